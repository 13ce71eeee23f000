#pragma once
#include <juce_core/juce_core.h>
#include <vector>
#include "ProjectModel.h"

namespace cadence
{
    // Flat note as exchanged with the composition service (clip-relative beats).
    struct AssistNote
    {
        int pitch = 60;
        double startBeat = 0.0;
        double durationBeats = 1.0;
        int velocity = 100;
    };

    enum class SuggestionType
    {
        Continuation,
        Harmony,
        ChordProgression,
        Variation
    };

    struct AssistSuggestion
    {
        juce::String id;
        juce::String name;
        juce::String description;
        SuggestionType type = SuggestionType::Continuation;
        std::vector<AssistNote> notes;
        double durationBeats = 16.0;
    };

    struct AssistAnalysis
    {
        juce::String key;
        juce::String scale;
        double tempo = 120.0;
        juce::String pattern;
        juce::String notesSummary;
        std::vector<AssistSuggestion> suggestions;
    };

    enum class ArrangementRole
    {
        Drums,
        Bass,
        Chords,
        Lead,
        Other
    };

    struct AssistArrangementPart
    {
        ArrangementRole role = ArrangementRole::Other;
        juce::String name;
        juce::String presetId;
        std::vector<AssistNote> notes;
        double durationBeats = 16.0;
    };

    struct AssistArrangement
    {
        std::vector<AssistArrangementPart> parts;
    };

    namespace CompositionAssist
    {
        juce::String suggestionTypeToString(SuggestionType type);
        SuggestionType suggestionTypeFromString(const juce::String& text);
        juce::String roleToString(ArrangementRole role);
        ArrangementRole roleFromString(const juce::String& text);

        std::vector<AssistNote> collectAssistNotes(const Clip& clip);
        // The clip's notes, or every note in the project when the clip is absent or empty.
        std::vector<AssistNote> collectAssistNotes(const Project& project, const juce::String& clipId);
        std::vector<Note> toNotes(const std::vector<AssistNote>& notes);

        // Request body for the analysis endpoint.
        juce::String makeAnalyzeRequest(const std::vector<AssistNote>& notes, double bpm, const juce::String& prompt);
        bool parseAnalysis(const juce::String& json, AssistAnalysis& result, juce::String& errorMessage);
        bool parseArrangement(const juce::String& json, AssistArrangement& result, juce::String& errorMessage);

        // Unknown or empty ids fall back to the role default.
        juce::String resolveArrangementPreset(ArrangementRole role, const juce::String& presetId);

        bool applyContinuation(ProjectModel& model, const juce::String& clipId, const AssistSuggestion& suggestion);
        // New midi track with one clip at beat 0. Returns the track id.
        juce::String addSuggestionAsTrack(ProjectModel& model, const AssistSuggestion& suggestion, const juce::String& presetId = {});
        // Tracks are created in role order drums, bass, chords, lead. Returns the new track ids.
        std::vector<juce::String> applyArrangement(ProjectModel& model, const AssistArrangement& arrangement);
    }
}
