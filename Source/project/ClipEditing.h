#pragma once
#include "ProjectModel.h"

namespace cadence
{
    // Note-level edits. The Clip& overloads are pure transforms; the
    // ProjectModel overloads look the clip up by id and are no-ops when it
    // is missing or has nothing to edit.
    namespace ClipEditing
    {
        struct NoteFilter
        {
            std::optional<int> pitchBelow;
            std::optional<int> pitchAbove;
            std::optional<int> velocityBelow;

            bool matches(const Note& note) const;
        };

        bool quantizeNotes(Clip& clip, double divisionBeats);
        bool transposeNotes(Clip& clip, int semitones);
        bool setNoteVelocities(Clip& clip, int velocity);
        bool randomiseNoteVelocities(Clip& clip, int minVelocity, int maxVelocity, juce::Random& random);
        bool reverseNotes(Clip& clip);
        bool timeStretch(Clip& clip, double factor);
        int deleteNotes(Clip& clip, const NoteFilter& filter);
        void replaceNotes(Clip& clip, const std::vector<Note>& notes, double beatsPerBar);
        void appendNotes(Clip& clip, const std::vector<Note>& notes, double beatsPerBar);
        bool splitClipAtBeat(Clip& left, Clip& rightOut, double splitBeat);

        double roundUpToBar(double beats, double beatsPerBar);

        bool quantizeClip(ProjectModel& model, const juce::String& clipId, double divisionBeats);
        bool transposeClip(ProjectModel& model, const juce::String& clipId, int semitones);
        bool setClipVelocity(ProjectModel& model, const juce::String& clipId, int velocity);
        bool reverseClip(ProjectModel& model, const juce::String& clipId);
        bool timeStretchClip(ProjectModel& model, const juce::String& clipId, double factor);
        int deleteClipNotes(ProjectModel& model, const juce::String& clipId, const NoteFilter& filter);
        bool replaceClipNotes(ProjectModel& model, const juce::String& clipId, const std::vector<Note>& notes);
        bool appendClipNotes(ProjectModel& model, const juce::String& clipId, const std::vector<Note>& notes);
        juce::String splitClip(ProjectModel& model, const juce::String& clipId, double splitBeat);
    }
}
