#include <juce_core/juce_core.h>
#include "../project/CompositionAssist.h"

using namespace cadence;

namespace
{
    const char* analysisJson = R"({
        "analysis": { "key": "A", "scale": "minor", "tempo": 96, "pattern": "arpeggio", "notesSummary": "A C E" },
        "suggestions": [
            { "id": "s1", "name": "Answer", "type": "continuation", "durationBeats": 4,
              "notes": [ { "pitch": 69, "startBeat": 0, "durationBeats": 1, "velocity": 90 },
                         { "pitch": 72, "startBeat": 1, "durationBeats": 0, "velocity": 200 } ] },
            { "name": "Pad", "type": "chord-progression", "notes": [] },
            "not an object"
        ]
    })";

    const char* arrangementJson = R"({
        "tracks": [
            { "role": "lead", "name": "Hook", "presetId": "square-lead", "notes": [ { "pitch": 76 } ] },
            { "role": "Drums", "presetId": "not-a-preset", "durationBeats": 8 },
            { "role": "bass", "notes": [ { "pitch": 36, "durationBeats": 2 } ] },
            { "role": "pads" }
        ]
    })";
}

class CompositionAssistTests final : public juce::UnitTest
{
public:
    CompositionAssistTests() : juce::UnitTest("Composition assist", "Cadence") {}

    void runTest() override
    {
        beginTest("Analysis responses");
        {
            AssistAnalysis analysis;
            juce::String error;
            expect(CompositionAssist::parseAnalysis(analysisJson, analysis, error), error);
            expectEquals(analysis.key, juce::String("A"));
            expectEquals(analysis.scale, juce::String("minor"));
            expectEquals(analysis.tempo, 96.0);
            expectEquals(static_cast<int>(analysis.suggestions.size()), 2);

            const auto& answer = analysis.suggestions[0];
            expectEquals(answer.id, juce::String("s1"));
            expect(answer.type == SuggestionType::Continuation);
            expectEquals(static_cast<int>(answer.notes.size()), 2);
            expectEquals(answer.notes[1].velocity, 127);
            expectEquals(answer.notes[1].durationBeats, 0.25);

            const auto& pad = analysis.suggestions[1];
            expect(pad.id.isNotEmpty());
            expect(pad.type == SuggestionType::ChordProgression);
            expectEquals(pad.durationBeats, 16.0);

            expect(!CompositionAssist::parseAnalysis("{ nope", analysis, error));
            expect(!CompositionAssist::parseAnalysis("[1, 2]", analysis, error));
            expect(!CompositionAssist::parseAnalysis(R"({ "suggestions": [] })", analysis, error));
            expectEquals(error, juce::String("Response has no analysis"));
        }

        beginTest("Analysis requests carry the notes");
        {
            const auto body = CompositionAssist::makeAnalyzeRequest({ { 60, 0.5, 1.0, 100 } }, 128.0, "make it darker");
            const auto parsed = juce::JSON::parse(body);
            expectEquals(static_cast<double>(parsed.getProperty("bpm", 0.0)), 128.0);
            expectEquals(parsed.getProperty("prompt", {}).toString(), juce::String("make it darker"));
            const auto* notes = parsed.getProperty("notes", {}).getArray();
            expect(notes != nullptr && notes->size() == 1);
            expectEquals(static_cast<double>((*notes)[0].getProperty("startBeat", 0.0)), 0.5);
        }

        beginTest("Note collection prefers the chosen clip");
        {
            ProjectModel model;
            const auto track = model.addTrack(TrackType::Midi, "Keys");
            const auto first = model.addClip(track.id, 0.0, 4.0);
            const auto second = model.addClip(track.id, 4.0, 4.0);
            Note note;
            note.pitch = 60;
            model.addNote(first, note);
            note.pitch = 67;
            model.addNote(second, note);

            const auto snapshot = model.getSnapshot();
            const auto chosen = CompositionAssist::collectAssistNotes(snapshot, second);
            expectEquals(static_cast<int>(chosen.size()), 1);
            expectEquals(chosen[0].pitch, 67);

            expectEquals(static_cast<int>(CompositionAssist::collectAssistNotes(snapshot, {}).size()), 2);
            expectEquals(static_cast<int>(CompositionAssist::collectAssistNotes(snapshot, "missing").size()), 2);
        }

        beginTest("Continuations append to the clip");
        {
            ProjectModel model;
            const auto track = model.addTrack(TrackType::Midi, "Keys");
            const auto clipId = model.addClip(track.id, 0.0, 4.0);
            Note note;
            note.startBeat = 0.0;
            model.addNote(clipId, note);

            AssistSuggestion suggestion;
            expect(!CompositionAssist::applyContinuation(model, clipId, suggestion));

            suggestion.notes = { { 64, 0.0, 1.0, 100 }, { 67, 1.0, 1.0, 100 } };
            expect(CompositionAssist::applyContinuation(model, clipId, suggestion));
            expectEquals(static_cast<int>(model.getClip(clipId)->notes.size()), 3);
            expect(model.getClip(clipId)->durationBeats >= 4.0);
        }

        beginTest("Suggestions can become their own track");
        {
            ProjectModel model;
            AssistSuggestion suggestion;
            suggestion.name = "Counter melody";
            suggestion.durationBeats = 8.0;
            suggestion.notes = { { 72, 0.0, 1.0, 100 } };

            const auto trackId = CompositionAssist::addSuggestionAsTrack(model, suggestion, "fm-bell");
            const auto track = model.getTrack(trackId);
            expect(track.has_value());
            expectEquals(track->name, juce::String("Counter melody"));
            expect(track->type == TrackType::Midi);
            expectEquals(track->getPresetId(), juce::String("fm-bell"));
            expectEquals(static_cast<int>(track->clips.size()), 1);
            expectEquals(track->clips[0].durationBeats, 8.0);
            expectEquals(static_cast<int>(track->clips[0].notes.size()), 1);
        }

        beginTest("Arrangements are applied in role order with valid presets");
        {
            AssistArrangement arrangement;
            juce::String error;
            expect(CompositionAssist::parseArrangement(arrangementJson, arrangement, error), error);
            expectEquals(static_cast<int>(arrangement.parts.size()), 4);
            expect(arrangement.parts[1].role == ArrangementRole::Drums);
            expect(arrangement.parts[3].role == ArrangementRole::Other);

            ProjectModel model;
            const auto ids = CompositionAssist::applyArrangement(model, arrangement);
            expectEquals(static_cast<int>(ids.size()), 4);

            const auto drums = model.getTrack(ids[0]);
            const auto bass = model.getTrack(ids[1]);
            const auto lead = model.getTrack(ids[2]);
            const auto other = model.getTrack(ids[3]);

            expectEquals(drums->getPresetId(), juce::String("acoustic-kit"));
            expectEquals(drums->clips[0].durationBeats, 8.0);
            expectEquals(bass->getPresetId(), juce::String("synth-bass"));
            expectEquals(lead->name, juce::String("Hook"));
            expectEquals(lead->getPresetId(), juce::String("square-lead"));
            expectEquals(other->getPresetId(), juce::String("triangle-lead"));

            expect(!CompositionAssist::parseArrangement(R"({ "analysis": {} })", arrangement, error));
        }

        beginTest("Role and type names");
        {
            expect(CompositionAssist::roleFromString(" Bass ") == ArrangementRole::Bass);
            expectEquals(CompositionAssist::roleToString(ArrangementRole::Chords), juce::String("chords"));
            expect(CompositionAssist::suggestionTypeFromString("variation") == SuggestionType::Variation);
            expect(CompositionAssist::suggestionTypeFromString("???") == SuggestionType::Continuation);
            expectEquals(CompositionAssist::suggestionTypeToString(SuggestionType::Harmony), juce::String("harmony"));
        }
    }
};

static CompositionAssistTests compositionAssistTests;
