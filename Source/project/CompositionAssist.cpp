#include "CompositionAssist.h"
#include <algorithm>
#include "ClipEditing.h"
#include "../engine/PresetLibrary.h"

namespace cadence
{
    namespace
    {
        AssistNote noteFromVar(const juce::var& value)
        {
            AssistNote note;
            note.pitch = juce::jlimit(0, 127, static_cast<int>(value.getProperty("pitch", 60)));
            note.startBeat = juce::jmax(0.0, static_cast<double>(value.getProperty("startBeat", 0.0)));
            note.durationBeats = static_cast<double>(value.getProperty("durationBeats", 1.0));
            if (note.durationBeats <= 0.0)
                note.durationBeats = 0.25;
            note.velocity = juce::jlimit(0, 127, static_cast<int>(value.getProperty("velocity", 100)));
            return note;
        }

        std::vector<AssistNote> notesFromVar(const juce::var& value)
        {
            std::vector<AssistNote> notes;
            if (const auto* array = value.getArray())
            {
                notes.reserve(static_cast<size_t>(array->size()));
                for (const auto& item : *array)
                    if (item.isObject())
                        notes.push_back(noteFromVar(item));
            }
            return notes;
        }

        bool parseObject(const juce::String& json, juce::var& parsed, juce::String& errorMessage)
        {
            const auto result = juce::JSON::parse(json, parsed);
            if (result.failed())
            {
                errorMessage = "Malformed response: " + result.getErrorMessage();
                return false;
            }
            if (!parsed.isObject())
            {
                errorMessage = "Response is not a JSON object";
                return false;
            }
            return true;
        }

        int roleOrder(ArrangementRole role)
        {
            switch (role)
            {
                case ArrangementRole::Drums:  return 0;
                case ArrangementRole::Bass:   return 1;
                case ArrangementRole::Chords: return 2;
                case ArrangementRole::Lead:   return 3;
                case ArrangementRole::Other:  break;
            }
            return 4;
        }

        juce::String addPartTrack(ProjectModel& model,
                                  const juce::String& name,
                                  const juce::String& presetId,
                                  const std::vector<AssistNote>& notes,
                                  double durationBeats)
        {
            const auto track = model.addTrack(TrackType::Midi, name);
            if (presetId.isNotEmpty())
                model.updateTrack(track.id, [&presetId](Track& t) { t.instrument = InstrumentSettings { presetId }; });

            const auto clipId = model.addClip(track.id, 0.0, durationBeats > 0.0 ? durationBeats : 4.0);
            for (const auto& note : CompositionAssist::toNotes(notes))
                model.addNote(clipId, note);
            return track.id;
        }
    }

    namespace CompositionAssist
    {
        juce::String suggestionTypeToString(SuggestionType type)
        {
            switch (type)
            {
                case SuggestionType::Continuation:     return "continuation";
                case SuggestionType::Harmony:          return "harmony";
                case SuggestionType::ChordProgression: return "chord-progression";
                case SuggestionType::Variation:        return "variation";
            }
            return "continuation";
        }

        SuggestionType suggestionTypeFromString(const juce::String& text)
        {
            if (text == "harmony")           return SuggestionType::Harmony;
            if (text == "chord-progression") return SuggestionType::ChordProgression;
            if (text == "variation")         return SuggestionType::Variation;
            return SuggestionType::Continuation;
        }

        juce::String roleToString(ArrangementRole role)
        {
            switch (role)
            {
                case ArrangementRole::Drums:  return "drums";
                case ArrangementRole::Bass:   return "bass";
                case ArrangementRole::Chords: return "chords";
                case ArrangementRole::Lead:   return "lead";
                case ArrangementRole::Other:  break;
            }
            return "other";
        }

        ArrangementRole roleFromString(const juce::String& text)
        {
            const auto role = text.trim().toLowerCase();
            if (role == "drums")  return ArrangementRole::Drums;
            if (role == "bass")   return ArrangementRole::Bass;
            if (role == "chords") return ArrangementRole::Chords;
            if (role == "lead")   return ArrangementRole::Lead;
            return ArrangementRole::Other;
        }

        std::vector<AssistNote> collectAssistNotes(const Clip& clip)
        {
            std::vector<AssistNote> notes;
            notes.reserve(clip.notes.size());
            for (const auto& note : clip.notes)
                notes.push_back({ note.pitch, note.startBeat, note.durationBeats, note.velocity });
            return notes;
        }

        std::vector<AssistNote> collectAssistNotes(const Project& project, const juce::String& clipId)
        {
            if (clipId.isNotEmpty())
            {
                if (const auto* clip = project.findClip(clipId))
                {
                    if (clip->hasNotes())
                        return collectAssistNotes(*clip);
                }
            }

            std::vector<AssistNote> notes;
            for (const auto& track : project.tracks)
            {
                for (const auto& clip : track.clips)
                {
                    const auto clipNotes = collectAssistNotes(clip);
                    notes.insert(notes.end(), clipNotes.begin(), clipNotes.end());
                }
            }
            return notes;
        }

        std::vector<Note> toNotes(const std::vector<AssistNote>& notes)
        {
            std::vector<Note> out;
            out.reserve(notes.size());
            for (const auto& n : notes)
            {
                Note note;
                note.pitch = n.pitch;
                note.startBeat = n.startBeat;
                note.durationBeats = n.durationBeats;
                note.velocity = n.velocity;
                out.push_back(note);
            }
            return out;
        }

        juce::String makeAnalyzeRequest(const std::vector<AssistNote>& notes, double bpm, const juce::String& prompt)
        {
            juce::Array<juce::var> noteArray;
            for (const auto& note : notes)
            {
                auto* object = new juce::DynamicObject();
                object->setProperty("pitch", note.pitch);
                object->setProperty("startBeat", note.startBeat);
                object->setProperty("durationBeats", note.durationBeats);
                object->setProperty("velocity", note.velocity);
                noteArray.add(juce::var(object));
            }

            auto* body = new juce::DynamicObject();
            body->setProperty("notes", noteArray);
            body->setProperty("bpm", bpm);
            body->setProperty("prompt", prompt);
            return juce::JSON::toString(juce::var(body), true);
        }

        bool parseAnalysis(const juce::String& json, AssistAnalysis& result, juce::String& errorMessage)
        {
            juce::var parsed;
            if (!parseObject(json, parsed, errorMessage))
                return false;

            const auto analysis = parsed.getProperty("analysis", {});
            if (!analysis.isObject())
            {
                errorMessage = "Response has no analysis";
                return false;
            }

            AssistAnalysis out;
            out.key = analysis.getProperty("key", "C").toString();
            out.scale = analysis.getProperty("scale", "major").toString();
            out.tempo = static_cast<double>(analysis.getProperty("tempo", 120.0));
            out.pattern = analysis.getProperty("pattern", {}).toString();
            out.notesSummary = analysis.getProperty("notesSummary", {}).toString();

            if (const auto* suggestions = parsed.getProperty("suggestions", {}).getArray())
            {
                for (const auto& item : *suggestions)
                {
                    if (!item.isObject())
                        continue;

                    AssistSuggestion suggestion;
                    suggestion.id = item.getProperty("id", {}).toString();
                    if (suggestion.id.isEmpty())
                        suggestion.id = makeId();
                    suggestion.name = item.getProperty("name", "Suggestion").toString();
                    suggestion.description = item.getProperty("description", {}).toString();
                    suggestion.type = suggestionTypeFromString(item.getProperty("type", {}).toString());
                    suggestion.notes = notesFromVar(item.getProperty("notes", {}));
                    suggestion.durationBeats = static_cast<double>(item.getProperty("durationBeats", 16.0));
                    out.suggestions.push_back(std::move(suggestion));
                }
            }

            result = std::move(out);
            return true;
        }

        bool parseArrangement(const juce::String& json, AssistArrangement& result, juce::String& errorMessage)
        {
            juce::var parsed;
            if (!parseObject(json, parsed, errorMessage))
                return false;

            const auto* tracks = parsed.getProperty("tracks", {}).getArray();
            if (tracks == nullptr)
            {
                errorMessage = "Response has no tracks";
                return false;
            }

            AssistArrangement out;
            for (const auto& item : *tracks)
            {
                if (!item.isObject())
                    continue;

                AssistArrangementPart part;
                part.role = roleFromString(item.getProperty("role", {}).toString());
                part.name = item.getProperty("name", roleToString(part.role)).toString();
                part.presetId = item.getProperty("presetId", {}).toString();
                part.notes = notesFromVar(item.getProperty("notes", {}));
                part.durationBeats = static_cast<double>(item.getProperty("durationBeats", 16.0));
                out.parts.push_back(std::move(part));
            }

            result = std::move(out);
            return true;
        }

        juce::String resolveArrangementPreset(ArrangementRole role, const juce::String& presetId)
        {
            if (presetId.isNotEmpty() && PresetLibrary::contains(presetId))
                return presetId;
            return PresetLibrary::getRoleDefault(roleToString(role));
        }

        bool applyContinuation(ProjectModel& model, const juce::String& clipId, const AssistSuggestion& suggestion)
        {
            if (suggestion.notes.empty())
                return false;
            return ClipEditing::appendClipNotes(model, clipId, toNotes(suggestion.notes));
        }

        juce::String addSuggestionAsTrack(ProjectModel& model, const AssistSuggestion& suggestion, const juce::String& presetId)
        {
            const auto resolved = presetId.isNotEmpty() ? PresetLibrary::resolve(presetId).id : juce::String();
            return addPartTrack(model,
                                suggestion.name.isNotEmpty() ? suggestion.name : juce::String("Suggestion"),
                                resolved,
                                suggestion.notes,
                                suggestion.durationBeats);
        }

        std::vector<juce::String> applyArrangement(ProjectModel& model, const AssistArrangement& arrangement)
        {
            auto parts = arrangement.parts;
            std::stable_sort(parts.begin(), parts.end(), [](const AssistArrangementPart& a, const AssistArrangementPart& b)
            {
                return roleOrder(a.role) < roleOrder(b.role);
            });

            std::vector<juce::String> trackIds;
            for (const auto& part : parts)
            {
                const auto name = part.name.isNotEmpty() ? part.name : roleToString(part.role);
                trackIds.push_back(addPartTrack(model, name,
                                                resolveArrangementPreset(part.role, part.presetId),
                                                part.notes, part.durationBeats));
            }
            return trackIds;
        }
    }
}
