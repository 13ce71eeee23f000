#include "ClipEditing.h"
#include <algorithm>
#include <cmath>

namespace cadence
{
    namespace ClipEditing
    {
        namespace
        {
            double findLastNoteEnd(const std::vector<Note>& notes)
            {
                double end = 0.0;
                for (const auto& note : notes)
                    end = juce::jmax(end, note.startBeat + note.durationBeats);
                return end;
            }

            template <typename Fn>
            bool editClip(ProjectModel& model, const juce::String& clipId, Fn&& fn)
            {
                bool changed = false;
                const bool found = model.updateClip(clipId, [&](Clip& clip) { changed = fn(clip); });
                return found && changed;
            }
        }

        bool NoteFilter::matches(const Note& note) const
        {
            if (pitchBelow.has_value() && note.pitch >= *pitchBelow)
                return false;
            if (pitchAbove.has_value() && note.pitch <= *pitchAbove)
                return false;
            if (velocityBelow.has_value() && note.velocity >= *velocityBelow)
                return false;
            return true;
        }

        bool quantizeNotes(Clip& clip, double divisionBeats)
        {
            if (!(divisionBeats > 0.0) || clip.notes.empty())
                return false;

            for (auto& note : clip.notes)
            {
                note.startBeat = std::round(note.startBeat / divisionBeats) * divisionBeats;
                note.durationBeats = juce::jmax(divisionBeats, std::round(note.durationBeats / divisionBeats) * divisionBeats);
            }
            clip.sortNotes();
            return true;
        }

        bool transposeNotes(Clip& clip, int semitones)
        {
            if (clip.notes.empty())
                return false;

            for (auto& note : clip.notes)
                note.pitch = juce::jlimit(0, 127, note.pitch + semitones);
            return true;
        }

        bool setNoteVelocities(Clip& clip, int velocity)
        {
            if (clip.notes.empty())
                return false;

            const auto clamped = juce::jlimit(0, 127, velocity);
            for (auto& note : clip.notes)
                note.velocity = clamped;
            return true;
        }

        bool randomiseNoteVelocities(Clip& clip, int minVelocity, int maxVelocity, juce::Random& random)
        {
            if (clip.notes.empty())
                return false;

            const auto low = juce::jlimit(0, 127, juce::jmin(minVelocity, maxVelocity));
            const auto high = juce::jlimit(0, 127, juce::jmax(minVelocity, maxVelocity));
            for (auto& note : clip.notes)
                note.velocity = high > low ? low + random.nextInt(high - low) : low;
            return true;
        }

        bool reverseNotes(Clip& clip)
        {
            if (clip.notes.empty())
                return false;

            const auto lastEnd = findLastNoteEnd(clip.notes);
            for (auto& note : clip.notes)
                note.startBeat = lastEnd - note.startBeat - note.durationBeats;
            clip.sortNotes();
            return true;
        }

        bool timeStretch(Clip& clip, double factor)
        {
            if (!(factor > 0.0) || clip.notes.empty())
                return false;

            for (auto& note : clip.notes)
            {
                note.startBeat *= factor;
                note.durationBeats *= factor;
            }
            clip.durationBeats *= factor;
            return true;
        }

        int deleteNotes(Clip& clip, const NoteFilter& filter)
        {
            const auto before = clip.notes.size();
            clip.notes.erase(std::remove_if(clip.notes.begin(), clip.notes.end(),
                                            [&](const Note& n) { return filter.matches(n); }),
                             clip.notes.end());
            return static_cast<int>(before - clip.notes.size());
        }

        double roundUpToBar(double beats, double beatsPerBar)
        {
            if (!(beatsPerBar > 0.0))
                return beats;
            return std::ceil(beats / beatsPerBar) * beatsPerBar;
        }

        void replaceNotes(Clip& clip, const std::vector<Note>& notes, double beatsPerBar)
        {
            clip.notes.clear();
            appendNotes(clip, notes, beatsPerBar);
        }

        void appendNotes(Clip& clip, const std::vector<Note>& notes, double beatsPerBar)
        {
            if (notes.empty())
                return;

            for (auto note : notes)
            {
                note.id = makeId();
                clip.notes.push_back(note);
            }
            clip.sortNotes();

            const auto lastEnd = findLastNoteEnd(notes);
            if (lastEnd > clip.durationBeats)
                clip.durationBeats = roundUpToBar(lastEnd, beatsPerBar);
        }

        bool splitClipAtBeat(Clip& left, Clip& rightOut, double splitBeat)
        {
            const double splitLocalBeat = splitBeat - left.startBeat;
            if (splitLocalBeat <= 0.0001 || splitLocalBeat >= left.durationBeats - 0.0001)
                return false;

            rightOut = left;
            rightOut.id = makeId();
            rightOut.startBeat = splitBeat;
            rightOut.durationBeats = left.durationBeats - splitLocalBeat;
            left.durationBeats = splitLocalBeat;

            std::vector<Note> leftNotes;
            std::vector<Note> rightNotes;
            leftNotes.reserve(left.notes.size());
            rightNotes.reserve(left.notes.size());

            for (const auto& note : left.notes)
            {
                const double noteEnd = note.startBeat + note.durationBeats;

                if (note.startBeat < splitLocalBeat)
                {
                    Note clipped = note;
                    clipped.durationBeats = juce::jmax(0.001, juce::jmin(note.durationBeats, splitLocalBeat - note.startBeat));
                    leftNotes.push_back(clipped);

                    if (noteEnd > splitLocalBeat)
                    {
                        Note carry = note;
                        carry.id = makeId();
                        carry.startBeat = 0.0;
                        carry.durationBeats = juce::jmax(0.001, noteEnd - splitLocalBeat);
                        rightNotes.push_back(carry);
                    }
                }
                else
                {
                    Note shifted = note;
                    shifted.startBeat = juce::jmax(0.0, note.startBeat - splitLocalBeat);
                    rightNotes.push_back(shifted);
                }
            }

            left.notes = std::move(leftNotes);
            rightOut.notes = std::move(rightNotes);
            return true;
        }

        //==============================================================================
        bool quantizeClip(ProjectModel& model, const juce::String& clipId, double divisionBeats)
        {
            return editClip(model, clipId, [&](Clip& c) { return quantizeNotes(c, divisionBeats); });
        }

        bool transposeClip(ProjectModel& model, const juce::String& clipId, int semitones)
        {
            return editClip(model, clipId, [&](Clip& c) { return transposeNotes(c, semitones); });
        }

        bool setClipVelocity(ProjectModel& model, const juce::String& clipId, int velocity)
        {
            return editClip(model, clipId, [&](Clip& c) { return setNoteVelocities(c, velocity); });
        }

        bool reverseClip(ProjectModel& model, const juce::String& clipId)
        {
            return editClip(model, clipId, [](Clip& c) { return reverseNotes(c); });
        }

        bool timeStretchClip(ProjectModel& model, const juce::String& clipId, double factor)
        {
            return editClip(model, clipId, [&](Clip& c) { return timeStretch(c, factor); });
        }

        int deleteClipNotes(ProjectModel& model, const juce::String& clipId, const NoteFilter& filter)
        {
            int removed = 0;
            model.updateClip(clipId, [&](Clip& c) { removed = deleteNotes(c, filter); });
            return removed;
        }

        bool replaceClipNotes(ProjectModel& model, const juce::String& clipId, const std::vector<Note>& notes)
        {
            const auto beatsPerBar = model.getTimeSignature().getBeatsPerBar();
            return model.updateClip(clipId, [&](Clip& c) { replaceNotes(c, notes, beatsPerBar); });
        }

        bool appendClipNotes(ProjectModel& model, const juce::String& clipId, const std::vector<Note>& notes)
        {
            const auto beatsPerBar = model.getTimeSignature().getBeatsPerBar();
            return model.updateClip(clipId, [&](Clip& c) { appendNotes(c, notes, beatsPerBar); });
        }

        juce::String splitClip(ProjectModel& model, const juce::String& clipId, double splitBeat)
        {
            const auto original = model.getClip(clipId);
            if (!original.has_value())
                return {};

            Clip left = *original;
            Clip right;
            if (!splitClipAtBeat(left, right, splitBeat))
                return {};

            const auto rightId = model.addClip(left.trackId, right.startBeat, right.durationBeats);
            if (rightId.isEmpty())
                return {};

            model.updateClip(rightId, [&](Clip& c)
            {
                c.name = right.name;
                c.notes = right.notes;
                c.audioSource = right.audioSource;
            });
            model.updateClip(clipId, [&](Clip& c)
            {
                c.durationBeats = left.durationBeats;
                c.notes = left.notes;
            });
            return rightId;
        }
    }
}
