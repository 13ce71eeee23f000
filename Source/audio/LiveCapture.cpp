#include "LiveCapture.h"
#include "../project/ClipEditing.h"

namespace cadence
{
    LiveCapture::LiveCapture(EngineState& stateToUse, ChannelRack& rackToUse)
        : state(stateToUse),
          rack(rackToUse)
    {
    }

    juce::String LiveCapture::resolveTargetTrack()
    {
        const auto targetId = state.project.findLiveInputTargetId();
        if (targetId.isEmpty() || rack.hasChannel(targetId))
            return targetId;

        // First note on this track: build its channel from the full track.
        const auto target = state.project.getTrack(targetId);
        if (!target.has_value())
            return {};

        juce::String error;
        if (!rack.ensureChannel(*target, error))
        {
            juce::Logger::writeToLog("Cadence: live input has no voice on " + target->name + ": " + error);
            return {};
        }
        return targetId;
    }

    void LiveCapture::noteOn(int pitch, int velocity)
    {
        if (pitch < 0 || pitch > 127)
            return;

        const auto trackId = resolveTargetTrack();
        if (trackId.isEmpty())
            return;

        rack.triggerAttack(trackId, pitch, velocity);

        const auto beat = state.transport.getCurrentBeat();
        juce::ScopedLock lock(state.recordingLock);
        auto& recording = state.recording;
        recording.activePitches[static_cast<size_t>(pitch)] = true;
        recording.activeTrackId = trackId;

        if (recording.isRecording())
            recording.pendingNotes[pitch] = { beat - recording.startBeat, juce::jlimit(1, 127, velocity) };
    }

    void LiveCapture::noteOff(int pitch)
    {
        if (pitch < 0 || pitch > 127)
            return;

        juce::String trackId;
        {
            juce::ScopedLock lock(state.recordingLock);
            trackId = state.recording.activeTrackId;
        }
        if (trackId.isEmpty())
            trackId = resolveTargetTrack();
        if (trackId.isNotEmpty())
            rack.triggerRelease(trackId, pitch);

        const auto beat = state.transport.getCurrentBeat();
        juce::String clipId;
        PendingRecordedNote pending;
        bool hasPending = false;
        double endBeat = 0.0;
        {
            juce::ScopedLock lock(state.recordingLock);
            auto& recording = state.recording;
            recording.activePitches[static_cast<size_t>(pitch)] = false;

            if (recording.isRecording())
            {
                const auto it = recording.pendingNotes.find(pitch);
                if (it != recording.pendingNotes.end())
                {
                    pending = it->second;
                    hasPending = true;
                    clipId = recording.clipId;
                    endBeat = beat - recording.startBeat;
                    // Held across a loop wrap: the note ends at the loop end.
                    if (endBeat < pending.startBeat && state.transport.isLooping())
                        endBeat = state.transport.getLoopEndBeat() - recording.startBeat;
                    recording.pendingNotes.erase(it);
                }
            }
        }

        if (hasPending)
            commitNote(clipId, pitch, pending, endBeat);
    }

    void LiveCapture::commitNote(const juce::String& clipId, int pitch, const PendingRecordedNote& pending, double endBeat)
    {
        Note note;
        note.pitch = pitch;
        note.startBeat = juce::jmax(0.0, pending.startBeat);
        note.durationBeats = juce::jmax(state.config.minRecordedNoteBeats, endBeat - pending.startBeat);
        note.velocity = pending.velocity;

        if (state.project.addNote(clipId, note).isEmpty())
            juce::Logger::writeToLog("Cadence: recording clip vanished, dropped note " + juce::String(pitch));
    }

    bool LiveCapture::startRecording(juce::String& errorMessage)
    {
        if (isRecording())
        {
            errorMessage = "Already recording";
            return false;
        }

        const auto armed = state.project.findFirstArmedTrack();
        if (!armed.has_value())
        {
            errorMessage = "No armed track";
            return false;
        }

        const auto startBeat = state.transport.getCurrentBeat();
        const auto clipId = state.project.addClip(armed->id, startBeat, 0.0);
        if (clipId.isEmpty())
        {
            errorMessage = "Could not create a recording clip on " + armed->name;
            return false;
        }

        {
            juce::ScopedLock lock(state.recordingLock);
            auto& recording = state.recording;
            recording.trackId = armed->id;
            recording.clipId = clipId;
            recording.startBeat = startBeat;
            recording.pendingNotes.clear();
        }
        state.transport.setRecording(true);

        juce::Logger::writeToLog("Cadence: recording on " + armed->name + " from beat " + juce::String(startBeat, 3));
        return true;
    }

    bool LiveCapture::stopRecording()
    {
        const auto beat = state.transport.getCurrentBeat();
        RecordingState finished;
        {
            juce::ScopedLock lock(state.recordingLock);
            if (!state.recording.isRecording())
                return false;

            finished = state.recording;
            state.recording.clearRecording();
        }
        state.transport.setRecording(false);

        const auto elapsed = beat - finished.startBeat;
        for (const auto& [pitch, pending] : finished.pendingNotes)
            commitNote(finished.clipId, pitch, pending, elapsed);

        const auto beatsPerBar = state.project.getTimeSignature().getBeatsPerBar();
        const auto duration = ClipEditing::roundUpToBar(juce::jmax(1.0, elapsed), beatsPerBar);
        state.project.updateClip(finished.clipId, [duration](Clip& clip) { clip.durationBeats = duration; });

        juce::Logger::writeToLog("Cadence: recording stopped, clip length " + juce::String(duration, 2) + " beats");
        return true;
    }

    bool LiveCapture::isRecording() const
    {
        juce::ScopedLock lock(state.recordingLock);
        return state.recording.isRecording();
    }

    juce::String LiveCapture::getRecordingClipId() const
    {
        juce::ScopedLock lock(state.recordingLock);
        return state.recording.clipId;
    }

    juce::String LiveCapture::getRecordingTrackId() const
    {
        juce::ScopedLock lock(state.recordingLock);
        return state.recording.trackId;
    }

    void LiveCapture::updateRecordingClipLength()
    {
        juce::String clipId;
        double elapsed = 0.0;
        {
            juce::ScopedLock lock(state.recordingLock);
            if (!state.recording.isRecording())
                return;
            clipId = state.recording.clipId;
            elapsed = state.transport.getCurrentBeat() - state.recording.startBeat;
        }

        if (elapsed > 0.0)
            state.project.updateClip(clipId, [elapsed](Clip& clip)
            {
                clip.durationBeats = juce::jmax(clip.durationBeats, elapsed);
            });
    }

    void LiveCapture::panic()
    {
        juce::String trackId;
        std::vector<int> held;
        {
            juce::ScopedLock lock(state.recordingLock);
            trackId = state.recording.activeTrackId;
            for (int pitch = 0; pitch < 128; ++pitch)
            {
                if (state.recording.activePitches[static_cast<size_t>(pitch)])
                    held.push_back(pitch);
            }
            state.recording.activePitches.fill(false);
            state.recording.pendingNotes.clear();
        }

        if (trackId.isNotEmpty())
            for (auto pitch : held)
                rack.triggerRelease(trackId, pitch);
    }

    std::vector<int> LiveCapture::getActivePitches() const
    {
        std::vector<int> pitches;
        juce::ScopedLock lock(state.recordingLock);
        for (int pitch = 0; pitch < 128; ++pitch)
        {
            if (state.recording.activePitches[static_cast<size_t>(pitch)])
                pitches.push_back(pitch);
        }
        return pitches;
    }
}
