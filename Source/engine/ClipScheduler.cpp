#include "ClipScheduler.h"
#include <algorithm>
#include <set>

namespace cadence
{
    ClipScheduler::ClipScheduler(EngineState& stateToUse, ChannelRack& rackToUse)
        : state(stateToUse),
          rack(rackToUse)
    {
    }

    std::vector<ScheduledTrigger> ClipScheduler::buildTriggers(const Track& track, double bpm, double minNoteSeconds)
    {
        std::vector<ScheduledTrigger> triggers;
        if (track.muted || !track.isNoteTrack() || bpm <= 0.0)
            return triggers;

        const auto secondsPerBeat = 60.0 / bpm;
        for (const auto& clip : track.clips)
        {
            if (!clip.hasNotes())
                continue;

            for (const auto& note : clip.notes)
            {
                ScheduledTrigger trigger;
                trigger.timeSeconds = (clip.startBeat + note.startBeat) * secondsPerBeat;
                trigger.durationSeconds = juce::jmax(minNoteSeconds, note.durationBeats * secondsPerBeat);
                trigger.pitch = juce::jlimit(0, 127, note.pitch);
                trigger.velocity = static_cast<float>(juce::jlimit(0, 127, note.velocity)) / 127.0f;
                triggers.push_back(trigger);
            }
        }
        return triggers;
    }

    bool ClipScheduler::isBeingRecorded(const juce::String& trackId)
    {
        juce::ScopedLock lock(state.recordingLock);
        return state.recording.isRecording() && state.recording.trackId == trackId;
    }

    bool ClipScheduler::scheduleTrack(const Track& track)
    {
        if (isBeingRecorded(track.id))
            return true;

        juce::String error;
        if (!rack.ensureChannel(track, error))
        {
            juce::Logger::writeToLog("Cadence: track " + track.name + " is silent: " + error);
            return false;
        }

        rack.clearSchedule(track.id);

        if (track.isNoteTrack() && !rack.setTrackInstrument(track.id, track.getPresetId(), error))
            juce::Logger::writeToLog("Cadence: keeping previous instrument on " + track.name + ": " + error);

        auto triggers = buildTriggers(track, state.transport.getTempo(), state.config.minScheduledNoteSeconds);
        if (!triggers.empty())
            rack.setSchedule(track.id, std::move(triggers), state.transport.getPositionSeconds());
        return true;
    }

    int ClipScheduler::scheduleTracks(const std::vector<Track>& tracks)
    {
        std::set<juce::String> liveIds;
        for (const auto& track : tracks)
            liveIds.insert(track.id);

        for (const auto& channelId : rack.getChannelIds())
            if (liveIds.count(channelId) == 0)
                rack.removeChannel(channelId);

        int scheduled = 0;
        for (const auto& track : tracks)
            if (scheduleTrack(track))
                ++scheduled;
        return scheduled;
    }
}
