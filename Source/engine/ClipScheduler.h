#pragma once
#include <vector>
#include "../core/EngineState.h"
#include "ChannelRack.h"

namespace cadence
{
    // Turns clips into trigger lists on each track's channel. A full resync:
    // call it while stopped or right before playback starts.
    class ClipScheduler
    {
    public:
        ClipScheduler(EngineState& stateToUse, ChannelRack& rackToUse);

        // Trigger times are (clip.startBeat + note.startBeat) * 60 / bpm.
        static std::vector<ScheduledTrigger> buildTriggers(const Track& track, double bpm, double minNoteSeconds);

        bool scheduleTrack(const Track& track);
        int scheduleTracks(const std::vector<Track>& tracks);

    private:
        bool isBeingRecorded(const juce::String& trackId);

        EngineState& state;
        ChannelRack& rack;
    };
}
