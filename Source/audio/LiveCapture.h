#pragma once
#include <vector>
#include "../core/EngineState.h"
#include "../engine/ChannelRack.h"

namespace cadence
{
    // Real-time note input. Sound is triggered first; recording bookkeeping
    // happens afterwards and never delays it.
    class LiveCapture
    {
    public:
        LiveCapture(EngineState& stateToUse, ChannelRack& rackToUse);

        void noteOn(int pitch, int velocity);
        void noteOff(int pitch);

        // Needs an armed track; creates an empty clip at the current beat.
        bool startRecording(juce::String& errorMessage);
        // Rounds the clip up to whole bars. Held notes are closed at the stop beat.
        bool stopRecording();
        bool isRecording() const;
        juce::String getRecordingClipId() const;
        juce::String getRecordingTrackId() const;

        // Polled while recording so the clip follows the playhead.
        void updateRecordingClipLength();

        void panic();
        std::vector<int> getActivePitches() const;

    private:
        juce::String resolveTargetTrack();
        void commitNote(const juce::String& clipId, int pitch, const PendingRecordedNote& pending, double endBeat);

        EngineState& state;
        ChannelRack& rack;

        JUCE_DECLARE_NON_COPYABLE(LiveCapture)
    };
}
