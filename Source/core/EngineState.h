#pragma once
#include <juce_core/juce_core.h>
#include <array>
#include <map>

#include "EngineConfig.h"
#include "../engine/TransportEngine.h"
#include "../project/ProjectModel.h"

namespace cadence
{
    struct PendingRecordedNote
    {
        double startBeat = 0.0;     // relative to the recording clip's start
        int velocity = 100;
    };

    // Live-capture bookkeeping. Guarded by EngineState::recordingLock.
    struct RecordingState
    {
        juce::String trackId;
        juce::String clipId;
        double startBeat = 0.0;
        std::map<int, PendingRecordedNote> pendingNotes;
        std::array<bool, 128> activePitches {};
        juce::String activeTrackId;

        bool isRecording() const noexcept { return clipId.isNotEmpty(); }

        void clearRecording()
        {
            trackId.clear();
            clipId.clear();
            startBeat = 0.0;
            pendingNotes.clear();
        }
    };

    // Everything the engine shares between threads, owned in one place.
    // Constructed by DawEngine and handed to components by reference.
    struct EngineState final
    {
        explicit EngineState(const EngineConfig& configToUse = {})
            : config(configToUse)
        {
            config.sanitise();
            transport.prepare(config.sampleRate);
        }

        EngineConfig config;
        ProjectModel project;
        TransportEngine transport;

        juce::CriticalSection recordingLock;
        RecordingState recording;

        JUCE_DECLARE_NON_COPYABLE(EngineState)
    };
}
