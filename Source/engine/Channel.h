#pragma once
#include <juce_audio_basics/juce_audio_basics.h>
#include <atomic>
#include <memory>
#include <vector>
#include "../project/ProjectModel.h"
#include "VoiceAdapter.h"

namespace cadence
{
    struct ScheduledTrigger
    {
        double timeSeconds = 0.0;       // on the transport time line
        double durationSeconds = 0.0;
        int pitch = 60;
        float velocity = 1.0f;          // 0..1
    };

    // One track's signal chain: voice adapter -> gain/pan -> master mix.
    // Parameter setters are lock-free; everything else runs under the
    // ChannelRack lock.
    class Channel
    {
    public:
        Channel(juce::String trackIdToUse, TrackType typeToUse, std::unique_ptr<VoiceAdapter> adapterToUse);

        const juce::String& getTrackId() const noexcept { return trackId; }
        TrackType getTrackType() const noexcept { return trackType; }
        VoiceAdapter* getAdapter() const noexcept { return adapter.get(); }
        juce::String getPresetId() const { return adapter != nullptr ? adapter->getPresetId() : juce::String(); }
        int getInstrumentRevision() const noexcept { return instrumentRevision; }

        // Returns the previous adapter so the caller can dispose of it outside the rack lock.
        std::unique_ptr<VoiceAdapter> swapAdapter(std::unique_ptr<VoiceAdapter> newAdapter);

        void setVolume(float newVolume) noexcept { volume.store(juce::jlimit(0.0f, 1.0f, newVolume), std::memory_order_relaxed); }
        void setPan(float newPan) noexcept { pan.store(juce::jlimit(-1.0f, 1.0f, newPan), std::memory_order_relaxed); }
        void setMuted(bool shouldMute) noexcept { muted.store(shouldMute, std::memory_order_relaxed); }
        void setSolo(bool shouldSolo) noexcept { solo.store(shouldSolo, std::memory_order_relaxed); }
        float getVolume() const noexcept { return volume.load(std::memory_order_relaxed); }
        float getPan() const noexcept { return pan.load(std::memory_order_relaxed); }
        bool isMuted() const noexcept { return muted.load(std::memory_order_relaxed); }
        bool isSolo() const noexcept { return solo.load(std::memory_order_relaxed); }

        // --- Scheduled triggers ---
        void setSchedule(std::vector<ScheduledTrigger> newTriggers, double transportSeconds);
        void clearSchedule();
        const std::vector<ScheduledTrigger>& getSchedule() const noexcept { return triggers; }
        void resetScheduleCursor(double transportSeconds);
        int fireScheduled(double segmentStartSeconds, double segmentEndSeconds);

        void releaseAll();

        void prepare(double newSampleRate, int maxBlockSize);
        void render(juce::AudioBuffer<float>& mix, int startSample, int numSamples, bool audible);

    private:
        const juce::String trackId;
        const TrackType trackType;
        std::unique_ptr<VoiceAdapter> adapter;
        int instrumentRevision = 0;

        std::atomic<float> volume { 0.8f };
        std::atomic<float> pan { 0.0f };
        std::atomic<bool> muted { false };
        std::atomic<bool> solo { false };

        std::vector<ScheduledTrigger> triggers;
        size_t nextTrigger = 0;

        double sampleRate = 44100.0;
        juce::AudioBuffer<float> scratch;
        float prevLeftGain = 0.0f;
        float prevRightGain = 0.0f;

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(Channel)
    };
}
