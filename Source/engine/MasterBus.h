#pragma once
#include <juce_audio_basics/juce_audio_basics.h>
#include <array>
#include <atomic>

namespace cadence
{
    // Shared output stage fed by every channel: master gain, DC blocker,
    // peak limiter and a non-finite sample guard.
    class MasterBus
    {
    public:
        MasterBus(float initialGain, float ceilingDb);

        void setGain(float newGain) noexcept { targetGain.store(juce::jlimit(0.0f, 2.0f, newGain), std::memory_order_relaxed); }
        float getGain() const noexcept { return targetGain.load(std::memory_order_relaxed); }
        void setCeilingDb(float newCeilingDb) noexcept;
        float getCeilingGain() const noexcept { return ceilingGain.load(std::memory_order_relaxed); }

        void reset();
        void process(juce::AudioBuffer<float>& buffer, int startSample, int numSamples);

        // True if the last processed block contained NaN/Inf or runaway samples.
        bool hadOutputFault() const noexcept { return outputFault.load(std::memory_order_relaxed); }

    private:
        static constexpr float gainDezipperCoeff = 0.0015f;
        static constexpr float limiterAttack = 0.45f;
        static constexpr float limiterRelease = 0.0025f;
        static constexpr float dcBlockCoeff = 0.995f;
        static constexpr float faultThreshold = 24.0f;

        std::atomic<float> targetGain;
        std::atomic<float> ceilingGain;
        std::atomic<bool> outputFault { false };

        float gainSmoothingState = 0.9f;
        float limiterGainState = 1.0f;
        std::array<float, 2> dcPrevInput {};
        std::array<float, 2> dcPrevOutput {};

        JUCE_DECLARE_NON_COPYABLE(MasterBus)
    };
}
