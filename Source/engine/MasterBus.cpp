#include "MasterBus.h"
#include <cmath>

namespace cadence
{
    MasterBus::MasterBus(float initialGain, float ceilingDb)
        : targetGain(juce::jlimit(0.0f, 2.0f, initialGain)),
          ceilingGain(juce::Decibels::decibelsToGain(juce::jmin(0.0f, ceilingDb))),
          gainSmoothingState(juce::jlimit(0.0f, 2.0f, initialGain))
    {
    }

    void MasterBus::setCeilingDb(float newCeilingDb) noexcept
    {
        ceilingGain.store(juce::Decibels::decibelsToGain(juce::jmin(0.0f, newCeilingDb)), std::memory_order_relaxed);
    }

    void MasterBus::reset()
    {
        gainSmoothingState = targetGain.load(std::memory_order_relaxed);
        limiterGainState = 1.0f;
        dcPrevInput.fill(0.0f);
        dcPrevOutput.fill(0.0f);
        outputFault.store(false, std::memory_order_relaxed);
    }

    void MasterBus::process(juce::AudioBuffer<float>& buffer, int startSample, int numSamples)
    {
        const int outputChannels = buffer.getNumChannels();
        if (numSamples <= 0 || outputChannels <= 0)
            return;

        const float gain = targetGain.load(std::memory_order_relaxed);
        const float ceiling = ceilingGain.load(std::memory_order_relaxed);
        bool fault = false;

        for (int i = 0; i < numSamples; ++i)
        {
            gainSmoothingState += (gain - gainSmoothingState) * gainDezipperCoeff;
            float overPeak = 0.0f;
            for (int ch = 0; ch < outputChannels; ++ch)
            {
                auto* write = buffer.getWritePointer(ch, startSample);
                float sample = write[i] * gainSmoothingState;
                if (!std::isfinite(sample))
                {
                    // Keep NaN/Inf out of the filter state.
                    sample = 0.0f;
                    fault = true;
                }

                if (ch < 2)
                {
                    auto& prevIn = dcPrevInput[static_cast<size_t>(ch)];
                    auto& prevOut = dcPrevOutput[static_cast<size_t>(ch)];
                    const float blocked = sample - prevIn + (dcBlockCoeff * prevOut);
                    prevIn = sample;
                    prevOut = blocked;
                    sample = blocked;
                }

                write[i] = sample;
                overPeak = juce::jmax(overPeak, std::abs(sample));
                if (overPeak > faultThreshold)
                    fault = true;
            }

            const float target = overPeak > ceiling ? (ceiling / overPeak) : 1.0f;
            if (target < limiterGainState)
                limiterGainState += (target - limiterGainState) * limiterAttack;
            else
                limiterGainState += (target - limiterGainState) * limiterRelease;

            for (int ch = 0; ch < outputChannels; ++ch)
            {
                auto* write = buffer.getWritePointer(ch, startSample);
                write[i] = juce::jlimit(-ceiling, ceiling, write[i] * limiterGainState);
            }
        }

        outputFault.store(fault, std::memory_order_relaxed);
    }
}
