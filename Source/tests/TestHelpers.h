#pragma once
#include <juce_audio_basics/juce_audio_basics.h>
#include "../core/EngineConfig.h"

namespace cadence::testing
{
    inline EngineConfig makeTestConfig()
    {
        EngineConfig config;
        config.sampleRate = 44100.0;
        config.blockSize = 512;
        config.samplesDirectory = juce::File::getSpecialLocation(juce::File::tempDirectory).getChildFile("cadence_no_samples");
        return config;
    }

    inline float peakOf(const juce::AudioBuffer<float>& buffer, int startSample, int numSamples)
    {
        float peak = 0.0f;
        for (int ch = 0; ch < buffer.getNumChannels(); ++ch)
            peak = juce::jmax(peak, buffer.getMagnitude(ch, startSample, numSamples));
        return peak;
    }

    inline float peakOf(const juce::AudioBuffer<float>& buffer)
    {
        return peakOf(buffer, 0, buffer.getNumSamples());
    }

    // Renders `blocks` blocks and returns the loudest sample seen.
    template <typename Engine>
    float renderBlocks(Engine& engine, int blocks, int blockSize = 512)
    {
        juce::AudioBuffer<float> buffer(2, blockSize);
        float peak = 0.0f;
        for (int i = 0; i < blocks; ++i)
        {
            engine.renderBlock(buffer);
            peak = juce::jmax(peak, peakOf(buffer));
        }
        return peak;
    }
}
