#include "Channel.h"
#include <algorithm>
#include <cmath>

namespace cadence
{
    Channel::Channel(juce::String trackIdToUse, TrackType typeToUse, std::unique_ptr<VoiceAdapter> adapterToUse)
        : trackId(std::move(trackIdToUse)),
          trackType(typeToUse),
          adapter(std::move(adapterToUse)),
          instrumentRevision(adapter != nullptr ? 1 : 0)
    {
        if (adapter != nullptr)
            sampleRate = adapter->getSampleRate();
        scratch.setSize(2, 512);
    }

    std::unique_ptr<VoiceAdapter> Channel::swapAdapter(std::unique_ptr<VoiceAdapter> newAdapter)
    {
        if (adapter != nullptr)
            adapter->releaseAll();

        auto old = std::move(adapter);
        adapter = std::move(newAdapter);
        if (adapter != nullptr)
        {
            adapter->prepare(sampleRate, scratch.getNumSamples());
            ++instrumentRevision;
        }
        return old;
    }

    void Channel::setSchedule(std::vector<ScheduledTrigger> newTriggers, double transportSeconds)
    {
        std::stable_sort(newTriggers.begin(), newTriggers.end(), [](const ScheduledTrigger& a, const ScheduledTrigger& b)
        {
            return a.timeSeconds < b.timeSeconds;
        });
        triggers = std::move(newTriggers);
        resetScheduleCursor(transportSeconds);
    }

    void Channel::clearSchedule()
    {
        triggers.clear();
        nextTrigger = 0;
    }

    void Channel::resetScheduleCursor(double transportSeconds)
    {
        const auto it = std::lower_bound(triggers.begin(), triggers.end(), transportSeconds - 1.0e-9,
                                         [](const ScheduledTrigger& t, double seconds) { return t.timeSeconds < seconds; });
        nextTrigger = static_cast<size_t>(std::distance(triggers.begin(), it));
    }

    int Channel::fireScheduled(double segmentStartSeconds, double segmentEndSeconds)
    {
        int fired = 0;
        while (nextTrigger < triggers.size())
        {
            const auto& trigger = triggers[nextTrigger];
            if (trigger.timeSeconds >= segmentEndSeconds)
                break;

            ++nextTrigger;
            if (adapter == nullptr || trigger.timeSeconds < segmentStartSeconds - 1.0e-9)
                continue;

            const auto offset = juce::jmax(0, static_cast<int>(std::floor((trigger.timeSeconds - segmentStartSeconds) * sampleRate + 1.0e-6)));
            adapter->attackRelease(trigger.pitch, trigger.durationSeconds, trigger.velocity, offset);
            ++fired;
        }
        return fired;
    }

    void Channel::releaseAll()
    {
        if (adapter != nullptr)
            adapter->releaseAll();
    }

    void Channel::prepare(double newSampleRate, int maxBlockSize)
    {
        sampleRate = newSampleRate > 0.0 ? newSampleRate : 44100.0;
        scratch.setSize(2, juce::jmax(64, maxBlockSize), false, true, true);
        if (adapter != nullptr)
            adapter->prepare(sampleRate, maxBlockSize);
    }

    void Channel::render(juce::AudioBuffer<float>& mix, int startSample, int numSamples, bool audible)
    {
        if (adapter == nullptr || numSamples <= 0)
            return;

        if (scratch.getNumSamples() < startSample + numSamples)
            scratch.setSize(2, startSample + numSamples, true, true, true);

        scratch.clear(startSample, numSamples);
        adapter->render(scratch, startSample, numSamples);

        // Equal-power pan law.
        const float vol = audible ? volume.load(std::memory_order_relaxed) : 0.0f;
        const float p = pan.load(std::memory_order_relaxed);
        const float angle = (p + 1.0f) * juce::MathConstants<float>::pi * 0.25f;
        const float leftGain = vol * std::cos(angle);
        const float rightGain = vol * std::sin(angle);

        scratch.applyGainRamp(0, startSample, numSamples, prevLeftGain, leftGain);
        scratch.applyGainRamp(1, startSample, numSamples, prevRightGain, rightGain);
        prevLeftGain = leftGain;
        prevRightGain = rightGain;

        const int outputChannels = mix.getNumChannels();
        if (outputChannels == 1)
        {
            mix.addFrom(0, startSample, scratch, 0, startSample, numSamples, 0.5f);
            mix.addFrom(0, startSample, scratch, 1, startSample, numSamples, 0.5f);
            return;
        }

        for (int ch = 0; ch < juce::jmin(outputChannels, 2); ++ch)
            mix.addFrom(ch, startSample, scratch, ch, startSample, numSamples);
    }
}
