#include "TransportEngine.h"

namespace cadence
{
    void TransportEngine::prepare(double newSampleRate)
    {
        juce::ScopedLock lock(stateLock);
        if (newSampleRate > 0.0)
            sampleRateRt.store(newSampleRate, std::memory_order_relaxed);
    }

    void TransportEngine::play()
    {
        juce::ScopedLock lock(stateLock);
        stateRt.store(static_cast<int>(State::Playing), std::memory_order_relaxed);
    }

    void TransportEngine::pause()
    {
        juce::ScopedLock lock(stateLock);
        if (getState() == State::Playing)
            stateRt.store(static_cast<int>(State::Paused), std::memory_order_relaxed);
    }

    void TransportEngine::stop()
    {
        juce::ScopedLock lock(stateLock);
        stateRt.store(static_cast<int>(State::Stopped), std::memory_order_relaxed);
        isRecordingRt.store(false, std::memory_order_relaxed);
        setPositionLocked(0.0);
    }

    void TransportEngine::seek(double beat)
    {
        juce::ScopedLock lock(stateLock);
        setPositionLocked(beat);
    }

    void TransportEngine::setPositionLocked(double beat)
    {
        const auto target = juce::jmax(0.0, beat);
        currentBeatRt.store(target, std::memory_order_relaxed);
        currentSecondsRt.store(beatsToSeconds(target, getTempo()), std::memory_order_relaxed);
    }

    void TransportEngine::setTempo(double newBpm)
    {
        juce::ScopedLock lock(stateLock);
        tempoRt.store(juce::jlimit(minTempo, maxTempo, newBpm), std::memory_order_relaxed);
    }

    void TransportEngine::setTimeSignature(int numerator, int denominator)
    {
        juce::ScopedLock lock(stateLock);
        const auto beatsPerBar = static_cast<double>(juce::jmax(1, numerator)) * (4.0 / static_cast<double>(juce::jmax(1, denominator)));
        beatsPerBarRt.store(beatsPerBar, std::memory_order_relaxed);
    }

    void TransportEngine::setLoop(double startBeat, double endBeat, bool enabled)
    {
        juce::ScopedLock lock(stateLock);
        const auto start = juce::jmax(0.0, startBeat);
        loopStartBeatRt.store(start, std::memory_order_relaxed);
        loopEndBeatRt.store(juce::jmax(start + 0.0001, endBeat), std::memory_order_relaxed);
        isLoopingRt.store(enabled, std::memory_order_relaxed);
    }

    TransportEngine::BlockSegments TransportEngine::advance(int numSamples) noexcept
    {
        BlockSegments block;
        if (numSamples <= 0)
            return block;

        const auto sampleRate = sampleRateRt.load(std::memory_order_relaxed);
        auto beat = currentBeatRt.load(std::memory_order_relaxed);
        auto seconds = currentSecondsRt.load(std::memory_order_relaxed);

        block.running = isPlaying();
        if (!block.running)
        {
            auto& only = block.segments[0];
            only.startSample = 0;
            only.numSamples = numSamples;
            only.startBeat = beat;
            only.startSeconds = seconds;
            only.endSeconds = seconds;
            block.numSegments = 1;
            return block;
        }

        const auto bpm = tempoRt.load(std::memory_order_relaxed);
        const auto beatsPerSample = bpm / 60.0 / sampleRate;
        const bool looping = isLoopingRt.load(std::memory_order_relaxed);
        const auto loopStart = loopStartBeatRt.load(std::memory_order_relaxed);
        const auto loopEnd = loopEndBeatRt.load(std::memory_order_relaxed);

        int offset = 0;
        bool nextStartsAfterWrap = false;
        while (offset < numSamples)
        {
            // A playhead already at or past the loop end (seek, or a loop set behind it) jumps back first.
            if (looping && loopEnd > loopStart && beat >= loopEnd)
            {
                beat = loopStart;
                seconds = beatsToSeconds(beat, bpm);
                nextStartsAfterWrap = true;
                block.wrapped = true;
            }

            const int remaining = numSamples - offset;
            int length = remaining;
            bool wrapsHere = false;

            const bool lastSlot = block.numSegments == BlockSegments::maxSegments - 1;
            if (looping && !lastSlot && loopEnd > loopStart && beat < loopEnd && beatsPerSample > 0.0)
            {
                const auto samplesToEnd = juce::jmax(1, static_cast<int>(std::ceil((loopEnd - beat) / beatsPerSample - 1.0e-9)));
                if (samplesToEnd <= remaining)
                {
                    length = samplesToEnd;
                    wrapsHere = true;
                }
            }

            auto& segment = block.segments[static_cast<size_t>(block.numSegments++)];
            segment.startSample = offset;
            segment.numSamples = length;
            segment.startBeat = beat;
            segment.startSeconds = seconds;
            segment.endSeconds = seconds + static_cast<double>(length) / sampleRate;
            segment.startsAfterWrap = nextStartsAfterWrap;

            beat += beatsPerSample * length;
            seconds = segment.endSeconds;
            nextStartsAfterWrap = false;

            if (wrapsHere)
            {
                beat = loopStart;
                seconds = beatsToSeconds(beat, bpm);
                nextStartsAfterWrap = true;
                block.wrapped = true;
            }

            offset += length;
        }

        block.endsOnWrap = nextStartsAfterWrap;
        currentBeatRt.store(beat, std::memory_order_relaxed);
        currentSecondsRt.store(seconds, std::memory_order_relaxed);
        return block;
    }
}
