#pragma once

#include <juce_audio_basics/juce_audio_basics.h>
#include <array>
#include <atomic>
#include <cmath>

namespace cadence
{
    // Master clock. Control calls take stateLock and publish to the Rt
    // atomics; the audio thread only touches the atomics through advance().
    class TransportEngine
    {
    public:
        enum class State : int
        {
            Stopped = 0,
            Playing = 1,
            Paused = 2
        };

        struct Segment
        {
            int startSample = 0;
            int numSamples = 0;
            double startBeat = 0.0;
            double startSeconds = 0.0;
            double endSeconds = 0.0;
            bool startsAfterWrap = false;
        };

        // One audio block split at loop-wrap samples.
        struct BlockSegments
        {
            static constexpr int maxSegments = 8;

            std::array<Segment, maxSegments> segments;
            int numSegments = 0;
            bool running = false;
            bool wrapped = false;
            bool endsOnWrap = false;    // the wrap fell exactly on the block boundary
        };

        static constexpr double minTempo = 20.0;
        static constexpr double maxTempo = 300.0;

        TransportEngine() = default;

        void prepare(double newSampleRate);

        void play();
        void pause();
        void stop();
        void seek(double beat);

        void setTempo(double newBpm);
        double getTempo() const noexcept { return tempoRt.load(std::memory_order_relaxed); }

        void setTimeSignature(int numerator, int denominator);
        double getBeatsPerBar() const noexcept { return beatsPerBarRt.load(std::memory_order_relaxed); }

        void setLoop(double startBeat, double endBeat, bool enabled);
        bool isLooping() const noexcept { return isLoopingRt.load(std::memory_order_relaxed); }
        double getLoopStartBeat() const noexcept { return loopStartBeatRt.load(std::memory_order_relaxed); }
        double getLoopEndBeat() const noexcept { return loopEndBeatRt.load(std::memory_order_relaxed); }

        void setRecording(bool shouldRecord) noexcept { isRecordingRt.store(shouldRecord, std::memory_order_relaxed); }
        bool isRecording() const noexcept { return isRecordingRt.load(std::memory_order_relaxed); }

        State getState() const noexcept { return static_cast<State>(stateRt.load(std::memory_order_relaxed)); }
        bool isPlaying() const noexcept { return getState() == State::Playing; }

        // Pull-based snapshot for pollers.
        double getCurrentBeat() const noexcept { return currentBeatRt.load(std::memory_order_relaxed); }
        double getPositionSeconds() const noexcept { return currentSecondsRt.load(std::memory_order_relaxed); }
        double getSampleRate() const noexcept { return sampleRateRt.load(std::memory_order_relaxed); }

        double beatsToSeconds(double beats) const noexcept { return beatsToSeconds(beats, getTempo()); }
        double secondsToBeats(double seconds) const noexcept { return secondsToBeats(seconds, getTempo()); }

        static double beatsToSeconds(double beats, double bpm) noexcept
        {
            return bpm > 0.0 ? beats * 60.0 / bpm : 0.0;
        }

        static double secondsToBeats(double seconds, double bpm) noexcept
        {
            return seconds * bpm / 60.0;
        }

        // Audio thread: moves the clock by one block when playing.
        BlockSegments advance(int numSamples) noexcept;

    private:
        void setPositionLocked(double beat);

        juce::CriticalSection stateLock;

        std::atomic<int> stateRt { static_cast<int>(State::Stopped) };
        std::atomic<double> currentBeatRt { 0.0 };
        std::atomic<double> currentSecondsRt { 0.0 };
        std::atomic<double> tempoRt { 120.0 };
        std::atomic<double> sampleRateRt { 44100.0 };
        std::atomic<double> beatsPerBarRt { 4.0 };
        std::atomic<bool> isRecordingRt { false };
        std::atomic<bool> isLoopingRt { false };
        std::atomic<double> loopStartBeatRt { 0.0 };
        std::atomic<double> loopEndBeatRt { 8.0 };

        JUCE_DECLARE_NON_COPYABLE(TransportEngine)
    };
}
