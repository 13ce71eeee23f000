#pragma once
#include <juce_audio_basics/juce_audio_basics.h>
#include <memory>
#include <vector>
#include "../core/EngineConfig.h"
#include "Channel.h"

namespace cadence
{
    // Owns every track's Channel plus the preview voice. One lock guards the
    // set: the audio thread holds it while rendering, control and MIDI threads
    // take it briefly. Adapters and channels are built and destroyed outside it.
    class ChannelRack
    {
    public:
        explicit ChannelRack(const EngineConfig& configToUse);
        ~ChannelRack();

        void prepare(double newSampleRate, int maxBlockSize);

        // Idempotent. Fails only when the voice adapter cannot be built.
        bool ensureChannel(const juce::String& trackId, TrackType type, const juce::String& presetId, juce::String& errorMessage);
        bool ensureChannel(const Track& track, juce::String& errorMessage);

        // No-op when the channel already plays this preset. A failed build keeps the old adapter.
        bool setTrackInstrument(const juce::String& trackId, const juce::String& presetId, juce::String& errorMessage);
        bool removeChannel(const juce::String& trackId);
        void removeAllChannels();

        bool hasChannel(const juce::String& trackId) const;
        int getNumChannels() const;
        std::vector<juce::String> getChannelIds() const;
        juce::String getChannelPresetId(const juce::String& trackId) const;
        int getInstrumentRevision(const juce::String& trackId) const;
        int getNumActiveVoices(const juce::String& trackId) const;
        bool waitForSamples(const juce::String& trackId, int timeoutMs);

        void setTrackVolume(const juce::String& trackId, float volume);
        void setTrackPan(const juce::String& trackId, float pan);
        void setTrackMute(const juce::String& trackId, bool muted);
        void setTrackSolo(const juce::String& trackId, bool solo);
        void applyMixSettings(const Track& track);

        // Immediate triggers; silently ignored when the track has no channel.
        void triggerAttack(const juce::String& trackId, int pitch, int velocity);
        void triggerRelease(const juce::String& trackId, int pitch);
        void previewNote(int pitch, double durationSeconds, const juce::String& trackId = {});

        void setSchedule(const juce::String& trackId, std::vector<ScheduledTrigger> triggers, double transportSeconds);
        void clearSchedule(const juce::String& trackId);
        void clearAllSchedules();
        std::vector<ScheduledTrigger> getSchedule(const juce::String& trackId) const;
        void resetScheduleCursors(double transportSeconds);
        void releaseAll();

        // Called from the audio callback once per transport segment.
        void renderSegment(juce::AudioBuffer<float>& mix,
                           int startSample,
                           int numSamples,
                           double segmentStartSeconds,
                           double segmentEndSeconds,
                           bool transportRunning);

    private:
        Channel* findChannelLocked(const juce::String& trackId) const;
        std::unique_ptr<VoiceAdapter> buildAdapter(const juce::String& presetId, juce::String& errorMessage);
        VoiceBuildContext makeBuildContext() const;

        const EngineConfig& config;
        mutable juce::ThreadPool sampleLoaderPool { 1 };

        mutable juce::CriticalSection rackLock;
        std::vector<std::unique_ptr<Channel>> channels;
        std::unique_ptr<Channel> previewChannel;
        double sampleRate = 44100.0;
        int blockSize = 512;

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ChannelRack)
    };
}
