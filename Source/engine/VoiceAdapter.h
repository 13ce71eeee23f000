#pragma once
#include <juce_audio_basics/juce_audio_basics.h>
#include <memory>
#include "PresetLibrary.h"
#include "ScheduledNoteQueue.h"

namespace cadence
{
    struct VoiceBuildContext
    {
        juce::ThreadPool* sampleLoaderPool = nullptr;
        juce::File samplesDirectory;
        int maxPolyphony = 16;
        double sampleRate = 44100.0;
        int blockSize = 512;
    };

    // Uniform trigger interface over the three voice families. Instances are
    // only made by create(); the family set is closed.
    //
    // Not thread-safe: the owning ChannelRack serialises every call, including
    // render(). Sample offsets are relative to the start of the next render().
    class VoiceAdapter
    {
    public:
        virtual ~VoiceAdapter() = default;

        static std::unique_ptr<VoiceAdapter> create(const InstrumentPreset& preset,
                                                    const VoiceBuildContext& context,
                                                    juce::String& errorMessage);

        virtual VoiceFamily getFamily() const = 0;
        virtual void attack(int pitch, float velocity, int sampleOffset = 0) = 0;
        virtual void release(int pitch, int sampleOffset = 0) = 0;
        virtual void releaseAll() = 0;

        // The release is timed on this adapter's own sample clock.
        void attackRelease(int pitch, double durationSeconds, float velocity, int sampleOffset = 0);

        virtual bool isLoaded() const { return true; }
        virtual bool waitUntilLoaded(int timeoutMs) { juce::ignoreUnused(timeoutMs); return true; }

        void prepare(double newSampleRate, int blockSize);
        void render(juce::AudioBuffer<float>& buffer, int startSample, int numSamples);

        const juce::String& getPresetId() const noexcept { return presetId; }
        double getSampleRate() const noexcept { return sampleRate; }
        int getNumActiveVoices() const;
        int getNumPendingEvents() const noexcept { return queue.getNumPending(); }

    protected:
        class Token
        {
            Token() {}
            friend class VoiceAdapter;
        };

        VoiceAdapter(Token, const InstrumentPreset& preset, const VoiceBuildContext& context);

        void queueNoteOn(int pitch, float velocity, int sampleOffset);
        void queueNoteOff(int pitch, int sampleOffset);
        void silence();

        juce::Synthesiser synth;
        const InstrumentPreset preset;

        // False for families whose voices end on their own.
        virtual bool acceptsRelease() const { return true; }

    private:
        juce::String presetId;
        double sampleRate = 44100.0;
        ScheduledNoteQueue queue;
        juce::MidiBuffer blockMidi;

        JUCE_DECLARE_NON_COPYABLE(VoiceAdapter)
    };
}
