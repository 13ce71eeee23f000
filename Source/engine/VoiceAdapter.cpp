#include "VoiceAdapter.h"
#include <juce_audio_formats/juce_audio_formats.h>
#include <iterator>
#include "OscillatorVoice.h"

namespace cadence
{
    namespace
    {
        constexpr int midiChannel = 1;

        class PolyphonicAdapter final : public VoiceAdapter
        {
        public:
            PolyphonicAdapter(Token token, const InstrumentPreset& presetToUse, const VoiceBuildContext& context)
                : VoiceAdapter(token, presetToUse, context)
            {
                for (int i = 0; i < juce::jlimit(1, 64, context.maxPolyphony); ++i)
                    synth.addVoice(new OscillatorVoice());
                synth.addSound(new PresetSound(preset.voice));
            }

            VoiceFamily getFamily() const override { return VoiceFamily::Polyphonic; }

            void attack(int pitch, float velocity, int sampleOffset) override
            {
                queueNoteOn(pitch, velocity, sampleOffset);
            }

            void release(int pitch, int sampleOffset) override
            {
                queueNoteOff(pitch, sampleOffset);
            }

            void releaseAll() override
            {
                silence();
            }
        };

        // One voice. One-shot presets ignore release(); releaseAll() releases
        // whatever pitch is sounding.
        class MonophonicAdapter final : public VoiceAdapter
        {
        public:
            MonophonicAdapter(Token token, const InstrumentPreset& presetToUse, const VoiceBuildContext& context)
                : VoiceAdapter(token, presetToUse, context),
                  oneShot(presetToUse.isOneShot())
            {
                synth.addVoice(new OscillatorVoice());
                synth.addSound(new PresetSound(preset.voice));
                synth.setNoteStealingEnabled(true);
            }

            VoiceFamily getFamily() const override { return VoiceFamily::Monophonic; }

            void attack(int pitch, float velocity, int sampleOffset) override
            {
                soundingPitch = pitch;
                queueNoteOn(pitch, velocity, sampleOffset);
            }

            void release(int pitch, int sampleOffset) override
            {
                if (oneShot || pitch != soundingPitch)
                    return;

                queueNoteOff(pitch, sampleOffset);
                soundingPitch = -1;
            }

            void releaseAll() override
            {
                soundingPitch = -1;
                silence();
            }

        private:
            bool acceptsRelease() const override { return !oneShot; }

            const bool oneShot;
            int soundingPitch = -1;
        };

        // Pitch-to-sample kit. Samples are read on the loader pool; attack()
        // before loading finishes is silent.
        class SampleAdapter final : public VoiceAdapter
        {
        public:
            SampleAdapter(Token token, const InstrumentPreset& presetToUse, const VoiceBuildContext& context, const juce::File& folder)
                : VoiceAdapter(token, presetToUse, context),
                  loaderPool(context.sampleLoaderPool)
            {
                for (int i = 0; i < juce::jlimit(1, 64, context.maxPolyphony); ++i)
                    synth.addVoice(new juce::SamplerVoice());

                loader = std::make_unique<LoaderJob>(*this, folder);
                if (loaderPool != nullptr)
                    loaderPool->addJob(loader.get(), false);
                else
                    loader->runJob();
            }

            ~SampleAdapter() override
            {
                if (loaderPool != nullptr && loader != nullptr)
                    loaderPool->removeJob(loader.get(), true, 5000);
            }

            VoiceFamily getFamily() const override { return VoiceFamily::SampleBased; }

            void attack(int pitch, float velocity, int sampleOffset) override
            {
                queueNoteOn(pitch, velocity, sampleOffset);
            }

            void release(int, int) override {}

            void releaseAll() override
            {
                silence();
            }

            bool isLoaded() const override
            {
                return loadFinished.load(std::memory_order_acquire);
            }

            bool waitUntilLoaded(int timeoutMs) override
            {
                if (isLoaded())
                    return true;
                return loadedEvent.wait(timeoutMs) && isLoaded();
            }

        private:
            bool acceptsRelease() const override { return false; }

            class LoaderJob final : public juce::ThreadPoolJob
            {
            public:
                LoaderJob(SampleAdapter& ownerRef, juce::File folderToRead)
                    : juce::ThreadPoolJob("Cadence sample loader"),
                      owner(ownerRef),
                      folder(std::move(folderToRead))
                {
                }

                JobStatus runJob() override
                {
                    owner.loadSamples(folder, *this);
                    return jobHasFinished;
                }

            private:
                SampleAdapter& owner;
                const juce::File folder;
            };

            void loadSamples(const juce::File& folder, LoaderJob& job)
            {
                juce::AudioFormatManager formatManager;
                formatManager.registerBasicFormats();

                const auto& sampleMap = preset.sampleMap;
                int loadedCount = 0;
                for (auto it = sampleMap.begin(); it != sampleMap.end(); ++it)
                {
                    if (job.shouldExit())
                        break;

                    // Each sample covers the pitches nearest to it so unmapped keys repitch.
                    const auto previous = it == sampleMap.begin() ? -1 : std::prev(it)->first;
                    const auto next = std::next(it) == sampleMap.end() ? 128 : std::next(it)->first;
                    const auto low = previous < 0 ? 0 : (previous + it->first) / 2 + 1;
                    const auto high = next > 127 ? 127 : (it->first + next) / 2;

                    const auto file = folder.getChildFile(it->second);
                    std::unique_ptr<juce::AudioFormatReader> reader(formatManager.createReaderFor(file));
                    if (reader == nullptr)
                    {
                        juce::Logger::writeToLog("Cadence: could not read sample " + file.getFullPathName()
                                                 + " for preset " + preset.id);
                        continue;
                    }

                    juce::BigInteger noteRange;
                    noteRange.setRange(low, high - low + 1, true);
                    synth.addSound(new juce::SamplerSound(file.getFileNameWithoutExtension(),
                                                          *reader,
                                                          noteRange,
                                                          it->first,
                                                          0.001,
                                                          static_cast<double>(preset.voice.envelope.release),
                                                          20.0));
                    ++loadedCount;
                }

                juce::Logger::writeToLog("Cadence: loaded " + juce::String(loadedCount) + "/" + juce::String(static_cast<int>(sampleMap.size()))
                                         + " samples for preset " + preset.id);
                loadFinished.store(true, std::memory_order_release);
                loadedEvent.signal();
            }

            juce::ThreadPool* loaderPool = nullptr;
            std::unique_ptr<LoaderJob> loader;
            std::atomic<bool> loadFinished { false };
            juce::WaitableEvent loadedEvent { true };
        };
    }

    //==============================================================================
    VoiceAdapter::VoiceAdapter(Token, const InstrumentPreset& presetToUse, const VoiceBuildContext& context)
        : preset(presetToUse),
          presetId(presetToUse.id)
    {
        prepare(context.sampleRate, context.blockSize);
    }

    std::unique_ptr<VoiceAdapter> VoiceAdapter::create(const InstrumentPreset& preset,
                                                       const VoiceBuildContext& context,
                                                       juce::String& errorMessage)
    {
        switch (preset.getVoiceFamily())
        {
            case VoiceFamily::Polyphonic:
                errorMessage.clear();
                return std::make_unique<PolyphonicAdapter>(Token(), preset, context);

            case VoiceFamily::Monophonic:
                errorMessage.clear();
                return std::make_unique<MonophonicAdapter>(Token(), preset, context);

            case VoiceFamily::SampleBased:
            default:
            {
                if (preset.sampleMap.empty())
                {
                    errorMessage = "Preset " + preset.id + " has no samples mapped.";
                    return nullptr;
                }

                const auto folder = context.samplesDirectory.getChildFile(preset.sampleFolder);
                if (!folder.isDirectory())
                {
                    errorMessage = "Sample folder does not exist: " + folder.getFullPathName();
                    return nullptr;
                }

                errorMessage.clear();
                return std::make_unique<SampleAdapter>(Token(), preset, context, folder);
            }
        }
    }

    void VoiceAdapter::attackRelease(int pitch, double durationSeconds, float velocity, int sampleOffset)
    {
        attack(pitch, velocity, sampleOffset);
        if (!acceptsRelease())
            return;

        const auto durationSamples = juce::jmax(1, juce::roundToInt(juce::jmax(0.0, durationSeconds) * sampleRate));
        queue.schedule(juce::MidiMessage::noteOff(midiChannel, juce::jlimit(0, 127, pitch)),
                       static_cast<int64_t>(juce::jmax(0, sampleOffset)) + durationSamples);
    }

    void VoiceAdapter::prepare(double newSampleRate, int blockSize)
    {
        sampleRate = newSampleRate > 0.0 ? newSampleRate : 44100.0;
        synth.setCurrentPlaybackSampleRate(sampleRate);
        synth.setMinimumRenderingSubdivisionSize(1, true);
        blockMidi.ensureSize(static_cast<size_t>(juce::jmax(64, blockSize)) * 8);
    }

    void VoiceAdapter::render(juce::AudioBuffer<float>& buffer, int startSample, int numSamples)
    {
        if (numSamples <= 0)
            return;

        blockMidi.clear();
        queue.process(startSample, numSamples, blockMidi);
        synth.renderNextBlock(buffer, blockMidi, startSample, numSamples);
    }

    int VoiceAdapter::getNumActiveVoices() const
    {
        int active = 0;
        for (int i = 0; i < synth.getNumVoices(); ++i)
            if (auto* voice = synth.getVoice(i); voice != nullptr && voice->isVoiceActive())
                ++active;
        return active;
    }

    void VoiceAdapter::queueNoteOn(int pitch, float velocity, int sampleOffset)
    {
        const auto note = juce::jlimit(0, 127, pitch);
        queue.cancelNoteOffs(note, sampleOffset);
        queue.schedule(juce::MidiMessage::noteOn(midiChannel, note, juce::jlimit(0.0f, 1.0f, velocity)), sampleOffset);
    }

    void VoiceAdapter::queueNoteOff(int pitch, int sampleOffset)
    {
        queue.schedule(juce::MidiMessage::noteOff(midiChannel, juce::jlimit(0, 127, pitch)), sampleOffset);
    }

    void VoiceAdapter::silence()
    {
        queue.clear();
        synth.allNotesOff(0, true);
    }
}
