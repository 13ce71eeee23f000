#pragma once
#include <juce_audio_basics/juce_audio_basics.h>
#include <map>
#include <vector>

namespace cadence
{
    enum class SynthEngine
    {
        Subtractive,
        AM,
        FM,
        Mono,
        Duo,
        Membrane,
        Metal,
        Pluck,
        Noise,
        Sampler
    };

    enum class Waveform
    {
        Sine,
        Triangle,
        Saw,
        Square,
        Pulse
    };

    enum class NoiseColour
    {
        White,
        Pink
    };

    enum class PresetCategory
    {
        Keys,
        Leads,
        Pads,
        Bass,
        Plucked,
        Bells,
        Drums,
        Fx
    };

    // Which adapter a preset is played through.
    enum class VoiceFamily
    {
        Polyphonic,
        Monophonic,
        SampleBased
    };

    juce::String presetCategoryToString(PresetCategory category);

    struct EnvelopeSpec
    {
        float attack = 0.01f;
        float decay = 0.1f;
        float sustain = 0.5f;
        float release = 0.5f;

        juce::ADSR::Parameters toAdsr() const { return { attack, decay, sustain, release }; }
    };

    struct OscillatorSpec
    {
        Waveform waveform = Waveform::Triangle;
        int partials = 0;              // 0 = band-unlimited shape, N = first N harmonics only
        int unisonCount = 1;
        float unisonSpreadCents = 0.0f;
        float pulseWidth = 0.5f;
    };

    struct VoiceSpec
    {
        SynthEngine engine = SynthEngine::Subtractive;
        OscillatorSpec oscillator;
        EnvelopeSpec envelope;
        float outputGain = 1.0f;

        // FM / AM / Duo
        float harmonicity = 1.0f;
        float modulationIndex = 0.0f;
        Waveform modulationWaveform = Waveform::Sine;
        EnvelopeSpec modulationEnvelope { 0.01f, 0.0f, 1.0f, 0.5f };

        // Mono filter
        float filterBaseHz = 0.0f;     // 0 disables the filter
        float filterOctaves = 0.0f;
        float filterResonance = 0.7f;
        EnvelopeSpec filterEnvelope;

        // Membrane
        float pitchDecaySeconds = 0.05f;
        float pitchOctaves = 0.0f;

        // Metal
        float metalFrequencyHz = 200.0f;
        float metalResonanceHz = 4000.0f;
        float metalOctaves = 1.5f;

        // Pluck
        float attackNoise = 1.0f;
        float dampeningHz = 4000.0f;
        float pluckResonance = 0.97f;

        // Noise
        NoiseColour noiseColour = NoiseColour::White;

        // Duo
        float vibratoAmount = 0.0f;
        float vibratoRateHz = 5.0f;
        Waveform secondWaveform = Waveform::Triangle;

        // One-shot voices release themselves once attack + decay has elapsed.
        bool isOneShot() const;
    };

    struct InstrumentPreset
    {
        juce::String id;
        juce::String name;
        PresetCategory category = PresetCategory::Leads;
        bool polyphonic = true;
        int previewNote = 60;
        VoiceSpec voice;

        // Sampler presets: folder under the samples root plus pitch -> file name.
        juce::String sampleFolder;
        std::map<int, juce::String> sampleMap;

        VoiceFamily getVoiceFamily() const;
        bool isOneShot() const;
    };

    class PresetLibrary
    {
    public:
        static constexpr const char* defaultPresetId = "triangle-lead";

        static const std::vector<InstrumentPreset>& getAll();
        static const InstrumentPreset* find(const juce::String& presetId);
        static bool contains(const juce::String& presetId);

        // Never fails: unknown ids resolve to the fallback, then to triangle-lead.
        static const InstrumentPreset& resolve(const juce::String& presetId, const juce::String& fallbackId = defaultPresetId);

        static std::vector<const InstrumentPreset*> getByCategory(PresetCategory category);

        // Settings written before presets existed carried a synth type instead.
        static juce::String migratePresetId(const juce::String& presetId, const juce::String& legacyType);

        static juce::String getRoleDefault(const juce::String& role);
    };
}
