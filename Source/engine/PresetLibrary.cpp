#include "PresetLibrary.h"

namespace cadence
{
    namespace
    {
        InstrumentPreset makePreset(const char* id,
                                    const char* name,
                                    PresetCategory category,
                                    SynthEngine engine,
                                    bool polyphonic,
                                    EnvelopeSpec envelope,
                                    int previewNote = 60)
        {
            InstrumentPreset preset;
            preset.id = id;
            preset.name = name;
            preset.category = category;
            preset.polyphonic = polyphonic;
            preset.previewNote = previewNote;
            preset.voice.engine = engine;
            preset.voice.envelope = envelope;
            return preset;
        }

        OscillatorSpec osc(Waveform waveform, int partials = 0, int unisonCount = 1, float spreadCents = 0.0f)
        {
            OscillatorSpec spec;
            spec.waveform = waveform;
            spec.partials = partials;
            spec.unisonCount = unisonCount;
            spec.unisonSpreadCents = spreadCents;
            return spec;
        }

        InstrumentPreset subtractive(const char* id, const char* name, PresetCategory category,
                                     OscillatorSpec oscillator, EnvelopeSpec envelope, int previewNote = 60)
        {
            auto preset = makePreset(id, name, category, SynthEngine::Subtractive, true, envelope, previewNote);
            preset.voice.oscillator = oscillator;
            return preset;
        }

        InstrumentPreset fm(const char* id, const char* name, PresetCategory category,
                            float harmonicity, float modulationIndex,
                            Waveform carrier, Waveform modulator,
                            EnvelopeSpec envelope, EnvelopeSpec modulationEnvelope, int previewNote = 60)
        {
            auto preset = makePreset(id, name, category, SynthEngine::FM, true, envelope, previewNote);
            preset.voice.oscillator = osc(carrier);
            preset.voice.harmonicity = harmonicity;
            preset.voice.modulationIndex = modulationIndex;
            preset.voice.modulationWaveform = modulator;
            preset.voice.modulationEnvelope = modulationEnvelope;
            return preset;
        }

        InstrumentPreset am(const char* id, const char* name, PresetCategory category,
                            float harmonicity, Waveform carrier, Waveform modulator,
                            EnvelopeSpec envelope, EnvelopeSpec modulationEnvelope, int previewNote = 60)
        {
            auto preset = makePreset(id, name, category, SynthEngine::AM, true, envelope, previewNote);
            preset.voice.oscillator = osc(carrier);
            preset.voice.harmonicity = harmonicity;
            preset.voice.modulationWaveform = modulator;
            preset.voice.modulationEnvelope = modulationEnvelope;
            return preset;
        }

        InstrumentPreset pluck(const char* id, const char* name, PresetCategory category,
                               float attackNoise, float dampeningHz, float resonance, int previewNote = 60)
        {
            auto preset = makePreset(id, name, category, SynthEngine::Pluck, false, { 0.001f, 2.0f, 1.0f, 0.05f }, previewNote);
            preset.voice.attackNoise = attackNoise;
            preset.voice.dampeningHz = dampeningHz;
            preset.voice.pluckResonance = resonance;
            return preset;
        }

        InstrumentPreset metal(const char* id, const char* name, PresetCategory category,
                               float frequencyHz, EnvelopeSpec envelope, float harmonicity,
                               float modulationIndex, float resonanceHz, float octaves, int previewNote)
        {
            auto preset = makePreset(id, name, category, SynthEngine::Metal, false, envelope, previewNote);
            preset.voice.metalFrequencyHz = frequencyHz;
            preset.voice.harmonicity = harmonicity;
            preset.voice.modulationIndex = modulationIndex;
            preset.voice.metalResonanceHz = resonanceHz;
            preset.voice.metalOctaves = octaves;
            return preset;
        }

        InstrumentPreset membrane(const char* id, const char* name, float pitchDecay, float octaves,
                                  EnvelopeSpec envelope, int previewNote)
        {
            auto preset = makePreset(id, name, PresetCategory::Drums, SynthEngine::Membrane, false, envelope, previewNote);
            preset.voice.oscillator = osc(Waveform::Sine);
            preset.voice.pitchDecaySeconds = pitchDecay;
            preset.voice.pitchOctaves = octaves;
            return preset;
        }

        InstrumentPreset noise(const char* id, const char* name, PresetCategory category,
                               NoiseColour colour, EnvelopeSpec envelope)
        {
            auto preset = makePreset(id, name, category, SynthEngine::Noise, false, envelope);
            preset.voice.noiseColour = colour;
            return preset;
        }

        std::vector<InstrumentPreset> buildPresets()
        {
            std::vector<InstrumentPreset> presets;

            // Keys
            presets.push_back(subtractive("classic-piano", "Classic Piano", PresetCategory::Keys,
                                          osc(Waveform::Triangle, 8), { 0.005f, 0.3f, 0.2f, 1.2f }));
            presets.push_back(fm("electric-piano", "Electric Piano", PresetCategory::Keys, 3.01f, 14.0f,
                                 Waveform::Triangle, Waveform::Square,
                                 { 0.01f, 0.5f, 0.2f, 1.0f }, { 0.5f, 0.0f, 1.0f, 0.5f }));
            presets.push_back(subtractive("organ", "Organ", PresetCategory::Keys,
                                          osc(Waveform::Sine, 4), { 0.05f, 0.3f, 0.9f, 0.1f }));
            presets.push_back(subtractive("clavinet", "Clavinet", PresetCategory::Keys,
                                          osc(Waveform::Saw), { 0.001f, 0.2f, 0.1f, 0.15f }));
            presets.push_back(subtractive("harpsichord", "Harpsichord", PresetCategory::Keys,
                                          osc(Waveform::Square), { 0.001f, 0.3f, 0.05f, 0.3f }));

            // Leads
            presets.push_back(subtractive("triangle-lead", "Triangle Lead", PresetCategory::Leads,
                                          osc(Waveform::Triangle), { 0.02f, 0.1f, 0.5f, 0.8f }));
            presets.push_back(subtractive("saw-lead", "Saw Lead", PresetCategory::Leads,
                                          osc(Waveform::Saw), { 0.01f, 0.15f, 0.7f, 0.4f }));
            presets.push_back(subtractive("square-lead", "Square Lead", PresetCategory::Leads,
                                          osc(Waveform::Square), { 0.01f, 0.2f, 0.6f, 0.5f }));
            {
                auto pulseOsc = osc(Waveform::Pulse);
                pulseOsc.pulseWidth = 0.3f;
                presets.push_back(subtractive("pulse-lead", "Pulse Lead", PresetCategory::Leads,
                                              pulseOsc, { 0.01f, 0.15f, 0.6f, 0.5f }));
            }
            presets.push_back(subtractive("detuned-saw", "Detuned Saw", PresetCategory::Leads,
                                          osc(Waveform::Saw, 0, 3, 30.0f), { 0.02f, 0.2f, 0.6f, 0.6f }));

            // Pads
            presets.push_back(subtractive("warm-pad", "Warm Pad", PresetCategory::Pads,
                                          osc(Waveform::Saw, 0, 3, 20.0f), { 0.8f, 1.0f, 0.8f, 2.0f }));
            presets.push_back(fm("string-pad", "String Pad", PresetCategory::Pads, 1.0f, 1.5f,
                                 Waveform::Sine, Waveform::Triangle,
                                 { 1.0f, 0.5f, 0.9f, 2.5f }, { 0.8f, 0.0f, 1.0f, 2.0f }));
            presets.push_back(fm("glass-pad", "Glass Pad", PresetCategory::Pads, 2.0f, 4.0f,
                                 Waveform::Sine, Waveform::Sine,
                                 { 0.6f, 0.8f, 0.5f, 2.0f }, { 0.4f, 0.5f, 0.8f, 1.5f }));
            presets.push_back(am("am-pad", "AM Pad", PresetCategory::Pads, 2.5f,
                                 Waveform::Triangle, Waveform::Sine,
                                 { 1.0f, 0.5f, 0.8f, 3.0f }, { 0.5f, 0.0f, 1.0f, 2.0f }));
            presets.push_back(subtractive("choir-pad", "Choir Pad", PresetCategory::Pads,
                                          osc(Waveform::Sine, 4, 5, 40.0f), { 1.2f, 0.5f, 0.9f, 3.0f }));

            // Bass
            presets.push_back(subtractive("sub-bass", "Sub Bass", PresetCategory::Bass,
                                          osc(Waveform::Sine), { 0.01f, 0.2f, 0.8f, 0.3f }, 36));
            presets.push_back(subtractive("synth-bass", "Synth Bass", PresetCategory::Bass,
                                          osc(Waveform::Saw), { 0.005f, 0.2f, 0.4f, 0.2f }, 36));
            presets.push_back(fm("fm-bass", "FM Bass", PresetCategory::Bass, 1.0f, 8.0f,
                                 Waveform::Triangle, Waveform::Square,
                                 { 0.01f, 0.3f, 0.3f, 0.2f }, { 0.01f, 0.2f, 0.0f, 0.2f }, 36));
            {
                auto acid = makePreset("acid-bass", "Acid Bass", PresetCategory::Bass, SynthEngine::Mono, false,
                                       { 0.001f, 0.25f, 0.4f, 0.1f }, 36);
                acid.voice.oscillator = osc(Waveform::Saw);
                acid.voice.filterBaseHz = 200.0f;
                acid.voice.filterOctaves = 3.0f;
                acid.voice.filterResonance = 6.0f;
                acid.voice.filterEnvelope = { 0.06f, 0.2f, 0.5f, 0.2f };
                presets.push_back(acid);
            }
            presets.push_back(pluck("pluck-bass", "Pluck Bass", PresetCategory::Bass, 1.0f, 4000.0f, 0.98f, 36));

            // Plucked
            presets.push_back(pluck("guitar", "Guitar", PresetCategory::Plucked, 1.5f, 3500.0f, 0.97f));
            presets.push_back(pluck("harp", "Harp", PresetCategory::Plucked, 0.5f, 5000.0f, 0.99f));
            presets.push_back(pluck("bell-pluck", "Bell Pluck", PresetCategory::Plucked, 0.8f, 6000.0f, 0.995f));
            presets.push_back(pluck("sitar", "Sitar", PresetCategory::Plucked, 2.0f, 2000.0f, 0.96f));

            // Bells
            presets.push_back(fm("fm-bell", "FM Bell", PresetCategory::Bells, 5.1f, 12.0f,
                                 Waveform::Sine, Waveform::Sine,
                                 { 0.001f, 1.5f, 0.0f, 1.5f }, { 0.001f, 0.5f, 0.0f, 1.0f }, 72));
            presets.push_back(fm("music-box", "Music Box", PresetCategory::Bells, 8.0f, 2.0f,
                                 Waveform::Sine, Waveform::Sine,
                                 { 0.001f, 0.8f, 0.0f, 0.8f }, { 0.001f, 0.3f, 0.0f, 0.3f }, 72));
            presets.push_back(am("vibraphone", "Vibraphone", PresetCategory::Bells, 6.0f,
                                 Waveform::Sine, Waveform::Sine,
                                 { 0.001f, 2.0f, 0.05f, 1.5f }, { 0.5f, 0.0f, 1.0f, 0.5f }, 72));
            presets.push_back(metal("chime", "Chime", PresetCategory::Bells, 400.0f, { 0.001f, 1.8f, 0.0f, 0.5f },
                                    8.0f, 32.0f, 4000.0f, 2.0f, 72));

            // Drums
            presets.push_back(membrane("kick", "Kick", 0.05f, 6.0f, { 0.001f, 0.4f, 0.01f, 0.4f }, 36));
            presets.push_back(membrane("tom", "Tom", 0.08f, 4.0f, { 0.001f, 0.3f, 0.01f, 0.3f }, 48));
            presets.push_back(metal("hi-hat", "Hi-Hat", PresetCategory::Drums, 200.0f, { 0.001f, 0.1f, 0.0f, 0.01f },
                                    5.1f, 40.0f, 8000.0f, 1.5f, 72));
            presets.push_back(noise("snare", "Snare", PresetCategory::Drums, NoiseColour::White, { 0.001f, 0.15f, 0.0f, 0.1f }));
            {
                auto kit = makePreset("acoustic-kit", "Acoustic Kit", PresetCategory::Drums, SynthEngine::Sampler, true,
                                      { 0.0f, 0.0f, 1.0f, 0.1f }, 36);
                kit.sampleFolder = "drums/acoustic";
                kit.sampleMap = {
                    { 36, "kick.wav" },
                    { 37, "snare-rim.wav" },
                    { 38, "snare.wav" },
                    { 39, "clap.wav" },
                    { 42, "hihat-closed.wav" },
                    { 45, "tom-low.wav" },
                    { 46, "hihat-open.wav" },
                    { 47, "tom-mid.wav" },
                    { 49, "crash.wav" },
                    { 50, "tom-high.wav" },
                    { 51, "ride.wav" }
                };
                presets.push_back(kit);
            }

            // FX
            presets.push_back(noise("noise-burst", "Noise Burst", PresetCategory::Fx, NoiseColour::Pink, { 0.01f, 0.3f, 0.1f, 0.5f }));
            {
                auto experiment = fm("fm-experiment", "FM Experiment", PresetCategory::Fx, 3.5f, 20.0f,
                                     Waveform::Triangle, Waveform::Saw,
                                     { 0.01f, 0.5f, 0.3f, 1.0f }, { 0.01f, 0.5f, 0.5f, 1.0f });
                presets.push_back(experiment);
            }
            {
                auto duo = makePreset("duo-voice", "Duo Voice", PresetCategory::Fx, SynthEngine::Duo, false,
                                      { 0.01f, 0.0f, 1.0f, 0.5f });
                duo.voice.oscillator = osc(Waveform::Sine);
                duo.voice.secondWaveform = Waveform::Triangle;
                duo.voice.harmonicity = 1.5f;
                duo.voice.vibratoAmount = 0.5f;
                duo.voice.vibratoRateHz = 5.0f;
                duo.voice.outputGain = juce::Decibels::decibelsToGain(-10.0f);
                presets.push_back(duo);
            }

            return presets;
        }
    }

    juce::String presetCategoryToString(PresetCategory category)
    {
        switch (category)
        {
            case PresetCategory::Keys: return "keys";
            case PresetCategory::Leads: return "leads";
            case PresetCategory::Pads: return "pads";
            case PresetCategory::Bass: return "bass";
            case PresetCategory::Plucked: return "plucked";
            case PresetCategory::Bells: return "bells";
            case PresetCategory::Drums: return "drums";
            case PresetCategory::Fx:
            default: return "fx";
        }
    }

    VoiceFamily InstrumentPreset::getVoiceFamily() const
    {
        if (voice.engine == SynthEngine::Sampler)
            return VoiceFamily::SampleBased;
        return polyphonic ? VoiceFamily::Polyphonic : VoiceFamily::Monophonic;
    }

    bool VoiceSpec::isOneShot() const
    {
        switch (engine)
        {
            case SynthEngine::Membrane:
            case SynthEngine::Metal:
            case SynthEngine::Pluck:
            case SynthEngine::Sampler:
                return true;
            default:
                return envelope.sustain <= 0.01f;
        }
    }

    bool InstrumentPreset::isOneShot() const
    {
        return voice.isOneShot();
    }

    //==============================================================================
    const std::vector<InstrumentPreset>& PresetLibrary::getAll()
    {
        static const std::vector<InstrumentPreset> presets = buildPresets();
        return presets;
    }

    const InstrumentPreset* PresetLibrary::find(const juce::String& presetId)
    {
        for (const auto& preset : getAll())
            if (preset.id == presetId)
                return &preset;
        return nullptr;
    }

    bool PresetLibrary::contains(const juce::String& presetId)
    {
        return find(presetId) != nullptr;
    }

    const InstrumentPreset& PresetLibrary::resolve(const juce::String& presetId, const juce::String& fallbackId)
    {
        if (const auto* preset = find(presetId))
            return *preset;
        if (const auto* fallback = find(fallbackId))
            return *fallback;

        const auto* builtInDefault = find(defaultPresetId);
        jassert(builtInDefault != nullptr);
        return *builtInDefault;
    }

    std::vector<const InstrumentPreset*> PresetLibrary::getByCategory(PresetCategory category)
    {
        std::vector<const InstrumentPreset*> matches;
        for (const auto& preset : getAll())
            if (preset.category == category)
                matches.push_back(&preset);
        return matches;
    }

    juce::String PresetLibrary::migratePresetId(const juce::String& presetId, const juce::String& legacyType)
    {
        if (presetId.isNotEmpty() && contains(presetId))
            return presetId;

        if (legacyType.isEmpty())
            return defaultPresetId;

        static const std::map<juce::String, juce::String> legacyMap {
            { "synth", "triangle-lead" },
            { "am-synth", "am-pad" },
            { "fm-synth", "electric-piano" },
            { "membrane", "kick" },
            { "metal", "hi-hat" },
            { "sampler", "triangle-lead" }
        };

        const auto it = legacyMap.find(legacyType.trim().toLowerCase());
        return it != legacyMap.end() ? it->second : juce::String(defaultPresetId);
    }

    juce::String PresetLibrary::getRoleDefault(const juce::String& role)
    {
        const auto lowered = role.trim().toLowerCase();
        if (lowered == "drums")
            return "acoustic-kit";
        if (lowered == "bass")
            return "synth-bass";
        if (lowered == "chords")
            return "warm-pad";
        if (lowered == "lead")
            return "saw-lead";
        return defaultPresetId;
    }
}
