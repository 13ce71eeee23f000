#pragma once
#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_dsp/juce_dsp.h>
#include <array>
#include <vector>
#include "PresetLibrary.h"

namespace cadence
{
    class PresetSound : public juce::SynthesiserSound
    {
    public:
        explicit PresetSound(const VoiceSpec& specToUse) : spec(specToUse) {}

        bool appliesToNote(int) override { return true; }
        bool appliesToChannel(int) override { return true; }

        const VoiceSpec& getSpec() const noexcept { return spec; }

    private:
        const VoiceSpec spec;
    };

    // Renders every synthesised engine described by a VoiceSpec.
    class OscillatorVoice : public juce::SynthesiserVoice
    {
    public:
        OscillatorVoice();

        bool canPlaySound(juce::SynthesiserSound* sound) override
        {
            return dynamic_cast<PresetSound*> (sound) != nullptr;
        }

        void setCurrentPlaybackSampleRate(double newRate) override;
        void startNote(int midiNoteNumber, float velocity, juce::SynthesiserSound* sound, int) override;
        void stopNote(float, bool allowTailOff) override;

        void pitchWheelMoved(int) override {}
        void controllerMoved(int, int) override {}

        void renderNextBlock(juce::AudioBuffer<float>& outputBuffer, int startSample, int numSamples) override;

    private:
        static constexpr int maxUnison = 5;
        static constexpr int metalPartials = 6;

        float renderSample();
        float renderOscillator(Waveform waveform, double phase, double phaseDelta, int partials, float pulseWidth) const;
        float renderSubtractive(double frequency);
        float renderPluck();
        float renderMetal(double frequency);
        float renderNoise();
        void advancePhase(double& phase, double frequency) const;
        void finishNote();
        void prepareForRate(double newRate);

        VoiceSpec spec;
        double sampleRate = 44100.0;
        double noteFrequency = 440.0;
        double elapsedSeconds = 0.0;
        float level = 0.0f;
        bool releasing = false;

        std::array<double, maxUnison> unisonPhases {};
        double modulatorPhase = 0.0;
        double secondPhase = 0.0;
        double vibratoPhase = 0.0;
        std::array<double, metalPartials> metalPhases {};
        std::array<double, metalPartials> metalModPhases {};

        juce::ADSR envelope;
        juce::ADSR modulationEnvelope;
        juce::ADSR filterEnvelope;
        juce::dsp::StateVariableTPTFilter<float> filter;
        int filterUpdateCounter = 0;

        std::vector<float> pluckLine;
        int pluckLength = 0;
        int pluckIndex = 0;
        float pluckLowpassState = 0.0f;
        float pluckDampCoeff = 0.5f;
        float pluckPeak = 0.0f;
        float pluckPeriodPeak = 0.0f;

        juce::Random random;
        std::array<float, 7> pinkState {};

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(OscillatorVoice)
    };
}
