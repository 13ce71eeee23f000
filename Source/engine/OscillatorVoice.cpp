#include "OscillatorVoice.h"
#include <cmath>

namespace cadence
{
    namespace
    {
        constexpr double twoPi = juce::MathConstants<double>::twoPi;
        constexpr double pi = juce::MathConstants<double>::pi;
        constexpr std::array<double, 6> metalRatios { 1.0, 1.483, 1.932, 2.546, 2.630, 3.897 };

        double polyBlep(double t, double dt)
        {
            if (dt <= 0.0)
                return 0.0;
            if (t < dt)
            {
                t /= dt;
                return t + t - t * t - 1.0;
            }
            if (t > 1.0 - dt)
            {
                t = (t - 1.0) / dt;
                return t * t + t + t + 1.0;
            }
            return 0.0;
        }

        double harmonicWeight(Waveform waveform, int n)
        {
            const bool odd = (n % 2) == 1;
            switch (waveform)
            {
                case Waveform::Sine: return 1.0 / n;
                case Waveform::Triangle:
                    if (!odd)
                        return 0.0;
                    return (8.0 / (pi * pi)) * ((((n - 1) / 2) % 2 == 0) ? 1.0 : -1.0) / (n * n);
                case Waveform::Saw: return (2.0 / pi) * ((n % 2 == 1) ? 1.0 : -1.0) / n;
                case Waveform::Square:
                case Waveform::Pulse:
                default:
                    return odd ? (4.0 / pi) / n : 0.0;
            }
        }
    }

    OscillatorVoice::OscillatorVoice()
    {
        prepareForRate(44100.0);
    }

    void OscillatorVoice::prepareForRate(double newRate)
    {
        sampleRate = newRate > 0.0 ? newRate : 44100.0;
        envelope.setSampleRate(sampleRate);
        modulationEnvelope.setSampleRate(sampleRate);
        filterEnvelope.setSampleRate(sampleRate);

        juce::dsp::ProcessSpec processSpec
        {
            sampleRate,
            static_cast<juce::uint32>(512),
            static_cast<juce::uint32>(1)
        };
        filter.prepare(processSpec);

        // Long enough for a 20 Hz string.
        pluckLine.assign(static_cast<size_t>(sampleRate / 20.0) + 2, 0.0f);
    }

    void OscillatorVoice::setCurrentPlaybackSampleRate(double newRate)
    {
        juce::SynthesiserVoice::setCurrentPlaybackSampleRate(newRate);
        prepareForRate(newRate);
    }

    void OscillatorVoice::startNote(int midiNoteNumber, float velocity, juce::SynthesiserSound* sound, int)
    {
        if (auto* presetSound = dynamic_cast<PresetSound*> (sound))
            spec = presetSound->getSpec();

        noteFrequency = juce::MidiMessage::getMidiNoteInHertz(midiNoteNumber);
        level = velocity * 0.3f * spec.outputGain;
        elapsedSeconds = 0.0;
        releasing = false;

        unisonPhases.fill(0.0);
        modulatorPhase = 0.0;
        secondPhase = 0.0;
        vibratoPhase = 0.0;
        for (int i = 0; i < metalPartials; ++i)
        {
            metalPhases[static_cast<size_t>(i)] = random.nextDouble();
            metalModPhases[static_cast<size_t>(i)] = 0.0;
        }
        pinkState.fill(0.0f);

        // Spread unison phases so the voices do not start in lockstep.
        for (int i = 1; i < maxUnison; ++i)
            unisonPhases[static_cast<size_t>(i)] = random.nextDouble();

        envelope.setParameters(spec.envelope.toAdsr());
        modulationEnvelope.setParameters(spec.modulationEnvelope.toAdsr());
        filterEnvelope.setParameters(spec.filterEnvelope.toAdsr());
        envelope.reset();
        modulationEnvelope.reset();
        filterEnvelope.reset();
        envelope.noteOn();
        modulationEnvelope.noteOn();
        filterEnvelope.noteOn();

        filter.reset();
        filterUpdateCounter = 0;
        if (spec.engine == SynthEngine::Mono && spec.filterBaseHz > 0.0f)
        {
            filter.setType(juce::dsp::StateVariableTPTFilterType::lowpass);
            filter.setResonance(juce::jlimit(0.1f, 10.0f, spec.filterResonance));
            filter.setCutoffFrequency(juce::jlimit(20.0f, static_cast<float>(sampleRate * 0.45), spec.filterBaseHz));
        }
        else if (spec.engine == SynthEngine::Metal)
        {
            filter.setType(juce::dsp::StateVariableTPTFilterType::highpass);
            filter.setResonance(1.0f / juce::MathConstants<float>::sqrt2);
            filter.setCutoffFrequency(juce::jlimit(20.0f, static_cast<float>(sampleRate * 0.45), spec.metalResonanceHz));
        }

        if (spec.engine == SynthEngine::Pluck)
        {
            const auto maxLength = static_cast<int>(pluckLine.size());
            pluckLength = juce::jlimit(2, maxLength, juce::roundToInt(sampleRate / noteFrequency));
            pluckIndex = 0;
            pluckLowpassState = 0.0f;
            pluckPeak = 1.0f;
            pluckPeriodPeak = 0.0f;
            pluckDampCoeff = static_cast<float>(std::exp(-twoPi * juce::jlimit(100.0, sampleRate * 0.45, static_cast<double>(spec.dampeningHz)) / sampleRate));

            const auto burst = juce::jlimit(0.1f, 2.0f, spec.attackNoise) * 0.5f;
            for (int i = 0; i < pluckLength; ++i)
                pluckLine[static_cast<size_t>(i)] = (random.nextFloat() * 2.0f - 1.0f) * burst;
        }
    }

    void OscillatorVoice::stopNote(float, bool allowTailOff)
    {
        if (allowTailOff)
        {
            releasing = true;
            envelope.noteOff();
            modulationEnvelope.noteOff();
            filterEnvelope.noteOff();
        }
        else
        {
            finishNote();
        }
    }

    void OscillatorVoice::finishNote()
    {
        envelope.reset();
        modulationEnvelope.reset();
        filterEnvelope.reset();
        releasing = false;
        clearCurrentNote();
    }

    void OscillatorVoice::renderNextBlock(juce::AudioBuffer<float>& outputBuffer, int startSample, int numSamples)
    {
        if (!isVoiceActive())
            return;

        const auto oneShotLength = static_cast<double>(spec.envelope.attack + spec.envelope.decay);
        const bool oneShot = spec.isOneShot();

        while (--numSamples >= 0)
        {
            const float currentSample = renderSample();
            for (int channel = 0; channel < outputBuffer.getNumChannels(); ++channel)
                outputBuffer.addSample(channel, startSample, currentSample);
            ++startSample;

            if (!envelope.isActive())
            {
                finishNote();
                break;
            }

            if (spec.engine == SynthEngine::Pluck && pluckPeak < 1.0e-4f)
            {
                finishNote();
                break;
            }

            if (oneShot && !releasing && elapsedSeconds >= oneShotLength)
            {
                releasing = true;
                envelope.noteOff();
                modulationEnvelope.noteOff();
                filterEnvelope.noteOff();
            }
        }
    }

    float OscillatorVoice::renderSample()
    {
        const auto env = envelope.getNextSample();
        const auto frequency = noteFrequency;
        float out = 0.0f;

        switch (spec.engine)
        {
            case SynthEngine::Subtractive:
                out = renderSubtractive(frequency);
                break;

            case SynthEngine::Mono:
            {
                out = renderSubtractive(frequency);
                if (spec.filterBaseHz > 0.0f)
                {
                    const auto filterEnv = filterEnvelope.getNextSample();
                    if ((filterUpdateCounter++ & 15) == 0)
                    {
                        const auto cutoff = spec.filterBaseHz * std::pow(2.0f, spec.filterOctaves * filterEnv);
                        filter.setCutoffFrequency(juce::jlimit(20.0f, static_cast<float>(sampleRate * 0.45), cutoff));
                    }
                    out = filter.processSample(0, out);
                }
                break;
            }

            case SynthEngine::FM:
            {
                const auto modEnv = static_cast<double>(modulationEnvelope.getNextSample());
                const auto modFrequency = frequency * spec.harmonicity;
                const auto modulator = renderOscillator(spec.modulationWaveform, modulatorPhase, modFrequency / sampleRate, 0, 0.5f);
                advancePhase(modulatorPhase, modFrequency);

                const auto carrierFrequency = frequency + modulator * spec.modulationIndex * modFrequency * modEnv;
                out = renderOscillator(spec.oscillator.waveform, unisonPhases[0], std::abs(carrierFrequency) / sampleRate, 0, spec.oscillator.pulseWidth);
                advancePhase(unisonPhases[0], carrierFrequency);
                break;
            }

            case SynthEngine::AM:
            {
                const auto modEnv = modulationEnvelope.getNextSample();
                const auto modFrequency = frequency * spec.harmonicity;
                const auto modulator = renderOscillator(spec.modulationWaveform, modulatorPhase, modFrequency / sampleRate, 0, 0.5f);
                const auto carrier = renderOscillator(spec.oscillator.waveform, unisonPhases[0], frequency / sampleRate, 0, spec.oscillator.pulseWidth);
                advancePhase(modulatorPhase, modFrequency);
                advancePhase(unisonPhases[0], frequency);
                out = carrier * (1.0f - modEnv * 0.5f * (1.0f - modulator));
                break;
            }

            case SynthEngine::Duo:
            {
                const auto vibrato = std::sin(twoPi * vibratoPhase) * spec.vibratoAmount;
                advancePhase(vibratoPhase, spec.vibratoRateHz);
                const auto first = frequency * std::pow(2.0, vibrato / 12.0);
                const auto second = first * spec.harmonicity;
                out = 0.5f * (renderOscillator(spec.oscillator.waveform, unisonPhases[0], first / sampleRate, 0, spec.oscillator.pulseWidth)
                              + renderOscillator(spec.secondWaveform, secondPhase, second / sampleRate, 0, 0.5f));
                advancePhase(unisonPhases[0], first);
                advancePhase(secondPhase, second);
                break;
            }

            case SynthEngine::Membrane:
            {
                auto sweep = 1.0;
                if (spec.pitchOctaves > 1.0f && spec.pitchDecaySeconds > 0.0f)
                    sweep = std::pow(static_cast<double>(spec.pitchOctaves), juce::jmax(0.0, 1.0 - elapsedSeconds / spec.pitchDecaySeconds));
                const auto swept = frequency * sweep;
                out = renderOscillator(spec.oscillator.waveform, unisonPhases[0], swept / sampleRate, 0, 0.5f);
                advancePhase(unisonPhases[0], swept);
                break;
            }

            case SynthEngine::Metal:
                out = renderMetal(spec.metalFrequencyHz * frequency / juce::MidiMessage::getMidiNoteInHertz(60));
                break;

            case SynthEngine::Pluck:
                out = renderPluck();
                break;

            case SynthEngine::Noise:
                out = renderNoise();
                break;

            case SynthEngine::Sampler:
            default:
                break;
        }

        elapsedSeconds += 1.0 / sampleRate;
        return out * env * level;
    }

    float OscillatorVoice::renderOscillator(Waveform waveform, double phase, double phaseDelta, int partials, float pulseWidth) const
    {
        if (partials > 0)
        {
            double sum = 0.0;
            for (int n = 1; n <= partials; ++n)
            {
                if (phaseDelta * n >= 0.5)
                    break;
                sum += harmonicWeight(waveform, n) * std::sin(twoPi * phase * n);
            }
            return static_cast<float>(sum);
        }

        switch (waveform)
        {
            case Waveform::Sine:
                return static_cast<float>(std::sin(twoPi * phase));
            case Waveform::Triangle:
                return static_cast<float>(1.0 - 4.0 * std::abs(phase - 0.5));
            case Waveform::Saw:
                return static_cast<float>(2.0 * phase - 1.0 - polyBlep(phase, phaseDelta));
            case Waveform::Square:
                pulseWidth = 0.5f;
                [[fallthrough]];
            case Waveform::Pulse:
            default:
            {
                const auto width = juce::jlimit(0.05, 0.95, static_cast<double>(pulseWidth));
                auto value = phase < width ? 1.0 : -1.0;
                value += polyBlep(phase, phaseDelta);
                value -= polyBlep(std::fmod(phase + 1.0 - width, 1.0), phaseDelta);
                return static_cast<float>(value);
            }
        }
    }

    float OscillatorVoice::renderSubtractive(double frequency)
    {
        const auto& oscillator = spec.oscillator;
        const int count = juce::jlimit(1, maxUnison, oscillator.unisonCount);
        float sum = 0.0f;
        for (int i = 0; i < count; ++i)
        {
            auto voiceFrequency = frequency;
            if (count > 1)
            {
                const auto cents = oscillator.unisonSpreadCents * (static_cast<double>(i) / (count - 1) - 0.5);
                voiceFrequency *= std::pow(2.0, cents / 1200.0);
            }

            auto& phase = unisonPhases[static_cast<size_t>(i)];
            sum += renderOscillator(oscillator.waveform, phase, voiceFrequency / sampleRate, oscillator.partials, oscillator.pulseWidth);
            advancePhase(phase, voiceFrequency);
        }
        return sum / static_cast<float>(count);
    }

    float OscillatorVoice::renderPluck()
    {
        const auto next = (pluckIndex + 1) % pluckLength;
        const auto current = pluckLine[static_cast<size_t>(pluckIndex)];
        const auto averaged = 0.5f * (current + pluckLine[static_cast<size_t>(next)]);

        pluckLowpassState = (1.0f - pluckDampCoeff) * averaged + pluckDampCoeff * pluckLowpassState;
        pluckLine[static_cast<size_t>(pluckIndex)] = pluckLowpassState * spec.pluckResonance;

        pluckPeriodPeak = juce::jmax(pluckPeriodPeak, std::abs(current));
        pluckIndex = next;
        if (pluckIndex == 0)
        {
            pluckPeak = pluckPeriodPeak;
            pluckPeriodPeak = 0.0f;
        }
        return current * 2.0f;
    }

    float OscillatorVoice::renderMetal(double frequency)
    {
        const auto nyquistLimit = sampleRate * 0.45;
        double sum = 0.0;
        for (int i = 0; i < metalPartials; ++i)
        {
            const auto partialFrequency = frequency * metalRatios[static_cast<size_t>(i)];
            const auto modFrequency = partialFrequency * spec.harmonicity;
            auto& modPhase = metalModPhases[static_cast<size_t>(i)];
            const auto modulator = std::sin(twoPi * modPhase);
            advancePhase(modPhase, juce::jmin(modFrequency, nyquistLimit));

            const auto instantaneous = juce::jlimit(0.0, nyquistLimit, partialFrequency + modulator * spec.modulationIndex * partialFrequency * 0.25);
            auto& phase = metalPhases[static_cast<size_t>(i)];
            sum += phase < 0.5 ? 1.0 : -1.0;
            advancePhase(phase, instantaneous);
        }

        return filter.processSample(0, static_cast<float>(sum / metalPartials));
    }

    float OscillatorVoice::renderNoise()
    {
        const auto white = random.nextFloat() * 2.0f - 1.0f;
        if (spec.noiseColour == NoiseColour::White)
            return white;

        auto& b = pinkState;
        b[0] = 0.99886f * b[0] + white * 0.0555179f;
        b[1] = 0.99332f * b[1] + white * 0.0750759f;
        b[2] = 0.96900f * b[2] + white * 0.1538520f;
        b[3] = 0.86650f * b[3] + white * 0.3104856f;
        b[4] = 0.55000f * b[4] + white * 0.5329522f;
        b[5] = -0.7616f * b[5] - white * 0.0168980f;
        const auto pink = b[0] + b[1] + b[2] + b[3] + b[4] + b[5] + b[6] + white * 0.5362f;
        b[6] = white * 0.115926f;
        return pink * 0.11f;
    }

    void OscillatorVoice::advancePhase(double& phase, double frequency) const
    {
        phase += frequency / sampleRate;
        phase -= std::floor(phase);
    }
}
