#include <juce_core/juce_core.h>
#include <cmath>
#include <limits>
#include "../engine/MasterBus.h"
#include "TestHelpers.h"

using namespace cadence;
using namespace cadence::testing;

class MasterBusTests final : public juce::UnitTest
{
public:
    MasterBusTests() : juce::UnitTest("Master bus", "Cadence") {}

    void runTest() override
    {
        beginTest("Output never exceeds the ceiling");
        {
            MasterBus bus(1.0f, -6.0f);
            juce::AudioBuffer<float> buffer(2, 512);
            for (int block = 0; block < 8; ++block)
            {
                for (int ch = 0; ch < 2; ++ch)
                    for (int i = 0; i < buffer.getNumSamples(); ++i)
                        buffer.setSample(ch, i, 3.0f * std::sin(0.05f * static_cast<float>(block * 512 + i)));

                bus.process(buffer, 0, buffer.getNumSamples());
                expect(peakOf(buffer) <= bus.getCeilingGain() + 1.0e-6f);
            }
            expect(!bus.hadOutputFault());
        }

        beginTest("Quiet signals pass through");
        {
            MasterBus bus(1.0f, -1.0f);
            juce::AudioBuffer<float> buffer(2, 4096);
            for (int ch = 0; ch < 2; ++ch)
                for (int i = 0; i < buffer.getNumSamples(); ++i)
                    buffer.setSample(ch, i, 0.1f * std::sin(0.05f * static_cast<float>(i)));

            bus.process(buffer, 0, buffer.getNumSamples());
            expectWithinAbsoluteError(peakOf(buffer, 2048, 2048), 0.1f, 0.01f);
        }

        beginTest("Non-finite samples are zeroed and flagged");
        {
            MasterBus bus(1.0f, -1.0f);
            juce::AudioBuffer<float> buffer(2, 64);
            buffer.clear();
            buffer.setSample(0, 10, std::numeric_limits<float>::quiet_NaN());
            buffer.setSample(1, 20, std::numeric_limits<float>::infinity());

            bus.process(buffer, 0, buffer.getNumSamples());
            expect(bus.hadOutputFault());
            for (int ch = 0; ch < 2; ++ch)
                for (int i = 0; i < buffer.getNumSamples(); ++i)
                    expect(std::isfinite(buffer.getSample(ch, i)));

            bus.reset();
            expect(!bus.hadOutputFault());
        }

        beginTest("Gain changes are clamped");
        {
            MasterBus bus(0.9f, -1.0f);
            bus.setGain(5.0f);
            expectEquals(bus.getGain(), 2.0f);
            bus.setCeilingDb(3.0f);
            expectEquals(bus.getCeilingGain(), 1.0f);
        }
    }
};

static MasterBusTests masterBusTests;
