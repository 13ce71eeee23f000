#include <juce_core/juce_core.h>
#include "../core/EngineConfig.h"

using namespace cadence;

class EngineConfigTests final : public juce::UnitTest
{
public:
    EngineConfigTests() : juce::UnitTest("Engine config", "Cadence") {}

    void runTest() override
    {
        const auto folder = juce::File::getSpecialLocation(juce::File::tempDirectory).getChildFile("cadence_config_test");
        folder.deleteRecursively();

        beginTest("Save then load keeps every field");
        {
            EngineConfig config;
            config.sampleRate = 48000.0;
            config.blockSize = 256;
            config.masterGain = 0.5f;
            config.limiterCeilingDb = -3.0f;
            config.minScheduledNoteSeconds = 0.02;
            config.minRecordedNoteBeats = 0.25;
            config.maxPolyphony = 8;
            config.sampleLoadTimeoutMs = 500;
            config.samplesDirectory = folder.getChildFile("samples");
            config.defaultPresetId = "organ";

            const auto file = folder.getChildFile("nested").getChildFile("engine.xml");
            juce::String error;
            expect(EngineConfig::saveToFile(file, config, error), error);

            EngineConfig loaded;
            expect(EngineConfig::loadFromFile(file, loaded, error), error);
            expectEquals(loaded.sampleRate, 48000.0);
            expectEquals(loaded.blockSize, 256);
            expectWithinAbsoluteError(loaded.masterGain, 0.5f, 1.0e-6f);
            expectWithinAbsoluteError(loaded.limiterCeilingDb, -3.0f, 1.0e-6f);
            expectWithinAbsoluteError(loaded.minScheduledNoteSeconds, 0.02, 1.0e-9);
            expectWithinAbsoluteError(loaded.minRecordedNoteBeats, 0.25, 1.0e-9);
            expectEquals(loaded.maxPolyphony, 8);
            expectEquals(loaded.sampleLoadTimeoutMs, 500);
            expect(loaded.samplesDirectory == config.samplesDirectory);
            expectEquals(loaded.defaultPresetId, juce::String("organ"));
        }

        beginTest("Missing and malformed files are reported");
        {
            EngineConfig config;
            juce::String error;
            expect(!EngineConfig::loadFromFile(folder.getChildFile("absent.xml"), config, error));
            expect(error.isNotEmpty());

            const auto garbage = folder.getChildFile("garbage.xml");
            garbage.replaceWithText("<ENGINE_CONFIG sampleRate=");
            expect(!EngineConfig::loadFromFile(garbage, config, error));

            const auto wrongRoot = folder.getChildFile("wrong.xml");
            wrongRoot.replaceWithText("<SOMETHING_ELSE/>");
            expect(!EngineConfig::loadFromFile(wrongRoot, config, error));
            expect(error.contains("SOMETHING_ELSE"));

            expect(!EngineConfig::saveToFile(juce::File(), config, error));
        }

        beginTest("Missing attributes keep defaults and bad values are clamped");
        {
            juce::XmlElement xml("ENGINE_CONFIG");
            xml.setAttribute("blockSize", 1);
            xml.setAttribute("masterGain", 10.0);
            xml.setAttribute("limiterCeilingDb", 6.0);
            xml.setAttribute("sampleRate", -1.0);
            xml.setAttribute("defaultPresetId", "  ");

            const auto config = EngineConfig::fromXml(xml);
            expectEquals(config.blockSize, 16);
            expectWithinAbsoluteError(config.masterGain, 2.0f, 1.0e-6f);
            expectWithinAbsoluteError(config.limiterCeilingDb, 0.0f, 1.0e-6f);
            expectEquals(config.sampleRate, 44100.0);
            expectEquals(config.maxPolyphony, 16);
            expectEquals(config.defaultPresetId, juce::String("triangle-lead"));
        }

        folder.deleteRecursively();
    }
};

static EngineConfigTests engineConfigTests;
