#include "EngineConfig.h"
#include "../AppMetadata.h"

namespace cadence
{
    namespace
    {
        constexpr const char* rootTag = "ENGINE_CONFIG";
    }

    void EngineConfig::sanitise()
    {
        if (!(sampleRate >= 8000.0 && sampleRate <= 384000.0))
            sampleRate = 44100.0;
        blockSize = juce::jlimit(16, 8192, blockSize);
        masterGain = juce::jlimit(0.0f, 2.0f, masterGain);
        limiterCeilingDb = juce::jlimit(-24.0f, 0.0f, limiterCeilingDb);
        minScheduledNoteSeconds = juce::jlimit(0.0, 1.0, minScheduledNoteSeconds);
        minRecordedNoteBeats = juce::jlimit(0.0, 4.0, minRecordedNoteBeats);
        maxPolyphony = juce::jlimit(1, 64, maxPolyphony);
        sampleLoadTimeoutMs = juce::jlimit(0, 60000, sampleLoadTimeoutMs);
        if (defaultPresetId.trim().isEmpty())
            defaultPresetId = "triangle-lead";
    }

    std::unique_ptr<juce::XmlElement> EngineConfig::toXml() const
    {
        auto xml = std::make_unique<juce::XmlElement>(rootTag);
        xml->setAttribute("version", meta::versionString);
        xml->setAttribute("sampleRate", sampleRate);
        xml->setAttribute("blockSize", blockSize);
        xml->setAttribute("masterGain", static_cast<double>(masterGain));
        xml->setAttribute("limiterCeilingDb", static_cast<double>(limiterCeilingDb));
        xml->setAttribute("minScheduledNoteSeconds", minScheduledNoteSeconds);
        xml->setAttribute("minRecordedNoteBeats", minRecordedNoteBeats);
        xml->setAttribute("maxPolyphony", maxPolyphony);
        xml->setAttribute("sampleLoadTimeoutMs", sampleLoadTimeoutMs);
        xml->setAttribute("samplesDirectory", samplesDirectory.getFullPathName());
        xml->setAttribute("defaultPresetId", defaultPresetId);
        return xml;
    }

    EngineConfig EngineConfig::fromXml(const juce::XmlElement& xml)
    {
        EngineConfig config;
        config.sampleRate = xml.getDoubleAttribute("sampleRate", config.sampleRate);
        config.blockSize = xml.getIntAttribute("blockSize", config.blockSize);
        config.masterGain = static_cast<float>(xml.getDoubleAttribute("masterGain", config.masterGain));
        config.limiterCeilingDb = static_cast<float>(xml.getDoubleAttribute("limiterCeilingDb", config.limiterCeilingDb));
        config.minScheduledNoteSeconds = xml.getDoubleAttribute("minScheduledNoteSeconds", config.minScheduledNoteSeconds);
        config.minRecordedNoteBeats = xml.getDoubleAttribute("minRecordedNoteBeats", config.minRecordedNoteBeats);
        config.maxPolyphony = xml.getIntAttribute("maxPolyphony", config.maxPolyphony);
        config.sampleLoadTimeoutMs = xml.getIntAttribute("sampleLoadTimeoutMs", config.sampleLoadTimeoutMs);
        config.defaultPresetId = xml.getStringAttribute("defaultPresetId", config.defaultPresetId);

        const auto samplesPath = xml.getStringAttribute("samplesDirectory");
        if (juce::File::isAbsolutePath(samplesPath))
            config.samplesDirectory = juce::File(samplesPath);

        config.sanitise();
        return config;
    }

    bool EngineConfig::loadFromFile(const juce::File& file, EngineConfig& config, juce::String& errorMessage)
    {
        if (!file.existsAsFile())
        {
            errorMessage = "Config file does not exist: " + file.getFullPathName();
            return false;
        }

        juce::XmlDocument document(file);
        std::unique_ptr<juce::XmlElement> xml(document.getDocumentElement());
        if (xml == nullptr)
        {
            errorMessage = "Config file is not valid XML: " + document.getLastParseError();
            return false;
        }

        if (!xml->hasTagName(rootTag))
        {
            errorMessage = "Unexpected config root element <" + xml->getTagName() + ">";
            return false;
        }

        config = fromXml(*xml);
        errorMessage.clear();
        return true;
    }

    bool EngineConfig::saveToFile(const juce::File& file, const EngineConfig& config, juce::String& errorMessage)
    {
        if (file == juce::File{})
        {
            errorMessage = "No config file was selected.";
            return false;
        }

        auto parent = file.getParentDirectory();
        if (!parent.exists() && !parent.createDirectory())
        {
            errorMessage = "Unable to create config folder:\n" + parent.getFullPathName();
            return false;
        }

        if (!config.toXml()->writeTo(file))
        {
            errorMessage = "Unable to write config file:\n" + file.getFullPathName();
            return false;
        }

        errorMessage.clear();
        return true;
    }

    juce::File EngineConfig::getDefaultConfigFile()
    {
        return juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory)
            .getChildFile(meta::appDataFolder)
            .getChildFile(meta::configFileName);
    }
}
