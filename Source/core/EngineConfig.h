#pragma once
#include <juce_core/juce_core.h>

namespace cadence
{
    // Runtime tunables. Loaded from an XML file (ENGINE_CONFIG root, one
    // attribute per field); attributes that are missing keep their defaults.
    struct EngineConfig
    {
        double sampleRate = 44100.0;
        int blockSize = 512;

        float masterGain = 0.9f;
        float limiterCeilingDb = -1.0f;

        // Scheduled notes shorter than this are stretched to it.
        double minScheduledNoteSeconds = 0.05;
        // Live-recorded notes shorter than this are stretched to it.
        double minRecordedNoteBeats = 0.125;

        int maxPolyphony = 16;
        int sampleLoadTimeoutMs = 2000;

        juce::File samplesDirectory;
        juce::String defaultPresetId = "triangle-lead";

        float getLimiterCeilingGain() const
        {
            return juce::Decibels::decibelsToGain(limiterCeilingDb);
        }

        void sanitise();

        std::unique_ptr<juce::XmlElement> toXml() const;
        static EngineConfig fromXml(const juce::XmlElement& xml);

        static bool loadFromFile(const juce::File& file, EngineConfig& config, juce::String& errorMessage);
        static bool saveToFile(const juce::File& file, const EngineConfig& config, juce::String& errorMessage);

        static juce::File getDefaultConfigFile();
    };
}
