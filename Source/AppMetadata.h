#pragma once
#include <juce_core/juce_core.h>

namespace cadence::meta
{
    // Centralized branding / IDs shared by the host app, logs and config files.
    static constexpr const char* companyName  = "Cadence";
    static constexpr const char* productName  = "Cadence Host";
    static constexpr const char* versionString = "0.3.0";

    // Folder under the user application-data directory for logs and config.
    static constexpr const char* appDataFolder = "Cadence";
    static constexpr const char* configFileName = "cadence-engine.xml";
} // namespace cadence::meta
