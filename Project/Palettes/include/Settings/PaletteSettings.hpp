#pragma once

#include "Logging.hpp"

#include <string>
#include <vector>

namespace Palettes {

    // PaletteSettingsData - JSON-configurable settings of the palette library
    struct PaletteSettingsData {
        // Descriptors whose sprite path starts with this prefix hold one frame per palette
        std::string palettePathPrefix = "units/player";

        // Descriptors that hold one frame per palette regardless of sprite path
        std::vector<std::string> baseDescriptors = { "MechUnit", "MechIcon" };

        PaletteLogging::LogLevel logLevel = PaletteLogging::LogLevel::Info;
        bool logToFile = false;
        std::string logFile = "logs/palettes.log";

        PaletteLogging::LoggingConfig ToLoggingConfig() const;
    };

    // Reads settings from a JSON file. Missing or mistyped members keep the values already in `out`.
    // Returns false (and leaves `out` untouched) if the file is missing or not valid JSON.
    bool LoadPaletteSettings(const std::string& filePath, PaletteSettingsData& out);

    // Same as LoadPaletteSettings, for JSON text already in memory
    bool ParsePaletteSettings(const std::string& json, PaletteSettingsData& out);

    // Writes settings as pretty-printed JSON
    bool SavePaletteSettings(const std::string& filePath, const PaletteSettingsData& settings);

} // namespace Palettes
