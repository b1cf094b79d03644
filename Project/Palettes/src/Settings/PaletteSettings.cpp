#include "pch.h"
#include "Settings/PaletteSettings.hpp"
#include "Logging.hpp"

#include "rapidjson/document.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"

#include <fstream>
#include <filesystem>

namespace Palettes {

    PaletteLogging::LoggingConfig PaletteSettingsData::ToLoggingConfig() const {
        PaletteLogging::LoggingConfig config;
        config.level = logLevel;
        config.logToFile = logToFile;
        config.filePath = logFile;
        return config;
    }

    bool ParsePaletteSettings(const std::string& json, PaletteSettingsData& out) {
        rapidjson::Document doc;
        doc.Parse(json.c_str());

        if (doc.HasParseError() || !doc.IsObject()) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteSettings] JSON parse error at offset ", doc.GetErrorOffset());
            return false;
        }

        PaletteSettingsData settings = out;

        if (doc.HasMember("palettePathPrefix") && doc["palettePathPrefix"].IsString()) {
            settings.palettePathPrefix = doc["palettePathPrefix"].GetString();
        }

        if (doc.HasMember("baseDescriptors") && doc["baseDescriptors"].IsArray()) {
            settings.baseDescriptors.clear();
            for (const auto& value : doc["baseDescriptors"].GetArray()) {
                if (value.IsString()) {
                    settings.baseDescriptors.emplace_back(value.GetString());
                }
                else {
                    PALETTES_PRINT(PaletteLogging::LogLevel::Warn, "[PaletteSettings] Ignoring non-string entry in baseDescriptors");
                }
            }
        }

        if (doc.HasMember("logLevel") && doc["logLevel"].IsString()) {
            settings.logLevel = PaletteLogging::ParseLogLevel(doc["logLevel"].GetString(), settings.logLevel);
        }
        if (doc.HasMember("logToFile") && doc["logToFile"].IsBool()) {
            settings.logToFile = doc["logToFile"].GetBool();
        }
        if (doc.HasMember("logFile") && doc["logFile"].IsString()) {
            settings.logFile = doc["logFile"].GetString();
        }

        out = settings;
        return true;
    }

    bool LoadPaletteSettings(const std::string& filePath, PaletteSettingsData& out) {
        namespace fs = std::filesystem;

        // Check if file exists (avoid exception overhead)
        if (!fs::exists(filePath)) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Info, "[PaletteSettings] No settings found at ", filePath, ", using defaults");
            return false;
        }

        std::ifstream inFile(filePath, std::ios::binary);
        if (!inFile.is_open()) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteSettings] Failed to open file: ", filePath);
            return false;
        }

        std::string jsonContent((std::istreambuf_iterator<char>(inFile)), std::istreambuf_iterator<char>());
        inFile.close();

        if (!ParsePaletteSettings(jsonContent, out)) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteSettings] Invalid settings file: ", filePath);
            return false;
        }

        PALETTES_PRINT(PaletteLogging::LogLevel::Info, "[PaletteSettings] Loaded settings from: ", filePath);
        return true;
    }

    bool SavePaletteSettings(const std::string& filePath, const PaletteSettingsData& settings) {
        namespace fs = std::filesystem;

        // Create parent directory if needed
        fs::path parentDir = fs::path(filePath).parent_path();
        if (!parentDir.empty() && !fs::exists(parentDir)) {
            std::error_code ec;
            fs::create_directories(parentDir, ec);
            if (ec) {
                PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteSettings] Failed to create directory: ", parentDir.string());
                return false;
            }
        }

        rapidjson::Document doc;
        doc.SetObject();
        rapidjson::Document::AllocatorType& alloc = doc.GetAllocator();

        doc.AddMember("palettePathPrefix", rapidjson::Value(settings.palettePathPrefix.c_str(), alloc), alloc);

        rapidjson::Value bases(rapidjson::kArrayType);
        for (const std::string& base : settings.baseDescriptors) {
            bases.PushBack(rapidjson::Value(base.c_str(), alloc), alloc);
        }
        doc.AddMember("baseDescriptors", bases, alloc);

        doc.AddMember("logLevel", rapidjson::Value(PaletteLogging::LogLevelName(settings.logLevel), alloc), alloc);
        doc.AddMember("logToFile", settings.logToFile, alloc);
        doc.AddMember("logFile", rapidjson::Value(settings.logFile.c_str(), alloc), alloc);

        rapidjson::StringBuffer buffer;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);

        std::ofstream outFile(filePath, std::ios::binary);
        if (!outFile.is_open()) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteSettings] Failed to open file for writing: ", filePath);
            return false;
        }

        outFile << buffer.GetString();
        outFile.close();

        PALETTES_PRINT(PaletteLogging::LogLevel::Debug, "[PaletteSettings] Saved settings to: ", filePath);
        return true;
    }

} // namespace Palettes
