#include "pch.h"
#include "Settings/PaletteDefinitionLoader.hpp"
#include "Registry/ColorValidator.hpp"
#include "Logging.hpp"

#include "rapidjson/document.h"

#include <fstream>
#include <filesystem>

namespace Palettes {

    namespace {

        bool ReadRawColor(const rapidjson::Value& value, RawColor& out) {
            if (!value.IsArray()) {
                return false;
            }
            out.clear();
            for (const auto& channel : value.GetArray()) {
                if (!channel.IsInt()) {
                    return false;
                }
                out.push_back(channel.GetInt());
            }
            return true;
        }

        // Collects every array member as a raw color. Non-array members other than ID and Name are ignored.
        bool ReadColors(const rapidjson::Value& object, std::unordered_map<std::string, RawColor>& out, const std::string& context) {
            for (auto it = object.MemberBegin(); it != object.MemberEnd(); ++it) {
                std::string key = it->name.GetString();
                if (!it->value.IsArray()) {
                    continue;
                }

                RawColor raw;
                if (!ReadRawColor(it->value, raw)) {
                    PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteDefinitionLoader] ", context, ": color ", key,
                        " must be an array of integers");
                    return false;
                }
                out[key] = raw;
            }
            return true;
        }

        bool ReadDefinition(const rapidjson::Value& value, size_t position, PaletteDefinition& out) {
            std::string context = "palettes[" + std::to_string(position) + "]";
            if (!value.IsObject()) {
                PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteDefinitionLoader] ", context, " is not an object");
                return false;
            }
            if (!value.HasMember("ID") || !value["ID"].IsString()) {
                PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteDefinitionLoader] ", context, " is missing a string ID");
                return false;
            }

            out.id = value["ID"].GetString();
            if (value.HasMember("Name")) {
                if (!value["Name"].IsString()) {
                    PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteDefinitionLoader] ", context, ": Name must be a string");
                    return false;
                }
                out.name = std::string(value["Name"].GetString());
            }

            return ReadColors(value, out.colors, context);
        }

        bool ReadHostPalette(const rapidjson::Value& value, size_t position, ColorMap& out) {
            std::string context = "hostPalettes[" + std::to_string(position) + "]";
            if (!value.IsObject()) {
                PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteDefinitionLoader] ", context, " is not an object");
                return false;
            }

            std::unordered_map<std::string, RawColor> colors;
            if (!ReadColors(value, colors, context)) {
                return false;
            }

            try {
                out = ColorValidator::NormalizeColorMap(colors);
            }
            catch (const ValidationError& e) {
                PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteDefinitionLoader] ", context, ": ", e.what());
                return false;
            }
            return true;
        }

    } // anonymous

    bool ParsePaletteDefinitions(const std::string& json, PaletteDefinitionFile& out) {
        rapidjson::Document doc;
        doc.Parse(json.c_str());

        if (doc.HasParseError() || !doc.IsObject()) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteDefinitionLoader] JSON parse error at offset ", doc.GetErrorOffset());
            return false;
        }

        PaletteDefinitionFile result;

        if (doc.HasMember("palettes")) {
            if (!doc["palettes"].IsArray()) {
                PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteDefinitionLoader] 'palettes' must be an array");
                return false;
            }
            size_t position = 0;
            for (const auto& value : doc["palettes"].GetArray()) {
                PaletteDefinition definition;
                if (!ReadDefinition(value, position++, definition)) {
                    return false;
                }
                result.palettes.push_back(std::move(definition));
            }
        }

        if (doc.HasMember("hostPalettes")) {
            if (!doc["hostPalettes"].IsArray()) {
                PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteDefinitionLoader] 'hostPalettes' must be an array");
                return false;
            }
            size_t position = 0;
            for (const auto& value : doc["hostPalettes"].GetArray()) {
                ColorMap colors{};
                if (!ReadHostPalette(value, position++, colors)) {
                    return false;
                }
                result.hostPalettes.push_back(colors);
            }
        }

        out = std::move(result);
        return true;
    }

    bool LoadPaletteDefinitions(const std::string& filePath, PaletteDefinitionFile& out) {
        namespace fs = std::filesystem;

        if (!fs::exists(filePath)) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteDefinitionLoader] File not found: ", filePath);
            return false;
        }

        std::ifstream inFile(filePath, std::ios::binary);
        if (!inFile.is_open()) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteDefinitionLoader] Failed to open file: ", filePath);
            return false;
        }

        std::string jsonContent((std::istreambuf_iterator<char>(inFile)), std::istreambuf_iterator<char>());
        inFile.close();

        if (!ParsePaletteDefinitions(jsonContent, out)) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteDefinitionLoader] Invalid definition file: ", filePath);
            return false;
        }

        PALETTES_PRINT(PaletteLogging::LogLevel::Info, "[PaletteDefinitionLoader] Loaded ", out.palettes.size(), " palettes from: ", filePath);
        return true;
    }

} // namespace Palettes
