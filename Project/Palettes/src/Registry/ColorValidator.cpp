#include "pch.h"
#include "Registry/ColorValidator.hpp"

namespace Palettes {
    namespace ColorValidator {

        bool IsValidChannel(int value) {
            return value >= MIN_CHANNEL && value <= MAX_CHANNEL;
        }

        bool IsValidColor(const RawColor& raw) {
            if (raw.size() != 3) {
                return false;
            }
            return std::all_of(raw.begin(), raw.end(), IsValidChannel);
        }

        Color NormalizeColor(const std::string& slotName, const RawColor& raw) {
            if (raw.size() != 3) {
                throw ValidationError("Invalid palette, color " + slotName + " must contain three integers (got "
                    + std::to_string(raw.size()) + ")");
            }
            for (int channel : raw) {
                if (!IsValidChannel(channel)) {
                    throw ValidationError("Invalid palette, color " + slotName + " has channel "
                        + std::to_string(channel) + " outside [0, 255]");
                }
            }
            return Color(static_cast<glm::u8>(raw[0]), static_cast<glm::u8>(raw[1]), static_cast<glm::u8>(raw[2]));
        }

        ColorMap NormalizeColorMap(const std::unordered_map<std::string, RawColor>& colors) {
            ColorMap result{};
            for (size_t i = 0; i < PALETTE_SLOT_COUNT; ++i) {
                const std::string slotName = PALETTE_SLOT_NAMES[i];
                auto it = colors.find(slotName);
                if (it == colors.end()) {
                    throw ValidationError("Invalid palette, missing key " + slotName);
                }
                result[i] = NormalizeColor(slotName, it->second);
            }
            return result;
        }

        void ValidateId(const std::string& id) {
            if (id.empty()) {
                throw ValidationError("Invalid palette, missing string ID");
            }
        }

        void ValidateName(const std::optional<std::string>& name) {
            if (name && name->empty()) {
                throw ValidationError("Name must be a non-empty string");
            }
        }

        ColorMap ValidateDefinition(const PaletteDefinition& definition) {
            ValidateId(definition.id);
            ValidateName(definition.name);
            try {
                return NormalizeColorMap(definition.colors);
            }
            catch (const ValidationError& e) {
                // Name the palette so batch callers can tell which definition failed
                throw ValidationError(std::string(e.what()) + " (palette '" + definition.id + "')");
            }
        }

    } // namespace ColorValidator
} // namespace Palettes
