#pragma once

#include "Registry/Color.hpp"

// ColorValidator - turns raw palette input into the registry's representation.
//
// Every Validate/Normalize function throws ValidationError with a message naming the
// offending field. None of them touch registry state.
namespace Palettes {
    namespace ColorValidator {

        bool IsValidChannel(int value);

        // True if the raw color has exactly three channels, each in [MIN_CHANNEL, MAX_CHANNEL]
        bool IsValidColor(const RawColor& raw);

        Color NormalizeColor(const std::string& slotName, const RawColor& raw);

        // Builds the slot-ordered color map. Throws if any of the eight slots is missing or invalid.
        ColorMap NormalizeColorMap(const std::unordered_map<std::string, RawColor>& colors);

        void ValidateId(const std::string& id);

        // An absent name is valid; a present name must not be empty
        void ValidateName(const std::optional<std::string>& name);

        // Validates id, name and colors, returning the normalized colors
        ColorMap ValidateDefinition(const PaletteDefinition& definition);

    } // namespace ColorValidator
} // namespace Palettes
