#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/type_precision.hpp>

namespace Palettes {

    constexpr size_t PALETTE_SLOT_COUNT = 8;

    constexpr int MIN_CHANNEL = 0;
    constexpr int MAX_CHANNEL = 255;

    using Color = glm::u8vec3;

    // Colors of one palette, indexed by ColorSlot
    using ColorMap = std::array<Color, PALETTE_SLOT_COUNT>;

    // Unchecked channel list as supplied by callers and data files
    using RawColor = std::vector<int>;

    enum class ColorSlot {
        PlateHighlight = 0,
        PlateLight,
        PlateMid,
        PlateDark,
        PlateOutline,
        PlateShadow,
        BodyColor,
        BodyHighlight
    };

    // Key names for each slot, in slot order
    inline constexpr std::array<const char*, PALETTE_SLOT_COUNT> PALETTE_SLOT_NAMES = {
        "PlateHighlight",
        "PlateLight",
        "PlateMid",
        "PlateDark",
        "PlateOutline",
        "PlateShadow",
        "BodyColor",
        "BodyHighlight"
    };

    // Raw palette data handed to Register. Keys of `colors` are slot names; unknown keys are ignored.
    struct PaletteDefinition {
        std::string id;
        std::optional<std::string> name;
        std::unordered_map<std::string, RawColor> colors;
    };

    // Thrown when a palette definition is malformed. Nothing has been mutated when it is thrown.
    class ValidationError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

} // namespace Palettes
