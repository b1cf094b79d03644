#pragma once

#include <array>
#include <optional>
#include <string>

// Ids and display names of the host's nine built-in palettes, indexed from 1.
// Only consulted when migrating palettes this registry has not seen yet.
namespace Palettes {
    namespace BuiltinPalettes {

        constexpr int BUILTIN_PALETTE_COUNT = 9;

        inline constexpr std::array<const char*, BUILTIN_PALETTE_COUNT> IDS = {
            "RiftWalkers",
            "RustingHulks",
            "ZenithGuard",
            "Blitzkrieg",
            "SteelJudoka",
            "FlameBehemoths",
            "FrozenTitans",
            "HazardousMechs",
            "SecretSquad"
        };

        inline constexpr std::array<const char*, BUILTIN_PALETTE_COUNT> NAMES = {
            "Archive Olive",
            "Rust Orange",
            "Pinnacle Dark Blue",
            "Detrius Yellow",
            "Archive Shivan",
            "Rust Red",
            "Pinnacle Ice Blue",
            "Detrius Tan",
            "Vek Purple"
        };

        inline std::optional<std::string> IdAt(int index) {
            if (index < 1 || index > BUILTIN_PALETTE_COUNT) return std::nullopt;
            return std::string(IDS[static_cast<size_t>(index - 1)]);
        }

        inline std::optional<std::string> NameAt(int index) {
            if (index < 1 || index > BUILTIN_PALETTE_COUNT) return std::nullopt;
            return std::string(NAMES[static_cast<size_t>(index - 1)]);
        }

    } // namespace BuiltinPalettes
} // namespace Palettes
