#pragma once

#include "Registry/PaletteRegistry.hpp"

// Image offsets used by sprites are the palette index minus one.
namespace Palettes {
    namespace OffsetAdapter {

        inline int IndexToOffset(int index) { return index - 1; }
        inline int OffsetToIndex(int offset) { return offset + 1; }

        std::optional<std::string> OffsetToId(const PaletteRegistry& registry, int offset);
        std::optional<int> IdToOffset(const PaletteRegistry& registry, const std::string& id);

    } // namespace OffsetAdapter
} // namespace Palettes
