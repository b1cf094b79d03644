#include "pch.h"
#include "Registry/OffsetAdapter.hpp"

namespace Palettes {
    namespace OffsetAdapter {

        std::optional<std::string> OffsetToId(const PaletteRegistry& registry, int offset) {
            // offsets past the registry have no index, and OffsetToIndex would overflow at INT_MAX
            if (offset < 0 || offset >= registry.Count()) {
                return std::nullopt;
            }
            return registry.IdAt(OffsetToIndex(offset));
        }

        std::optional<int> IdToOffset(const PaletteRegistry& registry, const std::string& id) {
            std::optional<int> index = registry.IndexOf(id);
            if (!index) {
                return std::nullopt;
            }
            return IndexToOffset(*index);
        }

    } // namespace OffsetAdapter
} // namespace Palettes
