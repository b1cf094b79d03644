#include "pch.h"
#include "Authority/ColorAccessor.hpp"
#include "Registry/PaletteRegistry.hpp"

namespace Palettes {

    std::optional<ColorMap> StaticColorAccessor::GetColorMap(int index) const {
        if (index < 1 || index > GetColorCount()) {
            return std::nullopt;
        }
        return m_colorMaps[static_cast<size_t>(index - 1)];
    }

    int RegistryColorAccessor::GetColorCount() const {
        return m_registry->Count();
    }

    std::optional<ColorMap> RegistryColorAccessor::GetColorMap(int index) const {
        return m_registry->ColorMapAt(index);
    }

} // namespace Palettes
