#pragma once

#include "Registry/Color.hpp"

#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace Palettes {

    class PaletteRegistry;

    // The two process-wide palette queries. Whoever's accessor is installed in the
    // HostEnvironment owns palettes for the whole process.
    struct IColorAccessor {
        virtual ~IColorAccessor() = default;

        // Number of palettes the implementation claims to hold
        virtual int GetColorCount() const = 0;

        // Colors for a 1-based index, or nullopt if the implementation has no data there
        virtual std::optional<ColorMap> GetColorMap(int index) const = 0;
    };

    // Fixed list of color maps, e.g. the host's built-in palettes
    class StaticColorAccessor : public IColorAccessor {
    public:
        StaticColorAccessor() = default;
        explicit StaticColorAccessor(std::vector<ColorMap> colorMaps) : m_colorMaps(std::move(colorMaps)) {}

        int GetColorCount() const override { return static_cast<int>(m_colorMaps.size()); }
        std::optional<ColorMap> GetColorMap(int index) const override;

    private:
        std::vector<ColorMap> m_colorMaps;
    };

    // Serves a PaletteRegistry. Each registry instance owns exactly one of these,
    // and its identity is what marks the instance as authoritative.
    class RegistryColorAccessor : public IColorAccessor {
    public:
        explicit RegistryColorAccessor(std::shared_ptr<const PaletteRegistry> registry) : m_registry(std::move(registry)) {}

        int GetColorCount() const override;
        std::optional<ColorMap> GetColorMap(int index) const override;

    private:
        std::shared_ptr<const PaletteRegistry> m_registry;
    };

} // namespace Palettes
