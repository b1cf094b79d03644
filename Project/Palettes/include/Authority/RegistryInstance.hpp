#pragma once

#include "Authority/ColorAccessor.hpp"
#include "Authority/LibraryVersion.hpp"
#include "Registry/PaletteRegistry.hpp"

#include <memory>

namespace Palettes {

    // One version's live palette state: the registry plus the accessor that marks it as authoritative.
    // The registry may be shared with an older instance it adopted.
    class RegistryInstance {
    public:
        RegistryInstance(const LibraryVersion& version, std::shared_ptr<PaletteRegistry> registry);

        const LibraryVersion& GetVersion() const { return m_version; }

        PaletteRegistry& GetRegistry() { return *m_registry; }
        const PaletteRegistry& GetRegistry() const { return *m_registry; }
        const std::shared_ptr<PaletteRegistry>& GetSharedRegistry() const { return m_registry; }

        const std::shared_ptr<IColorAccessor>& GetAccessor() const { return m_accessor; }

    private:
        LibraryVersion m_version;
        std::shared_ptr<PaletteRegistry> m_registry;
        std::shared_ptr<IColorAccessor> m_accessor;
    };

} // namespace Palettes
