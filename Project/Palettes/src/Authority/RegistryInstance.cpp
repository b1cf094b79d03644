#include "pch.h"
#include "Authority/RegistryInstance.hpp"

namespace Palettes {

    RegistryInstance::RegistryInstance(const LibraryVersion& version, std::shared_ptr<PaletteRegistry> registry)
        : m_version(version)
        , m_registry(registry ? std::move(registry) : std::make_shared<PaletteRegistry>())
        , m_accessor(std::make_shared<RegistryColorAccessor>(m_registry))
    {
    }

} // namespace Palettes
