#include "pch.h"
#include "Dependents/DependentDescriptor.hpp"
#include "Logging.hpp"

namespace Palettes {

    DependentDescriptor& DescriptorSet::Add(const std::string& name, const DependentDescriptor& descriptor) {
        DependentDescriptor& slot = m_descriptors[name];
        slot = descriptor;
        return slot;
    }

    DependentDescriptor* DescriptorSet::Derive(const std::string& name, const std::string& baseName, const std::string& spritePath) {
        const DependentDescriptor* base = Find(baseName);
        if (!base) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[DescriptorSet] Cannot derive '", name, "', base '", baseName, "' does not exist");
            return nullptr;
        }

        DependentDescriptor derived = *base;
        derived.spritePath = spritePath;
        return &Add(name, derived);
    }

    DependentDescriptor* DescriptorSet::Find(const std::string& name) {
        auto it = m_descriptors.find(name);
        return it != m_descriptors.end() ? &it->second : nullptr;
    }

    const DependentDescriptor* DescriptorSet::Find(const std::string& name) const {
        auto it = m_descriptors.find(name);
        return it != m_descriptors.end() ? &it->second : nullptr;
    }

} // namespace Palettes
