#pragma once

#include "Logging.hpp"
#include "Authority/ColorAccessor.hpp"
#include "Authority/NameResolver.hpp"
#include "Authority/RegistryInstance.hpp"
#include "Dependents/DependentDescriptor.hpp"
#include "Settings/PaletteSettings.hpp"

#include <memory>
#include <optional>

namespace Palettes {

    // HostEnvironment - process-wide state every loaded copy of the palette library shares.
    //
    // Holds:
    //  - the installed color accessor (the two global palette queries). Whoever installed it owns palettes.
    //  - the installed registry instance, i.e. the highest library version offered so far.
    //  - the id table of a foreign palette library, if one is loaded.
    //  - the host's render descriptors and the library settings.
    //
    // GetInstance() is the process scope. Tests and embedders may construct their own environments.
    // Main-thread only.
    class HostEnvironment {
    public:
        PALETTES_API static HostEnvironment& GetInstance();

        HostEnvironment();
        explicit HostEnvironment(std::shared_ptr<IColorAccessor> hostAccessor);

        HostEnvironment(const HostEnvironment&) = delete;
        HostEnvironment& operator=(const HostEnvironment&) = delete;

        // Accessor slot. Installing nullptr installs an empty accessor.
        const std::shared_ptr<IColorAccessor>& GetAccessor() const { return m_accessor; }
        void InstallAccessor(std::shared_ptr<IColorAccessor> accessor);

        // Instance slot. A version newer than the installed one replaces it, adopting its registry;
        // otherwise the installed instance is returned unchanged.
        std::shared_ptr<RegistryInstance> OfferInstance(const LibraryVersion& version);
        const std::shared_ptr<RegistryInstance>& GetInstalledInstance() const { return m_instance; }

        void SetForeignIdTable(std::optional<ForeignIdTable> table) { m_foreignIds = std::move(table); }
        const std::optional<ForeignIdTable>& GetForeignIdTable() const { return m_foreignIds; }

        DescriptorSet& GetDescriptors() { return m_descriptors; }
        const DescriptorSet& GetDescriptors() const { return m_descriptors; }

        PaletteSettingsData& GetSettings() { return m_settings; }
        const PaletteSettingsData& GetSettings() const { return m_settings; }

    private:
        std::shared_ptr<IColorAccessor> m_accessor;
        std::shared_ptr<RegistryInstance> m_instance;
        std::optional<ForeignIdTable> m_foreignIds;
        DescriptorSet m_descriptors;
        PaletteSettingsData m_settings;
    };

} // namespace Palettes
