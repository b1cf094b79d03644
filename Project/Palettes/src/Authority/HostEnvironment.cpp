#include "pch.h"
#include "Authority/HostEnvironment.hpp"

namespace Palettes {

    HostEnvironment& HostEnvironment::GetInstance() {
        static HostEnvironment instance;
        return instance;
    }

    HostEnvironment::HostEnvironment()
        : m_accessor(std::make_shared<StaticColorAccessor>())
    {
    }

    HostEnvironment::HostEnvironment(std::shared_ptr<IColorAccessor> hostAccessor)
        : HostEnvironment()
    {
        InstallAccessor(std::move(hostAccessor));
    }

    void HostEnvironment::InstallAccessor(std::shared_ptr<IColorAccessor> accessor) {
        m_accessor = accessor ? std::move(accessor) : std::make_shared<StaticColorAccessor>();
    }

    std::shared_ptr<RegistryInstance> HostEnvironment::OfferInstance(const LibraryVersion& version) {
        // if the installed copy is newer than or the same version as us, use that
        if (m_instance && m_instance->GetVersion() >= version) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Debug, "[HostEnvironment] Version ", version.ToString(),
                " defers to installed version ", m_instance->GetVersion().ToString());
            return m_instance;
        }

        // otherwise take over, keeping every palette the older copy already knows
        std::shared_ptr<PaletteRegistry> adopted = m_instance ? m_instance->GetSharedRegistry() : nullptr;
        if (m_instance) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Info, "[HostEnvironment] Version ", version.ToString(),
                " replaces version ", m_instance->GetVersion().ToString(), " (", adopted->Count(), " palettes adopted)");
        }
        else {
            PALETTES_PRINT(PaletteLogging::LogLevel::Info, "[HostEnvironment] Installing palette library version ", version.ToString());
        }

        m_instance = std::make_shared<RegistryInstance>(version, adopted);
        return m_instance;
    }

} // namespace Palettes
