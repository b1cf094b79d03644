#include "pch.h"
#include "Authority/AuthorityManager.hpp"
#include "Authority/NameResolver.hpp"
#include "Logging.hpp"

namespace Palettes {
    namespace AuthorityManager {

        bool OwnsAccessor(const HostEnvironment& host, const RegistryInstance& instance) {
            return host.GetAccessor() == instance.GetAccessor();
        }

        int MigratePalettes(const IColorAccessor& source, PaletteRegistry& target,
            const std::optional<ForeignIdTable>& foreignIds) {
            const int hostCount = source.GetColorCount();
            const int localCount = target.Count();
            if (hostCount <= localCount) {
                return 0;
            }

            const std::vector<NameResolver> idChain = {
                NameResolvers::BuiltinIds(),
                NameResolvers::ForeignIds(foreignIds),
                NameResolvers::IndexString()
            };
            auto isFree = [&target](const std::string& id) { return !target.Contains(id); };

            int migrated = 0;
            // the count may be INT_MAX
            for (long long next = localCount + 1LL; next <= hostCount; ++next) {
                const int index = static_cast<int>(next);
                // first, ensure there is a color map there
                std::optional<ColorMap> colors = source.GetColorMap(index);
                if (!colors) {
                    PALETTES_PRINT(PaletteLogging::LogLevel::Warn, "[AuthorityManager] No colors at index ", index,
                        " although ", hostCount, " palettes are reported, migration stopped");
                    break;
                }

                std::optional<std::string> id = NameResolvers::Resolve(idChain, index, isFree);
                if (!id) {
                    PALETTES_PRINT(PaletteLogging::LogLevel::Warn, "[AuthorityManager] Every candidate id for index ", index,
                        " is already taken, migration stopped");
                    break;
                }

                const std::vector<NameResolver> nameChain = {
                    NameResolvers::BuiltinNames(),
                    NameResolvers::Fixed(*id)
                };
                std::optional<std::string> name = NameResolvers::Resolve(nameChain, index);

                if (!target.RegisterAt(*id, index, name, *colors)) {
                    break;
                }
                ++migrated;
            }

            if (localCount + migrated < hostCount) {
                PALETTES_PRINT(PaletteLogging::LogLevel::Warn, "[AuthorityManager] Migrated ", migrated, " of ",
                    hostCount - localCount, " palettes");
            }
            return migrated;
        }

        int EnsureAuthority(HostEnvironment& host, RegistryInstance& instance) {
            if (OwnsAccessor(host, instance)) {
                return 0;
            }

            // clone any palettes we are missing from whoever currently answers palette queries
            const std::shared_ptr<IColorAccessor> current = host.GetAccessor();
            int migrated = MigratePalettes(*current, instance.GetRegistry(), host.GetForeignIdTable());

            host.InstallAccessor(instance.GetAccessor());

            PALETTES_PRINT(PaletteLogging::LogLevel::Info, "[AuthorityManager] Version ", instance.GetVersion().ToString(),
                " now handles palettes (", migrated, " migrated, ", instance.GetRegistry().Count(), " total)");
            return migrated;
        }

    } // namespace AuthorityManager
} // namespace Palettes
