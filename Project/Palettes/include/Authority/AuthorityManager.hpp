#pragma once

#include "Authority/HostEnvironment.hpp"

// AuthorityManager - makes a registry instance the owner of the process-wide palette queries.
//
// Flow for EnsureAuthority:
//   1. If the host's installed accessor is the instance's own accessor, nothing to do.
//   2. Otherwise copy every palette the installed accessor knows beyond our count into our
//      registry, in ascending index order, so indices stay aligned with what sprites already use.
//   3. Install our accessor.
//
// Ids for migrated palettes come from the built-in table, then the foreign library's table,
// then the stringified index. A palette with no color data stops the migration there; that is
// logged and tolerated, and authority is taken for whatever was copied.
namespace Palettes {
    namespace AuthorityManager {

        bool OwnsAccessor(const HostEnvironment& host, const RegistryInstance& instance);

        // Copies palettes source holds beyond target.Count(). Returns the number copied.
        int MigratePalettes(const IColorAccessor& source, PaletteRegistry& target,
            const std::optional<ForeignIdTable>& foreignIds);

        // Returns the number of palettes migrated (0 when already owned)
        int EnsureAuthority(HostEnvironment& host, RegistryInstance& instance);

    } // namespace AuthorityManager
} // namespace Palettes
