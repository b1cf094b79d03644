#pragma once

#include "Logging.hpp"
#include "Authority/HostEnvironment.hpp"
#include "Registry/PaletteRegistry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace Palettes {

    // PaletteLibrary - one loaded copy of the custom palette library.
    //
    // Several copies, possibly of different versions, can live in one process. Constructing a copy
    // offers its version to the HostEnvironment: the highest version's instance is installed and
    // every copy delegates to whichever instance is installed at the time of the call, so older
    // copies transparently use the newest logic and data.
    //
    // Minimal usage:
    //   Palettes::PaletteLibrary palettes;                       // process-wide HostEnvironment
    //   palettes.Register({ "KnightRed", "Knight Red", colors });
    //   int offset = palettes.IdToOffset("KnightRed").value_or(0);
    //
    // Mutating calls first make sure the installed instance owns the palette queries
    // (see AuthorityManager). Queries never migrate.
    class PaletteLibrary {
    public:
        // Version of this copy of the library
        static constexpr const char* VERSION = "0.4";

        PALETTES_API explicit PaletteLibrary(HostEnvironment& host = HostEnvironment::GetInstance(),
            const std::string& version = VERSION);

        // Load-time initialization, run by the constructor. Safe to call again: a copy whose
        // version lost arbitration, or whose instance already owns the queries, changes nothing.
        PALETTES_API void Initialize();

        // Takes ownership of the palette queries, migrating unknown palettes first and resizing
        // palette-bearing descriptors for them. Returns the number of palettes migrated.
        PALETTES_API int EnsureAuthority();

        // Adds a palette at the next index. Returns false if the id already exists (first one wins).
        // Throws ValidationError on malformed input; nothing changes in that case.
        PALETTES_API bool Register(const PaletteDefinition& definition);

        // Adds several palettes with one authority check and one descriptor update covering both
        // migrated and added palettes.
        // All definitions are validated before any is added. Returns the number actually added.
        PALETTES_API int Register(const std::vector<PaletteDefinition>& definitions);

        PALETTES_API std::optional<PaletteEntry> Get(const std::string& id) const;

        // Display name, falling back to the id for unnamed palettes
        PALETTES_API std::optional<std::string> GetName(const std::string& id) const;

        PALETTES_API std::optional<int> IndexOf(const std::string& id) const;
        PALETTES_API std::optional<std::string> IdAt(int index) const;

        // Image offsets are index - 1
        PALETTES_API std::optional<std::string> OffsetToId(int offset) const;
        PALETTES_API std::optional<int> IdToOffset(const std::string& id) const;

        PALETTES_API std::optional<ColorMap> ColorMapAt(int index) const;
        PALETTES_API int Count() const;

        const LibraryVersion& GetVersion() const { return m_version; }

        // Version of the instance every copy currently delegates to
        PALETTES_API std::string GetActiveVersion() const;

        // True if the installed instance currently owns the palette queries
        PALETTES_API bool IsAuthoritative() const;

        HostEnvironment& GetHost() { return m_host; }

    private:
        std::shared_ptr<RegistryInstance> Resolve() const;
        void SyncDependents(int committed, const PaletteRegistry& registry);

        HostEnvironment& m_host;
        LibraryVersion m_version;
    };

} // namespace Palettes
