#include "pch.h"
#include "PaletteLibrary.hpp"
#include "Authority/AuthorityManager.hpp"
#include "Dependents/DependentSynchronizer.hpp"
#include "Registry/ColorValidator.hpp"
#include "Registry/OffsetAdapter.hpp"

namespace Palettes {

    PaletteLibrary::PaletteLibrary(HostEnvironment& host, const std::string& version)
        : m_host(host)
        , m_version(version)
    {
        Initialize();
    }

    void PaletteLibrary::Initialize() {
        std::shared_ptr<RegistryInstance> instance = m_host.OfferInstance(m_version);

        // take control of the palette queries
        int migrated = AuthorityManager::EnsureAuthority(m_host, *instance);
        SyncDependents(migrated, instance->GetRegistry());
    }

    int PaletteLibrary::EnsureAuthority() {
        std::shared_ptr<RegistryInstance> instance = Resolve();
        int migrated = AuthorityManager::EnsureAuthority(m_host, *instance);
        SyncDependents(migrated, instance->GetRegistry());
        return migrated;
    }

    bool PaletteLibrary::Register(const PaletteDefinition& definition) {
        return Register(std::vector<PaletteDefinition>{ definition }) > 0;
    }

    int PaletteLibrary::Register(const std::vector<PaletteDefinition>& definitions) {
        // validate everything up front so a bad definition leaves no trace
        std::vector<ColorMap> colorMaps;
        colorMaps.reserve(definitions.size());
        for (const PaletteDefinition& definition : definitions) {
            colorMaps.push_back(ColorValidator::ValidateDefinition(definition));
        }

        std::shared_ptr<RegistryInstance> instance = Resolve();
        int migrated = AuthorityManager::EnsureAuthority(m_host, *instance);

        PaletteRegistry& registry = instance->GetRegistry();
        int added = 0;
        for (size_t i = 0; i < definitions.size(); ++i) {
            const PaletteDefinition& definition = definitions[i];
            if (registry.Register(definition.id, definition.name, colorMaps[i])) {
                ++added;
                PALETTES_PRINT(PaletteLogging::LogLevel::Debug, "[PaletteLibrary] Added palette '", definition.id,
                    "' at index ", registry.Count());
            }
            else {
                // two mods adding the same ID share the palette
                PALETTES_PRINT(PaletteLogging::LogLevel::Debug, "[PaletteLibrary] Palette '", definition.id,
                    "' already registered, skipped");
            }
        }

        // only need to update the sprite sheets once for the whole batch, migrated palettes included
        SyncDependents(migrated + added, registry);
        return added;
    }

    std::optional<PaletteEntry> PaletteLibrary::Get(const std::string& id) const {
        return Resolve()->GetRegistry().Get(id);
    }

    std::optional<std::string> PaletteLibrary::GetName(const std::string& id) const {
        return Resolve()->GetRegistry().NameOf(id);
    }

    std::optional<int> PaletteLibrary::IndexOf(const std::string& id) const {
        return Resolve()->GetRegistry().IndexOf(id);
    }

    std::optional<std::string> PaletteLibrary::IdAt(int index) const {
        return Resolve()->GetRegistry().IdAt(index);
    }

    std::optional<std::string> PaletteLibrary::OffsetToId(int offset) const {
        return OffsetAdapter::OffsetToId(Resolve()->GetRegistry(), offset);
    }

    std::optional<int> PaletteLibrary::IdToOffset(const std::string& id) const {
        return OffsetAdapter::IdToOffset(Resolve()->GetRegistry(), id);
    }

    std::optional<ColorMap> PaletteLibrary::ColorMapAt(int index) const {
        return Resolve()->GetRegistry().ColorMapAt(index);
    }

    int PaletteLibrary::Count() const {
        return Resolve()->GetRegistry().Count();
    }

    std::string PaletteLibrary::GetActiveVersion() const {
        return Resolve()->GetVersion().ToString();
    }

    bool PaletteLibrary::IsAuthoritative() const {
        return AuthorityManager::OwnsAccessor(m_host, *Resolve());
    }

    void PaletteLibrary::SyncDependents(int committed, const PaletteRegistry& registry) {
        DependentSynchronizer::SyncAfterBatch(committed, registry.Count(), m_host.GetDescriptors(), m_host.GetSettings());
    }

    std::shared_ptr<RegistryInstance> PaletteLibrary::Resolve() const {
        // the constructor always leaves an instance installed, and instances are never removed
        return m_host.GetInstalledInstance();
    }

} // namespace Palettes
