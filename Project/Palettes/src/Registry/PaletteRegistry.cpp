#include "pch.h"
#include "Registry/PaletteRegistry.hpp"
#include "Registry/ColorValidator.hpp"
#include "Logging.hpp"

namespace Palettes {

    bool PaletteRegistry::Register(const PaletteDefinition& definition) {
        ColorMap colors = ColorValidator::ValidateDefinition(definition);
        return Register(definition.id, definition.name, colors);
    }

    bool PaletteRegistry::Register(const std::string& id, const std::optional<std::string>& name, const ColorMap& colors) {
        ColorValidator::ValidateId(id);
        ColorValidator::ValidateName(name);

        // if two mods add a palette with the same ID, the first one wins
        if (Contains(id)) {
            return false;
        }

        Insert(id, name, colors);
        return true;
    }

    bool PaletteRegistry::RegisterAt(const std::string& id, int index, const std::optional<std::string>& name, const ColorMap& colors) {
        if (index != Count() + 1) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteRegistry] Cannot place '", id, "' at index ", index,
                ", next free index is ", Count() + 1);
            return false;
        }
        if (id.empty() || Contains(id)) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteRegistry] Cannot place '", id, "' at index ", index,
                ", id is empty or already registered");
            return false;
        }
        if (name && name->empty()) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[PaletteRegistry] Cannot place '", id, "', empty name");
            return false;
        }

        Insert(id, name, colors);
        return true;
    }

    void PaletteRegistry::Insert(const std::string& id, const std::optional<std::string>& name, const ColorMap& colors) {
        PaletteEntry entry;
        entry.id = id;
        entry.name = name;
        entry.colors = colors;
        entry.index = Count() + 1;

        m_entries.emplace(id, entry);
        m_indexMap.push_back(id);
    }

    std::optional<PaletteEntry> PaletteRegistry::Get(const std::string& id) const {
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<PaletteEntry> PaletteRegistry::ByIndex(int index) const {
        std::optional<std::string> id = IdAt(index);
        if (!id) {
            return std::nullopt;
        }
        return Get(*id);
    }

    bool PaletteRegistry::Contains(const std::string& id) const {
        return m_entries.find(id) != m_entries.end();
    }

    std::optional<std::string> PaletteRegistry::NameOf(const std::string& id) const {
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            return std::nullopt;
        }
        return it->second.name.value_or(id);
    }

    std::optional<int> PaletteRegistry::IndexOf(const std::string& id) const {
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            return std::nullopt;
        }
        return it->second.index;
    }

    std::optional<std::string> PaletteRegistry::IdAt(int index) const {
        if (index < 1 || index > Count()) {
            return std::nullopt;
        }
        return m_indexMap[static_cast<size_t>(index - 1)];
    }

    std::optional<ColorMap> PaletteRegistry::ColorMapAt(int index) const {
        std::optional<std::string> id = IdAt(index);
        if (!id) {
            return std::nullopt;
        }
        return m_entries.at(*id).colors;
    }

} // namespace Palettes
