#pragma once

#include "Registry/Color.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Palettes {

    struct PaletteEntry {
        std::string id;
        std::optional<std::string> name;
        ColorMap colors{};
        int index = 0; // 1-based slot
    };

    // PaletteRegistry - id <-> index bijection over immutable palette entries.
    //
    // Indices are dense and 1-based: with N entries every index in [1, N] maps to exactly one id.
    // Entries are never removed or modified, so N only grows and an index is never reused.
    class PaletteRegistry {
    public:
        PaletteRegistry() = default;

        // Validates the definition and appends it at index Count()+1.
        // Returns false without changes if the id is already registered.
        // Throws ValidationError on malformed input.
        bool Register(const PaletteDefinition& definition);

        // Appends already-normalized colors. Same duplicate rule as Register.
        bool Register(const std::string& id, const std::optional<std::string>& name, const ColorMap& colors);

        // Replays an entry that already existed elsewhere at a fixed index.
        // Fails unless index == Count()+1 and the id is free.
        bool RegisterAt(const std::string& id, int index, const std::optional<std::string>& name, const ColorMap& colors);

        std::optional<PaletteEntry> Get(const std::string& id) const;
        std::optional<PaletteEntry> ByIndex(int index) const;
        bool Contains(const std::string& id) const;

        // Display name of the palette, falling back to the id when unnamed
        std::optional<std::string> NameOf(const std::string& id) const;

        std::optional<int> IndexOf(const std::string& id) const;
        std::optional<std::string> IdAt(int index) const;
        std::optional<ColorMap> ColorMapAt(int index) const;

        int Count() const { return static_cast<int>(m_indexMap.size()); }

    private:
        void Insert(const std::string& id, const std::optional<std::string>& name, const ColorMap& colors);

        // id -> entry
        std::unordered_map<std::string, PaletteEntry> m_entries;
        // index - 1 -> id
        std::vector<std::string> m_indexMap;
    };

} // namespace Palettes
