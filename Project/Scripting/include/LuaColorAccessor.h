#pragma once
// LuaColorAccessor.h
//
// Palette queries answered by a Lua VM.
//
// Games that keep their built-in palettes in script expose two globals:
//   GetColorCount()      -> number of palettes
//   GetColorMap(index)   -> array of 8 colors for a 1-based index, each {r, g, b} or {r=, g=, b=}
// LuaColorAccessor wraps those globals so the palette library can migrate from them.
// Whatever the globals reference at call time is used, so a script library that replaced
// them is read the same way as the game's defaults.
//
// Script errors and malformed results are logged and reported as "no data".
// Main thread only; the lua_State must outlive the accessor.

#include "Authority/ColorAccessor.hpp"
#include "Authority/NameResolver.hpp"

#include <optional>
#include <string>

extern "C" {
    struct lua_State;
}

namespace Scripting {

    class LuaColorAccessor : public Palettes::IColorAccessor {
    public:
        explicit LuaColorAccessor(lua_State* L,
            std::string countGlobal = "GetColorCount",
            std::string colorMapGlobal = "GetColorMap");

        int GetColorCount() const override;
        std::optional<Palettes::ColorMap> GetColorMap(int index) const override;

    private:
        lua_State* m_L = nullptr;
        std::string m_countGlobal;
        std::string m_colorMapGlobal;
    };

    // Reads a foreign palette library's global {id = imageOffset} table.
    // Returns nullopt if the global is not a table. Non-string keys and non-integer values are skipped.
    std::optional<Palettes::ForeignIdTable> ReadForeignIdTable(lua_State* L, const std::string& globalName = "FURL_COLORS");

} // namespace Scripting
