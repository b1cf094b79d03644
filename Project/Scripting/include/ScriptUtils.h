#pragma once
// ScriptUtils.h
// Small cross-cutting helpers for Lua <-> C++ palette conversions.
// - Includes: RAII stack guard for lua_State, string getters, and color/palette
//   readers and pushers.
// - Readers never raise Lua errors; they return false on anything malformed.

#include "Registry/Color.hpp"

#include <string>
#include <unordered_map>

extern "C" {
#include "lua.h"
#include "lauxlib.h"
#include "lualib.h"
}

namespace Scripting {

    // RAII guard that restores Lua stack top when destroyed.
    // Usage:
    //    LuaStackGuard g(L);
    //    // push/pop freely
    //    // on exit stack is restored
    struct LuaStackGuard {
        lua_State* L = nullptr;
        int top = 0;
        LuaStackGuard(lua_State* L_) : L(L_), top(L_ ? lua_gettop(L_) : 0) {}
        ~LuaStackGuard() { if (L) lua_settop(L, top); }
        // non-copyable
        LuaStackGuard(const LuaStackGuard&) = delete;
        LuaStackGuard& operator=(const LuaStackGuard&) = delete;
    };

    // Saturates a Lua integer to the int range
    int ClampToInt(lua_Integer value);

    // Reads an integer that fits an int. Floats and out-of-range integers are rejected.
    bool GetIntegerSafe(lua_State* L, int idx, int& out);

    bool GetStringSafe(lua_State* L, int idx, std::string& out);

    // Reads {r, g, b} or {r = , g = , b = } as a raw channel list. Only integral channels are accepted.
    bool GetRawColorSafe(lua_State* L, int idx, Palettes::RawColor& out);

    // Reads an array of eight colors in slot order and validates the channels
    bool GetColorMapSafe(lua_State* L, int idx, Palettes::ColorMap& out);

    // Reads every slot-named member of a palette table (e.g. t.PlateHighlight) as a raw color.
    // Non-table members are left out and reported later as missing. Returns false, naming the slot in
    // badSlot, when a member is a table whose channels are not integers. Ranges are checked later.
    bool GetRawColorsSafe(lua_State* L, int idx, std::unordered_map<std::string, Palettes::RawColor>& out,
        std::string* badSlot = nullptr);

    // Pushes {r, g, b}
    void PushColor(lua_State* L, const Palettes::Color& color);

    // Pushes an array of eight {r, g, b} tables
    void PushColorMap(lua_State* L, const Palettes::ColorMap& colors);

} // namespace Scripting
