// ScriptUtils.cpp
#include "ScriptUtils.h"
#include "Registry/ColorValidator.hpp"

#include <limits>

namespace Scripting {

    namespace {
        const char* const CHANNEL_FIELDS[3] = { "r", "g", "b" };

        // Integers and integral floats (255.0) are channels. Values beyond int range are clamped,
        // which keeps them out of [0, 255] for the validator.
        bool ReadChannel(lua_State* L, int idx, Palettes::RawColor& out) {
            int isNumber = 0;
            lua_Integer value = lua_tointegerx(L, idx, &isNumber);
            if (!isNumber || lua_type(L, idx) != LUA_TNUMBER) {
                return false;
            }
            out.push_back(ClampToInt(value));
            return true;
        }
    } // anon

    int ClampToInt(lua_Integer value) {
        if (value > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
        if (value < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
        return static_cast<int>(value);
    }

    bool GetIntegerSafe(lua_State* L, int idx, int& out) {
        if (!L || !lua_isinteger(L, idx)) return false;
        lua_Integer value = lua_tointeger(L, idx);
        if (value > std::numeric_limits<int>::max() || value < std::numeric_limits<int>::min()) return false;
        out = static_cast<int>(value);
        return true;
    }

    bool GetStringSafe(lua_State* L, int idx, std::string& out) {
        if (!L) return false;
        if (lua_type(L, idx) != LUA_TSTRING) return false;
        size_t len = 0;
        const char* s = lua_tolstring(L, idx, &len);
        if (!s) return false;
        out.assign(s, len);
        return true;
    }

    bool GetRawColorSafe(lua_State* L, int idx, Palettes::RawColor& out) {
        if (!L || !lua_istable(L, idx)) return false;
        LuaStackGuard guard(L);
        int table = lua_absindex(L, idx);

        Palettes::RawColor raw;
        lua_rawgeti(L, table, 1);
        bool positional = !lua_isnil(L, -1);
        lua_pop(L, 1);

        if (positional) {
            lua_Integer length = static_cast<lua_Integer>(lua_rawlen(L, table));
            for (lua_Integer i = 1; i <= length; ++i) {
                lua_rawgeti(L, table, i);
                bool ok = ReadChannel(L, -1, raw);
                lua_pop(L, 1);
                if (!ok) return false;
            }
        }
        else {
            for (const char* field : CHANNEL_FIELDS) {
                lua_getfield(L, table, field);
                bool ok = ReadChannel(L, -1, raw);
                lua_pop(L, 1);
                if (!ok) return false;
            }
        }

        out = raw;
        return true;
    }

    bool GetColorMapSafe(lua_State* L, int idx, Palettes::ColorMap& out) {
        if (!L || !lua_istable(L, idx)) return false;
        LuaStackGuard guard(L);
        int table = lua_absindex(L, idx);

        Palettes::ColorMap colors{};
        for (size_t i = 0; i < Palettes::PALETTE_SLOT_COUNT; ++i) {
            lua_rawgeti(L, table, static_cast<lua_Integer>(i + 1));
            Palettes::RawColor raw;
            bool ok = GetRawColorSafe(L, -1, raw) && Palettes::ColorValidator::IsValidColor(raw);
            lua_pop(L, 1);
            if (!ok) return false;
            colors[i] = Palettes::Color(raw[0], raw[1], raw[2]);
        }

        out = colors;
        return true;
    }

    bool GetRawColorsSafe(lua_State* L, int idx, std::unordered_map<std::string, Palettes::RawColor>& out, std::string* badSlot) {
        if (!L || !lua_istable(L, idx)) return true;
        LuaStackGuard guard(L);
        int table = lua_absindex(L, idx);

        for (const char* slotName : Palettes::PALETTE_SLOT_NAMES) {
            lua_getfield(L, table, slotName);
            if (lua_istable(L, -1)) {
                Palettes::RawColor raw;
                if (!GetRawColorSafe(L, -1, raw)) {
                    if (badSlot) *badSlot = slotName;
                    return false;
                }
                out[slotName] = raw;
            }
            lua_pop(L, 1);
        }
        return true;
    }

    void PushColor(lua_State* L, const Palettes::Color& color) {
        lua_createtable(L, 3, 0);
        lua_pushinteger(L, color.r);
        lua_rawseti(L, -2, 1);
        lua_pushinteger(L, color.g);
        lua_rawseti(L, -2, 2);
        lua_pushinteger(L, color.b);
        lua_rawseti(L, -2, 3);
    }

    void PushColorMap(lua_State* L, const Palettes::ColorMap& colors) {
        lua_createtable(L, static_cast<int>(colors.size()), 0);
        for (size_t i = 0; i < colors.size(); ++i) {
            PushColor(L, colors[i]);
            lua_rawseti(L, -2, static_cast<lua_Integer>(i + 1));
        }
    }

} // namespace Scripting
