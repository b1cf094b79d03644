// LuaColorAccessor.cpp
#include "LuaColorAccessor.h"
#include "ScriptError.h"
#include "ScriptUtils.h"
#include "Logging.hpp"

#include <limits>

namespace Scripting {

    LuaColorAccessor::LuaColorAccessor(lua_State* L, std::string countGlobal, std::string colorMapGlobal)
        : m_L(L)
        , m_countGlobal(std::move(countGlobal))
        , m_colorMapGlobal(std::move(colorMapGlobal))
    {
    }

    int LuaColorAccessor::GetColorCount() const {
        if (!m_L) return 0;
        LuaStackGuard guard(m_L);

        if (lua_getglobal(m_L, m_countGlobal.c_str()) != LUA_TFUNCTION) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Warn, "[LuaColorAccessor] Global ", m_countGlobal, " is not a function");
            return 0;
        }

        int status = lua_pcall(m_L, 0, 1, 0);
        if (status != LUA_OK) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[LuaColorAccessor] ", m_countGlobal, " failed: ",
                Error::FormatLuaError(m_L, status));
            return 0;
        }

        if (!lua_isinteger(m_L, -1)) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Warn, "[LuaColorAccessor] ", m_countGlobal, " did not return an integer");
            return 0;
        }
        lua_Integer count = lua_tointeger(m_L, -1);
        if (count > std::numeric_limits<int>::max()) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Warn, "[LuaColorAccessor] ", m_countGlobal, " returned ", count,
                ", clamping to ", std::numeric_limits<int>::max());
            return std::numeric_limits<int>::max();
        }
        return count > 0 ? static_cast<int>(count) : 0;
    }

    std::optional<Palettes::ColorMap> LuaColorAccessor::GetColorMap(int index) const {
        if (!m_L) return std::nullopt;
        LuaStackGuard guard(m_L);

        if (lua_getglobal(m_L, m_colorMapGlobal.c_str()) != LUA_TFUNCTION) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Warn, "[LuaColorAccessor] Global ", m_colorMapGlobal, " is not a function");
            return std::nullopt;
        }

        lua_pushinteger(m_L, index);
        int status = lua_pcall(m_L, 1, 1, 0);
        if (status != LUA_OK) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Error, "[LuaColorAccessor] ", m_colorMapGlobal, "(", index, ") failed: ",
                Error::FormatLuaError(m_L, status));
            return std::nullopt;
        }

        // nil is a regular "no palette here" answer
        if (lua_isnil(m_L, -1)) {
            return std::nullopt;
        }

        Palettes::ColorMap colors{};
        if (!GetColorMapSafe(m_L, -1, colors)) {
            PALETTES_PRINT(PaletteLogging::LogLevel::Warn, "[LuaColorAccessor] ", m_colorMapGlobal, "(", index,
                ") did not return eight valid colors");
            return std::nullopt;
        }
        return colors;
    }

    std::optional<Palettes::ForeignIdTable> ReadForeignIdTable(lua_State* L, const std::string& globalName) {
        if (!L) return std::nullopt;
        LuaStackGuard guard(L);

        if (lua_getglobal(L, globalName.c_str()) != LUA_TTABLE) {
            return std::nullopt;
        }
        int table = lua_gettop(L);

        Palettes::ForeignIdTable ids;
        lua_pushnil(L);
        while (lua_next(L, table) != 0) {
            // key at -2, value at -1; never lua_tostring the key, it would confuse lua_next
            // an offset must leave room for its index (offset + 1) in int range
            int offset = 0;
            if (lua_type(L, -2) == LUA_TSTRING && GetIntegerSafe(L, -1, offset)
                && offset >= 0 && offset < std::numeric_limits<int>::max()) {
                std::string id;
                if (GetStringSafe(L, -2, id)) {
                    ids[id] = offset;
                }
            }
            lua_pop(L, 1);
        }
        return ids;
    }

} // namespace Scripting
