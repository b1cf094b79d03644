// PaletteBindings.cpp
//
// Every bound function carries two upvalues: the PaletteLibrary (light userdata) and the
// palette table itself, so the functions can compare and reinstall the VM globals.
//
// Lua errors longjmp past C++ frames, so functions that build C++ objects do their work in a
// helper and only raise the error (from a plain char buffer) once those objects are gone.

#include "PaletteBindings.h"
#include "LuaColorAccessor.h"
#include "ScriptUtils.h"
#include "Logging.hpp"
#include "Registry/ColorValidator.hpp"

#include <cstdio>
#include <memory>
#include <vector>

using namespace Scripting;

namespace {

    constexpr size_t ERROR_BUFFER_SIZE = 512;

    const char* const COUNT_GLOBAL = "GetColorCount";
    const char* const COLOR_MAP_GLOBAL = "GetColorMap";

    Palettes::PaletteLibrary& GetLibrary(lua_State* L) {
        return *static_cast<Palettes::PaletteLibrary*>(lua_touserdata(L, lua_upvalueindex(1)));
    }

    int PaletteTableIndex() {
        return lua_upvalueindex(2);
    }

    void CopyError(char* buffer, const std::string& message) {
        std::snprintf(buffer, ERROR_BUFFER_SIZE, "%s", message.c_str());
    }

    // Points the VM globals at the bound getCount/getColorMap and refreshes the version field
    void InstallGlobals(lua_State* L, int paletteTable, Palettes::PaletteLibrary& library) {
        lua_getfield(L, paletteTable, "getCount");
        lua_setglobal(L, COUNT_GLOBAL);
        lua_getfield(L, paletteTable, "getColorMap");
        lua_setglobal(L, COLOR_MAP_GLOBAL);

        std::string version = library.GetActiveVersion();
        lua_pushlstring(L, version.c_str(), version.size());
        lua_setfield(L, paletteTable, "version");
    }

    bool GlobalMatchesField(lua_State* L, int paletteTable, const char* global, const char* field) {
        LuaStackGuard guard(L);
        lua_getglobal(L, global);
        lua_getfield(L, paletteTable, field);
        return lua_rawequal(L, -1, -2) != 0;
    }

    // If a script replaced the palette globals, hand palette ownership to those functions so the
    // library migrates from them, then take it back.
    int MigrateHooks(lua_State* L, int paletteTable, Palettes::PaletteLibrary& library) {
        bool ownsGlobals = GlobalMatchesField(L, paletteTable, COUNT_GLOBAL, "getCount")
            && GlobalMatchesField(L, paletteTable, COLOR_MAP_GLOBAL, "getColorMap");

        if (!ownsGlobals) {
            Palettes::HostEnvironment& host = library.GetHost();
            PALETTES_PRINT(PaletteLogging::LogLevel::Info, "[PaletteBindings] Palette globals were replaced by a script, migrating");

            std::optional<Palettes::ForeignIdTable> foreignIds = ReadForeignIdTable(L);
            if (foreignIds) {
                host.SetForeignIdTable(foreignIds);
            }
            host.InstallAccessor(std::make_shared<LuaColorAccessor>(L, COUNT_GLOBAL, COLOR_MAP_GLOBAL));
        }

        int migrated = library.EnsureAuthority();
        InstallGlobals(L, paletteTable, library);
        return migrated;
    }

    // Reads one addPalette argument. Returns false with a message in error.
    bool ReadDefinition(lua_State* L, int arg, Palettes::PaletteDefinition& out, char* error) {
        if (!lua_istable(L, arg)) {
            CopyError(error, "Palette data must be a table");
            return false;
        }

        LuaStackGuard guard(L);
        lua_getfield(L, arg, "ID");
        if (!GetStringSafe(L, -1, out.id)) {
            CopyError(error, "Invalid palette, missing string ID");
            return false;
        }
        lua_pop(L, 1);

        lua_getfield(L, arg, "Name");
        if (!lua_isnil(L, -1)) {
            std::string name;
            if (!GetStringSafe(L, -1, name)) {
                CopyError(error, "Name must be a string");
                return false;
            }
            out.name = name;
        }
        lua_pop(L, 1);

        std::string badSlot;
        if (!GetRawColorsSafe(L, arg, out.colors, &badSlot)) {
            CopyError(error, "Invalid palette, color " + badSlot + " must contain three integers (palette '" + out.id + "')");
            return false;
        }
        return true;
    }

    int AddPalettes(lua_State* L, char* error) {
        Palettes::PaletteLibrary& library = GetLibrary(L);
        int count = lua_gettop(L);

        std::vector<Palettes::PaletteDefinition> definitions;
        definitions.reserve(static_cast<size_t>(count));
        for (int arg = 1; arg <= count; ++arg) {
            Palettes::PaletteDefinition definition;
            if (!ReadDefinition(L, arg, definition, error)) {
                return 0;
            }
            definitions.push_back(std::move(definition));
        }

        // a rejected batch must leave the globals and the host's accessor alone
        try {
            for (const Palettes::PaletteDefinition& definition : definitions) {
                Palettes::ColorValidator::ValidateDefinition(definition);
            }
        }
        catch (const Palettes::ValidationError& e) {
            CopyError(error, e.what());
            return 0;
        }

        // ensure this library is in charge of palettes
        MigrateHooks(L, PaletteTableIndex(), library);

        try {
            return library.Register(definitions);
        }
        catch (const Palettes::ValidationError& e) {
            CopyError(error, e.what());
            return 0;
        }
    }

    int l_addPalette(lua_State* L) {
        char error[ERROR_BUFFER_SIZE] = { 0 };
        int added = AddPalettes(L, error);
        if (error[0] != '\0') {
            return luaL_error(L, "%s", error);
        }
        lua_pushinteger(L, added);
        return 1;
    }

    void PushOptionalString(lua_State* L, const std::optional<std::string>& value) {
        if (value) {
            lua_pushlstring(L, value->c_str(), value->size());
        }
        else {
            lua_pushnil(L);
        }
    }

    void PushOptionalInteger(lua_State* L, const std::optional<int>& value) {
        if (value) {
            lua_pushinteger(L, *value);
        }
        else {
            lua_pushnil(L);
        }
    }

    // Indices and offsets outside int range name no palette
    std::optional<int> CheckIntArgument(lua_State* L, int arg) {
        luaL_checkinteger(L, arg);
        int value = 0;
        if (!GetIntegerSafe(L, arg, value)) {
            return std::nullopt;
        }
        return value;
    }

    int l_getMapID(lua_State* L) {
        std::optional<int> index = CheckIntArgument(L, 1);
        PushOptionalString(L, index ? GetLibrary(L).IdAt(*index) : std::nullopt);
        return 1;
    }

    int l_getOffsetID(lua_State* L) {
        std::optional<int> offset = CheckIntArgument(L, 1);
        PushOptionalString(L, offset ? GetLibrary(L).OffsetToId(*offset) : std::nullopt);
        return 1;
    }

    int l_getMapName(lua_State* L) {
        const char* id = luaL_checkstring(L, 1);
        PushOptionalString(L, GetLibrary(L).GetName(id));
        return 1;
    }

    int l_getOffset(lua_State* L) {
        const char* id = luaL_checkstring(L, 1);
        PushOptionalInteger(L, GetLibrary(L).IdToOffset(id));
        return 1;
    }

    int l_getColorMap(lua_State* L) {
        std::optional<int> index = CheckIntArgument(L, 1);
        std::optional<Palettes::ColorMap> colors = index ? GetLibrary(L).ColorMapAt(*index) : std::nullopt;
        if (colors) {
            PushColorMap(L, *colors);
        }
        else {
            lua_pushnil(L);
        }
        return 1;
    }

    int l_getCount(lua_State* L) {
        lua_pushinteger(L, GetLibrary(L).Count());
        return 1;
    }

    int l_migrateHooks(lua_State* L) {
        lua_pushinteger(L, MigrateHooks(L, PaletteTableIndex(), GetLibrary(L)));
        return 1;
    }

    struct BoundFunction {
        const char* name;
        lua_CFunction fn;
    };

    const BoundFunction PALETTE_FUNCTIONS[] = {
        { "addPalette",  &l_addPalette },
        { "getMapID",    &l_getMapID },
        { "getOffsetID", &l_getOffsetID },
        { "getMapName",  &l_getMapName },
        { "getOffset",   &l_getOffset },
        { "getColorMap", &l_getColorMap },
        { "getCount",    &l_getCount },
        { "migrateHooks", &l_migrateHooks },
    };

} // anonymous

void Scripting::BindPaletteLibrary(lua_State* L, Palettes::PaletteLibrary& library, const std::string& globalName) {
    if (!L) return;
    LuaStackGuard guard(L);

    lua_newtable(L);
    int paletteTable = lua_gettop(L);

    for (const BoundFunction& bound : PALETTE_FUNCTIONS) {
        lua_pushlightuserdata(L, &library);
        lua_pushvalue(L, paletteTable);
        lua_pushcclosure(L, bound.fn, 2);
        lua_setfield(L, paletteTable, bound.name);
    }

    lua_pushvalue(L, paletteTable);
    lua_setglobal(L, globalName.c_str());

    // take control of the script-side palette functions
    library.EnsureAuthority();
    InstallGlobals(L, paletteTable, library);

    PALETTES_PRINT(PaletteLogging::LogLevel::Info, "[PaletteBindings] Bound palette library ", library.GetActiveVersion(),
        " as ", globalName);
}
