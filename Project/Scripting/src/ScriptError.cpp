// ScriptError.cpp
//
// Behavior:
//  - Reads the Lua error message (if present) from the top of the stack.
//  - Calls luaL_traceback to build a stack traceback string and returns a composed message.

#include "ScriptError.h"

extern "C" {
#include "lua.h"
#include "lauxlib.h"
}

#include <sstream>

namespace Scripting {
    namespace Error {

        static void safe_tostring(lua_State* L, int index, std::string& out) {
            if (lua_type(L, index) == LUA_TSTRING) {
                size_t len = 0;
                const char* s = lua_tolstring(L, index, &len);
                if (s) {
                    out.assign(s, len);
                }
                return;
            }

            // luaL_tolstring pushes a string representation onto the stack; we then pop it.
            luaL_tolstring(L, index, nullptr);
            size_t len = 0;
            const char* s = lua_tolstring(L, -1, &len);
            if (s) {
                out.assign(s, len);
            }
            lua_pop(L, 1);
        }

        std::string FormatLuaError(lua_State* L, int err) {
            if (!L) return std::string("Lua error (null lua_State)");

            int top = lua_gettop(L);
            std::string message;
            if (top > 0) {
                safe_tostring(L, top, message);
            }

            luaL_traceback(L, L, nullptr, 1);
            const char* tb = lua_tostring(L, -1);
            std::string traceback = tb ? tb : "(no traceback)";

            std::ostringstream oss;
            oss << "Lua error";
            switch (err) {
            case LUA_ERRRUN: oss << " (runtime)"; break;
            case LUA_ERRMEM: oss << " (memory)"; break;
            case LUA_ERRERR: oss << " (error while handling error)"; break;
            case LUA_ERRSYNTAX: oss << " (syntax)"; break;
            default: break;
            }
            oss << ": " << (message.empty() ? std::string("(no message)") : message);
            oss << "\n" << traceback;

            // restore stack to previous top
            lua_settop(L, top);
            return oss.str();
        }

    } // namespace Error
} // namespace Scripting
