#pragma once
// ScriptError.h
//
// Converts Lua errors raised while calling into script-side palette functions
// into readable strings.
//
// Thread-safety & Lua usage notes:
//  - FormatLuaError pushes and pops on the given lua_State; it restores the stack top
//    before returning. Main thread only.

#include <string>

extern "C" {
    struct lua_State;
}

namespace Scripting {
    namespace Error {

        // Format the error object at the top of the stack (left by lua_pcall) with a traceback.
        // err is the lua_pcall result code.
        std::string FormatLuaError(lua_State* L, int err);

    } // namespace Error
} // namespace Scripting
