/* -*- mode: C++; c-basic-offset: 4; indent-tabs-mode: nil; -*- */
// SPDX-License-Identifier: MIT OR LGPL-2.0-or-later
// SPDX-FileCopyrightText: 2026 gdyn contributors

#include <config.h>

#include <stddef.h>

#include <string>
#include <unordered_map>

#include <glib.h>
#include <gmodule.h>

#include "gdyn/auto.h"
#include "gdyn/error-types.h"
#include "gi/library.h"
#include "util/log.h"

// Key is the library string exactly as given, "" for the main program
static std::unordered_map<std::string, GModule*>& library_cache() {
    static std::unordered_map<std::string, GModule*> cache;
    return cache;
}

GDYN_MARSHAL_RETURN_CONVENTION
static bool open_library(const std::string& library, GModule** module_out,
                         GError** error) {
    auto& cache = library_cache();
    auto it = cache.find(library);
    if (it != cache.end()) {
        *module_out = it->second;
        return true;
    }

    if (!g_module_supported()) {
        g_set_error_literal(error, GDYN_ERROR, GDYN_ERROR_SYMBOL_RESOLUTION,
                            "Dynamic loading is not supported on this platform");
        return false;
    }

    GModule* module = nullptr;
    std::string last_error;

    if (library.empty()) {
        module = g_module_open(nullptr, GModuleFlags(0));
        if (!module)
            last_error = g_module_error();
    } else {
        Gdyn::AutoStrv candidates{g_strsplit(library.c_str(), ",", -1)};
        for (char** name = candidates; *name; name++) {
            g_strstrip(*name);
            if (**name == '\0')
                continue;

            gdyn_debug(GDYN_DEBUG_LIBRARY, "Trying to open library '%s'",
                       *name);
            module = g_module_open(*name, GModuleFlags(0));
            if (module)
                break;
            last_error = g_module_error();
        }
    }

    if (!module) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_SYMBOL_RESOLUTION,
                    "Failed to load library '%s': %s",
                    library.empty() ? "<main program>" : library.c_str(),
                    last_error.empty() ? "no candidates" : last_error.c_str());
        return false;
    }

    gdyn_debug(GDYN_DEBUG_LIBRARY, "Opened library '%s' as %s",
               library.c_str(), g_module_name(module));

    // Never closed; symbols may be referenced by native code at any time
    g_module_make_resident(module);
    cache.emplace(library, module);
    *module_out = module;
    return true;
}

bool gdyn_library_lookup_symbol(const char* library, const char* symbol,
                                void** address, GError** error) {
    GModule* module;
    if (!open_library(library ? library : "", &module, error))
        return false;

    void* retval = nullptr;
    if (!g_module_symbol(module, symbol, &retval) || !retval) {
        g_set_error(error, GDYN_ERROR, GDYN_ERROR_SYMBOL_RESOLUTION,
                    "Symbol '%s' not found in library '%s'", symbol,
                    library && *library ? library : "<main program>");
        return false;
    }

    gdyn_debug_marshal(GDYN_DEBUG_LIBRARY, "Resolved %s to %p", symbol, retval);
    *address = retval;
    return true;
}

size_t gdyn_library_cache_size() { return library_cache().size(); }
