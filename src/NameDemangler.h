/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <optional>
#include <string>
#include <unordered_map>

/**
 * @class NameDemangler
 * @brief Cached symbol name demangling for C++ and Rust
 *
 * Three schemes are recognized:
 * - Rust v0 ("_R" prefix), through LLVMDemangle's rustDemangle
 * - Rust legacy ("_ZN...17h<16 hex>E"): identifiers joined with "::", the
 *   $LT$/$GT$/$u20$/... escapes and ".." decoded, the hash dropped
 * - Itanium C++ ("_Z" prefix), through abi::__cxa_demangle
 *
 * Anything else, or anything a demangler rejects, is returned unchanged.
 */
class NameDemangler {
public:
    /**
     * @param enabled When false, demangle() returns names unchanged
     */
    explicit NameDemangler(bool enabled = true) : enabled_(enabled) {}

    /**
     * @brief Demangle a raw linker symbol name
     * @param mangled_name Name as found in the symbol table
     * @return Human-readable name, or mangled_name if it cannot be demangled
     */
    std::string demangle(const std::string& mangled_name) const;

    bool isEnabled() const { return enabled_; }

private:
    static std::optional<std::string> demangleLegacyRust(const std::string& mangled_name);
    static std::optional<std::string> demangleRustV0(const std::string& mangled_name);
    static std::optional<std::string> demangleItanium(const std::string& mangled_name);

    bool enabled_;

    /// Cache of mangled name -> demangled name, including failed attempts
    mutable std::unordered_map<std::string, std::string> demangled_cache_;
};
