/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "NameDemangler.h"
#include <cxxabi.h>
#include <llvm/Demangle/Demangle.h>
#include <cctype>
#include <cstdlib>
#include <vector>

namespace {
bool startsWith(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

bool isHex(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

void appendUtf8(std::string& out, unsigned long code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

/// Split "_ZN<len><ident>...E" into its identifiers
bool splitNestedName(const std::string& name, std::vector<std::string>& components) {
    if (!startsWith(name, "_ZN") || name.size() < 5 || name.back() != 'E') {
        return false;
    }

    size_t pos = 3;
    const size_t end = name.size() - 1;
    while (pos < end) {
        if (!std::isdigit(static_cast<unsigned char>(name[pos]))) {
            return false;
        }
        size_t length = 0;
        while (pos < end && std::isdigit(static_cast<unsigned char>(name[pos]))) {
            length = length * 10 + static_cast<size_t>(name[pos] - '0');
            if (length > end) {
                return false;
            }
            ++pos;
        }
        if (length == 0 || length > end - pos) {
            return false;
        }
        components.push_back(name.substr(pos, length));
        pos += length;
    }
    return !components.empty();
}

/// "h" followed by 16 hex digits, appended by rustc to every legacy symbol
bool isRustHash(const std::string& component) {
    return component.size() == 17 && component[0] == 'h' && isHex(component.substr(1));
}

/// Decode the $..$ and "." escapes of one legacy Rust identifier
bool decodeRustIdentifier(std::string ident, std::string& out) {
    if (startsWith(ident, "_$")) {
        ident.erase(0, 1);
    }

    size_t i = 0;
    while (i < ident.size()) {
        const char c = ident[i];
        if (c == '.') {
            if (i + 1 < ident.size() && ident[i + 1] == '.') {
                out += "::";
                i += 2;
            } else {
                out += '.';
                ++i;
            }
        } else if (c == '$') {
            const size_t close = ident.find('$', i + 1);
            if (close == std::string::npos) {
                return false;
            }
            const std::string escape = ident.substr(i + 1, close - i - 1);
            if (escape == "SP") {
                out += '@';
            } else if (escape == "BP") {
                out += '*';
            } else if (escape == "RF") {
                out += '&';
            } else if (escape == "LT") {
                out += '<';
            } else if (escape == "GT") {
                out += '>';
            } else if (escape == "LP") {
                out += '(';
            } else if (escape == "RP") {
                out += ')';
            } else if (escape == "C") {
                out += ',';
            } else if (escape.size() > 1 && escape[0] == 'u' && escape.size() <= 7 &&
                       isHex(escape.substr(1))) {
                const unsigned long code_point = std::strtoul(escape.c_str() + 1, nullptr, 16);
                if (code_point > 0x10FFFF) {
                    return false;
                }
                appendUtf8(out, code_point);
            } else {
                return false;
            }
            i = close + 1;
        } else {
            out += c;
            ++i;
        }
    }
    return true;
}
}  // namespace

std::optional<std::string> NameDemangler::demangleLegacyRust(const std::string& mangled_name) {
    std::vector<std::string> components;
    if (!splitNestedName(mangled_name, components) || !isRustHash(components.back())) {
        return std::nullopt;
    }
    components.pop_back();

    std::string demangled;
    for (const auto& component : components) {
        if (!demangled.empty()) {
            demangled += "::";
        }
        if (!decodeRustIdentifier(component, demangled)) {
            return std::nullopt;
        }
    }

    if (demangled.empty()) {
        return std::nullopt;
    }
    return demangled;
}

std::optional<std::string> NameDemangler::demangleRustV0(const std::string& mangled_name) {
    int status = 0;
    char* demangled = llvm::rustDemangle(mangled_name.c_str(), nullptr, nullptr, &status);

    std::optional<std::string> result;
    if (status == 0 && demangled != nullptr) {
        result = std::string(demangled);
    }
    std::free(demangled);
    return result;
}

std::optional<std::string> NameDemangler::demangleItanium(const std::string& mangled_name) {
    int status = 0;
    char* demangled = abi::__cxa_demangle(mangled_name.c_str(), nullptr, nullptr, &status);

    std::optional<std::string> result;
    if (status == 0 && demangled != nullptr) {
        result = std::string(demangled);
    }
    std::free(demangled);
    return result;
}

std::string NameDemangler::demangle(const std::string& mangled_name) const {
    if (!enabled_) {
        return mangled_name;
    }

    auto it = demangled_cache_.find(mangled_name);
    if (it != demangled_cache_.end()) {
        return it->second;
    }

    std::optional<std::string> demangled;
    if (startsWith(mangled_name, "_R")) {
        demangled = demangleRustV0(mangled_name);
    } else if (mangled_name.size() > 2 && startsWith(mangled_name, "_Z")) {
        // Legacy Rust symbols are valid Itanium names too; try the Rust form first
        demangled = demangleLegacyRust(mangled_name);
        if (!demangled) {
            demangled = demangleItanium(mangled_name);
        }
    }

    const std::string result = demangled.value_or(mangled_name);
    demangled_cache_[mangled_name] = result;
    return result;
}
