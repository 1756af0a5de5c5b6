/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file OutputGenerator.cpp
 * @brief Text, CSV and JSON rendering of the stack usage report
 */

#include "OutputGenerator.h"
#include <iomanip>
#include <sstream>
#include "../StackUsageAnalyzer.h"  // For Config struct

OutputGenerator::OutputGenerator(AddressWidth width) : width_(width) {}

void OutputGenerator::generate(const std::vector<ReportEntry>& entries,
                               const std::set<std::string>& undefined,
                               const Config& config,
                               std::ostream& out) const {
    if (config.format == "json") {
        generateJsonOutput(entries, undefined, config, out);
    } else if (config.format == "csv") {
        generateCsvOutput(entries, undefined, config, out);
    } else {
        generateTextOutput(entries, undefined, config, out);
    }
}

void OutputGenerator::generateTextOutput(const std::vector<ReportEntry>& entries,
                                         const std::set<std::string>& undefined,
                                         const Config& config,
                                         std::ostream& out) const {
    if (config.showAddresses) {
        out << std::left << std::setw(static_cast<int>(addressBytes(width_) * 2 + 3)) << "Address"
            << std::right;
    }
    out << "Code  Stack Name\n";

    for (const auto& entry : entries) {
        if (config.showAddresses) {
            out << formatAddress(entry.address) << ' ';
        }
        out << std::dec << std::setfill(' ') << std::setw(5) << entry.codeSize << ' '
            << std::setw(5) << entry.stackSize << ' ' << entry.name << '\n';
    }

    if (config.showUndefined && !undefined.empty()) {
        out << "\nUndefined:\n";
        for (const auto& name : undefined) {
            out << "  " << name << '\n';
        }
    }
}

void OutputGenerator::generateCsvOutput(const std::vector<ReportEntry>& entries,
                                        const std::set<std::string>& undefined,
                                        const Config& config,
                                        std::ostream& out) const {
    out << "Name,Address,CodeSize,StackSize\n";

    for (const auto& entry : entries) {
        out << escapeCsv(entry.name) << ',' << formatAddress(entry.address) << ',' << std::dec
            << entry.codeSize << ',';
        if (entry.stackKnown) {
            out << entry.stackSize;
        }
        out << '\n';
    }

    if (config.showUndefined) {
        for (const auto& name : undefined) {
            out << escapeCsv(name) << ",,,\n";
        }
    }
}

void OutputGenerator::generateJsonOutput(const std::vector<ReportEntry>& entries,
                                         const std::set<std::string>& undefined,
                                         const Config& config,
                                         std::ostream& out) const {
    out << "{\n";
    out << "  \"addressWidth\": " << std::dec << static_cast<int>(width_) << ",\n";
    out << "  \"functions\": [\n";
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        out << "    {\n";
        out << "      \"name\": \"" << escapeJson(entry.name) << "\",\n";
        out << "      \"address\": \"" << formatAddress(entry.address) << "\",\n";
        out << "      \"codeSize\": " << std::dec << entry.codeSize << ",\n";
        out << "      \"stackSize\": ";
        if (entry.stackKnown) {
            out << entry.stackSize;
        } else {
            out << "null";
        }
        out << "\n    }" << (i + 1 == entries.size() ? "" : ",") << "\n";
    }
    out << "  ]";

    if (config.showUndefined) {
        out << ",\n  \"undefined\": [";
        size_t i = 0;
        for (const auto& name : undefined) {
            out << (i++ == 0 ? "\n" : ",\n") << "    \"" << escapeJson(name) << "\"";
        }
        out << (undefined.empty() ? "]" : "\n  ]");
    }

    out << "\n}\n";
}

std::string OutputGenerator::formatAddress(uint64_t address) const {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(static_cast<int>(addressBytes(width_) * 2))
        << std::setfill('0') << address;
    return oss.str();
}

std::string OutputGenerator::escapeCsv(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }

    std::string escaped = "\"";
    for (char c : value) {
        if (c == '"') {
            escaped += '"';
        }
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

std::string OutputGenerator::escapeJson(const std::string& value) {
    std::ostringstream oss;
    for (char c : value) {
        switch (c) {
            case '"':
                oss << "\\\"";
                break;
            case '\\':
                oss << "\\\\";
                break;
            case '\n':
                oss << "\\n";
                break;
            case '\t':
                oss << "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}
