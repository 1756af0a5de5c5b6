/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "ReportBuilder.h"
#include <algorithm>
#include <utility>

std::vector<ReportEntry> ReportBuilder::build(const Functions& functions,
                                              const NameTransform& transform,
                                              uint64_t min_stack) {
    std::vector<ReportEntry> entries;
    entries.reserve(functions.defined.size());

    for (const auto& [address, function] : functions.defined) {
        ReportEntry entry;
        entry.name = joinNames(function.names(), transform);
        entry.address = address;
        entry.codeSize = function.size();
        entry.stackKnown = function.stack().has_value();
        entry.stackSize = function.stack().value_or(0);
        entries.push_back(std::move(entry));
    }

    std::stable_sort(entries.begin(), entries.end(), [](const ReportEntry& a, const ReportEntry& b) {
        return a.stackSize > b.stackSize;
    });

    entries.erase(std::remove_if(entries.begin(),
                                 entries.end(),
                                 [min_stack](const ReportEntry& e) { return e.stackSize < min_stack; }),
                  entries.end());

    return entries;
}

std::string ReportBuilder::joinNames(const std::vector<std::string>& names,
                                     const NameTransform& transform) {
    std::string joined;
    for (const auto& name : names) {
        if (name.empty()) {
            continue;
        }
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += transform ? transform(name) : name;
    }
    return joined;
}
