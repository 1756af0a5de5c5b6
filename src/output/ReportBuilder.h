/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "StackStructures.h"

/**
 * @class ReportBuilder
 * @brief Flattens the function catalog into sorted report rows
 *
 * Each defined function becomes one ReportEntry whose name is the list of its
 * (transformed) names joined with a single space. Rows are ordered by stack
 * usage, largest first; rows with equal stack usage keep address order, which
 * is a property of this implementation and not a guarantee.
 *
 * Undefined symbols never produce a row.
 */
class ReportBuilder {
public:
    /// @brief Name transformation applied to each raw symbol name (e.g. demangling)
    using NameTransform = std::function<std::string(const std::string&)>;

    /**
     * @brief Build the report
     * @param functions Completed catalog
     * @param transform Applied to every name; nullptr keeps raw names
     * @param min_stack Rows with a stack size below this are dropped (0 keeps all)
     * @return Rows sorted by stack size, descending
     */
    static std::vector<ReportEntry>
    build(const Functions& functions, const NameTransform& transform, uint64_t min_stack = 0);

    /**
     * @brief Join the non-empty names of a function with single spaces
     */
    static std::string joinNames(const std::vector<std::string>& names,
                                 const NameTransform& transform);
};
