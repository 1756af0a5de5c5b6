/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include "StackStructures.h"
#include <cstdint>
#include <ostream>
#include <set>
#include <string>
#include <vector>

// Forward declaration
struct Config;

/**
 * @class OutputGenerator
 * @brief Renders the stack usage report (text/CSV/JSON)
 *
 * ## Supported Output Formats:
 * - **Text** (default): fixed-width table, largest stack first
 *   ```
 *   Code  Stack Name
 *     124    96 app::main
 *      16    24 foo
 *   ```
 * - **CSV**: tabular format with headers for spreadsheet compatibility
 *   ```
 *   Name,Address,CodeSize,StackSize
 *   app::main,0x08000100,124,96
 *   ```
 * - **JSON**: structured format with architecture metadata
 *   ```json
 *   {
 *     "addressWidth": 32,
 *     "functions": [
 *       {"name": "foo", "address": "0x00001000", "codeSize": 16, "stackSize": 24}
 *     ]
 *   }
 *   ```
 *
 * Functions without a matching .stack_sizes record print 0 in the text
 * table, an empty field in CSV and null in JSON.
 *
 * ## Usage Example:
 * ```cpp
 * OutputGenerator generator(functions.addressWidth);
 * generator.generate(entries, functions.undefined, config, std::cout);
 * ```
 */
class OutputGenerator {
public:
    /**
     * @param width Address width of the analyzed executable (controls address padding)
     */
    explicit OutputGenerator(AddressWidth width);

    /**
     * @brief Render in the format selected by config.format
     * @param entries Report rows from ReportBuilder
     * @param undefined Undefined function symbols (printed when config.showUndefined)
     * @param config Output options
     * @param out Destination stream
     */
    void generate(const std::vector<ReportEntry>& entries,
                  const std::set<std::string>& undefined,
                  const Config& config,
                  std::ostream& out) const;

    /**
     * @brief Fixed-width text table
     *
     * Column widths match the classic stack-sizes listing: five characters
     * for code and stack size, then the joined names.
     */
    void generateTextOutput(const std::vector<ReportEntry>& entries,
                            const std::set<std::string>& undefined,
                            const Config& config,
                            std::ostream& out) const;

    /**
     * @brief CSV with header row
     * @note Names are quoted when they contain commas or quotes
     */
    void generateCsvOutput(const std::vector<ReportEntry>& entries,
                           const std::set<std::string>& undefined,
                           const Config& config,
                           std::ostream& out) const;

    /**
     * @brief JSON document with address width, functions and optional undefined list
     */
    void generateJsonOutput(const std::vector<ReportEntry>& entries,
                            const std::set<std::string>& undefined,
                            const Config& config,
                            std::ostream& out) const;

    /// @brief Format an address as 0x-prefixed hex padded to the address width
    std::string formatAddress(uint64_t address) const;

    static std::string escapeCsv(const std::string& value);
    static std::string escapeJson(const std::string& value);

private:
    AddressWidth width_;  ///< Address width of the executable
};
