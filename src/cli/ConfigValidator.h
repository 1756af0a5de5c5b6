/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include "../StackUsageAnalyzer.h"
#include <string>
#include <vector>

/**
 * @file ConfigValidator.h
 * @brief Configuration validation and conflict detection
 *
 * Runs after CLI11 parsing to catch problems CLI11 cannot express (a
 * configuration built programmatically, an input file that exists but cannot
 * be read) and to warn about option combinations that have no effect.
 */

/**
 * @class ConfigValidator
 * @brief Validates configuration options and detects conflicts
 *
 * ## Usage:
 * ```cpp
 * auto result = ConfigValidator::validate(config);
 * if (!result.is_valid) {
 *     std::cerr << "Configuration error: " << result.error_message << '\n';
 *     return 1;
 * }
 * ```
 */
class ConfigValidator {
public:
    /**
     * @brief Validation result structure
     */
    struct ValidationResult {
        bool is_valid = true;               ///< Whether configuration is valid
        std::string error_message;          ///< Detailed error message if invalid
        std::vector<std::string> warnings;  ///< Non-fatal warnings
    };

    /**
     * @brief Validate complete configuration
     *
     * ## Validation Checks:
     * - Output format is one of the supported formats
     * - Input file exists, is readable and not empty
     * - Option combinations that are silently ignored (warnings)
     */
    static ValidationResult validate(const Config& config);

    /**
     * @brief Validate the output format name
     * @param format Output format to validate
     * @param error Output parameter for error message
     * @return true if format is valid, false otherwise
     */
    static bool validateOutputFormat(const std::string& format, std::string& error);

    /**
     * @brief Validate input file accessibility
     * @param filepath Path to input file
     * @param error Output parameter for error message
     * @return true if file is accessible, false otherwise
     */
    static bool validateInputFile(const std::string& filepath, std::string& error);

    /**
     * @brief Check logical consistency of option combinations
     * @param config Configuration to check
     * @param warnings Output parameter for warning messages
     */
    static void checkLogicalConsistency(const Config& config, std::vector<std::string>& warnings);

    /// @brief List of valid output formats
    static const std::vector<std::string>& getValidOutputFormats();

private:
    static const std::vector<std::string> VALID_OUTPUT_FORMATS;
};
