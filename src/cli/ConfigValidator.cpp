/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "ConfigValidator.h"
#include "../FileAccessStrategy.h"
#include <algorithm>
#include <sstream>

const std::vector<std::string> ConfigValidator::VALID_OUTPUT_FORMATS = {"text", "csv", "json"};

ConfigValidator::ValidationResult ConfigValidator::validate(const Config& config) {
    ValidationResult result;
    std::string error;

    if (!validateOutputFormat(config.format, error)) {
        result.is_valid = false;
        result.error_message = error;
        return result;
    }

    if (!validateInputFile(config.inputFile, error)) {
        result.is_valid = false;
        result.error_message = error;
        return result;
    }

    checkLogicalConsistency(config, result.warnings);

    return result;
}

bool ConfigValidator::validateOutputFormat(const std::string& format, std::string& error) {
    if (std::find(VALID_OUTPUT_FORMATS.begin(), VALID_OUTPUT_FORMATS.end(), format) ==
        VALID_OUTPUT_FORMATS.end()) {
        std::ostringstream oss;
        oss << "Invalid output format '" << format << "'. Valid options are: ";
        for (size_t i = 0; i < VALID_OUTPUT_FORMATS.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << VALID_OUTPUT_FORMATS[i];
        }
        error = oss.str();
        return false;
    }
    return true;
}

bool ConfigValidator::validateInputFile(const std::string& filepath, std::string& error) {
    try {
        if (FileAccessStrategy::regularFileSize(filepath) == 0) {
            error = "Input file '" + filepath + "' is empty";
            return false;
        }
    } catch (const FileAccessException& e) {
        error = e.what();
        return false;
    }
    return true;
}

void ConfigValidator::checkLogicalConsistency(const Config& config,
                                              std::vector<std::string>& warnings) {
    if (config.showAddresses && config.format == "json") {
        warnings.push_back("--show-addresses has no effect with JSON output. Addresses are always included.");
    }

    if (config.showUndefined && config.minStack > 0) {
        warnings.push_back("--min-stack does not apply to undefined symbols. All of them are listed.");
    }
}

const std::vector<std::string>& ConfigValidator::getValidOutputFormats() {
    return VALID_OUTPUT_FORMATS;
}
