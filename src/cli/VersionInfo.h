/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <string>

/**
 * @file VersionInfo.h
 * @brief Centralized version information
 *
 * Single source of truth for the application name, version and license
 * notice printed by --version.
 */

class VersionInfo {
public:
    /// @brief Application version string
    static constexpr const char* VERSION = "1.0.0";

    /// @brief Copyright notice
    static constexpr const char* COPYRIGHT = "Copyright (c) 2025 - Licensed under Mozilla Public License 2.0";

    /// @brief License URL
    static constexpr const char* LICENSE_URL = "https://mozilla.org/MPL/2.0/";

    /// @brief Application name
    static constexpr const char* APP_NAME = "stacktk";

    /**
     * @brief Get formatted version string
     * @return "stacktk v<VERSION>"
     */
    static std::string getVersionString();

    /**
     * @brief Display application version and build information
     */
    static void showVersion();
};
