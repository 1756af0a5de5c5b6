/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "VersionInfo.h"
#include <iostream>

/// @brief Build date macro (set by build system)
#ifndef BUILD_DATE
#define BUILD_DATE "unknown"
#endif

std::string VersionInfo::getVersionString() {
    return std::string(APP_NAME) + " v" + VERSION;
}

void VersionInfo::showVersion() {
    std::cout << getVersionString() << '\n';
    std::cout << COPYRIGHT << '\n';
    std::cout << "Build Date: " << BUILD_DATE << '\n';
    std::cout << '\n';
    std::cout << "License: " << LICENSE_URL << '\n';
}
