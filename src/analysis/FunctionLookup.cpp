/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "FunctionLookup.h"

Function* FunctionLookup::find(FunctionMap& defined, uint64_t address) {
    auto it = defined.find(address | 1);
    if (it != defined.end()) {
        return &it->second;
    }

    it = defined.find(address & ~static_cast<uint64_t>(1));
    if (it != defined.end()) {
        return &it->second;
    }

    return nullptr;
}
