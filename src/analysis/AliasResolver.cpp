/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "AliasResolver.h"
#include "FunctionLookup.h"

size_t AliasResolver::resolve(FunctionMap& defined, const AliasCandidateMap& candidates) {
    size_t attached = 0;

    for (const auto& [address, names] : candidates) {
        if (Function* function = FunctionLookup::find(defined, address)) {
            function->addNames(names);
            ++attached;
        }
    }

    return attached;
}
