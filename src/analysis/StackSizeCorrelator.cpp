/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "StackSizeCorrelator.h"
#include "FunctionLookup.h"

size_t StackSizeCorrelator::correlate(FunctionMap& defined,
                                      const std::vector<StackSizeRecord>& records) {
    size_t matched = 0;

    for (const auto& record : records) {
        if (Function* function = FunctionLookup::find(defined, record.address)) {
            function->setStack(record.stack);
            ++matched;
        }
    }

    return matched;
}
