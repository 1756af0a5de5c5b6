/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "StackSizeDecoder.h"
#include "../SectionReader.h"

std::vector<StackSizeRecord>
StackSizeDecoder::decode(const uint8_t* data, size_t size, AddressWidth width) {
    std::vector<StackSizeRecord> records;
    StackTkUtils::SectionReader reader(data, size, STACK_SIZES_SECTION);

    const size_t address_size = addressBytes(width);

    while (!reader.atEnd()) {
        const uint64_t address = reader.readLittleEndian(address_size, "function address");
        const uint64_t stack = reader.readUleb128("stack size");
        records.emplace_back(address, stack);
    }

    return records;
}
