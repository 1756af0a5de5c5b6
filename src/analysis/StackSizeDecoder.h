/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "StackStructures.h"

/**
 * @file StackSizeDecoder.h
 * @brief Decoder for the .stack_sizes section
 *
 * The section is a tightly packed sequence of records without headers or
 * padding:
 *
 * ```
 * +----------------------------+---------------------+
 * | address (4 or 8 bytes, LE) | stack size (ULEB128) |
 * +----------------------------+---------------------+
 * ```
 *
 * The section is emitted by -Z emit-stack-sizes (rustc) and
 * -fstack-size-section (clang) and is usually marked non-allocatable by the
 * linker script so it is not loaded on the target.
 */

class StackSizeDecoder {
public:
    /// @brief Name of the section written by the compiler instrumentation
    static constexpr const char* STACK_SIZES_SECTION = ".stack_sizes";

    /**
     * @brief Decode every record of the section, in file order
     * @param data Section bytes (may be null when size is 0)
     * @param size Section size in bytes
     * @param width Address width of the executable
     * @return Decoded records
     * @throws MalformedInputError if a record runs past the end of the section
     */
    static std::vector<StackSizeRecord> decode(const uint8_t* data, size_t size, AddressWidth width);
};
