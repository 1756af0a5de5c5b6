/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file SectionReader.h
 * @brief Bounds-checked sequential reads over raw section bytes
 *
 * Every read validates the requested range against the section size before
 * touching memory, so a truncated or corrupted section surfaces as a
 * MalformedInputError carrying the section name and offset instead of an
 * out-of-bounds access.
 */

#ifndef SECTION_READER_H
#define SECTION_READER_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include "ElfExceptions.h"

namespace StackTkUtils {

/**
 * @brief Safe arithmetic operations with overflow checking
 */
class SafeArithmetic {
public:
    /**
     * @brief Safe addition with overflow checking
     * @param result Receives a + b when the sum fits; untouched otherwise
     * @return true if a + b fits in size_t, false on overflow
     */
    static bool tryAdd(size_t a, size_t b, size_t& result) {
        if (a > std::numeric_limits<size_t>::max() - b) {
            return false;
        }
        result = a + b;
        return true;
    }
};

/**
 * @brief Cursor over the bytes of a single section
 */
class SectionReader {
private:
    const uint8_t* data_;
    size_t size_;
    size_t position_;
    std::string section_;

public:
    /**
     * @param data Pointer to the section bytes (may be null when size is 0)
     * @param size Number of bytes in the section
     * @param section Section name for error reporting
     */
    SectionReader(const uint8_t* data, size_t size, const std::string& section)
        : data_(data), size_(size), position_(0), section_(section) {}

    size_t position() const { return position_; }

    size_t size() const { return size_; }

    size_t remaining() const { return size_ - position_; }

    bool atEnd() const { return position_ >= size_; }

    /**
     * @brief Validate that length bytes can be read at the current position
     * @throws MalformedInputError if the range runs past the section end
     */
    void require(size_t length, const std::string& what) const {
        size_t end = 0;
        if (!SafeArithmetic::tryAdd(position_, length, end) || end > size_) {
            throw StackTkExceptions::MalformedInputError(
                "Truncated " + what + ": need " + std::to_string(length) + " bytes, " +
                    std::to_string(remaining()) + " remaining",
                section_,
                position_);
        }
    }

    /**
     * @brief Read an unsigned little-endian integer of the given width
     * @param width Number of bytes (1 to 8)
     * @param what Description of the field for error messages
     */
    uint64_t readLittleEndian(size_t width, const std::string& what) {
        require(width, what);

        uint64_t value = 0;
        for (size_t i = 0; i < width; ++i) {
            value |= static_cast<uint64_t>(data_[position_ + i]) << (8 * i);
        }
        position_ += width;
        return value;
    }

    /**
     * @brief Read an unsigned LEB128 value
     *
     * Each byte contributes its low seven bits, least significant group
     * first; the high bit marks continuation.
     *
     * @throws MalformedInputError if the encoding is truncated or does not fit in 64 bits
     */
    uint64_t readUleb128(const std::string& what) {
        const size_t start = position_;
        uint64_t value = 0;
        unsigned shift = 0;

        while (true) {
            if (position_ >= size_) {
                throw StackTkExceptions::MalformedInputError(
                    "Truncated " + what + ": LEB128 value runs past end of section",
                    section_,
                    start);
            }

            const uint8_t byte = data_[position_++];
            const uint64_t low = byte & 0x7f;

            if (shift >= 64 || (shift == 63 && low > 1)) {
                throw StackTkExceptions::MalformedInputError(
                    "Overflow in " + what + ": LEB128 value exceeds 64 bits", section_, start);
            }

            value |= low << shift;
            shift += 7;

            if ((byte & 0x80) == 0) {
                return value;
            }
        }
    }
};

}  // namespace StackTkUtils

#endif  // SECTION_READER_H
