/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file ElfExceptions.h
 * @brief Exception hierarchy for executable analysis errors
 *
 * Every error raised by the analysis engine derives from ElfParsingError, so a
 * caller can catch the whole family at once while still reaching the specific
 * context (section, offset, symbol index) of each failure.
 *
 * Exception Hierarchy:
 * - ElfParsingError (base)
 *   - ElfFileError (buffer is not a usable ELF object)
 *   - MalformedInputError (symbol table encoding, .stack_sizes records)
 *   - UnresolvedNameError (function symbol without a resolvable name)
 *
 * Usage Examples:
 * @code
 * try {
 *     Functions functions = StackUsageAnalyzer::analyzeExecutable(data, size);
 * } catch (const MalformedInputError& e) {
 *     std::cerr << "Corrupt section " << e.getSection() << " at " << e.getOffset() << '\n';
 * } catch (const ElfParsingError& e) {
 *     std::cerr << e.getDetailedMessage() << '\n';
 * }
 * @endcode
 */

#ifndef ELF_EXCEPTIONS_H
#define ELF_EXCEPTIONS_H

#include <cstddef>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace StackTkExceptions {

/**
 * @brief Base exception class for all analysis errors
 */
class ElfParsingError : public std::runtime_error {
public:
    /**
     * @brief Construct exception with error message
     * @param message Descriptive error message
     */
    explicit ElfParsingError(const std::string& message)
        : std::runtime_error(message), context_("") {}

    /**
     * @brief Construct exception with error message and context
     * @param message Descriptive error message
     * @param context Additional context information (section, symbol, etc.)
     */
    ElfParsingError(const std::string& message, const std::string& context)
        : std::runtime_error(message), context_(context) {}

    ElfParsingError(const ElfParsingError&) = default;
    ElfParsingError& operator=(const ElfParsingError&) = default;
    ElfParsingError(ElfParsingError&&) noexcept = default;
    ElfParsingError& operator=(ElfParsingError&&) noexcept = default;

    /**
     * @brief Get additional context information
     * @return Context string (may be empty)
     */
    const std::string& getContext() const noexcept { return context_; }

    /**
     * @brief Get formatted error message with context
     * @return Complete error description including context
     */
    virtual std::string getDetailedMessage() const {
        if (context_.empty()) {
            return what();
        }
        return std::string(what()) + " (Context: " + context_ + ")";
    }

protected:
    std::string context_;  ///< Additional context information
};

/**
 * @brief The buffer handed to the engine is not a usable ELF object
 */
class ElfFileError : public ElfParsingError {
public:
    enum class ErrorType {
        InvalidFormat,  ///< Not an ELF object (bad magic, unsupported class)
        LibraryError    ///< libelf refused the image
    };

    ElfFileError(ErrorType type, const std::string& message, const std::string& context = "")
        : ElfParsingError(message, context), errorType_(type) {}

    ErrorType getErrorType() const noexcept { return errorType_; }

    std::string getSuggestion() const {
        switch (errorType_) {
            case ErrorType::InvalidFormat:
                return "Verify that the file is an ELF executable (try 'file' command)";
            case ErrorType::LibraryError:
                return "The ELF headers may be corrupted or truncated";
            default:
                return "Check the input file";
        }
    }

    std::string getDetailedMessage() const override {
        return ElfParsingError::getDetailedMessage() + "\nSuggestion: " + getSuggestion();
    }

    static ElfFileError invalidFormat(const std::string& reason) {
        return ElfFileError(ErrorType::InvalidFormat, "Invalid ELF format: " + reason);
    }

    static ElfFileError libraryError(const std::string& operation, const std::string& reason) {
        return ElfFileError(ErrorType::LibraryError, "libelf " + operation + " failed: " + reason);
    }

private:
    ErrorType errorType_;
};

/**
 * @brief A section exists but its contents cannot be decoded
 *
 * Raised for symbol tables with an unrecognized entry encoding and for
 * .stack_sizes records that run past the end of the section.
 */
class MalformedInputError : public ElfParsingError {
public:
    /**
     * @param message Error description
     * @param section Name of the offending section
     * @param offset Byte offset inside the section where decoding failed
     */
    MalformedInputError(const std::string& message, const std::string& section, size_t offset = 0)
        : ElfParsingError(message, section), offset_(offset) {}

    const std::string& getSection() const noexcept { return context_; }

    size_t getOffset() const noexcept { return offset_; }

    std::string getDetailedMessage() const override {
        std::ostringstream oss;
        oss << what() << " (section " << context_ << ", offset 0x" << std::hex << std::uppercase
            << offset_ << ")";
        oss << "\nSuggestion: Rebuild the executable; the section may be truncated or corrupted";
        return oss.str();
    }

private:
    size_t offset_;  ///< Offset inside the section
};

/**
 * @brief A function symbol whose name cannot be read from the string table
 */
class UnresolvedNameError : public ElfParsingError {
public:
    UnresolvedNameError(const std::string& message, size_t symbolIndex)
        : ElfParsingError(message, "symbol #" + std::to_string(symbolIndex)),
          symbolIndex_(symbolIndex) {}

    size_t getSymbolIndex() const noexcept { return symbolIndex_; }

    std::string getDetailedMessage() const override {
        return ElfParsingError::getDetailedMessage() +
               "\nSuggestion: Check symbol table integrity and string table references";
    }

private:
    size_t symbolIndex_;
};

}  // namespace StackTkExceptions

#endif  // ELF_EXCEPTIONS_H
