#include "utils.hpp"

namespace stacktk::test {

    TEST_CASE("007: Analyzing a 32-bit executable", "[007][analyzer]") {
        SECTION("Function, alias and stack size") {
            auto image = ElfImageBuilder{false}
                                 .label("$t", 0x1000)
                                 .function("foo", 0x1001, 16)
                                 .label("foo_entry", 0x1000)
                                 .function("bar", 0x2000, 8)
                                 .undefinedFunction("extern_fn")
                                 .object("counter", 0x20000000, 4)
                                 .stackRecord(0x1000, 24)
                                 .stackRecord(0x2000, 8)
                                 .build();

            AnalysisStats stats;
            auto functions = analyze(image, &stats);

            CHECK(functions.addressWidth == AddressWidth::Bits32);
            CHECK(functions.undefined == std::set<std::string>{"extern_fn"});
            REQUIRE(functions.defined.size() == 2);

            const auto& foo = functions.defined.at(0x1001);
            CHECK(foo.names() == std::vector<std::string>{"foo", "foo_entry"});
            CHECK(foo.size() == 16);
            CHECK(foo.stack() == 24);

            CHECK(functions.defined.at(0x2000).stack() == 8);

            CHECK(stats.machine == EM_ARM);
            CHECK(stats.littleEndian);
            CHECK(stats.hasSymbolTable);
            CHECK(stats.hasStackSizes);
            CHECK(stats.symbolCount == 7);
            CHECK(stats.aliasGroupsAttached == 1);
            CHECK(stats.stackRecordsDecoded == 2);
            CHECK(stats.stackRecordsMatched == 2);
        }

        SECTION("Odd record for an even function") {
            auto image = ElfImageBuilder{false}.function("foo", 0x1000, 16).stackRecord(0x1001, 24).build();

            auto functions = analyze(image);

            CHECK(functions.defined.at(0x1000).stack() == 24);
        }

        SECTION("Missing .stack_sizes leaves every stack unknown") {
            auto image = ElfImageBuilder{false}.function("foo", 0x1000, 16).function("bar", 0x2000, 8).build();

            AnalysisStats stats;
            auto functions = analyze(image, &stats);

            CHECK_FALSE(stats.hasStackSizes);
            REQUIRE(functions.defined.size() == 2);
            for (const auto& [address, function] : functions.defined) {
                CHECK_FALSE(function.stack().has_value());
            }
        }

        SECTION("Empty .stack_sizes") {
            auto image = ElfImageBuilder{false}.function("foo", 0x1000, 16).emptyStackSizes().build();

            AnalysisStats stats;
            auto functions = analyze(image, &stats);

            CHECK(stats.hasStackSizes);
            CHECK(stats.stackRecordsDecoded == 0);
            CHECK_FALSE(functions.defined.at(0x1000).stack().has_value());
        }

        SECTION("Record for discarded code is ignored") {
            auto image = ElfImageBuilder{false}
                                 .function("foo", 0x1000, 16)
                                 .stackRecord(0x5000, 512)
                                 .stackRecord(0x1000, 32)
                                 .build();

            AnalysisStats stats;
            auto functions = analyze(image, &stats);

            CHECK(stats.stackRecordsMatched == 1);
            CHECK(functions.defined.size() == 1);
            CHECK(functions.defined.at(0x1000).stack() == 32);
        }
    }

    TEST_CASE("007: Analyzing a 64-bit executable", "[007][analyzer]") {
        auto image = ElfImageBuilder{true}
                             .function("_ZN4core3fmt5write17h0123456789abcdefE", 0x401000, 120)
                             .function("main", 0x401100, 40)
                             .undefinedFunction("memset")
                             .stackRecord(0x401000, 96)
                             .stackRecord(0x401100, 16)
                             .build();

        auto functions = analyze(image);

        CHECK(functions.addressWidth == AddressWidth::Bits64);
        CHECK(functions.undefined == std::set<std::string>{"memset"});
        CHECK(functions.defined.at(0x401000).stack() == 96);
        CHECK(functions.defined.at(0x401100).stack() == 16);
    }

    TEST_CASE("007: Big-endian executable", "[007][analyzer]") {
        // .stack_sizes addresses stay little-endian regardless of the ELF data encoding
        auto image = ElfImageBuilder{false, false}.function("task", 0x10000, 64).stackRecord(0x10000, 40).build();

        AnalysisStats stats;
        auto functions = analyze(image, &stats);

        CHECK_FALSE(stats.littleEndian);
        CHECK(stats.machine == EM_PPC);
        REQUIRE(functions.defined.count(0x10000) == 1);
        CHECK(functions.defined.at(0x10000).names() == std::vector<std::string>{"task"});
        CHECK(functions.defined.at(0x10000).size() == 64);
        CHECK(functions.defined.at(0x10000).stack() == 40);
    }

    TEST_CASE("007: Stripped executable", "[007][analyzer]") {
        SECTION("32-bit class decides the record width") {
            auto image = ElfImageBuilder{false}.withoutSymtab().stackRecord(0x1000, 16).build();

            AnalysisStats stats;
            auto functions = analyze(image, &stats);

            CHECK_FALSE(stats.hasSymbolTable);
            CHECK(stats.stackRecordsDecoded == 1);
            CHECK(stats.stackRecordsMatched == 0);
            CHECK(functions.addressWidth == AddressWidth::Bits32);
            CHECK(functions.defined.empty());
            CHECK(functions.undefined.empty());
        }

        SECTION("64-bit") {
            auto image = ElfImageBuilder{true}.withoutSymtab().build();

            auto functions = analyze(image);

            CHECK(functions.addressWidth == AddressWidth::Bits64);
            CHECK(functions.defined.empty());
        }
    }

    TEST_CASE("007: Invalid executables", "[007][analyzer][errors]") {
        SECTION("Not an ELF file") {
            std::vector<uint8_t> text(64, 'x');

            try {
                analyze(text);
                FAIL("expected ElfFileError");
            } catch (const StackTkExceptions::ElfFileError& e) {
                CHECK(e.getErrorType() == StackTkExceptions::ElfFileError::ErrorType::InvalidFormat);
            }
        }

        SECTION("Buffer shorter than the identification bytes") {
            std::vector<uint8_t> tiny{0x7f, 'E', 'L', 'F'};

            CHECK_THROWS_AS(analyze(tiny), StackTkExceptions::ElfFileError);
        }

        SECTION("Unrecognized symbol entry size") {
            auto image = ElfImageBuilder{false}.function("foo", 0x1000, 16).symtabEntrySize(12).build();

            CHECK_THROWS_AS(analyze(image), StackTkExceptions::MalformedInputError);
        }

        SECTION("Symbol entry size of the other ELF class") {
            auto image = ElfImageBuilder{false}.function("foo", 0x1000, 16).symtabEntrySize(24).build();

            CHECK_THROWS_AS(analyze(image), StackTkExceptions::MalformedInputError);
        }

        SECTION(".symtab that is not a symbol table") {
            auto image = ElfImageBuilder{false}.function("foo", 0x1000, 16).symtabType(SHT_PROGBITS).build();

            CHECK_THROWS_AS(analyze(image), StackTkExceptions::MalformedInputError);
        }

        SECTION("Function name outside the string table") {
            auto image = ElfImageBuilder{false}.function("foo", 0x1000, 16).unnamedFunction(0x2000, 8).build();

            try {
                analyze(image);
                FAIL("expected UnresolvedNameError");
            } catch (const StackTkExceptions::UnresolvedNameError& e) {
                CHECK(e.getSymbolIndex() == 2);
            }
        }

        SECTION("Truncated .stack_sizes") {
            auto image = ElfImageBuilder{false}
                                 .function("foo", 0x1000, 16)
                                 .stackBytes({0x00, 0x10, 0x00, 0x00, 0x80})
                                 .build();

            CHECK_THROWS_AS(analyze(image), StackTkExceptions::MalformedInputError);
        }
    }

}  // namespace stacktk::test
