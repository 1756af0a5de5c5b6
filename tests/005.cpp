#include "analysis/StackSizeCorrelator.h"
#include "utils.hpp"

namespace stacktk::test {

    namespace detail {
        inline FunctionMap functionsAt(std::initializer_list<uint64_t> addresses) {
            FunctionMap defined;
            for (auto address : addresses) {
                defined.try_emplace(address, 8).first->second.addName("fn_" + std::to_string(address));
            }
            return defined;
        }
    }  // namespace detail

    TEST_CASE("005: Stack size correlation", "[005][correlate]") {
        SECTION("Exact address") {
            auto defined = detail::functionsAt({0x1000});

            CHECK(StackSizeCorrelator::correlate(defined, {{0x1000, 32}}) == 1);
            CHECK(defined.at(0x1000).stack() == 32);
        }

        SECTION("Odd function address, record without the Thumb bit") {
            auto defined = detail::functionsAt({0x1001});

            CHECK(StackSizeCorrelator::correlate(defined, {{0x1000, 24}}) == 1);
            CHECK(defined.at(0x1001).stack() == 24);
        }

        SECTION("Even function address, record with the Thumb bit") {
            auto defined = detail::functionsAt({0x2000});

            CHECK(StackSizeCorrelator::correlate(defined, {{0x2001, 16}}) == 1);
            CHECK(defined.at(0x2000).stack() == 16);
        }

        SECTION("Unmatched records leave other functions untouched") {
            auto defined = detail::functionsAt({0x1000, 0x2000});

            CHECK(StackSizeCorrelator::correlate(defined, {{0x1500, 99}, {0x2000, 8}, {0x3000, 7}}) == 1);
            CHECK_FALSE(defined.at(0x1000).stack().has_value());
            CHECK(defined.at(0x2000).stack() == 8);
            CHECK(defined.size() == 2);
        }

        SECTION("Zero-byte frames are known") {
            auto defined = detail::functionsAt({0x1000});

            StackSizeCorrelator::correlate(defined, {{0x1000, 0}});
            REQUIRE(defined.at(0x1000).stack().has_value());
            CHECK(*defined.at(0x1000).stack() == 0);
        }

        SECTION("Later record for the same function wins") {
            auto defined = detail::functionsAt({0x1000});

            CHECK(StackSizeCorrelator::correlate(defined, {{0x1000, 8}, {0x1001, 40}}) == 2);
            CHECK(defined.at(0x1000).stack() == 40);
        }

        SECTION("Both bit variants defined, the odd address wins") {
            auto defined = detail::functionsAt({0x1000, 0x1001});

            CHECK(StackSizeCorrelator::correlate(defined, {{0x1000, 12}}) == 1);
            CHECK(defined.at(0x1001).stack() == 12);
            CHECK_FALSE(defined.at(0x1000).stack().has_value());
        }

        SECTION("No records") {
            auto defined = detail::functionsAt({0x1000});

            CHECK(StackSizeCorrelator::correlate(defined, {}) == 0);
            CHECK_FALSE(defined.at(0x1000).stack().has_value());
        }
    }

}  // namespace stacktk::test
