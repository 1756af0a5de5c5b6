#include "analysis/AliasResolver.h"
#include "analysis/FunctionLookup.h"
#include "utils.hpp"

namespace stacktk::test {

    namespace detail {
        inline FunctionMap catalog(std::initializer_list<std::pair<uint64_t, std::string>> functions) {
            FunctionMap defined;
            for (const auto& [address, name] : functions) {
                defined.try_emplace(address, 16).first->second.addName(name);
            }
            return defined;
        }
    }  // namespace detail

    TEST_CASE("003: Address lookup ignores the low bit", "[003][lookup]") {
        auto defined = detail::catalog({{0x1001, "thumb_fn"}, {0x2000, "arm_fn"}});

        SECTION("Exact odd address") {
            auto* function = FunctionLookup::find(defined, 0x1001);
            REQUIRE(function != nullptr);
            CHECK(function->names().front() == "thumb_fn");
        }

        SECTION("Even address finds the odd key") {
            auto* function = FunctionLookup::find(defined, 0x1000);
            REQUIRE(function != nullptr);
            CHECK(function->names().front() == "thumb_fn");
        }

        SECTION("Odd address finds the even key") {
            auto* function = FunctionLookup::find(defined, 0x2001);
            REQUIRE(function != nullptr);
            CHECK(function->names().front() == "arm_fn");
        }

        SECTION("Neighbouring addresses do not match") {
            CHECK(FunctionLookup::find(defined, 0x1002) == nullptr);
            CHECK(FunctionLookup::find(defined, 0x1fff) == nullptr);
            CHECK(FunctionLookup::find(defined, 0x2002) == nullptr);
        }
    }

    TEST_CASE("003: Alias resolution", "[003][alias]") {
        SECTION("Alias at the exact address is appended after the function names") {
            auto defined = detail::catalog({{0x1000, "foo"}});
            AliasCandidateMap candidates{{0x1000, {"foo_alias", "foo_entry"}}};

            CHECK(AliasResolver::resolve(defined, candidates) == 1);
            CHECK(defined.at(0x1000).names() == std::vector<std::string>{"foo", "foo_alias", "foo_entry"});
        }

        SECTION("Even label attaches to a Thumb function") {
            auto defined = detail::catalog({{0x8001, "Reset_Handler"}});
            AliasCandidateMap candidates{{0x8000, {"_start"}}};

            CHECK(AliasResolver::resolve(defined, candidates) == 1);
            CHECK(defined.at(0x8001).names() == std::vector<std::string>{"Reset_Handler", "_start"});
        }

        SECTION("Odd label attaches to an even function") {
            auto defined = detail::catalog({{0x8000, "handler"}});
            AliasCandidateMap candidates{{0x8001, {"handler_thumb"}}};

            CHECK(AliasResolver::resolve(defined, candidates) == 1);
            CHECK(defined.at(0x8000).names().back() == "handler_thumb");
        }

        SECTION("Labels away from any function are dropped") {
            auto defined = detail::catalog({{0x1000, "foo"}});
            AliasCandidateMap candidates{{0x1004, {"loop"}}, {0x3000, {"end"}}};

            CHECK(AliasResolver::resolve(defined, candidates) == 0);
            CHECK(defined.size() == 1);
            CHECK(defined.at(0x1000).names() == std::vector<std::string>{"foo"});
        }
    }

}  // namespace stacktk::test
