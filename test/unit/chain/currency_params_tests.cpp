// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license
// Tests for currency parameter loading

#include <catch2/catch_test_macros.hpp>

#include "chain/currency_params.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

using namespace trustledger::chain;

TEST_CASE("CurrencyParams - built-in sets", "[currency_params]") {
    auto defaults = CurrencyParams::CreateDefault();
    auto regtest = CurrencyParams::CreateRegTest();

    REQUIRE(defaults->currency_name == "g1");
    REQUIRE(defaults->fork_window_size == 100);
    REQUIRE(regtest->currency_name == "regtest");
    REQUIRE(regtest->fork_window_size < defaults->fork_window_size);
    REQUIRE(regtest->cert_validity_blocks > 0);
    REQUIRE(regtest->fork_advance_blocks >= 1);
}

TEST_CASE("CurrencyParams - JSON merge keeps unspecified values", "[currency_params]") {
    auto params = CurrencyParams::CreateDefault();
    params->MergeJson(nlohmann::json{{"currency_name", "test"}, {"max_forks", 3}});

    REQUIRE(params->currency_name == "test");
    REQUIRE(params->max_forks == 3);
    REQUIRE(params->fork_window_size == 100);

    REQUIRE_THROWS(params->MergeJson(nlohmann::json{{"fork_window_size", "ten"}}));
}

TEST_CASE("CurrencyParams - file round trip", "[currency_params]") {
    auto test_dir = std::filesystem::temp_directory_path() / "trustledger_params_test";
    std::filesystem::remove_all(test_dir);
    std::filesystem::create_directories(test_dir);
    const auto file = test_dir / "currency_params.json";

    SECTION("Saved parameters load back") {
        auto params = CurrencyParams::CreateRegTest();
        params->fork_advance_time = 300;
        REQUIRE(params->SaveToFile(file));

        auto loaded = CurrencyParams::LoadFromFile(file);
        REQUIRE(loaded != nullptr);
        REQUIRE(loaded->ToJson() == params->ToJson());
    }

    SECTION("Missing file") {
        REQUIRE(CurrencyParams::LoadFromFile(test_dir / "absent.json") == nullptr);
    }

    SECTION("Malformed file") {
        REQUIRE(trustledger::util::atomic_write_file(file, std::string("{not json")));
        REQUIRE(CurrencyParams::LoadFromFile(file) == nullptr);
    }

    SECTION("Zero fork window refused") {
        REQUIRE(trustledger::util::atomic_write_file(file, std::string(R"({"fork_window_size": 0})")));
        REQUIRE(CurrencyParams::LoadFromFile(file) == nullptr);
    }

    std::filesystem::remove_all(test_dir);
}
