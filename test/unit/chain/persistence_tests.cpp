// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license
// Tests for saving and loading the chain state

#include <catch2/catch_test_macros.hpp>

#include "chain/currency_params.hpp"
#include "chain/notifications.hpp"
#include "chain/write_coordinator.hpp"
#include "common/test_chain_builder.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>

using namespace trustledger;
using namespace trustledger::test;
using namespace trustledger::validation;
using chain::LoadResult;

namespace {

class TempDir {
public:
    explicit TempDir(const std::string& name) : path_(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() { std::filesystem::remove_all(path_); }

    std::string File(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

void SubmitAll(WriteCoordinator& wc, const std::vector<Block>& blocks) {
    for (const auto& block : blocks) {
        ValidationState state;
        INFO(block.GetBlockstamp().ToString());
        REQUIRE(wc.SubmitBlock(block, block.GetPreviousBlockstamp(), state).status == SubmitStatus::ACCEPTED);
    }
}

}  // namespace

TEST_CASE("Persistence - save and load", "[persistence]") {
    TempDir dir("trustledger_persistence_test");
    const std::string file = dir.File("chainstate.json");

    auto params = chain::CurrencyParams::CreateRegTest();
    ChainBuilder builder(*params);
    ChainBuilder fork_builder(*params, 1);

    const Block genesis = builder.Genesis({"A", "B"});
    auto main_blocks = builder.Extend(genesis, 3);
    main_blocks[0].dividend = 40;
    main_blocks[1].certifications.push_back(CertificationDoc{"A", "B", 1});
    const Block f2 = fork_builder.Next(main_blocks[0]);

    WriteCoordinator wc(*params);
    SubmitAll(wc, {genesis, main_blocks[0], main_blocks[1], main_blocks[2], f2});
    const std::string before = wc.GetSnapshot().State().ToJson().dump();

    SECTION("Missing file") {
        WriteCoordinator fresh(*params);
        REQUIRE(fresh.Load(dir.File("absent.json")) == LoadResult::FILE_NOT_FOUND);
        REQUIRE_FALSE(fresh.GetTipBlockstamp().has_value());
    }

    REQUIRE(wc.Save(file));

    SECTION("Round trip restores every store and index") {
        WriteCoordinator restored(*params);
        REQUIRE(restored.Load(file) == LoadResult::SUCCESS);
        REQUIRE(restored.GetSnapshot().State().ToJson().dump() == before);
        REQUIRE(restored.GetForks().size() == 1);

        // Restored writer keeps going
        const Block b4 = builder.Next(main_blocks[2]);
        SubmitAll(restored, {b4});
        REQUIRE(restored.GetTipBlockstamp() == b4.GetBlockstamp());

        ValidationState state;
        REQUIRE(restored.RevertTip(state));
        REQUIRE(restored.GetSnapshot().State().ToJson().dump() == before);
    }

    SECTION("Garbage is reported as corrupted") {
        REQUIRE(util::atomic_write_file(file, std::string("{\"current_meta\":")));
        WriteCoordinator restored(*params);
        REQUIRE(restored.Load(file) == LoadResult::CORRUPTED);
        REQUIRE_FALSE(restored.GetTipBlockstamp().has_value());
    }

    auto edit = [&](const std::function<void(nlohmann::json&)>& change) {
        nlohmann::json j = nlohmann::json::parse(*util::read_file_string(file));
        change(j);
        REQUIRE(util::atomic_write_file(file, j.dump()));
    };

    SECTION("Unknown schema version") {
        edit([](nlohmann::json& j) { j["current_meta"]["db_version"] = index::CHAINSTATE_DB_VERSION + 1; });
        WriteCoordinator restored(*params);
        REQUIRE(restored.Load(file) == LoadResult::CORRUPTED);
    }

    SECTION("Monetary mass out of step with outputs") {
        edit([](nlohmann::json& j) { j["current_meta"]["monetary_mass"] = 1; });
        WriteCoordinator restored(*params);
        REQUIRE(restored.Load(file) == LoadResult::CORRUPTED);
    }

    SECTION("Current blockstamp not at the main tip") {
        edit([&](nlohmann::json& j) { j["current_meta"]["current"] = main_blocks[1].GetBlockstamp().ToString(); });
        WriteCoordinator restored(*params);
        REQUIRE(restored.Load(file) == LoadResult::CORRUPTED);
    }
}

TEST_CASE("Persistence - index corruption halts the writer", "[persistence][fatal]") {
    TempDir dir("trustledger_corruption_test");
    const std::string file = dir.File("chainstate.json");

    auto params = chain::CurrencyParams::CreateRegTest();
    ChainBuilder builder(*params);

    const Block genesis = builder.Genesis({"A"});
    Block b1 = builder.Next(genesis);
    b1.identities.push_back(IdentityDoc{"C", "uid_C", genesis.GetBlockstamp()});
    b1.joiners.push_back(MembershipDoc{"C", genesis.GetBlockstamp()});

    {
        WriteCoordinator wc(*params);
        SubmitAll(wc, {genesis, b1});
        REQUIRE(wc.Save(file));
    }

    // The identity created by b1 vanishes from the saved index
    nlohmann::json j = nlohmann::json::parse(*util::read_file_string(file));
    j["identities"].erase("C");
    REQUIRE(util::atomic_write_file(file, j.dump()));

    WriteCoordinator wc(*params);
    REQUIRE(wc.Load(file) == LoadResult::SUCCESS);

    std::string fatal_message;
    auto sub = Notifications().SubscribeFatalError(
        [&](const std::string& debug_message, const std::string&) { fatal_message = debug_message; });

    ValidationState state;
    REQUIRE_FALSE(wc.RevertTip(state));
    REQUIRE(state.GetStoreError() == StoreError::CORRUPTION);
    REQUIRE(state.IsFatal());
    REQUIRE_FALSE(fatal_message.empty());
    REQUIRE(wc.GetTipBlockstamp() == b1.GetBlockstamp());

    // Every later write fails the same way
    ValidationState later;
    const Block b2 = builder.Next(b1);
    REQUIRE(wc.SubmitBlock(b2, b2.GetPreviousBlockstamp(), later).status == SubmitStatus::FAILED);
    REQUIRE(later.GetStoreError() == StoreError::CORRUPTION);

    SECTION("Reset clears the halt") {
        wc.Reset();
        ValidationState fresh;
        REQUIRE(wc.SubmitBlock(genesis, genesis.GetPreviousBlockstamp(), fresh).status == SubmitStatus::ACCEPTED);
    }
}
