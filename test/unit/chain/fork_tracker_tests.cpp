// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license
// Tests for fork link bookkeeping and fork classification

#include <catch2/catch_test_macros.hpp>

#include "chain/block_repository.hpp"
#include "chain/fork_tracker.hpp"
#include "common/test_chain_builder.hpp"

#include <nlohmann/json.hpp>

using namespace trustledger;
using namespace trustledger::chain;
using namespace trustledger::test;

namespace {

// Main chain 0..n linked in fork 0
std::vector<Blockstamp> MakeMainChain(ForkTracker& tracker, BlockHeight tip_height) {
    std::vector<Blockstamp> main;
    for (BlockHeight h = 0; h <= tip_height; ++h) {
        main.push_back(Blockstamp{h, MakeHash(0, h)});
        if (h > 0) {
            tracker.RecordLink(MAIN_FORK, main[h - 1], main[h].hash);
        }
    }
    return main;
}

}  // namespace

TEST_CASE("ForkTracker - assigning blocks to forks", "[fork_tracker]") {
    ForkTracker tracker;
    auto main = MakeMainChain(tracker, 5);

    const Blockstamp f3{3, MakeHash(1, 3)};
    const Blockstamp f4{4, MakeHash(1, 4)};

    SECTION("First block opens fork 1, its child continues it") {
        REQUIRE(tracker.AssignForkToNewBlock(main[2], f3.hash, 10) == ForkId{1});
        REQUIRE(tracker.AssignForkToNewBlock(f3, f4.hash, 10) == ForkId{1});
        REQUIRE(tracker.GetForkCount() == 1);
        REQUIRE(tracker.GetForkHead(1) == f4);
        REQUIRE(tracker.ForkOfBlock(f4) == ForkId{1});
        REQUIRE(tracker.ForkContaining(main[2]) == ForkId{1});
    }

    SECTION("Sibling of a fork block opens a new fork") {
        REQUIRE(tracker.AssignForkToNewBlock(main[2], f3.hash, 10) == ForkId{1});
        REQUIRE(tracker.AssignForkToNewBlock(main[2], MakeHash(2, 3), 10) == ForkId{2});
        REQUIRE(tracker.GetForkCount() == 2);
    }

    SECTION("No slot left") {
        REQUIRE(tracker.AssignForkToNewBlock(main[2], f3.hash, 1) == ForkId{1});
        REQUIRE_FALSE(tracker.AssignForkToNewBlock(main[3], MakeHash(2, 4), 1).has_value());
    }

    SECTION("Freed ids are reused") {
        tracker.AssignForkToNewBlock(main[2], f3.hash, 10);
        REQUIRE(tracker.RemoveLink(1, main[2]));
        REQUIRE(tracker.GetLinks(1) == nullptr);
        REQUIRE(tracker.AssignForkToNewBlock(main[4], MakeHash(3, 5), 10) == ForkId{1});
    }

    SECTION("Emptied main linkage is erased") {
        ForkTracker single;
        single.RecordLink(MAIN_FORK, main[0], main[1].hash);
        REQUIRE(single.RemoveLink(MAIN_FORK, main[0]));
        REQUIRE(single == ForkTracker{});
    }
}

TEST_CASE("ForkTracker - fork status", "[fork_tracker]") {
    ForkTracker tracker;
    auto main = MakeMainChain(tracker, 20);
    const Blockstamp tip = main.back();
    const uint32_t window = 10;

    SECTION("Stackable on the tip") {
        tracker.AssignForkToNewBlock(tip, MakeHash(1, 21), 10);
        BlockHeight common = 0;
        REQUIRE(tracker.GetForkStatus(1, tip, window, &common) == ForkStatus::STACKABLE);
        REQUIRE(common == 20);
    }

    SECTION("Rollback within the window") {
        tracker.AssignForkToNewBlock(main[15], MakeHash(1, 16), 10);
        BlockHeight common = 0;
        REQUIRE(tracker.GetForkStatus(1, tip, window, &common) == ForkStatus::ROLLBACK);
        REQUIRE(common == 15);
    }

    SECTION("Too old below the window") {
        tracker.AssignForkToNewBlock(main[5], MakeHash(1, 6), 10);
        REQUIRE(tracker.GetForkStatus(1, tip, window) == ForkStatus::TOO_OLD);
    }

    SECTION("Isolated without a main chain root") {
        tracker.AssignForkToNewBlock(Blockstamp{15, MakeHash(5, 15)}, MakeHash(1, 16), 10);
        REQUIRE(tracker.GetForkStatus(1, tip, window) == ForkStatus::ISOLATE);
    }

    SECTION("Unknown fork is free") {
        REQUIRE(tracker.GetForkStatus(4, tip, window) == ForkStatus::FREE);
        REQUIRE(tracker.GetForkStatus(MAIN_FORK, tip, window) == ForkStatus::FREE);
    }

    SECTION("Fork list reports every fork") {
        tracker.AssignForkToNewBlock(main[15], MakeHash(1, 16), 10);
        tracker.AssignForkToNewBlock(tip, MakeHash(2, 21), 10);
        auto forks = tracker.GetForks(tip, window);
        REQUIRE(forks.size() == 2);
        REQUIRE(forks[0].status == ForkStatus::ROLLBACK);
        REQUIRE(forks[1].status == ForkStatus::STACKABLE);
        REQUIRE(forks[1].head == Blockstamp{21, MakeHash(2, 21)});
        REQUIRE(forks[1].length == 1);
    }
}

TEST_CASE("ForkTracker - stackable blocks come from fork storage", "[fork_tracker]") {
    auto params = CurrencyParams::CreateRegTest();
    ChainBuilder builder(*params);
    ChainBuilder fork_builder(*params, 1);
    BlockRepository repo;
    ForkTracker tracker;

    const Block genesis = builder.Genesis({"A"});
    const Block b1 = builder.Next(genesis);
    const Block x2 = fork_builder.Next(b1);
    const Block y2 = ChainBuilder(*params, 2).Next(b1);
    repo.PutMain(genesis);
    repo.PutMain(b1);
    repo.PutFork(x2);
    repo.PutFork(y2);
    tracker.AssignForkToNewBlock(b1.GetBlockstamp(), x2.hash, 10);
    tracker.AssignForkToNewBlock(b1.GetBlockstamp(), y2.hash, 10);

    auto stackable = tracker.StackableBlocks(b1.GetBlockstamp(), repo);
    REQUIRE(stackable.size() == 2);
    REQUIRE(tracker.StackableForks(b1.GetBlockstamp()).size() == 2);
    REQUIRE(tracker.StackableBlocks(genesis.GetBlockstamp(), repo).empty());
}

TEST_CASE("ForkTracker - pruning", "[fork_tracker]") {
    ForkTracker tracker;
    auto main = MakeMainChain(tracker, 30);

    tracker.AssignForkToNewBlock(main[5], MakeHash(1, 6), 10);
    const Blockstamp f6{6, MakeHash(1, 6)};
    tracker.AssignForkToNewBlock(f6, MakeHash(1, 7), 10);
    tracker.AssignForkToNewBlock(main[25], MakeHash(2, 26), 10);

    REQUIRE(tracker.HasForksOlderThan(10, 30));
    REQUIRE_FALSE(tracker.HasForksOlderThan(10, 17));
    REQUIRE(tracker.GetOldestMainLinkHeight() == 0u);
    REQUIRE_FALSE(ForkTracker{}.GetOldestMainLinkHeight().has_value());

    auto removed = tracker.PruneOlderThan(10, 30);
    REQUIRE_FALSE(tracker.HasForksOlderThan(10, 30));
    REQUIRE(removed.size() == 1);
    REQUIRE(removed.at(1).size() == 2);
    REQUIRE(tracker.GetLinks(1) == nullptr);
    REQUIRE(tracker.GetLinks(2) != nullptr);

    REQUIRE(tracker.PruneMainLinksBelow(20) == 20);
    REQUIRE(tracker.GetOldestMainLinkHeight() == 20u);
    REQUIRE(tracker.IsMainPosition(main[25], main.back()));
    REQUIRE_FALSE(tracker.IsMainPosition(main[10], main.back()));

    SECTION("JSON round trip") {
        REQUIRE(ForkTracker::FromJson(tracker.ToJson()) == tracker);
    }

    SECTION("Duplicate ids refused on load") {
        nlohmann::json j = tracker.ToJson();
        j.push_back(j.at(0));
        REQUIRE_THROWS(ForkTracker::FromJson(j));
    }
}
