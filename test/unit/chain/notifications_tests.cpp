// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license
// Tests for chain notifications

#include <catch2/catch_test_macros.hpp>

#include "chain/currency_params.hpp"
#include "chain/notifications.hpp"
#include "chain/write_coordinator.hpp"
#include "common/test_chain_builder.hpp"

#include <vector>

using namespace trustledger;
using namespace trustledger::test;
using trustledger::validation::SubmitStatus;
using trustledger::validation::ValidationState;
using trustledger::validation::WriteCoordinator;

TEST_CASE("Notifications - connected blocks and tip changes", "[notifications][chain]") {
    auto params = chain::CurrencyParams::CreateRegTest();
    WriteCoordinator wc(*params);
    ChainBuilder builder(*params);

    std::vector<BlockConnectedEvent> connected;
    std::vector<ChainTipEvent> tips;
    auto connected_sub =
        Notifications().SubscribeBlockConnected([&](const BlockConnectedEvent& event) { connected.push_back(event); });
    auto tip_sub = Notifications().SubscribeChainTip([&](const ChainTipEvent& event) { tips.push_back(event); });

    const Block genesis = builder.Genesis({"A"});
    Block b1 = builder.Next(genesis);
    b1.dividend = 5;

    ValidationState state;
    REQUIRE(wc.SubmitBlock(genesis, genesis.GetPreviousBlockstamp(), state).status == SubmitStatus::ACCEPTED);
    REQUIRE(wc.SubmitBlock(b1, b1.GetPreviousBlockstamp(), state).status == SubmitStatus::ACCEPTED);

    REQUIRE(connected.size() == 2);
    REQUIRE(connected[1].blockstamp == b1.GetBlockstamp());
    REQUIRE(connected[1].dividend == 5);
    REQUIRE(connected[1].median_time == b1.median_time);
    REQUIRE(tips.size() == 2);
    REQUIRE(tips.back().tip == b1.GetBlockstamp());
    REQUIRE_FALSE(tips.back().reorganized);

    SECTION("Rejected blocks notify nothing") {
        Block bad = builder.Next(b1);
        bad.previous_issuer = "nobody";
        ValidationState bad_state;
        REQUIRE(wc.SubmitBlock(bad, bad.GetPreviousBlockstamp(), bad_state).status == SubmitStatus::REJECTED);
        REQUIRE(connected.size() == 2);
        REQUIRE(tips.size() == 2);
    }

    SECTION("Revert notifies a disconnect") {
        std::vector<Blockstamp> disconnected;
        auto sub = Notifications().SubscribeBlockDisconnected(
            [&](const BlockDisconnectedEvent& event) { disconnected.push_back(event.blockstamp); });
        REQUIRE(wc.RevertTip(state));
        REQUIRE(disconnected == std::vector<Blockstamp>{b1.GetBlockstamp()});
        REQUIRE(tips.back().tip == genesis.GetBlockstamp());
    }
}

TEST_CASE("Notifications - callbacks run after the write is published", "[notifications][chain]") {
    auto params = chain::CurrencyParams::CreateRegTest();
    WriteCoordinator wc(*params);
    ChainBuilder builder(*params);

    const Block genesis = builder.Genesis({"A"});
    ValidationState state;
    REQUIRE(wc.SubmitBlock(genesis, genesis.GetPreviousBlockstamp(), state).status == SubmitStatus::ACCEPTED);

    bool saw_new_tip = false;
    auto sub = Notifications().SubscribeChainTip([&](const ChainTipEvent& event) {
        saw_new_tip = wc.GetTipBlockstamp() == event.tip;
    });

    const Block b1 = builder.Next(genesis);
    REQUIRE(wc.SubmitBlock(b1, b1.GetPreviousBlockstamp(), state).status == SubmitStatus::ACCEPTED);
    REQUIRE(saw_new_tip);
}

TEST_CASE("Notifications - Subscription RAII cleanup", "[notifications]") {
    int callback_count = 0;

    {
        auto sub = Notifications().SubscribeFatalError(
            [&](const std::string&, const std::string&) { callback_count++; });
        Notifications().NotifyFatalError("debug", "user");
        REQUIRE(callback_count == 1);
    }

    // Subscription destroyed: no more callbacks
    Notifications().NotifyFatalError("debug", "user");
    REQUIRE(callback_count == 1);

    SECTION("Moved subscription stays active") {
        ChainNotifications::Subscription outer;
        {
            auto inner = Notifications().SubscribeFatalError(
                [&](const std::string&, const std::string&) { callback_count++; });
            outer = std::move(inner);
        }
        Notifications().NotifyFatalError("debug", "user");
        REQUIRE(callback_count == 2);

        outer.Unsubscribe();
        Notifications().NotifyFatalError("debug", "user");
        REQUIRE(callback_count == 2);
    }
}

TEST_CASE("Notifications - multiple subscribers", "[notifications]") {
    int first = 0;
    int second = 0;
    auto sub1 = Notifications().SubscribeChainTip([&](const ChainTipEvent&) { first++; });
    auto sub2 = Notifications().SubscribeChainTip([&](const ChainTipEvent&) { second++; });

    Notifications().NotifyChainTip(ChainTipEvent{Blockstamp{1, MakeHash(0, 1)}, false});
    REQUIRE(first == 1);
    REQUIRE(second == 1);
}
