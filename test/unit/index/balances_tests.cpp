// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license
// Tests for unspent outputs, balances and dividends

#include <catch2/catch_test_macros.hpp>

#include "chain/block_repository.hpp"
#include "chain/validation.hpp"
#include "common/test_chain_builder.hpp"
#include "index/balances.hpp"
#include "index/identities.hpp"

#include <nlohmann/json.hpp>

#include <limits>

using namespace trustledger;
using namespace trustledger::index;
using namespace trustledger::test;
using trustledger::validation::StoreError;
using trustledger::validation::ValidationState;

namespace {

struct BalancesFixture {
    std::unique_ptr<chain::CurrencyParams> params{chain::CurrencyParams::CreateRegTest()};
    chain::BlockRepository repo;
    IdentityIndex identities;
    BalancesIndex balances;
    ChainBuilder builder{*params};

    IndexContext Context() const { return IndexContext{*params, repo, identities}; }

    // Identities go first so dividends see the block's membership changes
    void Apply(const Block& block) {
        ValidationState state;
        REQUIRE(identities.Apply(block, Context(), state));
        REQUIRE(balances.Apply(block, Context(), state));
    }

    void Revert(const Block& block) {
        ValidationState state;
        REQUIRE(balances.Revert(block, Context(), state));
        REQUIRE(identities.Revert(block, Context(), state));
    }
};

}  // namespace

TEST_CASE("BalancesIndex - dividends and transfers", "[index][balances]") {
    BalancesFixture f;
    const ConditionGroup cond_a = SingleSigCondition("A");
    const ConditionGroup cond_b = SingleSigCondition("B");

    const Block genesis = f.builder.Genesis({"A", "B"});
    f.Apply(genesis);
    REQUIRE(f.balances.GetUtxoCount() == 0);
    REQUIRE_FALSE(f.balances.GetBalance(cond_a).has_value());

    Block b1 = f.builder.Next(genesis);
    b1.dividend = 100;
    f.Apply(b1);

    REQUIRE(f.balances.GetUtxoCount() == 2);
    REQUIRE(f.balances.GetBalance(cond_a)->amount == 100);
    REQUIRE(f.balances.GetUtxo(UtxoId::Dividend("B", 1))->conditions == cond_b);
    REQUIRE(f.balances.GetDividendsOf("A") == std::set<BlockHeight>{1});
    REQUIRE(f.balances.GetTotalBalances() == 200);

    Block b2 = f.builder.Next(b1);
    b2.transactions.push_back(
        MakeTransaction(1, {UtxoId::Dividend("A", 1)}, {TxOutput{60, cond_b}, TxOutput{40, cond_a}}));
    const nlohmann::json before = f.balances.ToJson();
    f.Apply(b2);

    REQUIRE(f.balances.GetUtxo(UtxoId::Dividend("A", 1)) == nullptr);
    REQUIRE(f.balances.HasConsumedRecord(2));
    REQUIRE(f.balances.GetBalance(cond_b)->amount == 160);
    REQUIRE(f.balances.GetBalance(cond_b)->utxos.size() == 2);
    REQUIRE(f.balances.GetBalance(cond_a)->amount == 40);
    REQUIRE(f.balances.GetTotalBalances() == f.balances.GetTotalUtxoAmount());
    REQUIRE(f.balances.GetTotalBalances() == 200);

    SECTION("Revert restores the spent output") {
        f.Revert(b2);
        REQUIRE(f.balances.ToJson() == before);
        REQUIRE(f.balances.GetBalance(cond_a)->amount == 100);
        REQUIRE_FALSE(f.balances.HasConsumedRecord(2));
    }

    SECTION("Emptied condition group disappears") {
        Block b3 = f.builder.Next(b2);
        const Hash tx_hash = b2.transactions[0].hash;
        b3.transactions.push_back(MakeTransaction(2, {UtxoId::Transaction(tx_hash, 1)}, {TxOutput{40, cond_b}}));
        f.Apply(b3);
        REQUIRE_FALSE(f.balances.GetBalance(cond_a).has_value());
        REQUIRE(f.balances.GetBalance(cond_b)->amount == 200);

        f.Revert(b3);
        REQUIRE(f.balances.GetBalance(cond_a)->amount == 40);
    }

    SECTION("Dividend reverted with its block") {
        f.Revert(b2);
        f.Revert(b1);
        REQUIRE(f.balances.GetUtxoCount() == 0);
        REQUIRE(f.balances.GetDividendsOf("A").empty());
        REQUIRE(f.balances.GetTotalBalances() == 0);
    }

    SECTION("Consumed records pruned below the cutoff") {
        REQUIRE(f.balances.PruneConsumedBelow(3) == 1);
        REQUIRE_FALSE(f.balances.HasConsumedRecord(2));
    }
}

TEST_CASE("BalancesIndex - dividend goes to current members only", "[index][balances]") {
    BalancesFixture f;
    const Block genesis = f.builder.Genesis({"A", "B"});
    f.Apply(genesis);

    Block b1 = f.builder.Next(genesis);
    b1.excluded.push_back("B");
    b1.dividend = 10;
    f.Apply(b1);

    REQUIRE(f.balances.GetDividendsOf("A") == std::set<BlockHeight>{1});
    REQUIRE(f.balances.GetDividendsOf("B").empty());
    REQUIRE(f.balances.GetTotalUtxoAmount() == 10);
}

TEST_CASE("BalancesIndex - refused transactions", "[index][balances]") {
    BalancesFixture f;
    const ConditionGroup cond_a = SingleSigCondition("A");

    const Block genesis = f.builder.Genesis({"A"});
    Block b1 = f.builder.Next(genesis);
    b1.dividend = 50;
    f.Apply(genesis);
    f.Apply(b1);

    Block block = f.builder.Next(b1);
    const UtxoId dividend = UtxoId::Dividend("A", 1);

    SECTION("Unknown input") {
        block.transactions.push_back(MakeTransaction(1, {UtxoId::Dividend("A", 7)}, {TxOutput{50, cond_a}}));
    }

    SECTION("Zero output") {
        block.transactions.push_back(MakeTransaction(1, {dividend}, {TxOutput{50, cond_a}, TxOutput{0, cond_a}}));
    }

    SECTION("Inputs and outputs differ") {
        block.transactions.push_back(MakeTransaction(1, {dividend}, {TxOutput{51, cond_a}}));
    }

    SECTION("Outputs wrapping around to the input total") {
        constexpr int64_t max = std::numeric_limits<int64_t>::max();
        block.transactions.push_back(MakeTransaction(
            1, {dividend}, {TxOutput{max, SingleSigCondition("X")}, TxOutput{max, SingleSigCondition("Y")},
                            TxOutput{52, cond_a}}));
    }

    SECTION("Same output spent twice in one block") {
        block.transactions.push_back(MakeTransaction(1, {dividend}, {TxOutput{50, cond_a}}));
        block.transactions.push_back(MakeTransaction(2, {dividend}, {TxOutput{50, cond_a}}));
    }

    ValidationState state;
    REQUIRE_FALSE(f.balances.Apply(block, f.Context(), state));
    REQUIRE(state.GetStoreError() == StoreError::WRITE_ABORT);
    REQUIRE_FALSE(state.IsFatal());
}

TEST_CASE("BalancesIndex - balance overflow refused", "[index][balances]") {
    BalancesFixture f;
    const ConditionGroup cond_a = SingleSigCondition("A");

    const Block genesis = f.builder.Genesis({"A"});
    Block b1 = f.builder.Next(genesis);
    b1.dividend = std::numeric_limits<int64_t>::max();
    f.Apply(genesis);
    f.Apply(b1);
    const nlohmann::json before = f.balances.ToJson();

    Block b2 = f.builder.Next(b1);
    b2.dividend = 1;
    ValidationState state;
    REQUIRE(f.identities.Apply(b2, f.Context(), state));
    REQUIRE_FALSE(f.balances.Apply(b2, f.Context(), state));
    REQUIRE(state.GetStoreError() == StoreError::WRITE_ABORT);

    // Refused credit leaves no output behind
    REQUIRE(f.balances.GetUtxo(UtxoId::Dividend("A", 2)) == nullptr);
    REQUIRE(f.balances.GetBalance(cond_a)->amount == std::numeric_limits<int64_t>::max());
    REQUIRE(f.balances.GetBalance(cond_a)->utxos.size() == 1);
    REQUIRE(f.balances.GetTotalUtxoAmount() == std::numeric_limits<int64_t>::max());
}

TEST_CASE("BalancesIndex - revert out of order is corruption", "[index][balances]") {
    BalancesFixture f;
    const ConditionGroup cond_a = SingleSigCondition("A");

    const Block genesis = f.builder.Genesis({"A"});
    Block b1 = f.builder.Next(genesis);
    b1.dividend = 50;
    Block b2 = f.builder.Next(b1);
    b2.transactions.push_back(MakeTransaction(1, {UtxoId::Dividend("A", 1)}, {TxOutput{50, cond_a}}));
    Block b3 = f.builder.Next(b2);
    b3.transactions.push_back(
        MakeTransaction(2, {UtxoId::Transaction(b2.transactions[0].hash, 0)}, {TxOutput{50, cond_a}}));
    for (const Block* block : {&genesis, &b1, &b2, &b3}) {
        f.Apply(*block);
    }

    // b2's output was spent by b3
    ValidationState state;
    REQUIRE_FALSE(f.balances.Revert(b2, f.Context(), state));
    REQUIRE(state.GetStoreError() == StoreError::CORRUPTION);
}

TEST_CASE("BalancesIndex - JSON round trip", "[index][balances]") {
    BalancesFixture f;
    const Block genesis = f.builder.Genesis({"A", "B"});
    Block b1 = f.builder.Next(genesis);
    b1.dividend = 30;
    Block b2 = f.builder.Next(b1);
    b2.transactions.push_back(
        MakeTransaction(1, {UtxoId::Dividend("B", 1)}, {TxOutput{30, SingleSigCondition("A")}}));
    f.Apply(genesis);
    f.Apply(b1);
    f.Apply(b2);

    const BalancesIndex restored = BalancesIndex::FromJson(f.balances.ToJson());
    REQUIRE(restored.ToJson() == f.balances.ToJson());
    REQUIRE(restored.GetBalance(SingleSigCondition("A")) == f.balances.GetBalance(SingleSigCondition("A")));
    REQUIRE_FALSE(restored.GetBalance(SingleSigCondition("B")).has_value());
    REQUIRE(restored.HasConsumedRecord(2));

    nlohmann::json broken = f.balances.ToJson();
    broken["utxos"][0]["amount"] = 0;
    REQUIRE_THROWS(BalancesIndex::FromJson(broken));
}
