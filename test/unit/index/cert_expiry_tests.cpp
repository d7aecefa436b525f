// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license
// Tests for the trust graph and its expiry schedule

#include <catch2/catch_test_macros.hpp>

#include "chain/block_repository.hpp"
#include "chain/validation.hpp"
#include "common/test_chain_builder.hpp"
#include "index/cert_expiry.hpp"
#include "index/identities.hpp"

#include <nlohmann/json.hpp>

using namespace trustledger;
using namespace trustledger::index;
using namespace trustledger::test;
using trustledger::validation::StoreError;
using trustledger::validation::ValidationState;

namespace {

struct CertFixture {
    std::unique_ptr<chain::CurrencyParams> params{chain::CurrencyParams::CreateRegTest()};
    chain::BlockRepository repo;
    IdentityIndex identities;
    CertExpiryIndex certs;
    ChainBuilder builder{*params};

    IndexContext Context() const { return IndexContext{*params, repo, identities}; }

    void Apply(const Block& block) {
        ValidationState state;
        REQUIRE(certs.Apply(block, Context(), state));
    }

    void Revert(const Block& block) {
        ValidationState state;
        REQUIRE(certs.Revert(block, Context(), state));
    }
};

}  // namespace

TEST_CASE("CertExpiryIndex - certifications expire after the validity period", "[index][cert_expiry]") {
    CertFixture f;
    const uint32_t validity = f.params->cert_validity_blocks;

    Block tip = f.builder.Genesis({"A", "B", "C"});
    f.Apply(tip);

    Block b1 = f.builder.Next(tip);
    b1.certifications.push_back(CertificationDoc{"A", "B", 1});
    b1.certifications.push_back(CertificationDoc{"C", "B", 1});
    f.Apply(b1);
    tip = b1;

    REQUIRE(f.certs.HasEdge("A", "B"));
    REQUIRE(f.certs.GetCertifiersOf("B") == std::vector<PubKey>{"A", "C"});
    REQUIRE(f.certs.ExpiringAt(1 + validity) == std::vector<TrustEdge>{{"A", "B"}, {"C", "B"}});
    REQUIRE(f.certs.ExpiringAt(validity).empty());

    while (tip.height + 1 < 1 + validity) {
        tip = f.builder.Next(tip);
        f.Apply(tip);
    }
    REQUIRE(f.certs.GetEdgeCount() == 2);

    const Block expiring = f.builder.Next(tip);
    REQUIRE(expiring.height == 1 + validity);
    const nlohmann::json before = f.certs.ToJson();
    f.Apply(expiring);
    REQUIRE(f.certs.GetEdgeCount() == 0);
    REQUIRE_FALSE(f.certs.HasEdge("A", "B"));

    SECTION("Revert brings the edges back") {
        f.Revert(expiring);
        REQUIRE(f.certs.ToJson() == before);
        REQUIRE(f.certs.HasEdge("C", "B"));
    }

    SECTION("Buckets pruned once out of reach") {
        REQUIRE(f.certs.PruneBucketsBelow(expiring.height + 1) == 1);
        REQUIRE(f.certs.ExpiringAt(expiring.height).empty());
    }
}

TEST_CASE("CertExpiryIndex - repeated certification stacks", "[index][cert_expiry]") {
    CertFixture f;
    f.params->cert_validity_blocks = 2;

    const Block genesis = f.builder.Genesis({"A", "B"});
    f.Apply(genesis);

    Block b1 = f.builder.Next(genesis);
    b1.certifications.push_back(CertificationDoc{"A", "B", 1});
    f.Apply(b1);

    Block b2 = f.builder.Next(b1);
    b2.certifications.push_back(CertificationDoc{"A", "B", 2});
    f.Apply(b2);

    // First certification expires, the renewed one keeps the edge
    const Block b3 = f.builder.Next(b2);
    f.Apply(b3);
    REQUIRE(f.certs.HasEdge("A", "B"));

    const Block b4 = f.builder.Next(b3);
    f.Apply(b4);
    REQUIRE_FALSE(f.certs.HasEdge("A", "B"));

    f.Revert(b4);
    f.Revert(b3);
    f.Revert(b2);
    REQUIRE(f.certs.HasEdge("A", "B"));
    f.Revert(b1);
    REQUIRE(f.certs.GetEdgeCount() == 0);
    REQUIRE(f.certs.ExpiringAt(3).empty());
}

TEST_CASE("CertExpiryIndex - expiry follows the signing height", "[index][cert_expiry]") {
    CertFixture f;
    const uint32_t validity = f.params->cert_validity_blocks;

    const Block genesis = f.builder.Genesis({"A", "B", "C"});
    f.Apply(genesis);
    const auto chain = f.builder.Extend(genesis, 3);
    f.Apply(chain[0]);
    f.Apply(chain[1]);

    // Written at height 3, signed against height 1
    Block b3 = chain[2];
    REQUIRE(b3.height == 3);
    b3.certifications.push_back(CertificationDoc{"A", "B", 1});
    b3.certifications.push_back(CertificationDoc{"C", "B", 3});
    const nlohmann::json before = f.certs.ToJson();
    f.Apply(b3);

    REQUIRE(f.certs.ExpiringAt(1 + validity) == std::vector<TrustEdge>{{"A", "B"}});
    REQUIRE(f.certs.ExpiringAt(3 + validity) == std::vector<TrustEdge>{{"C", "B"}});

    SECTION("Revert finds each certification in its own bucket") {
        f.Revert(b3);
        REQUIRE(f.certs.ToJson() == before);
    }

    SECTION("Edge leaves the graph at signing height plus validity") {
        Block tip = b3;
        while (tip.height + 1 < 1 + validity) {
            tip = f.builder.Next(tip);
            f.Apply(tip);
        }
        REQUIRE(f.certs.HasEdge("A", "B"));
        tip = f.builder.Next(tip);
        f.Apply(tip);
        REQUIRE_FALSE(f.certs.HasEdge("A", "B"));
        REQUIRE(f.certs.HasEdge("C", "B"));
    }
}

TEST_CASE("CertExpiryIndex - certification not live at its block is refused", "[index][cert_expiry]") {
    CertFixture f;
    f.params->cert_validity_blocks = 2;

    const Block genesis = f.builder.Genesis({"A", "B"});
    f.Apply(genesis);
    const auto chain = f.builder.Extend(genesis, 2);
    f.Apply(chain[0]);
    const nlohmann::json before = f.certs.ToJson();

    Block b2 = chain[1];

    SECTION("Signed above the block height") {
        b2.certifications.push_back(CertificationDoc{"A", "B", 3});
    }

    SECTION("Already due at the block height") {
        b2.certifications.push_back(CertificationDoc{"A", "B", 0});
    }

    SECTION("Refused even after a live one") {
        b2.certifications.push_back(CertificationDoc{"B", "A", 2});
        b2.certifications.push_back(CertificationDoc{"A", "B", 0});
    }

    ValidationState state;
    REQUIRE_FALSE(f.certs.Apply(b2, f.Context(), state));
    REQUIRE(state.GetStoreError() == StoreError::WRITE_ABORT);
    REQUIRE(f.certs.ToJson() == before);
}

TEST_CASE("CertExpiryIndex - inconsistent revert is corruption", "[index][cert_expiry]") {
    CertFixture f;
    const Block genesis = f.builder.Genesis({"A", "B"});
    f.Apply(genesis);

    Block b1 = f.builder.Next(genesis);
    b1.certifications.push_back(CertificationDoc{"A", "B", 1});

    ValidationState state;
    REQUIRE_FALSE(f.certs.Revert(b1, f.Context(), state));
    REQUIRE(state.GetStoreError() == StoreError::CORRUPTION);
}

TEST_CASE("CertExpiryIndex - JSON round trip", "[index][cert_expiry]") {
    CertFixture f;
    const Block genesis = f.builder.Genesis({"A", "B"});
    Block b1 = f.builder.Next(genesis);
    b1.certifications.push_back(CertificationDoc{"A", "B", 1});
    b1.certifications.push_back(CertificationDoc{"B", "A", 0});
    f.Apply(genesis);
    f.Apply(b1);

    const CertExpiryIndex restored = CertExpiryIndex::FromJson(f.certs.ToJson());
    REQUIRE(restored.ToJson() == f.certs.ToJson());

    nlohmann::json broken = f.certs.ToJson();
    broken["edges"][0]["count"] = 0;
    REQUIRE_THROWS(CertExpiryIndex::FromJson(broken));
}
