#include <gtest/gtest.h>
#include "consolidation/chain_resolver.hpp"

using namespace ACE;
using namespace ACE::Consolidation;

// Fixture building candidates by hand
// Fixture construisant des candidats à la main
class ChainResolverTest : public ::testing::Test {
protected:
    MergeCandidate candidate(EntityId source, EntityId target, double confidence) {
        MergeCandidate c;
        c.source_id = source;
        c.source_name = "entity " + std::to_string(source);
        c.target_id = target;
        c.target_name = "entity " + std::to_string(target);
        c.target_mentions = target * 10;
        c.confidence = confidence;
        c.method = ExactMatch{};
        return c;
    }

    ChainResolver resolver;
};

TEST_F(ChainResolverTest, ChainCollapsesToFinalTarget) {
    // X=1 -> Y=2 at 99, Y=2 -> Z=3 at 95
    auto result = resolver.resolve({candidate(1, 2, 99.0), candidate(2, 3, 95.0)});

    ASSERT_EQ(result.accepted.size(), 2u);
    EXPECT_TRUE(result.dropped.empty());
    EXPECT_EQ(result.redirects.at(1), 3);
    EXPECT_EQ(result.redirects.at(2), 3);
    for (const auto& accepted : result.accepted) {
        EXPECT_EQ(accepted.target_id, 3);
        EXPECT_EQ(accepted.target_name, "entity 3");
        EXPECT_EQ(accepted.target_mentions, 30);
    }
}

TEST_F(ChainResolverTest, ChainInReverseConfidenceOrder) {
    auto result = resolver.resolve({candidate(1, 2, 95.0), candidate(2, 3, 99.0)});

    ASSERT_EQ(result.accepted.size(), 2u);
    EXPECT_EQ(result.accepted[0].source_id, 2);
    EXPECT_EQ(result.redirects.at(1), 3);
    EXPECT_EQ(result.redirects.at(2), 3);
}

TEST_F(ChainResolverTest, MutualCandidatesKeepOne) {
    auto result = resolver.resolve({candidate(1, 2, 100.0), candidate(2, 1, 98.0)});

    ASSERT_EQ(result.accepted.size(), 1u);
    EXPECT_EQ(result.accepted[0].source_id, 1);
    EXPECT_EQ(result.accepted[0].target_id, 2);
    ASSERT_EQ(result.dropped.size(), 1u);
    EXPECT_EQ(result.dropped[0].reason, DropReason::CIRCULAR);
}

TEST_F(ChainResolverTest, SourceMergedOnlyOnce) {
    auto result = resolver.resolve({candidate(1, 2, 100.0), candidate(1, 3, 97.5)});

    ASSERT_EQ(result.accepted.size(), 1u);
    EXPECT_EQ(result.accepted[0].target_id, 2);
    ASSERT_EQ(result.dropped.size(), 1u);
    EXPECT_EQ(result.dropped[0].reason, DropReason::ALREADY_REDIRECTED);
    EXPECT_EQ(result.dropped[0].candidate.target_id, 3);
}

TEST_F(ChainResolverTest, NoTargetIsDeletedByTheSamePlan) {
    auto result = resolver.resolve({
        candidate(1, 2, 100.0),
        candidate(3, 1, 99.0),
        candidate(2, 4, 98.0),
        candidate(5, 3, 97.5)
    });

    std::unordered_set<EntityId> sources;
    for (const auto& accepted : result.accepted) {
        sources.insert(accepted.source_id);
    }
    for (const auto& accepted : result.accepted) {
        EXPECT_EQ(sources.count(accepted.target_id), 0u) << accepted.source_id << " -> " << accepted.target_id;
        EXPECT_EQ(accepted.target_id, 4);
    }
    EXPECT_EQ(result.accepted.size(), 4u);
}

TEST_F(ChainResolverTest, EqualConfidenceKeepsInputOrder) {
    auto result = resolver.resolve({candidate(1, 2, 100.0), candidate(1, 3, 100.0)});

    ASSERT_EQ(result.accepted.size(), 1u);
    EXPECT_EQ(result.accepted[0].target_id, 2);
}

TEST_F(ChainResolverTest, EmptyPlan) {
    auto result = resolver.resolve({});
    EXPECT_TRUE(result.accepted.empty());
    EXPECT_TRUE(result.dropped.empty());
    EXPECT_TRUE(result.redirects.empty());
}

TEST_F(ChainResolverTest, DropReasonNames) {
    EXPECT_EQ(dropReasonToString(DropReason::ALREADY_REDIRECTED), "already_redirected");
    EXPECT_EQ(dropReasonToString(DropReason::CIRCULAR), "circular");
}

// Tests for the disjoint-set forest
// Tests pour la forêt d'ensembles disjoints
TEST(RedirectForestTest, FindCompressesPaths) {
    RedirectForest forest;
    EXPECT_EQ(forest.find(7), 7);
    forest.link(1, 2);
    forest.link(2, 3);
    forest.link(3, 4);
    EXPECT_EQ(forest.find(1), 4);
    EXPECT_TRUE(forest.isRedirected(1));
    EXPECT_FALSE(forest.isRedirected(4));
    EXPECT_EQ(forest.size(), 3u);
}
