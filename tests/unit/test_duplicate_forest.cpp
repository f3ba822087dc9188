#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "dedup/duplicate_forest.hpp"

using namespace atlas;

class DuplicateForestTest : public ::testing::Test {
protected:
    static Claim claim(int64_t id, std::optional<int64_t> duplicate_of = std::nullopt) {
        Claim c;
        c.id = id;
        c.episode_id = "ep";
        c.text = "claim " + std::to_string(id);
        c.duplicate_of = duplicate_of;
        return c;
    }
};

// ==========================================
// Link Tests
// ==========================================

TEST_F(DuplicateForestTest, SelfLinkIsRejected) {
    DuplicateForest forest;
    EXPECT_THROW(forest.add_link(4, 4), DuplicateCycleError);
    EXPECT_EQ(forest.size(), 0u);
}

TEST_F(DuplicateForestTest, CycleIsRejected) {
    DuplicateForest forest;
    forest.add_link(1, 2);
    forest.add_link(2, 3);

    EXPECT_THROW(forest.add_link(3, 1), DuplicateCycleError);
    EXPECT_FALSE(forest.is_duplicate(3));
    EXPECT_EQ(forest.size(), 2u);
}

TEST_F(DuplicateForestTest, RepeatedLinkIsNoOp) {
    DuplicateForest forest;
    forest.add_link(5, 9);
    EXPECT_NO_THROW(forest.add_link(5, 9));
    EXPECT_EQ(forest.size(), 1u);
}

TEST_F(DuplicateForestTest, RelinkToAnotherClaimIsRejected) {
    DuplicateForest forest;
    forest.add_link(5, 9);
    EXPECT_THROW(forest.add_link(5, 7), std::invalid_argument);
    EXPECT_EQ(forest.parent(5).value(), 9);
}

// ==========================================
// Traversal Tests
// ==========================================

TEST_F(DuplicateForestTest, RootFollowsChain) {
    DuplicateForest forest;
    forest.add_link(1, 2);
    forest.add_link(2, 3);
    forest.add_link(4, 3);

    EXPECT_EQ(forest.root_of(1), 3);
    EXPECT_EQ(forest.root_of(4), 3);
    EXPECT_EQ(forest.root_of(3), 3);
    EXPECT_EQ(forest.root_of(99), 99);
    EXPECT_FALSE(forest.parent(3).has_value());
}

TEST_F(DuplicateForestTest, LinksAreSortedByDuplicate) {
    DuplicateForest forest;
    forest.add_link(8, 1);
    forest.add_link(3, 1);
    forest.add_link(5, 3);

    auto links = forest.links();
    ASSERT_EQ(links.size(), 3u);
    EXPECT_EQ(links[0], (DuplicateLink{3, 1}));
    EXPECT_EQ(links[1], (DuplicateLink{5, 3}));
    EXPECT_EQ(links[2], (DuplicateLink{8, 1}));
    EXPECT_EQ(links[0].to_json()["kept_id"], 1);
}

// ==========================================
// Loading Tests
// ==========================================

TEST_F(DuplicateForestTest, FromClaimsReadsExistingMarks) {
    auto forest = DuplicateForest::from_claims({claim(1), claim(2, 1), claim(3, 2)});
    EXPECT_EQ(forest.size(), 2u);
    EXPECT_EQ(forest.root_of(3), 1);
}

TEST_F(DuplicateForestTest, FromClaimsRejectsStoredCycle) {
    EXPECT_THROW(DuplicateForest::from_claims({claim(1, 2), claim(2, 1)}), DuplicateCycleError);
    EXPECT_THROW(DuplicateForest::from_claims({claim(7, 7)}), DuplicateCycleError);
}
