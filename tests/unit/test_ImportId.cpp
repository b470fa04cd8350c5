#include <gtest/gtest.h>
#include "sync/ImportId.hpp"

#include <set>

using namespace sb::sync;

TEST(ImportIdTest, PrefixesTheSourceId) {
    EXPECT_EQ(makeImportId("501"), "splitwise_501");
    EXPECT_EQ(makeImportId("501"), makeImportId("501"));
}

TEST(ImportIdTest, DistinctIdsNeverCollide) {
    const std::vector<std::string> ids = {"1", "10", "100", "01", "501", "5010", "a", "A", "splitwise_1", " 1"};
    std::set<std::string> tokens;
    for (const auto& id : ids) tokens.insert(makeImportId(id));
    EXPECT_EQ(tokens.size(), ids.size());

    for (int i = 0; i < 2000; ++i) tokens.insert(makeImportId("n" + std::to_string(i)));
    EXPECT_EQ(tokens.size(), ids.size() + 2000);
}

TEST(ImportIdTest, RecoversTheSourceId) {
    for (const auto* id : {"501", "abc", "splitwise_7"}) {
        const auto back = sourceIdFromImportId(makeImportId(id));
        ASSERT_TRUE(back.has_value());
        EXPECT_EQ(*back, id);
    }
}

TEST(ImportIdTest, RecognisesOnlyOwnIds) {
    EXPECT_TRUE(isOwnImportId("splitwise_501"));
    EXPECT_FALSE(isOwnImportId("splitwise_"));
    EXPECT_FALSE(isOwnImportId(""));
    EXPECT_FALSE(isOwnImportId("YNAB:-20000:2024-01-15:1"));
    EXPECT_FALSE(isOwnImportId("Splitwise_501"));
}
