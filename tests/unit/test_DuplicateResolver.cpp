#include <gtest/gtest.h>
#include "sync/DuplicateResolver.hpp"
#include "sync/ImportId.hpp"

using namespace sb::sync;
using namespace sb::types;

namespace {

CandidateTransaction candidate(const std::string& id, const sb::util::Milliunits amount,
                               const std::string& payee = "Dinner", const std::string& date = "2024-01-15") {
    CandidateTransaction t;
    t.import_id = makeImportId(id);
    t.source_id = id;
    t.amount = amount;
    t.payee = payee;
    t.date = Date::parse(date);
    return t;
}

ImportedRecord record(const std::string& importId, const sb::util::Milliunits amount,
                      const std::string& payee = "Dinner", const std::string& date = "2024-01-15") {
    return {importId, amount, payee, Date::parse(date)};
}

std::vector<std::string> ids(const std::vector<CandidateTransaction>& ts) {
    std::vector<std::string> out;
    for (const auto& t : ts) out.push_back(t.source_id);
    return out;
}

}

TEST(DuplicateResolverTest, EverythingImportableAgainstEmptySnapshot) {
    const auto res = DuplicateResolver::resolve({candidate("1", 100), candidate("2", 200)}, {});
    EXPECT_EQ(ids(res.importable), (std::vector<std::string>{"1", "2"}));
    EXPECT_TRUE(res.duplicates.empty());
    EXPECT_TRUE(res.ambiguous.empty());
}

TEST(DuplicateResolverTest, KnownImportIdIsDuplicate) {
    const auto res = DuplicateResolver::resolve({candidate("501", 12'500), candidate("502", -20'000)},
                                                {record("splitwise_501", 12'500)});
    EXPECT_EQ(ids(res.duplicates), (std::vector<std::string>{"501"}));
    EXPECT_EQ(ids(res.importable), (std::vector<std::string>{"502"}));
}

TEST(DuplicateResolverTest, ImportIdMatchWinsEvenWhenContentDiffers) {
    const auto res = DuplicateResolver::resolve({candidate("501", 99'000, "Renamed", "2024-03-01")},
                                                {record("splitwise_501", 12'500)});
    EXPECT_EQ(res.duplicates.size(), 1u);
    EXPECT_EQ(res.content_matches, 0u);
}

TEST(DuplicateResolverTest, ManualEntryMatchesOnContent) {
    const auto res = DuplicateResolver::resolve({candidate("7", -20'000, "Groceries", "2024-01-16")},
                                                {record("", -20'000, "Groceries", "2024-01-16")});
    EXPECT_EQ(ids(res.duplicates), (std::vector<std::string>{"7"}));
    EXPECT_EQ(res.content_matches, 1u);
    EXPECT_TRUE(res.importable.empty());
}

TEST(DuplicateResolverTest, ForeignImportIdsCountAsUntagged) {
    const auto res = DuplicateResolver::resolve({candidate("7", -20'000, "Groceries", "2024-01-16")},
                                                {record("YNAB:-20000:2024-01-16:1", -20'000, "Groceries", "2024-01-16")});
    EXPECT_EQ(res.duplicates.size(), 1u);
}

TEST(DuplicateResolverTest, ContentMatchRequiresAllThreeFields) {
    const std::vector<ImportedRecord> snapshot = {record("", -20'000, "Groceries", "2024-01-16")};
    const auto res = DuplicateResolver::resolve({
        candidate("1", -20'001, "Groceries", "2024-01-16"),
        candidate("2", -20'000, "groceries", "2024-01-16"),
        candidate("3", -20'000, "Groceries", "2024-01-17")
    }, snapshot);
    EXPECT_EQ(res.importable.size(), 3u);
    EXPECT_TRUE(res.duplicates.empty());
}

TEST(DuplicateResolverTest, OwnTaggedRecordsAreNotContentMatched) {
    // Same content as an earlier import of a different expense: only the id decides.
    const auto res = DuplicateResolver::resolve({candidate("2", 5'000, "Coffee")},
                                                {record("splitwise_1", 5'000, "Coffee")});
    EXPECT_EQ(ids(res.importable), (std::vector<std::string>{"2"}));
}

TEST(DuplicateResolverTest, RepeatedImportIdIsAmbiguous) {
    const auto res = DuplicateResolver::resolve({
        candidate("1", 100), candidate("2", 200), candidate("1", 300), candidate("1", 400)
    }, {});
    EXPECT_EQ(ids(res.importable), (std::vector<std::string>{"1", "2"}));
    EXPECT_EQ(res.ambiguous.size(), 2u);
    EXPECT_EQ(res.ambiguous[0].amount, 300);
    ASSERT_EQ(res.collisions.size(), 2u);
    EXPECT_EQ(res.collisions[0].import_id, "splitwise_1");
    EXPECT_EQ(res.collisions[0].first_position, 0u);
    EXPECT_EQ(res.collisions[0].position, 2u);
}

TEST(DuplicateResolverTest, GroupsAreDisjointAndOrderPreserving) {
    const std::vector<CandidateTransaction> candidates = {
        candidate("5", 500), candidate("4", 400, "Manual", "2024-01-20"), candidate("3", 300),
        candidate("2", 200), candidate("1", 100), candidate("3", 301)
    };
    const std::vector<ImportedRecord> snapshot = {
        record("splitwise_2", 200), record("", 400, "Manual", "2024-01-20"), record("splitwise_9", 1)
    };

    const auto res = DuplicateResolver::resolve(candidates, snapshot);
    EXPECT_EQ(ids(res.importable), (std::vector<std::string>{"5", "3", "1"}));
    EXPECT_EQ(ids(res.duplicates), (std::vector<std::string>{"4", "2"}));
    EXPECT_EQ(ids(res.ambiguous), (std::vector<std::string>{"3"}));
    EXPECT_EQ(res.importable.size() + res.duplicates.size() + res.ambiguous.size(), candidates.size());
}
