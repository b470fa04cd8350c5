#include <gtest/gtest.h>
#include "sync/MemoFormatter.hpp"
#include "sync/ShareCalculator.hpp"
#include "fakes.hpp"

using namespace sb;
using namespace sb::sync;
using namespace sb::test;

namespace {

constexpr types::UserId U = 100;
constexpr types::UserId V = 200;

types::RawExpense dinner(std::string notes = "") {
    auto e = expense("501", "Dinner", "25.00", "2024-01-15",
                     {participant(U, "25.00", "12.50", "Alex", "Doe"),
                      participant(V, "0.00", "12.50", "Jane", "Smith")});
    e.notes = std::move(notes);
    return e;
}

bool isValidUtf8(const std::string& s) {
    for (size_t i = 0; i < s.size();) {
        const auto c = static_cast<unsigned char>(s[i]);
        size_t len = 1;
        if (c >= 0xF0) len = 4;
        else if (c >= 0xE0) len = 3;
        else if (c >= 0xC0) len = 2;
        else if (c >= 0x80) return false;
        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k)
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return false;
        i += len;
    }
    return true;
}

}

TEST(MemoFormatterTest, ComposesAllSegments) {
    const auto e = dinner("Birthday dinner");
    EXPECT_EQ(formatMemo(e, computeShare(e, U), U),
              "Paid: $25.00, Owed: $12.50 | Users: Jane Smith | Notes: Birthday dinner | Splitwise ID: 501");
}

TEST(MemoFormatterTest, ExcludesTargetUserFromUsers) {
    const auto e = dinner();
    const auto memo = formatMemo(e, computeShare(e, U), U);
    EXPECT_EQ(memo.find("Alex"), std::string::npos);
    EXPECT_NE(memo.find("Users: Jane Smith"), std::string::npos);
}

TEST(MemoFormatterTest, OmitsEmptySegments) {
    auto e = dinner();
    e.participants[1].first_name.clear();
    e.participants[1].last_name.clear();
    EXPECT_EQ(formatMemo(e, computeShare(e, U), U), "Paid: $25.00, Owed: $12.50 | Splitwise ID: 501");
}

TEST(MemoFormatterTest, FoldsNotesOntoOneLine) {
    const auto e = dinner("  first line\r\nsecond line\nthird  ");
    const auto memo = formatMemo(e, computeShare(e, U), U);
    EXPECT_NE(memo.find("Notes: first line second line third | "), std::string::npos);
    EXPECT_EQ(memo.find('\n'), std::string::npos);
    EXPECT_EQ(memo.find('\r'), std::string::npos);
}

TEST(MemoFormatterTest, ShowsCurrencyCodeForNonDollarExpenses) {
    auto e = dinner();
    e.currency_code = "EUR";
    const auto memo = formatMemo(e, computeShare(e, U), U);
    EXPECT_EQ(memo.rfind("Paid: 25.00 EUR, Owed: 12.50 EUR", 0), 0u);
}

TEST(MemoFormatterTest, TruncationKeepsTheIdSegment) {
    const auto e = dinner(std::string(500, 'x'));
    const auto share = computeShare(e, U);

    for (size_t cap = 32; cap <= 250; ++cap) {
        const auto memo = formatMemo(e, share, U, cap);
        EXPECT_LE(memo.size(), cap);
        ASSERT_GE(memo.size(), std::string(" | Splitwise ID: 501").size());
        EXPECT_EQ(memo.substr(memo.size() - std::string(" | Splitwise ID: 501").size()), " | Splitwise ID: 501")
            << "cap " << cap;
    }
}

TEST(MemoFormatterTest, LeavesShortMemosUntouched) {
    const auto e = dinner("short");
    const auto full = formatMemo(e, computeShare(e, U), U, 1000);
    EXPECT_EQ(formatMemo(e, computeShare(e, U), U, full.size()), full);
    EXPECT_EQ(full.find("..."), std::string::npos);
}

TEST(MemoFormatterTest, TruncationNeverSplitsUtf8) {
    std::string notes;
    for (int i = 0; i < 150; ++i) notes += "\xC3\xA9";   // é
    const auto e = dinner(notes);
    const auto share = computeShare(e, U);

    for (size_t cap = 40; cap <= 120; ++cap) {
        const auto memo = formatMemo(e, share, U, cap);
        EXPECT_LE(memo.size(), cap);
        EXPECT_TRUE(isValidUtf8(memo)) << "cap " << cap;
    }
}

TEST(MemoFormatterTest, TruncateMemoHandlesTinyCaps) {
    EXPECT_EQ(truncateMemo("Paid: $1.00", "Splitwise ID: 123456789", 10), "Splitwise ");
    EXPECT_EQ(truncateMemo("", "Splitwise ID: 1", 200), "Splitwise ID: 1");
    EXPECT_EQ(truncateMemo("abcdefghij", "", 8), "abcde...");
}
