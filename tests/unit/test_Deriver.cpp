#include <gtest/gtest.h>
#include "sync/Deriver.hpp"
#include "util/errors.hpp"
#include "fakes.hpp"

using namespace sb;
using namespace sb::sync;
using namespace sb::test;

namespace {
constexpr types::UserId U = 100;
constexpr types::UserId V = 200;

DeriveOptions opts() { return {U, 200, 200}; }
}

TEST(DeriverTest, PayerGetsPositiveCandidate) {
    const auto e = expense("501", "Dinner at restaurant", "25.00", "2024-01-15",
                           {participant(U, "25.00", "12.50"), participant(V, "0.00", "12.50", "Jane", "Smith")});
    const auto item = derive(e, opts());

    ASSERT_EQ(item.kind, Derivation::Candidate);
    ASSERT_TRUE(item.transaction.has_value());
    const auto& t = *item.transaction;
    EXPECT_EQ(t.amount, 12'500);
    EXPECT_EQ(t.payee, "Dinner at restaurant");
    EXPECT_EQ(t.import_id, "splitwise_501");
    EXPECT_EQ(t.date, types::Date(2024, 1, 15));
    EXPECT_EQ(t.cleared, types::ClearedState::Uncleared);
    EXPECT_EQ(t.source_id, "501");
    EXPECT_NE(t.memo.find("501"), std::string::npos);
}

TEST(DeriverTest, DebtorGetsNegativeCandidate) {
    const auto e = expense("502", "Groceries", "40.00", "2024-01-16",
                           {participant(U, "0.00", "20.00"), participant(V, "40.00", "20.00")});
    const auto item = derive(e, opts());
    ASSERT_EQ(item.kind, Derivation::Candidate);
    EXPECT_EQ(item.transaction->amount, -20'000);
}

TEST(DeriverTest, ZeroNetProducesNoCandidate) {
    const auto e = expense("503", "Settled", "10.00", "2024-01-17",
                           {participant(U, "5.00", "5.00"), participant(V, "5.00", "5.00")});
    const auto item = derive(e, opts());
    EXPECT_EQ(item.kind, Derivation::ZeroNet);
    EXPECT_FALSE(item.transaction.has_value());
}

TEST(DeriverTest, OutsiderProducesNoCandidate) {
    const auto e = expense("504", "Not mine", "10.00", "2024-01-17",
                           {participant(V, "10.00", "10.00")});
    const auto item = derive(e, opts());
    EXPECT_EQ(item.kind, Derivation::NotParticipant);
    EXPECT_FALSE(item.transaction.has_value());
}

TEST(DeriverTest, RejectsEmptyId) {
    const auto e = expense("", "No id", "10.00", "2024-01-17",
                           {participant(U, "10.00", "5.00"), participant(V, "0.00", "5.00")});
    EXPECT_THROW(derive(e, opts()), ValidationError);
}

TEST(DeriverTest, PayeeFallsBackAndIsCapped) {
    auto e = expense("505", "", "10.00", "2024-01-17",
                     {participant(U, "10.00", "5.00"), participant(V, "0.00", "5.00")});
    EXPECT_EQ(derive(e, opts()).transaction->payee, "Unknown Expense");

    e.description = std::string(300, 'p');
    const auto item = derive(e, {U, 200, 50});
    EXPECT_EQ(item.transaction->payee, std::string(50, 'p'));
}

TEST(DeriverTest, MemoRespectsConfiguredCap) {
    auto e = expense("506", "Trip", "10.00", "2024-01-17",
                     {participant(U, "10.00", "5.00"), participant(V, "0.00", "5.00", "Jane", "Smith")});
    e.notes = std::string(400, 'n');
    const auto item = derive(e, {U, 64, 200});
    EXPECT_LE(item.transaction->memo.size(), 64u);
    EXPECT_NE(item.transaction->memo.find("Splitwise ID: 506"), std::string::npos);
}

TEST(DeriverTest, DerivationNames) {
    EXPECT_EQ(to_string(Derivation::Candidate), "candidate");
    EXPECT_EQ(to_string(Derivation::NotParticipant), "not_participant");
    EXPECT_EQ(to_string(Derivation::ZeroNet), "zero_net");
}
