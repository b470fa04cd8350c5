#include <gtest/gtest.h>
#include "ledger/SplitwiseClient.hpp"
#include "fakes.hpp"

#include <algorithm>
#include <memory>

using namespace sb;
using namespace sb::ledger;
using namespace sb::types;
using namespace sb::test;
using nlohmann::json;

namespace {

json rawExpense(const std::string& id, const std::string& date, const std::string& cost = "10.00") {
    return {
        {"id", std::stoll(id)},
        {"description", "Expense " + id},
        {"details", nullptr},
        {"cost", cost},
        {"currency_code", "USD"},
        {"date", date + "T12:00:00Z"},
        {"deleted_at", nullptr},
        {"users", json::array({
            {{"user_id", 1}, {"paid_share", cost}, {"owed_share", "5.00"},
             {"user", {{"first_name", "Alex"}, {"last_name", "Doe"}}}},
            {{"user_id", 2}, {"paid_share", "0.00"}, {"owed_share", "5.00"},
             {"user", {{"first_name", "Jane"}, {"last_name", nullptr}}}}
        })}
    };
}

std::string queryValue(const std::string& url, const std::string& key) {
    const auto pos = url.find(key + "=");
    if (pos == std::string::npos) return "";
    const auto start = pos + key.size() + 1;
    return url.substr(start, url.find('&', start) - start);
}

config::SourceConfig sourceConfig(const unsigned int pageSize = 2) {
    config::SourceConfig cfg;
    cfg.base_url = "https://splitwise.test/api/v3.0/";
    cfg.api_key = "sw-key";
    cfg.page_size = pageSize;
    return cfg;
}

}

TEST(SplitwiseClientTest, PaginatesUntilAShortPage) {
    const std::vector<json> pages = {
        json::array({rawExpense("1", "2024-01-02"), rawExpense("2", "2024-01-03")}),
        json::array({rawExpense("3", "2024-01-04"), rawExpense("4", "2024-01-05")}),
        json::array({rawExpense("5", "2024-01-06")})
    };
    size_t page = 0;
    auto transport = std::make_shared<FakeTransport>([&](const http::Request&) {
        return jsonResponse(200, {{"expenses", pages.at(page++)}});
    });

    SplitwiseClient client(sourceConfig(), transport);
    const auto feed = client.fetchExpenses(Date(2024, 1, 1));

    ASSERT_EQ(feed.expenses.size(), 5u);
    EXPECT_TRUE(feed.rejected.empty());
    ASSERT_EQ(transport->requests.size(), 3u);

    const auto& first = transport->requests[0];
    EXPECT_EQ(first.method, http::Method::Get);
    EXPECT_EQ(first.url.rfind("https://splitwise.test/api/v3.0/get_expenses?", 0), 0u);
    EXPECT_EQ(queryValue(first.url, "dated_after"), "2023-12-31");
    EXPECT_EQ(queryValue(first.url, "limit"), "2");
    EXPECT_EQ(queryValue(first.url, "offset"), "0");
    EXPECT_EQ(queryValue(transport->requests[2].url, "offset"), "4");
    EXPECT_NE(std::find(first.headers.begin(), first.headers.end(), "Authorization: Bearer sw-key"),
              first.headers.end());
}

TEST(SplitwiseClientTest, StopsOnAnEmptyPage) {
    size_t calls = 0;
    auto transport = std::make_shared<FakeTransport>([&](const http::Request&) {
        ++calls;
        if (calls == 1) return jsonResponse(200, {{"expenses", json::array({rawExpense("1", "2024-01-02"),
                                                                            rawExpense("2", "2024-01-02")})}});
        return jsonResponse(200, {{"expenses", json::array()}});
    });

    SplitwiseClient client(sourceConfig(), transport);
    EXPECT_EQ(client.fetchExpenses(Date(2024, 1, 1)).expenses.size(), 2u);
    EXPECT_EQ(calls, 2u);
}

TEST(SplitwiseClientTest, StartDateIsInclusive) {
    auto transport = std::make_shared<FakeTransport>([](const http::Request&) {
        return jsonResponse(200, {{"expenses", json::array({rawExpense("1", "2023-12-31"),
                                                            rawExpense("2", "2024-01-01")})}});
    });

    SplitwiseClient client(sourceConfig(100), transport);
    const auto feed = client.fetchExpenses(Date(2024, 1, 1));
    ASSERT_EQ(feed.expenses.size(), 1u);
    EXPECT_EQ(feed.expenses[0].id, "2");
}

TEST(SplitwiseClientTest, MalformedExpenseIsRejectedNotFatal) {
    auto bad = rawExpense("7", "2024-01-03");
    bad.erase("cost");
    auto transport = std::make_shared<FakeTransport>([&](const http::Request&) {
        return jsonResponse(200, {{"expenses", json::array({bad, rawExpense("8", "2024-01-03", "4.00")})}});
    });

    SplitwiseClient client(sourceConfig(100), transport);
    const auto feed = client.fetchExpenses(Date(2024, 1, 1));
    ASSERT_EQ(feed.expenses.size(), 1u);
    ASSERT_EQ(feed.rejected.size(), 1u);
    EXPECT_EQ(feed.rejected[0].source_id, "7");
    EXPECT_NE(feed.rejected[0].reason.find("cost"), std::string::npos);
    EXPECT_EQ(feed.size(), 2u);
}

TEST(SplitwiseClientTest, ErrorsMemberIsATransportFailure) {
    auto transport = std::make_shared<FakeTransport>([](const http::Request&) {
        return jsonResponse(200, {{"errors", {{"base", json::array({"Invalid API request"})}}}});
    });

    SplitwiseClient client(sourceConfig(), transport);
    EXPECT_THROW(client.fetchExpenses(Date(2024, 1, 1)), TransportError);
}

TEST(SplitwiseClientTest, HttpFailureCarriesStatus) {
    auto transport = std::make_shared<FakeTransport>([](const http::Request&) {
        return jsonResponse(401, {{"error", "Invalid API key"}});
    });

    SplitwiseClient client(sourceConfig(), transport);
    try {
        client.currentUser();
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.httpStatus(), 401);
        EXPECT_EQ(e.details(), "Invalid API key");
    }
}

TEST(SplitwiseClientTest, NetworkFailureIsATransportError) {
    auto transport = std::make_shared<FakeTransport>([](const http::Request&) { return networkFailure(); });
    SplitwiseClient client(sourceConfig(), transport);
    EXPECT_THROW(client.fetchExpenses(Date(2024, 1, 1)), TransportError);
}

TEST(SplitwiseClientTest, CurrentUser) {
    auto transport = std::make_shared<FakeTransport>([](const http::Request& req) {
        EXPECT_NE(req.url.find("/get_current_user"), std::string::npos);
        return jsonResponse(200, {{"user", {{"id", 42}, {"first_name", "Alex"}, {"last_name", "Doe"},
                                            {"email", "alex@example.com"}}}});
    });

    SplitwiseClient client(sourceConfig(), transport);
    const auto user = client.currentUser();
    EXPECT_EQ(user.id, 42);
    EXPECT_EQ(user.displayName(), "Alex Doe");
    EXPECT_EQ(user.email, "alex@example.com");
}

TEST(SplitwiseClientTest, CurrentUserWithoutUserObjectFails) {
    auto transport = std::make_shared<FakeTransport>([](const http::Request&) {
        return jsonResponse(200, json::object());
    });
    SplitwiseClient client(sourceConfig(), transport);
    EXPECT_THROW(client.currentUser(), TransportError);
}

TEST(SplitwiseParseTest, ReadsTypedExpense) {
    auto raw = rawExpense("501", "2024-01-15", "25.00");
    raw["details"] = "split evenly";
    raw["currency_code"] = "EUR";

    const auto e = splitwise::parseExpense(raw);
    EXPECT_EQ(e.id, "501");
    EXPECT_EQ(e.description, "Expense 501");
    EXPECT_EQ(e.notes, "split evenly");
    EXPECT_EQ(e.currency_code, "EUR");
    EXPECT_EQ(e.cost, 25'000'000);
    EXPECT_EQ(e.date, Date(2024, 1, 15));
    EXPECT_FALSE(e.deleted);
    ASSERT_EQ(e.participants.size(), 2u);
    EXPECT_EQ(e.participants[0].paid, 25'000'000);
    EXPECT_EQ(e.participants[0].owed, 5'000'000);
    EXPECT_EQ(e.participants[0].first_name, "Alex");
    EXPECT_EQ(e.participants[1].last_name, "");
}

TEST(SplitwiseParseTest, AcceptsStringIdsAndNumericAmounts) {
    auto raw = rawExpense("9", "2024-01-15");
    raw["id"] = "9";
    raw["cost"] = 12.5;
    raw["users"][0]["paid_share"] = 12.5;
    raw["users"][1]["owed_share"] = nullptr;

    const auto e = splitwise::parseExpense(raw);
    EXPECT_EQ(e.id, "9");
    EXPECT_EQ(e.cost, 12'500'000);
    EXPECT_EQ(e.participants[0].paid, 12'500'000);
    EXPECT_EQ(e.participants[1].owed, 0);
}

TEST(SplitwiseParseTest, DefaultsAndDeletion) {
    auto raw = rawExpense("10", "2024-01-15");
    raw["description"] = nullptr;
    raw.erase("currency_code");
    raw["deleted_at"] = "2024-01-16T08:00:00Z";

    const auto e = splitwise::parseExpense(raw);
    EXPECT_EQ(e.description, "Unknown Expense");
    EXPECT_EQ(e.currency_code, "USD");
    EXPECT_TRUE(e.deleted);
}

TEST(SplitwiseParseTest, RefusesMalformedInput) {
    EXPECT_THROW(splitwise::parseExpense(json::array()), ValidationError);

    auto noId = rawExpense("1", "2024-01-15");
    noId.erase("id");
    EXPECT_THROW(splitwise::parseExpense(noId), ValidationError);

    auto badDate = rawExpense("1", "2024-01-15");
    badDate["date"] = "15/01/2024";
    EXPECT_THROW(splitwise::parseExpense(badDate), ValidationError);

    auto badCost = rawExpense("1", "2024-01-15");
    badCost["cost"] = "ten";
    EXPECT_THROW(splitwise::parseExpense(badCost), ValidationError);

    auto badUser = rawExpense("1", "2024-01-15");
    badUser["users"][0].erase("user_id");
    EXPECT_THROW(splitwise::parseExpense(badUser), ValidationError);
}
