#include "ledger/SplitwiseClient.hpp"
#include "logging/LogRegistry.hpp"
#include "util/errors.hpp"

#include <nlohmann/json.hpp>

using namespace sb::ledger;
using namespace sb::types;
using namespace sb::logging;

namespace {

constexpr unsigned int kMaxPages = 10'000;
constexpr const char* kUnknownDescription = "Unknown Expense";

std::string optString(const nlohmann::json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

// ids and amounts arrive as strings or numbers depending on the endpoint
std::string scalarText(const nlohmann::json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) throw sb::ValidationError(std::string("missing field '") + key + "'");
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
    if (it->is_number()) return it->dump();
    throw sb::ValidationError(std::string("field '") + key + "' has unexpected type " + it->type_name());
}

sb::util::Micros amountField(const nlohmann::json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) return 0;
    return sb::util::parseDecimal(scalarText(j, key));
}

}

namespace sb::ledger::splitwise {

SourceUser parseUser(const nlohmann::json& j) {
    try {
        SourceUser user;
        user.id = j.at("id").get<UserId>();
        user.first_name = optString(j, "first_name");
        user.last_name = optString(j, "last_name");
        user.email = optString(j, "email");
        return user;
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError("Malformed Splitwise user", e.what());
    }
}

RawExpense parseExpense(const nlohmann::json& j) {
    if (!j.is_object()) throw ValidationError("Expense is not a JSON object");

    try {
        RawExpense e;
        e.id = scalarText(j, "id");
        if (e.id.empty()) throw ValidationError("Expense has an empty id");

        e.description = optString(j, "description");
        if (e.description.empty()) e.description = kUnknownDescription;
        e.notes = optString(j, "details");
        e.cost = util::parseDecimal(scalarText(j, "cost"));
        e.currency_code = optString(j, "currency_code");
        if (e.currency_code.empty()) e.currency_code = "USD";
        e.date = Date::parse(scalarText(j, "date"));
        e.deleted = !optString(j, "deleted_at").empty();

        if (const auto users = j.find("users"); users != j.end() && users->is_array()) {
            for (const auto& u : *users) {
                Participant p;
                p.user_id = u.at("user_id").get<UserId>();
                p.paid = amountField(u, "paid_share");
                p.owed = amountField(u, "owed_share");
                if (const auto nested = u.find("user"); nested != u.end() && nested->is_object()) {
                    p.first_name = optString(*nested, "first_name");
                    p.last_name = optString(*nested, "last_name");
                }
                e.participants.push_back(std::move(p));
            }
        }
        return e;
    } catch (const nlohmann::json::exception& ex) {
        throw ValidationError("Malformed Splitwise expense", ex.what());
    }
}

}

SplitwiseClient::SplitwiseClient(const config::SourceConfig& cfg, std::shared_ptr<http::Transport> transport)
    : api_(std::move(transport), cfg.base_url, cfg.api_key, cfg.timeout_seconds, "Splitwise"),
      page_size_(cfg.page_size == 0 ? 100 : cfg.page_size) {}

nlohmann::json SplitwiseClient::request(const std::string& endpoint, const http::Query& query) const {
    auto data = api_.get(endpoint, query);

    // Splitwise reports some failures inside a 200 response
    if (const auto it = data.find("errors"); it != data.end() && !it->empty()) {
        LogRegistry::source()->error("[SplitwiseClient] API error on {}: {}", endpoint, it->dump());
        throw TransportError("Splitwise API error on " + endpoint, it->dump());
    }
    return data;
}

SourceUser SplitwiseClient::currentUser() {
    LogRegistry::source()->info("[SplitwiseClient] Fetching current user information");
    const auto data = request("/get_current_user");

    if (!data.contains("user") || !data["user"].is_object())
        throw TransportError("Invalid Splitwise response: missing user data");

    try {
        auto user = splitwise::parseUser(data["user"]);
        LogRegistry::source()->info("[SplitwiseClient] Current user: {} ({})", user.displayName(), user.email);
        return user;
    } catch (const ValidationError& e) {
        throw TransportError("Invalid Splitwise response: " + std::string(e.what()), e.details());
    }
}

nlohmann::json SplitwiseClient::getExpensesPage(const Date& datedAfter, const unsigned int limit,
                                                const unsigned int offset) const {
    const http::Query query = {
        {"dated_after", datedAfter.str()},
        {"limit", std::to_string(limit)},
        {"offset", std::to_string(offset)}
    };

    LogRegistry::source()->debug("[SplitwiseClient] Fetching expenses dated_after={} limit={} offset={}",
                                 datedAfter.str(), limit, offset);
    auto data = request("/get_expenses", query);

    if (!data.contains("expenses") || !data["expenses"].is_array())
        throw TransportError("Invalid Splitwise response: missing expenses data");

    return std::move(data["expenses"]);
}

ExpenseFeed SplitwiseClient::fetchExpenses(const Date& since) {
    // dated_after is asked one day early and the boundary is applied here,
    // so expenses dated exactly on `since` are always included
    const Date datedAfter = since.addDays(-1);

    ExpenseFeed feed;
    unsigned int offset = 0;

    LogRegistry::source()->info("[SplitwiseClient] Fetching all expenses since {}", since.str());

    for (unsigned int page = 0; page < kMaxPages; ++page) {
        const auto expenses = getExpensesPage(datedAfter, page_size_, offset);
        if (expenses.empty()) break;

        for (const auto& raw : expenses) {
            try {
                auto expense = splitwise::parseExpense(raw);
                if (expense.date < since) continue;
                feed.expenses.push_back(std::move(expense));
            } catch (const ValidationError& e) {
                RejectedExpense rejected;
                rejected.source_id = raw.is_object() && raw.contains("id") ? optString(raw, "id") : "unknown";
                rejected.reason = e.details().empty() ? e.what() : std::string(e.what()) + ": " + e.details();
                LogRegistry::source()->warn("[SplitwiseClient] Rejected expense {}: {}", rejected.source_id, rejected.reason);
                feed.rejected.push_back(std::move(rejected));
            }
        }

        if (expenses.size() < page_size_) break;
        offset += page_size_;
    }

    LogRegistry::source()->info("[SplitwiseClient] Retrieved {} expenses since {} ({} rejected)",
                                feed.expenses.size(), since.str(), feed.rejected.size());
    return feed;
}
