#include "ledger/YnabClient.hpp"
#include "logging/LogRegistry.hpp"
#include "util/errors.hpp"

#include <unordered_set>
#include <nlohmann/json.hpp>

using namespace sb::ledger;
using namespace sb::types;
using namespace sb::logging;

namespace {
constexpr long kHttpBadRequest = 400;
constexpr long kHttpConflict = 409;
constexpr long kHttpUnprocessable = 422;

bool isItemRejection(const long status) {
    return status == kHttpBadRequest || status == kHttpUnprocessable;
}
}

namespace sb::ledger::ynab {

ImportedRecord parseTransaction(const nlohmann::json& j) {
    try {
        ImportedRecord r;
        if (const auto it = j.find("import_id"); it != j.end() && it->is_string()) r.import_id = it->get<std::string>();
        if (const auto it = j.find("payee_name"); it != j.end() && it->is_string()) r.payee = it->get<std::string>();
        r.amount = j.at("amount").get<util::Milliunits>();
        r.date = Date::parse(j.at("date").get<std::string>());
        return r;
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError("Malformed YNAB transaction", e.what());
    }
}

nlohmann::json toSaveTransaction(const CandidateTransaction& t, const std::string& accountId) {
    nlohmann::json j = t;
    j["account_id"] = accountId;
    return j;
}

std::vector<ItemOutcome> matchOutcomes(const std::vector<CandidateTransaction>& submitted, const nlohmann::json& data) {
    std::unordered_set<std::string> duplicates, created;

    if (const auto it = data.find("duplicate_import_ids"); it != data.end() && it->is_array())
        for (const auto& id : *it)
            if (id.is_string()) duplicates.insert(id.get<std::string>());

    const auto collect = [&created](const nlohmann::json& txn) {
        if (const auto id = txn.find("import_id"); id != txn.end() && id->is_string())
            created.insert(id->get<std::string>());
    };
    if (const auto it = data.find("transactions"); it != data.end() && it->is_array())
        for (const auto& txn : *it) collect(txn);
    if (const auto it = data.find("transaction"); it != data.end() && it->is_object())
        collect(*it);

    std::vector<ItemOutcome> outcomes;
    outcomes.reserve(submitted.size());
    for (const auto& t : submitted) {
        if (duplicates.contains(t.import_id)) outcomes.push_back({t.import_id, ItemStatus::DuplicatePerSink, {}});
        else if (created.contains(t.import_id)) outcomes.push_back({t.import_id, ItemStatus::Accepted, {}});
        else outcomes.push_back({t.import_id, ItemStatus::Rejected, "not confirmed in sink response"});
    }
    return outcomes;
}

}

YnabClient::YnabClient(const config::SinkConfig& cfg, std::shared_ptr<http::Transport> transport)
    : api_(std::move(transport), cfg.base_url, cfg.access_token, cfg.timeout_seconds, "YNAB"),
      budget_id_(cfg.budget_id.empty() ? "last-used" : cfg.budget_id) {}

AccountHandle YnabClient::findAccount(const std::string& name) {
    if (account_ && account_->name == name) return *account_;

    LogRegistry::sink()->info("[YnabClient] Looking for account '{}' in budget {}", name, budget_id_);
    const auto resp = api_.get(budgetPath() + "/accounts");

    const auto accounts = resp.contains("data") ? resp["data"].value("accounts", nlohmann::json::array())
                                                : nlohmann::json::array();

    std::string available;
    for (const auto& acc : accounts) {
        if (acc.value("deleted", false)) continue;
        const auto accName = acc.value("name", std::string{});
        if (accName == name) {
            account_ = AccountHandle{acc.value("id", std::string{}), accName};
            LogRegistry::sink()->info("[YnabClient] Found account '{}' with ID: {}", name, account_->id);
            return *account_;
        }
        if (!available.empty()) available += ", ";
        available += accName;
    }

    LogRegistry::sink()->error("[YnabClient] Account '{}' not found. Available accounts: {}", name, available);
    throw AccountNotFoundError("Account '" + name + "' not found", "Available accounts: " + available);
}

std::vector<ImportedRecord> YnabClient::fetchAccountTransactions(const AccountHandle& account,
                                                                 const std::optional<Date>& since) {
    http::Query query;
    if (since) query.emplace_back("since_date", since->str());

    const auto resp = api_.get(budgetPath() + "/accounts/" + account.id + "/transactions", query);
    const auto txns = resp.contains("data") ? resp["data"].value("transactions", nlohmann::json::array())
                                            : nlohmann::json::array();

    std::vector<ImportedRecord> records;
    records.reserve(txns.size());
    for (const auto& txn : txns) {
        if (txn.value("deleted", false)) continue;
        try {
            records.push_back(ynab::parseTransaction(txn));
        } catch (const ValidationError& e) {
            // unreadable history cannot be matched against; it must not block the run
            LogRegistry::sink()->warn("[YnabClient] Ignoring unreadable transaction {}: {}",
                                      txn.value("id", std::string{"?"}), e.details());
        }
    }

    LogRegistry::sink()->info("[YnabClient] Loaded {} existing transactions from '{}'", records.size(), account.name);
    return records;
}

std::vector<ItemOutcome> YnabClient::createTransactions(const AccountHandle& account,
                                                        const std::vector<CandidateTransaction>& transactions) {
    if (transactions.empty()) {
        LogRegistry::sink()->info("[YnabClient] No transactions to create");
        return {};
    }

    LogRegistry::sink()->info("[YnabClient] Creating batch of {} transactions", transactions.size());
    return submit(account, transactions);
}

std::vector<ItemOutcome> YnabClient::submit(const AccountHandle& account,
                                            const std::vector<CandidateTransaction>& transactions) {
    nlohmann::json body;
    body["transactions"] = nlohmann::json::array();
    for (const auto& t : transactions) body["transactions"].push_back(ynab::toSaveTransaction(t, account.id));

    const auto path = budgetPath() + "/transactions";
    const auto resp = api_.postRaw(path, body);

    if (resp.ok()) {
        const auto parsed = api_.parse(resp, "POST " + path);
        return ynab::matchOutcomes(transactions, parsed.value("data", nlohmann::json::object()));
    }

    if (resp.curl != CURLE_OK || !(isItemRejection(resp.http) || resp.http == kHttpConflict))
        api_.fail(resp, "POST " + path);

    // The sink validates a batch as a whole; resubmit one by one so a single
    // bad transaction does not take its siblings down with it.
    if (transactions.size() > 1) {
        LogRegistry::sink()->warn("[YnabClient] Batch rejected with HTTP {}, retrying {} transactions individually",
                                  resp.http, transactions.size());
        std::vector<ItemOutcome> outcomes;
        outcomes.reserve(transactions.size());
        for (const auto& t : transactions) {
            try {
                auto single = submit(account, {t});
                outcomes.insert(outcomes.end(), single.begin(), single.end());
            } catch (const TransportError& e) {
                LogRegistry::sink()->error("[YnabClient] Retry stopped at {} after {} of {} transactions: {}",
                                           t.import_id, outcomes.size(), transactions.size(), e.what());
                throw PartialBatchError(e, std::move(outcomes));
            }
        }
        return outcomes;
    }

    const auto& t = transactions.front();
    if (resp.http == kHttpConflict) {
        LogRegistry::sink()->info("[YnabClient] Sink already holds import_id {}", t.import_id);
        return {{t.import_id, ItemStatus::DuplicatePerSink, {}}};
    }

    auto reason = http::extractErrorDetail(resp.body);
    if (reason.empty()) reason = "HTTP " + std::to_string(resp.http);
    LogRegistry::sink()->warn("[YnabClient] Transaction {} rejected: {}", t.import_id, reason);
    return {{t.import_id, ItemStatus::Rejected, reason}};
}
