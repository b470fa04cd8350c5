#pragma once

#include "config/Config.hpp"
#include "http/JsonApi.hpp"
#include "ledger/TargetLedger.hpp"

#include <memory>
#include <optional>
#include <nlohmann/json_fwd.hpp>

namespace sb::ledger {

class YnabClient : public TargetLedger {
public:
    YnabClient(const config::SinkConfig& cfg, std::shared_ptr<http::Transport> transport);

    AccountHandle findAccount(const std::string& name) override;

    std::vector<types::ImportedRecord> fetchAccountTransactions(
        const AccountHandle& account, const std::optional<types::Date>& since) override;

    std::vector<ItemOutcome> createTransactions(
        const AccountHandle& account, const std::vector<types::CandidateTransaction>& transactions) override;

private:
    http::JsonApi api_;
    std::string budget_id_;
    std::optional<AccountHandle> account_;

    [[nodiscard]] std::string budgetPath() const { return "/budgets/" + budget_id_; }

    std::vector<ItemOutcome> submit(const AccountHandle& account,
                                    const std::vector<types::CandidateTransaction>& transactions);
};

namespace ynab {

types::ImportedRecord parseTransaction(const nlohmann::json& j);

nlohmann::json toSaveTransaction(const types::CandidateTransaction& t, const std::string& accountId);

// Per-candidate outcome from a create-transactions response body ("data" member).
std::vector<ItemOutcome> matchOutcomes(const std::vector<types::CandidateTransaction>& submitted,
                                       const nlohmann::json& data);

}

}
