#pragma once

#include "config/Config.hpp"
#include "http/JsonApi.hpp"
#include "ledger/SourceLedger.hpp"

#include <memory>
#include <nlohmann/json_fwd.hpp>

namespace sb::ledger {

class SplitwiseClient : public SourceLedger {
public:
    SplitwiseClient(const config::SourceConfig& cfg, std::shared_ptr<http::Transport> transport);

    types::SourceUser currentUser() override;

    ExpenseFeed fetchExpenses(const types::Date& since) override;

    // Raw expense objects of a single page.
    [[nodiscard]] nlohmann::json getExpensesPage(const types::Date& datedAfter, unsigned int limit, unsigned int offset) const;

private:
    http::JsonApi api_;
    unsigned int page_size_;

    [[nodiscard]] nlohmann::json request(const std::string& endpoint, const http::Query& query = {}) const;
};

namespace splitwise {

// Typed views of the wire objects; throw ValidationError on malformed input.
types::RawExpense parseExpense(const nlohmann::json& j);
types::SourceUser parseUser(const nlohmann::json& j);

}

}
