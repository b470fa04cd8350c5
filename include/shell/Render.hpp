#pragma once

#include "sync/Orchestrator.hpp"

#include <string>
#include <vector>

namespace sb::shell {

constexpr size_t kPreviewMemoWidth = 60;

// Numbered list with a memo line per transaction and a signed total.
std::string renderPreview(const std::vector<types::CandidateTransaction>& transactions);

std::string renderSummary(const sync::RunReport& report);

std::string renderSummaryJson(const sync::RunReport& report);

}
