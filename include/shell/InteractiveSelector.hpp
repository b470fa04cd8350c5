#pragma once

#include "sync/Selection.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace sb::shell {

// Reads one line after printing the question; nullopt on end of input.
std::optional<std::string> promptLine(std::istream& in, std::ostream& out, const std::string& question);

// y/yes or n/no, anything else asks again; end of input answers no.
bool confirm(std::istream& in, std::ostream& out, const std::string& question);

/**
 * Terminal menu over the importable candidates:
 *
 *   1. all   2. before position   3. after position
 *   4. range 5. explicit list     6. cancel
 *
 * followed by a final import confirmation. Declining, choosing cancel or
 * reaching end of input all cancel the run.
 */
class InteractiveSelector : public sync::CandidateSelector {
public:
    InteractiveSelector(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    std::optional<sync::IndexPredicate> select(const std::vector<types::CandidateTransaction>& candidates) override;

private:
    std::istream& in_;
    std::ostream& out_;

    std::optional<sync::IndexPredicate> chooseMode(size_t count);
    std::optional<size_t> askPosition(const std::string& question, size_t count);
};

}
