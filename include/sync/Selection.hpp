#pragma once

#include "types/Transaction.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sb::sync {

// Which 1-based positions of the importable sequence survive filtering.
class IndexPredicate {
public:
    enum class Mode { All, Before, After, Range, List };

    static IndexPredicate all();
    static IndexPredicate before(size_t position);                // positions < position
    static IndexPredicate after(size_t position);                 // positions > position
    static IndexPredicate range(size_t first, size_t last);       // inclusive
    static IndexPredicate list(std::vector<std::pair<size_t, size_t>> spans);

    /**
     * Textual forms: "all", "<N", ">N", "A-B", and comma lists of positions
     * and spans such as "2,3" or "1,3-5". Throws ValidationError otherwise.
     */
    static IndexPredicate parse(const std::string& text);

    [[nodiscard]] bool operator()(size_t position) const;

    [[nodiscard]] Mode mode() const { return mode_; }
    [[nodiscard]] std::string str() const;

    template <typename T>
    [[nodiscard]] std::vector<T> apply(const std::vector<T>& items) const {
        std::vector<T> out;
        for (size_t i = 0; i < items.size(); ++i)
            if ((*this)(i + 1)) out.push_back(items[i]);
        return out;
    }

private:
    Mode mode_{Mode::All};
    std::vector<std::pair<size_t, size_t>> spans_;   // inclusive, 1-based

    IndexPredicate() = default;
};

// Chooses the subset of importable candidates to submit; nullopt cancels the run.
class CandidateSelector {
public:
    virtual ~CandidateSelector() = default;
    virtual std::optional<IndexPredicate> select(const std::vector<types::CandidateTransaction>& candidates) = 0;
};

class FixedSelector : public CandidateSelector {
public:
    explicit FixedSelector(IndexPredicate predicate) : predicate_(std::move(predicate)) {}

    std::optional<IndexPredicate> select(const std::vector<types::CandidateTransaction>&) override { return predicate_; }

private:
    IndexPredicate predicate_;
};

}
