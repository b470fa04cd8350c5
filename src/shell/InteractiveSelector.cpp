#include "shell/InteractiveSelector.hpp"
#include "shell/Render.hpp"
#include "util/errors.hpp"
#include "util/parse.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

using namespace sb::sync;
using namespace sb::types;

namespace sb::shell {

namespace {

constexpr const char* kMenu =
    "\nHow would you like to filter?\n"
    "1. Import all transactions\n"
    "2. Import transactions before a position\n"
    "3. Import transactions after a position\n"
    "4. Import a range of positions\n"
    "5. Import specific positions (e.g. 2,3 or 1,3-5)\n"
    "6. Cancel import\n"
    "Enter choice (1-6)";

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });
    return s;
}

}

std::optional<std::string> promptLine(std::istream& in, std::ostream& out, const std::string& question) {
    out << question << ": " << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
        out << '\n';
        return std::nullopt;
    }
    return util::trim(line);
}

bool confirm(std::istream& in, std::ostream& out, const std::string& question) {
    while (true) {
        const auto answer = promptLine(in, out, question + " [y/N]");
        if (!answer) return false;
        const auto a = lower(*answer);
        if (a == "y" || a == "yes") return true;
        if (a.empty() || a == "n" || a == "no") return false;
        out << "Please answer y or n.\n";
    }
}

std::optional<size_t> InteractiveSelector::askPosition(const std::string& question, const size_t count) {
    while (true) {
        const auto answer = promptLine(in_, out_, question + " (1-" + std::to_string(count) + ")");
        if (!answer) return std::nullopt;
        if (const auto v = util::parseUInt(*answer); v && *v >= 1 && *v <= count) return *v;
        out_ << "Enter a number between 1 and " << count << ".\n";
    }
}

std::optional<IndexPredicate> InteractiveSelector::chooseMode(const size_t count) {
    while (true) {
        const auto choice = promptLine(in_, out_, kMenu);
        if (!choice) return std::nullopt;

        if (*choice == "1") return IndexPredicate::all();
        if (*choice == "6") return std::nullopt;

        if (*choice == "2") {
            const auto p = askPosition("Import transactions BEFORE position", count);
            if (!p) return std::nullopt;
            return IndexPredicate::before(*p);
        }

        if (*choice == "3") {
            const auto p = askPosition("Import transactions AFTER position", count);
            if (!p) return std::nullopt;
            return IndexPredicate::after(*p);
        }

        if (*choice == "4") {
            const auto first = askPosition("Import FROM position", count);
            if (!first) return std::nullopt;
            const auto last = askPosition("Import TO position", count);
            if (!last) return std::nullopt;
            if (*first > *last) {
                out_ << "The range runs backwards, try again.\n";
                continue;
            }
            return IndexPredicate::range(*first, *last);
        }

        if (*choice == "5") {
            const auto text = promptLine(in_, out_, "Positions to import (e.g. 2,3 or 1,3-5)");
            if (!text) return std::nullopt;
            try {
                return IndexPredicate::parse(*text);
            } catch (const ValidationError& e) {
                out_ << e.what() << (e.details().empty() ? "" : " (" + e.details() + ")") << "\n";
                continue;
            }
        }

        out_ << "Please enter a number from 1 to 6.\n";
    }
}

std::optional<IndexPredicate> InteractiveSelector::select(const std::vector<CandidateTransaction>& candidates) {
    if (candidates.empty()) return IndexPredicate::all();

    out_ << "\n" << renderPreview(candidates);
    out_ << "\nTransactions from " << candidates.front().date.str() << " to " << candidates.back().date.str() << "\n";

    const auto predicate = chooseMode(candidates.size());
    if (!predicate) {
        out_ << "Import cancelled\n";
        return std::nullopt;
    }

    const auto selected = predicate->apply(candidates);
    if (selected.empty()) {
        out_ << "No transactions selected for import\n";
        return predicate;
    }

    if (selected.size() != candidates.size())
        out_ << "\nSelected " << selected.size() << " transactions:\n" << renderPreview(selected);

    if (!confirm(in_, out_, "\nImport " + std::to_string(selected.size()) + " transactions to YNAB?")) {
        out_ << "Import cancelled\n";
        return std::nullopt;
    }
    return predicate;
}

}
