#pragma once

#include "util/parse.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <string>
#include <vector>
#include <fmt/format.h>

namespace sb::shell {

enum class Align { Left, Right };

struct Column {
    std::string header;
    Align align = Align::Left;
    std::size_t min = 1;
    std::size_t max = std::numeric_limits<std::size_t>::max();
};

// Fixed-width text table for terminal output. Cells wider than their column
// are cut with a trailing "...". Widths are measured in bytes.
class Table {
public:
    explicit Table(std::vector<Column> cols) : cols_(std::move(cols)) {}

    void add_row(std::vector<std::string> cells) {
        cells.resize(cols_.size());
        rows_.push_back(std::move(cells));
    }

    [[nodiscard]] bool empty() const { return rows_.empty(); }

    [[nodiscard]] std::string render() const {
        if (cols_.empty()) return {};

        const std::size_t ncol = cols_.size();
        std::vector<std::size_t> width(ncol, 0);
        for (std::size_t i = 0; i < ncol; ++i) width[i] = std::max(cols_[i].min, cols_[i].header.size());
        for (const auto& r : rows_)
            for (std::size_t i = 0; i < ncol; ++i) width[i] = std::max(width[i], r[i].size());
        for (std::size_t i = 0; i < ncol; ++i) width[i] = std::clamp(width[i], cols_[i].min, cols_[i].max);

        std::string out;
        out.reserve(128 + rows_.size() * 96);

        std::vector<std::string> headers;
        headers.reserve(ncol);
        for (const auto& c : cols_) headers.push_back(c.header);
        emit_line(out, headers, width);

        out += kPadLeft;
        for (std::size_t i = 0; i < ncol; ++i) {
            if (i) out += kGap;
            out += std::string(width[i], '-');
        }
        out += '\n';

        for (const auto& r : rows_) emit_line(out, r, width);
        return out;
    }

private:
    static constexpr const char* kPadLeft = "  ";
    static constexpr const char* kGap = "  ";

    std::vector<Column> cols_;
    std::vector<std::vector<std::string>> rows_;

    static std::string clip(const std::string& s, const std::size_t width) {
        if (s.size() <= width) return s;
        if (width <= 3) return std::string(util::utf8Prefix(s, width));
        return std::string(util::utf8Prefix(s, width - 3)) + "...";
    }

    void emit_line(std::string& out, const std::vector<std::string>& cells, const std::vector<std::size_t>& width) const {
        out += kPadLeft;
        for (std::size_t i = 0; i < cols_.size(); ++i) {
            if (i) out += kGap;
            const auto cell = clip(cells[i], width[i]);
            // no trailing blanks after the last column
            if (cols_[i].align == Align::Left && i + 1 == cols_.size()) out += cell;
            else if (cols_[i].align == Align::Left)
                fmt::format_to(std::back_inserter(out), "{:<{}}", cell, width[i]);
            else fmt::format_to(std::back_inserter(out), "{:>{}}", cell, width[i]);
        }
        out += '\n';
    }
};

}
