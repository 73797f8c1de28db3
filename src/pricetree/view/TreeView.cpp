#include "view/TreeView.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace PT {

namespace {

// Columns are padded by code points so accented labels line up.
auto displayWidth(std::string_view text) -> std::size_t {
    std::size_t width = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

void appendPadded(std::string& out, std::string_view text, std::size_t width, bool alignRight) {
    auto const used    = displayWidth(text);
    auto const padding = width > used ? width - used : 0;
    if (alignRight) {
        out.append(padding, ' ');
        out.append(text);
    } else {
        out.append(text);
        out.append(padding, ' ');
    }
}

void collectRows(CategoryPtr const& node, ExpansionState const& expansion, std::vector<ViewRow>& rows) {
    ViewRow row;
    row.category   = node;
    row.indent     = static_cast<std::size_t>(node->depth) * 2 + 1;
    row.expandable = !node->isLeaf();
    row.expanded   = row.expandable && expansion.isExpanded(node->code);
    rows.push_back(row);
    if (!row.expanded) {
        return;
    }
    for (auto const& child : node->children) {
        collectRows(child, expansion, rows);
    }
}

} // namespace

void ExpansionState::toggle(std::string_view code) {
    if (auto it = expanded_.find(code); it != expanded_.end()) {
        expanded_.erase(it);
        return;
    }
    expanded_.emplace(code);
}

void ExpansionState::expand(std::string_view code) {
    if (!isExpanded(code)) {
        expanded_.emplace(code);
    }
}

void ExpansionState::collapse(std::string_view code) {
    if (auto it = expanded_.find(code); it != expanded_.end()) {
        expanded_.erase(it);
    }
}

void ExpansionState::expandAll(CategoryTree const& tree) {
    tree.visit([this](Category const& node, std::size_t) {
        if (!node.isLeaf()) {
            expanded_.insert(node.code);
        }
    });
}

void ExpansionState::collapseAll() {
    expanded_.clear();
}

auto ExpansionState::isExpanded(std::string_view code) const -> bool {
    return expanded_.find(code) != expanded_.end();
}

auto visibleRows(CategoryTree const& tree, ExpansionState const& expansion) -> std::vector<ViewRow> {
    std::vector<ViewRow> rows;
    if (tree.valid()) {
        collectRows(tree.root(), expansion, rows);
    }
    return rows;
}

auto formatOneDecimal(double value) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value;
    auto text = oss.str();
    if (text == "-0.0") {
        return "0.0";
    }
    return text;
}

auto renderTable(std::vector<ViewRow> const& rows, TableLabels const& labels) -> std::string {
    constexpr std::size_t kColumns = 3 + kPeriodCount + 3;

    std::vector<std::array<std::string, kColumns>> cells;
    cells.reserve(rows.size() + 1);

    std::array<std::string, kColumns> header;
    header[0] = labels.code;
    header[1] = labels.name;
    header[2] = labels.weight;
    for (std::size_t i = 0; i < kPeriodCount; ++i) {
        header[3 + i] = labels.periods[i];
    }
    header[3 + kPeriodCount]     = labels.monthly;
    header[3 + kPeriodCount + 1] = labels.trimester;
    header[3 + kPeriodCount + 2] = labels.yearly;
    cells.push_back(header);

    for (auto const& row : rows) {
        auto const& node = *row.category;
        std::array<std::string, kColumns> line;
        std::string marker = row.expandable ? (row.expanded ? "[-] " : "[+] ") : "    ";
        line[0]            = std::string(row.indent, ' ') + marker + node.code;
        line[1]            = node.name;
        line[2]            = formatOneDecimal(node.weight);
        for (auto const period : kPeriods) {
            line[3 + periodSlot(period)] = formatOneDecimal(node.value(period));
        }
        line[3 + kPeriodCount]     = formatOneDecimal(node.variation.monthly);
        line[3 + kPeriodCount + 1] = formatOneDecimal(node.variation.trimester);
        line[3 + kPeriodCount + 2] = formatOneDecimal(node.variation.yearly);
        cells.push_back(std::move(line));
    }

    std::array<std::size_t, kColumns> widths{};
    for (auto const& line : cells) {
        for (std::size_t c = 0; c < kColumns; ++c) {
            widths[c] = std::max(widths[c], displayWidth(line[c]));
        }
    }

    std::string out;
    for (auto const& line : cells) {
        for (std::size_t c = 0; c < kColumns; ++c) {
            if (c > 0) {
                out.append("  ");
            }
            appendPadded(out, line[c], widths[c], c >= 2);
        }
        while (!out.empty() && out.back() == ' ') {
            out.pop_back();
        }
        out.push_back('\n');
    }
    return out;
}

} // namespace PT
