#include "config/change_set.hpp"

#include <algorithm>

#include "ftxui/dom/elements.hpp"
#include "ftxui/dom/node.hpp"
#include "ftxui/dom/table.hpp"
#include "ftxui/screen/screen.hpp"
#include "kernel/param_utils.hpp"

using namespace ftxui;

namespace dyn {

static YAML::Node snapshot(const YAML::Node& v) {
    if (!v.IsDefined()) return YAML::Node();
    return YAML::Clone(v);
}

void ChangeSet::record(const std::string& key, const YAML::Node& old_value, const YAML::Node& new_value) {
    entries_.push_back({key, snapshot(old_value), snapshot(new_value)});
}

const ChangeEntry* ChangeSet::find(const std::string& key) const {
    for (const auto& e : entries_)
        if (e.key == key) return &e;
    return nullptr;
}

std::string Report::render() const {
    std::vector<std::vector<std::string>> cells;
    if (!headers.empty()) cells.push_back(headers);
    cells.insert(cells.end(), rows.begin(), rows.end());
    if (cells.empty()) return {};

    // pad ragged rows so the table stays rectangular
    std::size_t width = 0;
    for (const auto& r : cells) width = std::max(width, r.size());
    for (auto& r : cells) r.resize(width);

    Table table(cells);
    table.SelectAll().Border(LIGHT);
    table.SelectAll().SeparatorVertical(LIGHT);
    table.SelectAll().SeparatorHorizontal(LIGHT);
    if (!headers.empty()) {
        table.SelectRow(0).Decorate(bold);
        table.SelectRow(0).BorderBottom(DOUBLE);
    }

    Element document = table.Render();
    // size to the table itself, not the terminal
    document->ComputeRequirement();
    const auto& req = document->requirement();
    auto screen = Screen::Create(Dimension::Fixed(req.min_x), Dimension::Fixed(req.min_y));
    ftxui::Render(screen, document);
    return screen.ToString();
}

nlohmann::json Report::to_json() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& row : rows) {
        nlohmann::json obj = nlohmann::json::object();
        for (std::size_t i = 0; i < headers.size(); ++i) {
            obj[headers[i]] = i < row.size() ? row[i] : std::string();
        }
        out.push_back(obj);
    }
    return out;
}

Report change_set_report(const ChangeSet& changes) {
    Report r;
    r.headers = {"Changed", "Old Value", "New Value"};
    for (const auto& e : changes.entries()) {
        std::string before = value_to_string(e.old_value);
        std::string after = value_to_string(e.new_value);
        r.rows.push_back({e.key, before.empty() ? "N/A" : before, after.empty() ? "N/A" : after});
    }
    return r;
}

} // namespace dyn
