// Change tracking and read-only reports produced by one mutation pass
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace dyn {

struct ChangeEntry {
    std::string key;  // field name or item id
    YAML::Node old_value;
    YAML::Node new_value;
};

class ChangeSet {
public:
    void record(const std::string& key, const YAML::Node& old_value, const YAML::Node& new_value);

    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }
    const std::vector<ChangeEntry>& entries() const { return entries_; }
    const ChangeEntry* find(const std::string& key) const;
    void clear() { entries_.clear(); }

private:
    std::vector<ChangeEntry> entries_;
};

// A headed table of display strings.
struct Report {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;

    bool empty() const { return rows.empty(); }

    // Box-drawn grid.
    std::string render() const;
    // Array of objects keyed by header.
    nlohmann::json to_json() const;
};

Report change_set_report(const ChangeSet& changes);

} // namespace dyn
