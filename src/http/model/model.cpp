#include "model.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "../../utils/string_utils.hpp"

namespace tfe::http::model {
    Headers::Headers(std::initializer_list<std::pair<std::string, std::string>> entries) {
        for (const auto& [name, value] : entries) {
            add(name, value);
        }
    }

    void Headers::set(const std::string& name, std::string value) {
        erase(name);
        entries_.emplace_back(name, std::move(value));
    }

    void Headers::add(std::string name, std::string value) { entries_.emplace_back(std::move(name), std::move(value)); }

    void Headers::erase(const std::string& name) {
        std::erase_if(entries_, [&name](const auto& entry) { return string_utils::ieq(entry.first, name); });
    }

    std::string Headers::get(const std::string& name) const {
        auto it = std::find_if(entries_.begin(), entries_.end(), [&name](const auto& entry) { return string_utils::ieq(entry.first, name); });
        return it == entries_.end() ? std::string{} : it->second;
    }

    bool Headers::has(const std::string& name) const {
        return std::any_of(entries_.begin(), entries_.end(), [&name](const auto& entry) { return string_utils::ieq(entry.first, name); });
    }

    std::vector<std::string> Headers::to_lines() const {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& [name, value] : entries_) {
            // "Name:" would tell libcurl to drop the header; "Name;" sends it empty.
            out.push_back(value.empty() ? name + ";" : name + ": " + value);
        }
        return out;
    }
}  // namespace tfe::http::model
