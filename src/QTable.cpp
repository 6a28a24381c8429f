#include "QTable.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

QTable::Values QTable::values(const std::string& key) const {
    auto it = table_.find(key);
    if (it == table_.end()) {
        return Values{0.0, 0.0, 0.0, 0.0};
    }
    return it->second;
}

double QTable::value(const std::string& key, int action) const {
    if (action < 0 || action >= 4) {
        throw std::out_of_range("action index out of range");
    }
    return values(key)[action];
}

double QTable::maxValue(const std::string& key) const {
    Values v = values(key);
    return *std::max_element(v.begin(), v.end());
}

void QTable::update(const std::string& key, int action, double value) {
    if (action < 0 || action >= 4) {
        throw std::out_of_range("action index out of range");
    }
    auto it = table_.find(key);
    if (it == table_.end()) {
        it = table_.emplace(key, Values{0.0, 0.0, 0.0, 0.0}).first;
    }
    it->second[action] = value;
}

nlohmann::json QTable::toJson() const {
    nlohmann::json doc = nlohmann::json::object();
    for (const auto& [key, v] : table_) {
        doc[key] = {v[0], v[1], v[2], v[3]};
    }
    return doc;
}

void QTable::fromJson(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw std::invalid_argument("q_table must be an object");
    }

    std::unordered_map<std::string, Values> loaded;
    loaded.reserve(doc.size());
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const nlohmann::json& entry = it.value();
        if (!entry.is_array() || entry.size() != 4) {
            throw std::invalid_argument("q_table entry '" + it.key() + "' must hold 4 values");
        }
        Values v;
        for (size_t i = 0; i < 4; i++) {
            if (!entry[i].is_number()) {
                throw std::invalid_argument("q_table entry '" + it.key() + "' holds a non-number");
            }
            v[i] = entry[i].get<double>();
            if (!std::isfinite(v[i])) {
                throw std::invalid_argument("q_table entry '" + it.key() + "' holds a non-finite value");
            }
        }
        loaded.emplace(it.key(), v);
    }
    table_.swap(loaded);
}
