#ifndef QTABLE_HPP
#define QTABLE_HPP

#include <array>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

// State key (Board::serialize) -> one value per move, in Board::Move order.
// Unseen states read as all zero and are not inserted by lookups.
class QTable {
public:
    using Values = std::array<double, 4>;

    Values values(const std::string& key) const;
    double value(const std::string& key, int action) const;
    double maxValue(const std::string& key) const;

    void update(const std::string& key, int action, double value);
    bool contains(const std::string& key) const { return table_.count(key) > 0; }

    size_t size() const { return table_.size(); }
    void clear() { table_.clear(); }

    // {"<state key>": [up, down, left, right], ...}
    nlohmann::json toJson() const;

    // Throws std::invalid_argument when the document is not a state -> 4 numbers map.
    // On failure the table is left unchanged.
    void fromJson(const nlohmann::json& doc);

private:
    std::unordered_map<std::string, Values> table_;
};

#endif // QTABLE_HPP
