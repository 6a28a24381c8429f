#include "StrategyRegistry.hpp"
#include "QLearningStrategy.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <numeric>

using json = nlohmann::json;

namespace {

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

// Population standard deviation
double stddev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    double m = mean(values);
    double sq = 0.0;
    for (double v : values) sq += (v - m) * (v - m);
    return std::sqrt(sq / values.size());
}

// Least-squares slope of values against their index
double slope(const std::vector<double>& values) {
    size_t n = values.size();
    if (n < 2) return 0.0;
    double xMean = (n - 1) / 2.0;
    double yMean = mean(values);
    double num = 0.0;
    double den = 0.0;
    for (size_t i = 0; i < n; i++) {
        double dx = static_cast<double>(i) - xMean;
        num += dx * (values[i] - yMean);
        den += dx * dx;
    }
    return num / den;
}

// Min-max normalization; a set of equal values maps to `flat`
std::vector<double> normalize(const std::vector<double>& values, double flat) {
    auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    double minVal = *lo;
    double maxVal = *hi;
    std::vector<double> out;
    out.reserve(values.size());
    for (double v : values) {
        out.push_back(maxVal == minVal ? flat : (v - minVal) / (maxVal - minVal));
    }
    return out;
}

} // namespace

// ============================================================================
// PerformanceRecord JSON
// ============================================================================

json toJson(const PerformanceRecord& record) {
    return {
        {"games_played", record.gamesPlayed},
        {"total_score", record.totalScore},
        {"total_moves", record.totalMoves},
        {"highest_tile", record.highestTile},
        {"average_efficiency", record.averageEfficiency},
    };
}

PerformanceRecord performanceRecordFromJson(const json& doc) {
    PerformanceRecord record;
    record.gamesPlayed = doc.at("games_played").get<int>();
    record.totalScore = doc.at("total_score").get<uint64_t>();
    record.totalMoves = doc.at("total_moves").get<uint64_t>();
    record.highestTile = doc.at("highest_tile").get<uint32_t>();
    record.averageEfficiency = doc.at("average_efficiency").get<double>();

    if (record.gamesPlayed < 0 || !std::isfinite(record.averageEfficiency) || record.averageEfficiency < 0.0 ||
        (record.highestTile != 0 && !Board::isValidTile(record.highestTile))) {
        throw std::invalid_argument("invalid performance record");
    }
    return record;
}

// ============================================================================
// WriteGuard
// ============================================================================

StrategyRegistry::WriteGuard::WriteGuard(std::atomic<bool>& flag) : flag_(flag) {
    if (flag_.exchange(true)) {
        throw ConcurrentMutationError("strategy registry is already being modified");
    }
}

StrategyRegistry::WriteGuard::~WriteGuard() {
    flag_.store(false);
}

// ============================================================================
// Registration and lookup
// ============================================================================

StrategyRegistry::StrategyRegistry(const Config& config) : config_(config) {}

const char* StrategyRegistry::statusName(Status status) {
    switch (status) {
    case OK: return "ok";
    case NOT_FOUND: return "not_found";
    case DUPLICATE: return "duplicate";
    case INVALID_CONFIG: return "invalid_config";
    }
    return "unknown";
}

StrategyRegistry::Status StrategyRegistry::registerStrategy(const Factory& factory, bool override) {
    WriteGuard guard(writing_);

    if (!factory) {
        std::cerr << "Cannot register strategy: empty factory" << std::endl;
        return INVALID_CONFIG;
    }

    std::unique_ptr<Strategy> probe;
    try {
        probe = factory(StrategyParams());
    } catch (const std::invalid_argument& e) {
        std::cerr << "Cannot register strategy: " << e.what() << std::endl;
        return INVALID_CONFIG;
    }
    if (!probe) {
        std::cerr << "Cannot register strategy: factory returned nothing" << std::endl;
        return INVALID_CONFIG;
    }

    StrategyMetadata metadata = probe->metadata();
    std::string id = metadata.id();

    auto it = index_.find(id);
    if (it != index_.end()) {
        if (!override) {
            if (config_.verbose) {
                std::cout << "Strategy " << id << " already registered" << std::endl;
            }
            return DUPLICATE;
        }
        entries_[it->second] = Entry{id, metadata, factory};
    } else {
        index_[id] = entries_.size();
        entries_.push_back(Entry{id, metadata, factory});
    }

    if (config_.verbose) {
        std::cout << "Registered strategy: " << id << std::endl;
    }
    return OK;
}

StrategyRegistry::Lookup StrategyRegistry::create(const std::string& id, const StrategyParams& params) const {
    Lookup lookup;
    auto it = index_.find(id);
    if (it == index_.end()) {
        lookup.status = NOT_FOUND;
        lookup.message = "strategy '" + id + "' is not registered";
        return lookup;
    }

    try {
        lookup.strategy = entries_[it->second].factory(params);
    } catch (const std::invalid_argument& e) {
        lookup.status = INVALID_CONFIG;
        lookup.message = e.what();
        return lookup;
    }
    if (!lookup.strategy) {
        lookup.status = INVALID_CONFIG;
        lookup.message = "factory for '" + id + "' returned nothing";
        return lookup;
    }

    lookup.status = OK;
    return lookup;
}

std::vector<StrategyMetadata> StrategyRegistry::list(std::optional<StrategyCategory> category) const {
    std::vector<StrategyMetadata> result;
    for (const Entry& entry : entries_) {
        if (!category || entry.metadata.category == *category) {
            result.push_back(entry.metadata);
        }
    }
    return result;
}

std::optional<StrategyRegistry::StrategyInfo> StrategyRegistry::info(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }

    StrategyInfo result;
    result.id = id;
    result.metadata = entries_[it->second].metadata;
    const std::deque<PerformanceRecord>& records = history(id);
    result.history.assign(records.begin(), records.end());
    size_t from = records.size() > RECENT_RECORDS ? records.size() - RECENT_RECORDS : 0;
    result.recent.assign(records.begin() + from, records.end());
    return result;
}

// ============================================================================
// Performance history
// ============================================================================

StrategyRegistry::Status StrategyRegistry::recordPerformance(const std::string& id, const PerformanceRecord& record) {
    WriteGuard guard(writing_);

    if (!contains(id)) {
        return NOT_FOUND;
    }

    std::deque<PerformanceRecord>& records = history_[id];
    records.push_back(record);
    while (records.size() > HISTORY_CAP) {
        records.pop_front();
    }
    return OK;
}

const std::deque<PerformanceRecord>& StrategyRegistry::history(const std::string& id) const {
    static const std::deque<PerformanceRecord> none;
    auto it = history_.find(id);
    return it != history_.end() ? it->second : none;
}

void StrategyRegistry::clearPerformance() {
    WriteGuard guard(writing_);
    history_.clear();
}

std::vector<std::string> StrategyRegistry::historyIds() const {
    std::vector<std::string> ids;
    for (const Entry& entry : entries_) {
        if (!history(entry.id).empty()) ids.push_back(entry.id);
    }
    // Loaded history for strategies that are not registered
    for (const auto& [id, records] : history_) {
        if (!contains(id) && !records.empty()) ids.push_back(id);
    }
    return ids;
}

StrategyRegistry::RankingEntry StrategyRegistry::metricsFor(const std::string& id) const {
    const std::deque<PerformanceRecord>& records = history(id);

    RankingEntry entry;
    entry.id = id;
    auto it = index_.find(id);
    if (it != index_.end()) {
        entry.name = entries_[it->second].metadata.name;
        entry.category = categoryName(entries_[it->second].metadata.category);
    } else {
        entry.name = id;
        entry.category = "unknown";
    }

    std::vector<double> efficiencies;
    efficiencies.reserve(records.size());
    for (const PerformanceRecord& record : records) {
        efficiencies.push_back(record.averageEfficiency);
        entry.gamesPlayed += record.gamesPlayed;
        entry.highestTile = std::max(entry.highestTile, record.highestTile);
    }

    entry.averageEfficiency = mean(efficiencies);
    double scale = std::max(entry.averageEfficiency, 0.1);
    entry.consistency = std::clamp(1.0 - stddev(efficiencies) / scale, 0.0, 1.0);
    entry.improvement = slope(efficiencies);

    if (efficiencies.size() >= STABILITY_WINDOW) {
        std::vector<double> recent(efficiencies.end() - STABILITY_WINDOW, efficiencies.end());
        entry.stability = 1.0 - std::min(stddev(recent) / scale, 1.0);
    } else {
        entry.stability = entry.consistency;
    }
    return entry;
}

// ============================================================================
// Ranking
// ============================================================================

std::vector<StrategyRegistry::RankingEntry> StrategyRegistry::rank(const std::vector<std::string>& ids) const {
    // Candidate order is registration order, which decides ties
    std::vector<std::string> candidates;
    for (const std::string& id : historyIds()) {
        if (std::find(ids.begin(), ids.end(), id) != ids.end()) {
            candidates.push_back(id);
        }
    }
    if (candidates.empty()) {
        return {};
    }

    std::vector<RankingEntry> entries;
    std::vector<double> efficiency;
    std::vector<double> consistency;
    std::vector<double> tiles;
    std::vector<double> improvement;
    for (const std::string& id : candidates) {
        RankingEntry entry = metricsFor(id);
        efficiency.push_back(entry.averageEfficiency);
        consistency.push_back(entry.consistency);
        tiles.push_back(std::log2(static_cast<double>(std::max<uint32_t>(entry.highestTile, 1))));
        improvement.push_back(entry.improvement);
        entries.push_back(entry);
    }

    std::vector<double> normEfficiency = normalize(efficiency, 1.0);
    std::vector<double> normConsistency = normalize(consistency, 1.0);
    std::vector<double> normTiles = normalize(tiles, 1.0);
    std::vector<double> normImprovement = normalize(improvement, 0.5);

    for (size_t i = 0; i < entries.size(); i++) {
        entries[i].compositeScore = normEfficiency[i] * EFFICIENCY_WEIGHT +
                                    normConsistency[i] * CONSISTENCY_WEIGHT +
                                    normTiles[i] * HIGHEST_TILE_WEIGHT +
                                    normImprovement[i] * IMPROVEMENT_WEIGHT;
    }

    std::stable_sort(entries.begin(), entries.end(), [](const RankingEntry& a, const RankingEntry& b) {
        return a.compositeScore > b.compositeScore;
    });

    const double total = static_cast<double>(entries.size());
    std::map<std::string, int> categoryCounts;
    for (size_t i = 0; i < entries.size(); i++) {
        entries[i].rank = static_cast<int>(i) + 1;
        entries[i].percentile = (total - i) / total * 100.0;
        entries[i].categoryRank = ++categoryCounts[entries[i].category];
    }
    return entries;
}

std::vector<StrategyRegistry::RankingEntry> StrategyRegistry::leaderboard() const {
    return rank(historyIds());
}

std::vector<StrategyRegistry::RankingEntry> StrategyRegistry::leaderboardBy(const std::string& metric,
                                                                            size_t limit) const {
    std::function<double(const RankingEntry&)> key;
    if (metric == "average_efficiency") {
        key = [](const RankingEntry& e) { return e.averageEfficiency; };
    } else if (metric == "highest_tile") {
        key = [](const RankingEntry& e) { return static_cast<double>(e.highestTile); };
    } else if (metric == "consistency_score") {
        key = [](const RankingEntry& e) { return e.consistency; };
    } else if (metric == "games_played") {
        key = [](const RankingEntry& e) { return static_cast<double>(e.gamesPlayed); };
    } else if (metric == "improvement_rate") {
        key = [](const RankingEntry& e) { return e.improvement; };
    } else if (metric == "stability_index") {
        key = [](const RankingEntry& e) { return e.stability; };
    } else {
        throw InvalidConfigError("unknown leaderboard metric '" + metric + "'");
    }

    std::vector<RankingEntry> entries;
    for (const std::string& id : historyIds()) {
        entries.push_back(metricsFor(id));
    }
    std::stable_sort(entries.begin(), entries.end(),
                     [&key](const RankingEntry& a, const RankingEntry& b) { return key(a) > key(b); });

    if (entries.size() > limit) {
        entries.resize(limit);
    }
    for (size_t i = 0; i < entries.size(); i++) {
        entries[i].rank = static_cast<int>(i) + 1;
    }
    return entries;
}

StrategyRegistry::Comparison StrategyRegistry::compare(const std::vector<std::string>& ids) const {
    Comparison comparison;
    for (const std::string& id : ids) {
        if (history(id).empty()) continue;
        comparison.entries.push_back(metricsFor(id));
    }

    auto orderBy = [&comparison](auto key) {
        std::vector<RankingEntry> sorted = comparison.entries;
        std::stable_sort(sorted.begin(), sorted.end(),
                         [&key](const RankingEntry& a, const RankingEntry& b) { return key(a) > key(b); });
        std::vector<std::string> order;
        for (const RankingEntry& entry : sorted) order.push_back(entry.id);
        return order;
    };

    comparison.byEfficiency = orderBy([](const RankingEntry& e) { return e.averageEfficiency; });
    comparison.byHighestTile = orderBy([](const RankingEntry& e) { return static_cast<double>(e.highestTile); });
    comparison.byConsistency = orderBy([](const RankingEntry& e) { return e.consistency; });
    return comparison;
}

// ============================================================================
// Export and persistence
// ============================================================================

json StrategyRegistry::exportPerformance() const {
    json strategies = json::array();
    for (const RankingEntry& entry : leaderboard()) {
        json records = json::array();
        for (const PerformanceRecord& record : history(entry.id)) {
            records.push_back(toJson(record));
        }

        strategies.push_back({
            {"algorithm_id", entry.id},
            {"name", entry.name},
            {"category", entry.category},
            {"rank", entry.rank},
            {"category_rank", entry.categoryRank},
            {"percentile", entry.percentile},
            {"composite_score", entry.compositeScore},
            {"games_played", entry.gamesPlayed},
            {"average_efficiency", entry.averageEfficiency},
            {"highest_tile", entry.highestTile},
            {"consistency_score", entry.consistency},
            {"improvement_rate", entry.improvement},
            {"stability_index", entry.stability},
            {"history", records},
        });
    }

    return {
        {"total_strategies", strategies.size()},
        {"strategies", strategies},
    };
}

namespace {

PersistResult writeJson(const json& doc, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        return PersistResult::failure(PersistResult::IO_ERROR, "cannot open " + path + " for writing");
    }
    out << doc.dump(2);
    out.flush();
    if (!out) {
        return PersistResult::failure(PersistResult::IO_ERROR, "failed writing " + path);
    }
    return PersistResult::success();
}

} // namespace

PersistResult StrategyRegistry::exportPerformance(const std::string& path) const {
    return writeJson(exportPerformance(), path);
}

PersistResult StrategyRegistry::savePerformance(const std::string& path) const {
    json doc = json::object();
    for (const auto& [id, records] : history_) {
        json list = json::array();
        for (const PerformanceRecord& record : records) {
            list.push_back(toJson(record));
        }
        doc[id] = list;
    }
    return writeJson(doc, path);
}

PersistResult StrategyRegistry::loadPerformance(const std::string& path) {
    WriteGuard guard(writing_);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return PersistResult::failure(PersistResult::FILE_MISSING, "no performance file at " + path);
    }
    std::ifstream in(path);
    if (!in) {
        return PersistResult::failure(PersistResult::IO_ERROR, "cannot open " + path);
    }

    json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return PersistResult::failure(PersistResult::CORRUPT_DATA, path + " is not a performance history");
    }

    std::map<std::string, std::deque<PerformanceRecord>> loaded;
    try {
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            if (!it.value().is_array()) {
                return PersistResult::failure(PersistResult::CORRUPT_DATA,
                                              path + ": history of '" + it.key() + "' is not a list");
            }
            std::deque<PerformanceRecord>& records = loaded[it.key()];
            for (const json& item : it.value()) {
                records.push_back(performanceRecordFromJson(item));
            }
            while (records.size() > HISTORY_CAP) {
                records.pop_front();
            }
        }
    } catch (const json::exception& e) {
        return PersistResult::failure(PersistResult::CORRUPT_DATA, path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        return PersistResult::failure(PersistResult::CORRUPT_DATA, path + ": " + e.what());
    }

    history_.swap(loaded);
    if (config_.verbose) {
        std::cout << "Performance data loaded from " << path << std::endl;
    }
    return PersistResult::success();
}

// ============================================================================
// Built-ins
// ============================================================================

bool registerBuiltinStrategies(StrategyRegistry& registry) {
    StrategyRegistry::Status results[] = {
        registry.registerStrategy<PriorityStrategy>(),
        registry.registerStrategy<RandomStrategy>(),
        registry.registerStrategy<HeuristicStrategy>(),
        registry.registerStrategy<QLearningStrategy>(),
    };

    bool ok = true;
    for (StrategyRegistry::Status status : results) {
        if (status != StrategyRegistry::OK && status != StrategyRegistry::DUPLICATE) {
            std::cerr << "Built-in strategy registration failed: " << StrategyRegistry::statusName(status)
                      << std::endl;
            ok = false;
        }
    }
    return ok;
}
