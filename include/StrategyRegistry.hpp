#ifndef STRATEGY_REGISTRY_HPP
#define STRATEGY_REGISTRY_HPP

#include "Strategy.hpp"
#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Thrown when a second writer enters a mutating registry call while another is active
class ConcurrentMutationError : public std::runtime_error {
public:
    explicit ConcurrentMutationError(const std::string& what) : std::runtime_error(what) {}
};

// Registration, lookup, performance history and ranking of strategies.
// Single writer: overlapping mutations throw ConcurrentMutationError.
class StrategyRegistry {
public:
    using Factory = std::function<std::unique_ptr<Strategy>(const StrategyParams&)>;

    static constexpr size_t HISTORY_CAP = 100;
    static constexpr size_t RECENT_RECORDS = 10;
    static constexpr size_t STABILITY_WINDOW = 5;

    // Composite ranking weights
    static constexpr double EFFICIENCY_WEIGHT = 0.4;
    static constexpr double CONSISTENCY_WEIGHT = 0.3;
    static constexpr double HIGHEST_TILE_WEIGHT = 0.2;
    static constexpr double IMPROVEMENT_WEIGHT = 0.1;

    enum Status {
        OK = 0,
        NOT_FOUND,
        DUPLICATE,
        INVALID_CONFIG
    };

    struct Config {
        bool verbose;  // log registrations to stdout

        Config() : verbose(false) {}
    };

    struct Lookup {
        Status status = NOT_FOUND;
        std::unique_ptr<Strategy> strategy;
        std::string message;

        bool ok() const { return status == OK; }
    };

    struct StrategyInfo {
        std::string id;
        StrategyMetadata metadata;
        std::vector<PerformanceRecord> history;
        std::vector<PerformanceRecord> recent;  // last RECENT_RECORDS entries
    };

    struct RankingEntry {
        std::string id;
        std::string name;
        std::string category;
        int gamesPlayed = 0;
        double averageEfficiency = 0.0;
        uint32_t highestTile = 0;
        double consistency = 0.0;
        double improvement = 0.0;  // least-squares slope of efficiency over history
        double stability = 0.0;
        double compositeScore = 0.0;
        int rank = 0;
        int categoryRank = 0;
        double percentile = 0.0;
    };

    struct Comparison {
        std::vector<RankingEntry> entries;  // input order, unknown or empty ids skipped
        std::vector<std::string> byEfficiency;
        std::vector<std::string> byHighestTile;
        std::vector<std::string> byConsistency;
    };

    explicit StrategyRegistry(const Config& config = Config());

    StrategyRegistry(const StrategyRegistry&) = delete;
    StrategyRegistry& operator=(const StrategyRegistry&) = delete;

    // Instantiates once with empty params to read metadata. INVALID_CONFIG when that
    // instantiation rejects its parameters.
    Status registerStrategy(const Factory& factory, bool override = false);

    template <typename T>
    Status registerStrategy(bool override = false) {
        return registerStrategy([](const StrategyParams& params) { return std::make_unique<T>(params); },
                                override);
    }

    Lookup create(const std::string& id, const StrategyParams& params = {}) const;

    bool contains(const std::string& id) const { return index_.count(id) > 0; }
    size_t size() const { return entries_.size(); }

    // Registration order
    std::vector<StrategyMetadata> list(std::optional<StrategyCategory> category = std::nullopt) const;
    std::optional<StrategyInfo> info(const std::string& id) const;

    // Appends to the bounded history of a registered id
    Status recordPerformance(const std::string& id, const PerformanceRecord& record);
    const std::deque<PerformanceRecord>& history(const std::string& id) const;
    void clearPerformance();

    // Composite ranking over ids with history; ties keep registration order
    std::vector<RankingEntry> rank(const std::vector<std::string>& ids) const;
    std::vector<RankingEntry> leaderboard() const;

    // Single metric ranking: average_efficiency, highest_tile, consistency_score,
    // games_played, improvement_rate or stability_index. Throws InvalidConfigError for
    // anything else.
    std::vector<RankingEntry> leaderboardBy(const std::string& metric, size_t limit = 10) const;

    Comparison compare(const std::vector<std::string>& ids) const;

    nlohmann::json exportPerformance() const;
    PersistResult exportPerformance(const std::string& path) const;

    // Raw history persistence: {"<id>": [record, ...], ...}
    PersistResult savePerformance(const std::string& path) const;
    PersistResult loadPerformance(const std::string& path);

    static const char* statusName(Status status);

private:
    struct Entry {
        std::string id;
        StrategyMetadata metadata;
        Factory factory;
    };

    // Holds the writer flag for the duration of one mutating call
    class WriteGuard {
    public:
        explicit WriteGuard(std::atomic<bool>& flag);
        ~WriteGuard();

        WriteGuard(const WriteGuard&) = delete;
        WriteGuard& operator=(const WriteGuard&) = delete;

    private:
        std::atomic<bool>& flag_;
    };

    std::vector<std::string> historyIds() const;
    RankingEntry metricsFor(const std::string& id) const;

    Config config_;
    std::vector<Entry> entries_;
    std::map<std::string, size_t> index_;
    std::map<std::string, std::deque<PerformanceRecord>> history_;
    std::atomic<bool> writing_{false};
};

// Registers Basic Priority, Random, Enhanced Heuristic and Q-Learning. Already
// registered ids are left as they are; returns false if any registration failed.
bool registerBuiltinStrategies(StrategyRegistry& registry);

nlohmann::json toJson(const PerformanceRecord& record);
PerformanceRecord performanceRecordFromJson(const nlohmann::json& doc);

#endif // STRATEGY_REGISTRY_HPP
