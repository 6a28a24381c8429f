#ifndef STRATEGY_HPP
#define STRATEGY_HPP

#include "Board.hpp"
#include "Evaluator.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

// Named constructor parameters, e.g. {"move_priority", "UP,LEFT,DOWN,RIGHT"}
using StrategyParams = std::map<std::string, std::string>;

// Score reported for a move that leaves the board unchanged
constexpr double INVALID_MOVE_SCORE = -999.0;

enum class StrategyCategory {
    RULE_BASED,
    HEURISTIC,
    REINFORCEMENT_LEARNING,
    DEEP_LEARNING,
    MINIMAX,
    MONTE_CARLO,
    STUDENT_SUBMISSION
};

const char* categoryName(StrategyCategory category);
std::optional<StrategyCategory> parseCategory(const std::string& name);

struct StrategyMetadata {
    std::string name;
    std::string version;
    std::string author;
    std::string description;
    StrategyCategory category = StrategyCategory::RULE_BASED;
    StrategyParams parameters;
    std::optional<double> performanceBaseline;
    bool trainingRequired = false;

    // Registry identifier: name + "_" + version
    std::string id() const { return name + "_" + version; }
};

// Outcome of one completed game
struct GameResult {
    uint64_t finalScore = 0;
    int movesCompleted = 0;
    uint32_t highestTile = 0;
};

// Cumulative statistics of one strategy instance
struct PerformanceRecord {
    int gamesPlayed = 0;
    uint64_t totalScore = 0;
    uint64_t totalMoves = 0;
    uint32_t highestTile = 0;
    double averageEfficiency = 0.0;  // score per move

    void add(const GameResult& result);
};

struct TrainOptions {
    int episodes = 1000;
    int maxStepsPerEpisode = 1000;
    int reportInterval = 100;
    bool verbose = true;
    std::optional<uint32_t> seed;  // overrides the strategy's seed for this run
};

struct TrainResult {
    bool supported = false;
    std::string message;

    int episodesTrained = 0;
    int totalEpisodes = 0;
    double averageReward = 0.0;
    double averageEpisodeLength = 0.0;
    double averageHighestTile = 0.0;
    uint32_t maxHighestTile = 0;
    double finalEpsilon = 0.0;
    std::vector<double> epsilonHistory;  // epsilon after each episode
    size_t qTableSize = 0;
    bool converged = false;
};

struct PersistResult {
    enum Status {
        OK = 0,
        FILE_MISSING,
        IO_ERROR,
        CORRUPT_DATA,
        UNSUPPORTED
    };

    Status status = OK;
    std::string message;

    bool ok() const { return status == OK; }

    static PersistResult success() { return {OK, ""}; }
    static PersistResult failure(Status status, const std::string& message) { return {status, message}; }
};

const char* persistStatusName(PersistResult::Status status);

// ============================================================================
// Strategy - capability contract shared by every decision procedure
// ============================================================================
class Strategy {
public:
    virtual ~Strategy() = default;

    virtual const StrategyMetadata& metadata() const = 0;

    // Always returns a move; detecting game over is the caller's job
    virtual Board::Move nextMove(const Board& board) = 0;

    // Scores in {UP, DOWN, LEFT, RIGHT} order. Default simulates each move and scores
    // the result with BasicEvaluator.
    virtual std::array<double, 4> moveScores(const Board& board);

    // Optional hooks, no-ops for strategies that need no training
    virtual TrainResult train(const TrainOptions& options);
    virtual PersistResult save(const std::string& path) const;
    virtual PersistResult load(const std::string& path);
    virtual void reset() {}

    void updateStats(const GameResult& result) { stats_.add(result); }
    const PerformanceRecord& stats() const { return stats_; }
    void clearStats() { stats_ = PerformanceRecord(); }

    const StrategyParams& config() const { return config_; }

protected:
    explicit Strategy(const StrategyParams& params) : config_(params) {}

    StrategyParams config_;

private:
    PerformanceRecord stats_;
};

// ============================================================================
// Fixed-priority: first move in the configured order that changes the board
// ============================================================================
class PriorityStrategy : public Strategy {
public:
    static const std::vector<Board::Move>& defaultPriority();

    explicit PriorityStrategy(const StrategyParams& params = {});

    const StrategyMetadata& metadata() const override { return metadata_; }
    Board::Move nextMove(const Board& board) override;
    std::array<double, 4> moveScores(const Board& board) override;

    // Must be a permutation of all four moves; throws InvalidConfigError otherwise
    void setMovePriority(const std::vector<Board::Move>& priority);
    const std::vector<Board::Move>& getMovePriority() const { return priority_; }

private:
    StrategyMetadata metadata_;
    std::vector<Board::Move> priority_;
};

// ============================================================================
// Random baseline: uniform over moves that change the board
// ============================================================================
class RandomStrategy : public Strategy {
public:
    explicit RandomStrategy(const StrategyParams& params = {});

    const StrategyMetadata& metadata() const override { return metadata_; }
    Board::Move nextMove(const Board& board) override;
    void reset() override;

private:
    StrategyMetadata metadata_;
    uint32_t seed_;
    std::mt19937 rng_;
};

// ============================================================================
// Heuristic-weighted: argmax of HeuristicEvaluator over the resulting boards
// ============================================================================
class HeuristicStrategy : public Strategy {
public:
    struct Explanation {
        Board::Move move;
        std::array<double, 4> scores;
        std::vector<HeuristicEvaluator::FeatureScore> features;  // of the resulting board
        std::string reasoning;
    };

    explicit HeuristicStrategy(const StrategyParams& params = {});

    const StrategyMetadata& metadata() const override { return metadata_; }
    Board::Move nextMove(const Board& board) override;
    std::array<double, 4> moveScores(const Board& board) override;

    Explanation explain(const Board& board);

    void configureWeights(const HeuristicWeights& weights);
    const HeuristicWeights& getWeights() const { return evaluator_.getWeights(); }

private:
    StrategyMetadata metadata_;
    HeuristicEvaluator evaluator_;
    std::vector<Board::Move> tieBreakOrder_;
};

// Parameter helpers shared by the strategy constructors
namespace paramutil {

std::vector<Board::Move> parseMoveList(const std::string& text);
std::string formatMoveList(const std::vector<Board::Move>& moves);
double getDouble(const StrategyParams& params, const std::string& key, double fallback);
int getInt(const StrategyParams& params, const std::string& key, int fallback);
std::string formatDouble(double value);

} // namespace paramutil

#endif // STRATEGY_HPP
