#ifndef ENVIRONMENT_HPP
#define ENVIRONMENT_HPP

#include "Board.hpp"
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <random>
#include <vector>

// Inputs to a reward function. `after` is the board right after the move, before the
// random tile is spawned.
struct RewardContext {
    const Board& before;
    const Board& after;
    bool moved;
    uint32_t scoreDelta;
};

using RewardFunction = std::function<double(const RewardContext&)>;

struct RewardConfig {
    double invalidMovePenalty = -10.0;
    double emptyTileWeight = 2.0;
    double maxTileLogWeight = 1.0;
    double monotonicityWeight = 5.0;
};

// Score delta + empty cells + log2(max tile) + monotonicity, or a flat penalty for a
// move that changes nothing
RewardFunction shapedReward(const RewardConfig& config = RewardConfig());

// Raw merge score only
RewardFunction scoreReward();

// ============================================================================
// Episodic 2048 simulation used for training and offline play
// ============================================================================
class Game2048Environment {
public:
    static constexpr int OBSERVATION_SIZE = Board::CELLS + 1;

    struct Config {
        uint32_t seed = 0;
        double fourProbability = 0.1;  // chance a spawned tile is a 4
        double scoreScale = 10000.0;   // observation score divisor
        RewardFunction reward;         // shapedReward() when empty

        Config() {}
    };

    using Observation = std::vector<float>;

    struct StepInfo {
        bool moved = false;
        uint32_t scoreDelta = 0;
        uint32_t highestTile = 0;
        int emptyTiles = 0;
        int totalMoves = 0;
        double efficiency = 0.0;  // score per step taken
    };

    struct StepResult {
        Observation observation;
        double reward = 0.0;
        bool done = false;
        StepInfo info;
    };

    explicit Game2048Environment(const Config& config = Config());

    Observation reset();

    // Starts an episode from a given position instead of two random tiles
    Observation loadBoard(const Board& board, uint64_t score = 0);

    // Throws std::logic_error once the episode is done
    StepResult step(Board::Move move);

    std::vector<Board::Move> validMoves() const { return board_.legalMoves(); }
    Observation observation() const;
    void render(std::ostream& out) const;

    const Board& board() const { return board_; }
    uint64_t score() const { return score_; }
    bool isDone() const { return done_; }
    int totalMoves() const { return totalMoves_; }
    uint32_t highestTile() const { return highestTile_; }

    void seed(uint32_t seed) { rng_.seed(seed); }
    void setRewardFunction(const RewardFunction& reward);

private:
    void addRandomTile();

    Config config_;
    std::mt19937 rng_;
    Board board_;
    uint64_t score_ = 0;
    bool done_ = false;
    int totalMoves_ = 0;
    uint32_t highestTile_ = 0;
};

#endif // ENVIRONMENT_HPP
