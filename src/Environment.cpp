#include "Environment.hpp"
#include "Evaluator.hpp"
#include "GameUtils.hpp"
#include "Profiler.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

// ============================================================================
// Reward functions
// ============================================================================

RewardFunction shapedReward(const RewardConfig& config) {
    return [config](const RewardContext& ctx) {
        if (!ctx.moved) {
            return config.invalidMovePenalty;
        }

        double reward = static_cast<double>(ctx.scoreDelta);
        reward += ctx.after.emptyCount() * config.emptyTileWeight;

        uint32_t maxTile = ctx.after.maxTile();
        if (maxTile > 0) {
            reward += std::log2(static_cast<double>(maxTile)) * config.maxTileLogWeight;
        }

        reward += HeuristicEvaluator::monotonicity(ctx.after) * config.monotonicityWeight;
        return reward;
    };
}

RewardFunction scoreReward() {
    return [](const RewardContext& ctx) {
        return static_cast<double>(ctx.scoreDelta);
    };
}

// ============================================================================
// Game2048Environment
// ============================================================================

Game2048Environment::Game2048Environment(const Config& config)
    : config_(config)
    , rng_(config.seed) {
    if (!config_.reward) {
        config_.reward = shapedReward();
    }
    if (config_.fourProbability < 0.0 || config_.fourProbability > 1.0) {
        throw std::invalid_argument("fourProbability must be within [0, 1]");
    }
    if (config_.scoreScale <= 0.0) {
        throw std::invalid_argument("scoreScale must be positive");
    }
}

void Game2048Environment::setRewardFunction(const RewardFunction& reward) {
    config_.reward = reward ? reward : shapedReward();
}

Game2048Environment::Observation Game2048Environment::reset() {
    board_ = Board::empty();
    score_ = 0;
    done_ = false;
    totalMoves_ = 0;
    highestTile_ = 0;

    addRandomTile();
    addRandomTile();
    highestTile_ = board_.maxTile();

    return observation();
}

Game2048Environment::Observation Game2048Environment::loadBoard(const Board& board, uint64_t score) {
    board_ = board;
    score_ = score;
    totalMoves_ = 0;
    highestTile_ = board_.maxTile();
    done_ = !board_.hasLegalMove();
    return observation();
}

void Game2048Environment::addRandomTile() {
    std::vector<int> emptyCells;
    emptyCells.reserve(Board::CELLS);
    for (int i = 0; i < Board::CELLS; i++) {
        if (board_.cells()[i] == 0) {
            emptyCells.push_back(i);
        }
    }
    if (emptyCells.empty()) {
        return;
    }

    std::uniform_int_distribution<size_t> pick(0, emptyCells.size() - 1);
    int cell = emptyCells[pick(rng_)];

    std::uniform_real_distribution<double> roll(0.0, 1.0);
    uint32_t value = roll(rng_) < config_.fourProbability ? 4 : 2;

    board_ = board_.withTile(cell / Board::SIZE, cell % Board::SIZE, value);
}

Game2048Environment::StepResult Game2048Environment::step(Board::Move move) {
    PROFILE_SCOPE("Environment::step");
    if (done_) {
        throw std::logic_error("episode is finished, call reset() to start a new one");
    }

    Board before = board_;
    Board::MoveOutcome outcome = board_.apply(move);
    totalMoves_++;

    StepResult result;
    result.reward = config_.reward(RewardContext{before, outcome.board, outcome.moved, outcome.scoreDelta});

    if (outcome.moved) {
        board_ = outcome.board;
        score_ += outcome.scoreDelta;
        addRandomTile();
    }

    done_ = !board_.hasLegalMove();
    highestTile_ = std::max(highestTile_, board_.maxTile());

    result.done = done_;
    result.observation = observation();
    result.info.moved = outcome.moved;
    result.info.scoreDelta = outcome.scoreDelta;
    result.info.highestTile = highestTile_;
    result.info.emptyTiles = board_.emptyCount();
    result.info.totalMoves = totalMoves_;
    result.info.efficiency = static_cast<double>(score_) / std::max(totalMoves_, 1);
    return result;
}

Game2048Environment::Observation Game2048Environment::observation() const {
    Observation obs;
    obs.reserve(OBSERVATION_SIZE);
    for (uint32_t value : board_.cells()) {
        obs.push_back(value > 0 ? static_cast<float>(std::log2(static_cast<double>(value))) : 0.0f);
    }
    obs.push_back(static_cast<float>(score_ / config_.scoreScale));
    return obs;
}

void Game2048Environment::render(std::ostream& out) const {
    out << "Score: " << GameUtils::formatWithCommas(static_cast<long long>(score_)) << "\n";
    out << "Moves: " << totalMoves_ << "\n";
    GameUtils::printBoard(board_, out);
}
