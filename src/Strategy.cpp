#include "Strategy.hpp"
#include "GameUtils.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <sstream>

// ============================================================================
// Enum names
// ============================================================================

const char* categoryName(StrategyCategory category) {
    switch (category) {
    case StrategyCategory::RULE_BASED: return "rule_based";
    case StrategyCategory::HEURISTIC: return "heuristic";
    case StrategyCategory::REINFORCEMENT_LEARNING: return "reinforcement_learning";
    case StrategyCategory::DEEP_LEARNING: return "deep_learning";
    case StrategyCategory::MINIMAX: return "minimax";
    case StrategyCategory::MONTE_CARLO: return "monte_carlo";
    case StrategyCategory::STUDENT_SUBMISSION: return "student_submission";
    }
    return "unknown";
}

std::optional<StrategyCategory> parseCategory(const std::string& name) {
    static const StrategyCategory all[] = {
        StrategyCategory::RULE_BASED, StrategyCategory::HEURISTIC,
        StrategyCategory::REINFORCEMENT_LEARNING, StrategyCategory::DEEP_LEARNING,
        StrategyCategory::MINIMAX, StrategyCategory::MONTE_CARLO,
        StrategyCategory::STUDENT_SUBMISSION,
    };
    for (StrategyCategory category : all) {
        if (name == categoryName(category)) return category;
    }
    return std::nullopt;
}

const char* persistStatusName(PersistResult::Status status) {
    switch (status) {
    case PersistResult::OK: return "ok";
    case PersistResult::FILE_MISSING: return "file_missing";
    case PersistResult::IO_ERROR: return "io_error";
    case PersistResult::CORRUPT_DATA: return "corrupt_data";
    case PersistResult::UNSUPPORTED: return "unsupported";
    }
    return "unknown";
}

void PerformanceRecord::add(const GameResult& result) {
    gamesPlayed++;
    totalScore += result.finalScore;
    totalMoves += result.movesCompleted;
    highestTile = std::max(highestTile, result.highestTile);
    averageEfficiency = totalMoves > 0 ? static_cast<double>(totalScore) / totalMoves : 0.0;
}

// ============================================================================
// Parameter helpers
// ============================================================================

namespace paramutil {

std::vector<Board::Move> parseMoveList(const std::string& text) {
    std::vector<Board::Move> moves;
    std::string token;
    std::istringstream in(text);
    while (std::getline(in, token, ',')) {
        token.erase(std::remove_if(token.begin(), token.end(),
                                   [](unsigned char ch) { return std::isspace(ch); }),
                    token.end());
        if (token.empty()) continue;
        auto move = GameUtils::parseMove(token);
        if (!move) {
            throw InvalidConfigError("unknown move '" + token + "'");
        }
        moves.push_back(*move);
    }
    return moves;
}

std::string formatMoveList(const std::vector<Board::Move>& moves) {
    std::string out;
    for (size_t i = 0; i < moves.size(); i++) {
        if (i > 0) out += ",";
        out += GameUtils::moveName(moves[i]);
    }
    return out;
}

double getDouble(const StrategyParams& params, const std::string& key, double fallback) {
    auto it = params.find(key);
    if (it == params.end()) return fallback;

    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(it->second, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != it->second.size() || !std::isfinite(value)) {
        throw InvalidConfigError("parameter '" + key + "' is not a number: " + it->second);
    }
    return value;
}

int getInt(const StrategyParams& params, const std::string& key, int fallback) {
    auto it = params.find(key);
    if (it == params.end()) return fallback;

    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(it->second, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != it->second.size()) {
        throw InvalidConfigError("parameter '" + key + "' is not an integer: " + it->second);
    }
    return value;
}

std::string formatDouble(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

} // namespace paramutil

// ============================================================================
// Strategy defaults
// ============================================================================

std::array<double, 4> Strategy::moveScores(const Board& board) {
    BasicEvaluator evaluator;
    std::array<double, 4> scores;
    for (Board::Move move : Board::ALL_MOVES) {
        Board::MoveOutcome outcome = board.apply(move);
        scores[move] = outcome.moved ? evaluator.evaluate(outcome.board) : INVALID_MOVE_SCORE;
    }
    return scores;
}

TrainResult Strategy::train(const TrainOptions&) {
    TrainResult result;
    result.supported = false;
    result.message = metadata().id() + " does not support training";
    return result;
}

PersistResult Strategy::save(const std::string&) const {
    return PersistResult::failure(PersistResult::UNSUPPORTED, metadata().id() + " has no state to save");
}

PersistResult Strategy::load(const std::string&) {
    return PersistResult::failure(PersistResult::UNSUPPORTED, metadata().id() + " has no state to load");
}

// ============================================================================
// PriorityStrategy
// ============================================================================

const std::vector<Board::Move>& PriorityStrategy::defaultPriority() {
    static const std::vector<Board::Move> order = {Board::UP, Board::LEFT, Board::DOWN, Board::RIGHT};
    return order;
}

PriorityStrategy::PriorityStrategy(const StrategyParams& params) : Strategy(params) {
    for (const auto& [key, value] : params) {
        if (key != "move_priority") {
            throw InvalidConfigError("unknown parameter '" + key + "' for Basic Priority");
        }
    }

    auto it = params.find("move_priority");
    setMovePriority(it != params.end() ? paramutil::parseMoveList(it->second) : defaultPriority());

    metadata_.name = "Basic Priority";
    metadata_.version = "1.0";
    metadata_.author = "2048 Bot Team";
    metadata_.description = "Rule-based baseline that tries moves in a fixed priority order.";
    metadata_.category = StrategyCategory::RULE_BASED;
    metadata_.parameters = {{"move_priority", paramutil::formatMoveList(defaultPriority())}};
    metadata_.performanceBaseline = 1.8;
    metadata_.trainingRequired = false;
}

void PriorityStrategy::setMovePriority(const std::vector<Board::Move>& priority) {
    std::vector<Board::Move> sorted = priority;
    std::sort(sorted.begin(), sorted.end());
    if (sorted.size() != 4 || std::unique(sorted.begin(), sorted.end()) != sorted.end()) {
        throw InvalidConfigError("move priority must list each of UP, DOWN, LEFT, RIGHT once");
    }
    priority_ = priority;
    config_["move_priority"] = paramutil::formatMoveList(priority_);
}

Board::Move PriorityStrategy::nextMove(const Board& board) {
    for (Board::Move move : priority_) {
        if (board.canMove(move)) {
            return move;
        }
    }
    return priority_.front();
}

std::array<double, 4> PriorityStrategy::moveScores(const Board& board) {
    std::array<double, 4> scores;
    for (size_t rank = 0; rank < priority_.size(); rank++) {
        Board::Move move = priority_[rank];
        scores[move] = board.canMove(move) ? 100.0 - rank * 10.0 : INVALID_MOVE_SCORE;
    }
    return scores;
}

// ============================================================================
// RandomStrategy
// ============================================================================

RandomStrategy::RandomStrategy(const StrategyParams& params) : Strategy(params) {
    for (const auto& [key, value] : params) {
        if (key != "seed") {
            throw InvalidConfigError("unknown parameter '" + key + "' for Random");
        }
    }
    if (params.count("seed")) {
        seed_ = static_cast<uint32_t>(paramutil::getInt(params, "seed", 0));
    } else {
        seed_ = static_cast<uint32_t>(std::chrono::steady_clock::now().time_since_epoch().count());
    }
    rng_.seed(seed_);

    metadata_.name = "Random";
    metadata_.version = "1.0";
    metadata_.author = "2048 Bot Team";
    metadata_.description = "Uniform random choice among moves that change the board. Comparison baseline.";
    metadata_.category = StrategyCategory::RULE_BASED;
    metadata_.performanceBaseline = 0.5;
    metadata_.trainingRequired = false;
}

Board::Move RandomStrategy::nextMove(const Board& board) {
    std::vector<Board::Move> moves = board.legalMoves();
    if (moves.empty()) {
        moves.assign(Board::ALL_MOVES.begin(), Board::ALL_MOVES.end());
    }
    std::uniform_int_distribution<size_t> dist(0, moves.size() - 1);
    return moves[dist(rng_)];
}

void RandomStrategy::reset() {
    rng_.seed(seed_);
}

// ============================================================================
// HeuristicStrategy
// ============================================================================

HeuristicStrategy::HeuristicStrategy(const StrategyParams& params)
    : Strategy(params)
    , tieBreakOrder_(PriorityStrategy::defaultPriority()) {
    std::map<std::string, double> weightValues;
    for (const auto& [key, value] : params) {
        if (key == "move_priority") continue;
        if (std::find(HeuristicWeights::keys().begin(), HeuristicWeights::keys().end(), key) ==
            HeuristicWeights::keys().end()) {
            throw InvalidConfigError("unknown parameter '" + key + "' for Enhanced Heuristic");
        }
        weightValues[key] = paramutil::getDouble(params, key, 0.0);
    }

    // Either the defaults or a complete weight set
    if (!weightValues.empty()) {
        configureWeights(HeuristicWeights::fromMap(weightValues));
    } else {
        configureWeights(HeuristicWeights());
    }

    auto it = params.find("move_priority");
    if (it != params.end()) {
        PriorityStrategy validator({{"move_priority", it->second}});
        tieBreakOrder_ = validator.getMovePriority();
    }

    metadata_.name = "Enhanced Heuristic";
    metadata_.version = "2.1";
    metadata_.author = "2048 Bot Team";
    metadata_.description =
        "Weighted heuristic over empty tiles, merge potential, corner placement, monotonicity and max tile.";
    metadata_.category = StrategyCategory::HEURISTIC;
    for (const auto& [key, value] : HeuristicWeights().toMap()) {
        metadata_.parameters[key] = paramutil::formatDouble(value);
    }
    metadata_.performanceBaseline = 2.36;
    metadata_.trainingRequired = false;
}

void HeuristicStrategy::configureWeights(const HeuristicWeights& weights) {
    evaluator_.setWeights(weights);
    for (const auto& [key, value] : weights.toMap()) {
        config_[key] = paramutil::formatDouble(value);
    }
}

std::array<double, 4> HeuristicStrategy::moveScores(const Board& board) {
    std::array<double, 4> scores;
    for (Board::Move move : Board::ALL_MOVES) {
        Board::MoveOutcome outcome = board.apply(move);
        scores[move] = outcome.moved ? evaluator_.evaluate(outcome.board) : INVALID_MOVE_SCORE;
    }
    return scores;
}

Board::Move HeuristicStrategy::nextMove(const Board& board) {
    std::array<double, 4> scores = moveScores(board);

    // Only moves that change the board compete; INVALID_MOVE_SCORE is for reporting and
    // can exceed real scores under negative weights. Strict comparison keeps the earliest
    // move of the tie-break order on ties.
    Board::Move best = tieBreakOrder_.front();
    bool found = false;
    double bestScore = 0.0;
    for (Board::Move move : tieBreakOrder_) {
        if (!board.canMove(move)) continue;
        if (!found || scores[move] > bestScore) {
            best = move;
            bestScore = scores[move];
            found = true;
        }
    }
    return best;
}

HeuristicStrategy::Explanation HeuristicStrategy::explain(const Board& board) {
    Explanation explanation;
    explanation.scores = moveScores(board);
    explanation.move = nextMove(board);

    Board::MoveOutcome outcome = board.apply(explanation.move);
    explanation.features = HeuristicEvaluator::breakdown(outcome.board, evaluator_.getWeights());

    std::ostringstream reason;
    if (!outcome.moved) {
        reason << "Move " << GameUtils::moveName(explanation.move) << " chosen but no move changes the board";
    } else {
        reason << "Move " << GameUtils::moveName(explanation.move) << " chosen (score: "
               << explanation.scores[explanation.move] << ") - results in "
               << outcome.board.emptyCount() << " empty tiles";
    }
    explanation.reasoning = reason.str();
    return explanation;
}
