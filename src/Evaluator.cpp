#include "Evaluator.hpp"
#include "Profiler.hpp"
#include <algorithm>
#include <cmath>

// ============================================================================
// HeuristicWeights
// ============================================================================

const std::vector<std::string>& HeuristicWeights::keys() {
    static const std::vector<std::string> names = {
        "empty_tiles", "merge_potential", "corner_bonus", "monotonicity", "max_tile_value"
    };
    return names;
}

HeuristicWeights HeuristicWeights::fromMap(const std::map<std::string, double>& values) {
    for (const auto& [key, value] : values) {
        if (std::find(keys().begin(), keys().end(), key) == keys().end()) {
            throw InvalidConfigError("unknown heuristic weight '" + key + "'");
        }
        if (!std::isfinite(value)) {
            throw InvalidConfigError("heuristic weight '" + key + "' is not finite");
        }
    }

    auto require = [&values](const std::string& key) {
        auto it = values.find(key);
        if (it == values.end()) {
            throw InvalidConfigError("missing heuristic weight '" + key + "'");
        }
        return it->second;
    };

    HeuristicWeights weights;
    weights.emptyTiles = require("empty_tiles");
    weights.mergePotential = require("merge_potential");
    weights.cornerBonus = require("corner_bonus");
    weights.monotonicity = require("monotonicity");
    weights.maxTileValue = require("max_tile_value");
    return weights;
}

std::map<std::string, double> HeuristicWeights::toMap() const {
    return {
        {"empty_tiles", emptyTiles},
        {"merge_potential", mergePotential},
        {"corner_bonus", cornerBonus},
        {"monotonicity", monotonicity},
        {"max_tile_value", maxTileValue},
    };
}

HeuristicWeights HeuristicWeights::scaled(double factor) const {
    HeuristicWeights out = *this;
    out.emptyTiles *= factor;
    out.mergePotential *= factor;
    out.cornerBonus *= factor;
    out.monotonicity *= factor;
    out.maxTileValue *= factor;
    return out;
}

// ============================================================================
// BasicEvaluator
// ============================================================================

double BasicEvaluator::evaluate(const Board& board) const {
    return board.emptyCount() * EMPTY_WEIGHT + board.maxTile() * MAX_TILE_WEIGHT;
}

// ============================================================================
// HeuristicEvaluator
// ============================================================================

int HeuristicEvaluator::emptyTiles(const Board& board) {
    return board.emptyCount();
}

int HeuristicEvaluator::mergePotential(const Board& board) {
    int pairs = 0;
    for (int r = 0; r < Board::SIZE; r++) {
        for (int c = 0; c < Board::SIZE; c++) {
            uint32_t value = board.at(r, c);
            if (value == 0) continue;
            if (c + 1 < Board::SIZE && board.at(r, c + 1) == value) pairs++;
            if (r + 1 < Board::SIZE && board.at(r + 1, c) == value) pairs++;
        }
    }
    return pairs;
}

double HeuristicEvaluator::cornerBonus(const Board& board) {
    uint32_t maxTile = board.maxTile();
    if (maxTile == 0) {
        return 0.0;
    }
    const int n = Board::SIZE - 1;
    if (board.at(0, 0) == maxTile || board.at(0, n) == maxTile ||
        board.at(n, 0) == maxTile || board.at(n, n) == maxTile) {
        return 1.0;
    }
    return 0.0;
}

namespace {

// Non-zero values of a line are fully non-increasing or fully non-decreasing
bool isMonotonicLine(const std::vector<uint32_t>& values) {
    if (values.size() < 2) return false;
    bool nonDecreasing = std::is_sorted(values.begin(), values.end());
    bool nonIncreasing = std::is_sorted(values.rbegin(), values.rend());
    return nonDecreasing || nonIncreasing;
}

} // namespace

double HeuristicEvaluator::monotonicity(const Board& board) {
    double score = 0.0;
    std::vector<uint32_t> line;
    line.reserve(Board::SIZE);

    for (int r = 0; r < Board::SIZE; r++) {
        line.clear();
        for (int c = 0; c < Board::SIZE; c++) {
            if (board.at(r, c) != 0) line.push_back(board.at(r, c));
        }
        if (isMonotonicLine(line)) score += 1.0;
    }

    for (int c = 0; c < Board::SIZE; c++) {
        line.clear();
        for (int r = 0; r < Board::SIZE; r++) {
            if (board.at(r, c) != 0) line.push_back(board.at(r, c));
        }
        if (isMonotonicLine(line)) score += 1.0;
    }

    return score;
}

double HeuristicEvaluator::maxTileValue(const Board& board) {
    return static_cast<double>(board.maxTile());
}

double HeuristicEvaluator::score(const Board& board, const HeuristicWeights& weights) {
    PROFILE_SCOPE("HeuristicEvaluator::score");
    double total = 0.0;
    total += emptyTiles(board) * weights.emptyTiles;
    total += mergePotential(board) * weights.mergePotential;
    total += cornerBonus(board) * weights.cornerBonus;
    total += monotonicity(board) * weights.monotonicity;
    total += maxTileValue(board) * weights.maxTileValue;
    return total;
}

double HeuristicEvaluator::score(const std::vector<std::vector<int>>& grid, const HeuristicWeights& weights) {
    return score(Board::fromRows(grid), weights);
}

std::vector<HeuristicEvaluator::FeatureScore> HeuristicEvaluator::breakdown(const Board& board,
                                                                            const HeuristicWeights& weights) {
    const double raw[] = {
        static_cast<double>(emptyTiles(board)),
        static_cast<double>(mergePotential(board)),
        cornerBonus(board),
        monotonicity(board),
        maxTileValue(board),
    };
    const double weight[] = {
        weights.emptyTiles, weights.mergePotential, weights.cornerBonus,
        weights.monotonicity, weights.maxTileValue,
    };

    std::vector<FeatureScore> features;
    features.reserve(HeuristicWeights::keys().size());
    for (size_t i = 0; i < HeuristicWeights::keys().size(); i++) {
        FeatureScore feature;
        feature.name = HeuristicWeights::keys()[i];
        feature.rawValue = raw[i];
        feature.weight = weight[i];
        feature.weightedScore = raw[i] * weight[i];
        features.push_back(feature);
    }
    return features;
}
