#ifndef EVALUATOR_HPP
#define EVALUATOR_HPP

#include "Board.hpp"
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// Thrown for weight sets and strategy parameters that are missing keys or malformed
class InvalidConfigError : public std::invalid_argument {
public:
    explicit InvalidConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// Weighted feature set for HeuristicEvaluator. Defaults are tuned starting points.
struct HeuristicWeights {
    double emptyTiles = 150.0;
    double mergePotential = 100.0;
    double cornerBonus = 250.0;
    double monotonicity = 75.0;
    double maxTileValue = 15.0;

    static const std::vector<std::string>& keys();

    // Requires all five keys; unknown keys and non-finite values are rejected
    static HeuristicWeights fromMap(const std::map<std::string, double>& values);
    std::map<std::string, double> toMap() const;

    HeuristicWeights scaled(double factor) const;
};

// Abstract interface for board evaluation
class Evaluator {
public:
    virtual ~Evaluator() = default;

    // Higher is better
    virtual double evaluate(const Board& board) const = 0;
};

// Empty cells and max tile only; backs the default move scorer
class BasicEvaluator : public Evaluator {
public:
    static constexpr double EMPTY_WEIGHT = 10.0;
    static constexpr double MAX_TILE_WEIGHT = 0.1;

    double evaluate(const Board& board) const override;
};

class HeuristicEvaluator : public Evaluator {
public:
    struct FeatureScore {
        std::string name;
        double rawValue = 0.0;
        double weight = 0.0;
        double weightedScore = 0.0;
    };

    HeuristicEvaluator() = default;
    explicit HeuristicEvaluator(const HeuristicWeights& weights) : weights_(weights) {}

    double evaluate(const Board& board) const override { return score(board, weights_); }

    const HeuristicWeights& getWeights() const { return weights_; }
    void setWeights(const HeuristicWeights& weights) { weights_ = weights; }

    // Weighted sum of the features below
    static double score(const Board& board, const HeuristicWeights& weights);

    // Validates the grid first; throws InvalidBoardError instead of scoring garbage
    static double score(const std::vector<std::vector<int>>& grid, const HeuristicWeights& weights);

    // Per-feature contribution, in the order of HeuristicWeights::keys()
    static std::vector<FeatureScore> breakdown(const Board& board, const HeuristicWeights& weights);

    // Features
    static int emptyTiles(const Board& board);
    static int mergePotential(const Board& board);
    static double cornerBonus(const Board& board);
    static double monotonicity(const Board& board);
    static double maxTileValue(const Board& board);

private:
    HeuristicWeights weights_;
};

#endif // EVALUATOR_HPP
