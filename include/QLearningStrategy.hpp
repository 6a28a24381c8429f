#ifndef QLEARNING_STRATEGY_HPP
#define QLEARNING_STRATEGY_HPP

#include "Environment.hpp"
#include "QTable.hpp"
#include "Strategy.hpp"
#include <random>
#include <vector>

// Tabular Q-learning over exact board states
class QLearningStrategy : public Strategy {
public:
    struct Config {
        double learningRate = 0.1;
        double discountFactor = 0.95;
        double epsilon = 0.1;        // exploration rate
        double epsilonDecay = 0.995; // applied once per episode
        double minEpsilon = 0.01;
        uint32_t seed = 0;

        // Reads learning_rate, discount_factor, epsilon, epsilon_decay, min_epsilon and
        // seed; throws InvalidConfigError for unknown keys or out of range values
        static Config fromParams(const StrategyParams& params);
        StrategyParams toParams() const;
        void validate() const;
    };

    struct Progress {
        int trainingEpisodes = 0;
        bool isTrained = false;
        double epsilon = 0.0;
        size_t qTableSize = 0;
        std::vector<double> recentRewards;  // last 100 episode rewards
    };

    static constexpr size_t RECENT_REWARDS = 100;

    explicit QLearningStrategy(const StrategyParams& params = {});
    explicit QLearningStrategy(const Config& config);

    const StrategyMetadata& metadata() const override { return metadata_; }

    // Greedy over Q-values; ties prefer moves that change the board, then lower index
    Board::Move nextMove(const Board& board) override;
    std::array<double, 4> moveScores(const Board& board) override;

    TrainResult train(const TrainOptions& options) override;
    PersistResult save(const std::string& path) const override;
    PersistResult load(const std::string& path) override;

    Progress trainingProgress() const;

    const QTable& qTable() const { return qTable_; }
    const Config& getConfig() const { return learnerConfig_; }
    double epsilon() const { return epsilon_; }
    bool isTrained() const { return isTrained_; }

private:
    void initMetadata();
    Board::Move greedyMove(const Board& board) const;

    StrategyMetadata metadata_;
    Config learnerConfig_;
    QTable qTable_;
    double epsilon_;
    int trainingEpisodes_ = 0;
    bool isTrained_ = false;
    std::vector<double> trainingRewards_;
    std::mt19937 rng_;
};

#endif // QLEARNING_STRATEGY_HPP
