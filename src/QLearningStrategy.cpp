#include "QLearningStrategy.hpp"
#include "Profiler.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <numeric>

using json = nlohmann::json;

namespace {

double mean(const std::vector<double>& values, size_t from = 0) {
    if (from >= values.size()) return 0.0;
    double sum = std::accumulate(values.begin() + from, values.end(), 0.0);
    return sum / static_cast<double>(values.size() - from);
}

} // namespace

// ============================================================================
// Config
// ============================================================================

QLearningStrategy::Config QLearningStrategy::Config::fromParams(const StrategyParams& params) {
    static const std::vector<std::string> known = {
        "learning_rate", "discount_factor", "epsilon", "epsilon_decay", "min_epsilon", "seed",
    };
    for (const auto& [key, value] : params) {
        if (std::find(known.begin(), known.end(), key) == known.end()) {
            throw InvalidConfigError("unknown parameter '" + key + "' for Q-Learning");
        }
    }

    Config config;
    config.learningRate = paramutil::getDouble(params, "learning_rate", config.learningRate);
    config.discountFactor = paramutil::getDouble(params, "discount_factor", config.discountFactor);
    config.epsilon = paramutil::getDouble(params, "epsilon", config.epsilon);
    config.epsilonDecay = paramutil::getDouble(params, "epsilon_decay", config.epsilonDecay);
    config.minEpsilon = paramutil::getDouble(params, "min_epsilon", config.minEpsilon);
    config.seed = static_cast<uint32_t>(paramutil::getInt(params, "seed", static_cast<int>(config.seed)));
    config.validate();
    return config;
}

StrategyParams QLearningStrategy::Config::toParams() const {
    return {
        {"learning_rate", paramutil::formatDouble(learningRate)},
        {"discount_factor", paramutil::formatDouble(discountFactor)},
        {"epsilon", paramutil::formatDouble(epsilon)},
        {"epsilon_decay", paramutil::formatDouble(epsilonDecay)},
        {"min_epsilon", paramutil::formatDouble(minEpsilon)},
        {"seed", std::to_string(seed)},
    };
}

void QLearningStrategy::Config::validate() const {
    auto inUnitRange = [](double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; };
    if (!inUnitRange(learningRate) || learningRate == 0.0) {
        throw InvalidConfigError("learning_rate must be within (0, 1]");
    }
    if (!inUnitRange(discountFactor)) {
        throw InvalidConfigError("discount_factor must be within [0, 1]");
    }
    if (!inUnitRange(epsilon)) {
        throw InvalidConfigError("epsilon must be within [0, 1]");
    }
    if (!inUnitRange(epsilonDecay) || epsilonDecay == 0.0) {
        throw InvalidConfigError("epsilon_decay must be within (0, 1]");
    }
    if (!inUnitRange(minEpsilon) || minEpsilon > epsilon) {
        throw InvalidConfigError("min_epsilon must be within [0, epsilon]");
    }
}

// ============================================================================
// QLearningStrategy
// ============================================================================

QLearningStrategy::QLearningStrategy(const StrategyParams& params)
    : QLearningStrategy(Config::fromParams(params)) {}

QLearningStrategy::QLearningStrategy(const Config& config)
    : Strategy(config.toParams())
    , learnerConfig_(config)
    , epsilon_(config.epsilon)
    , rng_(config.seed) {
    learnerConfig_.validate();
    initMetadata();
}

void QLearningStrategy::initMetadata() {
    metadata_.name = "Q-Learning";
    metadata_.version = "1.0";
    metadata_.author = "2048 Bot Team";
    metadata_.description = "Tabular Q-learning over exact board states with epsilon-greedy exploration.";
    metadata_.category = StrategyCategory::REINFORCEMENT_LEARNING;
    metadata_.parameters = {
        {"learning_rate", paramutil::formatDouble(learnerConfig_.learningRate)},
        {"discount_factor", paramutil::formatDouble(learnerConfig_.discountFactor)},
        {"epsilon", paramutil::formatDouble(learnerConfig_.epsilon)},
    };
    metadata_.trainingRequired = true;
}

Board::Move QLearningStrategy::greedyMove(const Board& board) const {
    QTable::Values q = qTable_.values(board.serialize());

    Board::Move best = Board::UP;
    bool bestMoves = board.canMove(best);
    for (Board::Move move : Board::ALL_MOVES) {
        bool moves = board.canMove(move);
        if (q[move] > q[best] || (q[move] == q[best] && moves && !bestMoves)) {
            best = move;
            bestMoves = moves;
        }
    }
    return best;
}

Board::Move QLearningStrategy::nextMove(const Board& board) {
    return greedyMove(board);
}

std::array<double, 4> QLearningStrategy::moveScores(const Board& board) {
    return qTable_.values(board.serialize());
}

TrainResult QLearningStrategy::train(const TrainOptions& options) {
    PROFILE_FUNCTION();
    if (options.episodes < 0 || options.maxStepsPerEpisode <= 0) {
        throw InvalidConfigError("episodes must be >= 0 and maxStepsPerEpisode > 0");
    }

    uint32_t seed = options.seed.value_or(learnerConfig_.seed);
    rng_.seed(seed);

    Game2048Environment::Config envConfig;
    envConfig.seed = seed;
    Game2048Environment env(envConfig);

    std::uniform_real_distribution<double> explore(0.0, 1.0);
    const double lr = learnerConfig_.learningRate;
    const double gamma = learnerConfig_.discountFactor;

    if (options.verbose) {
        std::cout << "Training Q-Learning for " << options.episodes << " episodes..." << std::endl;
    }

    std::vector<double> episodeRewards;
    std::vector<double> episodeLengths;
    std::vector<double> highestTiles;
    TrainResult result;
    result.supported = true;
    result.epsilonHistory.reserve(options.episodes);

    for (int episode = 0; episode < options.episodes; episode++) {
        env.reset();
        double totalReward = 0.0;
        int steps = 0;

        while (!env.isDone() && steps < options.maxStepsPerEpisode) {
            std::string stateKey = env.board().serialize();

            Board::Move action;
            if (explore(rng_) < epsilon_) {
                std::vector<Board::Move> valid = env.validMoves();
                if (valid.empty()) {
                    action = Board::UP;
                } else {
                    std::uniform_int_distribution<size_t> pick(0, valid.size() - 1);
                    action = valid[pick(rng_)];
                }
            } else {
                action = greedyMove(env.board());
            }

            Game2048Environment::StepResult step = env.step(action);
            std::string nextKey = env.board().serialize();

            double oldValue = qTable_.value(stateKey, action);
            double nextMax = qTable_.maxValue(nextKey);
            qTable_.update(stateKey, action, oldValue + lr * (step.reward + gamma * nextMax - oldValue));

            totalReward += step.reward;
            steps++;
        }

        episodeRewards.push_back(totalReward);
        episodeLengths.push_back(steps);
        highestTiles.push_back(env.highestTile());
        result.maxHighestTile = std::max(result.maxHighestTile, env.highestTile());

        epsilon_ = std::max(learnerConfig_.minEpsilon, epsilon_ * learnerConfig_.epsilonDecay);
        result.epsilonHistory.push_back(epsilon_);

        if (options.verbose && options.reportInterval > 0 && episode % options.reportInterval == 0) {
            size_t window = static_cast<size_t>(options.reportInterval);
            size_t from = episodeRewards.size() > window ? episodeRewards.size() - window : 0;
            std::cout << "Episode " << episode << ": Avg Reward = " << std::fixed << std::setprecision(2)
                      << mean(episodeRewards, from) << ", Avg Highest Tile = " << std::setprecision(1)
                      << mean(highestTiles, from) << ", Epsilon = " << std::setprecision(3) << epsilon_
                      << std::defaultfloat << std::setprecision(6) << std::endl;
        }
    }

    trainingEpisodes_ += options.episodes;
    trainingRewards_.insert(trainingRewards_.end(), episodeRewards.begin(), episodeRewards.end());
    if (trainingRewards_.size() > RECENT_REWARDS) {
        trainingRewards_.erase(trainingRewards_.begin(), trainingRewards_.end() - RECENT_REWARDS);
    }
    isTrained_ = true;

    result.episodesTrained = options.episodes;
    result.totalEpisodes = trainingEpisodes_;
    result.averageReward = mean(episodeRewards);
    result.averageEpisodeLength = mean(episodeLengths);
    result.averageHighestTile = mean(highestTiles);
    result.finalEpsilon = epsilon_;
    result.qTableSize = qTable_.size();
    result.converged = epsilon_ <= learnerConfig_.minEpsilon;
    result.message = "trained " + std::to_string(options.episodes) + " episodes";

    if (options.verbose) {
        std::cout << "Training completed." << std::endl;
        std::cout << "  Average reward: " << std::fixed << std::setprecision(2) << result.averageReward << std::endl;
        std::cout << "  Average highest tile: " << std::setprecision(1) << result.averageHighestTile << std::endl;
        std::cout << std::defaultfloat << std::setprecision(6);
        std::cout << "  Q-table size: " << result.qTableSize << " states" << std::endl;
    }
    return result;
}

QLearningStrategy::Progress QLearningStrategy::trainingProgress() const {
    Progress progress;
    progress.trainingEpisodes = trainingEpisodes_;
    progress.isTrained = isTrained_;
    progress.epsilon = epsilon_;
    progress.qTableSize = qTable_.size();
    progress.recentRewards = trainingRewards_;
    return progress;
}

// ============================================================================
// Persistence
// ============================================================================

PersistResult QLearningStrategy::save(const std::string& path) const {
    json doc;
    doc["q_table"] = qTable_.toJson();
    doc["config"] = {
        {"learning_rate", learnerConfig_.learningRate},
        {"discount_factor", learnerConfig_.discountFactor},
        {"epsilon", learnerConfig_.epsilon},
        {"epsilon_decay", learnerConfig_.epsilonDecay},
        {"min_epsilon", learnerConfig_.minEpsilon},
        {"seed", learnerConfig_.seed},
    };
    doc["training_episodes"] = trainingEpisodes_;
    doc["is_trained"] = isTrained_;
    doc["epsilon"] = epsilon_;

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

PersistResult QLearningStrategy::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return PersistResult::failure(PersistResult::FILE_MISSING, "no model file at " + path);
    }

    std::ifstream in(path);
    if (!in) {
        return PersistResult::failure(PersistResult::IO_ERROR, "cannot open " + path);
    }

    json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("q_table")) {
        return PersistResult::failure(PersistResult::CORRUPT_DATA, path + " is not a Q-learning model");
    }

    // Parse everything before touching this instance
    QTable table;
    Config config = learnerConfig_;
    int episodes = 0;
    bool trained = false;
    double epsilon = 0.0;
    try {
        table.fromJson(doc.at("q_table"));

        if (doc.contains("config")) {
            const json& c = doc.at("config");
            config.learningRate = c.value("learning_rate", config.learningRate);
            config.discountFactor = c.value("discount_factor", config.discountFactor);
            config.epsilon = c.value("epsilon", config.epsilon);
            config.epsilonDecay = c.value("epsilon_decay", config.epsilonDecay);
            config.minEpsilon = c.value("min_epsilon", config.minEpsilon);
            config.seed = c.value("seed", config.seed);
            config.validate();
        }

        episodes = doc.value("training_episodes", 0);
        trained = doc.value("is_trained", false);
        epsilon = doc.value("epsilon", config.minEpsilon);
    } catch (const json::exception& e) {
        return PersistResult::failure(PersistResult::CORRUPT_DATA, path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        return PersistResult::failure(PersistResult::CORRUPT_DATA, path + ": " + e.what());
    }

    if (episodes < 0 || !std::isfinite(epsilon) || epsilon < 0.0 || epsilon > 1.0) {
        return PersistResult::failure(PersistResult::CORRUPT_DATA, path + ": invalid training state");
    }

    qTable_ = std::move(table);
    learnerConfig_ = config;
    config_ = config.toParams();
    trainingEpisodes_ = episodes;
    isTrained_ = trained;
    epsilon_ = epsilon;
    return PersistResult::success();
}
