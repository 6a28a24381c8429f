#include "Environment.hpp"
#include "GameUtils.hpp"
#include "Profiler.hpp"
#include "QLearningStrategy.hpp"
#include <iostream>
#include <string>

// How to run: ./tilebot_train 2000 qlearning_model.json 7
int main(int argc, char* argv[]) {
    int episodes = 1000;
    std::string modelPath = "qlearning_model.json";
    uint32_t seed = 0;
    try {
        if (argc >= 2) episodes = std::stoi(argv[1]);
        if (argc >= 3) modelPath = argv[2];
        if (argc >= 4) seed = static_cast<uint32_t>(std::stoul(argv[3]));
    } catch (const std::logic_error&) {
        std::cerr << "Usage: " << argv[0] << " [episodes] [model-path] [seed]" << std::endl;
        return 1;
    }
    if (episodes < 0) {
        std::cerr << "episodes must not be negative" << std::endl;
        return 1;
    }

    QLearningStrategy::Config config;
    config.seed = seed;
    QLearningStrategy strategy(config);

    // Continue from an earlier run when the model already exists
    PersistResult loaded = strategy.load(modelPath);
    if (loaded.ok()) {
        QLearningStrategy::Progress progress = strategy.trainingProgress();
        std::cout << "Resuming from " << modelPath << " (" << progress.trainingEpisodes << " episodes, "
                  << progress.qTableSize << " states)" << std::endl;
    } else if (loaded.status != PersistResult::FILE_MISSING) {
        std::cerr << "Cannot resume from " << modelPath << ": " << persistStatusName(loaded.status) << " - "
                  << loaded.message << std::endl;
        return 1;
    }

    TrainOptions options;
    options.episodes = episodes;
    options.seed = seed;
    TrainResult result = strategy.train(options);

    std::cout << "Episodes trained: " << result.episodesTrained << " (total " << result.totalEpisodes << ")"
              << std::endl;
    std::cout << "Max highest tile: " << result.maxHighestTile << std::endl;
    std::cout << "Final epsilon: " << result.finalEpsilon << (result.converged ? " (converged)" : "") << std::endl;

    PersistResult saved = strategy.save(modelPath);
    if (!saved.ok()) {
        std::cerr << "Failed to save model: " << saved.message << std::endl;
        return 1;
    }
    std::cout << "Model saved to " << modelPath << std::endl;

    // One greedy evaluation game with the trained table
    Game2048Environment::Config envConfig;
    envConfig.seed = seed + 1;
    Game2048Environment env(envConfig);
    GameResult game = GameUtils::playGame(strategy, env);
    std::cout << "Evaluation game: score " << GameUtils::formatWithCommas(game.finalScore) << ", moves "
              << game.movesCompleted << ", highest tile " << game.highestTile << std::endl;

    Profiler::instance().printReport();

    return 0;
}
