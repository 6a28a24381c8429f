#include "Environment.hpp"
#include "GameUtils.hpp"
#include "Profiler.hpp"
#include "StrategyRegistry.hpp"
#include <iomanip>
#include <iostream>
#include <string>

// How to run: ./tilebot_compete 20 42 leaderboard.json
// Plays every registered strategy on the same seeds and prints the ranked leaderboard.
int main(int argc, char* argv[]) {
    int games = 10;
    uint32_t seed = 42;
    std::string exportPath = "leaderboard.json";
    try {
        if (argc >= 2) games = std::stoi(argv[1]);
        if (argc >= 3) seed = static_cast<uint32_t>(std::stoul(argv[2]));
        if (argc >= 4) exportPath = argv[3];
    } catch (const std::logic_error&) {
        std::cerr << "Usage: " << argv[0] << " [games] [seed] [export-path]" << std::endl;
        return 1;
    }
    if (games <= 0) {
        std::cerr << "games must be positive" << std::endl;
        return 1;
    }

    StrategyRegistry::Config registryConfig;
    registryConfig.verbose = true;
    StrategyRegistry registry(registryConfig);
    if (!registerBuiltinStrategies(registry)) {
        return 1;
    }

    for (const StrategyMetadata& meta : registry.list()) {
        StrategyRegistry::Lookup lookup = registry.create(meta.id(), {});
        if (!lookup.ok()) {
            std::cerr << "Skipping " << meta.id() << ": " << lookup.message << std::endl;
            continue;
        }
        Strategy& strategy = *lookup.strategy;

        if (meta.trainingRequired) {
            TrainOptions options;
            options.episodes = 200;
            options.verbose = false;
            options.seed = seed;
            TrainResult trained = strategy.train(options);
            std::cout << meta.id() << ": " << trained.message << std::endl;
        }

        // One record per game so the history carries a trend
        Game2048Environment::Config envConfig;
        envConfig.seed = seed;
        Game2048Environment env(envConfig);
        for (int i = 0; i < games; i++) {
            strategy.clearStats();
            GameUtils::playGame(strategy, env);
            if (registry.recordPerformance(meta.id(), strategy.stats()) != StrategyRegistry::OK) {
                std::cerr << "Cannot record performance for " << meta.id() << std::endl;
                return 1;
            }
        }
        std::cout << meta.id() << ": played " << games << " games" << std::endl;
    }

    std::cout << "\n=== Leaderboard ===" << std::endl;
    std::cout << std::left << std::setw(5) << "Rank" << std::setw(24) << "Strategy" << std::setw(24) << "Category"
              << std::setw(12) << "Efficiency" << std::setw(13) << "Consistency" << std::setw(8) << "Tile"
              << "Percentile" << std::endl;
    for (const StrategyRegistry::RankingEntry& entry : registry.leaderboard()) {
        std::cout << std::left << std::setw(5) << entry.rank << std::setw(24) << entry.name << std::setw(24)
                  << entry.category << std::fixed << std::setprecision(2) << std::setw(12) << entry.averageEfficiency
                  << std::setprecision(3) << std::setw(13) << entry.consistency << std::setw(8) << entry.highestTile
                  << std::setprecision(1) << entry.percentile << "%" << std::endl;
    }

    PersistResult exported = registry.exportPerformance(exportPath);
    if (!exported.ok()) {
        std::cerr << "Export failed: " << exported.message << std::endl;
        return 1;
    }
    std::cout << "\nLeaderboard written to " << exportPath << std::endl;

    Profiler::instance().printReport();

    return 0;
}
