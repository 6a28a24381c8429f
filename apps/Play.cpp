#include "Environment.hpp"
#include "GameUtils.hpp"
#include "Profiler.hpp"
#include "StrategyRegistry.hpp"
#include <iostream>
#include <string>

// How to run: ./tilebot_play "Enhanced Heuristic_2.1" 5 42
int main(int argc, char* argv[]) {
    StrategyRegistry registry;
    if (!registerBuiltinStrategies(registry)) {
        return 1;
    }

    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <strategy-id> [games] [seed]" << std::endl;
        std::cerr << "Available strategies:" << std::endl;
        for (const StrategyMetadata& meta : registry.list()) {
            std::cerr << "  " << meta.id() << " (" << categoryName(meta.category) << ")" << std::endl;
        }
        return 1;
    }

    std::string id = argv[1];
    int games = 1;
    uint32_t seed = 42;
    try {
        if (argc >= 3) games = std::stoi(argv[2]);
        if (argc >= 4) seed = static_cast<uint32_t>(std::stoul(argv[3]));
    } catch (const std::logic_error&) {
        std::cerr << "games and seed must be integers" << std::endl;
        return 1;
    }
    if (games <= 0) {
        std::cerr << "games must be positive" << std::endl;
        return 1;
    }

    StrategyRegistry::Lookup lookup = registry.create(id);
    if (!lookup.ok()) {
        std::cerr << "Cannot create " << id << ": " << lookup.message << std::endl;
        return 1;
    }
    Strategy& strategy = *lookup.strategy;

    const StrategyMetadata& meta = strategy.metadata();
    std::cout << "Playing " << games << " game(s) with " << meta.name << " v" << meta.version << std::endl;
    std::cout << meta.description << std::endl;

    Game2048Environment::Config envConfig;
    envConfig.seed = seed;
    Game2048Environment env(envConfig);

    // Play each game; show the first one move by move when only one is requested
    for (int i = 0; i < games; i++) {
        GameResult result = GameUtils::playGame(strategy, env, 10000, games == 1);
        std::cout << "Game " << (i + 1) << ": score " << GameUtils::formatWithCommas(result.finalScore)
                  << ", moves " << result.movesCompleted << ", highest tile " << result.highestTile << std::endl;
    }

    std::cout << "\nFinal board:" << std::endl;
    env.render(std::cout);

    const PerformanceRecord& stats = strategy.stats();
    std::cout << "\n=== Summary ===" << std::endl;
    std::cout << "Games played: " << stats.gamesPlayed << std::endl;
    std::cout << "Average score: "
              << GameUtils::formatWithCommas(static_cast<long long>(stats.totalScore / stats.gamesPlayed)) << std::endl;
    std::cout << "Highest tile: " << stats.highestTile << std::endl;
    std::cout << "Average efficiency: " << stats.averageEfficiency << " points/move" << std::endl;

    Profiler::instance().printReport();

    return 0;
}
