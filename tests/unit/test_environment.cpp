#include <gtest/gtest.h>
#include "Environment.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

class EnvironmentTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.seed = 1234;
        env_ = std::make_unique<Game2048Environment>(config_);
    }

    Game2048Environment::Config config_;
    std::unique_ptr<Game2048Environment> env_;
};

TEST_F(EnvironmentTest, ResetSpawnsTwoTiles) {
    Game2048Environment::Observation obs = env_->reset();

    ASSERT_EQ(obs.size(), static_cast<size_t>(Game2048Environment::OBSERVATION_SIZE));
    EXPECT_EQ(env_->board().tileCount(), 2);
    EXPECT_EQ(env_->score(), 0u);
    EXPECT_FALSE(env_->isDone());
    EXPECT_FLOAT_EQ(obs.back(), 0.0f);

    for (uint32_t value : env_->board().cells()) {
        EXPECT_TRUE(value == 0 || value == 2 || value == 4);
    }
}

TEST_F(EnvironmentTest, ObservationIsLog2OfCells) {
    Board board = Board::fromRows({{2, 0, 0, 0}, {0, 1024, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 8}});
    Game2048Environment::Observation obs = env_->loadBoard(board, 5000);

    EXPECT_FLOAT_EQ(obs[0], 1.0f);
    EXPECT_FLOAT_EQ(obs[1], 0.0f);
    EXPECT_FLOAT_EQ(obs[5], 10.0f);
    EXPECT_FLOAT_EQ(obs[15], 3.0f);
    EXPECT_FLOAT_EQ(obs[16], 0.5f);
}

TEST_F(EnvironmentTest, SameSeedSameGame) {
    Game2048Environment other(config_);
    env_->reset();
    other.reset();
    EXPECT_EQ(env_->board(), other.board());

    for (int i = 0; i < 20 && !env_->isDone(); i++) {
        Board::Move move = env_->validMoves().front();
        env_->step(move);
        other.step(move);
        EXPECT_EQ(env_->board(), other.board());
    }
}

TEST_F(EnvironmentTest, ValidMoveSpawnsOneTile) {
    Board board = Board::fromRows({{2, 2, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
    env_->loadBoard(board);

    Game2048Environment::StepResult step = env_->step(Board::LEFT);
    EXPECT_TRUE(step.info.moved);
    EXPECT_EQ(step.info.scoreDelta, 4u);
    EXPECT_EQ(env_->score(), 4u);
    EXPECT_EQ(env_->board().tileCount(), 2);
    EXPECT_EQ(env_->board().at(0, 0), 4u);
    EXPECT_EQ(step.info.totalMoves, 1);
    EXPECT_EQ(step.info.highestTile, 4u);
    EXPECT_DOUBLE_EQ(step.info.efficiency, 4.0);
}

TEST_F(EnvironmentTest, InvalidMoveIsPenalizedWithoutSpawn) {
    Board board = Board::fromRows({{2, 4, 8, 16}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
    env_->loadBoard(board);

    Game2048Environment::StepResult step = env_->step(Board::UP);
    EXPECT_FALSE(step.info.moved);
    EXPECT_DOUBLE_EQ(step.reward, -10.0);
    EXPECT_EQ(env_->board(), board);
    EXPECT_FALSE(step.done);
}

TEST_F(EnvironmentTest, ShapedRewardUsesBoardBeforeSpawn) {
    Board board = Board::fromRows({{2, 2, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
    env_->loadBoard(board);

    // After LEFT: single 4 in the corner, 15 empty, no line with two tiles
    Game2048Environment::StepResult step = env_->step(Board::LEFT);
    EXPECT_DOUBLE_EQ(step.reward, 4.0 + 15 * 2.0 + 2.0 + 0.0);
}

TEST_F(EnvironmentTest, CustomRewardFunction) {
    env_->setRewardFunction(scoreReward());
    env_->loadBoard(Board::fromRows({{4, 4, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}}));
    EXPECT_DOUBLE_EQ(env_->step(Board::RIGHT).reward, 8.0);

    RewardConfig rewards;
    rewards.invalidMovePenalty = -1.0;
    env_->setRewardFunction(shapedReward(rewards));
    env_->loadBoard(Board::fromRows({{2, 4, 8, 16}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}}));
    EXPECT_DOUBLE_EQ(env_->step(Board::LEFT).reward, -1.0);
}

TEST_F(EnvironmentTest, TerminalBoardEndsEpisode) {
    Board nearlyStuck = Board::fromRows({{2, 4, 2, 4}, {4, 2, 4, 2}, {2, 4, 2, 4}, {4, 2, 4, 0}});
    env_->loadBoard(nearlyStuck);
    ASSERT_FALSE(env_->isDone());

    // Moving RIGHT or DOWN refills the last cell; the board may or may not lock up
    Game2048Environment::StepResult step = env_->step(Board::RIGHT);
    EXPECT_EQ(step.done, !env_->board().hasLegalMove());

    Board stuck = Board::fromRows({{2, 4, 2, 4}, {4, 2, 4, 2}, {2, 4, 2, 4}, {4, 2, 4, 2}});
    env_->loadBoard(stuck);
    EXPECT_TRUE(env_->isDone());
    EXPECT_TRUE(env_->validMoves().empty());
    EXPECT_THROW(env_->step(Board::UP), std::logic_error);
}

TEST_F(EnvironmentTest, RandomPlayReachesTheEnd) {
    env_->reset();
    int steps = 0;
    while (!env_->isDone() && steps < 5000) {
        std::vector<Board::Move> moves = env_->validMoves();
        ASSERT_FALSE(moves.empty());
        Game2048Environment::StepResult step = env_->step(moves[steps % moves.size()]);
        EXPECT_TRUE(step.info.moved);
        EXPECT_TRUE(std::isfinite(step.reward));
        steps++;
    }
    EXPECT_TRUE(env_->isDone());
    EXPECT_FALSE(env_->board().hasLegalMove());
    EXPECT_THROW(env_->step(Board::LEFT), std::logic_error);

    env_->reset();
    EXPECT_FALSE(env_->isDone());
}

TEST_F(EnvironmentTest, RenderShowsScoreAndBoard) {
    env_->loadBoard(Board::fromRows({{2, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 512}}), 1500);
    std::ostringstream out;
    env_->render(out);
    EXPECT_NE(out.str().find("1,500"), std::string::npos);
    EXPECT_NE(out.str().find("512"), std::string::npos);
}

TEST(EnvironmentConfigTest, DefaultConstruction) {
    Game2048Environment::Config config;
    EXPECT_EQ(config.seed, 0u);
    EXPECT_DOUBLE_EQ(config.fourProbability, 0.1);
    EXPECT_DOUBLE_EQ(config.scoreScale, 10000.0);
    EXPECT_FALSE(config.reward);

    Game2048Environment env;
    env.seed(9);
    env.reset();
    EXPECT_EQ(env.board().tileCount(), 2);
    EXPECT_EQ(env.score(), 0u);
}

TEST(EnvironmentConfigTest, RejectsBadProbabilities) {
    Game2048Environment::Config config;
    config.fourProbability = 1.5;
    EXPECT_THROW(Game2048Environment env(config), std::invalid_argument);

    config.fourProbability = 1.0;
    Game2048Environment allFours(config);
    allFours.reset();
    for (uint32_t value : allFours.board().cells()) {
        EXPECT_TRUE(value == 0 || value == 4);
    }
}
