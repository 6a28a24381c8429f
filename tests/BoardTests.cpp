#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "Board.hpp"
#include "GameUtils.hpp"
#include <random>
#include <sstream>

namespace {

Board randomBoard(std::mt19937& rng) {
    std::uniform_int_distribution<int> exponent(0, 6);
    std::vector<int> cells;
    for (int i = 0; i < Board::CELLS; i++) {
        int e = exponent(rng);
        cells.push_back(e == 0 ? 0 : 1 << e);
    }
    return Board::fromCells(cells);
}

Board::Row row(uint32_t a, uint32_t b, uint32_t c, uint32_t d) {
    return Board::Row{a, b, c, d};
}

} // namespace

TEST_CASE("Board rejects malformed grids") {
    CHECK_THROWS_AS(Board::fromRows({{2, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}}), InvalidBoardError);
    CHECK_THROWS_AS(Board::fromRows({{0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}}), InvalidBoardError);
    CHECK_THROWS_AS(Board::fromRows({{3, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}}), InvalidBoardError);
    CHECK_THROWS_AS(Board::fromRows({{1, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}}), InvalidBoardError);
    CHECK_THROWS_AS(Board::fromRows({{-2, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}}), InvalidBoardError);
    CHECK_THROWS_AS(Board::fromCells({2, 4, 8}), InvalidBoardError);
    CHECK_THROWS_AS(Board::parse("2 0 0 0"), InvalidBoardError);
    CHECK_THROWS_AS(Board::parse("2-0 0 0 0 0 0 0 0 0 0 0 0 0 0 0"), InvalidBoardError);
}

TEST_CASE("Board parse and serialize agree") {
    Board board = Board::parse("[[2, 0, 0, 4], [0, 8, 0, 0], [0, 0, 16, 0], [0, 0, 0, 2048]]");
    CHECK(board.at(0, 3) == 4);
    CHECK(board.at(3, 3) == 2048);
    CHECK(board.serialize() == "2,0,0,4,0,8,0,0,0,0,16,0,0,0,0,2048");
    CHECK(Board::parse(board.serialize()) == board);
    CHECK(Board::fromRows(board.rows()) == board);
}

TEST_CASE("Board queries") {
    Board board = Board::fromRows({{2, 0, 0, 0}, {0, 4, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 128}});
    CHECK(board.emptyCount() == 13);
    CHECK(board.tileCount() == 3);
    CHECK(board.maxTile() == 128);
    CHECK(board.tileSum() == 134);
    CHECK(Board::empty().maxTile() == 0);
    CHECK(Board::empty().emptyCount() == 16);
}

TEST_CASE("mergeRowLeft merges each pair once") {
    uint32_t delta = 0;
    CHECK(Board::mergeRowLeft(row(2, 2, 2, 2), delta) == row(4, 4, 0, 0));
    CHECK(delta == 8);

    delta = 0;
    CHECK(Board::mergeRowLeft(row(2, 0, 2, 2), delta) == row(4, 2, 0, 0));
    CHECK(delta == 4);

    delta = 0;
    CHECK(Board::mergeRowLeft(row(4, 4, 8, 0), delta) == row(8, 8, 0, 0));
    CHECK(delta == 8);

    delta = 0;
    CHECK(Board::mergeRowLeft(row(0, 0, 0, 0), delta) == row(0, 0, 0, 0));
    CHECK(Board::mergeRowLeft(row(0, 0, 0, 8), delta) == row(8, 0, 0, 0));
    CHECK(Board::mergeRowLeft(row(2, 4, 8, 16), delta) == row(2, 4, 8, 16));
    CHECK(delta == 0);
}

TEST_CASE("Moves in every direction") {
    Board board = Board::fromRows({{2, 2, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {2, 0, 0, 2}});

    SUBCASE("left") {
        Board::MoveOutcome out = board.apply(Board::LEFT);
        CHECK(out.moved);
        CHECK(out.scoreDelta == 8);
        CHECK(out.board == Board::fromRows({{4, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {4, 0, 0, 0}}));
    }
    SUBCASE("right") {
        Board::MoveOutcome out = board.apply(Board::RIGHT);
        CHECK(out.board == Board::fromRows({{0, 0, 0, 4}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 4}}));
    }
    SUBCASE("up") {
        Board::MoveOutcome out = board.apply(Board::UP);
        CHECK(out.scoreDelta == 4);
        CHECK(out.board == Board::fromRows({{4, 2, 0, 2}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}}));
    }
    SUBCASE("down") {
        Board::MoveOutcome out = applyMove(board, Board::DOWN);
        CHECK(out.board == Board::fromRows({{0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {4, 2, 0, 2}}));
    }
}

TEST_CASE("A move that changes nothing returns the same board") {
    Board board = Board::fromRows({{2, 4, 8, 16}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}});
    Board::MoveOutcome out = board.apply(Board::UP);
    CHECK_FALSE(out.moved);
    CHECK(out.scoreDelta == 0);
    CHECK(out.board == board);
    CHECK_FALSE(board.canMove(Board::LEFT));
    CHECK(board.canMove(Board::DOWN));
}

TEST_CASE("Applying a move to its own result is a no-op") {
    std::mt19937 rng(7);
    for (int i = 0; i < 200; i++) {
        Board board = randomBoard(rng);
        for (Board::Move move : Board::ALL_MOVES) {
            Board once = board.apply(move).board;
            Board::MoveOutcome twice = once.apply(move);
            // A second move may still merge tiles produced by the first
            if (!twice.moved) {
                CHECK(twice.board == once);
            }
            CHECK(once.tileSum() == board.tileSum());
        }
    }
}

TEST_CASE("Directions are reflections of each other") {
    std::mt19937 rng(2048);
    for (int i = 0; i < 500; i++) {
        Board board = randomBoard(rng);

        Board::MoveOutcome left = board.apply(Board::LEFT);
        Board::MoveOutcome right = board.reversedRows().apply(Board::RIGHT);
        CHECK(left.board == right.board.reversedRows());
        CHECK(left.scoreDelta == right.scoreDelta);

        Board::MoveOutcome up = board.apply(Board::UP);
        Board::MoveOutcome leftOfTransposed = board.transposed().apply(Board::LEFT);
        CHECK(up.board == leftOfTransposed.board.transposed());
        CHECK(up.scoreDelta == leftOfTransposed.scoreDelta);

        Board::MoveOutcome down = board.apply(Board::DOWN);
        Board::MoveOutcome rightOfTransposed = board.transposed().apply(Board::RIGHT);
        CHECK(down.board == rightOfTransposed.board.transposed());
    }
}

TEST_CASE("Terminal detection") {
    Board stuck = Board::fromRows({{2, 4, 2, 4}, {4, 2, 4, 2}, {2, 4, 2, 4}, {4, 2, 4, 2}});
    CHECK_FALSE(stuck.hasLegalMove());
    CHECK(stuck.legalMoves().empty());

    Board pair = Board::fromRows({{2, 4, 2, 4}, {4, 2, 4, 2}, {2, 4, 2, 4}, {4, 2, 8, 8}});
    CHECK(pair.hasLegalMove());
    CHECK(pair.legalMoves().size() == 2);

    std::mt19937 rng(99);
    for (int i = 0; i < 200; i++) {
        Board board = randomBoard(rng);
        CHECK(board.hasLegalMove() == !board.legalMoves().empty());
    }
}

TEST_CASE("withTile validates its input") {
    Board board = Board::empty().withTile(1, 2, 4);
    CHECK(board.at(1, 2) == 4);
    CHECK(Board::empty().at(1, 2) == 0);
    CHECK_THROWS_AS(board.withTile(4, 0, 2), InvalidBoardError);
    CHECK_THROWS_AS(board.withTile(0, 0, 6), InvalidBoardError);
}

TEST_CASE("Tiles are capped at MAX_TILE") {
    const uint32_t cap = Board::MAX_TILE;
    CHECK(Board::isValidTile(cap));
    CHECK_FALSE(Board::isValidTile(static_cast<int64_t>(cap) * 2));
    CHECK_THROWS_AS(Board::empty().withTile(0, 0, cap * 2), InvalidBoardError);
    CHECK_THROWS_AS(Board::parse("2147483648 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0"), InvalidBoardError);

    // Two capped tiles stay apart instead of merging past the cap
    Board board = Board::empty().withTile(0, 0, cap).withTile(0, 1, cap);
    Board::MoveOutcome left = board.apply(Board::LEFT);
    CHECK_FALSE(left.moved);
    CHECK(left.scoreDelta == 0);
    CHECK(left.board.at(0, 0) == cap);
    CHECK(board.rows()[0][1] == static_cast<int>(cap));

    // Capped tiles still slide; pairs below the cap merge as usual
    Board::MoveOutcome right = board.apply(Board::RIGHT);
    CHECK(right.moved);
    CHECK(right.board.at(0, 2) == cap);
    CHECK(right.board.at(0, 3) == cap);

    Board half = Board::empty().withTile(0, 0, cap / 2).withTile(0, 1, cap / 2);
    CHECK(half.apply(Board::LEFT).board.at(0, 0) == cap);

    // A full board whose only equal neighbours are capped tiles is terminal
    Board full = Board::fromRows({{static_cast<int>(cap), static_cast<int>(cap), 2, 4},
                                  {2, 4, 8, 16},
                                  {4, 8, 16, 32},
                                  {8, 16, 32, 64}});
    CHECK_FALSE(full.hasLegalMove());
    CHECK(full.legalMoves().empty());
}

TEST_CASE("Move names round trip") {
    for (Board::Move move : Board::ALL_MOVES) {
        auto parsed = GameUtils::parseMove(GameUtils::moveName(move));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == move);
    }
    CHECK(GameUtils::parseMove("left") == Board::LEFT);
    CHECK(GameUtils::parseMove("r") == Board::RIGHT);
    CHECK_FALSE(GameUtils::parseMove("sideways").has_value());
}

TEST_CASE("printBoard and formatWithCommas") {
    std::ostringstream out;
    GameUtils::printBoard(Board::fromRows({{2, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 0}, {0, 0, 0, 1024}}), out);
    CHECK(out.str().find("1024") != std::string::npos);

    CHECK(GameUtils::formatWithCommas(0) == "0");
    CHECK(GameUtils::formatWithCommas(1234567) == "1,234,567");
    CHECK(GameUtils::formatWithCommas(-1000) == "-1,000");
}
