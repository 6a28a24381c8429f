#include "GameUtils.hpp"
#include "Environment.hpp"
#include "Strategy.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>

std::optional<Board::Move> GameUtils::parseMove(const std::string& text) {
    std::string upper;
    for (char ch : text) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }

    if (upper == "UP" || upper == "U") return Board::UP;
    if (upper == "DOWN" || upper == "D") return Board::DOWN;
    if (upper == "LEFT" || upper == "L") return Board::LEFT;
    if (upper == "RIGHT" || upper == "R") return Board::RIGHT;
    return std::nullopt;
}

const char* GameUtils::moveName(Board::Move move) {
    switch (move) {
    case Board::UP: return "UP";
    case Board::DOWN: return "DOWN";
    case Board::LEFT: return "LEFT";
    case Board::RIGHT: return "RIGHT";
    }
    return "?";
}

void GameUtils::printBoard(const Board& board, std::ostream& out) {
    std::string border = "+" + std::string(Board::SIZE * 7 - 1, '-') + "+";
    out << border << "\n";
    for (int r = 0; r < Board::SIZE; r++) {
        out << "|";
        for (int c = 0; c < Board::SIZE; c++) {
            uint32_t value = board.at(r, c);
            if (value == 0) {
                out << std::setw(6) << "." << (c + 1 < Board::SIZE ? " " : "");
            } else {
                out << std::setw(6) << value << (c + 1 < Board::SIZE ? " " : "");
            }
        }
        out << "|\n";
    }
    out << border << "\n";
}

void GameUtils::printBoard(const Board& board) {
    printBoard(board, std::cout);
}

std::string GameUtils::formatWithCommas(long long value) {
    std::string num = std::to_string(value < 0 ? -value : value);
    std::string result;
    int count = 0;
    for (int i = static_cast<int>(num.length()) - 1; i >= 0; --i) {
        if (count > 0 && count % 3 == 0) result = ',' + result;
        result = num[i] + result;
        ++count;
    }
    return value < 0 ? "-" + result : result;
}

GameResult GameUtils::playGame(Strategy& strategy, Game2048Environment& env, int maxMoves, bool verbose) {
    env.reset();
    strategy.reset();

    int moves = 0;
    while (!env.isDone() && moves < maxMoves) {
        Board::Move move = strategy.nextMove(env.board());
        Game2048Environment::StepResult step = env.step(move);
        if (!step.info.moved) {
            if (verbose) {
                std::cout << "Strategy chose " << moveName(move) << " which does not change the board, stopping.\n";
            }
            break;
        }
        moves++;

        if (verbose) {
            std::cout << "Move " << moves << ": " << moveName(move) << " (+" << step.info.scoreDelta << ")\n";
            printBoard(env.board());
        }
    }

    GameResult result;
    result.finalScore = env.score();
    result.movesCompleted = moves;
    result.highestTile = env.board().maxTile();
    strategy.updateStats(result);

    if (verbose) {
        std::cout << "Game over: score " << formatWithCommas(static_cast<long long>(result.finalScore))
                  << ", moves " << result.movesCompleted << ", highest tile " << result.highestTile << "\n";
    }
    return result;
}
