#ifndef GAMEUTILS_HPP
#define GAMEUTILS_HPP

#include "Board.hpp"
#include <iosfwd>
#include <optional>
#include <string>

// Forward declarations
class Strategy;
class Game2048Environment;
struct GameResult;

class GameUtils {
public:
    // Move parsing/display ("UP", "up", "U" all parse to Board::UP)
    static std::optional<Board::Move> parseMove(const std::string& text);
    static const char* moveName(Board::Move move);

    // Board printing
    static void printBoard(const Board& board, std::ostream& out);
    static void printBoard(const Board& board);

    // Number formatting
    static std::string formatWithCommas(long long value);

    // Plays one simulated game to the end (or maxMoves) and feeds the result to the
    // strategy's statistics. A move that leaves the board unchanged ends the game, the
    // way a stuck live game would.
    static GameResult playGame(Strategy& strategy, Game2048Environment& env, int maxMoves = 10000,
                               bool verbose = false);
};

#endif // GAMEUTILS_HPP
