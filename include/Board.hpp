#ifndef BOARD_HPP
#define BOARD_HPP

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// Thrown for grids that are not 4x4 or hold values other than 0 / powers of two in [2, MAX_TILE]
class InvalidBoardError : public std::invalid_argument {
public:
    explicit InvalidBoardError(const std::string& what) : std::invalid_argument(what) {}
};

class Board {
public:
    static constexpr int SIZE = 4;
    static constexpr int CELLS = SIZE * SIZE;

    // Largest tile a board holds; two MAX_TILE tiles do not merge
    static constexpr uint32_t MAX_TILE = 1u << 30;

    // Index order is the order of every 4-entry score vector
    enum Move {
        UP = 0,
        DOWN = 1,
        LEFT = 2,
        RIGHT = 3
    };
    static constexpr std::array<Move, 4> ALL_MOVES = {UP, DOWN, LEFT, RIGHT};

    using Row = std::array<uint32_t, SIZE>;
    using Cells = std::array<uint32_t, CELLS>;

    struct MoveOutcome;

    // Empty board
    Board();

    // Validating factories
    static Board fromRows(const std::vector<std::vector<int>>& rows);
    static Board fromCells(const std::vector<int>& cells);
    static Board parse(const std::string& text);  // 16 integers, any separators
    static Board empty() { return Board(); }

    // Core rule
    MoveOutcome apply(Move move) const;
    bool canMove(Move move) const;
    std::vector<Move> legalMoves() const;
    bool hasLegalMove() const;

    // Returns a copy with one cell replaced (value must be 0 or a power of two in [2, MAX_TILE])
    Board withTile(int row, int col, uint32_t value) const;

    // Queries
    uint32_t at(int row, int col) const { return cells_[row * SIZE + col]; }
    const Cells& cells() const { return cells_; }
    std::vector<std::vector<int>> rows() const;
    int emptyCount() const;
    int tileCount() const { return CELLS - emptyCount(); }
    uint32_t maxTile() const;
    uint64_t tileSum() const;

    // Canonical state key: row-major cells joined by ','
    std::string serialize() const;

    bool operator==(const Board& other) const { return cells_ == other.cells_; }
    bool operator!=(const Board& other) const { return cells_ != other.cells_; }

    static bool isValidTile(int64_t value);

    // Primitives the four directions are built from
    static Row mergeRowLeft(const Row& row, uint32_t& scoreDelta);
    Board transposed() const;
    Board reversedRows() const;

private:
    explicit Board(const Cells& cells) : cells_(cells) {}

    Board moveLeft(uint32_t& scoreDelta) const;

    Cells cells_;
};

struct Board::MoveOutcome {
    Board board;
    bool moved = false;
    uint32_t scoreDelta = 0;
};

// Free-function form of Board::apply
inline Board::MoveOutcome applyMove(const Board& board, Board::Move move) {
    return board.apply(move);
}

#endif // BOARD_HPP
