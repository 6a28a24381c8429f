#include "Board.hpp"
#include "Profiler.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

Board::Board() {
    cells_.fill(0);
}

bool Board::isValidTile(int64_t value) {
    if (value == 0) return true;
    if (value < 2 || value > MAX_TILE) return false;
    return (value & (value - 1)) == 0;
}

// ============================================================================
// Factories
// ============================================================================

Board Board::fromRows(const std::vector<std::vector<int>>& rows) {
    if (rows.size() != SIZE) {
        throw InvalidBoardError("board must have 4 rows, got " + std::to_string(rows.size()));
    }

    Cells cells;
    for (int r = 0; r < SIZE; r++) {
        if (rows[r].size() != SIZE) {
            throw InvalidBoardError("row " + std::to_string(r) + " must have 4 cells, got " +
                                    std::to_string(rows[r].size()));
        }
        for (int c = 0; c < SIZE; c++) {
            int value = rows[r][c];
            if (!isValidTile(value)) {
                throw InvalidBoardError("invalid tile " + std::to_string(value) + " at (" +
                                        std::to_string(r) + ", " + std::to_string(c) + ")");
            }
            cells[r * SIZE + c] = static_cast<uint32_t>(value);
        }
    }
    return Board(cells);
}

Board Board::fromCells(const std::vector<int>& cells) {
    if (cells.size() != CELLS) {
        throw InvalidBoardError("board must have 16 cells, got " + std::to_string(cells.size()));
    }
    std::vector<std::vector<int>> rows(SIZE);
    for (int i = 0; i < CELLS; i++) {
        rows[i / SIZE].push_back(cells[i]);
    }
    return fromRows(rows);
}

Board Board::parse(const std::string& text) {
    // Anything that is not a digit or a minus sign separates values
    std::string normalized = text;
    for (char& ch : normalized) {
        if (!std::isdigit(static_cast<unsigned char>(ch)) && ch != '-') {
            ch = ' ';
        }
    }

    std::istringstream in(normalized);
    std::vector<int> values;
    std::string token;
    while (in >> token) {
        size_t used = 0;
        int value = 0;
        try {
            value = std::stoi(token, &used);
        } catch (const std::logic_error&) {
            used = 0;
        }
        if (used == 0 || used != token.size()) {
            throw InvalidBoardError("cannot parse tile value '" + token + "'");
        }
        values.push_back(value);
    }
    return fromCells(values);
}

// ============================================================================
// Move primitives
// ============================================================================

Board::Row Board::mergeRowLeft(const Row& row, uint32_t& scoreDelta) {
    Row tiles{};
    int count = 0;
    for (uint32_t value : row) {
        if (value != 0) tiles[count++] = value;
    }

    Row merged{};
    int out = 0;
    int i = 0;
    while (i < count) {
        if (i + 1 < count && tiles[i] == tiles[i + 1] && tiles[i] < MAX_TILE) {
            merged[out++] = tiles[i] * 2;
            scoreDelta += tiles[i] * 2;
            i += 2;
        } else {
            merged[out++] = tiles[i];
            i += 1;
        }
    }
    return merged;
}

Board Board::transposed() const {
    Cells out;
    for (int r = 0; r < SIZE; r++) {
        for (int c = 0; c < SIZE; c++) {
            out[c * SIZE + r] = cells_[r * SIZE + c];
        }
    }
    return Board(out);
}

Board Board::reversedRows() const {
    Cells out;
    for (int r = 0; r < SIZE; r++) {
        for (int c = 0; c < SIZE; c++) {
            out[r * SIZE + c] = cells_[r * SIZE + (SIZE - 1 - c)];
        }
    }
    return Board(out);
}

Board Board::moveLeft(uint32_t& scoreDelta) const {
    Cells out;
    for (int r = 0; r < SIZE; r++) {
        Row row;
        std::copy_n(cells_.begin() + r * SIZE, SIZE, row.begin());
        Row merged = mergeRowLeft(row, scoreDelta);
        std::copy(merged.begin(), merged.end(), out.begin() + r * SIZE);
    }
    return Board(out);
}

Board::MoveOutcome Board::apply(Move move) const {
    PROFILE_SCOPE("Board::apply");
    uint32_t delta = 0;
    Board result;

    switch (move) {
    case LEFT:
        result = moveLeft(delta);
        break;
    case RIGHT:
        result = reversedRows().moveLeft(delta).reversedRows();
        break;
    case UP:
        result = transposed().moveLeft(delta).transposed();
        break;
    case DOWN:
        result = transposed().reversedRows().moveLeft(delta).reversedRows().transposed();
        break;
    default:
        throw std::invalid_argument("unknown move " + std::to_string(static_cast<int>(move)));
    }

    MoveOutcome outcome;
    outcome.moved = (result != *this);
    if (outcome.moved) {
        outcome.board = result;
        outcome.scoreDelta = delta;
    } else {
        // Hand back the input untouched
        outcome.board = *this;
        outcome.scoreDelta = 0;
    }
    return outcome;
}

bool Board::canMove(Move move) const {
    return apply(move).moved;
}

std::vector<Board::Move> Board::legalMoves() const {
    std::vector<Move> moves;
    for (Move move : ALL_MOVES) {
        if (canMove(move)) {
            moves.push_back(move);
        }
    }
    return moves;
}

bool Board::hasLegalMove() const {
    if (emptyCount() > 0) return true;

    for (int r = 0; r < SIZE; r++) {
        for (int c = 0; c < SIZE; c++) {
            uint32_t value = at(r, c);
            if (value == MAX_TILE) continue;
            if (c + 1 < SIZE && at(r, c + 1) == value) return true;
            if (r + 1 < SIZE && at(r + 1, c) == value) return true;
        }
    }
    return false;
}

Board Board::withTile(int row, int col, uint32_t value) const {
    if (row < 0 || row >= SIZE || col < 0 || col >= SIZE) {
        throw InvalidBoardError("cell (" + std::to_string(row) + ", " + std::to_string(col) +
                                ") is outside the board");
    }
    if (!isValidTile(value)) {
        throw InvalidBoardError("invalid tile " + std::to_string(value));
    }
    Cells cells = cells_;
    cells[row * SIZE + col] = value;
    return Board(cells);
}

// ============================================================================
// Queries
// ============================================================================

std::vector<std::vector<int>> Board::rows() const {
    std::vector<std::vector<int>> out(SIZE, std::vector<int>(SIZE, 0));
    for (int r = 0; r < SIZE; r++) {
        for (int c = 0; c < SIZE; c++) {
            out[r][c] = static_cast<int>(at(r, c));
        }
    }
    return out;
}

int Board::emptyCount() const {
    return static_cast<int>(std::count(cells_.begin(), cells_.end(), 0u));
}

uint32_t Board::maxTile() const {
    return *std::max_element(cells_.begin(), cells_.end());
}

uint64_t Board::tileSum() const {
    uint64_t sum = 0;
    for (uint32_t value : cells_) sum += value;
    return sum;
}

std::string Board::serialize() const {
    std::string key;
    key.reserve(CELLS * 3);
    for (int i = 0; i < CELLS; i++) {
        if (i > 0) key += ',';
        key += std::to_string(cells_[i]);
    }
    return key;
}
