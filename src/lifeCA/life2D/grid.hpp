#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---- Cell States ---- //
enum CellState : uint8_t {
    STATE_DEAD = 0,
    STATE_LIVE = 1
};

// ---- Errors ---- //
class EmptySeedError : public std::runtime_error {
public:
    EmptySeedError() : std::runtime_error("Seed pattern must have at least one row") {}
};

struct Pattern;

// ---- Grid ---- //
class Grid {
private:
    std::string name;
    std::size_t rows{0}, cols{0};

    // row-major flattened storage
    std::vector<uint8_t> data;
    std::vector<uint8_t> next;

    inline std::size_t idx(std::size_t i, std::size_t j) const {
        return i * cols + j;
    }

    int countLiveNeighbors(std::size_t i, std::size_t j) const;

public:
    using Point = std::pair<std::size_t, std::size_t>; // (x, y)

    // ---- Lazy views ---- //
    class RowView {
    private:
        const uint8_t* first;
        std::size_t length;

    public:
        class iterator {
        private:
            const uint8_t* pos;

        public:
            explicit iterator(const uint8_t* p) : pos(p) {}
            bool operator*() const { return *pos == STATE_LIVE; }
            iterator& operator++() { ++pos; return *this; }
            bool operator==(const iterator& o) const { return pos == o.pos; }
            bool operator!=(const iterator& o) const { return pos != o.pos; }
        };

        RowView(const uint8_t* f, std::size_t n) : first(f), length(n) {}

        iterator begin() const { return iterator(first); }
        iterator end() const { return iterator(first + length); }
        std::size_t size() const noexcept { return length; }
    };

    class CellsView {
    private:
        const Grid* grid;

    public:
        class iterator {
        private:
            const Grid* grid;
            std::size_t row;

        public:
            iterator(const Grid* g, std::size_t r) : grid(g), row(r) {}
            RowView operator*() const { return grid->row(row); }
            iterator& operator++() { ++row; return *this; }
            bool operator==(const iterator& o) const { return row == o.row; }
            bool operator!=(const iterator& o) const { return row != o.row; }
        };

        explicit CellsView(const Grid* g) : grid(g) {}

        iterator begin() const { return iterator(grid, 0); }
        iterator end() const { return iterator(grid, grid->getHeight()); }
        std::size_t size() const noexcept { return grid->getHeight(); }
    };

    // All cells dead.
    Grid(std::size_t width, std::size_t height);

    // Rows may be jagged: every row is cut to the shortest one.
    Grid(const std::string& name, const std::vector<std::vector<int>>& seed);

    explicit Grid(const Pattern& pattern);

    void setAlive(const std::vector<Point>& points);

    // Advances one generation. Returns false once the grid is a fixed point.
    bool step();

    // Steps until stable or max_steps; returns the number of changing steps.
    std::size_t simulate(std::size_t max_steps);

    static CellState nextState(uint8_t current, int live_neighbors) noexcept;

    // ---- Accessors ---- //
    const std::string& getName() const noexcept { return name; }
    std::size_t getWidth() const noexcept { return cols; }
    std::size_t getHeight() const noexcept { return rows; }

    bool isAlive(std::size_t x, std::size_t y) const;

    RowView row(std::size_t y) const;
    CellsView cells() const { return CellsView(this); }

    const std::vector<uint8_t>& raw() const noexcept { return data; }
};

std::ostream& operator<<(std::ostream& os, const Grid& grid);
