#include "grid.hpp"
#include "patterns.hpp"
#include <algorithm>
#include <ostream>
#include <stdexcept>

Grid::Grid(std::size_t width, std::size_t height)
    : rows(height),
      cols(width),
      data(rows * cols, STATE_DEAD),
      next(rows * cols, STATE_DEAD)
{
}

Grid::Grid(const std::string& n, const std::vector<std::vector<int>>& seed)
    : name(n)
{
    if (seed.empty())
        throw EmptySeedError();

    rows = seed.size();
    cols = seed[0].size();
    for (const auto& row : seed)
        cols = std::min(cols, row.size());

    data.assign(rows * cols, STATE_DEAD);
    next.assign(rows * cols, STATE_DEAD);

    for (std::size_t i = 0; i < rows; ++i)
    {
        for (std::size_t j = 0; j < cols; ++j)
        {
            const int v = seed[i][j];
            if (v != STATE_DEAD && v != STATE_LIVE)
                throw std::runtime_error("Seed values must be 0 or 1");
            data[idx(i, j)] = static_cast<uint8_t>(v);
        }
    }
}

Grid::Grid(const Pattern& pattern)
    : Grid(pattern.name, pattern.cells)
{
}

void Grid::setAlive(const std::vector<Point>& points)
{
    for (const auto& p : points)
        if (p.first >= cols || p.second >= rows)
            throw std::out_of_range("Point (" + std::to_string(p.first) + ", " +
                                    std::to_string(p.second) + ") outside " +
                                    std::to_string(cols) + " x " + std::to_string(rows) + " grid");

    for (const auto& p : points)
        data[idx(p.second, p.first)] = STATE_LIVE;
}

CellState Grid::nextState(uint8_t current, int live_neighbors) noexcept
{
    if (current == STATE_DEAD && live_neighbors == 3)
        return STATE_LIVE;
    if (current == STATE_LIVE && (live_neighbors == 2 || live_neighbors == 3))
        return STATE_LIVE;
    return STATE_DEAD;
}

int Grid::countLiveNeighbors(std::size_t i, std::size_t j) const
{
    // Clamped to the grid, no wraparound.
    const std::size_t i0 = i == 0 ? 0 : i - 1;
    const std::size_t i1 = std::min(i + 1, rows - 1);
    const std::size_t j0 = j == 0 ? 0 : j - 1;
    const std::size_t j1 = std::min(j + 1, cols - 1);

    int count = 0;
    for (std::size_t ni = i0; ni <= i1; ++ni)
    for (std::size_t nj = j0; nj <= j1; ++nj)
    {
        if (ni == i && nj == j) continue;
        if (data[idx(ni, nj)] == STATE_LIVE)
            ++count;
    }
    return count;
}

bool Grid::step()
{
    // data is the snapshot, every cell is written to next
    for (std::size_t i = 0; i < rows; ++i)
        for (std::size_t j = 0; j < cols; ++j)
            next[idx(i, j)] = nextState(data[idx(i, j)], countLiveNeighbors(i, j));

    if (next == data)
        return false;

    data.swap(next);
    return true;
}

std::size_t Grid::simulate(std::size_t max_steps)
{
    std::size_t changed = 0;
    while (changed < max_steps && step())
        ++changed;
    return changed;
}

bool Grid::isAlive(std::size_t x, std::size_t y) const
{
    if (x >= cols || y >= rows)
        throw std::out_of_range("Cell outside grid");
    return data[idx(y, x)] == STATE_LIVE;
}

Grid::RowView Grid::row(std::size_t y) const
{
    if (y >= rows)
        throw std::out_of_range("Row " + std::to_string(y) + " outside grid of height " +
                                std::to_string(rows));
    return RowView(data.data() + idx(y, 0), cols);
}

std::ostream& operator<<(std::ostream& os, const Grid& grid)
{
    for (const auto& row : grid.cells())
    {
        for (bool live : row)
            os << (live ? '+' : '.');
        os << '\n';
    }
    return os;
}
