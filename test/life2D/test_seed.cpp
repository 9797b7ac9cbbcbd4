#include <cassert>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include "grid.hpp"

// Reading the cell view back gives exactly the seed.
void test_seed_round_trip() {
    const std::vector<std::vector<int>> seed = {
        {0, 1, 1, 0},
        {1, 0, 0, 1},
        {0, 0, 1, 0},
    };
    Grid grid("tub", seed);
    assert(grid.getName() == "tub");
    assert(grid.getWidth() == 4);
    assert(grid.getHeight() == 3);

    std::size_t y = 0;
    for (const auto& row : grid.cells()) {
        assert(row.size() == 4);
        std::size_t x = 0;
        for (bool live : row) {
            assert(live == (seed[y][x] == 1));
            x++;
        }
        assert(x == 4);
        y++;
    }
    assert(y == 3);
    std::cout << "PASSED: test_seed_round_trip\n";
}

// The shortest row decides the width; extra cells are dropped.
void test_jagged_seed_truncated() {
    Grid grid("jagged", {{1, 1, 1}, {1, 1}});
    assert(grid.getWidth() == 2);
    assert(grid.getHeight() == 2);
    assert(grid.raw() == std::vector<uint8_t>({1, 1, 1, 1}));

    Grid empty_row("empty-row", {{1, 0, 1}, {}});
    assert(empty_row.getWidth() == 0);
    assert(empty_row.getHeight() == 2);
    assert(empty_row.step() == false);
    std::cout << "PASSED: test_jagged_seed_truncated\n";
}

void test_empty_seed_rejected() {
    bool thrown = false;
    try {
        Grid grid("nothing", {});
    } catch (const EmptySeedError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "PASSED: test_empty_seed_rejected\n";
}

void test_non_binary_seed_rejected() {
    bool thrown = false;
    try {
        Grid grid("bad", {{0, 2}});
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "PASSED: test_non_binary_seed_rejected\n";
}

void test_set_alive_bounds_checked() {
    Grid grid(3, 2);
    grid.setAlive({{2, 1}, {0, 0}});
    assert(grid.isAlive(2, 1));
    assert(grid.isAlive(0, 0));

    // nothing is written when any point is out of range
    Grid other(3, 2);
    bool thrown = false;
    try {
        other.setAlive({{1, 1}, {3, 0}});
    } catch (const std::out_of_range&) {
        thrown = true;
    }
    assert(thrown);
    assert(!other.isAlive(1, 1));

    thrown = false;
    try {
        other.setAlive({{0, 2}});
    } catch (const std::out_of_range&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "PASSED: test_set_alive_bounds_checked\n";
}

// The view is restartable and follows the grid after step().
void test_view_reflects_current_generation() {
    Grid grid("blinker", {{0, 1, 0}, {0, 1, 0}, {0, 1, 0}});
    auto view = grid.cells();

    int first = 0, second = 0;
    for (const auto& row : view)
        for (bool live : row)
            first += live;
    for (const auto& row : view)
        for (bool live : row)
            second += live;
    assert(first == 3 && second == 3);

    grid.step();
    auto middle = *(++view.begin());
    int live_in_middle = 0;
    for (bool live : middle)
        live_in_middle += live;
    assert(live_in_middle == 3);
    std::cout << "PASSED: test_view_reflects_current_generation\n";
}

void test_row_bounds_checked() {
    Grid grid(2, 3);
    grid.setAlive({{1, 2}});
    auto last = grid.row(2);
    assert(last.size() == 2);
    assert(*(++last.begin()) == true);

    bool thrown = false;
    try {
        grid.row(3);
    } catch (const std::out_of_range&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "PASSED: test_row_bounds_checked\n";
}

void test_text_dump() {
    Grid grid("blinker", {{0, 1, 0}, {0, 1, 0}, {0, 1, 0}});
    std::ostringstream os;
    os << grid;
    assert(os.str() == ".+.\n.+.\n.+.\n");

    Grid none(0, 0);
    std::ostringstream empty;
    empty << none;
    assert(empty.str().empty());
    std::cout << "PASSED: test_text_dump\n";
}

int main() {
    test_seed_round_trip();
    test_jagged_seed_truncated();
    test_empty_seed_rejected();
    test_non_binary_seed_rejected();
    test_set_alive_bounds_checked();
    test_view_reflects_current_generation();
    test_row_bounds_checked();
    test_text_dump();

    std::cout << "\nAll seed tests passed!\n";
    return 0;
}
