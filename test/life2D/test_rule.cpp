#include <cassert>
#include <iostream>
#include "grid.hpp"

// Every (state, neighbour count) combination.
void test_transition_table() {
    for (int n = 0; n <= 8; n++) {
        CellState from_dead = Grid::nextState(STATE_DEAD, n);
        assert(from_dead == (n == 3 ? STATE_LIVE : STATE_DEAD));

        CellState from_live = Grid::nextState(STATE_LIVE, n);
        assert(from_live == ((n == 2 || n == 3) ? STATE_LIVE : STATE_DEAD));
    }
    std::cout << "PASSED: test_transition_table\n";
}

void test_dead_grid_is_fixed_point() {
    const std::size_t sizes[][2] = {{0, 0}, {0, 3}, {3, 0}, {1, 1}, {5, 2}, {7, 7}};
    for (const auto& s : sizes) {
        Grid grid(s[0], s[1]);
        assert(grid.getWidth() == s[0]);
        assert(grid.getHeight() == s[1]);
        assert(grid.step() == false);
        assert(grid.step() == false);
        for (auto v : grid.raw())
            assert(v == STATE_DEAD);
    }
    std::cout << "PASSED: test_dead_grid_is_fixed_point\n";
}

// A lone cell dies, a cell with 4 neighbours dies of overcrowding.
void test_underpopulation_and_overcrowding() {
    Grid lone(3, 3);
    lone.setAlive({{1, 1}});
    assert(lone.step() == true);
    assert(!lone.isAlive(1, 1));

    // plus sign: centre has 4 live neighbours
    Grid plus(3, 3);
    plus.setAlive({{1, 0}, {0, 1}, {1, 1}, {2, 1}, {1, 2}});
    assert(plus.step() == true);
    assert(!plus.isAlive(1, 1));
    assert(plus.isAlive(0, 0));
    assert(plus.isAlive(2, 2));
    std::cout << "PASSED: test_underpopulation_and_overcrowding\n";
}

int main() {
    test_transition_table();
    test_dead_grid_is_fixed_point();
    test_underpopulation_and_overcrowding();

    std::cout << "\nAll rule tests passed!\n";
    return 0;
}
