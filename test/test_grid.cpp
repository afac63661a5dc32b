#include <cassert>
#include <iostream>
#include <set>
#include "../src/errors.hpp"
#include "../src/geometry.hpp"
#include "../src/grid.hpp"

using Cells = std::set<Position>;

template <typename F>
bool throws_configuration_error(F f) {
    try {
        f();
    } catch (const ConfigurationError&) {
        return true;
    }
    return false;
}

void test_rejects_bad_dimensions() {
    assert(throws_configuration_error([] { Grid(0, 5, std::set<Position>()); }));
    assert(throws_configuration_error([] { Grid(5, 0, std::set<Position>()); }));
    assert(throws_configuration_error([] { Grid(-3, 4, std::set<Position>()); }));
    assert(throws_configuration_error([] { Grid(0, 0, RandomFill()); }));
    std::cout << "PASSED: test_rejects_bad_dimensions\n";
}

void test_rejects_out_of_range_seed() {
    assert(throws_configuration_error([] { Grid(8, 8, Cells{{8, 0}}); }));
    assert(throws_configuration_error([] { Grid(8, 8, Cells{{0, 8}}); }));
    assert(throws_configuration_error([] { Grid(8, 8, Cells{{-1, 2}}); }));
    assert(throws_configuration_error([] { Grid(8, 8, Cells{{3, 3}, {2, -1}}); }));
    // the far corner is still inside.
    Grid grid(8, 8, Cells{{7, 7}});
    assert(grid.is_alive(7, 7));
    std::cout << "PASSED: test_rejects_out_of_range_seed\n";
}

void test_out_of_bounds_is_dead() {
    std::set<Position> all;
    for (int row = 0; row < 3; row++)
        for (int col = 0; col < 4; col++)
            all.insert({row, col});
    Grid grid(3, 4, all);
    assert(grid.is_alive(0, 0));
    assert(grid.is_alive(2, 3));
    assert(!grid.is_alive(-1, 0));
    assert(!grid.is_alive(0, -1));
    assert(!grid.is_alive(3, 0));
    assert(!grid.is_alive(0, 4));
    assert(!grid.is_alive(-1, -1));
    assert(!grid.is_alive(100, 100));
    assert(!grid.is_alive(-1000000, 1000000));
    std::cout << "PASSED: test_out_of_bounds_is_dead\n";
}

void test_corner_sees_three_neighbors() {
    // every cell alive: a corner counts only its 3 in-bounds neighbors, an edge 5, the middle 8.
    std::set<Position> all;
    for (int row = 0; row < 5; row++)
        for (int col = 0; col < 5; col++)
            all.insert({row, col});
    Grid grid(5, 5, all);
    assert(grid.count_live_neighbors(0, 0) == 3);
    assert(grid.count_live_neighbors(0, 4) == 3);
    assert(grid.count_live_neighbors(4, 0) == 3);
    assert(grid.count_live_neighbors(4, 4) == 3);
    assert(grid.count_live_neighbors(0, 2) == 5);
    assert(grid.count_live_neighbors(2, 4) == 5);
    assert(grid.count_live_neighbors(2, 2) == 8);
    std::cout << "PASSED: test_corner_sees_three_neighbors\n";
}

void test_live_neighbors() {
    // vertical line in column 2, as in the first board the editor usually produces
    Grid grid(8, 8, Cells{{0, 2}, {1, 2}, {2, 2}});
    assert(grid.count_live_neighbors(0, 2) == 1);
    assert(grid.count_live_neighbors(1, 2) == 2);
    assert(grid.count_live_neighbors(2, 2) == 1);
    assert(grid.count_live_neighbors(1, 1) == 3);
    assert(grid.count_live_neighbors(1, 3) == 3);
    assert(grid.count_live_neighbors(5, 5) == 0);
    std::cout << "PASSED: test_live_neighbors\n";
}

void test_step_in_bounds() {
    Position p = {1, 2};
    assert(step_in_bounds(p, Direction::N, 8, 8) == Position(0, 2));
    assert(step_in_bounds(p, Direction::NE, 8, 8) == Position(0, 3));
    assert(step_in_bounds(p, Direction::E, 8, 8) == Position(1, 3));
    assert(step_in_bounds(p, Direction::SE, 8, 8) == Position(2, 3));
    assert(step_in_bounds(p, Direction::S, 8, 8) == Position(2, 2));
    assert(step_in_bounds(p, Direction::SW, 8, 8) == Position(2, 1));
    assert(step_in_bounds(p, Direction::W, 8, 8) == Position(1, 1));
    assert(step_in_bounds(p, Direction::NW, 8, 8) == Position(0, 1));
    std::cout << "PASSED: test_step_in_bounds\n";
}

void test_step_in_bounds_board_edge() {
    for (Direction d : {Direction::NW, Direction::N, Direction::NE, Direction::W})
        assert(!step_in_bounds({0, 0}, d, 8, 8).has_value());
    for (Direction d : {Direction::SW, Direction::S, Direction::SE, Direction::E})
        assert(!step_in_bounds({7, 7}, d, 8, 8).has_value());
    // the other directions from a corner stay on the board.
    assert(step_in_bounds({0, 0}, Direction::SE, 8, 8) == Position(1, 1));
    assert(step_in_bounds({7, 7}, Direction::NW, 8, 8) == Position(6, 6));
    std::cout << "PASSED: test_step_in_bounds_board_edge\n";
}

void test_snapshot_is_a_copy() {
    Grid grid(3, 3, Cells{{1, 1}});
    Snapshot snap = grid.snapshot();
    assert(snap.size() == 3);
    assert(snap[0].size() == 3);
    assert(snap[1][1] == true);
    assert(snap[0][0] == false);

    snap[0][0] = true;
    snap[1][1] = false;
    assert(!grid.is_alive(0, 0));
    assert(grid.is_alive(1, 1));
    assert(grid.snapshot()[1][1] == true);
    std::cout << "PASSED: test_snapshot_is_a_copy\n";
}

void test_generation_counter() {
    Grid grid(6, 6, Cells{{2, 1}, {2, 2}, {2, 3}});
    assert(grid.generation() == 0);
    long previous = grid.generation();
    for (int i = 0; i < 10; i++) {
        grid.advance();
        assert(grid.generation() == previous + 1);
        previous = grid.generation();
    }
    assert(grid.generation() == 10);
    std::cout << "PASSED: test_generation_counter\n";
}

void test_random_fill() {
    Grid empty(10, 12, RandomFill{0.0, 7});
    assert(empty.live_count() == 0);
    Grid full(10, 12, RandomFill{1.0, 7});
    assert(full.live_count() == 120);

    Grid a(20, 20, RandomFill{0.5, 42});
    Grid b(20, 20, RandomFill{0.5, 42});
    assert(a.snapshot() == b.snapshot());
    assert(throws_configuration_error([] { Grid(4, 4, RandomFill{1.5, 0}); }));
    std::cout << "PASSED: test_random_fill\n";
}

int main() {
    test_rejects_bad_dimensions();
    test_rejects_out_of_range_seed();
    test_out_of_bounds_is_dead();
    test_corner_sees_three_neighbors();
    test_live_neighbors();
    test_step_in_bounds();
    test_step_in_bounds_board_edge();
    test_snapshot_is_a_copy();
    test_generation_counter();
    test_random_fill();

    std::cout << "\nAll grid tests passed!\n";
    return 0;
}
