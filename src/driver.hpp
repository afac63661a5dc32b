#pragma once
/*
Driver: owns the Grid and the Renderer and runs the single-threaded control loop.

Each loop iteration polls the renderer for input with a bounded wait equal to the tick
interval, applies the signal, and, while Running, advances the grid and draws the new
generation. Paused keeps redrawing the unchanged board. Stopped is terminal: the renderer
is released before run() returns, including when it throws RenderFailure, which is then
rethrown to the caller.
*/

#include <chrono>
#include <memory>
#include <string>
#include "grid.hpp"
#include "renderer.hpp"

enum class StopReason {
    Quit,
    Stable,
    GenerationLimit
};

std::string to_string(StopReason reason);

struct DriverConfig {
    std::chrono::milliseconds interval{200};
    long max_generations = 0; // 0 = unlimited
    bool stop_when_stable = false;
};

struct RunSummary {
    long generation = 0;
    int live_cells = 0;
    StopReason reason = StopReason::Quit;
    std::chrono::milliseconds elapsed{0};
};

class Driver {
    private:
        Grid grid;
        std::unique_ptr<Renderer> renderer;
        DriverConfig config;
        RunState state;
        StopReason reason;

        void render();
        void check_stop_conditions();
        void release_renderer();

    public:
        Driver(Grid grid, std::unique_ptr<Renderer> renderer, DriverConfig config = DriverConfig());

        RunState get_state() const { return state; }
        const Grid& get_grid() const { return grid; }
        bool has_renderer() const { return renderer != nullptr; }

        // Apply one input signal to the state machine. Signals after Stopped are ignored.
        void handle(InputSignal signal);

        // One loop iteration: poll, handle, then advance and draw if still Running.
        void tick();

        RunSummary run();
};
