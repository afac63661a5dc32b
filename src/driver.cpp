#include "driver.hpp"
#include <stdexcept>
#include <utility>
#include "errors.hpp"

std::string to_string(StopReason reason) {
    switch (reason) {
        case StopReason::Quit: return "quit";
        case StopReason::Stable: return "stable";
        case StopReason::GenerationLimit: return "generation limit";
    }
    return "unknown";
}

Driver::Driver(Grid grid, std::unique_ptr<Renderer> renderer, DriverConfig config)
    : grid(std::move(grid)), renderer(std::move(renderer)), config(config),
      state(RunState::Running), reason(StopReason::Quit)
{
    if (!this->renderer)
        throw std::invalid_argument("Driver: renderer must not be null");
}

void Driver::render() {
    renderer->draw(grid.generation(), grid.snapshot(), state);
}

void Driver::release_renderer() {
    renderer.reset();
}

void Driver::handle(InputSignal signal) {
    if (state == RunState::Stopped) return;
    switch (signal) {
        case InputSignal::None:
            break;
        case InputSignal::ToggleRun:
            state = (state == RunState::Running) ? RunState::Paused : RunState::Running;
            break;
        case InputSignal::Quit:
            state = RunState::Stopped;
            reason = StopReason::Quit;
            break;
    }
}

void Driver::check_stop_conditions() {
    if (config.stop_when_stable && grid.is_stable()) {
        state = RunState::Stopped;
        reason = StopReason::Stable;
    } else if (config.max_generations > 0 && grid.generation() >= config.max_generations) {
        state = RunState::Stopped;
        reason = StopReason::GenerationLimit;
    }
}

void Driver::tick() {
    if (state == RunState::Stopped) return;

    InputSignal signal = renderer->poll(config.interval);
    if (signal != InputSignal::None) {
        handle(signal);
        // redraw so the status line follows the toggle; the board only moves on a quiet tick.
        if (state != RunState::Stopped) render();
        return;
    }

    if (state == RunState::Running) {
        grid.advance();
        render();
        check_stop_conditions();
    } else {
        render();
    }
}

RunSummary Driver::run() {
    if (!renderer)
        throw std::logic_error("Driver::run: the driver has already stopped");
    auto start = std::chrono::steady_clock::now();
    try {
        render();
        while (state != RunState::Stopped)
            tick();
    } catch (const RenderFailure&) {
        state = RunState::Stopped;
        release_renderer();
        throw;
    }
    release_renderer();

    RunSummary summary;
    summary.generation = grid.generation();
    summary.live_cells = grid.live_count();
    summary.reason = reason;
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return summary;
}
