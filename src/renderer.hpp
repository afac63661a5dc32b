#pragma once
/*
Renderer: the display collaborator of the Driver.

The driver hands it every generation to draw and uses poll() as its only blocking point:
poll() waits at most `wait` for user input, which doubles as the generation cadence.
A renderer that loses its display throws RenderFailure from either call. Whatever display
resource it holds is released by its destructor.
*/

#include <chrono>
#include "grid.hpp"

enum class InputSignal {
    None,
    ToggleRun,
    Quit
};

enum class RunState {
    Running,
    Paused,
    Stopped
};

class Renderer {
public:
    virtual ~Renderer() = default;

    virtual void draw(long generation, const Snapshot& snapshot, RunState state) = 0;

    // Input observed since the last call, waiting at most `wait` for some to arrive.
    virtual InputSignal poll(std::chrono::milliseconds wait) = 0;
};
