#ifndef TUI_STATE_HPP
#define TUI_STATE_HPP

#include <cstdint>

#include <ncpp/NotCurses.hh>
#include <ncpp/Plane.hh>

class StateMachine;

enum class ScreenId {
    Welcome,
    Import
};

// Interface for a screen driven by the state machine.
class State {
public:
    virtual ~State() = default;

    // Called when the screen becomes active.
    virtual void Enter(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) = 0;
    // Called when transitioning away, and once more when the loop ends.
    virtual void Exit(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) = 0;
    // Paints the current frame onto the provided plane.
    virtual void Draw(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) = 0;
    // Polled on every input timeout.
    virtual void Update(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) = 0;
    // Handles a single key event.
    virtual void HandleInput(StateMachine& machine,
                             ncpp::NotCurses& nc,
                             ncpp::Plane& stdplane,
                             uint32_t input,
                             const ncinput& details) = 0;
};

#endif // TUI_STATE_HPP
