#ifndef TUI_BASESCREEN_HPP
#define TUI_BASESCREEN_HPP

#include <string>
#include <vector>

#include <ncpp/Plane.hh>

#include "tui/State.hpp"

// Base class with no-op lifecycle hooks and shared drawing helpers.
class BaseScreen : public State {
public:
    void Enter(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override {}
    void Exit(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override {}
    void Update(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override {}

    virtual void Draw(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override = 0;
    virtual void HandleInput(StateMachine& machine,
                             ncpp::NotCurses& nc,
                             ncpp::Plane& stdplane,
                             uint32_t input,
                             const ncinput& details) override = 0;

protected:
    // Clears the plane, draws the outer border and centers title on it.
    void DrawOuterFrame(ncpp::Plane& plane, const std::string& title);
    // Writes each line centered vertically around mid-row.
    void CenterLines(ncpp::Plane& plane, const std::vector<std::string>& lines);
};

#endif // TUI_BASESCREEN_HPP
