#ifndef TUI_STATEMACHINE_HPP
#define TUI_STATEMACHINE_HPP

#include <map>
#include <memory>

#include <ncpp/NotCurses.hh>
#include <ncpp/Plane.hh>

#include "tui/State.hpp"

// Swaps between importer screens and carries the session's exit status.
class StateMachine {
public:
    StateMachine();
    ~StateMachine();

    void AddState(ScreenId id, std::shared_ptr<State> state);
    void TransitionTo(ScreenId id, ncpp::NotCurses& nc, ncpp::Plane& stdplane);
    std::shared_ptr<State> GetCurrentState() const;

    void SetRunning(bool running);
    void RequestStop();

    void SetExitStatus(int status) { exit_status_ = status; }
    int ExitStatus() const { return exit_status_; }

    // Runs the main loop until a screen stops it, 'q' is pressed, or an
    // interrupt arrives. Returns the exit status.
    int Run(ncpp::NotCurses& nc, ncpp::Plane& stdplane);

private:
    std::map<ScreenId, std::shared_ptr<State>> states_;
    std::shared_ptr<State> current_state_;
    bool running_;
    int exit_status_;
};

#endif // TUI_STATEMACHINE_HPP
