#include "tui/StateMachine.hpp"

#include <cstdint>
#include <ctime>
#include <notcurses/notcurses.h>

#include "tui/ExitStatus.hpp"
#include "tui/Signal.hpp"

StateMachine::StateMachine() : current_state_(nullptr), running_(true), exit_status_(exit_status::kCancelled) {}

StateMachine::~StateMachine() = default;

void StateMachine::AddState(ScreenId id, std::shared_ptr<State> state) {
    states_[id] = state;
}

void StateMachine::TransitionTo(ScreenId id, ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    std::map<ScreenId, std::shared_ptr<State>>::const_iterator it = states_.find(id);
    if (it == states_.cend()) {
        return;
    }

    // Swap the active screen, running its Exit/Enter hooks on the way out/in.
    if (current_state_ != nullptr) {
        current_state_->Exit(*this, nc, stdplane);
    }

    current_state_ = it->second;
    current_state_->Enter(*this, nc, stdplane);
}

std::shared_ptr<State> StateMachine::GetCurrentState() const {
    return current_state_;
}

void StateMachine::SetRunning(bool running) {
    running_ = running;
}

void StateMachine::RequestStop() {
    running_ = false;
}

int StateMachine::Run(ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    running_ = true;

    const timespec poll_timeout{0, 100'000'000}; // 100ms

    while (running_) {
        if (current_state_ == nullptr) {
            break;
        }

        // Redraw before polling so the palette reflects the latest import.
        current_state_->Draw(*this, nc, stdplane);
        nc.render();

        ncinput input_details{};
        uint32_t ch = notcurses_get(nc, &poll_timeout, &input_details);

        // Ctrl-C leaves the loop promptly so the terminal is restored.
        if (g_interrupt_received.load(std::memory_order_relaxed)) {
            running_ = false;
            break;
        }

        if (ch == 0) {
            // Timeout: let the screen react to flags set outside input handling.
            current_state_->Update(*this, nc, stdplane);
            continue;
        }

        if (static_cast<int32_t>(ch) == -1) {
            // Input error; bail out so the terminal gets restored.
            running_ = false;
            break;
        }

        // Key releases arrive as separate events on terminals that report them.
        if (input_details.evtype == NCTYPE_RELEASE) {
            continue;
        }

        // Global escape hatch; screens can also call SetRunning(false).
        if (ch == 'q' || ch == 'Q') {
            running_ = false;
            break;
        }

        // Dispatch to the active screen, then tick its update hook.
        current_state_->HandleInput(*this, nc, stdplane, ch, input_details);
        current_state_->Update(*this, nc, stdplane);
    }

    // Final cleanup chance for the active screen.
    if (current_state_ != nullptr) {
        current_state_->Exit(*this, nc, stdplane);
    }
    return exit_status_;
}
