#include "tui/WelcomeScreen.hpp"

#include <string>
#include <vector>
#include <notcurses/notcurses.h>

#include "tui/Signal.hpp"
#include "tui/StateMachine.hpp"

WelcomeScreen::WelcomeScreen(const SchemerConfig& config) : config_(config), exit_requested_(false) {}

void WelcomeScreen::Enter(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    (void)machine;
    (void)nc;
    (void)stdplane;
    // Reset the local exit flag every time we land on this screen.
    exit_requested_ = false;
}

void WelcomeScreen::Draw(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    (void)machine;
    (void)nc;
    // Clear the screen, draw a rounded border, and center the summary.
    DrawOuterFrame(stdplane, "schemer");

    const std::string store_line = "Preferences: " + config_.PreferenceFile().string();
    const std::string bools_line = std::string("Boolean preferences: ")
        + (config_.IncludeBooleans() ? "imported" : "left alone");
    CenterLines(stdplane, {
        "Color scheme importer",
        "",
        store_line,
        bools_line,
        "",
        "Once imported, colours cannot be restored; export your current scheme first.",
        "",
        "Press Enter or I to choose a scheme file, Q/Ctrl-C to exit."
    });
}

void WelcomeScreen::Update(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    (void)nc;
    (void)stdplane;
    // Exit if the user asked or a SIGINT arrived.
    if (exit_requested_ || g_interrupt_received.load(std::memory_order_relaxed)) {
        machine.SetRunning(false);
    }
}

void WelcomeScreen::HandleInput(StateMachine& machine,
                                ncpp::NotCurses& nc,
                                ncpp::Plane& stdplane,
                                uint32_t input,
                                const ncinput& details) {
    (void)details;

    // I or Enter opens the import screen; Q quits globally via the loop.
    if (input == 'i' || input == 'I' || input == NCKEY_ENTER || input == '\n' || input == '\r') {
        machine.TransitionTo(ScreenId::Import, nc, stdplane);
        return;
    }
    if (input == NCKEY_ESC) {
        exit_requested_ = true;
    }
}
