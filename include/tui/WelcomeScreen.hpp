#ifndef TUI_WELCOMESCREEN_HPP
#define TUI_WELCOMESCREEN_HPP

#include "tui/BaseScreen.hpp"
#include "tui/Config.hpp"

// First screen: says where the scheme will be written and how to proceed.
class WelcomeScreen : public BaseScreen {
public:
    explicit WelcomeScreen(const SchemerConfig& config);

    void Enter(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override;
    void Draw(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override;
    void Update(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override;
    void HandleInput(StateMachine& machine,
                     ncpp::NotCurses& nc,
                     ncpp::Plane& stdplane,
                     uint32_t input,
                     const ncinput& details) override;

private:
    const SchemerConfig& config_;
    bool exit_requested_;
};

#endif // TUI_WELCOMESCREEN_HPP
