#include <memory>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include <ncpp/NotCurses.hh>
#include <ncpp/Plane.hh>
#include <notcurses/notcurses.h>

#include "schemer/ImportError.hpp"
#include "schemer/PrfPreferenceStore.hpp"
#include "schemer/SchemeImporter.hpp"
#include "tui/Config.hpp"
#include "tui/ExitStatus.hpp"
#include "tui/ImportScreen.hpp"
#include "tui/Signal.hpp"
#include "tui/StateMachine.hpp"
#include "tui/WelcomeScreen.hpp"

namespace {
struct CommandLine {
    std::filesystem::path config_path = std::filesystem::current_path() / "config" / "schemer.yml";
    std::filesystem::path scheme;
    std::string store_path;
    bool include_bools = false;
    bool include_bools_given = false;
};

void PrintUsage(std::ostream& out) {
    out << "Usage: schemer_import [--include-bools] [--store PRF] [--config YML] [SCHEME]\n"
        << "  SCHEME           color scheme or full preferences file to import;\n"
        << "                   without it an interactive picker opens\n"
        << "  --include-bools  also import boolean preferences\n"
        << "  --store PRF      preference file to update (default from config, else matlab.prf)\n"
        << "  --config YML     run configuration (default config/schemer.yml)\n";
}

// Returns false on a usage error.
bool ParseCommandLine(int argc, char** argv, CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--include-bools") {
            cmd.include_bools = true;
            cmd.include_bools_given = true;
        } else if ((arg == "--store" || arg == "--config") && i + 1 < argc) {
            const std::string value = argv[++i];
            if (arg == "--store") {
                cmd.store_path = value;
            } else {
                cmd.config_path = value;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            return false;
        } else if (cmd.scheme.empty()) {
            cmd.scheme = arg;
        } else {
            return false;
        }
    }
    return true;
}

int RunHeadless(const CommandLine& cmd, const SchemerConfig& config, PrfPreferenceStore& store) {
    SchemeImporter importer(store);
    importer.SetWarningCallback([](const ImportWarning& warning) {
        std::cerr << "Warning: " << FormatWarning(warning) << "\n";
    });

    ImportOptions options;
    options.include_boolean_preferences = config.IncludeBooleans();

    try {
        const ImportReport report = importer.ImportFile(cmd.scheme, options);
        const std::filesystem::path prf = config.PreferenceFile();
        if (!store.SaveToFile(prf)) {
            std::cerr << "Error: failed to save preferences to " << prf << "\n";
            return exit_status::kImportFailed;
        }
        std::cout << "Imported color scheme " << (report.included_booleans ? "WITH" : "WITHOUT")
                  << " boolean options from\n" << report.source << "\n";
        std::cout << report.direct_colors.size() << " colours from file, "
                  << report.fallback_colors.size() << " from fallbacks, "
                  << report.warnings.size() << " entries skipped\n";
        return exit_status::kImported;
    } catch (const ImportError& e) {
        std::cerr << "Error (" << ImportErrorKindName(e.kind()) << "): " << e.what() << "\n";
        return exit_status::ForError(e.kind());
    }
}

int RunInteractive(const CommandLine& cmd, SchemerConfig& config, PrfPreferenceStore& store) {
    // Install SIGINT handler early so Ctrl-C can cleanly exit the loop.
    InitInterruptHandlers();

    // Configure NotCurses and suppress the startup banner.
    notcurses_options nc_options = ncpp::NotCurses::default_notcurses_options;
    nc_options.flags |= NCOPTION_SUPPRESS_BANNERS;
    ncpp::NotCurses nc(nc_options);
    // Grab the root plane; it tracks the terminal size automatically.
    std::unique_ptr<ncpp::Plane> stdplane{nc.get_stdplane()};

    SchemeImporter importer(store);
    bool config_changed = false;

    // Wire up the state machine with the welcome screen first.
    StateMachine machine;
    machine.AddState(ScreenId::Welcome, std::make_shared<WelcomeScreen>(config));
    machine.AddState(ScreenId::Import, std::make_shared<ImportScreen>(config, config_changed, store, importer));
    machine.TransitionTo(ScreenId::Welcome, nc, *stdplane);

    // Enter the main loop: draw, poll, and dispatch to the active screen.
    const int status = machine.Run(nc, *stdplane);

    // If the boolean option was toggled, offer to keep it.
    if (config_changed && !g_interrupt_received.load(std::memory_order_relaxed)) {
        unsigned rows = 0;
        unsigned cols = 0;
        stdplane->get_dim(rows, cols);
        bool save = true;

        while (true) {
            stdplane->erase();
            stdplane->perimeter_rounded(0, 0, 0);
            const int choice_row = static_cast<int>(rows) - 1;
            const std::string prompt = "Save configuration changes to " + cmd.config_path.filename().string() + "?";
            stdplane->putstr(choice_row, 2, prompt.c_str());
            const int yes_col = 2 + static_cast<int>(prompt.size()) + 4;
            const int no_col = yes_col + 8;
            if (save) {
                stdplane->set_bg_rgb8(255, 255, 255);
                stdplane->set_fg_rgb8(0, 0, 0);
                stdplane->putstr(choice_row, yes_col, "Yes");
                stdplane->set_bg_default();
                stdplane->set_fg_default();
                stdplane->putstr(choice_row, no_col, "No");
            } else {
                stdplane->putstr(choice_row, yes_col, "Yes");
                stdplane->set_bg_rgb8(255, 255, 255);
                stdplane->set_fg_rgb8(0, 0, 0);
                stdplane->putstr(choice_row, no_col, "No");
                stdplane->set_bg_default();
                stdplane->set_fg_default();
            }
            nc.render();

            ncinput ni{};
            timespec ts{0, 500'000'000};
            uint32_t ch = notcurses_get(nc, &ts, &ni);
            if (ch == 0 || ni.evtype == NCTYPE_RELEASE) {
                continue;
            }
            if (ch == 'q' || ch == 'Q' || static_cast<int32_t>(ch) == -1) {
                break;
            }
            if (ch == NCKEY_LEFT || ch == NCKEY_RIGHT) {
                save = !save;
            } else if (ch == NCKEY_ENTER || ch == '\n' || ch == '\r') {
                if (save) {
                    std::error_code ec;
                    if (cmd.config_path.has_parent_path()) {
                        std::filesystem::create_directories(cmd.config_path.parent_path(), ec);
                    }
                    if (!config.SaveToFile(cmd.config_path)) {
                        std::cerr << "Warning: failed to save config to " << cmd.config_path << "\n";
                    }
                }
                break;
            }
        }
    }
    return status;
}
}

int main(int argc, char** argv) {
    CommandLine cmd;
    if (!ParseCommandLine(argc, argv, cmd)) {
        PrintUsage(std::cerr);
        return exit_status::kUsage;
    }

    // Load the run configuration if present.
    SchemerConfig config;
    if (!config.LoadFromFile(cmd.config_path)) {
        std::cerr << "Warning: could not load config from " << cmd.config_path << "; using defaults.\n";
    }
    // Command-line flags win over the file.
    if (cmd.include_bools_given) {
        config.SetBool(SchemerConfig::kIncludeBooleans, cmd.include_bools);
    }
    if (!cmd.store_path.empty()) {
        config.SetString(SchemerConfig::kPreferenceFile, cmd.store_path);
    }

    // The store starts from the existing preference file so unrelated
    // preferences are written back untouched.
    PrfPreferenceStore store;
    const std::filesystem::path prf = config.PreferenceFile();
    if (!store.LoadFromFile(prf)) {
        std::cerr << "Warning: could not load preferences from " << prf << "; starting empty.\n";
    }

    if (!cmd.scheme.empty()) {
        return RunHeadless(cmd, config, store);
    }
    return RunInteractive(cmd, config, store);
}
