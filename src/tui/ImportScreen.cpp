#include "tui/ImportScreen.hpp"

#include <algorithm>
#include <notcurses/notcurses.h>

#include "schemer/ImportError.hpp"
#include "tui/ExitStatus.hpp"
#include "tui/StateMachine.hpp"

namespace {
constexpr int kMargin = 1;
constexpr int kGap = 1;
constexpr int kFooterRows = 9;
constexpr int kSwatchWidth = 4;
constexpr std::size_t kMaxLogLines = 200;

int TopRows(unsigned parent_rows) {
    return std::max(6, static_cast<int>(parent_rows) - (kMargin * 2) - kGap - kFooterRows);
}

int FilePaneCols(unsigned parent_cols) {
    const int available = static_cast<int>(parent_cols) - (kMargin * 2) - kGap;
    return std::max(20, (available * 2) / 5);
}

bool IsEnter(uint32_t input) {
    return input == NCKEY_ENTER || input == '\n' || input == '\r';
}

// Clip text to width columns from the left; names here are plain ASCII.
std::string Fit(const std::string& text, int width) {
    if (width <= 0) {
        return "";
    }
    if (static_cast<int>(text.size()) <= width) {
        return text;
    }
    return text.substr(0, static_cast<std::size_t>(width));
}
}

ImportScreen::ImportScreen(SchemerConfig& config,
                           bool& config_changed,
                           PrfPreferenceStore& store,
                           SchemeImporter& importer)
    : config_(config),
      config_changed_(config_changed),
      store_(store),
      importer_(importer),
      file_subframe_(config.StartDirectory()),
      palette_subframe_(store, importer.Tables().Colors()),
      command_subframe_() {}

void ImportScreen::Enter(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    (void)machine;
    (void)nc;
    (void)stdplane;
    command_subframe_.SetLabelState(config_.IncludeBooleans(), file_subframe_.ShowAllFiles());
}

void ImportScreen::Draw(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) {
    (void)machine;
    (void)nc;
    DrawOuterFrame(stdplane, "Import color scheme");

    unsigned rows = 0;
    unsigned cols = 0;
    stdplane.get_dim(rows, cols);

    file_subframe_.SetFocused(focus_ == Focus::Files);
    palette_subframe_.SetFocused(focus_ == Focus::Palette);
    command_subframe_.SetFocused(focus_ == Focus::Commands);

    file_subframe_.Resize(stdplane, rows, cols);
    palette_subframe_.Resize(stdplane, rows, cols);
    command_subframe_.Resize(stdplane, rows, cols);
    file_subframe_.Draw();
    palette_subframe_.Draw();
    command_subframe_.Draw();
}

void ImportScreen::HandleInput(StateMachine& machine,
                               ncpp::NotCurses& nc,
                               ncpp::Plane& stdplane,
                               uint32_t input,
                               const ncinput& details) {
    (void)nc;
    (void)stdplane;
    if (input == '\t') {
        if (focus_ == Focus::Commands) {
            focus_ = Focus::Files;
        } else if (focus_ == Focus::Files) {
            focus_ = Focus::Palette;
        } else {
            focus_ = Focus::Commands;
        }
        return;
    }

    if (focus_ == Focus::Commands) {
        if (IsEnter(input)) {
            RunCommand(machine);
        } else {
            command_subframe_.HandleInput(input, details);
        }
        return;
    }

    if (focus_ == Focus::Files) {
        file_subframe_.HandleInput(input, details);
        const std::filesystem::path chosen = file_subframe_.TakeChosenFile();
        if (!chosen.empty()) {
            RunImport(machine, chosen);
        }
        return;
    }

    palette_subframe_.HandleInput(input, details);
}

void ImportScreen::RunCommand(StateMachine& machine) {
    switch (command_subframe_.SelectedCommand()) {
        case CommandSubframe::Command::Import: {
            const std::filesystem::path selected = file_subframe_.SelectedFile();
            if (selected.empty()) {
                command_subframe_.SetFeedback("Select a scheme file in the file pane first");
                return;
            }
            RunImport(machine, selected);
            return;
        }
        case CommandSubframe::Command::ToggleBooleans:
            config_.SetBool(SchemerConfig::kIncludeBooleans, !config_.IncludeBooleans());
            config_changed_ = true;
            command_subframe_.SetFeedback(config_.IncludeBooleans()
                ? "Boolean preferences will be imported"
                : "Boolean preferences will be left alone");
            break;
        case CommandSubframe::Command::ToggleAllFiles:
            file_subframe_.SetShowAllFiles(!file_subframe_.ShowAllFiles());
            break;
        case CommandSubframe::Command::Exit:
            machine.SetRunning(false);
            return;
    }
    command_subframe_.SetLabelState(config_.IncludeBooleans(), file_subframe_.ShowAllFiles());
}

void ImportScreen::RunImport(StateMachine& machine, const std::filesystem::path& scheme) {
    ImportOptions options;
    options.include_boolean_preferences = config_.IncludeBooleans();

    command_subframe_.ClearLog();
    importer_.SetWarningCallback([this](const ImportWarning& warning) {
        command_subframe_.AddLog("Warning: " + FormatWarning(warning));
    });

    try {
        const ImportReport report = importer_.ImportFile(scheme, options);
        palette_subframe_.SetReport(report);

        const std::filesystem::path prf = config_.PreferenceFile();
        if (!store_.SaveToFile(prf)) {
            command_subframe_.AddLog("Warning: failed to save preferences to " + prf.string());
        }
        command_subframe_.AddLog(std::to_string(report.direct_colors.size()) + " colours from file, "
                                 + std::to_string(report.fallback_colors.size()) + " from fallbacks");
        command_subframe_.SetFeedback(std::string("Imported color scheme ")
                                      + (report.included_booleans ? "WITH" : "WITHOUT")
                                      + " boolean options from " + scheme.filename().string());
        machine.SetExitStatus(exit_status::kImported);
    } catch (const ImportError& e) {
        command_subframe_.SetFeedback(std::string(ImportErrorKindName(e.kind())) + ": import failed");
        command_subframe_.AddLog(std::string("Error: ") + e.what());
        machine.SetExitStatus(exit_status::ForError(e.kind()));
    }
}

ImportScreen::FileSubframe::FileSubframe(const std::filesystem::path& start)
    : Subframe("Scheme file"),
      browser_(start) {}

std::filesystem::path ImportScreen::FileSubframe::TakeChosenFile() {
    std::filesystem::path chosen;
    chosen.swap(chosen_);
    return chosen;
}

void ImportScreen::FileSubframe::ComputeGeometry(unsigned parent_rows,
                                                 unsigned parent_cols,
                                                 int& y,
                                                 int& x,
                                                 int& rows,
                                                 int& cols) {
    rows = TopRows(parent_rows);
    cols = FilePaneCols(parent_cols);
    y = kMargin;
    x = kMargin;
}

void ImportScreen::FileSubframe::DrawContents() {
    const ContentArea area = ContentBox(1, 2, 1, 2);
    const int bar_col = area.left + area.width - 1;
    const int text_width = std::max(0, area.width - 1);
    const std::vector<FileBrowser::Entry>& entries = browser_.Entries();
    const int item_count = static_cast<int>(entries.size());
    const int selected_index = static_cast<int>(browser_.SelectedIndex());

    ClampScroll(selected_index, area.height);

    for (int i = 0; i < area.height && (scroll_offset_ + i) < item_count; ++i) {
        const int item_index = scroll_offset_ + i;
        const FileBrowser::Entry& entry = entries[static_cast<std::size_t>(item_index)];
        if (item_index == selected_index) {
            plane_->set_bg_rgb8(255, 255, 255);
            plane_->set_fg_rgb8(0, 0, 0);
            for (int col = area.left - 1; col < area.left + area.width - 1; ++col) {
                plane_->putstr(area.top + i, col, " ");
            }
        } else {
            plane_->set_bg_default();
            plane_->set_fg_default();
        }
        std::string label = entry.name;
        if (entry.is_dir && label != "..") {
            label.append("/");
        }
        plane_->putstr(area.top + i, area.left, Fit(label, text_width).c_str());
    }
    plane_->set_bg_default();
    plane_->set_fg_default();

    DrawScrollbar(area, bar_col, item_count);

    const std::string footer = browser_.ShowAllFiles() ? " All Files " : " *.prf, *.txt ";
    plane_->putstr(static_cast<int>(cached_rows_) - 1, ncpp::NCAlign::Center, footer.c_str());
}

void ImportScreen::FileSubframe::HandleInput(uint32_t input, const ncinput& details) {
    (void)details;
    if (input == NCKEY_UP) {
        browser_.MoveSelectionUp();
    } else if (input == NCKEY_DOWN) {
        browser_.MoveSelectionDown();
    } else if (input == NCKEY_BACKSPACE) {
        browser_.Load(browser_.CurrentPath().parent_path());
        scroll_offset_ = 0;
    } else if (IsEnter(input)) {
        if (browser_.ActivateSelection()) {
            chosen_ = browser_.SelectedFile();
        } else {
            scroll_offset_ = 0;
        }
    }
}

ImportScreen::PaletteSubframe::PaletteSubframe(const PreferenceStore& store, const ColorRegistry& registry)
    : Subframe("Palette"),
      store_(store),
      registry_(registry) {}

void ImportScreen::PaletteSubframe::SetReport(const ImportReport& report) {
    direct_.clear();
    derived_.clear();
    direct_.insert(report.direct_colors.begin(), report.direct_colors.end());
    derived_.insert(report.fallback_colors.begin(), report.fallback_colors.end());
}

void ImportScreen::PaletteSubframe::ComputeGeometry(unsigned parent_rows,
                                                    unsigned parent_cols,
                                                    int& y,
                                                    int& x,
                                                    int& rows,
                                                    int& cols) {
    const int file_cols = FilePaneCols(parent_cols);
    rows = TopRows(parent_rows);
    cols = std::max(20, static_cast<int>(parent_cols) - (kMargin * 2) - kGap - file_cols);
    y = kMargin;
    x = kMargin + file_cols + kGap;
}

void ImportScreen::PaletteSubframe::DrawContents() {
    const ContentArea area = ContentBox(1, 2, 1, 2);
    const std::vector<ColorEntry>& entries = registry_.Entries();
    const int item_count = static_cast<int>(entries.size());
    const int bar_col = area.left + area.width - 1;

    ClampScroll(selected_index_, area.height);

    for (int i = 0; i < area.height && (scroll_offset_ + i) < item_count; ++i) {
        const int item_index = scroll_offset_ + i;
        const ColorEntry& entry = entries[static_cast<std::size_t>(item_index)];
        const int row = area.top + i;

        PutSwatch(row, area.left, store_.GetColorPreference(entry.name));

        // f = from file, d = derived by fallback, blank = untouched.
        const char* origin = " ";
        if (direct_.count(entry.name) != 0) {
            origin = "f";
        } else if (derived_.count(entry.name) != 0) {
            origin = "d";
        }
        if (item_index == selected_index_ && Focused()) {
            plane_->set_fg_rgb8(150, 200, 255);
        }
        plane_->putstr(row, area.left + kSwatchWidth + 1, origin);
        const int text_col = area.left + kSwatchWidth + 3;
        plane_->putstr(row, text_col, Fit(entry.name, bar_col - text_col).c_str());
        plane_->set_fg_default();
    }

    DrawScrollbar(area, bar_col, item_count);
}

void ImportScreen::PaletteSubframe::PutSwatch(int row, int col, const Rgb& color) {
    plane_->set_bg_rgb8(color.red, color.green, color.blue);
    for (int i = 0; i < kSwatchWidth; ++i) {
        plane_->putstr(row, col + i, " ");
    }
    plane_->set_bg_default();
}

void ImportScreen::PaletteSubframe::HandleInput(uint32_t input, const ncinput& details) {
    (void)details;
    const int item_count = static_cast<int>(registry_.Entries().size());
    if (item_count == 0) {
        return;
    }
    if (input == NCKEY_UP) {
        selected_index_ = (selected_index_ + item_count - 1) % item_count;
    } else if (input == NCKEY_DOWN) {
        selected_index_ = (selected_index_ + 1) % item_count;
    } else if (input == NCKEY_PGDOWN) {
        selected_index_ = std::min(item_count - 1, selected_index_ + 10);
    } else if (input == NCKEY_PGUP) {
        selected_index_ = std::max(0, selected_index_ - 10);
    }
}

ImportScreen::CommandSubframe::CommandSubframe() : Subframe("Commands") {}

void ImportScreen::CommandSubframe::ComputeGeometry(unsigned parent_rows,
                                                    unsigned parent_cols,
                                                    int& y,
                                                    int& x,
                                                    int& rows,
                                                    int& cols) {
    rows = kFooterRows;
    cols = std::max(20, static_cast<int>(parent_cols) - (kMargin * 2));
    y = kMargin + TopRows(parent_rows) + kGap;
    x = kMargin;
}

std::string ImportScreen::CommandSubframe::Label(Command command) const {
    switch (command) {
        case Command::Import:
            return "Import";
        case Command::ToggleBooleans:
            return include_booleans_ ? "Booleans: on" : "Booleans: off";
        case Command::ToggleAllFiles:
            return show_all_files_ ? "Files: all" : "Files: *.prf, *.txt";
        case Command::Exit:
            return "Exit";
    }
    return "";
}

void ImportScreen::CommandSubframe::DrawContents() {
    const ContentArea area = ContentBox(1, 2, 1, 2);
    if (area.height <= 0) {
        return;
    }

    int col = area.left;
    for (std::size_t i = 0; i < commands_.size(); ++i) {
        const std::string label = " " + Label(commands_[i]) + " ";
        if (static_cast<int>(i) == selected_index_) {
            plane_->set_bg_rgb8(255, 255, 255);
            plane_->set_fg_rgb8(0, 0, 0);
        }
        plane_->putstr(area.top, col, label.c_str());
        plane_->set_bg_default();
        plane_->set_fg_default();
        col += static_cast<int>(label.size()) + 2;
    }

    if (area.height > 1) {
        plane_->putstr(area.top + 1, area.left, Fit(feedback_, area.width).c_str());
    }

    // Newest log lines at the bottom.
    const int log_rows = area.height - 2;
    if (log_rows <= 0) {
        return;
    }
    const int first = std::max(0, static_cast<int>(log_.size()) - log_rows);
    for (int i = first; i < static_cast<int>(log_.size()); ++i) {
        plane_->putstr(area.top + 2 + (i - first), area.left, Fit(log_[static_cast<std::size_t>(i)], area.width).c_str());
    }
}

void ImportScreen::CommandSubframe::HandleInput(uint32_t input, const ncinput& details) {
    (void)details;
    const int count = static_cast<int>(commands_.size());
    if (input == NCKEY_LEFT) {
        selected_index_ = (selected_index_ + count - 1) % count;
    } else if (input == NCKEY_RIGHT) {
        selected_index_ = (selected_index_ + 1) % count;
    }
}

void ImportScreen::CommandSubframe::SetLabelState(bool include_booleans, bool show_all_files) {
    include_booleans_ = include_booleans;
    show_all_files_ = show_all_files;
}

void ImportScreen::CommandSubframe::SetFeedback(const std::string& text) {
    feedback_ = text;
}

void ImportScreen::CommandSubframe::AddLog(const std::string& line) {
    log_.push_back(line);
    if (log_.size() > kMaxLogLines) {
        log_.erase(log_.begin());
    }
}

void ImportScreen::CommandSubframe::ClearLog() {
    log_.clear();
}
