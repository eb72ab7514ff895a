#ifndef TUI_IMPORTSCREEN_HPP
#define TUI_IMPORTSCREEN_HPP

#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "schemer/PrfPreferenceStore.hpp"
#include "schemer/SchemeImporter.hpp"
#include "tui/BaseScreen.hpp"
#include "tui/Config.hpp"
#include "tui/FileBrowser.hpp"
#include "tui/Subframe.hpp"

// Main screen: pick a scheme file, import it, and preview the palette.
// Tab cycles focus between the command, file and palette panes.
class ImportScreen : public BaseScreen {
public:
    ImportScreen(SchemerConfig& config,
                 bool& config_changed,
                 PrfPreferenceStore& store,
                 SchemeImporter& importer);

    void Enter(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override;
    void Draw(StateMachine& machine, ncpp::NotCurses& nc, ncpp::Plane& stdplane) override;
    void HandleInput(StateMachine& machine,
                     ncpp::NotCurses& nc,
                     ncpp::Plane& stdplane,
                     uint32_t input,
                     const ncinput& details) override;

private:
    enum class Focus {
        Commands,
        Files,
        Palette
    };

    class FileSubframe : public Subframe {
    public:
        explicit FileSubframe(const std::filesystem::path& start);

        void HandleInput(uint32_t input, const ncinput& details) override;
        // File chosen with Enter since the last call, or empty.
        std::filesystem::path TakeChosenFile();
        std::filesystem::path SelectedFile() const { return browser_.SelectedFile(); }
        void SetShowAllFiles(bool show_all) { browser_.SetShowAllFiles(show_all); }
        bool ShowAllFiles() const { return browser_.ShowAllFiles(); }

    protected:
        void ComputeGeometry(unsigned parent_rows,
                             unsigned parent_cols,
                             int& y,
                             int& x,
                             int& rows,
                             int& cols) override;
        void DrawContents() override;

    private:
        FileBrowser browser_;
        std::filesystem::path chosen_;
    };

    class PaletteSubframe : public Subframe {
    public:
        PaletteSubframe(const PreferenceStore& store, const ColorRegistry& registry);

        void HandleInput(uint32_t input, const ncinput& details) override;
        void SetReport(const ImportReport& report);

    protected:
        void ComputeGeometry(unsigned parent_rows,
                             unsigned parent_cols,
                             int& y,
                             int& x,
                             int& rows,
                             int& cols) override;
        void DrawContents() override;

    private:
        void PutSwatch(int row, int col, const Rgb& color);

        const PreferenceStore& store_;
        const ColorRegistry& registry_;
        std::set<std::string> direct_;
        std::set<std::string> derived_;
        int selected_index_ = 0;
    };

    class CommandSubframe : public Subframe {
    public:
        enum class Command {
            Import,
            ToggleBooleans,
            ToggleAllFiles,
            Exit
        };

        CommandSubframe();

        void HandleInput(uint32_t input, const ncinput& details) override;
        Command SelectedCommand() const { return commands_[static_cast<std::size_t>(selected_index_)]; }
        void SetLabelState(bool include_booleans, bool show_all_files);
        void SetFeedback(const std::string& text);
        void AddLog(const std::string& line);
        void ClearLog();

    protected:
        void ComputeGeometry(unsigned parent_rows,
                             unsigned parent_cols,
                             int& y,
                             int& x,
                             int& rows,
                             int& cols) override;
        void DrawContents() override;

    private:
        std::string Label(Command command) const;

        std::vector<Command> commands_{Command::Import, Command::ToggleBooleans, Command::ToggleAllFiles, Command::Exit};
        int selected_index_ = 0;
        bool include_booleans_ = false;
        bool show_all_files_ = false;
        std::string feedback_ = "Ready";
        std::vector<std::string> log_;
    };

    void RunImport(StateMachine& machine, const std::filesystem::path& scheme);
    void RunCommand(StateMachine& machine);

    SchemerConfig& config_;
    bool& config_changed_;
    PrfPreferenceStore& store_;
    SchemeImporter& importer_;
    Focus focus_ = Focus::Files;
    FileSubframe file_subframe_;
    PaletteSubframe palette_subframe_;
    CommandSubframe command_subframe_;
};

#endif // TUI_IMPORTSCREEN_HPP
