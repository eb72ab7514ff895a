#ifndef TUI_FILEBROWSER_HPP
#define TUI_FILEBROWSER_HPP

#include <filesystem>
#include <string>
#include <vector>

// Directory listing used to pick a scheme file: directories plus files whose
// extension is in the filter (case-insensitive). An empty filter shows all files.
class FileBrowser {
public:
    struct Entry {
        std::string name;
        bool is_dir;
    };

    explicit FileBrowser(const std::filesystem::path& start = std::filesystem::current_path(),
                         std::vector<std::string> extensions = {".prf", ".txt"});

    // Load a new directory; returns false if it could not be read.
    bool Load(const std::filesystem::path& path);

    // Move selection up/down with wrap-around.
    void MoveSelectionUp();
    void MoveSelectionDown();

    // Enter the selected directory (".." goes to parent). Returns true when
    // the selection is a file, leaving the listing unchanged.
    bool ActivateSelection();

    // Full path of the selected file, or empty when a directory is selected.
    std::filesystem::path SelectedFile() const;

    // Toggle between the extension filter and "All Files".
    void SetShowAllFiles(bool show_all);
    bool ShowAllFiles() const { return show_all_; }

    const std::vector<Entry>& Entries() const { return entries_; }
    std::size_t SelectedIndex() const { return selected_index_; }
    std::filesystem::path CurrentPath() const { return current_path_; }

private:
    bool Refresh();
    bool MatchesFilter(const std::filesystem::path& file) const;

    std::filesystem::path current_path_;
    std::vector<std::string> extensions_;
    std::vector<Entry> entries_;
    std::size_t selected_index_;
    bool show_all_;
};

#endif // TUI_FILEBROWSER_HPP
