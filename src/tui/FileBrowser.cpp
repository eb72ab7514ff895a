#include "tui/FileBrowser.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

namespace {
std::string Lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}
}

FileBrowser::FileBrowser(const std::filesystem::path& start, std::vector<std::string> extensions)
    : current_path_(start),
      extensions_(std::move(extensions)),
      selected_index_(0),
      show_all_(false) {
    for (std::string& ext : extensions_) {
        ext = Lowercase(ext);
    }
    if (!Refresh()) {
        current_path_ = std::filesystem::current_path();
        Refresh();
    }
}

bool FileBrowser::Load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        return false;
    }
    const std::filesystem::path previous = current_path_;
    current_path_ = path;
    if (!Refresh()) {
        current_path_ = previous;
        Refresh();
        return false;
    }
    return true;
}

void FileBrowser::MoveSelectionUp() {
    if (entries_.empty()) {
        return;
    }
    if (selected_index_ == 0) {
        selected_index_ = entries_.size() - 1;
    } else {
        --selected_index_;
    }
}

void FileBrowser::MoveSelectionDown() {
    if (entries_.empty()) {
        return;
    }
    selected_index_ = (selected_index_ + 1) % entries_.size();
}

bool FileBrowser::ActivateSelection() {
    if (entries_.empty()) {
        return false;
    }

    const Entry& entry = entries_[selected_index_];
    if (entry.name == "..") {
        if (current_path_.has_parent_path()) {
            Load(current_path_.parent_path());
        }
        return false;
    }

    if (!entry.is_dir) {
        return true;
    }

    Load(current_path_ / entry.name);
    return false;
}

std::filesystem::path FileBrowser::SelectedFile() const {
    if (entries_.empty() || entries_[selected_index_].is_dir) {
        return {};
    }
    return current_path_ / entries_[selected_index_].name;
}

void FileBrowser::SetShowAllFiles(bool show_all) {
    if (show_all_ == show_all) {
        return;
    }
    show_all_ = show_all;
    Refresh();
}

bool FileBrowser::MatchesFilter(const std::filesystem::path& file) const {
    if (show_all_ || extensions_.empty()) {
        return true;
    }
    const std::string ext = Lowercase(file.extension().string());
    return std::find(extensions_.begin(), extensions_.end(), ext) != extensions_.end();
}

bool FileBrowser::Refresh() {
    std::error_code ec;
    std::filesystem::directory_iterator it(current_path_, ec);
    if (ec) {
        return false;
    }

    entries_.clear();
    selected_index_ = 0;

    if (current_path_.has_parent_path() && current_path_ != current_path_.root_path()) {
        entries_.push_back(Entry{"..", true});
    }

    std::vector<Entry> dirs;
    std::vector<Entry> files;

    // A read error part way through ends the listing; nothing throws here.
    const std::filesystem::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        const std::filesystem::directory_entry& dirent = *it;
        const std::string name = dirent.path().filename().string();
        std::error_code entry_ec;
        if (dirent.is_directory(entry_ec)) {
            dirs.push_back(Entry{name, true});
        } else if (MatchesFilter(dirent.path())) {
            files.push_back(Entry{name, false});
        }
    }

    auto sorter = [](const Entry& a, const Entry& b) {
        return a.name < b.name;
    };
    std::sort(dirs.begin(), dirs.end(), sorter);
    std::sort(files.begin(), files.end(), sorter);

    entries_.insert(entries_.end(), dirs.begin(), dirs.end());
    entries_.insert(entries_.end(), files.begin(), files.end());
    return true;
}
