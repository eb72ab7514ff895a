#include "tui/BaseScreen.hpp"

void BaseScreen::DrawOuterFrame(ncpp::Plane& plane, const std::string& title) {
    plane.erase();
    plane.perimeter_rounded(0, 0, 0);
    plane.putstr(0, ncpp::NCAlign::Center, title.c_str());
}

void BaseScreen::CenterLines(ncpp::Plane& plane, const std::vector<std::string>& lines) {
    unsigned rows = 0;
    unsigned cols = 0;
    plane.get_dim(rows, cols);

    const int total_lines = static_cast<int>(lines.size());
    const int mid_row = static_cast<int>(rows) / 2;

    for (int index = 0; index < total_lines; ++index) {
        const int row = mid_row - total_lines / 2 + index;
        plane.putstr(row, ncpp::NCAlign::Center, lines[static_cast<std::size_t>(index)].c_str());
    }
}
