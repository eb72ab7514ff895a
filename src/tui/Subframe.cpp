#include <algorithm>
#include <utility>

#include "tui/Subframe.hpp"

Subframe::Subframe(std::string title)
    : plane_(nullptr),
      cached_rows_(0),
      cached_cols_(0),
      scroll_offset_(0),
      title_(std::move(title)),
      focused_(false) {}

Subframe::~Subframe() = default;

void Subframe::Resize(ncpp::Plane& parent, unsigned parent_rows, unsigned parent_cols) {
    int y = 0;
    int x = 0;
    int rows = 0;
    int cols = 0;
    ComputeGeometry(parent_rows, parent_cols, y, x, rows, cols);

    if (rows <= 0 || cols <= 0) {
        plane_.reset();
        cached_rows_ = cached_cols_ = 0;
        return;
    }

    if (plane_ == nullptr || cached_rows_ != static_cast<unsigned>(rows) || cached_cols_ != static_cast<unsigned>(cols)) {
        plane_ = std::make_unique<ncpp::Plane>(&parent, rows, cols, y, x);
        cached_rows_ = static_cast<unsigned>(rows);
        cached_cols_ = static_cast<unsigned>(cols);
    } else {
        plane_->move(y, x);
    }
}

void Subframe::Draw() {
    if (plane_ == nullptr) {
        return;
    }
    plane_->erase();

    uint64_t channels = 0;
    if (focused_) {
        ncchannels_set_fg_rgb8(&channels, 150, 200, 255);
        ncchannels_set_bg_default(&channels);
    }
    plane_->perimeter_rounded(0, channels, 0);
    plane_->putstr(0, ncpp::NCAlign::Center, title_.c_str());

    DrawContents();

    plane_->set_bg_default();
    plane_->set_fg_default();
}

void Subframe::HandleInput(uint32_t input, const ncinput& details) {
    (void)input;
    (void)details;
}

Subframe::ContentArea Subframe::ContentBox(int pad_top, int pad_left, int pad_bottom, int pad_right) const {
    ContentArea area{0, 0, 0, 0};
    if (plane_ == nullptr) {
        return area;
    }

    const int total_rows = static_cast<int>(plane_->get_dim_y());
    const int total_cols = static_cast<int>(plane_->get_dim_x());

    area.top = std::max(0, pad_top);
    area.left = std::max(0, pad_left);
    area.height = std::max(0, total_rows - pad_top - pad_bottom);
    area.width = std::max(0, total_cols - pad_left - pad_right);
    return area;
}

void Subframe::ClampScroll(int selected, int visible_rows) {
    if (visible_rows <= 0) {
        scroll_offset_ = 0;
        return;
    }
    if (selected < scroll_offset_) {
        scroll_offset_ = selected;
    } else if (selected >= scroll_offset_ + visible_rows) {
        scroll_offset_ = selected - visible_rows + 1;
    }
    scroll_offset_ = std::max(0, scroll_offset_);
}

void Subframe::DrawScrollbar(const ContentArea& area, int col, int item_count) {
    const int visible_rows = area.height;
    if (item_count <= visible_rows || visible_rows <= 0) {
        return;
    }
    const int thumb_height = std::max(1, (visible_rows * visible_rows) / item_count);
    const int max_thumb_start = visible_rows - thumb_height;
    const int thumb_start = (max_thumb_start * scroll_offset_) / (item_count - visible_rows);
    plane_->set_bg_rgb8(200, 200, 200);
    plane_->set_fg_rgb8(0, 0, 0);
    for (int i = 0; i < thumb_height; ++i) {
        plane_->putstr(area.top + thumb_start + i, col, " ");
    }
    plane_->set_bg_default();
    plane_->set_fg_default();
}
