#ifndef TUI_SUBFRAME_HPP
#define TUI_SUBFRAME_HPP

#include <memory>
#include <string>

#include <ncpp/Plane.hh>
#include <notcurses/notcurses.h>

// Bordered, titled pane that owns its own ncplane anchored to a parent.
class Subframe {
public:
    explicit Subframe(std::string title);
    virtual ~Subframe();

    // Resize/recreate the plane based on the parent's current dimensions.
    void Resize(ncpp::Plane& parent, unsigned parent_rows, unsigned parent_cols);

    // Draw border, title and contents. Assumes Resize was called this frame.
    void Draw();

    // Input handler for the focused pane.
    virtual void HandleInput(uint32_t input, const ncinput& details);

    void SetFocused(bool focused) { focused_ = focused; }
    bool Focused() const { return focused_; }

protected:
    struct ContentArea {
        int top;
        int left;
        int height;
        int width;
    };

    // Derived classes describe placement relative to the parent.
    virtual void ComputeGeometry(unsigned parent_rows,
                                 unsigned parent_cols,
                                 int& y,
                                 int& x,
                                 int& rows,
                                 int& cols) = 0;

    // Derived classes render inside the border; plane_ is valid here.
    virtual void DrawContents() = 0;

    // Inner content area after applying padding.
    ContentArea ContentBox(int pad_top, int pad_left, int pad_bottom, int pad_right) const;

    // Keeps selected inside [scroll_offset_, scroll_offset_ + visible_rows).
    void ClampScroll(int selected, int visible_rows);

    // Draws a scrollbar thumb in column col for a list of item_count rows.
    void DrawScrollbar(const ContentArea& area, int col, int item_count);

    std::unique_ptr<ncpp::Plane> plane_;
    unsigned cached_rows_;
    unsigned cached_cols_;
    int scroll_offset_;

private:
    std::string title_;
    bool focused_;
};

#endif // TUI_SUBFRAME_HPP
