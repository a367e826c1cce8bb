#pragma once
#include <string>
#include <string_view>
#include <vector>

// Minimal VT100-style emulator. Replays a raw PTY byte stream onto a
// character grid so in-place redraws collapse into what a real
// terminal would show. Colours and attributes are parsed and dropped.
class TerminalRenderer {
public:
    // Cursor addressing is clamped to maxRows; line feeds past it scroll
    explicit TerminalRenderer(int columns = 200, int maxRows = kDefaultMaxRows);

    void feed(std::string_view bytes);
    void reset();

    // Grid serialised top to bottom, trailing blanks and blank tail rows removed
    std::vector<std::string> lines() const;
    std::string text() const;

    int cursorRow() const { return row_; }
    int cursorCol() const { return col_; }

    // One-shot convenience: render(raw) == TerminalRenderer(c).feed(raw).text()
    static std::string render(std::string_view raw, int columns = 200,
                              int maxRows = kDefaultMaxRows);

    static constexpr int kDefaultMaxRows = 2000;

private:
    enum class State {
        Ground,
        Escape,
        Csi,
        Osc,
        OscEscape,   // saw ESC inside an OSC, expecting '\'
        Charset      // ESC ( / ESC ) designator, one byte follows
    };

    void processByte(unsigned char b);
    void processCodepoint(char32_t cp);
    void putGlyph(char32_t cp);
    void executeCsi(char final);
    void escapeDispatch(unsigned char b);

    void lineFeed();
    void moveTo(int row, int col);
    void eraseInLine(int mode);
    void eraseInDisplay(int mode);
    std::u32string& rowAt(int r);

    // Numeric parameters saturate at kMaxParam
    int param(size_t index, int defaultVal) const;

    static constexpr int    kMaxParam      = 9999;
    static constexpr size_t kMaxCsiLength  = 64;

    int columns_;
    int maxRows_;
    std::vector<std::u32string> grid_;
    int row_ = 0;
    int col_ = 0;
    bool wrapPending_ = false;
    int savedRow_ = 0;
    int savedCol_ = 0;

    State state_ = State::Ground;
    std::string csiParams_;
    bool csiPrivate_ = false;

    // UTF-8 decoder state
    char32_t utf8Acc_ = 0;
    int      utf8Remaining_ = 0;
};
