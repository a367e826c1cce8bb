#include "terminal/TerminalRenderer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

constexpr char32_t kReplacement = 0xFFFD;

void appendUtf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // namespace

TerminalRenderer::TerminalRenderer(int columns, int maxRows)
    : columns_(std::max(columns, 1)), maxRows_(std::max(maxRows, 1)) {}

void TerminalRenderer::reset() {
    grid_.clear();
    row_ = col_ = 0;
    savedRow_ = savedCol_ = 0;
    wrapPending_ = false;
    state_ = State::Ground;
    csiParams_.clear();
    csiPrivate_ = false;
    utf8Acc_ = 0;
    utf8Remaining_ = 0;
}

std::string TerminalRenderer::render(std::string_view raw, int columns, int maxRows) {
    TerminalRenderer r(columns, maxRows);
    r.feed(raw);
    return r.text();
}

void TerminalRenderer::feed(std::string_view bytes) {
    for (char c : bytes)
        processByte(static_cast<unsigned char>(c));
}

void TerminalRenderer::processByte(unsigned char b) {
    // Escape sequences are pure ASCII; only Ground decodes UTF-8
    if (state_ != State::Ground) {
        switch (state_) {
            case State::Escape:
                escapeDispatch(b);
                return;
            case State::Csi:
                if (b >= 0x40 && b <= 0x7E) {
                    executeCsi(static_cast<char>(b));
                    state_ = State::Ground;
                } else if (b == '?' || b == '>' || b == '=') {
                    csiPrivate_ = true;
                } else if (b == 0x1B) {
                    state_ = State::Escape;   // aborted sequence
                } else if (csiParams_.size() < kMaxCsiLength) {
                    csiParams_ += static_cast<char>(b);
                }
                return;
            case State::Osc:
                if (b == 0x07)      state_ = State::Ground;
                else if (b == 0x1B) state_ = State::OscEscape;
                return;
            case State::OscEscape:
                state_ = (b == '\\') ? State::Ground : State::Osc;
                return;
            case State::Charset:
                state_ = State::Ground;
                return;
            case State::Ground:
                break;
        }
    }

    if (utf8Remaining_ > 0) {
        if ((b & 0xC0) == 0x80) {
            utf8Acc_ = (utf8Acc_ << 6) | (b & 0x3F);
            if (--utf8Remaining_ == 0)
                processCodepoint(utf8Acc_);
            return;
        }
        // Truncated sequence: emit replacement and reprocess this byte
        utf8Remaining_ = 0;
        processCodepoint(kReplacement);
    }

    if (b < 0x80) {
        processCodepoint(b);
    } else if ((b & 0xE0) == 0xC0) {
        utf8Acc_ = b & 0x1F;
        utf8Remaining_ = 1;
    } else if ((b & 0xF0) == 0xE0) {
        utf8Acc_ = b & 0x0F;
        utf8Remaining_ = 2;
    } else if ((b & 0xF8) == 0xF0) {
        utf8Acc_ = b & 0x07;
        utf8Remaining_ = 3;
    } else {
        processCodepoint(kReplacement);
    }
}

void TerminalRenderer::processCodepoint(char32_t cp) {
    switch (cp) {
        case 0x1B:
            state_ = State::Escape;
            return;
        case '\r':
            col_ = 0;
            wrapPending_ = false;
            return;
        case '\n':
        case 0x0B:
        case 0x0C:
            // PTYs translate LF to CRLF on output; plain text expects the same
            lineFeed();
            col_ = 0;
            return;
        case '\b':
            if (col_ > 0) col_--;
            wrapPending_ = false;
            return;
        case '\t':
            col_ = std::min(columns_ - 1, (col_ / 8 + 1) * 8);
            wrapPending_ = false;
            return;
        case 0x07:
        case 0x00:
            return;
        default:
            break;
    }
    if (cp < 0x20 || cp == 0x7F) return;
    putGlyph(cp);
}

void TerminalRenderer::putGlyph(char32_t cp) {
    if (wrapPending_) {
        lineFeed();
        col_ = 0;
        wrapPending_ = false;
    }
    auto& line = rowAt(row_);
    if ((int)line.size() <= col_)
        line.resize(col_ + 1, U' ');
    line[col_] = cp;

    if (col_ == columns_ - 1) wrapPending_ = true;
    else                      col_++;
}

void TerminalRenderer::escapeDispatch(unsigned char b) {
    state_ = State::Ground;
    switch (b) {
        case '[':
            state_ = State::Csi;
            csiParams_.clear();
            csiPrivate_ = false;
            break;
        case ']':
            state_ = State::Osc;
            break;
        case '(':
        case ')':
            state_ = State::Charset;
            break;
        case '7':
            savedRow_ = row_;
            savedCol_ = col_;
            break;
        case '8':
            moveTo(savedRow_, savedCol_);
            break;
        case 'D':
            lineFeed();
            break;
        case 'E':
            lineFeed();
            col_ = 0;
            break;
        case 'M':
            if (row_ > 0) row_--;
            break;
        case 'c':
            reset();
            break;
        default:
            spdlog::debug("TerminalRenderer: ignoring ESC {:c}", static_cast<char>(b));
            break;
    }
}

int TerminalRenderer::param(size_t index, int defaultVal) const {
    size_t start = 0;
    for (size_t i = 0; i < index; i++) {
        start = csiParams_.find(';', start);
        if (start == std::string::npos) return defaultVal;
        start++;
    }
    size_t end = csiParams_.find(';', start);
    std::string field = csiParams_.substr(start, end == std::string::npos
                                                     ? std::string::npos
                                                     : end - start);
    if (field.empty()) return defaultVal;
    int value = 0;
    for (char c : field) {
        if (c < '0' || c > '9') return defaultVal;
        value = std::min(value * 10 + (c - '0'), kMaxParam);
    }
    return value;
}

void TerminalRenderer::executeCsi(char final) {
    // Private-mode sequences (cursor visibility, alt screen, bracketed
    // paste) do not affect the text grid
    if (csiPrivate_) return;

    switch (final) {
        case 'A': moveTo(row_ - std::max(param(0, 1), 1), col_); break;
        case 'B': moveTo(row_ + std::max(param(0, 1), 1), col_); break;
        case 'C': moveTo(row_, col_ + std::max(param(0, 1), 1)); break;
        case 'D': moveTo(row_, col_ - std::max(param(0, 1), 1)); break;
        case 'E': moveTo(row_ + std::max(param(0, 1), 1), 0); break;
        case 'F': moveTo(row_ - std::max(param(0, 1), 1), 0); break;
        case 'G':
        case '`': moveTo(row_, param(0, 1) - 1); break;
        case 'd': moveTo(param(0, 1) - 1, col_); break;
        case 'H':
        case 'f': moveTo(param(0, 1) - 1, param(1, 1) - 1); break;
        case 'J': eraseInDisplay(param(0, 0)); break;
        case 'K': eraseInLine(param(0, 0)); break;
        case 'X': {
            auto& line = rowAt(row_);
            int n = std::max(param(0, 1), 1);
            for (int c = col_; c < col_ + n && c < (int)line.size(); c++)
                line[c] = U' ';
            break;
        }
        case 'P': {
            auto& line = rowAt(row_);
            int n = std::max(param(0, 1), 1);
            if (col_ < (int)line.size())
                line.erase(col_, std::min<size_t>(n, line.size() - col_));
            break;
        }
        case 's':
            savedRow_ = row_;
            savedCol_ = col_;
            break;
        case 'u':
            moveTo(savedRow_, savedCol_);
            break;
        case 'm':   // SGR: colours and attributes are discarded
        default:
            break;
    }
}

void TerminalRenderer::lineFeed() {
    wrapPending_ = false;
    if (row_ + 1 < maxRows_) {
        row_++;
        return;
    }
    // Bottom of the buffer: scroll the oldest row away
    if (!grid_.empty()) grid_.erase(grid_.begin());
}

void TerminalRenderer::moveTo(int row, int col) {
    row_ = std::clamp(row, 0, maxRows_ - 1);
    col_ = std::clamp(col, 0, columns_ - 1);
    wrapPending_ = false;
}

void TerminalRenderer::eraseInLine(int mode) {
    auto& line = rowAt(row_);
    switch (mode) {
        case 0:
            if (col_ < (int)line.size()) line.resize(col_);
            break;
        case 1:
            for (int c = 0; c <= col_ && c < (int)line.size(); c++)
                line[c] = U' ';
            break;
        case 2:
            line.clear();
            break;
        default:
            break;
    }
}

void TerminalRenderer::eraseInDisplay(int mode) {
    switch (mode) {
        case 0:
            eraseInLine(0);
            if ((int)grid_.size() > row_ + 1) grid_.resize(row_ + 1);
            break;
        case 1:
            for (int r = 0; r < row_ && r < (int)grid_.size(); r++)
                grid_[r].clear();
            eraseInLine(1);
            break;
        case 2:
        case 3:
            // Full clear: the grid restarts, cursor stays where it is
            for (auto& line : grid_) line.clear();
            break;
        default:
            break;
    }
}

std::u32string& TerminalRenderer::rowAt(int r) {
    if ((int)grid_.size() <= r)
        grid_.resize(r + 1);
    return grid_[r];
}

std::vector<std::string> TerminalRenderer::lines() const {
    std::vector<std::string> out;
    out.reserve(grid_.size());
    for (auto& row : grid_) {
        size_t end = row.find_last_not_of(U" \0", std::u32string::npos, 2);
        std::string line;
        if (end != std::u32string::npos) {
            for (size_t i = 0; i <= end; i++)
                appendUtf8(line, row[i] == U'\0' ? U' ' : row[i]);
        }
        out.push_back(std::move(line));
    }
    while (!out.empty() && out.back().empty())
        out.pop_back();
    return out;
}

std::string TerminalRenderer::text() const {
    std::string out;
    auto all = lines();
    for (size_t i = 0; i < all.size(); i++) {
        if (i > 0) out += '\n';
        out += all[i];
    }
    return out;
}
