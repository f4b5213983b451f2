#include "ui/TerminalWindow.hpp"
#include "utils/TextUtils.hpp"
#include <ncursesw/curses.h>
#include <algorithm>
#include <clocale>
#include <cstdio>
#include <stdexcept>

namespace Pequod {

namespace {

enum ColorPair : short {
    PairHeader = 1,
    PairUnread = 2,
    PairError = 3,
    PairStatus = 4,
    PairDate = 5
};

std::optional<KeyEvent> mapFunctionKey(wint_t ch) {
    switch (ch) {
        case KEY_UP: return KeyEvent{Keys::Up, NoModifier};
        case KEY_DOWN: return KeyEvent{Keys::Down, NoModifier};
        case KEY_LEFT: return KeyEvent{Keys::Left, NoModifier};
        case KEY_RIGHT: return KeyEvent{Keys::Right, NoModifier};
        case KEY_HOME: return KeyEvent{Keys::Home, NoModifier};
        case KEY_END: return KeyEvent{Keys::End, NoModifier};
        case KEY_PPAGE: return KeyEvent{Keys::PageUp, NoModifier};
        case KEY_NPAGE: return KeyEvent{Keys::PageDown, NoModifier};
        case KEY_ENTER: return KeyEvent{Keys::Enter, NoModifier};
        case KEY_BACKSPACE: return KeyEvent{Keys::Backspace, NoModifier};
        case KEY_RESIZE: return KeyEvent{Keys::Resize, NoModifier};
        default: return std::nullopt;
    }
}

KeyEvent mapCharacter(wint_t ch) {
    switch (ch) {
        case '\n':
        case '\r': return KeyEvent{Keys::Enter, NoModifier};
        case 27: return KeyEvent{Keys::Escape, NoModifier};
        case 8:
        case 127: return KeyEvent{Keys::Backspace, NoModifier};
        default: break;
    }
    // Ctrl-a .. Ctrl-z arrive as 1 .. 26.
    if (ch >= 1 && ch <= 26) return KeyEvent{static_cast<int>('a' + ch - 1), Ctrl};
    return KeyEvent{static_cast<int>(ch), NoModifier};
}

}

TerminalWindow::TerminalWindow(int pollMillis) : screen_(nullptr), colors_(false) {
    setlocale(LC_ALL, "");
    screen_ = newterm(nullptr, stdout, stdin);
    if (!screen_) throw std::runtime_error("unable to initialize the terminal");
    set_term(screen_);
    set_escdelay(25);
    cbreak();
    noecho();
    nonl();
    keypad(stdscr, TRUE);
    curs_set(0);
    timeout(pollMillis);

    if (has_colors()) {
        start_color();
        use_default_colors();
        init_pair(PairHeader, COLOR_BLACK, COLOR_CYAN);
        init_pair(PairUnread, COLOR_YELLOW, -1);
        init_pair(PairError, COLOR_RED, -1);
        init_pair(PairStatus, COLOR_WHITE, COLOR_BLUE);
        init_pair(PairDate, COLOR_CYAN, -1);
        colors_ = true;
    }
}

TerminalWindow::~TerminalWindow() {
    endwin();
    delscreen(screen_);
}

int TerminalWindow::width() const { return COLS; }
int TerminalWindow::height() const { return LINES; }

std::optional<KeyEvent> TerminalWindow::readKey() {
    wint_t ch = 0;
    int rc = get_wch(&ch);
    if (rc == ERR) return std::nullopt;
    if (rc == KEY_CODE_YES) return mapFunctionKey(ch);
    return mapCharacter(ch);
}

void TerminalWindow::putLine(int y, int x, const std::string& text, int maxWidth) {
    if (maxWidth <= 0 || y < 0 || y >= LINES) return;
    mvaddstr(y, x, truncateText(text, static_cast<size_t>(maxWidth)).c_str());
}

void TerminalWindow::draw(const RenderSnapshot& snap) {
    erase();
    if (snap.view == ViewMode::Feeds) drawFeeds(snap);
    else drawEntry(snap);
    drawStatus(snap);

    switch (snap.overlay) {
        case Overlay::HelpPopup: drawHelp(snap); break;
        case Overlay::ConfirmDelete: drawConfirm(snap); break;
        case Overlay::AddFeedPrompt: drawPrompt(snap); break;
        case Overlay::None: curs_set(0); break;
    }
    refresh();
}

void TerminalWindow::drawFeeds(const RenderSnapshot& snap) {
    if (colors_) attron(COLOR_PAIR(PairHeader));
    mvhline(0, 0, ' ', COLS);
    std::string header = " pequod  " + std::to_string(snap.rowCount) + " rows";
    putLine(0, 0, header, COLS);
    if (colors_) attroff(COLOR_PAIR(PairHeader));

    if (snap.rows.empty()) {
        putLine(2, 2, "No feeds yet. Press a to add one.", COLS - 2);
        return;
    }

    int y = 1;
    for (const auto& row : snap.rows) {
        int attrs = row.selected ? A_REVERSE : A_NORMAL;
        attron(attrs);
        if (row.selected) mvhline(y, 0, ' ', COLS);
        if (row.kind == RowKind::Feed) {
            std::string label = std::string(row.collapsed ? "[+] " : "[-] ") + row.title;
            if (row.unreadCount > 0) label += " (" + std::to_string(row.unreadCount) + ")";
            if (row.syncFailed) label += " !";
            if (colors_ && row.syncFailed && !row.selected) attron(COLOR_PAIR(PairError));
            attron(A_BOLD);
            putLine(y, 0, label, COLS);
            attroff(A_BOLD);
            if (colors_ && row.syncFailed && !row.selected) attroff(COLOR_PAIR(PairError));
        } else {
            int dateWidth = row.date.empty() ? 0 : static_cast<int>(displayWidth(row.date)) + 1;
            std::string marker = row.read ? "    " : "  * ";
            if (colors_ && !row.read && !row.selected) attron(COLOR_PAIR(PairUnread));
            putLine(y, 0, marker + row.title, COLS - dateWidth - 1);
            if (colors_ && !row.read && !row.selected) attroff(COLOR_PAIR(PairUnread));
            if (dateWidth > 0 && COLS > dateWidth + 10) {
                if (colors_ && !row.selected) attron(COLOR_PAIR(PairDate));
                putLine(y, COLS - dateWidth, row.date, dateWidth);
                if (colors_ && !row.selected) attroff(COLOR_PAIR(PairDate));
            }
        }
        attroff(attrs);
        ++y;
    }
}

void TerminalWindow::drawEntry(const RenderSnapshot& snap) {
    if (colors_) attron(COLOR_PAIR(PairHeader));
    mvhline(0, 0, ' ', COLS);
    putLine(0, 1, snap.entryTitle, COLS - 2);
    if (colors_) attroff(COLOR_PAIR(PairHeader));

    int y = 1;
    for (const auto& line : snap.bodyLines) {
        putLine(y++, 1, line, COLS - 2);
    }
}

void TerminalWindow::drawStatus(const RenderSnapshot& snap) {
    int y = LINES - 1;
    if (colors_) attron(COLOR_PAIR(PairStatus));
    mvhline(y, 0, ' ', COLS);
    std::string prefix = snap.busy ? std::string(1, snap.spinner) + " " : "";
    std::string position;
    if (snap.view == ViewMode::Entry && snap.bodyLineCount > 0) {
        position = std::to_string(snap.bodyScroll + 1) + "/" + std::to_string(snap.bodyLineCount);
        if (snap.showingFullContent) position = "full " + position;
    }
    int positionWidth = static_cast<int>(displayWidth(position));
    putLine(y, 0, prefix + snap.status, COLS - positionWidth - 1);
    if (!position.empty()) putLine(y, COLS - positionWidth, position, positionWidth);
    if (colors_) attroff(COLOR_PAIR(PairStatus));
}

void TerminalWindow::drawBox(int top, int left, int rows, int cols, const std::string& title) {
    for (int y = top; y < top + rows; ++y) mvhline(y, left, ' ', cols);
    mvhline(top, left, ACS_HLINE, cols);
    mvhline(top + rows - 1, left, ACS_HLINE, cols);
    mvvline(top, left, ACS_VLINE, rows);
    mvvline(top, left + cols - 1, ACS_VLINE, rows);
    mvaddch(top, left, ACS_ULCORNER);
    mvaddch(top, left + cols - 1, ACS_URCORNER);
    mvaddch(top + rows - 1, left, ACS_LLCORNER);
    mvaddch(top + rows - 1, left + cols - 1, ACS_LRCORNER);
    if (!title.empty()) putLine(top, left + 2, " " + title + " ", cols - 4);
}

void TerminalWindow::drawHelp(const RenderSnapshot& snap) {
    int rows = std::min(LINES, static_cast<int>(snap.helpLines.size()) + 2);
    int cols = std::min(COLS, 44);
    int top = std::max(0, (LINES - rows) / 2);
    int left = std::max(0, (COLS - cols) / 2);
    drawBox(top, left, rows, cols, "Help");
    for (int i = 0; i + 2 < rows && i < static_cast<int>(snap.helpLines.size()); ++i) {
        putLine(top + 1 + i, left + 2, snap.helpLines[i], cols - 4);
    }
}

void TerminalWindow::drawConfirm(const RenderSnapshot& snap) {
    int cols = std::min(COLS, 50);
    int top = std::max(0, (LINES - 4) / 2);
    int left = std::max(0, (COLS - cols) / 2);
    drawBox(top, left, 4, cols, "Delete feed");
    putLine(top + 1, left + 2, snap.deleteTarget, cols - 4);
    putLine(top + 2, left + 2, "Delete this feed and its entries? (y/n)", cols - 4);
}

void TerminalWindow::drawPrompt(const RenderSnapshot& snap) {
    int cols = std::min(COLS, 70);
    int top = std::max(0, (LINES - 3) / 2);
    int left = std::max(0, (COLS - cols) / 2);
    drawBox(top, left, 3, cols, "Add feed (Enter to add, Esc to cancel)");

    // Keep the cursor in view for URLs wider than the box.
    int field = std::max(1, cols - 4);
    int offset = std::max(0, snap.promptCursor - field + 1);
    const std::string& text = snap.promptText;
    std::string shown;
    int index = 0;
    for (size_t i = 0; i < text.size();) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t len = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : 4;
        if (index >= offset && index < offset + field) shown += text.substr(i, len);
        i += len;
        ++index;
    }
    putLine(top + 1, left + 2, shown, field);
    curs_set(1);
    move(top + 1, left + 2 + snap.promptCursor - offset);
}

}
