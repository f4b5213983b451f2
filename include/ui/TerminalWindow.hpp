#pragma once
#include <optional>
#include <string>
#include "app/ViewController.hpp"
#include "ui/InputStateMachine.hpp"

typedef struct screen SCREEN;

namespace Pequod {

// ncurses screen for the lifetime of the object.
class TerminalWindow {
public:
    explicit TerminalWindow(int pollMillis = 100);
    ~TerminalWindow();
    TerminalWindow(const TerminalWindow&) = delete;
    TerminalWindow& operator=(const TerminalWindow&) = delete;

    // Waits up to the poll interval; nullopt when no key arrived.
    std::optional<KeyEvent> readKey();
    void draw(const RenderSnapshot& snap);

    int width() const;
    int height() const;

private:
    void drawFeeds(const RenderSnapshot& snap);
    void drawEntry(const RenderSnapshot& snap);
    void drawStatus(const RenderSnapshot& snap);
    void drawHelp(const RenderSnapshot& snap);
    void drawConfirm(const RenderSnapshot& snap);
    void drawPrompt(const RenderSnapshot& snap);
    void drawBox(int top, int left, int rows, int cols, const std::string& title);
    void putLine(int y, int x, const std::string& text, int maxWidth);

    SCREEN* screen_;
    bool colors_;
};

}
