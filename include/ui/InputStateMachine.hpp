#pragma once
#include <map>
#include <optional>
#include <utility>

namespace Pequod {

enum class ViewMode {
    Feeds,
    Entry
};

enum class Overlay {
    None,
    HelpPopup,
    ConfirmDelete,
    AddFeedPrompt
};

// Codes above the Unicode range name the non-character keys.
namespace Keys {
constexpr int Enter = 0x110001;
constexpr int Escape = 0x110002;
constexpr int Backspace = 0x110003;
constexpr int Up = 0x110004;
constexpr int Down = 0x110005;
constexpr int Left = 0x110006;
constexpr int Right = 0x110007;
constexpr int Home = 0x110008;
constexpr int End = 0x110009;
constexpr int PageUp = 0x11000a;
constexpr int PageDown = 0x11000b;
constexpr int Resize = 0x11000c;
}

enum Modifier : unsigned {
    NoModifier = 0,
    Ctrl = 1 << 0,
    Alt = 1 << 1
};

struct KeyEvent {
    // A Unicode code point or one of Keys.
    int code = 0;
    unsigned modifiers = NoModifier;

    bool isPrintable() const { return modifiers == NoModifier && code >= 0x20 && code != 0x7f && code < 0x110000; }
    bool operator<(const KeyEvent& other) const {
        return code != other.code ? code < other.code : modifiers < other.modifiers;
    }
    bool operator==(const KeyEvent& other) const { return code == other.code && modifiers == other.modifiers; }
};

enum class Command {
    Unknown,
    // The key started a sequence; wait for the next one.
    Pending,
    MoveDown,
    MoveUp,
    HalfPageDown,
    HalfPageUp,
    Top,
    Bottom,
    Select,
    Collapse,
    AddFeed,
    DeleteFeed,
    Sync,
    Help,
    Quit,
    Back,
    FetchContent,
    OpenBrowser,
    Dismiss,
    Confirm,
    Cancel,
    InsertChar,
    DeleteChar,
    CursorLeft,
    CursorRight,
    Submit
};

struct Action {
    Command command = Command::Unknown;
    // The code point for InsertChar.
    int ch = 0;
};

// Turns key events into commands for the active view and overlay. At most
// one key of a two-key sequence is held; if the next key does not complete a
// sequence the prefix is dropped and that key is interpreted on its own.
class InputStateMachine {
public:
    InputStateMachine();

    Action handle(const KeyEvent& key, ViewMode view, Overlay overlay);
    bool hasPendingPrefix() const { return state_ == State::PendingPrefix; }
    void reset() { state_ = State::Idle; }

private:
    enum class State {
        Idle,
        PendingPrefix
    };

    struct BindingTable {
        std::map<KeyEvent, Command> keys;
        std::map<std::pair<KeyEvent, KeyEvent>, Command> sequences;
        std::optional<Command> fallback;
        bool fallbackPrintableOnly = false;
    };

    Action interpret(const BindingTable& table, const KeyEvent& key);
    const BindingTable& tableFor(ViewMode view, Overlay overlay) const;

    std::map<std::pair<ViewMode, Overlay>, BindingTable> tables_;
    State state_ = State::Idle;
    KeyEvent pending_;
};

}
