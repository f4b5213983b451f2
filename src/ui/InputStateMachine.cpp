#include "ui/InputStateMachine.hpp"

namespace Pequod {

namespace {

KeyEvent key(int code, unsigned modifiers = NoModifier) {
    return KeyEvent{code, modifiers};
}

}

InputStateMachine::InputStateMachine() {
    BindingTable scrolling;
    scrolling.keys = {
        {key('j'), Command::MoveDown},
        {key(Keys::Down), Command::MoveDown},
        {key('k'), Command::MoveUp},
        {key(Keys::Up), Command::MoveUp},
        {key('d', Ctrl), Command::HalfPageDown},
        {key(Keys::PageDown), Command::HalfPageDown},
        {key('u', Ctrl), Command::HalfPageUp},
        {key(Keys::PageUp), Command::HalfPageUp},
        {key(Keys::Home), Command::Top},
        {key('G'), Command::Bottom},
        {key(Keys::End), Command::Bottom},
        {key('h'), Command::Help},
    };
    scrolling.sequences = {
        {{key('g'), key('g')}, Command::Top},
    };

    BindingTable feeds = scrolling;
    feeds.keys[key(Keys::Enter)] = Command::Select;
    feeds.keys[key('c')] = Command::Collapse;
    feeds.keys[key('a')] = Command::AddFeed;
    feeds.keys[key('d')] = Command::DeleteFeed;
    feeds.keys[key('s')] = Command::Sync;
    feeds.keys[key('q')] = Command::Quit;
    feeds.keys[key(Keys::Escape)] = Command::Quit;

    BindingTable entry = scrolling;
    entry.keys[key('f')] = Command::FetchContent;
    entry.keys[key('o')] = Command::OpenBrowser;
    entry.keys[key('q')] = Command::Back;
    entry.keys[key(Keys::Escape)] = Command::Back;

    BindingTable help;
    help.fallback = Command::Dismiss;

    BindingTable confirm;
    confirm.keys = {
        {key('y'), Command::Confirm},
        {key('n'), Command::Cancel},
        {key('q'), Command::Cancel},
        {key(Keys::Escape), Command::Cancel},
    };

    BindingTable prompt;
    prompt.keys = {
        {key(Keys::Enter), Command::Submit},
        {key(Keys::Escape), Command::Cancel},
        {key(Keys::Backspace), Command::DeleteChar},
        {key(Keys::Left), Command::CursorLeft},
        {key(Keys::Right), Command::CursorRight},
    };
    prompt.fallback = Command::InsertChar;
    prompt.fallbackPrintableOnly = true;

    tables_[{ViewMode::Feeds, Overlay::None}] = feeds;
    tables_[{ViewMode::Entry, Overlay::None}] = entry;
    for (ViewMode view : {ViewMode::Feeds, ViewMode::Entry}) {
        tables_[{view, Overlay::HelpPopup}] = help;
        tables_[{view, Overlay::ConfirmDelete}] = confirm;
        tables_[{view, Overlay::AddFeedPrompt}] = prompt;
    }
}

const InputStateMachine::BindingTable& InputStateMachine::tableFor(ViewMode view, Overlay overlay) const {
    return tables_.at({view, overlay});
}

Action InputStateMachine::handle(const KeyEvent& key, ViewMode view, Overlay overlay) {
    const BindingTable& table = tableFor(view, overlay);
    if (state_ == State::PendingPrefix) {
        state_ = State::Idle;
        auto it = table.sequences.find({pending_, key});
        if (it != table.sequences.end()) return Action{it->second, 0};
    }
    return interpret(table, key);
}

Action InputStateMachine::interpret(const BindingTable& table, const KeyEvent& key) {
    auto it = table.keys.find(key);
    if (it != table.keys.end()) return Action{it->second, 0};

    for (const auto& sequence : table.sequences) {
        if (sequence.first.first == key) {
            state_ = State::PendingPrefix;
            pending_ = key;
            return Action{Command::Pending, 0};
        }
    }

    if (table.fallback && (!table.fallbackPrintableOnly || key.isPrintable())) {
        return Action{*table.fallback, key.code};
    }
    return Action{Command::Unknown, 0};
}

}
