#include <gtest/gtest.h>
#include "ui/InputStateMachine.hpp"

using namespace Pequod;

namespace {

KeyEvent press(int code, unsigned modifiers = NoModifier) {
    return KeyEvent{code, modifiers};
}

}

class InputStateMachineTest : public ::testing::Test {
protected:
    Command feeds(const KeyEvent& key) { return input_.handle(key, ViewMode::Feeds, Overlay::None).command; }
    Command entry(const KeyEvent& key) { return input_.handle(key, ViewMode::Entry, Overlay::None).command; }

    InputStateMachine input_;
};

TEST_F(InputStateMachineTest, SingleKeysInFeedsView) {
    EXPECT_EQ(feeds(press('j')), Command::MoveDown);
    EXPECT_EQ(feeds(press(Keys::Up)), Command::MoveUp);
    EXPECT_EQ(feeds(press('G')), Command::Bottom);
    EXPECT_EQ(feeds(press(Keys::Enter)), Command::Select);
    EXPECT_EQ(feeds(press('c')), Command::Collapse);
    EXPECT_EQ(feeds(press('a')), Command::AddFeed);
    EXPECT_EQ(feeds(press('d')), Command::DeleteFeed);
    EXPECT_EQ(feeds(press('s')), Command::Sync);
    EXPECT_EQ(feeds(press('h')), Command::Help);
    EXPECT_EQ(feeds(press('q')), Command::Quit);
    EXPECT_EQ(feeds(press(Keys::Escape)), Command::Quit);
    EXPECT_EQ(feeds(press('x')), Command::Unknown);
}

TEST_F(InputStateMachineTest, ControlKeysAreDistinctFromLetters) {
    EXPECT_EQ(feeds(press('d', Ctrl)), Command::HalfPageDown);
    EXPECT_EQ(feeds(press('u', Ctrl)), Command::HalfPageUp);
    EXPECT_EQ(feeds(press(Keys::PageDown)), Command::HalfPageDown);
    EXPECT_EQ(feeds(press('d')), Command::DeleteFeed);
}

TEST_F(InputStateMachineTest, EntryViewBindings) {
    EXPECT_EQ(entry(press('f')), Command::FetchContent);
    EXPECT_EQ(entry(press('o')), Command::OpenBrowser);
    EXPECT_EQ(entry(press('q')), Command::Back);
    EXPECT_EQ(entry(press(Keys::Escape)), Command::Back);
    EXPECT_EQ(entry(press('s')), Command::Unknown);
}

TEST_F(InputStateMachineTest, DoubleGGoesToTop) {
    EXPECT_EQ(feeds(press('g')), Command::Pending);
    EXPECT_TRUE(input_.hasPendingPrefix());
    EXPECT_EQ(feeds(press('g')), Command::Top);
    EXPECT_FALSE(input_.hasPendingPrefix());

    EXPECT_EQ(entry(press('g')), Command::Pending);
    EXPECT_EQ(entry(press('g')), Command::Top);
}

TEST_F(InputStateMachineTest, BrokenSequenceInterpretsTheSecondKey) {
    EXPECT_EQ(feeds(press('g')), Command::Pending);
    EXPECT_EQ(feeds(press('j')), Command::MoveDown);
    EXPECT_FALSE(input_.hasPendingPrefix());

    EXPECT_EQ(feeds(press('g')), Command::Pending);
    EXPECT_EQ(feeds(press('x')), Command::Unknown);
    EXPECT_FALSE(input_.hasPendingPrefix());
}

TEST_F(InputStateMachineTest, ResetDropsPrefix) {
    feeds(press('g'));
    input_.reset();
    EXPECT_EQ(feeds(press('g')), Command::Pending);
}

TEST_F(InputStateMachineTest, HelpPopupDismissesOnAnyKey) {
    for (const KeyEvent& key : {press('q'), press('j'), press(Keys::Enter), press('d', Ctrl), press('g')}) {
        EXPECT_EQ(input_.handle(key, ViewMode::Feeds, Overlay::HelpPopup).command, Command::Dismiss);
        EXPECT_FALSE(input_.hasPendingPrefix());
    }
}

TEST_F(InputStateMachineTest, ConfirmDeleteBindings) {
    auto confirm = [&](const KeyEvent& key) {
        return input_.handle(key, ViewMode::Feeds, Overlay::ConfirmDelete).command;
    };
    EXPECT_EQ(confirm(press('y')), Command::Confirm);
    EXPECT_EQ(confirm(press('n')), Command::Cancel);
    EXPECT_EQ(confirm(press('q')), Command::Cancel);
    EXPECT_EQ(confirm(press(Keys::Escape)), Command::Cancel);
    EXPECT_EQ(confirm(press('j')), Command::Unknown);
}

TEST_F(InputStateMachineTest, PromptInsertsPrintableCharacters) {
    auto prompt = [&](const KeyEvent& key) { return input_.handle(key, ViewMode::Feeds, Overlay::AddFeedPrompt); };

    Action q = prompt(press('q'));
    EXPECT_EQ(q.command, Command::InsertChar);
    EXPECT_EQ(q.ch, 'q');

    Action g = prompt(press('g'));
    EXPECT_EQ(g.command, Command::InsertChar);
    EXPECT_FALSE(input_.hasPendingPrefix());

    Action accented = prompt(press(0xe9));
    EXPECT_EQ(accented.command, Command::InsertChar);
    EXPECT_EQ(accented.ch, 0xe9);

    EXPECT_EQ(prompt(press(Keys::Enter)).command, Command::Submit);
    EXPECT_EQ(prompt(press(Keys::Escape)).command, Command::Cancel);
    EXPECT_EQ(prompt(press(Keys::Backspace)).command, Command::DeleteChar);
    EXPECT_EQ(prompt(press(Keys::Left)).command, Command::CursorLeft);
    EXPECT_EQ(prompt(press(Keys::Right)).command, Command::CursorRight);
    EXPECT_EQ(prompt(press('d', Ctrl)).command, Command::Unknown);
}
