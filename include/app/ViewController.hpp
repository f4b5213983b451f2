#pragma once
#include <functional>
#include <string>
#include <vector>
#include "app/BackgroundRunner.hpp"
#include "app/MessageQueue.hpp"
#include "services/ContentResolver.hpp"
#include "services/SyncEngine.hpp"
#include "storage/FeedStore.hpp"
#include "ui/InputStateMachine.hpp"
#include "ui/NavigationTree.hpp"

namespace Pequod {

struct BackgroundEvent {
    enum class Kind {
        SyncFinished,
        FeedAdded,
        ContentResolved,
        ContentFailed
    };

    Kind kind = Kind::SyncFinished;
    std::vector<SyncResult> syncResults;
    AddFeedResult addResult;
    EntryId entryId = 0;
    // Resolved article text, or the reason resolution failed.
    std::string text;
};

struct RenderRow {
    RowKind kind = RowKind::Feed;
    int depth = 0;
    std::string title;
    std::string date;
    bool selected = false;
    bool read = false;
    bool collapsed = true;
    bool syncFailed = false;
    int unreadCount = 0;
};

// Everything the terminal needs to draw one frame.
struct RenderSnapshot {
    int width = 0;
    int height = 0;
    ViewMode view = ViewMode::Feeds;
    Overlay overlay = Overlay::None;

    // Feeds view: the visible window of the tree.
    std::vector<RenderRow> rows;
    int firstRow = 0;
    int rowCount = 0;
    int selectedIndex = 0;

    // Entry view: the visible window of the article.
    std::string entryTitle;
    std::vector<std::string> bodyLines;
    int bodyScroll = 0;
    int bodyLineCount = 0;
    bool showingFullContent = false;

    std::string status;
    bool busy = false;
    char spinner = ' ';

    std::vector<std::string> helpLines;
    std::string promptText;
    int promptCursor = 0;
    std::string deleteTarget;
};

// Owns the view state. Keys and background results are applied on the
// loop thread; sync, add and content resolution run on the runner.
class ViewController {
public:
    ViewController(FeedStore& store, SyncEngine& engine, ContentResolver& resolver,
                   BrowserLauncher& browser, BackgroundRunner& runner);

    // Returns true when the user asked to quit.
    bool handleKey(const KeyEvent& key);
    // Applies finished background work. Returns true when anything changed.
    bool pumpEvents();
    void setViewport(int width, int height);
    // Advances the spinner while work is in flight.
    void tick();
    void reload();
    RenderSnapshot snapshot() const;

    void startSync();
    bool isSyncing() const { return syncing_; }
    bool isBusy() const { return syncing_ || adding_ || resolving_; }

    ViewMode viewMode() const { return view_; }
    Overlay overlay() const { return overlay_; }
    const NavigationTree& tree() const { return tree_; }
    const std::string& status() const { return status_; }
    int bodyScroll() const { return bodyScroll_; }
    EntryId openEntryId() const { return openEntryId_; }

private:
    void handleFeedsCommand(const Action& action);
    void handleEntryCommand(const Action& action);
    void handlePromptCommand(const Action& action);
    void handleConfirmCommand(const Action& action);

    int listHeight() const;
    int halfPage() const;
    void moveSelection(int delta);
    void scrollBody(int delta);
    void followSelection();

    void activateSelected();
    void collapseSelected();
    void setFeedCollapsed(FeedId feedId, bool collapsed);
    void openEntry(EntryId entryId);
    void layoutEntry();
    void confirmDelete();
    void submitFeed();
    void startResolve();
    void openInBrowser();
    // False when the runner could not take the task.
    bool dispatch(std::function<void()> task);

    void applySyncResults(const std::vector<SyncResult>& results);
    void applyAddResult(const AddFeedResult& result);
    void applyResolvedContent(EntryId entryId, const std::string& text);

    FeedStore& store_;
    SyncEngine& engine_;
    ContentResolver& resolver_;
    BrowserLauncher& browser_;
    BackgroundRunner& runner_;
    MessageQueue<BackgroundEvent> events_;

    NavigationTree tree_;
    InputStateMachine input_;
    ViewMode view_;
    Overlay overlay_;
    int width_;
    int height_;
    int treeScroll_;

    EntryId openEntryId_;
    std::string entryContent_;
    bool showingFullContent_;
    std::vector<std::string> bodyLines_;
    int bodyScroll_;

    std::u32string prompt_;
    size_t promptCursor_;
    FeedId deleteTarget_;

    std::string status_;
    bool syncing_;
    bool adding_;
    bool resolving_;
    int spinnerFrame_;
};

}
