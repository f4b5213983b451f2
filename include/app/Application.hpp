#pragma once

#include <memory>
#include <string>
#include "app/BackgroundRunner.hpp"
#include "app/ViewController.hpp"
#include "services/Capabilities.hpp"
#include "services/ContentResolver.hpp"
#include "services/SyncEngine.hpp"
#include "storage/FeedStore.hpp"

namespace Pequod {

struct CommandLine {
    std::string dbPath;
    std::string configPath;
    std::string logLevel;
    int maxTtlDays = 0;
    bool help = false;
    bool version = false;
};

class Application {
public:
    Application();
    ~Application();

    int run(int argc, char* argv[]);

    // Throws std::invalid_argument for unknown options or bad values.
    static CommandLine parseCommandLine(int argc, char* argv[]);
    static void printUsage(const char* prog);

private:
    bool openStore(const std::string& dbPath, int maxTtlDays);
    void runLoop();
    void shutdown();

    std::unique_ptr<FeedStore> store_;
    std::unique_ptr<CurlTransport> transport_;
    XmlFeedParser parser_;
    HtmlTextExtractor extractor_;
    SystemBrowserLauncher browser_;
    std::unique_ptr<SyncEngine> engine_;
    std::unique_ptr<ContentResolver> resolver_;
    std::unique_ptr<ThreadBackgroundRunner> runner_;
    std::unique_ptr<ViewController> controller_;
};

}
