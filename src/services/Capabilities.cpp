#include "services/Capabilities.hpp"
#include "utils/Errors.hpp"
#include "utils/HtmlParser.hpp"
#include "utils/TextUtils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace Pequod {

CurlTransport::CurlTransport(const std::string& userAgent) : userAgent_(userAgent), cancelled_(false) {}

FetchedDocument CurlTransport::fetch(const std::string& url, long timeoutSeconds) {
    if (cancelled_) throw FetchError("cancelled");
    HttpClient client;
    if (!userAgent_.empty()) client.setUserAgent(userAgent_);
    client.setTimeout(timeoutSeconds);
    client.setCancelFlag(&cancelled_);

    auto response = client.get(url);
    if (response.timedOut) {
        throw TimeoutError("timed out after " + std::to_string(timeoutSeconds) + "s fetching " + url);
    }
    if (!response.success) {
        throw FetchError(response.error.empty() ? "request failed" : response.error);
    }
    return FetchedDocument{url, response.body, response.contentType()};
}

void CurlTransport::cancelAll() { cancelled_ = true; }

ParsedFeed XmlFeedParser::parse(const std::string& bytes) {
    return HtmlParser::parseFeed(bytes);
}

std::vector<std::string> XmlFeedParser::discoverFeedLinks(const std::string& html, const std::string& pageUrl) {
    std::vector<std::string> hrefs;
    HtmlParser parser;
    if (parser.parse(html)) {
        auto advertised = parser.getAttributes(
            "//link[@rel='alternate' and (contains(@type,'rss') or contains(@type,'atom'))]", "href");
        hrefs.insert(hrefs.end(), advertised.begin(), advertised.end());

        // Anything whose href mentions rss or feed.
        auto mentioned = parser.getAttributes(
            "//*[self::link or self::a][contains(translate(@href,'RSFED','rsfed'),'rss') or "
            "contains(translate(@href,'RSFED','rsfed'),'feed')]", "href");
        hrefs.insert(hrefs.end(), mentioned.begin(), mentioned.end());
    }
    for (const char* path : {"/rss", "/feed", "/rss.xml", "/feed.xml", "/atom.xml", "/index.xml"}) {
        hrefs.emplace_back(path);
    }

    std::vector<std::string> candidates;
    for (const auto& href : hrefs) {
        std::string resolved = resolveUrl(pageUrl, href);
        if (resolved == pageUrl) continue;
        if (std::find(candidates.begin(), candidates.end(), resolved) == candidates.end()) {
            candidates.push_back(resolved);
        }
    }
    return candidates;
}

std::string HtmlTextExtractor::extractReadableText(const std::string& html) {
    HtmlParser parser;
    if (!parser.parse(html)) throw ResolutionError("page could not be parsed as HTML");
    std::string text = parser.extractReadableText();
    if (text.empty()) throw ResolutionError("no readable text found on the page");
    return text;
}

bool SystemBrowserLauncher::open(const std::string& url) {
#ifdef __APPLE__
    const char* command = "open";
#else
    const char* command = "xdg-open";
#endif
    pid_t pid = fork();
    if (pid == -1) {
        spdlog::error("Failed to fork for {}: {}", command, std::strerror(errno));
        return false;
    }
    if (pid == 0) {
        // The terminal belongs to the UI; keep the browser's chatter off it.
        int devNull = ::open("/dev/null", O_RDWR);
        if (devNull != -1) {
            dup2(devNull, STDIN_FILENO);
            dup2(devNull, STDOUT_FILENO);
            dup2(devNull, STDERR_FILENO);
            close(devNull);
        }
        execlp(command, command, url.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }
    int status = 0;
    if (waitpid(pid, &status, 0) == -1) {
        spdlog::warn("waitpid failed for {}: {}", command, std::strerror(errno));
        return false;
    }
    bool ok = WIFEXITED(status) && WEXITSTATUS(status) == 0;
    if (!ok) spdlog::warn("{} exited with status {} for {}", command, WEXITSTATUS(status), url);
    return ok;
}

}
