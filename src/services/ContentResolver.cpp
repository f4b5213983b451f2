#include "services/ContentResolver.hpp"
#include "utils/Errors.hpp"
#include "utils/TextUtils.hpp"
#include <spdlog/spdlog.h>

namespace Pequod {

ContentResolver::ContentResolver(Transport& transport, TextExtractor& extractor, long timeoutSeconds)
    : transport_(transport), extractor_(extractor), timeoutSeconds_(timeoutSeconds) {}

std::string ContentResolver::resolveFullContent(const Entry& entry) {
    std::string link = trim(entry.link);
    if (link.empty()) throw ResolutionError("entry has no link");

    FetchedDocument doc;
    try {
        doc = transport_.fetch(link, timeoutSeconds_);
    } catch (const TimeoutError& e) {
        throw ResolutionError(std::string("timed out: ") + e.what());
    } catch (const FetchError& e) {
        throw ResolutionError(std::string("fetch failed: ") + e.what());
    }

    std::string contentType = toLower(doc.contentType);
    if (!contentType.empty() && contentType.find("html") == std::string::npos) {
        throw ResolutionError("not an HTML page (" + doc.contentType + ")");
    }

    std::string text = trim(extractor_.extractReadableText(doc.body));
    if (displayWidth(text) < kMinimumTextLength) {
        throw ResolutionError("page has too little readable text");
    }
    spdlog::debug("Resolved {} characters of content for entry {}", text.size(), entry.id);
    return text;
}

}
