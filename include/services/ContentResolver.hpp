#pragma once
#include <string>
#include "services/Capabilities.hpp"
#include "storage/Models.hpp"

namespace Pequod {

// Fetches an entry's article page and reduces it to readable text.
class ContentResolver {
public:
    static constexpr size_t kMinimumTextLength = 80;

    ContentResolver(Transport& transport, TextExtractor& extractor, long timeoutSeconds = 20);

    // Throws ResolutionError; the caller offers the browser instead.
    std::string resolveFullContent(const Entry& entry);

private:
    Transport& transport_;
    TextExtractor& extractor_;
    long timeoutSeconds_;
};

}
