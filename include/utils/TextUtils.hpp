#pragma once
#include <string>
#include <vector>

namespace Pequod {

// Drops invalid byte sequences so the text is valid UTF-8.
std::string sanitizeUtf8(const std::string& input);

std::string trim(const std::string& text);
std::string toLower(std::string text);

std::string encodeUtf8(char32_t codePoint);

// Number of code points, used as display width.
size_t displayWidth(const std::string& text);

// Greedy word wrap. Words longer than the width are kept whole, embedded
// newlines start a new line and an empty text yields one empty line.
std::vector<std::string> wrapText(const std::string& text, size_t width);

// Cuts the text to maxWidth code points, ending with "..." when shortened.
std::string truncateText(const std::string& text, size_t maxWidth);

// Resolves href against the page it was found on.
std::string resolveUrl(const std::string& base, const std::string& href);

}
