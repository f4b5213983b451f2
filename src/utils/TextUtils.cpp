#include "utils/TextUtils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Pequod {

std::string sanitizeUtf8(const std::string& input) {
    std::string result;
    result.reserve(input.size());
    const char* p = input.c_str();
    while (*p) {
        unsigned char c = static_cast<unsigned char>(*p);
        if (c < 0x80) {
            result += *p;
            p++;
        } else if ((c & 0xE0) == 0xC0 && p[1]) {
            if ((p[1] & 0xC0) == 0x80) {
                result.append(p, 2);
                p += 2;
            } else {
                p++;
            }
        } else if ((c & 0xF0) == 0xE0 && p[1] && p[2]) {
            if ((p[1] & 0xC0) == 0x80 && (p[2] & 0xC0) == 0x80) {
                result.append(p, 3);
                p += 3;
            } else {
                p++;
            }
        } else if ((c & 0xF8) == 0xF0 && p[1] && p[2] && p[3]) {
            if ((p[1] & 0xC0) == 0x80 && (p[2] & 0xC0) == 0x80 && (p[3] & 0xC0) == 0x80) {
                result.append(p, 4);
                p += 4;
            } else {
                p++;
            }
        } else {
            p++;
        }
    }
    return result;
}

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\n\r");
    size_t end = text.find_last_not_of(" \t\n\r");
    return (start == std::string::npos) ? "" : text.substr(start, end - start + 1);
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string encodeUtf8(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x110000) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

size_t displayWidth(const std::string& text) {
    size_t width = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) width++;
    }
    return width;
}

// Byte offset just past the first n code points.
static size_t byteOffsetOf(const std::string& text, size_t n) {
    size_t count = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80) {
            if (count == n) return i;
            count++;
        }
    }
    return text.size();
}

std::vector<std::string> wrapText(const std::string& text, size_t width) {
    if (width == 0) width = 1;
    std::vector<std::string> lines;
    std::istringstream paragraphs(text);
    std::string paragraph;
    bool any = false;
    while (std::getline(paragraphs, paragraph)) {
        any = true;
        std::istringstream words(paragraph);
        std::string word;
        std::string line;
        size_t lineWidth = 0;
        bool emitted = false;
        while (words >> word) {
            size_t wordWidth = displayWidth(word);
            if (line.empty()) {
                line = word;
                lineWidth = wordWidth;
            } else if (lineWidth + 1 + wordWidth <= width) {
                line += ' ';
                line += word;
                lineWidth += 1 + wordWidth;
            } else {
                lines.push_back(line);
                emitted = true;
                line = word;
                lineWidth = wordWidth;
            }
        }
        if (!line.empty() || !emitted) lines.push_back(line);
    }
    if (!any) lines.emplace_back();
    return lines;
}

std::string truncateText(const std::string& text, size_t maxWidth) {
    if (displayWidth(text) <= maxWidth) return text;
    if (maxWidth <= 3) return std::string(maxWidth, '.');
    return text.substr(0, byteOffsetOf(text, maxWidth - 3)) + "...";
}

std::string resolveUrl(const std::string& base, const std::string& href) {
    if (href.rfind("http://", 0) == 0 || href.rfind("https://", 0) == 0) return href;
    size_t s = base.find("://");
    std::string scheme = "https";
    std::string host = base;
    if (s != std::string::npos) {
        scheme = base.substr(0, s);
        size_t start = s + 3;
        size_t end = base.find('/', start);
        host = (end == std::string::npos) ? base.substr(start) : base.substr(start, end - start);
    }
    if (href.rfind("//", 0) == 0) return scheme + ":" + href;
    if (href.rfind("/", 0) == 0) return scheme + "://" + host + href;
    size_t pos = base.rfind('/');
    size_t authorityEnd = (s == std::string::npos) ? 0 : s + 3;
    if (pos == std::string::npos || pos < authorityEnd) return scheme + "://" + host + "/" + href;
    return base.substr(0, pos + 1) + href;
}

}
