#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace Pequod {

// Seconds since the Unix epoch, UTC.
using Timestamp = std::int64_t;

Timestamp nowTimestamp();

// "Mon, 02 Jan 2006 15:04:05 -0700" as used by RSS pubDate.
std::optional<Timestamp> parseRfc822(const std::string& text);

// "2006-01-02T15:04:05Z" / "+07:00" offsets as used by Atom and dc:date.
std::optional<Timestamp> parseRfc3339(const std::string& text);

// Tries both formats.
std::optional<Timestamp> parseFeedDate(const std::string& text);

// Local time rendering, strftime format.
std::string formatTimestamp(Timestamp ts, const char* format = "%Y-%m-%d %I:%M%p");

}
