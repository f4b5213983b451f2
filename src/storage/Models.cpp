#include "storage/Models.hpp"

namespace Pequod {

std::string ParsedEntry::identityKey() const {
    if (guid && !guid->empty()) return *guid;
    if (!link.empty()) return link;
    if (!title.empty()) return "title:" + title;
    return "";
}

std::string describeCounts(const UpsertCounts& counts) {
    return std::to_string(counts.inserted) + " new, " + std::to_string(counts.updated) + " updated";
}

}
