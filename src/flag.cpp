#include "cobra/flag.hpp"

namespace cobra {

std::string Flag::displayName() const {
    if (!name_.empty()) return "--" + name_;
    return "-" + shortName_;
}

bool Flag::conflictsWith(const Flag& other) const {
    const bool sameName = !name_.empty() && !other.name_.empty() && name_ == other.name_;
    const bool sameShort = !shortName_.empty() && !other.shortName_.empty() && shortName_ == other.shortName_;
    return sameName || sameShort;
}

} // namespace cobra
