#include "cobra/flag_set.hpp"

#include <utility>

namespace cobra {

FlagSet::FlagSet(std::vector<Entry> entries) : entries_(std::move(entries)) {
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        const auto* f = entries_[i].flag;
        if (!f->name().empty()) index_[f->name()] = i;
        if (!f->shortName().empty()) index_[f->shortName()] = i;
    }
}

const Flag* FlagSet::getFlag(const std::string& key) const {
    const auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return entries_[it->second].flag;
}

std::vector<const Flag*> FlagSet::flags() const {
    std::vector<const Flag*> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.flag);
    return out;
}

const FlagState* FlagSet::stateOf(const Flag& flag) const {
    for (const auto& e : entries_) {
        if (e.flag == &flag) return &e.state;
    }
    return nullptr;
}

void FlagSet::checkRequired() const {
    for (const auto& e : entries_) {
        if (!e.flag->required()) continue;
        if (e.flag->defaultValue() == e.state.value) throw RequiredFlagMissing(e.flag->displayName());
    }
}

const FlagSet::Entry& FlagSet::lookup(const std::string& key) const {
    const auto it = index_.find(key);
    if (it == index_.end()) throw UnknownFlag(key);
    return entries_[it->second];
}

} // namespace cobra
