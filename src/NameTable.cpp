#include "netdef/NameTable.hpp"

namespace netdef {

NameId NameTable::intern(const std::string& name) {
    auto it = ids_.find(name);
    if (it != ids_.end()) {
        return it->second;
    }
    // Added to end of list so index is size minus 1
    names_.push_back(name);
    NameId id = static_cast<NameId>(names_.size() - 1);
    ids_.emplace(name, id);
    return id;
}

std::vector<NameId> NameTable::internMany(const std::vector<std::string>& names) {
    std::vector<NameId> result;
    result.reserve(names.size());
    for (const std::string& name : names) {
        result.push_back(intern(name));
    }
    return result;
}

std::optional<std::string> NameTable::resolve(NameId id) const {
    if (id < 0 || static_cast<std::size_t>(id) >= names_.size()) {
        return std::nullopt;
    }
    return names_[static_cast<std::size_t>(id)];
}

std::optional<NameId> NameTable::query(const std::string& name) const {
    auto it = ids_.find(name);
    if (it == ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ErrorCode> NameTable::allocate(std::size_t count) {
    std::vector<ErrorCode> codes;
    codes.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        codes.push_back(errorCodeCount_++);
    }
    return codes;
}

} // namespace netdef
