#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace netdef {

// Interned string id. Index into the owning NameTable.
using NameId = int;

// Result code returned by a collaborator. Minted through NameTable::allocate.
using ErrorCode = int;

// Maps names (keywords, device names, pins, punctuation) to stable integer ids.
//
// Ids are insertion indices and never change for the lifetime of the table.
// The table also hands out unique result codes to the Devices, Network and
// Monitors collaborators so that each can define its own codes without a
// central registry. Ids and codes from two different tables must never be mixed.
class NameTable {
public:
    NameTable() = default;

    // Returns the id of name, adding it if it is not present yet
    NameId intern(const std::string& name);

    // intern() applied to every element, preserving order
    std::vector<NameId> internMany(const std::vector<std::string>& names);

    // Name string for id, empty optional if id is not in the table
    std::optional<std::string> resolve(NameId id) const;

    // Id of name without inserting it
    std::optional<NameId> query(const std::string& name) const;

    // Returns count fresh codes, never handed out before by this table
    std::vector<ErrorCode> allocate(std::size_t count);

    std::size_t size() const { return names_.size(); }

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, NameId> ids_;
    ErrorCode errorCodeCount_ = 0;
};

} // namespace netdef
