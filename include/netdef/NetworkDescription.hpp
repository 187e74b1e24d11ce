#pragma once

#include "Symbol.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace netdef {

enum class Section { DEVICES, CONNECT, MONITOR };

std::string sectionName(Section section);

// Raw symbols of one declaration, in source order:
//   device:     keyword name [property]
//   connection: dev ['.' outpin] '>' dev '.' inpin
//   monitor:    dev ['.' outpin]
using ItemDescriptor = std::vector<Symbol>;

// Items of one section while parsing. An empty optional marks a malformed item.
using ItemList = std::vector<std::optional<ItemDescriptor>>;

// Syntactically valid contents of a definition file, one list per section
struct NetworkDescription {
    std::map<Section, std::vector<ItemDescriptor>> sections;

    // Items of section, empty if the section was never filled
    const std::vector<ItemDescriptor>& items(Section section) const;
};

} // namespace netdef
