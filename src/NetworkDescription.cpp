#include "netdef/NetworkDescription.hpp"
#include "netdef/Constants.hpp"

namespace netdef {

std::string sectionName(Section section) {
    switch (section) {
        case Section::DEVICES: return Constants::KEYWORD_DEVICES;
        case Section::CONNECT: return Constants::KEYWORD_CONNECT;
        case Section::MONITOR: return Constants::KEYWORD_MONITOR;
    }
    return "UNKNOWN";
}

const std::vector<ItemDescriptor>& NetworkDescription::items(Section section) const {
    static const std::vector<ItemDescriptor> empty;
    auto it = sections.find(section);
    return it != sections.end() ? it->second : empty;
}

} // namespace netdef
