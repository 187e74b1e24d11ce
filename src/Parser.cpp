#include "netdef/Parser.hpp"
#include "netdef/Constants.hpp"
#include "netdef/Debug.hpp"
#include <stdexcept>

namespace netdef {

namespace {

enum class PropertyKind { NONE, POSITIVE_INTEGER, BIT, FAN_IN, WAVEFORM };

// How the symbols after a device keyword are checked
struct DeviceRule {
    const char* keyword;
    PropertyKind property;
    SyntaxError missingError;  // separator where the name or property belongs
    SyntaxError propertyError;
};

const DeviceRule DEVICE_RULES[] = {
    {"CLOCK",  PropertyKind::POSITIVE_INTEGER, SyntaxError::MISSING_PROPERTY,    SyntaxError::BAD_INTEGER_PROPERTY},
    {"RC",     PropertyKind::POSITIVE_INTEGER, SyntaxError::MISSING_PROPERTY,    SyntaxError::BAD_INTEGER_PROPERTY},
    {"SWITCH", PropertyKind::BIT,              SyntaxError::MISSING_PROPERTY,    SyntaxError::BAD_SWITCH_STATE},
    {"AND",    PropertyKind::FAN_IN,           SyntaxError::MISSING_PROPERTY,    SyntaxError::BAD_FAN_IN},
    {"NAND",   PropertyKind::FAN_IN,           SyntaxError::MISSING_PROPERTY,    SyntaxError::BAD_FAN_IN},
    {"OR",     PropertyKind::FAN_IN,           SyntaxError::MISSING_PROPERTY,    SyntaxError::BAD_FAN_IN},
    {"NOR",    PropertyKind::FAN_IN,           SyntaxError::MISSING_PROPERTY,    SyntaxError::BAD_FAN_IN},
    {"XOR",    PropertyKind::NONE,             SyntaxError::MISSING_DEVICE_NAME, SyntaxError::MISSING_DEVICE_NAME},
    {"DTYPE",  PropertyKind::NONE,             SyntaxError::MISSING_DEVICE_NAME, SyntaxError::MISSING_DEVICE_NAME},
    {"SIGGEN", PropertyKind::WAVEFORM,         SyntaxError::MISSING_PROPERTY,    SyntaxError::BAD_WAVEFORM}
};

const DeviceRule* findDeviceRule(const std::string& keyword) {
    for (const DeviceRule& rule : DEVICE_RULES) {
        if (keyword == rule.keyword) {
            return &rule;
        }
    }
    return nullptr;
}

// Offset of the first offending character, empty if text is a valid property
std::optional<std::size_t> propertyViolation(PropertyKind kind, const std::string& text) {
    switch (kind) {
        case PropertyKind::NONE:
            return std::nullopt;
        case PropertyKind::POSITIVE_INTEGER:
            return Symbol::indexNotInteger(text);
        case PropertyKind::BIT:
            if (text == "0" || text == "1") {
                return std::nullopt;
            }
            return 0;
        case PropertyKind::FAN_IN: {
            if (!Symbol::isInteger(text) || text.size() > 2) {
                return 0;
            }
            int inputs = std::stoi(text);
            if (inputs < Constants::MIN_GATE_INPUTS || inputs > Constants::MAX_GATE_INPUTS) {
                return 0;
            }
            return std::nullopt;
        }
        case PropertyKind::WAVEFORM: {
            auto [valid, offset] = Symbol::isWaveform(text);
            if (valid) {
                return std::nullopt;
            }
            return offset.value_or(0);
        }
    }
    return 0;
}

} // namespace

Parser::Parser(NameTable& names, Devices& devices, Network& network,
               Monitors& monitors, Scanner& scanner)
    : names_(names), devices_(devices), network_(network), monitors_(monitors),
      scanner_(scanner), semanticHandler_(names, devices, network, monitors, scanner) {}

// ---------------------------------------------------------------------------
// Token stream
// ---------------------------------------------------------------------------

// Moves to the next symbol. Running out of symbols is reported once, at the
// last symbol of the file, and every later call fails straight away.
bool Parser::advance() {
    if (eof_) {
        return false;
    }

    std::optional<Symbol> next = scanner_.getSymbol();
    if (!next) {
        eof_ = true;
        reportSyntaxError(SyntaxError::PREMATURE_EOF, scanner_.lastSymbol());
        return false;
    }

    previous_ = symbol_;
    symbol_ = next;
    return true;
}

// advance() inside an item: the item is abandoned at end of file
bool Parser::step(ItemList& list) {
    if (advance()) {
        return true;
    }
    list.push_back(std::nullopt);
    return false;
}

// Skips to the next ',' or ';' (or sectionKeyword, when given).
// Stops early at end of file, leaving eof_ set.
void Parser::resync(const char* sectionKeyword) {
    while (!symbol_->isSeparator() &&
           !(sectionKeyword != nullptr && isKeyword(*symbol_, sectionKeyword))) {
        if (!advance()) {
            return;
        }
    }
}

bool Parser::isKeyword(const Symbol& symbol, const char* keyword) const {
    return symbol.is(SymbolCategory::KEYWORD) && textOf(symbol) == keyword;
}

std::string Parser::textOf(const Symbol& symbol) const {
    return names_.resolve(symbol.getId()).value_or("");
}

void Parser::reportSyntaxError(SyntaxError error, const std::optional<Symbol>& symbol,
                               int arrowOffset, const std::string& detail) {
    ++errorCount_;

    std::string message = syntaxErrorMessage(error);
    if (!detail.empty()) {
        message += " " + detail;
    }

    if (symbol) {
        NETDEF_LOG(DebugLevel::DETAIL, "Syntax error {} at {}:{}", syntaxErrorNumber(error),
                   symbol->getLine(), symbol->getColumn() + arrowOffset);
    } else {
        NETDEF_LOG(DebugLevel::DETAIL, "Syntax error {} (no location)", syntaxErrorNumber(error));
    }
    scanner_.printError(symbol, arrowOffset, message);
}

void Parser::rejectItem(ItemList& list, SyntaxError error, int arrowOffset) {
    list.push_back(std::nullopt);
    reportSyntaxError(error, symbol_, arrowOffset);
    resync();
}

// ---------------------------------------------------------------------------
// Grammar
// ---------------------------------------------------------------------------

std::optional<NetworkDescription> Parser::parseFile() {
    if (parsed_) {
        throw std::logic_error("Parser::parseFile called twice on " + scanner_.getPath());
    }
    parsed_ = true;

    if (scanner_.unterminatedComment()) {
        reportSyntaxError(SyntaxError::UNTERMINATED_COMMENT, scanner_.unterminatedComment());
    }

    const SectionRule sections[] = {
        {Section::DEVICES, Constants::KEYWORD_DEVICES, SyntaxError::EXPECTED_DEVICES,
         {&Parser::device, false, SyntaxError::DEVICE_SEPARATOR, Constants::KEYWORD_CONNECT}},
        {Section::CONNECT, Constants::KEYWORD_CONNECT, SyntaxError::EXPECTED_CONNECT,
         {&Parser::connection, true, SyntaxError::CONNECTION_SEPARATOR, Constants::KEYWORD_MONITOR}},
        {Section::MONITOR, Constants::KEYWORD_MONITOR, SyntaxError::EXPECTED_MONITOR,
         {&Parser::monitor, true, SyntaxError::MONITOR_SEPARATOR, Constants::KEYWORD_END}}
    };

    NetworkDescription description;
    if (!advance()) {
        return std::nullopt;
    }

    for (const SectionRule& rule : sections) {
        NETDEF_LOG(DebugLevel::DETAIL, "Parsing section {}", rule.keyword);
        if (rule.section == Section::CONNECT) {
            connectHeader_ = symbol_;
        }
        if (!sectionHeader(rule.keyword, rule.missingKeyword)) {
            return std::nullopt;
        }

        std::optional<std::vector<ItemDescriptor>> items = itemList(rule.list);
        if (eof_) {
            return std::nullopt;
        }
        if (items) {
            NETDEF_LOG(DebugLevel::DETAIL, "Section {} holds {} items", sectionName(rule.section), items->size());
            description.sections[rule.section] = std::move(*items);
        }
    }

    if (!isKeyword(*symbol_, Constants::KEYWORD_END)) {
        reportSyntaxError(SyntaxError::EXPECTED_END, symbol_);
    }
    // A missing ';' at the very end is an END error, not a premature end
    if (!scanner_.peekSymbol()) {
        reportSyntaxError(SyntaxError::EXPECTED_END_SEMICOLON, scanner_.lastSymbol());
        return std::nullopt;
    }
    if (!advance()) {
        return std::nullopt;
    }
    if (!symbol_->is(SymbolCategory::SEMICOLON)) {
        reportSyntaxError(SyntaxError::EXPECTED_END_SEMICOLON, symbol_);
    }

    if (errorCount_ != 0) {
        return std::nullopt;
    }
    return description;
}

// On entry symbol_ should be keyword; on success symbol_ is the first symbol
// of the section's list.
bool Parser::sectionHeader(const char* keyword, SyntaxError missingKeyword) {
    if (!isKeyword(*symbol_, keyword)) {
        reportSyntaxError(missingKeyword, symbol_);
        std::optional<Symbol> next = scanner_.peekSymbol();
        if (!next || !next->is(SymbolCategory::COLON)) {
            // No header at all: the current symbol already belongs to the list
            return true;
        }
    }

    if (!advance()) {
        return false;
    }
    if (!symbol_->is(SymbolCategory::COLON)) {
        reportSyntaxError(SyntaxError::EXPECTED_COLON, symbol_);
    }
    return advance();
}

// Returns the section's items, or empty if any of them is malformed.
// On return symbol_ is the symbol after the list (normally the next keyword).
std::optional<std::vector<ItemDescriptor>> Parser::itemList(const ListRule& rule) {
    ItemList list;

    if (symbol_->is(SymbolCategory::SEMICOLON)) {
        if (!rule.emptyAllowed) {
            reportSyntaxError(SyntaxError::NO_DEVICES, symbol_);
        }
        if (!advance() || !rule.emptyAllowed) {
            return std::nullopt;
        }
        return std::vector<ItemDescriptor>();
    }

    (this->*rule.item)(list);
    if (eof_) {
        return std::nullopt;
    }

    while (symbol_->is(SymbolCategory::COMMA)) {
        if (!advance()) {
            return std::nullopt;
        }
        if (isKeyword(*symbol_, rule.nextKeyword)) {
            // Trailing comma
            reportSyntaxError(rule.separatorError, previous_);
            return std::nullopt;
        }
        (this->*rule.item)(list);
        if (eof_) {
            return std::nullopt;
        }
    }

    if (symbol_->is(SymbolCategory::SEMICOLON)) {
        if (!advance()) {
            return std::nullopt;
        }
        std::vector<ItemDescriptor> items;
        for (std::optional<ItemDescriptor>& entry : list) {
            if (!entry) {
                return std::nullopt;
            }
            items.push_back(std::move(*entry));
        }
        return items;
    }

    // Recovery inside the last item already stopped at the next section
    if (isKeyword(*symbol_, rule.nextKeyword)) {
        return std::nullopt;
    }

    reportSyntaxError(rule.separatorError, previous_);
    while (!isKeyword(*symbol_, rule.nextKeyword)) {
        if (!advance()) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool Parser::expectName(ItemList& list) {
    if (symbol_->is(SymbolCategory::NAME)) {
        return true;
    }

    NameViolationAt violation = Symbol::indexNotName(textOf(*symbol_))
        .value_or(NameViolationAt{0, NameViolation::FIRST_NOT_LOWERCASE_LETTER});
    list.push_back(std::nullopt);
    reportSyntaxError(SyntaxError::BAD_DEVICE_NAME, symbol_, static_cast<int>(violation.offset),
                      nameViolationMessage(violation.violation));
    resync();
    return false;
}

// keyword name [[','] property]
void Parser::device(ItemList& list) {
    const DeviceRule* rule = findDeviceRule(textOf(*symbol_));
    if (rule == nullptr) {
        rejectItem(list, SyntaxError::NOT_DEVICE_KEYWORD);
        return;
    }

    ItemDescriptor item{*symbol_};
    if (!step(list)) {
        return;
    }
    if (symbol_->isSeparator()) {
        list.push_back(std::nullopt);
        reportSyntaxError(rule->missingError, symbol_);
        return;
    }

    if (!expectName(list)) {
        return;
    }
    item.push_back(*symbol_);
    if (!step(list)) {
        return;
    }

    if (rule->property != PropertyKind::NONE) {
        // "SWITCH sw, 0": the comma belongs to the device when a value follows
        if (symbol_->is(SymbolCategory::COMMA)) {
            std::optional<Symbol> next = scanner_.peekSymbol();
            if (next && (next->is(SymbolCategory::NUMBER) || next->is(SymbolCategory::INTEGER)) &&
                !step(list)) {
                return;
            }
        }
        if (symbol_->isSeparator()) {
            list.push_back(std::nullopt);
            reportSyntaxError(rule->missingError, symbol_);
            return;
        }

        std::optional<std::size_t> violation = propertyViolation(rule->property, textOf(*symbol_));
        if (violation) {
            rejectItem(list, rule->propertyError, static_cast<int>(*violation));
            return;
        }
        item.push_back(*symbol_);
        if (!step(list)) {
            return;
        }
    }

    closeItem(list, item, SyntaxError::DEVICE_SEPARATOR, Constants::KEYWORD_CONNECT);
}

// device ['.' output_pin] '>' device '.' input_pin
void Parser::connection(ItemList& list) {
    ItemDescriptor item;

    if (!expectName(list)) {
        return;
    }
    item.push_back(*symbol_);
    if (!step(list)) {
        return;
    }

    if (symbol_->is(SymbolCategory::DOT)) {
        item.push_back(*symbol_);
        if (!step(list)) {
            return;
        }
        if (!symbol_->is(SymbolCategory::OUTPUT_PIN)) {
            rejectItem(list, SyntaxError::BAD_OUTPUT_PIN);
            return;
        }
        item.push_back(*symbol_);
        if (!step(list)) {
            return;
        }
    }

    if (!symbol_->is(SymbolCategory::ARROW)) {
        rejectItem(list, SyntaxError::EXPECTED_ARROW);
        return;
    }
    item.push_back(*symbol_);
    if (!step(list)) {
        return;
    }

    if (!expectName(list)) {
        return;
    }
    item.push_back(*symbol_);
    if (!step(list)) {
        return;
    }

    if (!symbol_->is(SymbolCategory::DOT)) {
        rejectItem(list, SyntaxError::EXPECTED_INPUT_TARGET);
        return;
    }
    item.push_back(*symbol_);
    if (!step(list)) {
        return;
    }

    if (!symbol_->is(SymbolCategory::INPUT_PIN)) {
        rejectItem(list, SyntaxError::BAD_INPUT_PIN);
        return;
    }
    item.push_back(*symbol_);
    if (!step(list)) {
        return;
    }

    closeItem(list, item, SyntaxError::CONNECTION_SEPARATOR, Constants::KEYWORD_MONITOR);
}

// device ['.' output_pin]
void Parser::monitor(ItemList& list) {
    ItemDescriptor item;

    if (!expectName(list)) {
        return;
    }
    item.push_back(*symbol_);
    if (!step(list)) {
        return;
    }

    if (symbol_->is(SymbolCategory::DOT)) {
        item.push_back(*symbol_);
        if (!step(list)) {
            return;
        }
        if (!symbol_->is(SymbolCategory::OUTPUT_PIN)) {
            rejectItem(list, SyntaxError::BAD_OUTPUT_PIN);
            return;
        }
        item.push_back(*symbol_);
        if (!step(list)) {
            return;
        }
    }

    closeItem(list, item, SyntaxError::MONITOR_SEPARATOR, Constants::KEYWORD_END);
}

// A complete item must be followed by ',' or ';'
void Parser::closeItem(ItemList& list, ItemDescriptor& item, SyntaxError separatorError,
                       const char* sectionKeyword) {
    if (symbol_->isSeparator()) {
        list.push_back(std::move(item));
        return;
    }
    list.push_back(std::nullopt);
    reportSyntaxError(separatorError, symbol_);
    resync(sectionKeyword);
}

// ---------------------------------------------------------------------------
// Building
// ---------------------------------------------------------------------------

bool Parser::parseNetwork() {
    std::optional<NetworkDescription> description = parseFile();

    if (!description) {
        std::string summary = errorCount_ == 1
            ? std::string("1 syntax error detected in the file")
            : fmt::format("{} syntax errors detected in the file", errorCount_);
        NETDEF_LOG(DebugLevel::INFO, "{}: {}", scanner_.getPath(), summary);
        scanner_.printError(std::nullopt, 0, summary);
        return false;
    }

    bool built = buildNetwork(*description);
    NETDEF_LOG(DebugLevel::INFO, "{}: circuit build {} ({} semantic errors, {} warnings)",
               scanner_.getPath(), built ? "succeeded" : "failed",
               semanticHandler_.errorCount(), semanticHandler_.warningCount());
    return built;
}

bool Parser::buildNetwork(const NetworkDescription& description) {
    if (!buildDevices(description.items(Section::DEVICES))) {
        return false;
    }
    if (!buildConnections(description.items(Section::CONNECT))) {
        return false;
    }
    return buildMonitors(description.items(Section::MONITOR));
}

bool Parser::buildDevices(const std::vector<ItemDescriptor>& items) {
    for (const ItemDescriptor& item : items) {
        NameId kind = item[0].getId();
        NameId name = item[1].getId();
        std::optional<std::string> property;
        if (item.size() == 3) {
            property = names_.resolve(item[2].getId());
        }

        ErrorCode code = devices_.makeDevice(name, kind, property);
        NETDEF_LOG(DebugLevel::TRACE, "makeDevice({}, {}) -> {}", textOf(item[1]), textOf(item[0]), code);
        if (semanticHandler_.handleError(code, item)) {
            return false;
        }
    }
    return true;
}

bool Parser::buildConnections(const std::vector<ItemDescriptor>& items) {
    for (const ItemDescriptor& item : items) {
        ConnectionRoles roles = SemanticErrorHandler::labelConnection(item);
        std::optional<NameId> firstPort;
        std::optional<NameId> secondPort;
        if (roles.firstPort) {
            firstPort = roles.firstPort->getId();
        }
        if (roles.secondPort) {
            secondPort = roles.secondPort->getId();
        }

        ErrorCode code = network_.makeConnection(roles.firstDevice.getId(), firstPort,
                                                 roles.secondDevice.getId(), secondPort);
        NETDEF_LOG(DebugLevel::TRACE, "makeConnection({} > {}) -> {}",
                   textOf(roles.firstDevice), textOf(roles.secondDevice), code);
        if (semanticHandler_.handleError(code, item)) {
            return false;
        }
    }

    if (!network_.checkNetwork()) {
        std::optional<Symbol> anchor = items.empty() ? connectHeader_ : items.back().back();
        semanticHandler_.reportUnconnectedInputs(anchor);
        return false;
    }
    return true;
}

bool Parser::buildMonitors(const std::vector<ItemDescriptor>& items) {
    for (const ItemDescriptor& item : items) {
        std::optional<NameId> port;
        if (item.size() == 3) {
            port = item[2].getId();
        }

        ErrorCode code = monitors_.makeMonitor(item[0].getId(), port);
        NETDEF_LOG(DebugLevel::TRACE, "makeMonitor({}) -> {}", textOf(item[0]), code);
        if (semanticHandler_.handleError(code, item)) {
            return false;
        }
    }
    return true;
}

} // namespace netdef
