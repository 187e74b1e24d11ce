#pragma once

#include "Collaborators.hpp"
#include "NameTable.hpp"
#include "NetworkDescription.hpp"
#include "Scanner.hpp"
#include "SemanticErrorHandler.hpp"
#include "SyntaxErrors.hpp"
#include <optional>
#include <string>
#include <vector>

namespace netdef {

// Recursive-descent parser for circuit definition files.
//
//   file       := DEVICES ':' deviceList CONNECT ':' connList MONITOR ':' monList END ';'
//   deviceList := device (',' device)* ';'
//   connList   := ';' | conn (',' conn)* ';'
//   monList    := ';' | mon  (',' mon)*  ';'
//
// Every syntax error is reported once and parsing resumes at the next ',' or
// ';' (or section keyword), so a single run reports all independent errors.
// Only a file with no syntax errors is handed to the building phase, which
// creates devices, connections and monitors through the collaborators.
class Parser {
public:
    Parser(NameTable& names, Devices& devices, Network& network,
           Monitors& monitors, Scanner& scanner);

    // Checks the syntax of the whole file. Empty if any syntax error was found.
    // Throws std::logic_error when called a second time.
    std::optional<NetworkDescription> parseFile();

    // parseFile() followed, on clean syntax, by the building phase.
    // Returns true if the circuit was built without fatal errors.
    bool parseNetwork();

    int errorCount() const { return errorCount_; }
    int warningCount() const { return semanticHandler_.warningCount(); }

private:
    using ItemParser = void (Parser::*)(ItemList&);

    struct ListRule {
        ItemParser item;
        bool emptyAllowed;
        SyntaxError separatorError;
        const char* nextKeyword;
    };

    struct SectionRule {
        Section section;
        const char* keyword;
        SyntaxError missingKeyword;
        ListRule list;
    };

    // Token stream
    bool advance();
    bool step(ItemList& list);
    void resync(const char* sectionKeyword = nullptr);
    bool isKeyword(const Symbol& symbol, const char* keyword) const;
    std::string textOf(const Symbol& symbol) const;

    void reportSyntaxError(SyntaxError error, const std::optional<Symbol>& symbol,
                           int arrowOffset = 0, const std::string& detail = "");
    void rejectItem(ItemList& list, SyntaxError error, int arrowOffset = 0);

    // Grammar
    bool sectionHeader(const char* keyword, SyntaxError missingKeyword);
    std::optional<std::vector<ItemDescriptor>> itemList(const ListRule& rule);
    bool expectName(ItemList& list);
    void device(ItemList& list);
    void connection(ItemList& list);
    void monitor(ItemList& list);
    void closeItem(ItemList& list, ItemDescriptor& item, SyntaxError separatorError,
                   const char* sectionKeyword);

    // Building
    bool buildNetwork(const NetworkDescription& description);
    bool buildDevices(const std::vector<ItemDescriptor>& items);
    bool buildConnections(const std::vector<ItemDescriptor>& items);
    bool buildMonitors(const std::vector<ItemDescriptor>& items);

    NameTable& names_;
    Devices& devices_;
    Network& network_;
    Monitors& monitors_;
    Scanner& scanner_;
    SemanticErrorHandler semanticHandler_;

    std::optional<Symbol> symbol_;
    std::optional<Symbol> previous_;
    std::optional<Symbol> connectHeader_;
    int errorCount_ = 0;
    bool eof_ = false;
    bool parsed_ = false;
};

} // namespace netdef
