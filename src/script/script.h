#ifndef EMUFLOW_SCRIPT_H
#define EMUFLOW_SCRIPT_H

#include <string>
#include <map>
#include <vector>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>
#include "../command_model/command.h"
#include "../command_model/expression.h"

namespace emuflow {

/**
 * @class Script
 * @brief Validated, read-only command sequence
 *
 * Construction checks every structural rule (unique ids and names, parent
 * links, label references, expression syntax, per command field
 * constraints) and throws ConfigurationError on the first violation. A
 * constructed Script never changes.
 */
class Script {
public:
    static constexpr int DEFAULT_MAX_ITERATIONS = 10000;
    static constexpr int MAX_NESTING_LEVEL = 16;

    explicit Script(std::vector<Command> sequence,
                    nlohmann::json variablesGlobal = nlohmann::json::object(),
                    int maxIterations = DEFAULT_MAX_ITERATIONS,
                    std::optional<Command> onErrorHandler = std::nullopt);

    Script(Script&&) = default;
    Script& operator=(Script&&) = default;
    Script(const Script&) = delete;
    Script& operator=(const Script&) = delete;

    const std::vector<Command>& sequence() const { return m_sequence; }
    const nlohmann::json& variablesGlobal() const { return m_variablesGlobal; }
    int maxIterations() const { return m_maxIterations; }

    // nullptr when no handler is configured
    const Command* onErrorHandler() const { return m_onErrorHandler.get(); }

    // Lookup over every command, nested ones and the handler included
    const Command* findById(const std::string& id) const;
    const Command* findByLabel(const std::string& label) const;

    // Position in sequence() of the command a label jumps to
    std::optional<size_t> resolveLabel(const std::string& label) const;
    std::optional<size_t> topLevelIndex(const std::string& id) const;

    // name -> id for every named command
    const std::map<std::string, std::string>& labelMap() const { return m_labelMap; }

    /**
     * @brief Compiled form of an expression that appears in this script
     * @throws ConfigurationError if the source was not part of the script
     */
    const Expression& expression(const std::string& source) const;

    size_t commandCount() const { return m_index.size(); }

private:
    struct IndexEntry {
        const Command* command;
        std::optional<size_t> topLevel;
    };

    void indexCommand(const Command& command, const std::optional<std::string>& expectedParent,
                      std::optional<size_t> topLevel, int depth);
    void checkLabel(const Command& owner, const std::string& label, const char* field) const;
    void checkReferences(const Command& command);
    void compileExpression(const std::string& source);

    std::vector<Command> m_sequence;
    nlohmann::json m_variablesGlobal;
    int m_maxIterations;
    std::unique_ptr<Command> m_onErrorHandler;

    std::map<std::string, IndexEntry> m_index;
    std::map<std::string, std::string> m_labelMap;
    std::map<std::string, Expression> m_expressions;
};

} // namespace emuflow

#endif // EMUFLOW_SCRIPT_H
