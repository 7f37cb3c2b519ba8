#include "script.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"

namespace emuflow {

Script::Script(std::vector<Command> sequence,
               nlohmann::json variablesGlobal,
               int maxIterations,
               std::optional<Command> onErrorHandler)
    : m_sequence(std::move(sequence)),
      m_variablesGlobal(std::move(variablesGlobal)),
      m_maxIterations(maxIterations) {

    if (m_maxIterations < 1) {
        throw ConfigurationError("max_iterations must be at least 1, got " + std::to_string(m_maxIterations),
                                 "script");
    }
    if (m_variablesGlobal.is_null()) {
        m_variablesGlobal = nlohmann::json::object();
    }
    if (!m_variablesGlobal.is_object()) {
        throw ConfigurationError("variables_global must be an object", "script");
    }
    if (onErrorHandler) {
        m_onErrorHandler = std::make_unique<Command>(std::move(*onErrorHandler));
    }

    for (size_t i = 0; i < m_sequence.size(); ++i) {
        indexCommand(m_sequence[i], std::nullopt, i, 0);
    }
    if (m_onErrorHandler) {
        indexCommand(*m_onErrorHandler, std::nullopt, std::nullopt, 0);
    }

    // Labels can only be checked once every name is known
    for (const auto& command : m_sequence) {
        checkReferences(command);
    }
    if (m_onErrorHandler) {
        checkReferences(*m_onErrorHandler);
    }

    SLOG_DEBUG().message("Script constructed")
        .context("commands", m_index.size())
        .context("top_level", m_sequence.size())
        .context("labels", m_labelMap.size())
        .context("expressions", m_expressions.size())
        .context("max_iterations", m_maxIterations);
}

void Script::indexCommand(const Command& command, const std::optional<std::string>& expectedParent,
                          std::optional<size_t> topLevel, int depth) {
    if (depth > MAX_NESTING_LEVEL) {
        throw ConfigurationError("Command nesting deeper than " + std::to_string(MAX_NESTING_LEVEL) +
                                 " levels at '" + command.name + "'", command.id);
    }

    validateCommand(command);

    if (command.parentId) {
        if (!expectedParent) {
            throw ConfigurationError("Top level command '" + command.name + "' has parent_id " +
                                     *command.parentId, command.id);
        }
        if (*command.parentId != *expectedParent) {
            throw ConfigurationError("Command '" + command.name + "' has parent_id " + *command.parentId +
                                     " but is owned by " + *expectedParent, command.id);
        }
    }

    if (!m_index.emplace(command.id, IndexEntry{&command, topLevel}).second) {
        throw ConfigurationError("Duplicate command id: " + command.id, command.id);
    }
    if (!m_labelMap.emplace(command.name, command.id).second) {
        throw ConfigurationError("Duplicate command name: '" + command.name + "'", command.id);
    }

    if (const auto* repeat = std::get_if<RepeatParams>(&command.params)) {
        if (repeat->untilConditionExpr) {
            compileExpression(*repeat->untilConditionExpr);
        }
    } else if (const auto* jump = std::get_if<GotoParams>(&command.params)) {
        if (jump->conditionExpr) {
            compileExpression(*jump->conditionExpr);
        }
    } else if (const auto* condition = std::get_if<ConditionParams>(&command.params)) {
        compileExpression(condition->expr);
    }

    for (const auto* children : command.childLists()) {
        for (const auto& child : *children) {
            indexCommand(child, command.id, std::nullopt, depth + 1);
        }
    }
}

void Script::checkLabel(const Command& owner, const std::string& label, const char* field) const {
    if (!resolveLabel(label)) {
        auto it = m_labelMap.find(label);
        if (it == m_labelMap.end()) {
            throw ConfigurationError("Command '" + owner.name + "': " + field + " '" + label +
                                     "' does not name any command", owner.id);
        }
        throw ConfigurationError("Command '" + owner.name + "': " + field + " '" + label +
                                 "' names a nested command; jump targets must be top level", owner.id);
    }
}

void Script::checkReferences(const Command& command) {
    if (command.onFail == OnFailAction::GOTO_LABEL && command.onFailLabel) {
        checkLabel(command, *command.onFailLabel, "on_fail_label");
    }

    if (const auto* jump = std::get_if<GotoParams>(&command.params)) {
        checkLabel(command, jump->targetLabel, "target_label");
    } else if (const auto* condition = std::get_if<ConditionParams>(&command.params)) {
        if (condition->thenLabel) {
            checkLabel(command, *condition->thenLabel, "then_label");
        }
        if (condition->elseLabel) {
            checkLabel(command, *condition->elseLabel, "else_label");
        }
    }

    for (const auto* children : command.childLists()) {
        for (const auto& child : *children) {
            checkReferences(child);
        }
    }
}

void Script::compileExpression(const std::string& source) {
    if (m_expressions.find(source) != m_expressions.end()) {
        return;
    }
    m_expressions.emplace(source, Expression::parse(source));
}

const Command* Script::findById(const std::string& id) const {
    auto it = m_index.find(id);
    return it != m_index.end() ? it->second.command : nullptr;
}

const Command* Script::findByLabel(const std::string& label) const {
    auto it = m_labelMap.find(label);
    return it != m_labelMap.end() ? findById(it->second) : nullptr;
}

std::optional<size_t> Script::resolveLabel(const std::string& label) const {
    auto it = m_labelMap.find(label);
    if (it == m_labelMap.end()) {
        return std::nullopt;
    }
    return topLevelIndex(it->second);
}

std::optional<size_t> Script::topLevelIndex(const std::string& id) const {
    auto it = m_index.find(id);
    if (it == m_index.end()) {
        return std::nullopt;
    }
    return it->second.topLevel;
}

const Expression& Script::expression(const std::string& source) const {
    auto it = m_expressions.find(source);
    if (it == m_expressions.end()) {
        throw ConfigurationError("Expression was not compiled with the script: '" + source + "'", "script");
    }
    return it->second;
}

} // namespace emuflow
