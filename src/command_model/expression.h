#ifndef EMUFLOW_EXPRESSION_H
#define EMUFLOW_EXPRESSION_H

#include <string>
#include <memory>
#include <nlohmann/json.hpp>

namespace emuflow {

/**
 * @class Expression
 * @brief Compiled condition expression over the worker's variable map
 *
 * Supports literals, variable lookups with member and index access,
 * arithmetic, comparison and boolean operators. There are no calls and no
 * assignment.
 */
class Expression {
public:
    struct Node;

    /**
     * @brief Compile an expression
     * @throws ConfigurationError on a syntax error
     */
    static Expression parse(const std::string& source);

    /**
     * @brief Evaluate against a JSON object of variables
     * @throws CommandExecutionError on type errors or division by zero
     */
    nlohmann::json evaluate(const nlohmann::json& variables) const;
    bool evaluateBool(const nlohmann::json& variables) const;

    const std::string& source() const { return m_source; }

    // null, false, 0, "" and empty containers are false
    static bool isTruthy(const nlohmann::json& value);

private:
    Expression(std::string source, std::shared_ptr<const Node> root);

    std::string m_source;
    std::shared_ptr<const Node> m_root;
};

} // namespace emuflow

#endif // EMUFLOW_EXPRESSION_H
