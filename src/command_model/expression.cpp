#include "expression.h"
#include "../common/error_handler.h"
#include <vector>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cerrno>
#include <cstdint>
#include <limits>
#include <utility>

namespace emuflow {

namespace {

enum class TokenKind {
    NUMBER,
    STRING,
    IDENTIFIER,
    OPERATOR,
    LPAREN,
    RPAREN,
    LBRACKET,
    RBRACKET,
    DOT,
    END
};

struct Token {
    TokenKind kind;
    std::string text;
    size_t position;
};

[[noreturn]] void syntaxError(const std::string& source, size_t position, const std::string& message) {
    throw ConfigurationError("Expression syntax error at " + std::to_string(position) + ": " + message +
                             " in '" + source + "'", "expression");
}

std::vector<Token> tokenize(const std::string& source) {
    std::vector<Token> tokens;
    size_t i = 0;

    while (i < source.size()) {
        char c = source[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        size_t start = i;

        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && i + 1 < source.size() && std::isdigit(static_cast<unsigned char>(source[i + 1])))) {
            bool seenDot = false;
            while (i < source.size() &&
                   (std::isdigit(static_cast<unsigned char>(source[i])) || (source[i] == '.' && !seenDot))) {
                if (source[i] == '.') {
                    // "1.x" is not a number continuation
                    if (i + 1 >= source.size() || !std::isdigit(static_cast<unsigned char>(source[i + 1]))) {
                        break;
                    }
                    seenDot = true;
                }
                ++i;
            }
            tokens.push_back({TokenKind::NUMBER, source.substr(start, i - start), start});
            continue;
        }

        if (c == '\'' || c == '"') {
            char quote = c;
            std::string value;
            ++i;
            bool closed = false;
            while (i < source.size()) {
                char ch = source[i];
                if (ch == '\\' && i + 1 < source.size()) {
                    char next = source[i + 1];
                    switch (next) {
                        case 'n': value += '\n'; break;
                        case 't': value += '\t'; break;
                        case '\\': value += '\\'; break;
                        case '\'': value += '\''; break;
                        case '"': value += '"'; break;
                        default: value += '\\'; value += next; break;
                    }
                    i += 2;
                    continue;
                }
                if (ch == quote) {
                    closed = true;
                    ++i;
                    break;
                }
                value += ch;
                ++i;
            }
            if (!closed) {
                syntaxError(source, start, "unterminated string");
            }
            tokens.push_back({TokenKind::STRING, value, start});
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            while (i < source.size() &&
                   (std::isalnum(static_cast<unsigned char>(source[i])) || source[i] == '_')) {
                ++i;
            }
            tokens.push_back({TokenKind::IDENTIFIER, source.substr(start, i - start), start});
            continue;
        }

        switch (c) {
            case '(': tokens.push_back({TokenKind::LPAREN, "(", start}); ++i; continue;
            case ')': tokens.push_back({TokenKind::RPAREN, ")", start}); ++i; continue;
            case '[': tokens.push_back({TokenKind::LBRACKET, "[", start}); ++i; continue;
            case ']': tokens.push_back({TokenKind::RBRACKET, "]", start}); ++i; continue;
            case '.': tokens.push_back({TokenKind::DOT, ".", start}); ++i; continue;
            default: break;
        }

        static const char* twoCharOps[] = {"==", "!=", "<=", ">=", "&&", "||"};
        bool matched = false;
        for (const char* op : twoCharOps) {
            if (source.compare(i, 2, op) == 0) {
                tokens.push_back({TokenKind::OPERATOR, op, start});
                i += 2;
                matched = true;
                break;
            }
        }
        if (matched) {
            continue;
        }

        if (std::string("+-*/%<>!").find(c) != std::string::npos) {
            tokens.push_back({TokenKind::OPERATOR, std::string(1, c), start});
            ++i;
            continue;
        }

        syntaxError(source, start, std::string("unexpected character '") + c + "'");
    }

    tokens.push_back({TokenKind::END, "", source.size()});
    return tokens;
}

} // anonymous namespace

struct Expression::Node {
    enum class Kind {
        LITERAL,
        VARIABLE,
        MEMBER,
        INDEX,
        UNARY,
        BINARY,
        LOGICAL_AND,
        LOGICAL_OR
    };

    Kind kind;
    std::string text;              // variable name, member name or operator
    nlohmann::json literal;
    std::shared_ptr<const Node> left;
    std::shared_ptr<const Node> right;
};

namespace {

using Node = Expression::Node;
using NodePtr = std::shared_ptr<const Node>;

NodePtr makeNode(Node::Kind kind, std::string text = "", NodePtr left = nullptr, NodePtr right = nullptr) {
    auto node = std::make_shared<Node>();
    node->kind = kind;
    node->text = std::move(text);
    node->left = std::move(left);
    node->right = std::move(right);
    return node;
}

NodePtr makeLiteral(nlohmann::json value) {
    auto node = std::make_shared<Node>();
    node->kind = Node::Kind::LITERAL;
    node->literal = std::move(value);
    return node;
}

class Parser {
public:
    Parser(const std::string& source, std::vector<Token> tokens)
        : m_source(source), m_tokens(std::move(tokens)), m_pos(0) {}

    NodePtr parseAll() {
        if (peek().kind == TokenKind::END) {
            syntaxError(m_source, 0, "empty expression");
        }
        NodePtr root = parseOr();
        if (peek().kind != TokenKind::END) {
            syntaxError(m_source, peek().position, "unexpected '" + peek().text + "'");
        }
        return root;
    }

private:
    const Token& peek() const { return m_tokens[m_pos]; }
    const Token& advance() { return m_tokens[m_pos++]; }

    bool acceptOperator(const std::string& op) {
        if (peek().kind == TokenKind::OPERATOR && peek().text == op) {
            ++m_pos;
            return true;
        }
        return false;
    }

    bool acceptKeyword(const std::string& word) {
        if (peek().kind == TokenKind::IDENTIFIER && peek().text == word) {
            ++m_pos;
            return true;
        }
        return false;
    }

    void expect(TokenKind kind, const char* what) {
        if (peek().kind != kind) {
            syntaxError(m_source, peek().position, std::string("expected ") + what);
        }
        ++m_pos;
    }

    NodePtr parseOr() {
        NodePtr left = parseAnd();
        while (acceptKeyword("or") || acceptOperator("||")) {
            left = makeNode(Node::Kind::LOGICAL_OR, "or", left, parseAnd());
        }
        return left;
    }

    NodePtr parseAnd() {
        NodePtr left = parseNot();
        while (acceptKeyword("and") || acceptOperator("&&")) {
            left = makeNode(Node::Kind::LOGICAL_AND, "and", left, parseNot());
        }
        return left;
    }

    NodePtr parseNot() {
        if (acceptKeyword("not") || acceptOperator("!")) {
            return makeNode(Node::Kind::UNARY, "not", parseNot());
        }
        return parseComparison();
    }

    NodePtr parseComparison() {
        NodePtr left = parseAdditive();
        static const char* ops[] = {"==", "!=", "<=", ">=", "<", ">"};
        for (const char* op : ops) {
            if (acceptOperator(op)) {
                NodePtr right = parseAdditive();
                // Chained comparisons are not supported
                for (const char* other : ops) {
                    if (peek().kind == TokenKind::OPERATOR && peek().text == other) {
                        syntaxError(m_source, peek().position, "chained comparison");
                    }
                }
                return makeNode(Node::Kind::BINARY, op, left, right);
            }
        }
        return left;
    }

    NodePtr parseAdditive() {
        NodePtr left = parseMultiplicative();
        while (true) {
            if (acceptOperator("+")) {
                left = makeNode(Node::Kind::BINARY, "+", left, parseMultiplicative());
            } else if (acceptOperator("-")) {
                left = makeNode(Node::Kind::BINARY, "-", left, parseMultiplicative());
            } else {
                return left;
            }
        }
    }

    NodePtr parseMultiplicative() {
        NodePtr left = parseUnary();
        while (true) {
            if (acceptOperator("*")) {
                left = makeNode(Node::Kind::BINARY, "*", left, parseUnary());
            } else if (acceptOperator("/")) {
                left = makeNode(Node::Kind::BINARY, "/", left, parseUnary());
            } else if (acceptOperator("%")) {
                left = makeNode(Node::Kind::BINARY, "%", left, parseUnary());
            } else {
                return left;
            }
        }
    }

    NodePtr parseUnary() {
        if (acceptOperator("-")) {
            return makeNode(Node::Kind::UNARY, "-", parseUnary());
        }
        if (acceptOperator("+")) {
            return makeNode(Node::Kind::UNARY, "+", parseUnary());
        }
        return parsePostfix();
    }

    NodePtr parsePostfix() {
        NodePtr node = parsePrimary();
        while (true) {
            if (peek().kind == TokenKind::DOT) {
                advance();
                if (peek().kind != TokenKind::IDENTIFIER) {
                    syntaxError(m_source, peek().position, "expected member name after '.'");
                }
                node = makeNode(Node::Kind::MEMBER, advance().text, node);
            } else if (peek().kind == TokenKind::LBRACKET) {
                advance();
                NodePtr index = parseOr();
                expect(TokenKind::RBRACKET, "']'");
                node = makeNode(Node::Kind::INDEX, "[]", node, index);
            } else {
                return node;
            }
        }
    }

    NodePtr parsePrimary() {
        const Token& token = peek();
        switch (token.kind) {
            case TokenKind::NUMBER: {
                advance();
                if (token.text.find('.') != std::string::npos) {
                    return makeLiteral(std::strtod(token.text.c_str(), nullptr));
                }
                errno = 0;
                long long value = std::strtoll(token.text.c_str(), nullptr, 10);
                if (errno == ERANGE) {
                    syntaxError(m_source, token.position, "integer literal out of range");
                }
                return makeLiteral(static_cast<int64_t>(value));
            }
            case TokenKind::STRING:
                advance();
                return makeLiteral(token.text);
            case TokenKind::IDENTIFIER: {
                advance();
                if (token.text == "true" || token.text == "True") {
                    return makeLiteral(true);
                }
                if (token.text == "false" || token.text == "False") {
                    return makeLiteral(false);
                }
                if (token.text == "null" || token.text == "None") {
                    return makeLiteral(nullptr);
                }
                if (token.text == "and" || token.text == "or" || token.text == "not") {
                    syntaxError(m_source, token.position, "unexpected keyword '" + token.text + "'");
                }
                return makeNode(Node::Kind::VARIABLE, token.text);
            }
            case TokenKind::LPAREN: {
                advance();
                NodePtr inner = parseOr();
                expect(TokenKind::RPAREN, "')'");
                return inner;
            }
            case TokenKind::END:
                syntaxError(m_source, token.position, "unexpected end of expression");
            default:
                syntaxError(m_source, token.position, "unexpected '" + token.text + "'");
        }
    }

    const std::string& m_source;
    std::vector<Token> m_tokens;
    size_t m_pos;
};

[[noreturn]] void evaluationError(const std::string& source, const std::string& message) {
    throw CommandExecutionError("Expression evaluation failed: " + message + " in '" + source + "'",
                                "expression");
}

bool isNumber(const nlohmann::json& value) {
    return value.is_number();
}

// Unsigned values beyond int64_t range are treated as doubles
bool isIntegral(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    }
    return value.is_number_integer();
}

[[noreturn]] void overflowError(const std::string& source) {
    evaluationError(source, "integer overflow");
}

nlohmann::json arithmetic(const std::string& source, const std::string& op,
                          const nlohmann::json& left, const nlohmann::json& right) {
    if (op == "+" && left.is_string() && right.is_string()) {
        return left.get<std::string>() + right.get<std::string>();
    }

    if (!isNumber(left) || !isNumber(right)) {
        evaluationError(source, "operator '" + op + "' needs numbers, got " +
                                std::string(left.type_name()) + " and " + right.type_name());
    }

    if (op == "/") {
        double divisor = right.get<double>();
        if (divisor == 0.0) {
            evaluationError(source, "division by zero");
        }
        return left.get<double>() / divisor;
    }

    if (isIntegral(left) && isIntegral(right)) {
        int64_t a = left.get<int64_t>();
        int64_t b = right.get<int64_t>();
        int64_t r = 0;
        if (op == "+") {
            if (__builtin_add_overflow(a, b, &r)) overflowError(source);
            return r;
        }
        if (op == "-") {
            if (__builtin_sub_overflow(a, b, &r)) overflowError(source);
            return r;
        }
        if (op == "*") {
            if (__builtin_mul_overflow(a, b, &r)) overflowError(source);
            return r;
        }
        if (b == 0) {
            evaluationError(source, "modulo by zero");
        }
        if (b == -1) {
            return int64_t(0);
        }
        r = a % b;
        // Result takes the sign of the divisor
        if (r != 0 && ((r < 0) != (b < 0))) {
            r += b;
        }
        return r;
    }

    double a = left.get<double>();
    double b = right.get<double>();
    if (op == "+") return a + b;
    if (op == "-") return a - b;
    if (op == "*") return a * b;
    if (b == 0.0) {
        evaluationError(source, "modulo by zero");
    }
    double r = std::fmod(a, b);
    if (r != 0.0 && ((r < 0) != (b < 0))) {
        r += b;
    }
    return r;
}

bool valuesEqual(const nlohmann::json& left, const nlohmann::json& right) {
    if (isNumber(left) && isNumber(right)) {
        if (isIntegral(left) && isIntegral(right)) {
            return left.get<int64_t>() == right.get<int64_t>();
        }
        if (left.is_number_unsigned() && right.is_number_unsigned()) {
            return left.get<uint64_t>() == right.get<uint64_t>();
        }
        return left.get<double>() == right.get<double>();
    }
    // bool and number never compare equal here; json treats them as distinct types
    return left == right;
}

nlohmann::json compare(const std::string& source, const std::string& op,
                       const nlohmann::json& left, const nlohmann::json& right) {
    if (op == "==") return valuesEqual(left, right);
    if (op == "!=") return !valuesEqual(left, right);

    int order = 0;
    if (isNumber(left) && isNumber(right)) {
        if (isIntegral(left) && isIntegral(right)) {
            int64_t a = left.get<int64_t>();
            int64_t b = right.get<int64_t>();
            order = (a < b) ? -1 : (a > b ? 1 : 0);
        } else {
            double a = left.get<double>();
            double b = right.get<double>();
            order = (a < b) ? -1 : (a > b ? 1 : 0);
        }
    } else if (left.is_string() && right.is_string()) {
        order = left.get<std::string>().compare(right.get<std::string>());
    } else {
        evaluationError(source, "cannot order " + std::string(left.type_name()) + " and " + right.type_name());
    }

    if (op == "<") return order < 0;
    if (op == "<=") return order <= 0;
    if (op == ">") return order > 0;
    return order >= 0;
}

nlohmann::json lookupVariable(const std::string& name, const nlohmann::json& variables) {
    if (variables.is_object()) {
        auto it = variables.find(name);
        if (it != variables.end()) {
            return *it;
        }
    }
    if (name == "variables") {
        return variables;
    }
    return nullptr;
}

// Splits UTF-8 text into code points. Stray continuation bytes stand alone.
std::vector<std::string> codePoints(const std::string& text) {
    std::vector<std::string> points;
    size_t i = 0;
    while (i < text.size()) {
        size_t start = i++;
        while (i < text.size() && (static_cast<unsigned char>(text[i]) & 0xC0) == 0x80 &&
               (static_cast<unsigned char>(text[start]) & 0xC0) == 0xC0) {
            ++i;
        }
        points.push_back(text.substr(start, i - start));
    }
    return points;
}

nlohmann::json indexInto(const std::string& source, const nlohmann::json& container, const nlohmann::json& index) {
    if (container.is_null()) {
        return nullptr;
    }
    if (container.is_object()) {
        if (!index.is_string()) {
            evaluationError(source, "object index must be a string");
        }
        auto it = container.find(index.get<std::string>());
        return it != container.end() ? *it : nlohmann::json();
    }
    if (container.is_array() || container.is_string()) {
        if (!index.is_number_integer()) {
            evaluationError(source, "sequence index must be an integer");
        }
        if (!isIntegral(index)) {
            return nullptr;
        }
        std::vector<std::string> points;
        if (container.is_string()) {
            points = codePoints(container.get_ref<const std::string&>());
        }
        int64_t i = index.get<int64_t>();
        int64_t size = container.is_array() ? static_cast<int64_t>(container.size())
                                            : static_cast<int64_t>(points.size());
        if (i < 0) {
            i += size;
        }
        if (i < 0 || i >= size) {
            return nullptr;
        }
        if (container.is_array()) {
            return container[static_cast<size_t>(i)];
        }
        return points[static_cast<size_t>(i)];
    }
    evaluationError(source, "cannot index " + std::string(container.type_name()));
}

nlohmann::json evaluateNode(const std::string& source, const Node& node, const nlohmann::json& variables) {
    switch (node.kind) {
        case Node::Kind::LITERAL:
            return node.literal;

        case Node::Kind::VARIABLE:
            return lookupVariable(node.text, variables);

        case Node::Kind::MEMBER: {
            nlohmann::json object = evaluateNode(source, *node.left, variables);
            if (!object.is_object()) {
                return nullptr;
            }
            auto it = object.find(node.text);
            return it != object.end() ? *it : nlohmann::json();
        }

        case Node::Kind::INDEX:
            return indexInto(source, evaluateNode(source, *node.left, variables),
                             evaluateNode(source, *node.right, variables));

        case Node::Kind::UNARY: {
            nlohmann::json operand = evaluateNode(source, *node.left, variables);
            if (node.text == "not") {
                return !Expression::isTruthy(operand);
            }
            if (!isNumber(operand)) {
                evaluationError(source, "unary '" + node.text + "' needs a number");
            }
            if (node.text == "+") {
                return operand;
            }
            if (isIntegral(operand)) {
                int64_t value = operand.get<int64_t>();
                if (value == std::numeric_limits<int64_t>::min()) {
                    overflowError(source);
                }
                return -value;
            }
            return -operand.get<double>();
        }

        case Node::Kind::LOGICAL_AND:
            if (!Expression::isTruthy(evaluateNode(source, *node.left, variables))) {
                return false;
            }
            return Expression::isTruthy(evaluateNode(source, *node.right, variables));

        case Node::Kind::LOGICAL_OR:
            if (Expression::isTruthy(evaluateNode(source, *node.left, variables))) {
                return true;
            }
            return Expression::isTruthy(evaluateNode(source, *node.right, variables));

        case Node::Kind::BINARY: {
            nlohmann::json left = evaluateNode(source, *node.left, variables);
            nlohmann::json right = evaluateNode(source, *node.right, variables);
            const std::string& op = node.text;
            if (op == "+" || op == "-" || op == "*" || op == "/" || op == "%") {
                return arithmetic(source, op, left, right);
            }
            return compare(source, op, left, right);
        }
    }
    evaluationError(source, "corrupt expression tree");
}

} // anonymous namespace

Expression::Expression(std::string source, std::shared_ptr<const Node> root)
    : m_source(std::move(source)), m_root(std::move(root)) {
}

Expression Expression::parse(const std::string& source) {
    Parser parser(source, tokenize(source));
    NodePtr root = parser.parseAll();
    return Expression(source, root);
}

nlohmann::json Expression::evaluate(const nlohmann::json& variables) const {
    return evaluateNode(m_source, *m_root, variables);
}

bool Expression::evaluateBool(const nlohmann::json& variables) const {
    return isTruthy(evaluate(variables));
}

bool Expression::isTruthy(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            return false;
        case nlohmann::json::value_t::boolean:
            return value.get<bool>();
        case nlohmann::json::value_t::number_integer:
            return value.get<int64_t>() != 0;
        case nlohmann::json::value_t::number_unsigned:
            return value.get<uint64_t>() != 0;
        case nlohmann::json::value_t::number_float:
            return value.get<double>() != 0.0;
        case nlohmann::json::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        case nlohmann::json::value_t::array:
        case nlohmann::json::value_t::object:
            return !value.empty();
        default:
            return true;
    }
}

} // namespace emuflow
