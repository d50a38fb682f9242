#include "context.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace {

std::string escapeString(const std::string& str) {
    std::string result;
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    result += fmt::format("\\u{:04x}", static_cast<unsigned char>(c));
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

// Integral doubles in the 64-bit range are spelled like integers so that
// 2, 2.0 and -0.0/0 agree with the exact integer form
std::string formatNumber(double value) {
    if (value == std::trunc(value) && value >= -9223372036854775808.0 && value < 9223372036854775808.0) {
        return fmt::format("{}", static_cast<long long>(value));
    }
    return fmt::format("{}", value);
}

// Drop leading zeros and the sign of zero from a decimal integer lexeme
std::string normalizeDigits(const std::string& lexeme) {
    bool negative = !lexeme.empty() && lexeme[0] == '-';
    size_t first = lexeme.find_first_not_of('0', negative ? 1 : 0);
    if (first == std::string::npos) {
        return "0";
    }
    return (negative ? "-" : "") + lexeme.substr(first);
}

std::vector<std::string> sortedKeys(const std::unordered_map<std::string, ContextNodePtr>& children) {
    std::vector<std::string> keys;
    keys.reserve(children.size());
    for (const auto& [key, value] : children) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace

// ContextNode Implementation
ContextNode::ContextNode(ContextType t) : type(t), numberValue(0.0), booleanValue(false) {}

ContextNodePtr ContextNode::createNull() {
    return std::make_shared<ContextNode>(ContextType::NULL_TYPE);
}

ContextNodePtr ContextNode::createString(const std::string& value) {
    auto node = std::make_shared<ContextNode>(ContextType::STRING);
    node->stringValue = value;
    return node;
}

ContextNodePtr ContextNode::createNumber(double value) {
    auto node = std::make_shared<ContextNode>(ContextType::NUMBER);
    node->numberValue = value;
    return node;
}

ContextNodePtr ContextNode::createInteger(long long value) {
    auto node = std::make_shared<ContextNode>(ContextType::NUMBER);
    node->numberValue = static_cast<double>(value);
    node->integerDigits = fmt::format("{}", value);
    return node;
}

ContextNodePtr ContextNode::createInteger(unsigned long long value) {
    auto node = std::make_shared<ContextNode>(ContextType::NUMBER);
    node->numberValue = static_cast<double>(value);
    node->integerDigits = fmt::format("{}", value);
    return node;
}

ContextNodePtr ContextNode::createBoolean(bool value) {
    auto node = std::make_shared<ContextNode>(ContextType::BOOLEAN);
    node->booleanValue = value;
    return node;
}

ContextNodePtr ContextNode::createObject() {
    return std::make_shared<ContextNode>(ContextType::OBJECT);
}

ContextNodePtr ContextNode::createArray() {
    return std::make_shared<ContextNode>(ContextType::ARRAY);
}

void ContextNode::addChild(const std::string& key, ContextNodePtr child) {
    if (type != ContextType::OBJECT) {
        throw std::runtime_error("Cannot add child to non-object node");
    }
    children[key] = child ? std::move(child) : createNull();
}

void ContextNode::addElement(ContextNodePtr element) {
    if (type != ContextType::ARRAY) {
        throw std::runtime_error("Cannot add element to non-array node");
    }
    elements.push_back(element ? std::move(element) : createNull());
}

ContextNodePtr ContextNode::getChild(const std::string& key) {
    auto it = children.find(key);
    return (it != children.end()) ? it->second : nullptr;
}

ContextNodeConstPtr ContextNode::getChild(const std::string& key) const {
    auto it = children.find(key);
    return (it != children.end()) ? it->second : nullptr;
}

ContextNodePtr ContextNode::getElement(size_t index) {
    return (index < elements.size()) ? elements[index] : nullptr;
}

ContextNodeConstPtr ContextNode::getElement(size_t index) const {
    return (index < elements.size()) ? elements[index] : nullptr;
}

ContextNodePtr ContextNode::clone() const {
    auto copy = std::make_shared<ContextNode>(type);
    copy->stringValue = stringValue;
    copy->numberValue = numberValue;
    copy->integerDigits = integerDigits;
    copy->booleanValue = booleanValue;
    for (const auto& [key, value] : children) {
        copy->children[key] = value->clone();
    }
    copy->elements.reserve(elements.size());
    for (const auto& element : elements) {
        copy->elements.push_back(element->clone());
    }
    return copy;
}

std::string ContextNode::canonical() const {
    switch (type) {
        case ContextType::NULL_TYPE:
            return "null";
        case ContextType::STRING:
            return "\"" + escapeString(stringValue) + "\"";
        case ContextType::NUMBER:
            return integerDigits.empty() ? formatNumber(numberValue) : integerDigits;
        case ContextType::BOOLEAN:
            return booleanValue ? "true" : "false";
        case ContextType::ARRAY: {
            std::string result = "[";
            for (size_t i = 0; i < elements.size(); ++i) {
                if (i > 0) result += ",";
                result += elements[i]->canonical();
            }
            return result + "]";
        }
        case ContextType::OBJECT: {
            std::string result = "{";
            bool first = true;
            for (const auto& key : sortedKeys(children)) {
                if (!first) result += ",";
                first = false;
                result += "\"" + escapeString(key) + "\":";
                result += children.at(key)->canonical();
            }
            return result + "}";
        }
    }
    return "";
}

// ContextParser Implementation
ContextParser::ContextParser() : pos(0) {}

void ContextParser::skipWhitespace() {
    while (pos < json.length() && std::isspace(static_cast<unsigned char>(json[pos]))) {
        pos++;
    }
}

char ContextParser::peek() const {
    return (pos < json.length()) ? json[pos] : '\0';
}

char ContextParser::consume() {
    return (pos < json.length()) ? json[pos++] : '\0';
}

bool ContextParser::match(const std::string& str) {
    if (json.compare(pos, str.length(), str) != 0) return false;
    pos += str.length();
    return true;
}

std::string ContextParser::parseString() {
    if (consume() != '"') {
        throw std::runtime_error(fmt::format("Expected '\"' at offset {}", pos - 1));
    }

    std::string result;
    while (true) {
        if (pos >= json.length()) {
            throw std::runtime_error("Unterminated string");
        }
        char c = consume();
        if (c == '"') break;
        if (c == '\\') {
            char escaped = consume();
            switch (escaped) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    if (pos + 4 > json.length()) {
                        throw std::runtime_error("Truncated \\u escape");
                    }
                    for (size_t i = 0; i < 4; ++i) {
                        if (!std::isxdigit(static_cast<unsigned char>(json[pos + i]))) {
                            throw std::runtime_error("Invalid \\u escape");
                        }
                    }
                    unsigned long code = std::stoul(json.substr(pos, 4), nullptr, 16);
                    pos += 4;
                    // Encoded as UTF-8; surrogate pairs are not combined
                    if (code < 0x80) {
                        result += static_cast<char>(code);
                    } else if (code < 0x800) {
                        result += static_cast<char>(0xC0 | (code >> 6));
                        result += static_cast<char>(0x80 | (code & 0x3F));
                    } else {
                        result += static_cast<char>(0xE0 | (code >> 12));
                        result += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
                        result += static_cast<char>(0x80 | (code & 0x3F));
                    }
                    break;
                }
                default:
                    throw std::runtime_error(fmt::format("Invalid escape '\\{}'", escaped));
            }
        } else {
            result += c;
        }
    }
    return result;
}

ContextNodePtr ContextParser::parseNumber() {
    size_t start = pos;
    bool integral = true;

    if (peek() == '-') consume();

    if (!std::isdigit(static_cast<unsigned char>(peek()))) {
        throw std::runtime_error("Invalid number format");
    }

    while (std::isdigit(static_cast<unsigned char>(peek()))) consume();

    if (peek() == '.') {
        integral = false;
        consume();
        while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
    }

    if (peek() == 'e' || peek() == 'E') {
        integral = false;
        consume();
        if (peek() == '+' || peek() == '-') consume();
        while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
    }

    const std::string lexeme = json.substr(start, pos - start);
    double value;
    try {
        value = std::stod(lexeme);
    } catch (const std::out_of_range&) {
        throw std::runtime_error(fmt::format("Number out of range at offset {}", start));
    }

    auto node = ContextNode::createNumber(value);
    if (integral) {
        // Keep every digit; doubles cannot hold integers past 2^53
        node->integerDigits = normalizeDigits(lexeme);
    }
    return node;
}

ContextNodePtr ContextParser::parseValue(int depth) {
    if (depth > MAX_DEPTH) {
        throw std::runtime_error("Context nesting too deep");
    }

    skipWhitespace();

    char c = peek();

    if (c == '"') {
        return ContextNode::createString(parseString());
    } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
        return parseNumber();
    } else if (match("true")) {
        return ContextNode::createBoolean(true);
    } else if (match("false")) {
        return ContextNode::createBoolean(false);
    } else if (match("null")) {
        return ContextNode::createNull();
    } else if (c == '[') {
        return parseArray(depth + 1);
    } else if (c == '{') {
        return parseObject(depth + 1);
    } else if (c == '\0') {
        throw std::runtime_error("Unexpected end of input");
    } else {
        throw std::runtime_error("Unexpected character: " + std::string(1, c));
    }
}

ContextNodePtr ContextParser::parseArray(int depth) {
    consume(); // '['
    skipWhitespace();

    auto arrayNode = ContextNode::createArray();

    if (peek() == ']') {
        consume();
        return arrayNode;
    }

    while (true) {
        arrayNode->addElement(parseValue(depth));
        skipWhitespace();

        if (peek() == ']') {
            consume();
            break;
        } else if (peek() == ',') {
            consume();
            skipWhitespace();
        } else {
            throw std::runtime_error("Expected ',' or ']' in array");
        }
    }

    return arrayNode;
}

ContextNodePtr ContextParser::parseObject(int depth) {
    consume(); // '{'
    skipWhitespace();

    auto objectNode = ContextNode::createObject();

    if (peek() == '}') {
        consume();
        return objectNode;
    }

    while (true) {
        skipWhitespace();
        std::string key = parseString();

        skipWhitespace();
        if (consume() != ':') {
            throw std::runtime_error("Expected ':' after object key");
        }

        objectNode->addChild(key, parseValue(depth));

        skipWhitespace();
        if (peek() == '}') {
            consume();
            break;
        } else if (peek() == ',') {
            consume();
            skipWhitespace();
        } else {
            throw std::runtime_error("Expected ',' or '}' in object");
        }
    }

    return objectNode;
}

ContextNodePtr ContextParser::parse(const std::string& jsonString) {
    json = jsonString;
    pos = 0;
    ContextNodePtr node = parseValue(0);
    skipWhitespace();
    if (pos != json.length()) {
        throw std::runtime_error(fmt::format("Trailing characters at offset {}", pos));
    }
    return node;
}

std::string ContextParser::toString(const ContextNodePtr& node, int indent) const {
    std::string spaces(indent * 2, ' ');

    switch (node->type) {
        case ContextType::NULL_TYPE:
        case ContextType::STRING:
        case ContextType::NUMBER:
        case ContextType::BOOLEAN:
            return node->canonical();
        case ContextType::ARRAY: {
            if (node->elements.empty()) return "[]";

            std::string result = "[\n";
            for (size_t i = 0; i < node->elements.size(); ++i) {
                result += std::string((indent + 1) * 2, ' ');
                result += toString(node->elements[i], indent + 1);
                if (i < node->elements.size() - 1) result += ",";
                result += "\n";
            }
            result += spaces + "]";
            return result;
        }
        case ContextType::OBJECT: {
            if (node->children.empty()) return "{}";

            std::string result = "{\n";
            size_t count = 0;
            for (const auto& key : sortedKeys(node->children)) {
                result += std::string((indent + 1) * 2, ' ');
                result += "\"" + escapeString(key) + "\": ";
                result += toString(node->children.at(key), indent + 1);
                if (++count < node->children.size()) result += ",";
                result += "\n";
            }
            result += spaces + "}";
            return result;
        }
    }
    return "";
}

// ContextEntry Implementation
ContextEntry::ContextEntry(std::string k, const ContextNodeConstPtr& v)
    : key(std::move(k)), value(v ? v->clone() : ContextNode::createNull()) {}

ContextEntry::ContextEntry(std::string k, std::nullptr_t)
    : key(std::move(k)), value(ContextNode::createNull()) {}

ContextEntry::ContextEntry(std::string k, const char* v)
    : key(std::move(k)), value(v ? ContextNode::createString(v) : ContextNode::createNull()) {}

ContextEntry::ContextEntry(std::string k, std::string v)
    : key(std::move(k)), value(ContextNode::createString(v)) {}

ContextEntry::ContextEntry(std::string k, double v)
    : key(std::move(k)), value(ContextNode::createNumber(v)) {}

ContextEntry::ContextEntry(std::string k, bool v)
    : key(std::move(k)), value(ContextNode::createBoolean(v)) {}

ContextEntry::ContextEntry(std::string k, const Context& v)
    : key(std::move(k)), value(v.node().clone()) {}

// Context Implementation
Context::Context() : root(ContextNode::createObject()) {}

Context::Context(std::initializer_list<ContextEntry> entries) : root(ContextNode::createObject()) {
    for (const auto& entry : entries) {
        root->addChild(entry.key, entry.value->clone());
    }
}

Context::Context(const Context& other) : root(other.root->clone()) {}

Context& Context::operator=(const Context& other) {
    if (this != &other) {
        root = other.root->clone();
    }
    return *this;
}

Context Context::fromJson(const std::string& text) {
    ContextParser parser;
    ContextNodePtr node = parser.parse(text);
    if (node->type != ContextType::OBJECT) {
        throw std::runtime_error("Context JSON must be an object");
    }
    Context context;
    context.root = std::move(node);
    return context;
}

Context Context::fromNode(const ContextNode& node) {
    if (node.type != ContextType::OBJECT) {
        throw std::runtime_error("Context root must be an object node");
    }
    Context context;
    context.root = node.clone();
    return context;
}

Context& Context::set(ContextEntry entry) {
    root->addChild(entry.key, entry.value->clone());
    return *this;
}

Context& Context::set(const std::string& key, const ContextNodeConstPtr& value) {
    root->addChild(key, value ? value->clone() : ContextNode::createNull());
    return *this;
}

ContextNodeConstPtr Context::get(const std::string& key) const {
    return std::as_const(*root).getChild(key);
}

bool Context::has(const std::string& key) const {
    return root->children.find(key) != root->children.end();
}

size_t Context::size() const {
    return root->children.size();
}

bool Context::empty() const {
    return root->children.empty();
}

std::string Context::canonical() const {
    return root->canonical();
}

std::string Context::toString() const {
    ContextParser parser;
    return parser.toString(root);
}

bool Context::operator==(const Context& other) const {
    return canonical() == other.canonical();
}

bool Context::operator!=(const Context& other) const {
    return !(*this == other);
}
