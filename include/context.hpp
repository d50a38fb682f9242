#pragma once

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

// Forward declaration
class ContextNode;
using ContextNodePtr = std::shared_ptr<ContextNode>;
using ContextNodeConstPtr = std::shared_ptr<const ContextNode>;

enum class ContextType {
    NULL_TYPE,
    STRING,
    NUMBER,
    BOOLEAN,
    OBJECT,
    ARRAY
};

// One value of a construction context
class ContextNode {
public:
    ContextType type;
    std::string stringValue;
    double numberValue;
    // Exact decimal digits of an integral number; when set it is the
    // number's identity and numberValue is only its approximation
    std::string integerDigits;
    bool booleanValue;
    std::unordered_map<std::string, ContextNodePtr> children; // For objects
    std::vector<ContextNodePtr> elements; // For arrays

    explicit ContextNode(ContextType t = ContextType::NULL_TYPE);

    // Factory methods
    static ContextNodePtr createNull();
    static ContextNodePtr createString(const std::string& value);
    static ContextNodePtr createNumber(double value);
    static ContextNodePtr createInteger(long long value);
    static ContextNodePtr createInteger(unsigned long long value);
    static ContextNodePtr createBoolean(bool value);
    static ContextNodePtr createObject();
    static ContextNodePtr createArray();

    // Node manipulation
    void addChild(const std::string& key, ContextNodePtr child);
    void addElement(ContextNodePtr element);
    ContextNodePtr getChild(const std::string& key);
    ContextNodeConstPtr getChild(const std::string& key) const;
    ContextNodePtr getElement(size_t index);
    ContextNodeConstPtr getElement(size_t index) const;

    // Deep copy of this node and everything below it
    ContextNodePtr clone() const;

    // Compact JSON with object members sorted by key. Value-equal trees
    // always produce the same string.
    std::string canonical() const;
};

// Reads JSON text into ContextNode trees
class ContextParser {
private:
    std::string json;
    size_t pos;

    // Parsing utilities
    void skipWhitespace();
    char peek() const;
    char consume();
    bool match(const std::string& str);

    // Value parsers
    std::string parseString();
    ContextNodePtr parseNumber();
    ContextNodePtr parseValue(int depth);
    ContextNodePtr parseArray(int depth);
    ContextNodePtr parseObject(int depth);

public:
    static constexpr int MAX_DEPTH = 256;

    ContextParser();

    ContextNodePtr parse(const std::string& jsonString);
    std::string toString(const ContextNodePtr& node, int indent = 0) const;
};

class Context;

// A single {key, value} pair used to build a Context from a braced list
struct ContextEntry {
    std::string key;
    ContextNodePtr value;

    ContextEntry(std::string k, const ContextNodeConstPtr& v);
    ContextEntry(std::string k, std::nullptr_t);
    ContextEntry(std::string k, const char* v);
    ContextEntry(std::string k, std::string v);
    ContextEntry(std::string k, double v);
    ContextEntry(std::string k, bool v);
    ContextEntry(std::string k, const Context& v);

    // Any integer type except bool, kept exact
    template<typename T,
             std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    ContextEntry(std::string k, T v)
        : key(std::move(k)),
          value(std::is_signed_v<T> ? ContextNode::createInteger(static_cast<long long>(v))
                                    : ContextNode::createInteger(static_cast<unsigned long long>(v))) {}
};

// Named parameters handed to a flyweight construction. Copies are deep.
class Context {
private:
    ContextNodePtr root;

public:
    Context();
    Context(std::initializer_list<ContextEntry> entries);

    Context(const Context& other);
    Context& operator=(const Context& other);

    // Parse a JSON object; throws std::runtime_error for anything else
    static Context fromJson(const std::string& text);

    // Wrap a copy of an object node
    static Context fromNode(const ContextNode& node);

    Context& set(ContextEntry entry);
    Context& set(const std::string& key, const ContextNodeConstPtr& value);

    ContextNodeConstPtr get(const std::string& key) const;
    bool has(const std::string& key) const;
    size_t size() const;
    bool empty() const;

    const ContextNode& node() const { return *root; }

    std::string canonical() const;
    std::string toString() const;

    bool operator==(const Context& other) const;
    bool operator!=(const Context& other) const;
};
