#include "flyweight_factory.hpp"

ConstructionError::ConstructionError(const std::string& identifier, const std::string& reason)
    : std::runtime_error(fmt::format("Cannot construct '{}': {}", identifier, reason)),
      identifierName(identifier) {}

std::string deriveFlyweightKey(const std::string& identifier, const Context& context) {
    return ContextNode::createString(identifier)->canonical() + ":" + context.canonical();
}
