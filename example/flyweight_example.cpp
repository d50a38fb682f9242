#include "flyweight_factory.hpp"
#include "logger.hpp"

#include <fmt/core.h>
#include <memory>
#include <stdexcept>

// Error objects shared by name, the way an application would reuse
// immutable error descriptors
class FooError : public Object {
public:
    std::string getType() const override { return "FooError"; }
    void display() const override { fmt::print("FooError\n"); }
};

class BarError : public Object {
public:
    std::string getType() const override { return "BarError"; }
    void display() const override { fmt::print("BarError\n"); }
};

class ErrorFactory : public FlyweightFactory<Object> {
public:
    ErrorFactory() : FlyweightFactory<Object>("ErrorFactory") {}

protected:
    ValuePtr construct(const std::string& identifier, const Context& context) override {
        (void)context;
        if (identifier == "Foo") return std::make_shared<FooError>();
        if (identifier == "Bar") return std::make_shared<BarError>();
        throw ConstructionError(identifier, "no such error type");
    }
};

// Tree sprites keyed by species and color; the context carries the
// intrinsic state shared between every tree of that kind
class TreeSprite : public Object {
private:
    std::string species;
    std::string color;

public:
    explicit TreeSprite(const Context& context)
        : species(context.has("species") ? context.get("species")->stringValue : "oak"),
          color(context.has("color") ? context.get("color")->stringValue : "green") {}

    std::string getType() const override { return "TreeSprite"; }
    void display() const override { fmt::print("TreeSprite [{} / {}]\n", species, color); }
};

int main() {
    fmt::print("=== Flyweight Factory Example ===\n\n");

    auto logger = std::make_shared<Logger>("flyweight");
    logger->addEndpoint(std::make_shared<StdoutEndpoint>());
    logger->setLevel(Logger::LogLevel::DEBUG);
    logger->setFlushByteLimit(1);

    // 1. Subclass with a hand-written construct()
    fmt::print("--- Subclassed factory ---\n");
    ErrorFactory errors;
    errors.setLogger(logger);

    auto foo1 = errors.acquire("Foo");
    auto foo2 = errors.acquire("Foo");
    auto bar = errors.acquire("Bar");

    fmt::print("foo1 == foo2: {}\n", foo1 == foo2);
    fmt::print("foo1 == bar:  {}\n", foo1 == bar);

    try {
        errors.acquire("Unknown");
    } catch (const ConstructionError& e) {
        fmt::print("Caught: {}\n", e.what());
    }
    errors.printStatistics();

    // 2. Producer table
    fmt::print("\n--- Registered producers ---\n");
    RegisteredFlyweightFactory<Object> sprites("SpriteFactory");
    sprites.setLogger(logger);
    sprites.registerType<TreeSprite>("tree");

    for (int i = 0; i < 5; ++i) {
        Context context{{"species", i % 2 ? "pine" : "oak"}, {"color", "green"}};
        auto sprite = sprites.acquire("tree", context);
        sprite->display();
    }

    // Entry order does not change the derived key
    auto a = sprites.acquire("tree", {{"color", "red"}, {"species", "maple"}});
    auto b = sprites.acquire("tree", Context::fromJson(R"({"species": "maple", "color": "red"})"));
    fmt::print("order independent: {}\n", a == b);

    fmt::print("cached keys:\n");
    for (const auto& key : sprites.cachedKeys()) {
        fmt::print("  {}\n", key);
    }
    sprites.display();

    logger->flush();
    return 0;
}
