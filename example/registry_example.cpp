#include "flyweight_factory.hpp"
#include "keyed_store.hpp"
#include "logger.hpp"
#include "object.hpp"

#include <fmt/core.h>
#include <memory>

int main() {
    fmt::print("=== Registry Example ===\n\n");

    // A plain KeyedStore used as a local registry
    KeyedStore<int> ports;
    ports.set("http", 80).set("https", 443).set("ssh", 22);

    fmt::print("https -> {}\n", ports.get("https"));
    fmt::print("gopher -> {} (default)\n", ports.get("gopher", -1));

    ports.remove("ssh");
    for (const auto& name : ports.keys()) {
        fmt::print("  {} = {}\n", name, ports.get(name));
    }

    // Snapshots do not write back
    auto snapshot = ports.all();
    snapshot["ftp"] = 21;
    fmt::print("store has ftp: {}\n", ports.has("ftp"));

    ports.clear();
    fmt::print("empty after clear: {}\n\n", ports.isEmpty());

    // The process-wide registry shares services by name
    auto& registry = ObjectRegistry::getInstance();

    auto logger = std::make_shared<Logger>("Registry");
    logger->addEndpoint(std::make_shared<StdoutEndpoint>());
    registry.registerObject("main_logger", logger);

    auto factory = std::make_shared<RegisteredFlyweightFactory<Object>>("objects");
    factory->registerType<Object>("Object");
    factory->setLogger(logger);
    registry.registerObject("object_factory", factory);

    for (const auto& name : registry.getObjectNames()) {
        auto obj = registry.getObject(name);
        fmt::print("{} -> {}\n", name, obj->getType());
    }

    if (auto shared = registry.getObjectAs<RegisteredFlyweightFactory<Object>>("object_factory")) {
        auto first = shared->acquire("Object");
        auto second = shared->acquire("Object");
        fmt::print("same instance through registry: {}\n", first == second);
    }

    registry.removeObject("object_factory");
    fmt::print("factory still registered: {}\n", registry.hasObject("object_factory"));

    logger->flush();
    registry.clear();
    return 0;
}
