#include "flyweight_factory.hpp"
#include "logger.hpp"
#include "object.hpp"

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

class Color : public Object {
public:
    std::string getType() const override { return "Color"; }
};

int main() {
    fmt::print("=== Logger Example ===\n\n");

    auto logger = std::make_shared<Logger>("MainApp");
    ObjectRegistry::getInstance().registerObject("main_logger", logger);

    logger->addEndpoint(std::make_shared<StdoutEndpoint>());

    try {
        logger->addEndpoint(std::make_shared<FileEndpoint>("patternkit.log"));
        fmt::print("Logging to both stdout and patternkit.log\n\n");
    } catch (const std::exception& e) {
        fmt::print("Warning: Could not open log file: {}\n", e.what());
    }

    logger->setFlushByteLimit(512);
    logger->setFlushTimeInterval(std::chrono::milliseconds(500));
    logger->setLevel(Logger::LogLevel::DEBUG);

    fmt::print("--- Factory activity ---\n");
    RegisteredFlyweightFactory<Object> colors("ColorFactory");
    colors.setLogger(logger);
    colors.registerType<Color>("rgb");

    colors.acquire("rgb", {{"r", 255}, {"g", 0}, {"b", 0}});
    colors.acquire("rgb", {{"b", 0}, {"g", 0}, {"r", 255}});   // debug: cache hit
    try {
        colors.acquire("cmyk");                                 // warn: no producer
    } catch (const ConstructionError& e) {
        logger->error("giving up on cmyk: {}", e.what());
    }
    logger->flush();

    fmt::print("\n--- Level filtering ---\n");
    logger->setLevel(Logger::LogLevel::WARN);
    logger->info("This INFO won't be logged (level too low)");
    logger->warn("This WARN will be logged");
    logger->setLevel(Logger::LogLevel::INFO);
    logger->flush();

    fmt::print("\n--- Multi-threaded acquire ---\n");
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&colors, logger, i]() {
            for (int j = 0; j < 3; ++j) {
                colors.acquire("rgb", {{"r", j * 100}, {"g", 0}, {"b", 0}});
                logger->info("Thread {} - request {}", i, j);
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    logger->flush();
    colors.printStatistics();

    ObjectRegistry::getInstance().removeObject("main_logger");
    fmt::print("\n=== Logger example completed ===\n");
    return 0;
}
