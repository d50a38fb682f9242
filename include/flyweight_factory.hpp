#pragma once

#include "context.hpp"
#include "keyed_store.hpp"
#include "logger.hpp"
#include "object.hpp"

#include <atomic>
#include <exception>
#include <fmt/core.h>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

// Raised when a flyweight cannot be built for an identifier
class ConstructionError : public std::runtime_error {
private:
    std::string identifierName;

public:
    ConstructionError(const std::string& identifier, const std::string& reason);

    const std::string& identifier() const { return identifierName; }
};

// Cache key for (identifier, context): the quoted identifier, a colon, and
// the canonical form of the context. Context entry order does not matter.
std::string deriveFlyweightKey(const std::string& identifier, const Context& context);

// Flyweight factory capability. Concrete factories implement construct();
// acquire() hands out one shared instance per distinct (identifier, context).
//
// acquire() is thread-safe. At most one construct() runs per derived key at
// a time, and unrelated keys construct concurrently. construct() must not
// acquire its own key.
template<typename Value>
class FlyweightFactory : public Object {
public:
    using value_type = Value;
    using ValuePtr = std::shared_ptr<Value>;

private:
    // Serializes construction of one derived key. users counts the threads
    // holding or waiting on mutex and is only touched under cacheMutex.
    struct KeyLock {
        std::mutex mutex;
        size_t users = 0;
    };

    // Registers the caller on a key's lock for its lifetime; the last user
    // out removes the entry. Must outlive any guard on the key mutex.
    class KeyLockLease {
    private:
        FlyweightFactory& factory;
        std::string key;
        std::shared_ptr<KeyLock> keyLock;

    public:
        KeyLockLease(FlyweightFactory& owner, const std::string& derivedKey)
            : factory(owner), key(derivedKey) {
            std::lock_guard<std::mutex> lock(factory.cacheMutex);
            auto& slot = factory.keyLocks[key];
            if (!slot) {
                slot = std::make_shared<KeyLock>();
            }
            ++slot->users;
            keyLock = slot;
        }

        ~KeyLockLease() {
            std::lock_guard<std::mutex> lock(factory.cacheMutex);
            if (--keyLock->users == 0) {
                factory.keyLocks.erase(key);
            }
        }

        KeyLockLease(const KeyLockLease&) = delete;
        KeyLockLease& operator=(const KeyLockLease&) = delete;

        std::mutex& mutex() { return keyLock->mutex; }
    };

    std::string factoryName;
    KeyedStore<ValuePtr> cache;
    // Present only while some thread holds or waits on the key
    std::unordered_map<std::string, std::shared_ptr<KeyLock>> keyLocks;
    mutable std::mutex cacheMutex;
    std::shared_ptr<Logger> logger;

    // Statistics
    std::atomic<size_t> hitCount{0};
    std::atomic<size_t> constructionCount{0};
    std::atomic<size_t> failureCount{0};

    bool lookup(const std::string& key, ValuePtr& out) const {
        std::lock_guard<std::mutex> lock(cacheMutex);
        if (!cache.has(key)) {
            return false;
        }
        out = cache.get(key);
        return true;
    }

    ValuePtr hit(const std::string& key, ValuePtr value) {
        hitCount.fetch_add(1);
        if (logger) {
            logger->debug("{}: cache hit for {}", factoryName, key);
        }
        return value;
    }

protected:
    // Build a new value for identifier/context. Throw (conventionally
    // ConstructionError) when the identifier cannot be produced.
    virtual ValuePtr construct(const std::string& identifier, const Context& context) = 0;

public:
    explicit FlyweightFactory(const std::string& name = "FlyweightFactory")
        : factoryName(name) {}

    ~FlyweightFactory() override = default;

    FlyweightFactory(const FlyweightFactory&) = delete;
    FlyweightFactory& operator=(const FlyweightFactory&) = delete;

    // Return the shared instance for (identifier, context), constructing it
    // on first use. Exceptions from construct() reach the caller unchanged
    // and nothing is cached for the key.
    ValuePtr acquire(const std::string& identifier, const Context& context = Context()) {
        const std::string key = deriveFlyweightKey(identifier, context);

        ValuePtr cached;
        if (lookup(key, cached)) {
            return hit(key, std::move(cached));
        }

        KeyLockLease lease(*this, key);
        std::lock_guard<std::mutex> keyGuard(lease.mutex());

        // Another thread may have finished the key while we waited
        if (lookup(key, cached)) {
            return hit(key, std::move(cached));
        }

        ValuePtr instance;
        try {
            instance = construct(identifier, context);
            if (!instance) {
                throw ConstructionError(identifier, "construct produced no instance");
            }
        } catch (const std::exception& e) {
            failureCount.fetch_add(1);
            if (logger) {
                logger->warn("{}: construction of '{}' failed: {}", factoryName, identifier, e.what());
            }
            throw;
        } catch (...) {
            failureCount.fetch_add(1);
            throw;
        }

        {
            std::lock_guard<std::mutex> lock(cacheMutex);
            cache.set(key, instance);
        }
        constructionCount.fetch_add(1);
        if (logger) {
            logger->info("{}: constructed '{}' as {}", factoryName, identifier, key);
        }
        return instance;
    }

    // Cache management
    bool isCached(const std::string& identifier, const Context& context = Context()) const {
        std::lock_guard<std::mutex> lock(cacheMutex);
        return cache.has(deriveFlyweightKey(identifier, context));
    }

    // Remove one cached instance; returns whether it was cached
    bool forget(const std::string& identifier, const Context& context = Context()) {
        const std::string key = deriveFlyweightKey(identifier, context);
        std::lock_guard<std::mutex> lock(cacheMutex);
        if (!cache.has(key)) {
            return false;
        }
        cache.remove(key);
        return true;
    }

    void clearCache() {
        std::lock_guard<std::mutex> lock(cacheMutex);
        cache.clear();
    }

    size_t cacheSize() const {
        std::lock_guard<std::mutex> lock(cacheMutex);
        return cache.size();
    }

    std::vector<std::string> cachedKeys() const {
        std::lock_guard<std::mutex> lock(cacheMutex);
        return cache.keys();
    }

    // Keys currently being built or waited on
    size_t pendingKeyLocks() const {
        std::lock_guard<std::mutex> lock(cacheMutex);
        return keyLocks.size();
    }

    // Configuration
    void setLogger(std::shared_ptr<Logger> newLogger) { logger = std::move(newLogger); }
    const std::string& getName() const { return factoryName; }

    // Statistics
    size_t getHitCount() const { return hitCount.load(); }
    size_t getConstructionCount() const { return constructionCount.load(); }
    size_t getFailureCount() const { return failureCount.load(); }

    void printStatistics() const {
        fmt::print("{}: {} cached, {} hits, {} constructions, {} failures\n",
                   factoryName, cacheSize(), getHitCount(), getConstructionCount(), getFailureCount());
    }

    // Override Object methods
    std::string getType() const override { return "FlyweightFactory"; }
    void display() const override { printStatistics(); }
};

// Flyweight factory whose construct() dispatches through a table of
// producers registered per identifier. Unknown identifiers raise
// ConstructionError.
template<typename Value>
class RegisteredFlyweightFactory : public FlyweightFactory<Value> {
public:
    using ValuePtr = typename FlyweightFactory<Value>::ValuePtr;
    using Producer = std::function<ValuePtr(const Context&)>;

private:
    KeyedStore<Producer> producers;
    mutable std::mutex producerMutex;

protected:
    ValuePtr construct(const std::string& identifier, const Context& context) override {
        Producer producer;
        {
            std::lock_guard<std::mutex> lock(producerMutex);
            producer = producers.get(identifier);
        }
        if (!producer) {
            throw ConstructionError(identifier, "no producer registered");
        }
        return producer(context);
    }

public:
    explicit RegisteredFlyweightFactory(const std::string& name = "RegisteredFlyweightFactory")
        : FlyweightFactory<Value>(name) {}

    RegisteredFlyweightFactory& registerProducer(const std::string& identifier, Producer producer) {
        if (!producer) {
            throw std::invalid_argument("Producer for '" + identifier + "' must not be empty");
        }
        std::lock_guard<std::mutex> lock(producerMutex);
        producers.set(identifier, std::move(producer));
        return *this;
    }

    // Register T under identifier, built from the context when T accepts one
    template<typename T>
    RegisteredFlyweightFactory& registerType(const std::string& identifier) {
        static_assert(std::is_convertible_v<T*, Value*>, "T must derive from the factory value type");
        return registerProducer(identifier, [](const Context& context) -> ValuePtr {
            if constexpr (std::is_constructible_v<T, const Context&>) {
                return std::make_shared<T>(context);
            } else {
                (void)context;
                return std::make_shared<T>();
            }
        });
    }

    bool hasProducer(const std::string& identifier) const {
        std::lock_guard<std::mutex> lock(producerMutex);
        return producers.has(identifier);
    }

    RegisteredFlyweightFactory& removeProducer(const std::string& identifier) {
        std::lock_guard<std::mutex> lock(producerMutex);
        producers.remove(identifier);
        return *this;
    }

    std::vector<std::string> producerNames() const {
        std::lock_guard<std::mutex> lock(producerMutex);
        return producers.keys();
    }

    std::string getType() const override { return "RegisteredFlyweightFactory"; }
};
