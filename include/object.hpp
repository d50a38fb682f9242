#pragma once

#include "keyed_store.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Generic Object base class that can be inherited
class Object {
public:
    Object();
    virtual ~Object();

    // Virtual method for runtime type identification
    virtual std::string getType() const;

    // Virtual method that derived classes can override
    virtual void display() const;
};

using ObjectPtr = std::shared_ptr<Object>;

// Process-wide registry mapping names to shared objects
class ObjectRegistry {
private:
    KeyedStore<ObjectPtr> objects;
    mutable std::mutex registryMutex;

    // Private constructor for singleton
    ObjectRegistry();

public:
    // Delete copy constructor and assignment operator
    ObjectRegistry(const ObjectRegistry&) = delete;
    ObjectRegistry& operator=(const ObjectRegistry&) = delete;

    // Static method to get the singleton instance
    static ObjectRegistry& getInstance();

    // Register an object with a name, replacing any previous one
    void registerObject(const std::string& name, ObjectPtr obj);

    // Get an object by name, nullptr when missing
    ObjectPtr getObject(const std::string& name) const;

    // Get an object by name downcast to T, nullptr when missing or of another type
    template<typename T>
    std::shared_ptr<T> getObjectAs(const std::string& name) const {
        return std::dynamic_pointer_cast<T>(getObject(name));
    }

    // Remove an object by name; returns whether it was registered
    bool removeObject(const std::string& name);

    bool hasObject(const std::string& name) const;

    // Registered names in sorted order
    std::vector<std::string> getObjectNames() const;

    void clear();

    size_t size() const;

    bool isEmpty() const;
};
