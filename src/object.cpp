#include "object.hpp"

#include <fmt/core.h>

// Object class implementation
Object::Object() = default;

Object::~Object() = default;

std::string Object::getType() const {
    return "Object";
}

void Object::display() const {
    fmt::print("Generic Object\n");
}

// ObjectRegistry class implementation
ObjectRegistry::ObjectRegistry() = default;

ObjectRegistry& ObjectRegistry::getInstance() {
    static ObjectRegistry instance;
    return instance;
}

void ObjectRegistry::registerObject(const std::string& name, ObjectPtr obj) {
    std::lock_guard<std::mutex> lock(registryMutex);
    objects.set(name, std::move(obj));
}

ObjectPtr ObjectRegistry::getObject(const std::string& name) const {
    std::lock_guard<std::mutex> lock(registryMutex);
    return objects.get(name, nullptr);
}

bool ObjectRegistry::removeObject(const std::string& name) {
    std::lock_guard<std::mutex> lock(registryMutex);
    if (!objects.has(name)) {
        return false;
    }
    objects.remove(name);
    return true;
}

bool ObjectRegistry::hasObject(const std::string& name) const {
    std::lock_guard<std::mutex> lock(registryMutex);
    return objects.has(name);
}

std::vector<std::string> ObjectRegistry::getObjectNames() const {
    std::lock_guard<std::mutex> lock(registryMutex);
    return objects.keys();
}

void ObjectRegistry::clear() {
    std::lock_guard<std::mutex> lock(registryMutex);
    objects.clear();
}

size_t ObjectRegistry::size() const {
    std::lock_guard<std::mutex> lock(registryMutex);
    return objects.size();
}

bool ObjectRegistry::isEmpty() const {
    std::lock_guard<std::mutex> lock(registryMutex);
    return objects.isEmpty();
}
