#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Simple associative storage from string keys to values.
// Not synchronized; owners that share it across threads must guard it.
template<typename Value>
class KeyedStore {
private:
    std::unordered_map<std::string, Value> data;

public:
    using value_type = Value;

    KeyedStore() = default;

    // Get the value stored under key, or defaultValue when the key is missing
    Value get(const std::string& key, const Value& defaultValue = Value()) const {
        auto it = data.find(key);
        if (it != data.end()) {
            return it->second;
        }
        return defaultValue;
    }

    // Insert or overwrite the value for key
    KeyedStore& set(const std::string& key, Value value) {
        data[key] = std::move(value);
        return *this;
    }

    bool has(const std::string& key) const {
        return data.find(key) != data.end();
    }

    // Remove the entry for key; missing keys are ignored
    KeyedStore& remove(const std::string& key) {
        data.erase(key);
        return *this;
    }

    KeyedStore& clear() {
        data.clear();
        return *this;
    }

    // Copy of every entry. Changes to the copy do not reach the store.
    std::unordered_map<std::string, Value> all() const {
        return data;
    }

    bool isEmpty() const {
        return data.empty();
    }

    size_t size() const {
        return data.size();
    }

    // Sorted list of keys
    std::vector<std::string> keys() const {
        std::vector<std::string> names;
        names.reserve(data.size());
        for (const auto& pair : data) {
            names.push_back(pair.first);
        }
        std::sort(names.begin(), names.end());
        return names;
    }
};
