#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

// Raised by KvStore::get/remove for a key that is not present.
class KeyNotFound : public std::out_of_range {
public:
    explicit KeyNotFound(const std::string& key)
        : std::out_of_range("Key not found: " + key), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// Key-value mapping of JSON-safe values.
class KvStore {
public:
    virtual ~KvStore() = default;

    // Throws KeyNotFound if absent.
    virtual nlohmann::json get(const std::string& key) = 0;
    virtual void set(const std::string& key, nlohmann::json value) = 0;
    // Throws KeyNotFound if absent.
    virtual void remove(const std::string& key) = 0;
    // Keys in no particular order.
    virtual std::vector<std::string> list() = 0;

    // Human-readable origin, used in error messages.
    virtual std::string describe() const = 0;
};
