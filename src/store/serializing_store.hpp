#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include "kv_store.hpp"

// Typed view over a KvStore. T must be convertible to and from
// nlohmann::json (to_json/from_json found by ADL). Same contracts as
// KvStore: get() on a missing key throws KeyNotFound.
template <typename T>
class SerializingStore {
public:
    explicit SerializingStore(KvStore& store) : store_(store) {}

    T get(const std::string& key) {
        nlohmann::json raw = store_.get(key);
        try {
            return raw.get<T>();
        } catch (const std::exception& e) {
            throw std::runtime_error(fmt::format("Cannot decode '{}' from {}: {}",
                                                 key, store_.describe(), e.what()));
        }
    }

    void set(const std::string& key, const T& value) {
        store_.set(key, nlohmann::json(value));
    }

    void remove(const std::string& key) { store_.remove(key); }

    std::vector<std::string> list() { return store_.list(); }

private:
    KvStore& store_;
};
