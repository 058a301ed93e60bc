#include "json_file_store.hpp"
#include <core/log.hpp>
#include <fstream>
#include <fmt/format.h>
#include <unistd.h>

// ── JsonFileKvStore ─────────────────────────────────────────

JsonFileKvStore::JsonFileKvStore(fs::path file, std::optional<fs::path> lock_file,
                                 int lock_timeout_ms)
    : path_(std::move(file)), lock_path_(std::move(lock_file)),
      lock_timeout_ms_(lock_timeout_ms) {}

JsonFileSession JsonFileKvStore::begin_session() const {
    std::optional<FileLock> lock;
    if (lock_path_) {
        lock.emplace(lock_path_->string(), lock_timeout_ms_);
        ktun_log(fmt::format("Store: acquired lock {}", lock_path_->string()));
    }
    return JsonFileSession(path_, std::move(lock));
}

// ── JsonFileSession ─────────────────────────────────────────

JsonFileSession::JsonFileSession(fs::path file, std::optional<FileLock> lock)
    : path_(std::move(file)), lock_(std::move(lock)) {}

JsonFileSession::JsonFileSession(JsonFileSession&& other) noexcept
    : path_(std::move(other.path_)), lock_(std::move(other.lock_)),
      data_(std::move(other.data_)), loaded_(other.loaded_), open_(other.open_) {
    other.loaded_ = false;
    other.open_ = false;
}

JsonFileSession::~JsonFileSession() {
    if (!open_) return;
    try {
        close();
    } catch (const std::exception& e) {
        ktun_log(fmt::format("Store: failed to flush {} on session end: {}",
                             path_.string(), e.what()));
    }
}

void JsonFileSession::close() {
    if (!open_) return;
    open_ = false;
    try {
        save();
    } catch (...) {
        data_ = nlohmann::json::object();
        loaded_ = false;
        if (lock_) lock_->release();
        throw;
    }
    data_ = nlohmann::json::object();
    loaded_ = false;
    if (lock_) {
        lock_->release();
        ktun_log(fmt::format("Store: released lock {}", lock_->path()));
    }
}

void JsonFileSession::ensure_open() const {
    if (!open_) {
        throw std::logic_error(fmt::format("Store session for {} is already closed", path_.string()));
    }
}

void JsonFileSession::load() {
    ensure_open();
    if (loaded_) return;

    if (fs::exists(path_)) {
        std::ifstream in(path_);
        if (!in) {
            throw std::runtime_error(fmt::format("Cannot read {}", path_.string()));
        }
        try {
            data_ = nlohmann::json::parse(in);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(fmt::format("Corrupt state file {}: {}", path_.string(), e.what()));
        }
        if (!data_.is_object()) {
            throw std::runtime_error(fmt::format("Corrupt state file {}: top level is not an object",
                                                 path_.string()));
        }
    } else {
        data_ = nlohmann::json::object();
    }
    loaded_ = true;
}

void JsonFileSession::save() {
    // Nothing was read, so nothing can have changed.
    if (!loaded_) return;

    if (path_.has_parent_path()) fs::create_directories(path_.parent_path());

    // Write to a sibling and rename so a crash never leaves half a document.
    fs::path tmp = path_;
    tmp += fmt::format(".{}.tmp", getpid());
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw std::runtime_error(fmt::format("Cannot write {}", tmp.string()));
        }
        out << data_.dump(2) << "\n";
        if (!out) {
            throw std::runtime_error(fmt::format("Short write to {}", tmp.string()));
        }
    }
    fs::rename(tmp, path_);
}

nlohmann::json JsonFileSession::get(const std::string& key) {
    load();
    auto it = data_.find(key);
    if (it == data_.end()) throw KeyNotFound(key);
    return *it;
}

void JsonFileSession::set(const std::string& key, nlohmann::json value) {
    load();
    data_[key] = std::move(value);
}

void JsonFileSession::remove(const std::string& key) {
    load();
    if (data_.erase(key) == 0) throw KeyNotFound(key);
}

std::vector<std::string> JsonFileSession::list() {
    load();
    std::vector<std::string> keys;
    keys.reserve(data_.size());
    for (auto it = data_.begin(); it != data_.end(); ++it) {
        keys.push_back(it.key());
    }
    return keys;
}

std::string JsonFileSession::describe() const {
    return path_.string();
}
