#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <platform/file_lock.hpp>
#include "kv_store.hpp"

namespace fs = std::filesystem;

class JsonFileSession;

// A key-value store persisted as a single JSON object in one file.
//
// All access goes through a JsonFileSession obtained from begin_session().
// When a lock file is configured, beginning a session takes an exclusive
// advisory lock on it (bounded wait, then LockTimeout). The document is read
// lazily on first access inside the session and written back when the session
// closes; the cached copy dies with the session, so every session re-reads
// whatever another process last wrote.
class JsonFileKvStore {
public:
    JsonFileKvStore(fs::path file, std::optional<fs::path> lock_file,
                    int lock_timeout_ms);

    JsonFileSession begin_session() const;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    std::optional<fs::path> lock_path_;
    int lock_timeout_ms_;
};

// One locked unit of work against a JsonFileKvStore. Move-only.
class JsonFileSession : public KvStore {
public:
    ~JsonFileSession() override;

    JsonFileSession(JsonFileSession&& other) noexcept;
    JsonFileSession& operator=(JsonFileSession&&) = delete;
    JsonFileSession(const JsonFileSession&) = delete;
    JsonFileSession& operator=(const JsonFileSession&) = delete;

    nlohmann::json get(const std::string& key) override;
    void set(const std::string& key, nlohmann::json value) override;
    void remove(const std::string& key) override;
    std::vector<std::string> list() override;
    std::string describe() const override;

    // Flush the document (if it was loaded) and release the lock.
    // Any later operation on this session throws std::logic_error.
    void close();
    bool is_open() const { return open_; }

private:
    friend class JsonFileKvStore;
    JsonFileSession(fs::path file, std::optional<FileLock> lock);

    void ensure_open() const;
    void load();
    void save();

    fs::path path_;
    std::optional<FileLock> lock_;
    nlohmann::json data_ = nlohmann::json::object();
    bool loaded_ = false;
    bool open_ = true;
};
