#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cascade {

// CascadeStore is the SQLite-backed key/value store that persists variables.
// One connection is shared by every thread; calls are serialized internally.
class CascadeStore {
public:
    // Opens $HOME/.local/share/cascade/cascade.db.
    CascadeStore();
    // Opens an explicit database file. ":memory:" gives a private in-memory store.
    explicit CascadeStore(const std::filesystem::path &dbPath);
    ~CascadeStore();

    CascadeStore(const CascadeStore &) = delete;
    CascadeStore &operator=(const CascadeStore &) = delete;

    // std::nullopt when the key does not exist.
    std::optional<std::string> get(const std::string &key) const;
    void set(const std::string &key, const std::string &value);

    std::vector<std::string> keysWithPrefix(const std::string &prefix) const;

    bool integrityCheck(std::string *message) const;

    static std::filesystem::path defaultPath();

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace cascade
