#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "daemon/cascade_store.hpp"
#include "daemon/change_channel.hpp"
#include "script/errors.hpp"
#include "script/value.hpp"

namespace cascade {

class VariableError : public script::ScriptError {
public:
    explicit VariableError(const std::string &message)
        : script::ScriptError(message)
    {
    }
};

class UndefinedVariableError : public VariableError {
public:
    explicit UndefinedVariableError(const std::string &name)
        : VariableError("undefined symbol: " + name)
    {
    }
};

// The stored record exists but cannot be turned back into a value.
class DecodeError : public VariableError {
public:
    explicit DecodeError(const std::string &message)
        : VariableError(message)
    {
    }
};

// VariableManager mediates every variable read and write against the store.
// Writes that change a value are persisted, cached, and then handed to the
// change channel; the writer blocks until the dispatch loop takes the event.
class VariableManager {
public:
    explicit VariableManager(CascadeStore &store);

    VariableManager(const VariableManager &) = delete;
    VariableManager &operator=(const VariableManager &) = delete;

    script::Value get(const std::string &name);
    void set(const std::string &name, const script::Value &value);

    ChangeChannel &updates();

    // Storage key of a variable. Names are never prefixed anywhere else.
    static std::string storageKey(const std::string &name);
    static const std::string &storagePrefix();

    static std::string encodeRecord(const script::Value &value);
    static script::Value decodeRecord(const std::string &record);

private:
    // Caller must hold m_mutex.
    bool lookupLocked(const std::string &name, script::Value *value);

    CascadeStore &m_store;
    ChangeChannel m_updates;

    std::mutex m_mutex;
    std::unordered_map<std::string, script::Value> m_cache;
};

} // namespace cascade
