#include "daemon/variable_manager.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace cascade {

namespace {

const std::string kVarPrefix = "var~";

} // namespace

VariableManager::VariableManager(CascadeStore &store)
    : m_store(store)
{
}

const std::string &VariableManager::storagePrefix()
{
    return kVarPrefix;
}

std::string VariableManager::storageKey(const std::string &name)
{
    return kVarPrefix + name;
}

std::string VariableManager::encodeRecord(const script::Value &value)
{
    try {
        return nlohmann::json{{"value", value}}.dump();
    } catch (const std::invalid_argument &error) {
        throw VariableError(error.what());
    }
}

script::Value VariableManager::decodeRecord(const std::string &record)
{
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(record);
    } catch (const nlohmann::json::parse_error &error) {
        throw DecodeError(std::string("malformed variable record: ") + error.what());
    }

    if (!parsed.is_object()) {
        throw DecodeError("variable record is not an object");
    }
    auto it = parsed.find("value");
    if (it == parsed.end()) {
        throw DecodeError("variable record has no value field");
    }

    try {
        return it->get<script::Value>();
    } catch (const std::invalid_argument &error) {
        throw DecodeError(error.what());
    }
}

script::Value VariableManager::get(const std::string &name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    script::Value value;
    if (!lookupLocked(name, &value)) {
        throw UndefinedVariableError(name);
    }
    return value;
}

void VariableManager::set(const std::string &name, const script::Value &value)
{
    if (!value.isPersistable()) {
        throw VariableError("cannot store a " + std::string(value.typeName())
                            + " value in variable " + name);
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        script::Value current;
        bool exists = false;
        try {
            exists = lookupLocked(name, &current);
        } catch (const DecodeError &) {
            // An unreadable record is simply replaced.
            exists = false;
        }
        if (exists && current == value) {
            return;
        }

        // Persist before publishing so a woken consumer reads the new value.
        m_store.set(storageKey(name), encodeRecord(value));
        m_cache[name] = value;
    }

    CLOG_TRACE(QStringLiteral("VariableManager"),
               QStringLiteral("set"),
               QStringLiteral("variable_changed"),
               QStringLiteral("value_differs"),
               (nlohmann::json{{"name", name}, {"value", value.toString()}}));

    if (!m_updates.send(ChangeEvent{name, value})) {
        CLOG_TRACE(QStringLiteral("VariableManager"),
                   QStringLiteral("set"),
                   QStringLiteral("change_not_published"),
                   QStringLiteral("channel_closed"),
                   (nlohmann::json{{"name", name}}));
    }
}

ChangeChannel &VariableManager::updates()
{
    return m_updates;
}

bool VariableManager::lookupLocked(const std::string &name, script::Value *value)
{
    auto cached = m_cache.find(name);
    if (cached != m_cache.end()) {
        *value = cached->second;
        return true;
    }

    const auto record = m_store.get(storageKey(name));
    if (!record) {
        return false;
    }

    try {
        *value = decodeRecord(*record);
    } catch (const DecodeError &error) {
        throw DecodeError("variable " + name + ": " + error.what());
    }
    return true;
}

} // namespace cascade
