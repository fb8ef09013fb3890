#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "script/value.hpp"

namespace cascade {

struct ChangeEvent {
    std::string name;
    script::Value value;
};

// Unbuffered hand-off between variable writers and the dispatch loop.
// send() returns only once a receiver has taken the event, so at most one
// event is ever outstanding. After close() both ends stop blocking.
class ChangeChannel {
public:
    // Blocks until the event is received. Returns false if the channel was
    // closed before that happened.
    bool send(ChangeEvent event)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_senderCv.wait(lock, [this] { return m_closed || !m_slot.has_value(); });
        if (m_closed) {
            return false;
        }

        m_slot = std::move(event);
        const std::uint64_t ticket = ++m_sent;
        m_receiverCv.notify_one();

        m_senderCv.wait(lock, [this, ticket] { return m_closed || m_received >= ticket; });
        return m_received >= ticket;
    }

    // Blocks until an event arrives. std::nullopt once the channel is closed.
    std::optional<ChangeEvent> receive()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_receiverCv.wait(lock, [this] { return m_closed || m_slot.has_value(); });
        if (m_closed) {
            return std::nullopt;
        }

        std::optional<ChangeEvent> event = std::move(m_slot);
        m_slot.reset();
        ++m_received;
        m_senderCv.notify_all();
        return event;
    }

    void close()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        m_slot.reset();
        m_senderCv.notify_all();
        m_receiverCv.notify_all();
    }

    bool isClosed() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_senderCv;
    std::condition_variable m_receiverCv;
    std::optional<ChangeEvent> m_slot;
    std::uint64_t m_sent = 0;
    std::uint64_t m_received = 0;
    bool m_closed = false;
};

} // namespace cascade
