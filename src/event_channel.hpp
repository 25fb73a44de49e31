#pragma once

#include "errors.hpp"
#include "workload_client.hpp"
#include "x509_types.hpp"
#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace svidsource {

struct watch_event {
    enum class kind { update, error, stop };

    kind type = kind::stop;

    // Delivery order stamp, starting at 1. Zero for stop events.
    uint64_t sequence = 0;

    std::optional<x509_context> update;
    std::optional<error> err;
};

// Hand-off between the transport's callback thread(s) and the source's
// dispatcher thread. Producers never block. The queue is not size-limited:
// the watcher delivers one stream in order, and the dispatcher drains it
// until close(), after which pushes are discarded.
class event_channel {
public:
    void push_update(x509_context update);
    void push_error(error err);

    // Wakes the consumer and tells it to exit.
    void push_stop();

    // Drops every later update and error, then pushes a stop event.
    void close();
    bool is_closed() const { return m_closed.load(); }

    // Blocks up to timeout. Returns false if no event arrived.
    bool wait_pop(watch_event& ev, std::chrono::milliseconds timeout);

    std::size_t size_approx() const;

private:
    moodycamel::BlockingConcurrentQueue<watch_event> m_queue;
    std::atomic<uint64_t> m_next_sequence{1};
    std::atomic<bool> m_closed{false};
};

// Watcher installed on the client. Only enqueues, so the transport is never
// held up by snapshot publication, and late events after unsubscribe land in
// a channel nobody drains instead of a destroyed source.
class channel_watcher : public x509_context_watcher {
public:
    explicit channel_watcher(std::shared_ptr<event_channel> channel);

    void on_update(x509_context update) override;
    void on_error(error err) override;

private:
    std::shared_ptr<event_channel> m_channel;
};

} // namespace svidsource
