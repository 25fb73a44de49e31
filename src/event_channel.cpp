#include "event_channel.hpp"

namespace svidsource {

void event_channel::push_update(x509_context update) {
    if (m_closed.load()) return;
    watch_event ev;
    ev.type = watch_event::kind::update;
    ev.sequence = m_next_sequence.fetch_add(1);
    ev.update = std::move(update);
    m_queue.enqueue(std::move(ev));
}

void event_channel::push_error(error err) {
    if (m_closed.load()) return;
    watch_event ev;
    ev.type = watch_event::kind::error;
    ev.sequence = m_next_sequence.fetch_add(1);
    ev.err = std::move(err);
    m_queue.enqueue(std::move(ev));
}

void event_channel::push_stop() {
    m_queue.enqueue(watch_event{});
}

void event_channel::close() {
    if (m_closed.exchange(true)) return;
    push_stop();
}

bool event_channel::wait_pop(watch_event& ev, std::chrono::milliseconds timeout) {
    return m_queue.wait_dequeue_timed(ev, timeout);
}

std::size_t event_channel::size_approx() const {
    return m_queue.size_approx();
}

channel_watcher::channel_watcher(std::shared_ptr<event_channel> channel)
    : m_channel(std::move(channel))
{}

void channel_watcher::on_update(x509_context update) {
    m_channel->push_update(std::move(update));
}

void channel_watcher::on_error(error err) {
    m_channel->push_error(std::move(err));
}

} // namespace svidsource
