#include "x509_source.hpp"
#include "address.hpp"
#include <exception>

namespace svidsource {

namespace {

error closed_error() {
    return make_error(errc::closed, "X.509 source is closed");
}

} // anonymous namespace

result<std::unique_ptr<x509_source>> x509_source::create(source_options options) {
    auto endpoint = resolve_endpoint(options.endpoint_address);
    if (!endpoint) return endpoint.err();

    if (!options.make_client) {
        return make_error(errc::configuration, "no workload API client factory configured");
    }

    auto address = to_string(endpoint.value());
    workload_api_client_sptr client;
    try {
        client = options.make_client(endpoint.value());
    } catch (const std::exception& e) {
        return make_error(errc::connection,
            "failed to create workload API client for " + address + ": " + e.what());
    }
    if (!client) {
        return make_error(errc::connection, "failed to create workload API client for " + address);
    }

    auto log = options.log ? options.log : spdlog::default_logger();
    log->info("Connecting to workload API at {}", address);
    return create(std::move(client), std::move(options));
}

result<std::unique_ptr<x509_source>> x509_source::create(workload_api_client_sptr client,
                                                         source_options options) {
    if (!client) {
        return make_error(errc::configuration, "workload API client must not be null");
    }

    std::unique_ptr<x509_source> source(new x509_source(std::move(client), std::move(options)));

    auto s = source->start();
    if (s.failed()) {
        source->close();
        return s.err();
    }

    return result<std::unique_ptr<x509_source>>(std::move(source));
}

x509_source::x509_source(workload_api_client_sptr client, source_options options)
    : m_client(std::move(client)),
      m_picker(options.picker ? std::move(options.picker) : make_default_picker()),
      m_init_timeout(options.init_timeout),
      m_error_policy(options.error_policy),
      m_log(options.log ? std::move(options.log) : spdlog::default_logger()),
      m_channel(std::make_shared<event_channel>())
{}

x509_source::~x509_source() {
    close();

    m_running.store(false);
    m_channel->push_stop();
    if (m_dispatcher.joinable()) m_dispatcher.join();
}

status x509_source::start() {
    auto init = m_init_promise.get_future();

    m_running.store(true);
    m_dispatcher = std::thread(&x509_source::dispatch_loop, this);

    subscription_id id = 0;
    try {
        id = m_client->watch_x509_context(std::make_shared<channel_watcher>(m_channel));
    } catch (const std::exception& e) {
        return make_error(errc::connection,
            std::string("failed to watch X.509 context: ") + e.what());
    }

    bool stored = false;
    {
        std::lock_guard<std::mutex> lock(m_write_mutex);
        if (!m_closed.load()) {
            m_subscription = id;
            stored = true;
        }
    }
    // Closed by an escalated error before we got the handle back
    if (!stored) m_client->unsubscribe(id);

    if (m_init_timeout) {
        if (init.wait_for(*m_init_timeout) != std::future_status::ready) {
            m_log->error("No X.509 context received within {}ms", m_init_timeout->count());
            return make_error(errc::timeout,
                "timed out after " + std::to_string(m_init_timeout->count()) +
                "ms waiting for the first X.509 context update");
        }
    }

    auto s = init.get();
    if (s.failed()) {
        return make_error(errc::connection,
            "X.509 source initialization failed: " + s.err().message);
    }
    return s;
}

void x509_source::dispatch_loop() {
    m_log->debug("X.509 source dispatcher started");

    watch_event ev;
    while (m_running.load(std::memory_order_relaxed)) {
        // Block with timeout to allow checking m_running
        if (!m_channel->wait_pop(ev, std::chrono::milliseconds(100))) continue;

        if (ev.type == watch_event::kind::stop) break;

        if (ev.type == watch_event::kind::update) {
            apply_update(ev.sequence, std::move(*ev.update));
        } else {
            handle_error(std::move(*ev.err));
        }
        ev = watch_event{};
    }

    m_log->debug("X.509 source dispatcher stopped");
}

void x509_source::apply_update(uint64_t sequence, x509_context update) {
    if (update.svids.empty()) {
        handle_error(make_error(errc::connection, "X.509 context update contains no SVIDs"));
        return;
    }

    std::optional<x509_svid> picked;
    try {
        picked = m_picker->pick(update.svids);
    } catch (const std::exception& e) {
        handle_error(make_error(errc::connection, std::string("SVID picker failed: ") + e.what()));
        return;
    }

    std::shared_ptr<const source_snapshot> published;
    {
        std::lock_guard<std::mutex> lock(m_write_mutex);
        if (m_closed.load()) return;

        if (sequence <= m_applied_sequence) {
            m_log->debug("Dropping stale X.509 context update {} (applied {})",
                        sequence, m_applied_sequence);
            return;
        }
        m_applied_sequence = sequence;

        published = std::make_shared<const source_snapshot>(
            source_snapshot{std::move(*picked), std::move(update.bundles), ++m_version});
        std::atomic_store(&m_snapshot, published);
    }

    m_log->debug("Applied X.509 context update {}: SVID '{}', {} bundles",
                published->version, published->svid.id().str(), published->bundles.size());

    if (!m_initialized.exchange(true)) {
        m_log->info("X.509 source ready");
        signal_init(status{});
    }
}

void x509_source::handle_error(error err) {
    if (!m_initialized.load()) {
        m_log->error("Workload API watch failed before the first update: {}", err.message);
        signal_init(std::move(err));
        return;
    }

    switch (m_error_policy) {
        case post_init_error_policy::keep_last_good:
            m_log->warn("Workload API watch error, keeping last X.509 context: {}", err.message);
            break;
        case post_init_error_policy::close:
            m_log->error("Workload API watch error, closing X.509 source: {}", err.message);
            close();
            break;
    }
}

void x509_source::signal_init(status s) {
    if (m_init_signalled.exchange(true)) return;
    m_init_promise.set_value(std::move(s));
}

void x509_source::close() {
    bool expected = false;
    if (!m_closed.compare_exchange_strong(expected, true)) return; // already closed

    std::optional<subscription_id> sub;
    {
        std::lock_guard<std::mutex> lock(m_write_mutex);
        std::atomic_store(&m_snapshot, std::shared_ptr<const source_snapshot>());
        sub.swap(m_subscription);
    }

    if (sub) m_client->unsubscribe(*sub);

    m_channel->close();
    m_log->info("X.509 source closed");
}

bool x509_source::is_closed() const {
    return m_closed.load();
}

result<std::shared_ptr<const source_snapshot>> x509_source::current() const {
    if (m_closed.load()) return closed_error();

    auto snap = std::atomic_load(&m_snapshot);
    if (!snap) return closed_error();
    return snap;
}

result<x509_svid> x509_source::get_x509_svid() const {
    auto snap = current();
    if (!snap) return snap.err();
    return snap.value()->svid;
}

result<x509_bundle> x509_source::get_x509_bundle_for_trust_domain(const trust_domain& td) const {
    auto snap = current();
    if (!snap) return snap.err();
    return snap.value()->bundles.get_bundle_for_trust_domain(td);
}

result<x509_bundle_set> x509_source::get_x509_bundle_set() const {
    auto snap = current();
    if (!snap) return snap.err();
    return snap.value()->bundles;
}

result<std::shared_ptr<const source_snapshot>> x509_source::get_snapshot() const {
    return current();
}

} // namespace svidsource
