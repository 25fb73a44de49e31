#pragma once

#include "errors.hpp"
#include "event_channel.hpp"
#include "source_snapshot.hpp"
#include "svid_picker.hpp"
#include "workload_client.hpp"
#include "x509_sources.hpp"
#include "x509_types.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace svidsource {

// What an x509_source does when the watcher reports an error after the
// first update has been applied.
enum class post_init_error_policy {
    keep_last_good,  // log and keep serving the last snapshot
    close            // close the source; accessors return errc::closed
};

struct source_options {
    // Workload API address; SPIFFE_ENDPOINT_SOCKET when unset.
    std::optional<std::string> endpoint_address;

    // Defaults to default_svid_picker.
    std::shared_ptr<const svid_picker> picker;

    // Builds the transport for the resolved endpoint.
    client_factory make_client;

    // Bound on create()'s wait for the first update; unbounded when unset.
    std::optional<std::chrono::milliseconds> init_timeout;

    post_init_error_policy error_policy = post_init_error_policy::keep_last_good;

    // Defaults to spdlog's default logger.
    std::shared_ptr<spdlog::logger> log;
};

// Source of X.509-SVIDs and bundles kept current by a Workload API watch.
//
// create() blocks until the first update (or a failure) arrives. After that
// every update published by the watcher replaces the served snapshot as a
// whole; readers never see the SVID of one update with the bundles of
// another. All accessors are safe to call concurrently, and fail with
// errc::closed once close() has been called.
class x509_source : public x509_svid_source, public x509_bundle_source {
public:
    static result<std::unique_ptr<x509_source>> create(source_options options);

    // Uses an existing client; endpoint_address and make_client are ignored.
    static result<std::unique_ptr<x509_source>> create(workload_api_client_sptr client,
                                                       source_options options);

    ~x509_source() override;

    x509_source(const x509_source&) = delete;
    x509_source& operator=(const x509_source&) = delete;

    result<x509_svid> get_x509_svid() const override;

    // errc::closed if closed, errc::not_found if no bundle for the domain.
    result<x509_bundle> get_x509_bundle_for_trust_domain(const trust_domain& td) const override;

    result<x509_bundle_set> get_x509_bundle_set() const;

    // SVID and bundles of one update, with the update count.
    result<std::shared_ptr<const source_snapshot>> get_snapshot() const;

    // Idempotent and thread-safe; exactly one call unsubscribes.
    void close();

    bool is_closed() const;

private:
    x509_source(workload_api_client_sptr client, source_options options);

    // Subscribe and wait for the first update.
    status start();

    void dispatch_loop();
    void apply_update(uint64_t sequence, x509_context update);
    void handle_error(error err);
    void signal_init(status s);

    result<std::shared_ptr<const source_snapshot>> current() const;

    workload_api_client_sptr m_client;
    std::shared_ptr<const svid_picker> m_picker;
    std::optional<std::chrono::milliseconds> m_init_timeout;
    post_init_error_policy m_error_policy;
    std::shared_ptr<spdlog::logger> m_log;

    std::shared_ptr<event_channel> m_channel;
    std::thread m_dispatcher;
    std::atomic<bool> m_running{false};

    // Serializes snapshot publication and close teardown.
    std::mutex m_write_mutex;

    // Current snapshot; atomic load/store for lock-free readers.
    // Null before the first update and after close.
    std::shared_ptr<const source_snapshot> m_snapshot;

    // Protected by m_write_mutex
    uint64_t m_applied_sequence = 0;
    uint64_t m_version = 0;
    std::optional<subscription_id> m_subscription;

    std::atomic<bool> m_closed{false};
    std::atomic<bool> m_initialized{false};

    // Single-use init gate
    std::atomic<bool> m_init_signalled{false};
    std::promise<status> m_init_promise;
};

} // namespace svidsource
