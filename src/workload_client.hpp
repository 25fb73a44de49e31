#pragma once

#include "address.hpp"
#include "errors.hpp"
#include "x509_types.hpp"
#include <cstdint>
#include <functional>
#include <memory>

namespace svidsource {

// Receives pushed X.509 context events from a workload_api_client.
// Calls for one subscription are delivered one at a time, in order.
class x509_context_watcher {
public:
    virtual ~x509_context_watcher() = default;

    virtual void on_update(x509_context update) = 0;

    // Fatal condition on the stream.
    virtual void on_error(error err) = 0;
};

using subscription_id = uint64_t;

// Transport to the Workload API. Implementations stream X.509 context
// updates from the endpoint to subscribed watchers.
class workload_api_client {
public:
    virtual ~workload_api_client() = default;

    // Begin delivering events asynchronously. The client keeps the watcher
    // alive until unsubscribe() returns.
    virtual subscription_id watch_x509_context(std::shared_ptr<x509_context_watcher> watcher) = 0;

    // Stop delivery. No events for the subscription start after this returns.
    virtual void unsubscribe(subscription_id id) = 0;
};

using workload_api_client_sptr = std::shared_ptr<workload_api_client>;

using client_factory = std::function<workload_api_client_sptr(const workload_endpoint&)>;

} // namespace svidsource
