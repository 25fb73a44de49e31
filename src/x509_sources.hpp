#pragma once

#include "errors.hpp"
#include "spiffe_id.hpp"
#include "x509_types.hpp"

namespace svidsource {

// Anything that can hand out the current X.509-SVID, e.g. for TLS client or
// server setup.
class x509_svid_source {
public:
    virtual ~x509_svid_source() = default;
    virtual result<x509_svid> get_x509_svid() const = 0;
};

// Anything that can hand out the X.509 bundle of a trust domain, e.g. for
// peer certificate verification.
class x509_bundle_source {
public:
    virtual ~x509_bundle_source() = default;

    // errc::not_found if there is no bundle for the domain.
    virtual result<x509_bundle> get_x509_bundle_for_trust_domain(const trust_domain& td) const = 0;
};

} // namespace svidsource
