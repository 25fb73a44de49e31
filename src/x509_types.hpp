#pragma once

#include "errors.hpp"
#include "spiffe_id.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace svidsource {

using der_bytes = std::vector<uint8_t>;

// X.509-SVID: certificate chain (leaf first) and private key bound to one
// SPIFFE ID. Certificate and key material is carried as DER, unparsed.
class x509_svid {
public:
    x509_svid(spiffe_id id, std::vector<der_bytes> chain, der_bytes private_key,
              std::string hint = {});

    const spiffe_id& id() const { return m_id; }
    const std::vector<der_bytes>& chain() const { return m_chain; }
    const der_bytes& leaf() const { return m_chain.front(); }
    const der_bytes& private_key() const { return m_private_key; }

    // Operator-assigned label distinguishing SVIDs with the same ID; may be empty.
    const std::string& hint() const { return m_hint; }

private:
    spiffe_id m_id;
    std::vector<der_bytes> m_chain;
    der_bytes m_private_key;
    std::string m_hint;
};

// Trusted X.509 root authorities of one trust domain.
class x509_bundle {
public:
    x509_bundle(trust_domain td, std::vector<der_bytes> authorities);

    const trust_domain& get_trust_domain() const { return m_trust_domain; }
    const std::vector<der_bytes>& authorities() const { return m_authorities; }
    bool has_authority(const der_bytes& authority) const;
    bool empty() const { return m_authorities.empty(); }

private:
    trust_domain m_trust_domain;
    std::vector<der_bytes> m_authorities;
};

// Bundles keyed by trust domain, one per domain.
class x509_bundle_set {
public:
    x509_bundle_set() = default;
    explicit x509_bundle_set(std::vector<x509_bundle> bundles);

    // Inserts or replaces the bundle of its trust domain.
    void add(x509_bundle bundle);

    bool has(const trust_domain& td) const;
    std::size_t size() const { return m_bundles.size(); }
    bool empty() const { return m_bundles.empty(); }

    result<x509_bundle> get_bundle_for_trust_domain(const trust_domain& td) const;

    std::vector<x509_bundle> bundles() const;

private:
    std::map<trust_domain, x509_bundle> m_bundles;
};

// The Workload API designates the first SVID of an update as the default.
// nullopt for an empty list.
std::optional<x509_svid> default_svid(const std::vector<x509_svid>& svids);

// One coherent refresh delivered by the Workload API: candidate SVIDs in
// delivery order plus the bundles valid alongside them.
struct x509_context {
    std::vector<x509_svid> svids;
    x509_bundle_set bundles;

    std::optional<x509_svid> default_svid() const;
};

} // namespace svidsource
