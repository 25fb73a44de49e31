#include "x509_types.hpp"
#include <algorithm>
#include <stdexcept>

namespace svidsource {

x509_svid::x509_svid(spiffe_id id, std::vector<der_bytes> chain,
                     der_bytes private_key, std::string hint)
    : m_id(std::move(id)), m_chain(std::move(chain)),
      m_private_key(std::move(private_key)), m_hint(std::move(hint))
{
    if (m_chain.empty()) {
        throw std::invalid_argument("x509_svid: certificate chain must not be empty");
    }
}

x509_bundle::x509_bundle(trust_domain td, std::vector<der_bytes> authorities)
    : m_trust_domain(std::move(td)), m_authorities(std::move(authorities))
{}

bool x509_bundle::has_authority(const der_bytes& authority) const {
    return std::find(m_authorities.begin(), m_authorities.end(), authority)
        != m_authorities.end();
}

x509_bundle_set::x509_bundle_set(std::vector<x509_bundle> bundles) {
    for (auto& b : bundles) {
        add(std::move(b));
    }
}

void x509_bundle_set::add(x509_bundle bundle) {
    auto td = bundle.get_trust_domain();
    auto it = m_bundles.find(td);
    if (it != m_bundles.end()) {
        it->second = std::move(bundle);
        return;
    }
    m_bundles.emplace(std::move(td), std::move(bundle));
}

bool x509_bundle_set::has(const trust_domain& td) const {
    return m_bundles.find(td) != m_bundles.end();
}

result<x509_bundle> x509_bundle_set::get_bundle_for_trust_domain(const trust_domain& td) const {
    auto it = m_bundles.find(td);
    if (it == m_bundles.end()) {
        return make_error(errc::not_found,
            "no X.509 bundle for trust domain \"" + td.name() + "\"");
    }
    return it->second;
}

std::vector<x509_bundle> x509_bundle_set::bundles() const {
    std::vector<x509_bundle> out;
    out.reserve(m_bundles.size());
    for (const auto& [td, bundle] : m_bundles) {
        out.push_back(bundle);
    }
    return out;
}

std::optional<x509_svid> default_svid(const std::vector<x509_svid>& svids) {
    if (svids.empty()) return std::nullopt;
    return svids.front();
}

std::optional<x509_svid> x509_context::default_svid() const {
    return svidsource::default_svid(svids);
}

} // namespace svidsource
