#include "svid_picker.hpp"
#include <stdexcept>

namespace svidsource {

x509_svid default_svid_picker::pick(const std::vector<x509_svid>& candidates) const {
    return *default_svid(candidates);
}

hint_svid_picker::hint_svid_picker(std::string hint)
    : m_hint(std::move(hint))
{}

x509_svid hint_svid_picker::pick(const std::vector<x509_svid>& candidates) const {
    for (const auto& svid : candidates) {
        if (svid.hint() == m_hint) return svid;
    }
    return *default_svid(candidates);
}

function_svid_picker::function_svid_picker(pick_fn fn)
    : m_fn(std::move(fn))
{
    if (!m_fn) throw std::invalid_argument("function_svid_picker: empty function");
}

x509_svid function_svid_picker::pick(const std::vector<x509_svid>& candidates) const {
    return m_fn(candidates);
}

std::shared_ptr<const svid_picker> make_default_picker() {
    return std::make_shared<const default_svid_picker>();
}

} // namespace svidsource
