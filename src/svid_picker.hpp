#pragma once

#include "x509_types.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace svidsource {

// Chooses the SVID an x509_source serves from the candidates of one update.
// pick() is only called with a non-empty candidate list.
class svid_picker {
public:
    virtual ~svid_picker() = default;
    virtual x509_svid pick(const std::vector<x509_svid>& candidates) const = 0;
};

// The Workload API's default SVID: the first candidate in delivery order.
class default_svid_picker : public svid_picker {
public:
    x509_svid pick(const std::vector<x509_svid>& candidates) const override;
};

// First candidate whose hint matches, falling back to the default SVID.
class hint_svid_picker : public svid_picker {
public:
    explicit hint_svid_picker(std::string hint);
    x509_svid pick(const std::vector<x509_svid>& candidates) const override;

    const std::string& hint() const { return m_hint; }

private:
    std::string m_hint;
};

class function_svid_picker : public svid_picker {
public:
    using pick_fn = std::function<x509_svid(const std::vector<x509_svid>&)>;

    explicit function_svid_picker(pick_fn fn);
    x509_svid pick(const std::vector<x509_svid>& candidates) const override;

private:
    pick_fn m_fn;
};

std::shared_ptr<const svid_picker> make_default_picker();

} // namespace svidsource
