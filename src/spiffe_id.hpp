#pragma once

#include "errors.hpp"
#include <functional>
#include <string>
#include <string_view>

namespace svidsource {

// Administrative namespace of a set of workloads, e.g. "example.org".
class trust_domain {
public:
    // Accepts a bare name ("example.org") or a SPIFFE ID, in which case the
    // trust domain of the ID is returned.
    static result<trust_domain> parse(std::string_view name);

    const std::string& name() const { return m_name; }

    // "spiffe://<name>"
    std::string id_string() const;

    bool operator==(const trust_domain& other) const { return m_name == other.m_name; }
    bool operator!=(const trust_domain& other) const { return m_name != other.m_name; }
    bool operator<(const trust_domain& other) const { return m_name < other.m_name; }

private:
    friend class spiffe_id;

    explicit trust_domain(std::string name) : m_name(std::move(name)) {}

    std::string m_name;
};

// Workload identity: spiffe://<trust-domain>[/path/segments]
class spiffe_id {
public:
    static result<spiffe_id> parse(std::string_view id);

    // Builds an ID from a trust domain and a path ("" or "/seg/seg").
    static result<spiffe_id> from_path(const trust_domain& td, std::string_view path);

    const trust_domain& member_of() const { return m_trust_domain; }
    const std::string& path() const { return m_path; }
    std::string str() const;

    bool operator==(const spiffe_id& other) const {
        return m_trust_domain == other.m_trust_domain && m_path == other.m_path;
    }
    bool operator!=(const spiffe_id& other) const { return !(*this == other); }

private:
    spiffe_id(trust_domain td, std::string path)
        : m_trust_domain(std::move(td)), m_path(std::move(path)) {}

    trust_domain m_trust_domain;
    std::string m_path;
};

} // namespace svidsource

template <>
struct std::hash<svidsource::trust_domain> {
    std::size_t operator()(const svidsource::trust_domain& td) const noexcept {
        return std::hash<std::string>{}(td.name());
    }
};
