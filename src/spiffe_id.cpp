#include "spiffe_id.hpp"
#include <optional>

namespace svidsource {

namespace {

constexpr std::string_view k_scheme_prefix = "spiffe://";

bool is_trust_domain_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '.' || c == '-' || c == '_';
}

bool is_path_segment_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '_';
}

std::optional<error> validate_trust_domain_name(std::string_view name) {
    if (name.empty()) {
        return make_error(errc::invalid_argument, "trust domain is missing");
    }
    for (char c : name) {
        if (!is_trust_domain_char(c)) {
            return make_error(errc::invalid_argument,
                "trust domain characters are limited to lowercase letters, "
                "numbers, dots, dashes, and underscores");
        }
    }
    return std::nullopt;
}

std::optional<error> validate_path(std::string_view path) {
    if (path.empty()) return std::nullopt;
    if (path.front() != '/') {
        return make_error(errc::invalid_argument, "path must have a leading slash");
    }

    std::size_t pos = 0;
    while (pos < path.size()) {
        // path[pos] == '/'
        auto next = path.find('/', pos + 1);
        auto segment = path.substr(pos + 1, next == std::string_view::npos
                                                ? std::string_view::npos
                                                : next - pos - 1);
        if (segment.empty()) {
            if (next == std::string_view::npos) {
                return make_error(errc::invalid_argument, "path cannot have a trailing slash");
            }
            return make_error(errc::invalid_argument, "path cannot contain empty segments");
        }
        if (segment == "." || segment == "..") {
            return make_error(errc::invalid_argument, "path cannot contain dot segments");
        }
        for (char c : segment) {
            if (!is_path_segment_char(c)) {
                return make_error(errc::invalid_argument,
                    "path segment characters are limited to letters, numbers, "
                    "dots, dashes, and underscores");
            }
        }
        if (next == std::string_view::npos) break;
        pos = next;
    }
    return std::nullopt;
}

} // anonymous namespace

result<trust_domain> trust_domain::parse(std::string_view name) {
    // Looks like a SPIFFE ID: take its trust domain
    if (name.find(":/") != std::string_view::npos) {
        auto id = spiffe_id::parse(name);
        if (!id) return id.err();
        return id.value().member_of();
    }

    if (auto err = validate_trust_domain_name(name)) return *err;
    return trust_domain(std::string(name));
}

std::string trust_domain::id_string() const {
    return std::string(k_scheme_prefix) + m_name;
}

result<spiffe_id> spiffe_id::parse(std::string_view id) {
    if (id.empty()) {
        return make_error(errc::invalid_argument, "SPIFFE ID cannot be empty");
    }
    if (id.substr(0, k_scheme_prefix.size()) != k_scheme_prefix) {
        return make_error(errc::invalid_argument, "scheme is missing or invalid");
    }

    auto rest = id.substr(k_scheme_prefix.size());
    auto slash = rest.find('/');
    auto td_name = rest.substr(0, slash);
    auto path = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash);

    if (auto err = validate_trust_domain_name(td_name)) return *err;
    if (auto err = validate_path(path)) return *err;

    return spiffe_id(trust_domain(std::string(td_name)), std::string(path));
}

result<spiffe_id> spiffe_id::from_path(const trust_domain& td, std::string_view path) {
    if (auto err = validate_path(path)) return *err;
    return spiffe_id(td, std::string(path));
}

std::string spiffe_id::str() const {
    return m_trust_domain.id_string() + m_path;
}

} // namespace svidsource
