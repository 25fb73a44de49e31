#pragma once

#include <string>
#include <utility>
#include <variant>

namespace svidsource {

enum class errc {
    configuration,    // malformed or unresolvable endpoint / missing client
    connection,       // watcher failed before the first update
    closed,           // accessor called after close()
    not_found,        // no bundle for the requested trust domain
    timeout,          // no first update within init_timeout
    invalid_argument  // malformed identifier
};

const char* to_string(errc code);

struct error {
    errc code;
    std::string message;
};

// Value-or-error return type used by every fallible library operation.
template <typename T>
class result {
public:
    result(T value) : m_value(std::move(value)) {}
    result(error err) : m_value(std::move(err)) {}

    bool ok() const { return std::holds_alternative<T>(m_value); }
    bool failed() const { return !ok(); }
    explicit operator bool() const { return ok(); }

    const T& value() const& { return std::get<T>(m_value); }
    T& value() & { return std::get<T>(m_value); }
    T&& value() && { return std::get<T>(std::move(m_value)); }

    const error& err() const { return std::get<error>(m_value); }
    errc code() const { return err().code; }

private:
    std::variant<T, error> m_value;
};

// result<void> counterpart.
class status {
public:
    status() = default;
    status(error err) : m_failed(true), m_error(std::move(err)) {}

    bool ok() const { return !m_failed; }
    bool failed() const { return m_failed; }
    explicit operator bool() const { return ok(); }

    const error& err() const { return m_error; }
    errc code() const { return m_error.code; }

private:
    bool m_failed = false;
    error m_error{errc::configuration, {}};
};

inline error make_error(errc code, std::string message) {
    return error{code, std::move(message)};
}

} // namespace svidsource
