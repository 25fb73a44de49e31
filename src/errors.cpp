#include "errors.hpp"

namespace svidsource {

const char* to_string(errc code) {
    switch (code) {
        case errc::configuration:    return "configuration";
        case errc::connection:       return "connection";
        case errc::closed:           return "closed";
        case errc::not_found:        return "not_found";
        case errc::timeout:          return "timeout";
        case errc::invalid_argument: return "invalid_argument";
    }
    return "unknown";
}

} // namespace svidsource
