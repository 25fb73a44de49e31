#pragma once

#include "x509_types.hpp"
#include <cstdint>

namespace svidsource {

// Immutable pairing of the served SVID with the bundles of the same update.
// Readers share it via shared_ptr<const source_snapshot>; each update
// publishes a new one instead of modifying the current.
struct source_snapshot {
    x509_svid svid;
    x509_bundle_set bundles;

    // Number of updates applied so far, 1 for the first.
    uint64_t version = 0;
};

} // namespace svidsource
