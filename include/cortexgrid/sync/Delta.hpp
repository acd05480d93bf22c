#pragma once

#include "cortexgrid/Types.hpp"

#include <set>
#include <vector>

namespace cortexgrid::sync {

// Hashes in the peer manifest that the local set lacks, in manifest order
// with duplicates removed.
std::vector<ContentHash> compute_delta(const std::set<ContentHash>& local, const std::vector<ContentHash>& remote);

}  // namespace cortexgrid::sync
