#pragma once

#include "cortexgrid/Error.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace cortexgrid::tasks {

// Local execution backend for delegated work.
class Executor {
public:
    virtual ~Executor() = default;

    virtual Result<std::vector<std::uint8_t>> execute(const std::string& capability,
                                                      std::span<const std::uint8_t> input) = 0;
};

}  // namespace cortexgrid::tasks
