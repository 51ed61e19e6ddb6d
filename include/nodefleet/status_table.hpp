#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "nodefleet/types.hpp"

namespace nodefleet {
    std::string status_to_emoji(NodeStatus status);

    // Fleet table plus a one-line summary per status, as printed each poll cycle.
    void print_fleet_table(std::ostream& out, const std::vector<Node>& nodes, int64_t current_ms);
} // namespace nodefleet
