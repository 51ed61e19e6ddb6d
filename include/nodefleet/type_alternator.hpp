#pragma once
#include <atomic>
#include <cstdint>
#include <optional>

#include "nodefleet/types.hpp"

namespace nodefleet {
    // Picks the type of the next launched node. With no fixed type it
    // round-robins fast, large, fast, ... across the whole process lifetime.
    class TypeAlternator {
    public:
        TypeAlternator() = default;
        explicit TypeAlternator(std::optional<NodeType> fixed_type) : fixed_type_(fixed_type) {}

        NodeType next() {
            if (fixed_type_) {
                return *fixed_type_;
            }
            uint64_t turn = counter_.fetch_add(1);
            return (turn % 2 == 0) ? NodeType::FAST : NodeType::LARGE;
        }

        bool alternating() const {
            return !fixed_type_.has_value();
        }

        uint64_t consumed() const {
            return counter_.load();
        }

    private:
        std::optional<NodeType> fixed_type_;
        std::atomic<uint64_t> counter_{0};
    };
} // namespace nodefleet
