#pragma once

#include "cairn/data/value.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace cairn::data {

struct Row final {
    std::vector<Value> values{};

    [[nodiscard]] std::size_t size() const noexcept { return values.size(); }
    [[nodiscard]] const Value* get(std::size_t index) const noexcept
    {
        return index < values.size() ? &values[index] : nullptr;
    }

    bool operator==(const Row& other) const = default;
};

[[nodiscard]] std::string format_row(const Row& row);

}  // namespace cairn::data
