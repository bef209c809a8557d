#include "cairn/data/row.hpp"

namespace cairn::data {

std::string format_row(const Row& row)
{
    std::string text;
    text.push_back('(');
    for (std::size_t index = 0U; index < row.values.size(); ++index) {
        if (index > 0U) {
            text.append(", ");
        }
        text.append(format_value(row.values[index]));
    }
    text.push_back(')');
    return text;
}

}  // namespace cairn::data
