#include "cairn/executor/schema_lookup.hpp"
#include "cairn/data/data_errors.hpp"

namespace cairn::executor {

std::string get_table_name(const parser::QualifiedName& name)
{
    const auto& parts = name.parts;
    if (parts.empty() || parts.size() > 2U) {
        throw std::system_error(data::make_error_code(data::DataErrc::InvalidTableName),
                                parser::format_qualified_name(name));
    }
    for (const auto& part : parts) {
        if (part.value.empty()) {
            throw std::system_error(data::make_error_code(data::DataErrc::InvalidTableName),
                                    parser::format_qualified_name(name));
        }
    }
    return parts.back().value;
}

}  // namespace cairn::executor
