#pragma once

#include <system_error>

namespace cairn::storage {

enum class StorageErrc {
    Success = 0,
    TableNotFound,
    TableAlreadyExists,
    RowNotFound,
    RowIdExhausted
};

const std::error_category& storage_error_category() noexcept;
std::error_code make_error_code(StorageErrc value) noexcept;

}  // namespace cairn::storage

namespace std {

template <>
struct is_error_code_enum<cairn::storage::StorageErrc> : true_type {
};

}  // namespace std
