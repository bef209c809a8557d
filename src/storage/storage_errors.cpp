#include "cairn/storage/storage_errors.hpp"

namespace cairn::storage {

namespace {

class StorageErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "cairn.storage";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<StorageErrc>(condition)) {
        case StorageErrc::Success:
            return "success";
        case StorageErrc::TableNotFound:
            return "table not found";
        case StorageErrc::TableAlreadyExists:
            return "table already exists";
        case StorageErrc::RowNotFound:
            return "row not found";
        case StorageErrc::RowIdExhausted:
            return "row identifiers exhausted";
        default:
            return "unknown storage error";
        }
    }
};

const StorageErrorCategory kStorageCategory{};

}  // namespace

const std::error_category& storage_error_category() noexcept
{
    return kStorageCategory;
}

std::error_code make_error_code(StorageErrc value) noexcept
{
    return {static_cast<int>(value), storage_error_category()};
}

}  // namespace cairn::storage
