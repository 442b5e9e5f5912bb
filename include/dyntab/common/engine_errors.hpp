#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

namespace dyntab::common {

enum class EngineErrc {
    Success = 0,
    ValidationFailed,
    InvalidColumnName,
    InvalidArgument,
    ProtectedColumn,
    RequiredValueMissing,
    CoercionFailed,
    AccessDenied,
    NotForSale,
    NotForRent,
    TableNotFound,
    ColumnNotFound,
    RowNotFound,
    TransactionsNotFound,
    RentalNotFound,
    UnknownColumnType,
    ModuleInactive,
    ModuleNotFound,
    GeneratorNotFound,
    DuplicateValue,
    DuplicateColumnName,
    ModuleAlreadyInstalled,
    InsufficientQuantity,
    InvalidRentalState,
    SaleRecordFailed,
    RentalRecordFailed,
    StorageFailure,
    InternalError
};

enum class StatusCategory : std::uint8_t {
    Ok = 0,
    Created,
    ValidationFailed,
    AccessDenied,
    NotFound,
    Conflict,
    Internal
};

const std::error_category& engine_error_category() noexcept;
std::error_code make_error_code(EngineErrc value) noexcept;

// Maps any error to the transport-neutral status family; foreign categories are Internal.
[[nodiscard]] StatusCategory status_category(std::error_code error) noexcept;
[[nodiscard]] std::uint16_t status_code(StatusCategory category) noexcept;
[[nodiscard]] std::string_view status_category_name(StatusCategory category) noexcept;

}  // namespace dyntab::common

namespace std {

template <>
struct is_error_code_enum<dyntab::common::EngineErrc> : true_type {
};

}  // namespace std
