#pragma once

#include "dyntab/common/diagnostics.hpp"
#include "dyntab/common/engine_errors.hpp"

#include <cstdint>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace dyntab::common {

struct FieldError final {
    std::string field{};
    std::string value{};
    std::string reason{};
};

template <typename Payload>
struct OperationResponse final {
    bool success = false;
    StatusCategory status = StatusCategory::Internal;
    std::error_code error{};
    std::string message{};
    DiagnosticSeverity severity = DiagnosticSeverity::Error;
    std::vector<FieldError> field_errors{};
    std::vector<std::string> warnings{};
    std::vector<std::string> remediation_hints{};
    Payload payload{};

    [[nodiscard]] std::uint16_t status_code() const noexcept { return common::status_code(status); }
};

inline DiagnosticSeverity default_diagnostic_severity(std::error_code error) noexcept
{
    if (!error) {
        return DiagnosticSeverity::Info;
    }
    switch (status_category(error)) {
    case StatusCategory::Ok:
    case StatusCategory::Created:
        return DiagnosticSeverity::Info;
    case StatusCategory::ValidationFailed:
    case StatusCategory::NotFound:
    case StatusCategory::Conflict:
    case StatusCategory::AccessDenied:
        return DiagnosticSeverity::Warning;
    default:
        return DiagnosticSeverity::Error;
    }
}

inline std::vector<std::string> default_remediation_hints(std::error_code error)
{
    if (!error) {
        return {};
    }
    if (error.category() != engine_error_category()) {
        return {"Inspect server logs for additional details."};
    }

    switch (static_cast<EngineErrc>(error.value())) {
    case EngineErrc::Success:
    case EngineErrc::AccessDenied:
        return {};
    case EngineErrc::ValidationFailed:
    case EngineErrc::CoercionFailed:
    case EngineErrc::RequiredValueMissing:
        return {"Correct the listed fields and submit the row again."};
    case EngineErrc::InvalidColumnName:
        return {"Use Latin letters and spaces only, up to 100 characters."};
    case EngineErrc::InvalidArgument:
        return {"Review the request parameters and retry."};
    case EngineErrc::ProtectedColumn:
        return {"Change the table purpose to default before modifying commerce columns."};
    case EngineErrc::NotForSale:
        return {"Set a price greater than zero on the item to make it purchasable."};
    case EngineErrc::TableNotFound:
        return {"Confirm the table identifier is correct."};
    case EngineErrc::ColumnNotFound:
        return {"Confirm the column belongs to the target table."};
    case EngineErrc::RowNotFound:
        return {"Confirm the row identifier is correct and the row was not deleted."};
    case EngineErrc::TransactionsNotFound:
        return {"No inventory activity has been recorded for this scope yet."};
    case EngineErrc::UnknownColumnType:
        return {"Use a built-in column type or install the module that provides it."};
    case EngineErrc::ModuleInactive:
        return {"Activate the module that provides this column type before writing new values."};
    case EngineErrc::ModuleNotFound:
    case EngineErrc::GeneratorNotFound:
        return {"Install and activate the module that provides this capability."};
    case EngineErrc::DuplicateValue:
        return {"Choose a value that is not already used in this column."};
    case EngineErrc::DuplicateColumnName:
        return {"Choose a column name that does not exist on the table."};
    case EngineErrc::ModuleAlreadyInstalled:
        return {"Uninstall the existing module before installing it again."};
    case EngineErrc::InsufficientQuantity:
        return {"Reduce the requested quantity or restock the item."};
    case EngineErrc::SaleRecordFailed:
    case EngineErrc::StorageFailure:
    case EngineErrc::InternalError:
    default:
        return {"Inspect server logs for additional details."};
    }
}

template <typename Payload>
OperationResponse<Payload> make_success(Payload payload, StatusCategory status = StatusCategory::Ok)
{
    OperationResponse<Payload> response{};
    response.success = true;
    response.status = status;
    response.severity = DiagnosticSeverity::Info;
    response.payload = std::move(payload);
    return response;
}

template <typename Payload>
OperationResponse<Payload> make_failure(std::error_code error,
                                        std::string message = {},
                                        std::vector<FieldError> field_errors = {})
{
    OperationResponse<Payload> response{};
    response.success = false;
    response.status = status_category(error);
    response.error = error;
    response.message = message.empty() ? error.message() : std::move(message);
    response.severity = default_diagnostic_severity(error);
    response.field_errors = std::move(field_errors);
    response.remediation_hints = default_remediation_hints(error);
    return response;
}

// Re-types a failure so it can be returned from an operation with a different payload.
template <typename Payload, typename Other>
OperationResponse<Payload> forward_failure(OperationResponse<Other>&& other)
{
    OperationResponse<Payload> response{};
    response.success = false;
    response.status = other.status;
    response.error = other.error;
    response.message = std::move(other.message);
    response.severity = other.severity;
    response.field_errors = std::move(other.field_errors);
    response.warnings = std::move(other.warnings);
    response.remediation_hints = std::move(other.remediation_hints);
    return response;
}

}  // namespace dyntab::common
