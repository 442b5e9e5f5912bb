#include "dyntab/common/engine_errors.hpp"

namespace dyntab::common {

namespace {

class EngineErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "dyntab.engine";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<EngineErrc>(condition)) {
        case EngineErrc::Success:
            return "success";
        case EngineErrc::ValidationFailed:
            return "validation failed";
        case EngineErrc::InvalidColumnName:
            return "invalid column name";
        case EngineErrc::InvalidArgument:
            return "invalid argument";
        case EngineErrc::ProtectedColumn:
            return "protected column";
        case EngineErrc::RequiredValueMissing:
            return "required value missing";
        case EngineErrc::CoercionFailed:
            return "value could not be converted to the column type";
        case EngineErrc::AccessDenied:
            return "access denied";
        case EngineErrc::NotForSale:
            return "item is not available for sale";
        case EngineErrc::NotForRent:
            return "item is not available for rent";
        case EngineErrc::TableNotFound:
            return "table not found";
        case EngineErrc::ColumnNotFound:
            return "column not found";
        case EngineErrc::RowNotFound:
            return "row not found";
        case EngineErrc::TransactionsNotFound:
            return "no inventory transactions found";
        case EngineErrc::RentalNotFound:
            return "rental not found";
        case EngineErrc::UnknownColumnType:
            return "unknown column type";
        case EngineErrc::ModuleInactive:
            return "column type belongs to an inactive module";
        case EngineErrc::ModuleNotFound:
            return "module not found";
        case EngineErrc::GeneratorNotFound:
            return "generator not found";
        case EngineErrc::DuplicateValue:
            return "duplicate value";
        case EngineErrc::DuplicateColumnName:
            return "duplicate column name";
        case EngineErrc::ModuleAlreadyInstalled:
            return "module already installed";
        case EngineErrc::InsufficientQuantity:
            return "insufficient quantity";
        case EngineErrc::InvalidRentalState:
            return "item is not in a state that allows this rental step";
        case EngineErrc::SaleRecordFailed:
            return "sale record could not be created";
        case EngineErrc::RentalRecordFailed:
            return "rental record could not be written";
        case EngineErrc::StorageFailure:
            return "storage failure";
        case EngineErrc::InternalError:
            return "internal error";
        default:
            return "unknown engine error";
        }
    }
};

const EngineErrorCategory kCategory{};

}  // namespace

const std::error_category& engine_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(EngineErrc value) noexcept
{
    return {static_cast<int>(value), engine_error_category()};
}

StatusCategory status_category(std::error_code error) noexcept
{
    if (!error) {
        return StatusCategory::Ok;
    }
    if (error.category() != engine_error_category()) {
        return StatusCategory::Internal;
    }

    switch (static_cast<EngineErrc>(error.value())) {
    case EngineErrc::Success:
        return StatusCategory::Ok;
    case EngineErrc::ValidationFailed:
    case EngineErrc::InvalidColumnName:
    case EngineErrc::InvalidArgument:
    case EngineErrc::ProtectedColumn:
    case EngineErrc::RequiredValueMissing:
    case EngineErrc::CoercionFailed:
    case EngineErrc::InsufficientQuantity:
    case EngineErrc::InvalidRentalState:
        return StatusCategory::ValidationFailed;
    case EngineErrc::AccessDenied:
    case EngineErrc::NotForSale:
    case EngineErrc::NotForRent:
        return StatusCategory::AccessDenied;
    case EngineErrc::TableNotFound:
    case EngineErrc::ColumnNotFound:
    case EngineErrc::RowNotFound:
    case EngineErrc::TransactionsNotFound:
    case EngineErrc::RentalNotFound:
    case EngineErrc::UnknownColumnType:
    case EngineErrc::ModuleInactive:
    case EngineErrc::ModuleNotFound:
    case EngineErrc::GeneratorNotFound:
        return StatusCategory::NotFound;
    case EngineErrc::DuplicateValue:
    case EngineErrc::DuplicateColumnName:
    case EngineErrc::ModuleAlreadyInstalled:
        return StatusCategory::Conflict;
    default:
        return StatusCategory::Internal;
    }
}

std::uint16_t status_code(StatusCategory category) noexcept
{
    switch (category) {
    case StatusCategory::Ok:
        return 200U;
    case StatusCategory::Created:
        return 201U;
    case StatusCategory::ValidationFailed:
        return 400U;
    case StatusCategory::AccessDenied:
        return 403U;
    case StatusCategory::NotFound:
        return 404U;
    case StatusCategory::Conflict:
        return 409U;
    case StatusCategory::Internal:
    default:
        return 500U;
    }
}

std::string_view status_category_name(StatusCategory category) noexcept
{
    switch (category) {
    case StatusCategory::Ok:
        return "ok";
    case StatusCategory::Created:
        return "created";
    case StatusCategory::ValidationFailed:
        return "validationFailed";
    case StatusCategory::AccessDenied:
        return "accessDenied";
    case StatusCategory::NotFound:
        return "notFound";
    case StatusCategory::Conflict:
        return "conflict";
    case StatusCategory::Internal:
    default:
        return "internal";
    }
}

}  // namespace dyntab::common
