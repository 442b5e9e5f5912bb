#pragma once

#include "dyntab/registry/column_type.hpp"
#include "dyntab/registry/module_rules.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace dyntab::registry {

struct BuiltinTypeEntry final {
    using NormalizeFn = common::CellValue (*)(std::string_view);
    using ValidateFn = ValidationOutcome (*)(std::string_view);
    using FormatFn = std::string (*)(const common::CellValue&);
    using GenerateFn = common::CellValue (*)(GenerationContext&);

    std::string id{};
    std::string display_name{};
    ValueKind kind = ValueKind::Text;
    ValidateFn validate = nullptr;
    FormatFn format = nullptr;
    GenerateFn generate = nullptr;  // null when the type has no sample data
    NormalizeFn normalize = nullptr;
};

class BuiltinColumnType final : public ColumnTypeHandler {
public:
    explicit BuiltinColumnType(BuiltinTypeEntry entry);

    [[nodiscard]] std::string_view type_id() const noexcept override { return entry_.id; }
    [[nodiscard]] std::string_view display_name() const noexcept override { return entry_.display_name; }
    [[nodiscard]] ValueKind value_kind() const noexcept override { return entry_.kind; }
    [[nodiscard]] common::CellValue normalize(std::string_view value) const override;
    [[nodiscard]] ValidationOutcome validate(std::string_view value) const override;
    [[nodiscard]] std::string format(const common::CellValue& value) const override;
    [[nodiscard]] std::optional<common::CellValue> generate(GenerationContext& context) const override;

private:
    BuiltinTypeEntry entry_{};
};

// Column type declared by a module; its id is "<module>:<tag>".
class ModuleColumnType final : public ColumnTypeHandler {
public:
    ModuleColumnType(std::string module_id, ModuleColumnTypeDefinition definition);

    [[nodiscard]] std::string_view type_id() const noexcept override { return type_id_; }
    [[nodiscard]] std::string_view display_name() const noexcept override { return definition_.display_name; }
    [[nodiscard]] ValueKind value_kind() const noexcept override { return definition_.base_kind; }
    [[nodiscard]] common::CellValue normalize(std::string_view value) const override { return std::string{value}; }
    [[nodiscard]] ValidationOutcome validate(std::string_view value) const override;
    [[nodiscard]] std::string format(const common::CellValue& value) const override;
    [[nodiscard]] std::optional<common::CellValue> generate(GenerationContext& context) const override;

    [[nodiscard]] const std::string& module_id() const noexcept { return module_id_; }
    [[nodiscard]] const ModuleColumnTypeDefinition& definition() const noexcept { return definition_; }

private:
    std::string module_id_{};
    std::string type_id_{};
    ModuleColumnTypeDefinition definition_{};
};

[[nodiscard]] std::vector<BuiltinTypeEntry> builtin_type_entries();
[[nodiscard]] std::string make_module_type_id(std::string_view module_id, std::string_view tag);
// Splits "<module>:<tag>"; an id without a separator is built-in and yields an empty module.
[[nodiscard]] std::string_view module_of_type(std::string_view type_id) noexcept;

}  // namespace dyntab::registry
