#pragma once

#include "dyntab/common/cell_value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>

namespace dyntab::registry {

enum class ValueKind : std::uint8_t {
    Text = 0,
    Number,
    Boolean,
    Date,
    Json
};

struct ValidationOutcome final {
    bool valid = true;
    std::string reason{};
    std::string suggestion{};

    [[nodiscard]] static ValidationOutcome ok() { return {}; }
    [[nodiscard]] static ValidationOutcome failure(std::string reason, std::string suggestion = {})
    {
        return ValidationOutcome{false, std::move(reason), std::move(suggestion)};
    }
};

struct GenerationContext final {
    explicit GenerationContext(std::uint64_t seed = 0x5eedU)
        : engine{seed}
    {
    }

    std::mt19937_64 engine;
    std::size_t index = 0U;
    std::size_t total = 0U;
    const common::RowData* row = nullptr;
};

// Behaviour bundle resolved from a column type identifier.
class ColumnTypeHandler {
public:
    virtual ~ColumnTypeHandler() = default;

    [[nodiscard]] virtual std::string_view type_id() const noexcept = 0;
    [[nodiscard]] virtual std::string_view display_name() const noexcept = 0;
    [[nodiscard]] virtual ValueKind value_kind() const noexcept = 0;
    // Canonical form of trimmed text input; a null result stores nothing.
    [[nodiscard]] virtual common::CellValue normalize(std::string_view value) const = 0;
    [[nodiscard]] virtual ValidationOutcome validate(std::string_view value) const = 0;
    [[nodiscard]] virtual std::string format(const common::CellValue& value) const = 0;
    [[nodiscard]] virtual std::optional<common::CellValue> generate(GenerationContext& context) const = 0;
};

[[nodiscard]] std::string_view to_string(ValueKind kind) noexcept;

}  // namespace dyntab::registry
