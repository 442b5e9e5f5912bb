#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>

namespace dyntab::data {

enum class MutationKind : std::uint8_t {
    Create = 0,
    Update,
    Delete,
    MassAction,
    Import,
    Purchase,
    Rent,
    Release,
    Count
};

[[nodiscard]] std::string_view to_string(MutationKind kind) noexcept;

struct MutationKindSnapshot final {
    std::uint64_t attempts = 0U;
    std::uint64_t successes = 0U;
    std::uint64_t failures = 0U;
    std::uint64_t total_duration_ns = 0U;
    std::uint64_t last_duration_ns = 0U;
};

struct MutationFailureSnapshot final {
    std::uint64_t access_denied = 0U;
    std::uint64_t validation_failures = 0U;
    std::uint64_t duplicate_rejections = 0U;
    std::uint64_t not_found = 0U;
    std::uint64_t storage_failures = 0U;
    std::uint64_t other_failures = 0U;
};

struct MutationTelemetrySnapshot final {
    std::array<MutationKindSnapshot, static_cast<std::size_t>(MutationKind::Count)> kinds{};
    MutationFailureSnapshot failures{};
    std::uint64_t ledger_appends = 0U;
    std::uint64_t ledger_append_failures = 0U;
};

class MutationTelemetry final {
public:
    void record_attempt(MutationKind kind) noexcept;
    void record_success(MutationKind kind) noexcept;
    void record_failure(MutationKind kind, std::error_code error) noexcept;
    void record_duration(MutationKind kind, std::uint64_t duration_ns) noexcept;
    void record_ledger_append(bool succeeded) noexcept;

    [[nodiscard]] MutationTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    static constexpr std::size_t kind_count = static_cast<std::size_t>(MutationKind::Count);

    std::array<std::atomic<std::uint64_t>, kind_count> attempts_{};
    std::array<std::atomic<std::uint64_t>, kind_count> successes_{};
    std::array<std::atomic<std::uint64_t>, kind_count> failures_{};
    std::array<std::atomic<std::uint64_t>, kind_count> total_duration_ns_{};
    std::array<std::atomic<std::uint64_t>, kind_count> last_duration_ns_{};

    std::atomic<std::uint64_t> access_denied_{0U};
    std::atomic<std::uint64_t> validation_failures_{0U};
    std::atomic<std::uint64_t> duplicate_rejections_{0U};
    std::atomic<std::uint64_t> not_found_{0U};
    std::atomic<std::uint64_t> storage_failures_{0U};
    std::atomic<std::uint64_t> other_failures_{0U};
    std::atomic<std::uint64_t> ledger_appends_{0U};
    std::atomic<std::uint64_t> ledger_append_failures_{0U};
};

// Records the elapsed time of one mutation when it leaves scope.
class MutationLatencyScope final {
public:
    MutationLatencyScope(MutationTelemetry& telemetry, MutationKind kind) noexcept;
    ~MutationLatencyScope();

    MutationLatencyScope(const MutationLatencyScope&) = delete;
    MutationLatencyScope& operator=(const MutationLatencyScope&) = delete;

private:
    MutationTelemetry& telemetry_;
    MutationKind kind_;
    std::chrono::steady_clock::time_point start_;
};

class MutationTelemetryRegistry final {
public:
    using Sampler = std::function<MutationTelemetrySnapshot()>;
    using Visitor = std::function<void(const std::string&, const MutationTelemetrySnapshot&)>;

    void register_sampler(std::string identifier, Sampler sampler);
    void unregister_sampler(const std::string& identifier);

    [[nodiscard]] MutationTelemetrySnapshot aggregate() const;
    void visit(const Visitor& visitor) const;

private:
    using SamplerMap = std::unordered_map<std::string, Sampler>;

    mutable std::mutex mutex_{};
    SamplerMap samplers_{};
};

}  // namespace dyntab::data
