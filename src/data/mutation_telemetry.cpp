#include "dyntab/data/mutation_telemetry.hpp"

#include "dyntab/common/engine_errors.hpp"

#include <utility>
#include <vector>

namespace dyntab::data {

namespace {

inline std::size_t to_index(MutationKind kind) noexcept
{
    return static_cast<std::size_t>(kind);
}

void accumulate(MutationKindSnapshot& target, const MutationKindSnapshot& source) noexcept
{
    target.attempts += source.attempts;
    target.successes += source.successes;
    target.failures += source.failures;
    target.total_duration_ns += source.total_duration_ns;
    if (source.last_duration_ns != 0U) {
        target.last_duration_ns = source.last_duration_ns;
    }
}

void accumulate(MutationFailureSnapshot& target, const MutationFailureSnapshot& source) noexcept
{
    target.access_denied += source.access_denied;
    target.validation_failures += source.validation_failures;
    target.duplicate_rejections += source.duplicate_rejections;
    target.not_found += source.not_found;
    target.storage_failures += source.storage_failures;
    target.other_failures += source.other_failures;
}

}  // namespace

std::string_view to_string(MutationKind kind) noexcept
{
    switch (kind) {
    case MutationKind::Create:
        return "create";
    case MutationKind::Update:
        return "update";
    case MutationKind::Delete:
        return "delete";
    case MutationKind::MassAction:
        return "mass_action";
    case MutationKind::Import:
        return "import";
    case MutationKind::Purchase:
        return "purchase";
    case MutationKind::Rent:
        return "rent";
    case MutationKind::Release:
        return "release";
    default:
        return "unknown";
    }
}

void MutationTelemetry::record_attempt(MutationKind kind) noexcept
{
    attempts_[to_index(kind)].fetch_add(1U, std::memory_order_relaxed);
}

void MutationTelemetry::record_success(MutationKind kind) noexcept
{
    successes_[to_index(kind)].fetch_add(1U, std::memory_order_relaxed);
}

void MutationTelemetry::record_failure(MutationKind kind, std::error_code error) noexcept
{
    failures_[to_index(kind)].fetch_add(1U, std::memory_order_relaxed);

    if (!error || error.category() != common::engine_error_category()) {
        other_failures_.fetch_add(1U, std::memory_order_relaxed);
        return;
    }

    switch (static_cast<common::EngineErrc>(error.value())) {
    case common::EngineErrc::AccessDenied:
    case common::EngineErrc::NotForSale:
        access_denied_.fetch_add(1U, std::memory_order_relaxed);
        break;
    case common::EngineErrc::ValidationFailed:
    case common::EngineErrc::CoercionFailed:
    case common::EngineErrc::RequiredValueMissing:
    case common::EngineErrc::ProtectedColumn:
    case common::EngineErrc::InsufficientQuantity:
    case common::EngineErrc::InvalidArgument:
        validation_failures_.fetch_add(1U, std::memory_order_relaxed);
        break;
    case common::EngineErrc::DuplicateValue:
        duplicate_rejections_.fetch_add(1U, std::memory_order_relaxed);
        break;
    case common::EngineErrc::TableNotFound:
    case common::EngineErrc::RowNotFound:
    case common::EngineErrc::ColumnNotFound:
    case common::EngineErrc::UnknownColumnType:
    case common::EngineErrc::ModuleInactive:
        not_found_.fetch_add(1U, std::memory_order_relaxed);
        break;
    case common::EngineErrc::StorageFailure:
    case common::EngineErrc::SaleRecordFailed:
        storage_failures_.fetch_add(1U, std::memory_order_relaxed);
        break;
    default:
        other_failures_.fetch_add(1U, std::memory_order_relaxed);
        break;
    }
}

void MutationTelemetry::record_duration(MutationKind kind, std::uint64_t duration_ns) noexcept
{
    total_duration_ns_[to_index(kind)].fetch_add(duration_ns, std::memory_order_relaxed);
    last_duration_ns_[to_index(kind)].store(duration_ns, std::memory_order_relaxed);
}

void MutationTelemetry::record_ledger_append(bool succeeded) noexcept
{
    if (succeeded) {
        ledger_appends_.fetch_add(1U, std::memory_order_relaxed);
    } else {
        ledger_append_failures_.fetch_add(1U, std::memory_order_relaxed);
    }
}

MutationTelemetrySnapshot MutationTelemetry::snapshot() const noexcept
{
    MutationTelemetrySnapshot snapshot{};
    for (std::size_t i = 0; i < kind_count; ++i) {
        snapshot.kinds[i].attempts = attempts_[i].load(std::memory_order_relaxed);
        snapshot.kinds[i].successes = successes_[i].load(std::memory_order_relaxed);
        snapshot.kinds[i].failures = failures_[i].load(std::memory_order_relaxed);
        snapshot.kinds[i].total_duration_ns = total_duration_ns_[i].load(std::memory_order_relaxed);
        snapshot.kinds[i].last_duration_ns = last_duration_ns_[i].load(std::memory_order_relaxed);
    }

    snapshot.failures.access_denied = access_denied_.load(std::memory_order_relaxed);
    snapshot.failures.validation_failures = validation_failures_.load(std::memory_order_relaxed);
    snapshot.failures.duplicate_rejections = duplicate_rejections_.load(std::memory_order_relaxed);
    snapshot.failures.not_found = not_found_.load(std::memory_order_relaxed);
    snapshot.failures.storage_failures = storage_failures_.load(std::memory_order_relaxed);
    snapshot.failures.other_failures = other_failures_.load(std::memory_order_relaxed);
    snapshot.ledger_appends = ledger_appends_.load(std::memory_order_relaxed);
    snapshot.ledger_append_failures = ledger_append_failures_.load(std::memory_order_relaxed);
    return snapshot;
}

void MutationTelemetry::reset() noexcept
{
    for (std::size_t i = 0; i < kind_count; ++i) {
        attempts_[i].store(0U, std::memory_order_relaxed);
        successes_[i].store(0U, std::memory_order_relaxed);
        failures_[i].store(0U, std::memory_order_relaxed);
        total_duration_ns_[i].store(0U, std::memory_order_relaxed);
        last_duration_ns_[i].store(0U, std::memory_order_relaxed);
    }

    access_denied_.store(0U, std::memory_order_relaxed);
    validation_failures_.store(0U, std::memory_order_relaxed);
    duplicate_rejections_.store(0U, std::memory_order_relaxed);
    not_found_.store(0U, std::memory_order_relaxed);
    storage_failures_.store(0U, std::memory_order_relaxed);
    other_failures_.store(0U, std::memory_order_relaxed);
    ledger_appends_.store(0U, std::memory_order_relaxed);
    ledger_append_failures_.store(0U, std::memory_order_relaxed);
}

MutationLatencyScope::MutationLatencyScope(MutationTelemetry& telemetry, MutationKind kind) noexcept
    : telemetry_{telemetry}
    , kind_{kind}
    , start_{std::chrono::steady_clock::now()}
{
}

MutationLatencyScope::~MutationLatencyScope()
{
    const auto end = std::chrono::steady_clock::now();
    const auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_).count();
    telemetry_.record_duration(kind_, static_cast<std::uint64_t>(duration < 0 ? 0 : duration));
}

void MutationTelemetryRegistry::register_sampler(std::string identifier, Sampler sampler)
{
    if (!sampler) {
        return;
    }
    std::lock_guard guard(mutex_);
    samplers_.insert_or_assign(std::move(identifier), std::move(sampler));
}

void MutationTelemetryRegistry::unregister_sampler(const std::string& identifier)
{
    std::lock_guard guard(mutex_);
    samplers_.erase(identifier);
}

MutationTelemetrySnapshot MutationTelemetryRegistry::aggregate() const
{
    std::vector<Sampler> samplers;
    {
        std::lock_guard guard(mutex_);
        samplers.reserve(samplers_.size());
        for (const auto& [_, sampler] : samplers_) {
            samplers.push_back(sampler);
        }
    }

    MutationTelemetrySnapshot total{};
    for (const auto& sampler : samplers) {
        if (!sampler) {
            continue;
        }
        const auto snapshot = sampler();
        for (std::size_t i = 0; i < snapshot.kinds.size(); ++i) {
            accumulate(total.kinds[i], snapshot.kinds[i]);
        }
        accumulate(total.failures, snapshot.failures);
        total.ledger_appends += snapshot.ledger_appends;
        total.ledger_append_failures += snapshot.ledger_append_failures;
    }
    return total;
}

void MutationTelemetryRegistry::visit(const Visitor& visitor) const
{
    if (!visitor) {
        return;
    }

    std::vector<std::pair<std::string, Sampler>> entries;
    {
        std::lock_guard guard(mutex_);
        entries.reserve(samplers_.size());
        for (const auto& [identifier, sampler] : samplers_) {
            entries.emplace_back(identifier, sampler);
        }
    }

    for (const auto& [identifier, sampler] : entries) {
        if (!sampler) {
            continue;
        }
        visitor(identifier, sampler());
    }
}

}  // namespace dyntab::data
