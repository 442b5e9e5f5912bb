#include "dyntab/shell/shell_backend.hpp"

#include <CLI/CLI.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace dd = dyntab::data;

namespace {

constexpr std::string_view kActor = "bench";

struct BenchmarkOptions final {
    std::size_t samples = 5U;
    std::size_t row_count = 2000U;
    std::size_t import_rows = 1000U;
    std::size_t purchase_count = 500U;
    bool json_output = false;
};

struct BenchmarkResult final {
    std::string name{};
    std::vector<double> samples_ms{};
    std::size_t work_units = 0U;
};

template <typename Payload>
const Payload& require_success(const dyntab::common::OperationResponse<Payload>& response, std::string_view context)
{
    if (!response.success) {
        throw std::runtime_error(std::string(context) + ": " + response.message);
    }
    return response.payload;
}

template <typename Fn>
double time_ms(Fn&& fn)
{
    const auto start = std::chrono::steady_clock::now();
    fn();
    const auto elapsed = std::chrono::steady_clock::now() - start;
    return std::chrono::duration<double, std::milli>(elapsed).count();
}

// A sale table with a unique SKU column, so every write pays for the duplicate scan.
dyntab::common::TableId make_catalog_table(dyntab::shell::ShellBackend& backend)
{
    dyntab::schema::CreateTableRequest request{};
    request.name = "Catalog";
    request.purpose = dyntab::catalog::TablePurpose::Sale;
    request.visibility = dyntab::catalog::TableVisibility::Public;

    dyntab::schema::ColumnDraft name{};
    name.name = "Name";
    name.required = true;
    request.columns.push_back(name);

    dyntab::schema::ColumnDraft sku{};
    sku.name = "SKU";
    sku.allow_duplicates = false;
    request.columns.push_back(sku);

    dyntab::schema::ColumnDraft listed{};
    listed.name = "Listed On";
    listed.type_id = "date";
    request.columns.push_back(listed);

    const auto view = backend.capability_view();
    return require_success(backend.schema().create_table(request, kActor, view), "create table").table.id;
}

dyntab::common::RowData make_item(std::size_t index)
{
    dyntab::common::RowData row;
    row["name"] = "Item " + std::to_string(index);
    row["sku"] = "SKU-" + std::to_string(100000U + index);
    row["price"] = std::to_string(1U + index % 50U) + ".99";
    row["qty"] = static_cast<double>(10U + index % 20U);
    row["listedOn"] = std::string{"2024-01-15"};
    return row;
}

void seed_rows(dyntab::shell::ShellBackend& backend, dyntab::common::TableId table, std::size_t count)
{
    const auto view = backend.capability_view();
    for (std::size_t index = 0U; index < count; ++index) {
        require_success(backend.pipeline().create_row(table, make_item(index), kActor, view), "seed row");
    }
}

BenchmarkResult benchmark_row_creation(const BenchmarkOptions& options)
{
    BenchmarkResult result{};
    result.name = "pipeline_create_rows";
    for (std::size_t sample = 0U; sample < options.samples; ++sample) {
        dyntab::shell::ShellBackend backend;
        const auto table = make_catalog_table(backend);
        result.samples_ms.push_back(time_ms([&] { seed_rows(backend, table, options.row_count); }));
    }
    result.work_units = options.row_count;
    return result;
}

BenchmarkResult benchmark_import(const BenchmarkOptions& options)
{
    dd::ImportRequest request{};
    request.headers = {"Name", "SKU", "price", "Quantity", "Listed On"};
    request.column_mapping = {{"Quantity", "qty"}};
    for (std::size_t index = 0U; index < options.import_rows; ++index) {
        request.rows.push_back({"Imported " + std::to_string(index),
                                "IMP-" + std::to_string(index),
                                "9.50",
                                std::to_string(1U + index % 9U),
                                "2024-02-0" + std::to_string(1U + index % 9U)});
    }

    BenchmarkResult result{};
    result.name = "pipeline_import_batch";
    for (std::size_t sample = 0U; sample < options.samples; ++sample) {
        dyntab::shell::ShellBackend backend;
        const auto table = make_catalog_table(backend);
        const auto view = backend.capability_view();
        result.samples_ms.push_back(time_ms([&] {
            const auto response = backend.pipeline().import_rows(table, request, kActor, view);
            if (require_success(response, "import").imported_rows != options.import_rows) {
                throw std::runtime_error("import dropped rows");
            }
        }));
    }
    result.work_units = options.import_rows;
    return result;
}

BenchmarkResult benchmark_mass_update(const BenchmarkOptions& options)
{
    dd::MassActionRequest request{};
    request.action = dd::RowMassAction::SetFieldValue;
    request.select_all = true;
    request.field = "qty";
    request.value = 3.0;

    BenchmarkResult result{};
    result.name = "pipeline_mass_set_field";
    for (std::size_t sample = 0U; sample < options.samples; ++sample) {
        dyntab::shell::ShellBackend backend;
        const auto table = make_catalog_table(backend);
        seed_rows(backend, table, options.row_count);
        const auto view = backend.capability_view();
        result.samples_ms.push_back(time_ms([&] {
            require_success(backend.pipeline().execute_mass_action(table, request, kActor, view), "mass update");
        }));
    }
    result.work_units = options.row_count;
    return result;
}

BenchmarkResult benchmark_purchases(const BenchmarkOptions& options)
{
    BenchmarkResult result{};
    result.name = "purchase_flow";
    for (std::size_t sample = 0U; sample < options.samples; ++sample) {
        dyntab::shell::ShellBackend backend;
        const auto table = make_catalog_table(backend);
        const auto view = backend.capability_view();
        auto item = make_item(0U);
        item["qty"] = static_cast<double>(options.purchase_count);
        const auto row = require_success(backend.pipeline().create_row(table, item, kActor, view), "stock item").id;

        dyntab::sales::PurchaseRequest request{};
        request.table_id = table;
        request.item_id = row;
        request.quantity = 1;
        request.customer_id = "customer";
        result.samples_ms.push_back(time_ms([&] {
            for (std::size_t index = 0U; index < options.purchase_count; ++index) {
                require_success(backend.purchases().purchase(request, view), "purchase");
            }
        }));

        // Folding the whole ledger is part of what a seller sees after a busy day.
        require_success(backend.ledger().summary_for_item(table, row), "item summary");
    }
    result.work_units = options.purchase_count;
    return result;
}

// One line per benchmark. Throughput uses the fastest sample; a cold first sample inflates the mean.
void report(const BenchmarkResult& result, bool json)
{
    if (result.samples_ms.empty()) {
        return;
    }
    double total_ms = 0.0;
    for (const auto sample : result.samples_ms) {
        total_ms += sample;
    }
    const auto mean_ms = total_ms / static_cast<double>(result.samples_ms.size());
    const auto best_ms = *std::min_element(result.samples_ms.begin(), result.samples_ms.end());
    const auto per_second = best_ms > 0.0 ? static_cast<double>(result.work_units) * 1000.0 / best_ms : 0.0;

    char line[256];
    if (json) {
        std::snprintf(line, sizeof(line),
                      "{\"name\":\"%s\",\"samples\":%zu,\"units\":%zu,\"mean_ms\":%.3f,\"best_ms\":%.3f,\"units_per_sec\":%.1f}",
                      result.name.c_str(), result.samples_ms.size(), result.work_units, mean_ms, best_ms, per_second);
    } else {
        std::snprintf(line, sizeof(line), "%-24s %5zu units x %zu  mean %9.3f ms  best %9.3f ms  %10.1f units/s",
                      result.name.c_str(), result.work_units, result.samples_ms.size(), mean_ms, best_ms, per_second);
    }
    std::cout << line << '\n';
}

}  // namespace

int main(int argc, char** argv)
{
    BenchmarkOptions options{};
    CLI::App app{"dyntab pipeline benchmarks"};
    app.add_option("--samples", options.samples, "Samples per benchmark")->check(CLI::PositiveNumber);
    app.add_option("--rows", options.row_count, "Rows per create and mass-update sample");
    app.add_option("--import-rows", options.import_rows, "Rows per import batch");
    app.add_option("--purchases", options.purchase_count, "Purchases per sample");
    app.add_flag("--json", options.json_output, "Emit JSON Lines");
    CLI11_PARSE(app, argc, argv);

    try {
        for (auto* run : {&benchmark_row_creation, &benchmark_import, &benchmark_mass_update, &benchmark_purchases}) {
            report(run(options), options.json_output);
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "dyntab_benchmarks: " << ex.what() << '\n';
        return 1;
    }
}
