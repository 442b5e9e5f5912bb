#include "dyntab/common/engine_errors.hpp"
#include "dyntab/shell/shell_backend.hpp"
#include "dyntab/shell/shell_engine.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>
#include <variant>
#include <vector>

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using dyntab::common::EngineErrc;
using dyntab::shell::CommandMetrics;
using dyntab::shell::ShellBackend;
using dyntab::shell::ShellEngine;

namespace {

dyntab::registry::ModuleCapabilities badge_module()
{
    using namespace dyntab::registry;

    ModuleColumnTypeDefinition badge{};
    badge.tag = "badge";
    badge.display_name = "Badge";
    ValidationRule pattern{};
    pattern.kind = ValidationRuleKind::Regex;
    pattern.pattern = "^[A-Z]{2}[0-9]{3}$";
    pattern.message = "Badge must look like AB123";
    badge.validation.push_back(pattern);
    badge.format.kind = FormatRuleKind::Template;
    badge.format.template_text = "[{value}]";

    ModuleCapabilities capabilities{};
    capabilities.column_types.push_back(std::move(badge));
    return capabilities;
}

struct BackendHarness final {
    BackendHarness()
        : backend{make_backend_config()}
        , engine{backend.make_config()}
    {
        backend.add_module("staff", badge_module());
        REQUIRE(engine.execute("create table People").success);
        REQUIRE(engine.execute("add column 1 name text").success);
    }

    static ShellBackend::Config make_backend_config()
    {
        ShellBackend::Config config{};
        config.actor = "admin";
        config.engine.telemetry_identifier = "shell";
        config.engine.diagnostics = [](const dyntab::common::Diagnostic&) {};
        return config;
    }

    CommandMetrics run(const std::string& text)
    {
        auto metrics = engine.execute(text);
        CAPTURE(text);
        CAPTURE(metrics.summary);
        return metrics;
    }

    ShellBackend backend;
    ShellEngine engine;
};

}  // namespace

TEST_CASE("ShellBackend wires the engine components together")
{
    BackendHarness harness;
    CHECK(harness.backend.actor() == "admin");

    const auto tables = harness.backend.schema().list_tables("admin");
    REQUIRE(tables.success);
    REQUIRE(tables.payload.size() == 1U);
    CHECK(tables.payload.front().owner == "admin");

    REQUIRE(harness.run("insert 1 name=Ada").success);
    CHECK(harness.backend.store().list_rows(tables.payload.front().id).size() == 1U);

    const auto snapshot = harness.backend.pipeline().telemetry_snapshot();
    const auto& creates = snapshot.kinds[static_cast<std::size_t>(dyntab::data::MutationKind::Create)];
    CHECK(creates.attempts == 1U);

    const auto aggregate = harness.backend.telemetry_registry().aggregate();
    CHECK(aggregate.kinds[static_cast<std::size_t>(dyntab::data::MutationKind::Create)].successes == 1U);
}

TEST_CASE("Module column types follow install and activation state")
{
    BackendHarness harness;

    const auto listed = harness.run("modules");
    REQUIRE(listed.success);
    CHECK(listed.summary == "Listed 1 module");
    REQUIRE(listed.detail_lines.size() == 3U);
    CHECK_THAT(listed.detail_lines[2], StartsWith("staff"));

    SECTION("inactive modules do not resolve")
    {
        const auto rejected = harness.run("add column 1 badge staff:badge");
        CHECK_FALSE(rejected.success);
        CHECK(rejected.summary == "notFound: Unknown column type: staff:badge");
    }

    SECTION("activated modules validate and format their values")
    {
        REQUIRE(harness.run("module install staff").success);
        REQUIRE(harness.run("module activate staff").success);
        REQUIRE(harness.run("add column 1 badge staff:badge").success);

        REQUIRE(harness.run("insert 1 name=Ada, badge=AB123").success);
        const auto invalid = harness.run("insert 1 name=Bob, badge=ab1");
        CHECK_FALSE(invalid.success);
        CHECK_THAT(invalid.diagnostics.back().message, ContainsSubstring("Badge must look like AB123"));

        const auto selected = harness.run("select 1");
        REQUIRE(selected.success);
        CHECK_THAT(selected.detail_lines.back(), ContainsSubstring("[AB123]"));

        SECTION("deactivation leaves stored values readable but unwritable")
        {
            const auto deactivated = harness.run("module deactivate staff");
            REQUIRE(deactivated.success);
            CHECK(deactivated.summary == "Deactivated module staff");

            const auto blocked = harness.run("insert 1 name=Cy, badge=CD456");
            CHECK_FALSE(blocked.success);
            CHECK(blocked.summary == "notFound: Column type could not be resolved for badge");

            // Rows that leave the column empty are still accepted.
            CHECK(harness.run("insert 1 name=Di").success);

            const auto plain = harness.run("select 1");
            REQUIRE(plain.success);
            CHECK(plain.summary == "Selected 2 rows");
            CHECK_FALSE(plain.detail_lines[2].find("[AB123]") != std::string::npos);
            CHECK_THAT(plain.detail_lines[2], ContainsSubstring("AB123"));
        }
    }

    SECTION("types only lists active module types")
    {
        const auto before = harness.run("types");
        CHECK_FALSE(before.detail_lines.empty());
        bool listed_badge = false;
        for (const auto& line : before.detail_lines) {
            listed_badge = listed_badge || line.find("staff:badge") != std::string::npos;
        }
        CHECK_FALSE(listed_badge);

        REQUIRE(harness.run("module activate staff").success);
        const auto after = harness.run("types");
        listed_badge = false;
        for (const auto& line : after.detail_lines) {
            listed_badge = listed_badge || line.find("staff:badge") != std::string::npos;
        }
        CHECK(listed_badge);
    }
}

TEST_CASE("Module commands report lifecycle errors")
{
    BackendHarness harness;

    CHECK(harness.backend.install_module("ghost") == EngineErrc::ModuleNotFound);
    CHECK(harness.backend.set_module_active("ghost", true) == EngineErrc::ModuleNotFound);

    const auto missing = harness.run("module activate ghost");
    CHECK_FALSE(missing.success);
    CHECK(missing.summary == "module not found: ghost");
    REQUIRE_FALSE(missing.diagnostics.empty());

    REQUIRE(harness.run("module install staff").success);
    const auto twice = harness.run("module install staff");
    CHECK_FALSE(twice.success);
    CHECK(twice.summary == "module already installed: staff");
    CHECK(harness.backend.registry().is_installed("staff"));
}
