#include "dyntab/tools/operation_log_formatter.hpp"

#include "dyntab/common/time_format.hpp"

#include <string_view>
#include <vector>

namespace {

void append_json_string(std::string& out, std::string_view text)
{
    out.push_back('"');
    for (unsigned char ch : text) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (ch < 0x20U) {
                constexpr char kHex[] = "0123456789ABCDEF";
                out.append("\\u00");
                out.push_back(kHex[(ch >> 4U) & 0x0F]);
                out.push_back(kHex[ch & 0x0F]);
            } else {
                out.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    out.push_back('"');
}

// Appends `"name":` with a leading comma after the first field of an object.
class JsonObjectWriter final {
public:
    explicit JsonObjectWriter(std::string& out)
        : out_{out}
    {
        out_.push_back('{');
    }

    void key(std::string_view name)
    {
        if (!first_) {
            out_.push_back(',');
        }
        first_ = false;
        append_json_string(out_, name);
        out_.push_back(':');
    }

    void string_field(std::string_view name, std::string_view value)
    {
        key(name);
        append_json_string(out_, value);
    }

    template <typename Number>
    void number_field(std::string_view name, Number value)
    {
        key(name);
        out_.append(std::to_string(value));
    }

    void bool_field(std::string_view name, bool value)
    {
        key(name);
        out_.append(value ? "true" : "false");
    }

    void timestamp_field(std::string_view name, std::chrono::system_clock::time_point tp)
    {
        key(name);
        const auto text = dyntab::common::format_timestamp_iso(tp);
        if (text.empty()) {
            out_.append("null");
        } else {
            append_json_string(out_, text);
        }
    }

    void string_array_field(std::string_view name, const std::vector<std::string>& values)
    {
        key(name);
        out_.push_back('[');
        for (std::size_t i = 0U; i < values.size(); ++i) {
            if (i > 0U) {
                out_.push_back(',');
            }
            append_json_string(out_, values[i]);
        }
        out_.push_back(']');
    }

    void close() { out_.push_back('}'); }

private:
    std::string& out_;
    bool first_ = true;
};

}  // namespace

namespace dyntab::tools {

std::string format_command_log_json(const shell::CommandMetrics& metrics)
{
    std::string json;
    json.reserve(512U);
    JsonObjectWriter record{json};

    record.string_field("correlation_id", metrics.correlation_id);
    record.string_field("category", metrics.command_category);
    record.string_field("command", metrics.command_text);
    record.string_field("summary", metrics.summary);
    record.bool_field("success", metrics.success);
    record.number_field("duration_ms", metrics.duration_ms);
    record.number_field("rows_touched", metrics.rows_touched);
    record.number_field("ledger_entries", metrics.ledger_entries);
    record.timestamp_field("started_at", metrics.started_at);
    record.timestamp_field("finished_at", metrics.finished_at);
    record.string_array_field("detail_lines", metrics.detail_lines);

    record.key("diagnostics");
    json.push_back('[');
    for (std::size_t i = 0U; i < metrics.diagnostics.size(); ++i) {
        if (i > 0U) {
            json.push_back(',');
        }
        const auto& diagnostic = metrics.diagnostics[i];
        JsonObjectWriter entry{json};
        entry.string_field("severity", common::severity_name(diagnostic.severity));
        entry.string_field("message", diagnostic.message);
        entry.number_field("column", diagnostic.column);
        entry.string_field("statement", diagnostic.statement);
        entry.string_array_field("remediation_hints", diagnostic.remediation_hints);
        entry.close();
    }
    json.push_back(']');

    record.close();
    return json;
}

std::string format_diagnostic_log_json(const common::Diagnostic& diagnostic)
{
    std::string json;
    json.reserve(256U);
    JsonObjectWriter record{json};

    record.timestamp_field("timestamp", diagnostic.timestamp);
    record.string_field("severity", common::severity_name(diagnostic.severity));
    record.string_field("component", diagnostic.component);
    record.string_field("message", diagnostic.message);
    record.string_field("correlation_id", diagnostic.correlation_id);
    if (diagnostic.error) {
        record.number_field("error_code", diagnostic.error.value());
        record.string_field("error", diagnostic.error.message());
    }

    record.close();
    return json;
}

}  // namespace dyntab::tools
