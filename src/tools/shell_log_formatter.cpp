#include "cairn/tools/shell_log_formatter.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <vector>

namespace {

void append_json_string(std::string& out, std::string_view text)
{
    constexpr char kHex[] = "0123456789ABCDEF";
    out.push_back('"');
    for (const unsigned char ch : text) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
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

[[nodiscard]] std::string_view severity_name(cairn::parser::ParserSeverity severity) noexcept
{
    switch (severity) {
    case cairn::parser::ParserSeverity::Info:
        return "info";
    case cairn::parser::ParserSeverity::Warning:
        return "warning";
    case cairn::parser::ParserSeverity::Error:
    default:
        return "error";
    }
}

[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm buffer{};
#if defined(_WIN32)
    gmtime_s(&buffer, &time_value);
#else
    gmtime_r(&time_value, &buffer);
#endif

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - std::chrono::system_clock::from_time_t(time_value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

// Writes the members of one JSON object, inserting separators as needed.
class ObjectWriter final {
public:
    explicit ObjectWriter(std::string& out)
        : out_{out}
    {
        out_.push_back('{');
    }

    ~ObjectWriter() { out_.push_back('}'); }

    ObjectWriter(const ObjectWriter&) = delete;
    ObjectWriter& operator=(const ObjectWriter&) = delete;

    std::string& key(std::string_view name)
    {
        if (!first_) {
            out_.push_back(',');
        }
        first_ = false;
        append_json_string(out_, name);
        out_.push_back(':');
        return out_;
    }

    void string(std::string_view name, std::string_view value) { append_json_string(key(name), value); }

    void number(std::string_view name, std::uint64_t value) { key(name).append(std::to_string(value)); }

    void real(std::string_view name, double value)
    {
        std::ostringstream stream;
        stream << std::fixed << std::setprecision(3) << value;
        key(name).append(stream.str());
    }

    void boolean(std::string_view name, bool value) { key(name).append(value ? "true" : "false"); }

    void timestamp(std::string_view name, std::chrono::system_clock::time_point value)
    {
        const auto text = format_timestamp_iso(value);
        if (text.empty()) {
            key(name).append("null");
        } else {
            append_json_string(key(name), text);
        }
    }

    void strings(std::string_view name, const std::vector<std::string>& values)
    {
        auto& out = key(name);
        out.push_back('[');
        for (std::size_t index = 0U; index < values.size(); ++index) {
            if (index > 0U) {
                out.push_back(',');
            }
            append_json_string(out, values[index]);
        }
        out.push_back(']');
    }

private:
    std::string& out_;
    bool first_ = true;
};

void append_diagnostic(std::string& out, const cairn::parser::ParserDiagnostic& diagnostic)
{
    ObjectWriter writer{out};
    writer.string("severity", severity_name(diagnostic.severity));
    writer.string("message", diagnostic.message);
    writer.number("line", diagnostic.line);
    writer.number("column", diagnostic.column);
    writer.string("statement", diagnostic.statement);
    writer.strings("remediation_hints", diagnostic.remediation_hints);
}

}  // namespace

namespace cairn::tools {

std::string format_shell_command_log_json(const cairn::shell::CommandMetrics& metrics)
{
    std::string json;
    json.reserve(512U);
    {
        ObjectWriter writer{json};
        writer.string("correlation_id", metrics.correlation_id);
        writer.string("category", metrics.command_category);
        writer.string("sql", metrics.command_text);
        writer.string("summary", metrics.summary);
        writer.boolean("success", metrics.success);
        writer.real("duration_ms", metrics.duration_ms);
        writer.number("rows_touched", metrics.rows_touched);
        writer.number("statements_executed", metrics.statements_executed);
        writer.timestamp("started_at", metrics.started_at);
        writer.timestamp("finished_at", metrics.finished_at);
        writer.strings("detail_lines", metrics.detail_lines);

        auto& out = writer.key("diagnostics");
        out.push_back('[');
        for (std::size_t index = 0U; index < metrics.diagnostics.size(); ++index) {
            if (index > 0U) {
                out.push_back(',');
            }
            append_diagnostic(out, metrics.diagnostics[index]);
        }
        out.push_back(']');
    }
    return json;
}

}  // namespace cairn::tools
