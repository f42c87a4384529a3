#include "output.hpp"
#include <core/errors.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>

Result<OutputFormat> parse_output_format(const std::string& name) {
    if (name == "txt") return Result<OutputFormat>::Ok(OutputFormat::Txt);
    if (name == "yaml") return Result<OutputFormat>::Ok(OutputFormat::Yaml);
    return Result<OutputFormat>::Err(fmt::format("Unknown output format '{}' (txt or yaml)", name));
}

// ── txt ────────────────────────────────────────────────────────

static void write_records_txt(std::ostream& out, const std::vector<Record>& records) {
    // Columns are taken from the widest record
    size_t n_cols = 0;
    const Record* widest = nullptr;
    for (const auto& r : records) {
        if (r.size() > n_cols) {
            n_cols = r.size();
            widest = &r;
        }
    }
    if (!widest) return;

    std::vector<size_t> widths(n_cols, 0);
    for (size_t c = 0; c < n_cols; c++) widths[c] = (*widest)[c].first.size();
    for (const auto& r : records) {
        for (size_t c = 0; c < r.size(); c++) {
            widths[c] = std::max(widths[c], r[c].second.size());
        }
    }

    std::string line;
    for (size_t c = 0; c < n_cols; c++) {
        line += fmt::format("{:<{}}", (*widest)[c].first, widths[c] + 2);
    }
    out << line.substr(0, line.find_last_not_of(' ') + 1) << "\n";
    for (const auto& r : records) {
        line.clear();
        for (size_t c = 0; c < r.size(); c++) {
            line += fmt::format("{:<{}}", r[c].second, widths[c] + 2);
        }
        out << line.substr(0, line.find_last_not_of(' ') + 1) << "\n";
    }
}

static void write_text_block(std::ostream& out, const std::string& text) {
    if (text.empty()) return;
    out << text;
    if (text.back() != '\n') out << "\n";
}

static void write_txt(std::ostream& out, const std::vector<RemoteOutcome>& outcomes,
                      const Command& command) {
    for (const auto& o : outcomes) {
        out << "== " << o.remote << " ==\n";
        if (o.result.is_ok()) {
            const auto& r = o.result.value;
            auto records = command.parse(r);
            if (!records.empty()) {
                write_records_txt(out, records);
            } else {
                write_text_block(out, r.stdout_data);
            }
            if (!r.stderr_data.empty()) {
                out << "-- stderr --\n";
                write_text_block(out, r.stderr_data);
            }
            if (!r.exit_signal.empty()) {
                out << fmt::format("exit signal: {}\n", r.exit_signal);
            }
            out << fmt::format("exit status: {}\n", r.exit_status);
        } else {
            out << "error: " << describe(o.result.error) << "\n";
        }
        for (const auto& c : o.result.cleanup_errors) {
            out << fmt::format("cleanup error: hop {} ({}): {}\n", c.hop_index, c.host, c.message);
        }
    }
}

// ── yaml ───────────────────────────────────────────────────────

// Multi-line text as a literal block, everything else as a plain scalar
static void emit_text(YAML::Emitter& em, const std::string& text) {
    if (text.find('\n') != std::string::npos) {
        em << YAML::Literal << text;
    } else {
        em << text;
    }
}

static void write_yaml(std::ostream& out, const std::vector<RemoteOutcome>& outcomes,
                       const Command& command) {
    YAML::Emitter em;
    em << YAML::BeginSeq;
    for (const auto& o : outcomes) {
        em << YAML::BeginMap;
        em << YAML::Key << "remote" << YAML::Value << o.remote;
        em << YAML::Key << "ok" << YAML::Value << o.result.is_ok();
        if (o.result.is_ok()) {
            const auto& r = o.result.value;
            em << YAML::Key << "exit_status" << YAML::Value << r.exit_status;
            if (!r.exit_signal.empty()) {
                em << YAML::Key << "exit_signal" << YAML::Value << r.exit_signal;
            }
            auto records = command.parse(r);
            if (!records.empty()) {
                em << YAML::Key << "records" << YAML::Value << YAML::BeginSeq;
                for (const auto& rec : records) {
                    em << YAML::BeginMap;
                    for (const auto& [k, v] : rec) {
                        em << YAML::Key << k << YAML::Value << v;
                    }
                    em << YAML::EndMap;
                }
                em << YAML::EndSeq;
            } else {
                em << YAML::Key << "stdout" << YAML::Value;
                emit_text(em, r.stdout_data);
            }
            em << YAML::Key << "stderr" << YAML::Value;
            emit_text(em, r.stderr_data);
        } else {
            em << YAML::Key << "error" << YAML::Value << YAML::BeginMap;
            em << YAML::Key << "kind" << YAML::Value << error_kind_name(o.result.error.kind);
            em << YAML::Key << "message" << YAML::Value << o.result.error.message;
            em << YAML::EndMap;
        }
        if (!o.result.cleanup_errors.empty()) {
            em << YAML::Key << "cleanup_errors" << YAML::Value << YAML::BeginSeq;
            for (const auto& c : o.result.cleanup_errors) {
                em << YAML::BeginMap;
                em << YAML::Key << "hop" << YAML::Value << c.hop_index;
                em << YAML::Key << "host" << YAML::Value << c.host;
                em << YAML::Key << "message" << YAML::Value << c.message;
                em << YAML::EndMap;
            }
            em << YAML::EndSeq;
        }
        em << YAML::EndMap;
    }
    em << YAML::EndSeq;
    out << em.c_str() << "\n";
}

void write_outcomes(std::ostream& out, OutputFormat format,
                    const std::vector<RemoteOutcome>& outcomes, const Command& command) {
    switch (format) {
    case OutputFormat::Txt:  write_txt(out, outcomes, command); break;
    case OutputFormat::Yaml: write_yaml(out, outcomes, command); break;
    }
}
