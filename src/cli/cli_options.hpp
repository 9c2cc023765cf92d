#pragma once
#include <CLI/CLI.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "../core/error.hpp"
#include "../core/settings.hpp"
#include "../csv/tokenizer.hpp"

namespace dprof {

struct AppOptions {
    // Required/paths
    std::string input;
    std::string source      = "csv";           // csv | sqlite
    std::vector<std::string> tables;           // empty = every table
    std::string output_root = "exports";
    std::string format      = "json";          // json | html | both
    std::string template_path = "templates/report.mustache";
    bool        list_tables = false;

    // Limits (validated into settings, not by the parser)
    std::int64_t max_records = 10000;
    bool         no_limit = false;
    std::int64_t max_threads = 4;

    // CSV parsing
    std::string delimiter = ",";        // single char, e.g. ","
    std::string quote     = "\"";       // single char, e.g. "\""
    bool        has_header = true;      // header row present?

    // Logging
    std::string log_level = "info";
    std::string log_file;
};

inline AppOptions parse_cli(int argc, char** argv) {
    AppOptions opt;
    CLI::App app{"dprof: column profiling for CSV files and SQLite databases"};
    app.set_version_flag("--version", "1.0.0");
    app.set_config("--config", "", "Read options from a TOML/INI file");

    // Required/basic
    app.add_option("-i,--input", opt.input, "CSV file, directory of CSV files, or SQLite database")
        ->required()->envname("DPROF_INPUT");
    app.add_option("--source", opt.source, "Data source kind")
        ->check(CLI::IsMember({"csv", "sqlite"}))->envname("DPROF_SOURCE");
    app.add_option("-t,--table", opt.tables, "Table to profile (repeatable; default all)");
    app.add_option("--output-root", opt.output_root, "Export directory")->envname("DPROF_OUTPUT_ROOT");
    app.add_option("--format", opt.format, "Export format")
        ->check(CLI::IsMember({"json", "html", "both"}))->envname("DPROF_FORMAT");
    app.add_option("--template", opt.template_path, "Mustache template for the HTML export")
        ->envname("DPROF_TEMPLATE");
    app.add_flag("--list-tables", opt.list_tables, "List tables with column and record counts, then exit");

    // Limits
    auto* max_rec = app.add_option("--max-records", opt.max_records, "Row cap per table (must be > 0)")
        ->envname("DPROF_MAX_RECORDS");
    app.add_flag("--no-limit", opt.no_limit, "Profile every row")->excludes(max_rec);
    app.add_option("--max-threads", opt.max_threads, "Workers per pool")->envname("DPROF_MAX_THREADS");

    // CSV parsing
    app.add_option("-d,--delimiter", opt.delimiter,
                   "CSV delimiter (single character, default ',')")->default_val(",");
    app.add_option("-q,--quote",     opt.quote,
                   "CSV quote (single character, default '\"')")->default_val("\"");
    app.add_option("--has-header",   opt.has_header,
                   "CSV has a header row (true/false)")->default_val(true);

    // Logging
    app.add_option("--log-level", opt.log_level, "trace|debug|info|warn|error|off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}))
        ->envname("DPROF_LOG_LEVEL");
    app.add_option("--log-file", opt.log_file, "Also write the log to this file")->envname("DPROF_LOG_FILE");

    app.allow_windows_style_options();
    auto one_char = [](const std::string& s, const char* name){
        if (s.size() != 1)
            throw CLI::ValidationError{name, "must be a single character"};
    };
    try {
        app.parse(argc, argv);
        one_char(opt.delimiter, "delimiter");
        one_char(opt.quote,     "quote");
    } catch (const CLI::ParseError& e) {
        app.exit(e); // prints help, version or the error
        throw;
    }

    return opt;
}

// Limits are configuration, not syntax: out-of-range values throw
// configuration_error so the caller can exit with its own code.
inline settings to_settings(const AppOptions& opt) {
    settings cfg;
    if (opt.max_threads <= 0) throw configuration_error("--max-threads must be > 0");
    cfg.max_threads = static_cast<std::size_t>(opt.max_threads);
    if (opt.no_limit) {
        cfg.default_max_records = 0;
    } else {
        if (opt.max_records <= 0) throw configuration_error("--max-records must be > 0");
        cfg.default_max_records = static_cast<std::uint64_t>(opt.max_records);
    }
    cfg.export_dir = opt.output_root;
    cfg.validate();
    return cfg;
}

inline csv_dialect to_dialect(const AppOptions& opt) {
    csv_dialect d;
    d.delimiter  = opt.delimiter[0];
    d.quote      = opt.quote[0];
    d.has_header = opt.has_header;
    return d;
}

inline std::filesystem::path ensure_export_dir(const std::string& root) {
    namespace fs = std::filesystem;
    fs::path dir(root);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw export_error("cannot create export directory " + dir.string() + ": " + ec.message());
    return dir;
}

}
