#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "../cli/cli_options.hpp"
#include "../core/error.hpp"
#include "../metrics/timers.hpp"
#include "../profile/orchestrator.hpp"
#include "../report/emit_profile_json.hpp"
#include "../report/render_report.hpp"
#include "../source/csv_source.hpp"
#include "../source/sqlite_source.hpp"
#include "../util/logging.hpp"

namespace fs = std::filesystem;
using namespace dprof;

// ---------- small helpers ----------
static std::unique_ptr<data_source> open_source(const AppOptions& opt) {
    if (opt.source == "sqlite") return std::make_unique<sqlite_source>(opt.input);
    return std::make_unique<csv_source>(fs::path(opt.input), to_dialect(opt));
}

static int list_tables(data_source& source) {
    for (const auto& info : source.list_tables()) {
        fmt::print("{}\t{}\t{}\n", info.name, info.columns.size(), source.count_records(info.name));
    }
    return 0;
}

int main(int argc, char** argv) try {
    const auto opt = parse_cli(argc, argv);
    init_logging(opt.log_level, opt.log_file);
    const settings cfg = to_settings(opt);

    if (!fs::exists(opt.input)) {
        fmt::print(stderr, "ERROR: input not found: {}\n", opt.input);
        return 2; // IO error
    }
    auto source = open_source(opt);
    if (opt.list_tables) return list_tables(*source);

    std::vector<std::string> tables = opt.tables;
    if (tables.empty()) {
        for (const auto& info : source->list_tables()) tables.push_back(info.name);
    }
    if (tables.empty()) {
        fmt::print(stderr, "ERROR: no tables found in {}\n", opt.input);
        return 2;
    }

    WallTimer wt_all; wt_all.start();
    profile_orchestrator orchestrator(*source, cfg);
    const profile_report report = orchestrator.profile(tables, cfg.default_row_cap(), [](int pct) {
        fmt::print(stderr, "\rprofiling... {:3d}%", pct);
        if (pct == 100) fmt::print(stderr, "\n");
    });
    wt_all.stop();

    std::size_t failed = 0;
    for (const auto& [name, entry] : report.tables) {
        if (is_error(entry)) {
            ++failed;
            fmt::print(stderr, "WARN: table {} failed: {}\n", name, std::get<profile_error>(entry).message);
        }
    }

    // --- exports
    const fs::path out_dir = ensure_export_dir(cfg.export_dir);
    if (opt.format == "json" || opt.format == "both") {
        const fs::path out = out_dir / export_file_name("json");
        emit_profile_json(out, report);
        spdlog::info("wrote {}", out.string());
    }
    if (opt.format == "html" || opt.format == "both") {
        const fs::path out = out_dir / export_file_name("html");
        render_report(opt.template_path, report, out);
        spdlog::info("wrote {}", out.string());
    }

    spdlog::info("{} tables, {} failed, {:.2f} s", report.size(), failed, wt_all.seconds());
    fmt::print("OK {}\n", out_dir.string());
    return 0;
}
catch (const CLI::ParseError& e) {
    return e.get_exit_code() == 0 ? 0 : 1; // --help/--version exit 0; errors already printed by CLI11
}
catch (const configuration_error& e) {
    fmt::print(stderr, "ERROR: {}\n", e.what());
    return 3;
}
catch (const data_source_error& e) {
    fmt::print(stderr, "ERROR: {}\n", e.what());
    return 2;
}
catch (const std::exception& e) {
    fmt::print(stderr, "ERROR: {}\n", e.what());
    return 4; // internal error
}
