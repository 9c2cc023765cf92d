#include "metrics/timers.hpp"
#include "profile/orchestrator.hpp"
#include "source/csv_source.hpp"
#include "util/strings.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <filesystem>

using std::string;
namespace fs = std::filesystem;

int main(int argc, char** argv){
  // Defaults
  string      dataPath;
  std::size_t threads    = 4;
  std::uint64_t maxRows  = 0;     // 0 = every row
  bool        hasHeader  = true;

  // Supported:
  //   --data <path>  --threads <N>  --max-records <N>  --has-header true|false
  // Fallback positional: <input.csv|dir> [threads]
  for (int i=1;i<argc;++i){
    std::string_view a(argv[i]);
    auto next = [&](std::string_view name, string* out)->bool{
      if (i+1<argc){ *out = argv[++i]; return true; }
      fmt::print(stderr, "missing value for {}\n", name);
      return false;
    };
    string v;
    if (a == "--data") {
      if (!next(a, &dataPath)) return 2;
    } else if (a == "--threads") {
      if (!next(a, &v)) return 2;
      threads = static_cast<std::size_t>(std::stoull(v));
    } else if (a == "--max-records") {
      if (!next(a, &v)) return 2;
      maxRows = std::stoull(v);
    } else if (a == "--has-header") {
      if (!next(a, &v)) return 2;
      hasHeader = !(dprof::ieq(v,"false") || v=="0" || dprof::ieq(v,"no"));
    } else if (dataPath.empty() && !a.empty() && a[0] != '-') {
      dataPath = string(a);
      if (i+1<argc && argv[i+1][0] != '-') threads = static_cast<std::size_t>(std::stoull(argv[++i]));
    }
  }

  if (dataPath.empty()){
    fmt::print(stderr,
      "usage:\n"
      "  dprof_bench <input.csv|dir> [threads]\n"
      "  dprof_bench --data <input.csv|dir> [--threads N] [--max-records N] [--has-header true|false]\n");
    return 2;
  }

  spdlog::set_level(spdlog::level::warn);
  try {
    dprof::csv_dialect dialect;
    dialect.has_header = hasHeader;
    dprof::csv_source source(fs::path(dataPath), dialect);

    std::vector<string> tables;
    for (const auto& info : source.list_tables()) tables.push_back(info.name);

    dprof::settings cfg;
    cfg.max_threads = threads;
    dprof::profile_orchestrator orchestrator(source, cfg);

    dprof::WallTimer wt; wt.start();
    std::optional<std::uint64_t> cap;
    if (maxRows > 0) cap = maxRows;
    const auto report = orchestrator.profile(tables, cap);
    wt.stop();

    std::uint64_t rows = 0, cols = 0;
    for (const auto& [name, entry] : report.tables) {
      if (const auto* tp = std::get_if<dprof::table_profile>(&entry)) {
        rows += tp->total_records;
        cols += tp->total_columns;
      }
    }
    const double secs = wt.seconds();
    const double rps  = secs>0? (double(rows)/secs) : 0.0;
    const double cps  = secs>0? (double(rows*cols)/secs) : 0.0;

    fmt::print("bench_profile,path={},tables={},rows={},cols={},threads={},sec={:.3f},rows/s={:.0f},cells/s={:.0f}\n",
               dataPath, report.size(), rows, cols, threads, secs, rps, cps);
  } catch (const std::exception& e) {
    fmt::print(stderr, "bench failed: {}\n", e.what());
    return 2;
  }
  return 0;
}
