#include "app/CsvExporter.hpp"
#include "app/Monitor.hpp"
#include "app/Sampler.hpp"
#include "collectors/MeminfoCollector.hpp"
#include "ui/Config.hpp"
#include "ui/Report.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};

static void on_sigint(int) { g_stop.store(true); }

static void print_usage(std::ostream& os) {
  os << "Usage: memfo [options]\n"
        "  -u, --units UNITS      KiB, MB, MiB, GB, GiB or human [dflt=MiB]\n"
        "  -c, --config NAME      use NAME.toml for configuration [dflt=memfo]\n"
        "  -i, --interval-sec S   sampling interval in seconds [dflt=1.0]\n"
        "      --vmalloc-total    include the VmallocTotal row\n"
        "  -z, --zeros            show rows that have never been non-zero\n"
        "  -d, --dump             print the data once and exit\n"
        "      --DB               debugging output on stderr\n"
        "      --iterations N     stop after N reports (0 = until Ctrl+C)\n"
        "      --interval PRESET  column interval: Var, 5s, 15s, 30s, 1m, 5m, 15m, 1h\n"
        "      --delta            show differences from the previous column\n"
        "      --export PATH      write the full history as CSV on exit\n"
        "      --max-samples N    history capacity [dflt=600]\n"
        "      --compact          thin old history instead of dropping it\n"
        "  -h, --help             this text\n";
}

struct CliOptions {
  std::string config_name{"memfo"};
  std::optional<memfo::ui::Units> units;
  std::optional<double> interval_sec;
  std::optional<memfo::app::IntervalMode> interval;
  std::optional<int> max_samples;
  bool vmalloc_total{false};
  bool zeros{false};
  bool dump{false};
  bool debug{false};
  bool delta{false};
  bool compact{false};
  int iterations{0};
  std::string export_path;
};

// Returns false on a usage error (already reported on stderr)
static bool parse_args(int argc, char** argv, CliOptions& o, bool& help) {
  auto need = [&](int& i, const std::string& a) -> const char* {
    if (i + 1 >= argc) {
      std::fprintf(stderr, "memfo: option %s needs a value\n", a.c_str());
      return nullptr;
    }
    return argv[++i];
  };
  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      const char* v = nullptr;
      if (a == "-h" || a == "--help") { help = true; return true; }
      else if (a == "-u" || a == "--units") {
        if (!(v = need(i, a))) return false;
        o.units = memfo::ui::parse_units(v);
        if (!o.units) { std::fprintf(stderr, "memfo: invalid units '%s'\n", v); return false; }
      }
      else if (a == "-c" || a == "--config") {
        if (!(v = need(i, a))) return false;
        o.config_name = v;
      }
      else if (a == "-i" || a == "--interval-sec") {
        if (!(v = need(i, a))) return false;
        o.interval_sec = std::stod(v);
        if (!(*o.interval_sec > 0)) { std::fprintf(stderr, "memfo: interval must be positive\n"); return false; }
      }
      else if (a == "--interval") {
        if (!(v = need(i, a))) return false;
        o.interval = memfo::app::parse_interval_preset(v);
        if (!o.interval) { std::fprintf(stderr, "memfo: invalid interval preset '%s'\n", v); return false; }
      }
      else if (a == "--iterations") {
        if (!(v = need(i, a))) return false;
        o.iterations = std::stoi(v);
      }
      else if (a == "--max-samples") {
        if (!(v = need(i, a))) return false;
        o.max_samples = std::stoi(v);
      }
      else if (a == "--export") {
        if (!(v = need(i, a))) return false;
        o.export_path = v;
      }
      else if (a == "--vmalloc-total") o.vmalloc_total = true;
      else if (a == "-z" || a == "--zeros") o.zeros = true;
      else if (a == "-d" || a == "--dump") o.dump = true;
      else if (a == "--DB") o.debug = true;
      else if (a == "--delta") o.delta = true;
      else if (a == "--compact") o.compact = true;
      else {
        std::fprintf(stderr, "memfo: unknown option '%s'\n", a.c_str());
        return false;
      }
    }
  } catch (const std::logic_error&) { // stoi/stod: invalid_argument, out_of_range
    std::fprintf(stderr, "memfo: invalid numeric argument\n");
    return false;
  }
  return true;
}

int main(int argc, char** argv) {
  CliOptions cli;
  bool help = false;
  if (!parse_args(argc, argv, cli, help)) {
    print_usage(std::cerr);
    return 2;
  }
  if (help) {
    print_usage(std::cout);
    return 0;
  }

  // command line over TOML over env over defaults
  memfo::ui::MemfoConfig cfg = memfo::ui::load_config(cli.config_name);
  if (cli.units) cfg.units = *cli.units;
  if (cli.interval_sec)
    cfg.interval_ms = static_cast<int>(memfo::app::Sampler::interval_from_seconds(*cli.interval_sec).count());
  if (cli.interval) cfg.interval = *cli.interval;
  if (cli.max_samples) cfg.max_samples = *cli.max_samples;
  if (cli.compact) cfg.policy = memfo::app::RetentionPolicy::Compact;
  if (cli.zeros) cfg.zeros = true;
  if (cli.delta) cfg.delta = true;
  if (cli.debug) cfg.debug = true;

  auto interval = memfo::app::Sampler::clamp_interval(std::chrono::milliseconds(cfg.interval_ms));
  if (cfg.debug) {
    std::fprintf(stderr, "memfo: config %s: interval=%lldms max_samples=%d policy=%s units=%s view=%s\n",
                 cfg.path.empty() ? "(none)" : cfg.path.c_str(), static_cast<long long>(interval.count()),
                 cfg.max_samples, memfo::ui::policy_name(cfg.policy), memfo::ui::units_name(cfg.units),
                 memfo::app::interval_preset_name(cfg.interval).c_str());
  }

  const auto run_start = std::chrono::steady_clock::now();
  auto now_s = [&] { return std::chrono::duration<double>(std::chrono::steady_clock::now() - run_start).count(); };

  memfo::app::MonitorOptions mo;
  mo.max_samples = cfg.max_samples < 2 ? 2 : static_cast<size_t>(cfg.max_samples);
  mo.policy = cfg.policy;
  mo.sample_interval_s = std::chrono::duration<double>(interval).count();
  mo.mode = cfg.interval;
  mo.column_count = memfo::ui::getenv_int("MEMFO_COLUMNS", 8);
  mo.delta = cfg.delta;
  memfo::app::Monitor monitor(mo);
  memfo::collectors::MeminfoCollector source(run_start, cli.vmalloc_total);

  memfo::ui::Report report;
  memfo::ui::ReportOptions ro;
  ro.units = cfg.units;
  ro.zeros = cfg.zeros;
  ro.interval_name = memfo::app::interval_preset_name(cfg.interval);

  int rc = 0;
  if (cli.dump) {
    auto reading = source.sample();
    if (!reading) {
      std::fprintf(stderr, "memfo: cannot read /proc/meminfo\n");
      return 1;
    }
    (void)monitor.ingest(*reading);
    std::cout << report.render(monitor.display_frame(now_s()), cfg.fields, ro);
  } else {
    std::signal(SIGINT, on_sigint);
    std::signal(SIGTERM, on_sigint);
    memfo::app::Sampler sampler(monitor, source, interval);
    sampler.start();
    uint64_t last_tick = 0;
    int printed = 0;
    while (!g_stop.load()) {
      uint64_t t = sampler.ticks();
      if (t != last_tick) {
        last_tick = t;
        if (monitor.size() > 0) {
          std::cout << report.render(monitor.display_frame(now_s()), cfg.fields, ro) << std::endl;
          ++printed;
          if (cli.iterations > 0 && printed >= cli.iterations) break;
        }
      }
      std::this_thread::sleep_for(20ms);
    }
    sampler.stop();
    if (monitor.size() == 0) {
      std::fprintf(stderr, "memfo: no samples collected\n");
      rc = 1;
    }
  }

  if (!cli.export_path.empty()) {
    if (!memfo::app::CsvExporter::write(cli.export_path, monitor.field_names(), monitor.dump_all())) rc = 1;
  }
  return rc;
}
