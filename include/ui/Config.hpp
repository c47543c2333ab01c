#pragma once

#include <string>
#include "app/FieldSelector.hpp"
#include "app/HistoryStore.hpp"
#include "app/IntervalModel.hpp"
#include "ui/Formatting.hpp"

namespace memfo::ui {

// Settings resolved from TOML -> env -> compiled default. The command line
// is applied on top by main.
struct MemfoConfig {
  std::string name{"memfo"};
  std::string path;          // config file in use; empty when there is no home
  int interval_ms{1000};     // sampling cadence
  int max_samples{static_cast<int>(memfo::app::HistoryStore::kDefaultMaxSamples)};
  memfo::app::RetentionPolicy policy{memfo::app::RetentionPolicy::Ring};
  Units units{Units::MiB};
  memfo::app::IntervalMode interval{memfo::app::IntervalMode::Adaptive()};
  bool delta{false};
  bool zeros{false};         // show rows that were never non-zero
  bool debug{false};
  memfo::app::FieldSelector fields{memfo::app::FieldSelector::defaults()};
};

// Environment variable helpers (MEMFO_X and memfo_x are equivalent)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool env_flag(const char* name, bool defv);

// $XDG_CONFIG_HOME/memfo/<name>.toml, else ~/.config/memfo/<name>.toml
std::string config_file_path(const std::string& name);

// Reads <name>.toml; writes a default file first when there is none
MemfoConfig load_config(const std::string& name);
// Persists everything but the debug flag. Returns false on I/O failure.
bool save_config(const MemfoConfig& cfg);

const char* policy_name(memfo::app::RetentionPolicy p);

} // namespace memfo::ui
