#include "ui/Config.hpp"
#include "util/TomlReader.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace memfo::ui {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("MEMFO_", 0) == 0) {
    alt = std::string("memfo_") + n.substr(6);
  } else if (n.rfind("memfo_", 0) == 0) {
    alt = std::string("MEMFO_") + n.substr(6);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try {
    return std::stoi(v);
  } catch (const std::logic_error&) { // invalid_argument, out_of_range
    return defv;
  }
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F') return false;
  return true;
}

std::string config_file_path(const std::string& name) {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/memfo/" + name + ".toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/memfo/" + name + ".toml";
  return {};
}

const char* policy_name(memfo::app::RetentionPolicy p) {
  return p == memfo::app::RetentionPolicy::Compact ? "compact" : "ring";
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const memfo::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const memfo::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const memfo::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

MemfoConfig load_config(const std::string& name) {
  MemfoConfig c;
  c.name = name.empty() ? std::string("memfo") : name;
  c.path = config_file_path(c.name);

  memfo::util::TomlReader toml;
  bool have_toml = !c.path.empty() && toml.load(c.path);
  if (!c.path.empty() && !have_toml && !std::filesystem::exists(c.path)) {
    // First run with this name: write the defaults so there is a file to edit
    (void)save_config(c);
  }

  c.interval_ms = resolve_int(toml, have_toml, "sampling", "interval_ms", "MEMFO_INTERVAL_MS", c.interval_ms);
  c.max_samples = resolve_int(toml, have_toml, "sampling", "max_samples", "MEMFO_MAX_SAMPLES", c.max_samples);
  if (c.max_samples < 2) c.max_samples = 2;

  auto policy = resolve_string(toml, have_toml, "history", "policy", "MEMFO_HISTORY_POLICY", policy_name(c.policy));
  if (policy == "compact") c.policy = memfo::app::RetentionPolicy::Compact;
  else if (policy == "ring") c.policy = memfo::app::RetentionPolicy::Ring;
  else std::fprintf(stderr, "memfo: Config: unknown history policy '%s', using ring\n", policy.c_str());

  auto units = resolve_string(toml, have_toml, "view", "units", "MEMFO_UNITS", units_name(c.units));
  if (auto u = parse_units(units)) c.units = *u;
  else std::fprintf(stderr, "memfo: Config: unknown units '%s', using %s\n", units.c_str(), units_name(c.units));

  auto interval = resolve_string(toml, have_toml, "view", "interval", "MEMFO_VIEW_INTERVAL",
                                 memfo::app::interval_preset_name(c.interval));
  if (auto m = memfo::app::parse_interval_preset(interval)) c.interval = *m;
  else std::fprintf(stderr, "memfo: Config: unknown interval '%s', using Var\n", interval.c_str());

  c.delta = resolve_bool(toml, have_toml, "view", "delta", "MEMFO_DELTA", c.delta);
  c.zeros = resolve_bool(toml, have_toml, "view", "zeros", "MEMFO_ZEROS", c.zeros);
  c.debug = env_flag("MEMFO_DEBUG", false);

  // an existing file is authoritative for the field lists, even when empty
  if (have_toml) {
    c.fields = memfo::app::FieldSelector{};
    c.fields.load(toml);
  }
  return c;
}

bool save_config(const MemfoConfig& cfg) {
  if (cfg.path.empty()) return false;
  std::error_code ec;
  std::filesystem::create_directories(std::filesystem::path(cfg.path).parent_path(), ec);
  if (ec) {
    std::fprintf(stderr, "memfo: Config: failed to create %s: %s\n",
                 std::filesystem::path(cfg.path).parent_path().c_str(), ec.message().c_str());
    return false;
  }
  memfo::util::TomlReader toml;
  toml.set("sampling", "interval_ms", cfg.interval_ms);
  toml.set("sampling", "max_samples", cfg.max_samples);
  toml.set("history", "policy", std::string(policy_name(cfg.policy)));
  toml.set("view", "units", std::string(units_name(cfg.units)));
  toml.set("view", "interval", memfo::app::interval_preset_name(cfg.interval));
  toml.set("view", "delta", cfg.delta);
  toml.set("view", "zeros", cfg.zeros);
  auto fields = cfg.fields;
  fields.store(toml);
  if (!toml.save(cfg.path)) {
    std::fprintf(stderr, "memfo: Config: failed to write %s\n", cfg.path.c_str());
    return false;
  }
  return true;
}

} // namespace memfo::ui
