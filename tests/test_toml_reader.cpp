#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static std::string tmp_path(const char* suffix) {
  return (std::filesystem::temp_directory_path() /
          ("memfo_test_toml_" + std::string(suffix) + "_" + std::to_string(::getpid()) + ".toml")).string();
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(toml_load_missing_file) {
  memfo::util::TomlReader tr;
  ASSERT_TRUE(!tr.load(tmp_path("does_not_exist")));
}

TEST(toml_load_sections) {
  auto path = tmp_path("sections");
  write_file(path,
    "# memfo settings\n"
    "[sampling]\n"
    "interval_ms = 2500\n"
    "\n"
    "[view]\n"
    "  units  =  \"GiB\"  \n"
    "delta = false\n"
  );
  memfo::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("sampling", "interval_ms"), 2500);
  ASSERT_EQ(tr.get_string("view", "units"), "GiB");
  ASSERT_EQ(tr.get_bool("view", "delta", true), false);
  ASSERT_TRUE(tr.has("view", "units"));
  ASSERT_TRUE(!tr.has("view", "zeros"));
  ASSERT_EQ(tr.get_int("sampling", "max_samples", 600), 600);
  ASSERT_EQ(tr.get_string("nosection", "key", "nope"), "nope");
  remove_file(path);
}

TEST(toml_bad_values_fall_back) {
  auto path = tmp_path("bad");
  write_file(path, "[sampling]\ninterval_ms = soon\n[view]\ndelta = maybe\n");
  memfo::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_int("sampling", "interval_ms", 1000), 1000);
  ASSERT_EQ(tr.get_bool("view", "delta", true), true);
  ASSERT_EQ(tr.get_bool("view", "delta", false), false);
  remove_file(path);
}

TEST(toml_bare_keys_read_as_set) {
  auto path = tmp_path("bare");
  write_file(path, "[hidden]\nKernelStack\nActive(file)\n[pinned]\nMemTotal = true\nSwapFree = false\n");
  memfo::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_bool("hidden", "KernelStack"), true);
  ASSERT_EQ(tr.get_bool("hidden", "Active(file)"), true);
  auto keys = tr.keys("pinned");
  ASSERT_EQ(keys.size(), 2u);
  ASSERT_EQ(keys[0], "MemTotal");
  ASSERT_EQ(keys[1], "SwapFree");
  ASSERT_EQ(tr.get_bool("pinned", "SwapFree", true), false);
  ASSERT_TRUE(tr.keys("nosection").empty());
  remove_file(path);
}

TEST(toml_clear_section_keeps_others) {
  memfo::util::TomlReader tr;
  tr.set("pinned", "MemTotal", true);
  tr.set("hidden", "Bounce", true);
  tr.clear_section("pinned");
  ASSERT_TRUE(tr.keys("pinned").empty());
  ASSERT_TRUE(tr.has("hidden", "Bounce"));
}

TEST(toml_save_round_trip) {
  auto path = tmp_path("roundtrip");
  memfo::util::TomlReader tr;
  tr.set("sampling", "interval_ms", 1000);
  tr.set("history", "policy", std::string("compact"));
  tr.set("view", "zeros", true);
  tr.set("pinned", "MemAvailable", true);
  tr.set("sampling", "interval_ms", 3000); // overwrite in place
  ASSERT_TRUE(tr.save(path));

  memfo::util::TomlReader back;
  ASSERT_TRUE(back.load(path));
  ASSERT_EQ(back.get_int("sampling", "interval_ms"), 3000);
  ASSERT_EQ(back.get_string("history", "policy"), "compact");
  ASSERT_EQ(back.get_bool("view", "zeros"), true);
  ASSERT_EQ(back.get_bool("pinned", "MemAvailable"), true);
  remove_file(path);
}
