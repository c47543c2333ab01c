#include "minitest.hpp"
#include "app/FieldSelector.hpp"

using memfo::app::FieldSelector;

TEST(selector_layout_partitions_in_registry_order) {
  FieldSelector f;
  f.pin("MemAvailable");
  f.pin("MemTotal");
  f.hide("Buffers");
  auto l = f.layout({"MemTotal", "MemFree", "MemAvailable", "Buffers", "Cached"});
  ASSERT_EQ(l.pinned.size(), 2u);
  ASSERT_EQ(l.pinned[0], "MemTotal");
  ASSERT_EQ(l.pinned[1], "MemAvailable");
  ASSERT_EQ(l.normal.size(), 2u);
  ASSERT_EQ(l.normal[0], "MemFree");
  ASSERT_EQ(l.normal[1], "Cached");
}

TEST(selector_pin_and_hide_are_exclusive) {
  FieldSelector f;
  f.hide("Cached");
  f.pin("Cached");
  ASSERT_TRUE(f.is_pinned("Cached"));
  ASSERT_TRUE(!f.is_hidden("Cached"));
  f.hide("Cached");
  ASSERT_TRUE(!f.is_pinned("Cached"));
  ASSERT_TRUE(f.is_hidden("Cached"));
}

TEST(selector_defaults) {
  auto f = FieldSelector::defaults();
  ASSERT_TRUE(f.is_pinned("MemTotal"));
  ASSERT_TRUE(f.is_pinned("MemAvailable"));
  ASSERT_TRUE(f.is_hidden("KernelStack"));
  ASSERT_TRUE(f.is_hidden("Active(file)"));
}

TEST(selector_store_and_load) {
  FieldSelector f;
  f.pin("SwapFree");
  f.hide("Mlocked");
  memfo::util::TomlReader toml;
  toml.set("pinned", "Stale", true);
  f.store(toml);
  ASSERT_TRUE(!toml.has("pinned", "Stale"));
  ASSERT_EQ(toml.get_bool("pinned", "SwapFree"), true);

  FieldSelector g;
  g.load(toml);
  ASSERT_TRUE(g.is_pinned("SwapFree"));
  ASSERT_TRUE(g.is_hidden("Mlocked"));
  ASSERT_TRUE(!g.is_pinned("Stale"));
}
