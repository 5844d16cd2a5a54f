#include "document/source_registry.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#include "renderer/render_test_fixation.hpp"

namespace pageorg {
TEST(SourceRegistryTest, RegisterAndLookup) {
  SourceRegistry registry;
  auto           first  = MakeDocument("first", 3);
  auto           second = MakeDocument("second", 2);

  const auto     first_id  = registry.Register(first);
  const auto     second_id = registry.Register(second);
  EXPECT_NE(first_id, second_id);
  EXPECT_EQ(registry.Size(), 2u);
  EXPECT_EQ(registry.Lookup(first_id), first);
  EXPECT_EQ(registry.Lookup(second_id), second);
  EXPECT_EQ(registry.Lookup(9999), nullptr);
}

TEST(SourceRegistryTest, ReleaseDropsOnlyTheGivenSource) {
  SourceRegistry registry;
  const auto     first_id  = registry.Register(MakeDocument("first", 1));
  const auto     second_id = registry.Register(MakeDocument("second", 1));

  EXPECT_TRUE(registry.Release(first_id));
  EXPECT_FALSE(registry.Release(first_id));
  EXPECT_FALSE(registry.Contains(first_id));
  EXPECT_TRUE(registry.Contains(second_id));
  EXPECT_EQ(registry.Size(), 1u);
}

TEST(SourceRegistryTest, IdsAreNotReusedAfterClear) {
  SourceRegistry registry;
  const auto     before = registry.Register(MakeDocument("a", 1));
  registry.Clear();
  EXPECT_EQ(registry.Size(), 0u);
  const auto after = registry.Register(MakeDocument("a", 1));
  EXPECT_NE(before, after);
}

TEST(SourceRegistryTest, RejectsNullDocument) {
  SourceRegistry registry;
  EXPECT_THROW(registry.Register(nullptr), std::invalid_argument);
}

TEST(SourceDocumentTest, LabelIsFileStem) {
  EXPECT_EQ(LabelFromPath("/tmp/report.final.pdf"), "report.final");
  EXPECT_EQ(LabelFromPath("scan.pdf"), "scan");
  EXPECT_EQ(LabelFromPath("/tmp/notes"), "notes");
}
}  // namespace pageorg
