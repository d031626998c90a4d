#include "plugin/deflate_algorithm.hpp"
#include "plugin/registry.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace crush;
using crush::test::make_metadata;
using crush::test::StubAlgorithm;

namespace {
AlgorithmFactory stub(const std::string &name, uint8_t id, double throughput,
                      double ratio) {
  return [=]() -> AlgorithmPtr {
    return std::make_shared<StubAlgorithm>(
        make_metadata(name, id, throughput, ratio));
  };
}
} // namespace

TEST(RegistryTest, BuiltinsAreRegistered) {
  PluginRegistry registry;
  EXPECT_FALSE(registry.initialized());
  registry.init();
  EXPECT_TRUE(registry.initialized());

  ASSERT_NE(registry.find_by_name("deflate"), nullptr);
  ASSERT_NE(registry.find_by_name("deflate-fast"), nullptr);

  auto fallback = registry.default_algorithm();
  ASSERT_NE(fallback, nullptr);
  EXPECT_EQ(fallback->metadata().name, DEFAULT_ALGORITHM_NAME);
  EXPECT_EQ(registry.default_magic(), DEFAULT_ALGORITHM_MAGIC);
}

TEST(RegistryTest, ListIsSortedByName) {
  PluginRegistry registry;
  registry.init({stub("zstd-ish", 0x10, 500, 0.3), stub("alpha", 0x11, 50, 0.2),
                 stub("middle", 0x12, 100, 0.5)});

  auto plugins = registry.list();
  ASSERT_EQ(plugins.size(), 3u);
  EXPECT_EQ(plugins[0].name, "alpha");
  EXPECT_EQ(plugins[1].name, "middle");
  EXPECT_EQ(plugins[2].name, "zstd-ish");
  EXPECT_TRUE(registry.warnings().empty());
}

TEST(RegistryTest, LookupByMagic) {
  PluginRegistry registry;
  registry.init({stub("one", 0x20, 100, 0.5), stub("two", 0x21, 100, 0.5)});

  MagicNumber magic{MAGIC_PREFIX_0, MAGIC_PREFIX_1, FORMAT_VERSION, 0x21};
  auto found = registry.lookup(magic);
  ASSERT_NE(found, nullptr);
  EXPECT_EQ(found->metadata().name, "two");

  MagicNumber unknown{MAGIC_PREFIX_0, MAGIC_PREFIX_1, FORMAT_VERSION, 0x7f};
  EXPECT_EQ(registry.lookup(unknown), nullptr);
  EXPECT_EQ(registry.find_by_name("three"), nullptr);
}

TEST(RegistryTest, DuplicateMagicKeepsFirst) {
  PluginRegistry registry;
  registry.init({stub("first", 0x30, 100, 0.5), stub("second", 0x30, 200, 0.4)});

  EXPECT_EQ(registry.size(), 1u);
  EXPECT_NE(registry.find_by_name("first"), nullptr);
  EXPECT_EQ(registry.find_by_name("second"), nullptr);
  ASSERT_EQ(registry.warnings().size(), 1u);
  EXPECT_NE(registry.warnings()[0].find("duplicate magic"), std::string::npos);
}

TEST(RegistryTest, DuplicateNameKeepsFirst) {
  PluginRegistry registry;
  registry.init({stub("twin", 0x35, 100, 0.5), stub("twin", 0x31, 800, 0.7),
                 stub("other", 0x36, 100, 0.5)});

  EXPECT_EQ(registry.size(), 2u);
  auto twin = registry.find_by_name("twin");
  ASSERT_NE(twin, nullptr);
  EXPECT_EQ(twin->metadata().magic_number[3], 0x35);
  MagicNumber second{MAGIC_PREFIX_0, MAGIC_PREFIX_1, FORMAT_VERSION, 0x31};
  EXPECT_EQ(registry.lookup(second), nullptr);
  ASSERT_EQ(registry.warnings().size(), 1u);
  EXPECT_NE(registry.warnings()[0].find("duplicate algorithm name 'twin'"),
            std::string::npos);
}

TEST(RegistryTest, InvalidMetadataIsSkipped) {
  PluginRegistry registry;
  registry.init({stub("", 0x40, 100, 0.5), stub("zero-throughput", 0x41, 0, 0.5),
                 stub("bad-ratio", 0x42, 100, 1.5), stub("good", 0x43, 100, 0.5)});

  EXPECT_EQ(registry.size(), 1u);
  EXPECT_NE(registry.find_by_name("good"), nullptr);
  EXPECT_EQ(registry.warnings().size(), 3u);
}

TEST(RegistryTest, ZeroMagicIsRejected) {
  auto meta = make_metadata("zero", 0x00, 100, 0.5);
  meta.magic_number = MagicNumber{};
  EXPECT_FALSE(validate_metadata(meta).empty());

  auto ok = make_metadata("ok", 0x01, 100, 0.5);
  EXPECT_TRUE(validate_metadata(ok).empty());

  auto no_version = ok;
  no_version.version.clear();
  EXPECT_FALSE(validate_metadata(no_version).empty());
}

TEST(RegistryTest, FailingFactoriesBecomeWarnings) {
  PluginRegistry registry;
  registry.init({[]() -> AlgorithmPtr { throw std::runtime_error("boom"); },
                 []() -> AlgorithmPtr { return nullptr; },
                 stub("survivor", 0x50, 100, 0.5)});

  EXPECT_EQ(registry.size(), 1u);
  EXPECT_EQ(registry.warnings().size(), 2u);
}

TEST(RegistryTest, ThrowingMetadataBecomesWarning) {
  class BrokenMetadata : public StubAlgorithm {
  public:
    using StubAlgorithm::StubAlgorithm;
    AlgorithmMetadata metadata() const override {
      throw std::runtime_error("metadata unavailable");
    }
  };

  PluginRegistry registry;
  registry.init({stub("before", 0x51, 100, 0.5),
                 []() -> AlgorithmPtr {
                   return std::make_shared<BrokenMetadata>(
                       make_metadata("broken", 0x52, 100, 0.5));
                 },
                 stub("after", 0x53, 100, 0.5)});

  EXPECT_TRUE(registry.initialized());
  EXPECT_EQ(registry.size(), 2u);
  EXPECT_NE(registry.find_by_name("before"), nullptr);
  EXPECT_NE(registry.find_by_name("after"), nullptr);
  ASSERT_EQ(registry.warnings().size(), 1u);
  EXPECT_NE(registry.warnings()[0].find("metadata unavailable"),
            std::string::npos);
}

TEST(RegistryTest, ReinitReplacesContents) {
  PluginRegistry registry;
  registry.init({stub("old", 0x60, 100, 0.5)});
  registry.init({stub("new", 0x61, 100, 0.5)});

  EXPECT_EQ(registry.size(), 1u);
  EXPECT_EQ(registry.find_by_name("old"), nullptr);
  EXPECT_NE(registry.find_by_name("new"), nullptr);

  registry.clear();
  EXPECT_TRUE(registry.empty());
  EXPECT_FALSE(registry.initialized());
}

TEST(RegistryTest, MissingDefaultHasNoFallback) {
  PluginRegistry registry;
  registry.init({stub("only", 0x70, 100, 0.5)});
  EXPECT_EQ(registry.default_algorithm(), nullptr);
}

TEST(RegistryTest, GlobalRegistryHoldsBuiltins) {
  init_plugins();
  EXPECT_TRUE(global_registry().initialized());
  auto plugins = list_plugins();
  EXPECT_GE(plugins.size(), 2u);
}
