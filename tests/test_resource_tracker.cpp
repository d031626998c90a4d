#include "cancel/resource_tracker.hpp"
#include "core/errors.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace crush;
namespace fs = std::filesystem;

class ResourceTrackerTest : public ::testing::Test {
protected:
  void touch(const fs::path &path) {
    std::ofstream out(path);
    out << "data";
  }

  test::TempDir dir{"crush_tracker_test"};
};

TEST_F(ResourceTrackerTest, IncompleteOutputIsDeleted) {
  const auto output = dir / "out.bin";
  {
    ResourceTracker tracker;
    std::ofstream &out = tracker.create_output(output);
    out << "partial";
    EXPECT_TRUE(tracker.cleanup_all());
  }
  EXPECT_FALSE(fs::exists(output));
}

TEST_F(ResourceTrackerTest, CompletedOutputIsKept) {
  const auto output = dir / "out.bin";
  ResourceTracker tracker;
  tracker.create_output(output) << "done";
  tracker.mark_complete();
  EXPECT_TRUE(tracker.is_complete());
  EXPECT_TRUE(tracker.cleanup_all());
  EXPECT_TRUE(fs::exists(output));
}

TEST_F(ResourceTrackerTest, TempFilesAreAlwaysDeleted) {
  const auto temp = dir / "scratch.tmp";
  const auto output = dir / "out.bin";
  ResourceTracker tracker;
  tracker.create_temp_file(temp) << "scratch";
  tracker.create_output(output) << "result";
  tracker.mark_complete();
  tracker.cleanup_all();

  EXPECT_FALSE(fs::exists(temp));
  EXPECT_TRUE(fs::exists(output));
}

TEST_F(ResourceTrackerTest, DestructorCleansUp) {
  const auto temp = dir / "scratch.tmp";
  touch(temp);
  {
    ResourceTracker tracker;
    tracker.register_temp_file(temp);
  }
  EXPECT_FALSE(fs::exists(temp));
}

TEST_F(ResourceTrackerTest, CleanupIsIdempotent) {
  const auto output = dir / "out.bin";
  ResourceTracker tracker;
  tracker.create_output(output);
  EXPECT_FALSE(tracker.cleaned_up());
  EXPECT_TRUE(tracker.cleanup_all());
  EXPECT_TRUE(tracker.cleaned_up());

  // A file recreated at the same path is not touched by a second call
  touch(output);
  EXPECT_TRUE(tracker.cleanup_all());
  EXPECT_TRUE(fs::exists(output));
}

TEST_F(ResourceTrackerTest, MissingFilesAreNotAnError) {
  ResourceTracker tracker;
  tracker.register_temp_file(dir / "never-created.tmp");
  tracker.register_output(dir / "never-created.out");
  EXPECT_TRUE(tracker.cleanup_all());
}

TEST_F(ResourceTrackerTest, CreateFailsForMissingDirectory) {
  ResourceTracker tracker;
  try {
    tracker.create_output(dir / "no" / "such" / "dir" / "out.bin");
    FAIL() << "Expected CrushError";
  } catch (const CrushError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Io);
  }
}

TEST_F(ResourceTrackerTest, RecordsRegisteredPaths) {
  ResourceTracker tracker;
  tracker.register_temp_file(dir / "a.tmp");
  tracker.register_temp_file(dir / "b.tmp");
  tracker.register_output(dir / "out.bin");

  ASSERT_EQ(tracker.temp_files().size(), 2u);
  ASSERT_TRUE(tracker.output_path().has_value());
  EXPECT_EQ(*tracker.output_path(), dir / "out.bin");
  tracker.mark_complete();
}
