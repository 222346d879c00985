#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "java_lens/analysis/analysis_cache.hpp"
#include "java_lens/basic/cancellation.hpp"
#include "java_lens/driver/workspace_scan.hpp"
#include "java_lens/syntax/parser.hpp"

namespace fs = std::filesystem;

namespace
{

void write_file(const fs::path & path, const std::string & text)
{
  fs::create_directories(path.parent_path());
  std::ofstream ofs(path, std::ios::binary);
  ofs << text;
}

class WorkspaceScanTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    root_ = fs::temp_directory_path() / "java_lens_scan_tree";
    fs::remove_all(root_);

    write_file(
      root_ / "services" / "PowerManagerService.java",
      "public final class PowerManagerService extends SystemService {\n"
      "  public void onStart() { publishBinderService(\"power\", mBinder); }\n"
      "}\n");
    write_file(root_ / "services" / "Plain.java", "class Plain { void f() {} }\n");
    write_file(
      root_ / "out" / "Generated.java",
      "class Generated extends SystemService { public void onStart() {} }\n");
    write_file(
      root_ / "java" / "SystemServer.java",
      "public final class SystemServer {\n"
      "  public static void main(String[] args) { new SystemServer().run(); }\n"
      "  private void run() {}\n"
      "  private void startBootstrapServices() {}\n"
      "}\n");
    write_file(root_ / "services" / "README.txt", "not java\n");
  }

  void TearDown() override { fs::remove_all(root_); }

  fs::path root_;
};

}  // namespace

TEST_F(WorkspaceScanTest, FindsJavaFilesSortedAndSkipsExcludedDirs)
{
  const auto files = java_lens::find_java_files(root_, java_lens::ScanOptions{});
  ASSERT_EQ(files.size(), 3U);
  EXPECT_EQ(files[0].string(), (root_ / "java" / "SystemServer.java").string());
  EXPECT_EQ(files[1].string(), (root_ / "services" / "Plain.java").string());
  EXPECT_EQ(files[2].string(), (root_ / "services" / "PowerManagerService.java").string());

  java_lens::ScanOptions everything;
  everything.exclude_dirs.clear();
  EXPECT_EQ(java_lens::find_java_files(root_, everything).size(), 4U);

  const auto named = java_lens::find_java_files(root_, java_lens::ScanOptions{}, "SystemServer.java");
  ASSERT_EQ(named.size(), 1U);
  EXPECT_EQ(named[0].filename().string(), "SystemServer.java");

  EXPECT_TRUE(java_lens::find_java_files(root_ / "missing", java_lens::ScanOptions{}).empty());
}

TEST_F(WorkspaceScanTest, ScansSystemServices)
{
  java_lens::JavaParser parser;
  java_lens::AnalysisCache cache(parser);

  const auto services = java_lens::scan_system_services(cache, root_, java_lens::ScanOptions{});
  ASSERT_EQ(services.size(), 1U);
  EXPECT_EQ(services[0].file_path, (root_ / "services" / "PowerManagerService.java").string());
  EXPECT_EQ(services[0].summary.service_class, "PowerManagerService");
  ASSERT_EQ(services[0].summary.binder_services.size(), 1U);
  EXPECT_EQ(services[0].summary.binder_services[0].name, "power");

  // Every scanned file went through the shared cache.
  EXPECT_EQ(cache.size(), 3U);
}

TEST_F(WorkspaceScanTest, CancelledScanStopsEarly)
{
  java_lens::JavaParser parser;
  java_lens::AnalysisCache cache(parser);
  java_lens::CancellationFlag cancel;
  cancel.cancel();

  EXPECT_TRUE(
    java_lens::scan_system_services(cache, root_, java_lens::ScanOptions{}, &cancel).empty());
  EXPECT_TRUE(
    java_lens::build_lifecycle_timelines(cache, root_, java_lens::ScanOptions{}, &cancel).empty());
  EXPECT_EQ(cache.size(), 0U);
}

TEST_F(WorkspaceScanTest, BuildsLifecycleTimelinesForTargetFiles)
{
  java_lens::JavaParser parser;
  java_lens::AnalysisCache cache(parser);

  const auto timelines =
    java_lens::build_lifecycle_timelines(cache, root_, java_lens::ScanOptions{});
  ASSERT_EQ(timelines.size(), 1U);
  EXPECT_EQ(timelines[0].class_name, "SystemServer");
  ASSERT_EQ(timelines[0].entries.size(), 2U);
  EXPECT_EQ(timelines[0].entries[0].name, "main");
  EXPECT_EQ(timelines[0].entries[0].line, 2U);
  EXPECT_EQ(timelines[0].entries[1].name, "startBootstrapServices");
  EXPECT_EQ(timelines[0].entries[1].line, 4U);
}

TEST(DriverFileUri, ConvertsBetweenPathsAndUris)
{
  EXPECT_EQ(java_lens::path_to_file_uri("/tmp/src/A.java"), "file:///tmp/src/A.java");

  const auto p = java_lens::file_uri_to_path("file:///tmp/a%20b/X.java");
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->generic_string(), "/tmp/a b/X.java");

  const auto host = java_lens::file_uri_to_path("file://localhost/etc/x.rc");
  ASSERT_TRUE(host.has_value());
  EXPECT_EQ(host->generic_string(), "/etc/x.rc");

  EXPECT_FALSE(java_lens::file_uri_to_path("untitled:Untitled-1").has_value());
  EXPECT_FALSE(java_lens::file_uri_to_path("file://").has_value());
}

TEST(DriverFileUri, ReadFileToString)
{
  const fs::path path = fs::temp_directory_path() / "java_lens_read_file.txt";
  write_file(path, "a\r\nb");
  const auto text = java_lens::read_file_to_string(path);
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "a\r\nb");
  fs::remove(path);

  EXPECT_FALSE(java_lens::read_file_to_string(path).has_value());
}
