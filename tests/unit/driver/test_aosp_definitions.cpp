#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "java_lens/basic/cancellation.hpp"
#include "java_lens/driver/aosp_definitions.hpp"

namespace fs = std::filesystem;

using java_lens::DefinitionKind;
using java_lens::DefinitionRequest;

namespace
{

uint32_t column_of(const std::string & line, const std::string & needle)
{
  const auto pos = line.find(needle);
  EXPECT_NE(pos, std::string::npos) << "needle must exist: '" << needle << "'";
  return pos == std::string::npos ? 0U : static_cast<uint32_t>(pos);
}

void write_file(const fs::path & path, const std::string & text)
{
  fs::create_directories(path.parent_path());
  std::ofstream ofs(path, std::ios::binary);
  ofs << text;
}

}  // namespace

TEST(DriverAospDefinitions, StringLiteralAroundCursor)
{
  const std::string line = "publishBinderService(\"power\", mBinder);";
  const auto lit = java_lens::string_literal_at(line, column_of(line, "wer"));
  ASSERT_TRUE(lit.has_value());
  EXPECT_EQ(lit->text, "power");
  EXPECT_EQ(lit->start, column_of(line, "power"));
  EXPECT_EQ(lit->end, column_of(line, "\", m"));

  // On the opening quote
  EXPECT_TRUE(java_lens::string_literal_at(line, lit->start - 1).has_value());

  EXPECT_FALSE(java_lens::string_literal_at(line, 0).has_value());
  EXPECT_FALSE(java_lens::string_literal_at("", 0).has_value());
}

TEST(DriverAospDefinitions, WordUnderOrBeforeCursor)
{
  const std::string line = "native void nativeAcquire(long ptr);";
  EXPECT_EQ(java_lens::word_at(line, column_of(line, "Acquire")), "nativeAcquire");
  EXPECT_EQ(java_lens::word_at(line, column_of(line, "(long")), "nativeAcquire");
  EXPECT_EQ(java_lens::word_at(line, 0), "native");
  EXPECT_FALSE(java_lens::word_at("a  b", 2).has_value());
}

TEST(DriverAospDefinitions, ClassifiesCursorContext)
{
  {
    const std::string line = "    publishBinderService(\"power\", new BinderService());";
    const auto r = java_lens::classify_definition(line, column_of(line, "ower"));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->kind, DefinitionKind::ServiceContext);
    EXPECT_EQ(r->symbol, "power");
  }
  {
    const std::string line = "    SystemProperties.set(\"ctl.start\", \"lmkd\");";
    const auto r = java_lens::classify_definition(line, column_of(line, "mkd"));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->kind, DefinitionKind::InitService);
    EXPECT_EQ(r->symbol, "lmkd");
  }
  {
    const std::string line = "  private static native void nativeAcquire(long ptr);";
    const auto r = java_lens::classify_definition(line, column_of(line, "Acquire"));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->kind, DefinitionKind::JniMethod);
    EXPECT_EQ(r->symbol, "nativeAcquire");
  }
  {
    const std::string line = "    ServiceManager.addService(\"\", b);";
    EXPECT_FALSE(java_lens::classify_definition(line, column_of(line, "\"\"") + 1).has_value());
  }
  {
    // "nativeInit" is not the word "native".
    const std::string line = "  void nativeInit() {}";
    EXPECT_FALSE(java_lens::classify_definition(line, column_of(line, "Init")).has_value());
  }
  EXPECT_EQ(java_lens::to_string(DefinitionKind::ServiceContext), "service-context");
  EXPECT_EQ(java_lens::to_string(DefinitionKind::InitService), "init-service");
  EXPECT_EQ(java_lens::to_string(DefinitionKind::JniMethod), "jni-method");
}

class AospDefinitionSearchTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    root_ = fs::temp_directory_path() / "java_lens_aosp_tree";
    fs::remove_all(root_);

    write_file(
      root_ / "system" / "sepolicy" / "service_contexts",
      "# binder services\n"
      "power                                     u:object_r:power_service:s0\n");
    write_file(
      root_ / "system" / "memory" / "lmkd" / "lmkd.rc",
      "# lmkd daemon\n"
      "service lmkd /system/bin/lmkd\n"
      "    class core\n");
    write_file(
      root_ / "frameworks" / "base" / "core" / "aaa" / "first.cpp",
      "void nativeAcquire() {}\n");
    write_file(
      root_ / "frameworks" / "base" / "core" / "jni" / "android_os_Power.cpp",
      "#include <jni.h>\n"
      "\n"
      "static void nativeAcquire(JNIEnv* env) {}\n");
  }

  void TearDown() override { fs::remove_all(root_); }

  fs::path root_;
};

TEST_F(AospDefinitionSearchTest, FindsServiceContextEntry)
{
  const auto loc = java_lens::find_definition(
    root_, DefinitionRequest{DefinitionKind::ServiceContext, "power"}, java_lens::ScanOptions{});
  ASSERT_TRUE(loc.has_value());
  EXPECT_EQ(loc->path.filename().string(), "service_contexts");
  EXPECT_EQ(loc->line, 1U);
  EXPECT_EQ(loc->column, 0U);
}

TEST_F(AospDefinitionSearchTest, FindsInitServiceDeclaration)
{
  const auto loc = java_lens::find_definition(
    root_, DefinitionRequest{DefinitionKind::InitService, "lmkd"}, java_lens::ScanOptions{});
  ASSERT_TRUE(loc.has_value());
  EXPECT_EQ(loc->path.filename().string(), "lmkd.rc");
  EXPECT_EQ(loc->line, 1U);
  EXPECT_EQ(loc->column, 8U);
}

TEST_F(AospDefinitionSearchTest, FindsJniImplementationOnlyUnderJniDirectories)
{
  const auto loc = java_lens::find_definition(
    root_, DefinitionRequest{DefinitionKind::JniMethod, "nativeAcquire"}, java_lens::ScanOptions{});
  ASSERT_TRUE(loc.has_value());
  EXPECT_EQ(loc->path.filename().string(), "android_os_Power.cpp");
  EXPECT_EQ(loc->line, 2U);
  EXPECT_EQ(loc->column, 12U);
}

TEST_F(AospDefinitionSearchTest, MissingSymbolsAndCancellation)
{
  EXPECT_FALSE(java_lens::find_definition(
                 root_, DefinitionRequest{DefinitionKind::ServiceContext, "nosuch"},
                 java_lens::ScanOptions{})
                 .has_value());
  EXPECT_FALSE(java_lens::find_definition(
                 root_, DefinitionRequest{DefinitionKind::InitService, ""}, java_lens::ScanOptions{})
                 .has_value());

  java_lens::CancellationFlag cancel;
  cancel.cancel();
  EXPECT_FALSE(java_lens::find_definition(
                 root_, DefinitionRequest{DefinitionKind::ServiceContext, "power"},
                 java_lens::ScanOptions{}, &cancel)
                 .has_value());
}
