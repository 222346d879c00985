#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "java_lens/analysis/json_export.hpp"
#include "java_lens/basic/diagnostic.hpp"
#include "java_lens/basic/source_manager.hpp"

using json = nlohmann::json;

TEST(AnalysisJsonExport, ClassSummaryUsesCamelCaseKeys)
{
  java_lens::ClassSummary s;
  s.class_name = "Foo";
  s.package_name = "p";
  s.fields.push_back(java_lens::FieldSummary{"count", "int", java_lens::Visibility::Private, true, 3});
  s.methods.push_back(java_lens::MethodSummary{"run", 2, java_lens::Visibility::Package, false, 5});
  s.inner_classes.push_back("Inner");

  const json j = s;
  EXPECT_EQ(j["className"], "Foo");
  EXPECT_EQ(j["packageName"], "p");
  ASSERT_EQ(j["fields"].size(), 1U);
  EXPECT_EQ(j["fields"][0]["name"], "count");
  EXPECT_EQ(j["fields"][0]["type"], "int");
  EXPECT_EQ(j["fields"][0]["visibility"], "private");
  EXPECT_EQ(j["fields"][0]["isStatic"], true);
  EXPECT_EQ(j["fields"][0]["startLine"], 3);
  EXPECT_EQ(j["methods"][0]["paramsCount"], 2);
  EXPECT_EQ(j["methods"][0]["visibility"], "package");
  EXPECT_EQ(j["innerClasses"], json::array({"Inner"}));
}

TEST(AnalysisJsonExport, OptionalOffsetsBecomeNull)
{
  java_lens::MethodDecl m;
  m.name = "later";
  m.signature = "void later(0)";
  m.start_offset = 10;
  m.end_offset = 30;

  json j = m;
  EXPECT_TRUE(j["bodyStartOffset"].is_null());
  EXPECT_TRUE(j["bodyEndOffset"].is_null());

  m.body_start_offset = 20;
  m.body_end_offset = 29;
  j = m;
  EXPECT_EQ(j["bodyStartOffset"], 20);
  EXPECT_EQ(j["bodyEndOffset"], 29);
  EXPECT_EQ(j["signature"], "void later(0)");
}

TEST(AnalysisJsonExport, SystemServiceAndTimeline)
{
  java_lens::SystemServiceSummary s;
  s.service_class = "PowerManagerService";
  s.on_boot_phases = {9, 12};
  s.binder_services.push_back(java_lens::BinderServiceRegistration{"power", 6});

  const json js = s;
  EXPECT_EQ(js["serviceClass"], "PowerManagerService");
  EXPECT_TRUE(js["onStartLine"].is_null());
  EXPECT_EQ(js["onBootPhases"], json::array({9, 12}));
  EXPECT_EQ(js["binderServices"][0]["name"], "power");
  EXPECT_EQ(js["binderServices"][0]["line"], 6);

  java_lens::LifecycleTimeline t;
  t.file_path = "/x/SystemServer.java";
  t.class_name = "SystemServer";
  t.entries.push_back(java_lens::LifecycleEntry{"main", 3});
  const json jt = t;
  EXPECT_EQ(jt["filePath"], "/x/SystemServer.java");
  EXPECT_EQ(jt["entries"][0]["name"], "main");
}

TEST(AnalysisJsonExport, DiagnosticCarriesRangeAndHelp)
{
  const java_lens::SourceManager sm("class A {\n  synchronized (x) {}\n}\n");
  java_lens::DiagnosticBag bag;
  bag.report_warning(java_lens::SourceRange(12, 31), "Nested synchronized blocks detected.")
    .with_code("JL003")
    .with_help("release the outer lock first");

  const json j = java_lens::diagnostic_to_json(bag.all().front(), sm);
  EXPECT_EQ(j["severity"], "Warning");
  EXPECT_EQ(j["code"], "JL003");
  EXPECT_EQ(j["range"]["startLine"], 2);
  EXPECT_EQ(j["range"]["startColumn"], 3);
  EXPECT_EQ(j["range"]["endLine"], 2);
  EXPECT_EQ(j["help"], "release the outer lock first");
}
