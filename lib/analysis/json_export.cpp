// java_lens/analysis/json_export.cpp - nlohmann::json serialization of analysis results
#include "java_lens/analysis/json_export.hpp"

#include <nlohmann/json.hpp>
#include <optional>

namespace java_lens
{

namespace
{

using nlohmann::json;

template <typename T>
json j_optional(const std::optional<T> & v)
{
  if (!v) return nullptr;
  return json(*v);
}

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().get_offset()}, {"end", r.get_end().get_offset()}};
}

}  // namespace

void to_json(json & j, Visibility v) { j = std::string(to_string(v)); }

void to_json(json & j, const FieldSummary & f)
{
  j = json{
    {"name", f.name},
    {"type", f.type},
    {"visibility", f.visibility},
    {"isStatic", f.is_static},
    {"startLine", f.start_line}};
}

void to_json(json & j, const MethodSummary & m)
{
  j = json{
    {"name", m.name},
    {"paramsCount", m.params_count},
    {"visibility", m.visibility},
    {"isStatic", m.is_static},
    {"startLine", m.start_line}};
}

void to_json(json & j, const MethodDecl & m)
{
  j = json{
    {"name", m.name},
    {"paramsCount", m.params_count},
    {"visibility", m.visibility},
    {"isStatic", m.is_static},
    {"startLine", m.start_line},
    {"signature", m.signature},
    {"startOffset", m.start_offset},
    {"endOffset", m.end_offset},
    {"bodyStartOffset", j_optional(m.body_start_offset)},
    {"bodyEndOffset", j_optional(m.body_end_offset)}};
}

void to_json(json & j, const MethodInvocation & inv)
{
  j = json{
    {"name", inv.name},
    {"argsCount", inv.args_count},
    {"startOffset", inv.start_offset},
    {"line", inv.line}};
}

void to_json(json & j, const ClassSummary & s)
{
  j = json{
    {"className", s.class_name},
    {"packageName", s.package_name},
    {"fields", s.fields},
    {"methods", s.methods},
    {"innerClasses", s.inner_classes}};
}

void to_json(json & j, const MethodRef & ref)
{
  j = json{
    {"className", ref.class_name},
    {"methodName", ref.method_name},
    {"filePath", ref.file_path},
    {"line", ref.line}};
}

void to_json(json & j, const MethodCallGraph & g)
{
  j = json{{"method", g.method}, {"callers", g.callers}, {"callees", g.callees}};
}

void to_json(json & j, const BinderServiceRegistration & b)
{
  j = json{{"name", b.name}, {"line", b.line}};
}

void to_json(json & j, const SystemServiceSummary & s)
{
  j = json{
    {"serviceClass", s.service_class},
    {"onStartLine", j_optional(s.on_start_line)},
    {"onBootPhases", s.on_boot_phases},
    {"binderServices", s.binder_services}};
}

void to_json(json & j, const LifecycleEntry & e) { j = json{{"name", e.name}, {"line", e.line}}; }

void to_json(json & j, const LifecycleTimeline & t)
{
  j = json{{"filePath", t.file_path}, {"className", t.class_name}, {"entries", t.entries}};
}

void to_json(json & j, const ConcurrencyWarning & w)
{
  j = json{{"range", j_range(w.range)}, {"line", w.line}, {"message", w.message}};
}

void to_json(json & j, const FileAnalysis & a)
{
  j = json{
    {"summary", a.summary},
    {"methodDecls", a.method_decls},
    {"methodInvocations", a.method_invocations},
    {"systemService", j_optional(a.system_service)}};
}

json diagnostic_to_json(const Diagnostic & d, const SourceManager & sm)
{
  const FullSourceRange fr = sm.get_full_range(d.primary_range());
  json out = {
    {"severity", to_string(d.severity)},
    {"code", d.code},
    {"message", d.message},
    {"range",
     {{"startLine", fr.start_line},
      {"startColumn", fr.start_column},
      {"endLine", fr.end_line},
      {"endColumn", fr.end_column}}}};
  if (d.help_message) {
    out["help"] = *d.help_message;
  }
  return out;
}

}  // namespace java_lens
