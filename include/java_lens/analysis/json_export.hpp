// java_lens/analysis/json_export.hpp - nlohmann::json serialization of analysis results
//
// Field names are camelCase. Absent optionals serialize as null.
//
#pragma once

#include <nlohmann/json_fwd.hpp>

#include "java_lens/analysis/file_analysis.hpp"
#include "java_lens/analysis/model.hpp"
#include "java_lens/basic/diagnostic.hpp"
#include "java_lens/basic/source_manager.hpp"

namespace java_lens
{

void to_json(nlohmann::json & j, Visibility v);
void to_json(nlohmann::json & j, const FieldSummary & f);
void to_json(nlohmann::json & j, const MethodSummary & m);
void to_json(nlohmann::json & j, const MethodDecl & m);
void to_json(nlohmann::json & j, const MethodInvocation & inv);
void to_json(nlohmann::json & j, const ClassSummary & s);
void to_json(nlohmann::json & j, const MethodRef & ref);
void to_json(nlohmann::json & j, const MethodCallGraph & g);
void to_json(nlohmann::json & j, const BinderServiceRegistration & b);
void to_json(nlohmann::json & j, const SystemServiceSummary & s);
void to_json(nlohmann::json & j, const LifecycleEntry & e);
void to_json(nlohmann::json & j, const LifecycleTimeline & t);
void to_json(nlohmann::json & j, const ConcurrencyWarning & w);
void to_json(nlohmann::json & j, const FileAnalysis & a);

/// Diagnostic with its primary range expanded to 1-based line/column.
[[nodiscard]] nlohmann::json diagnostic_to_json(const Diagnostic & d, const SourceManager & sm);

}  // namespace java_lens
