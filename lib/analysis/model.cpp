// java_lens/analysis/model.cpp
#include "java_lens/analysis/model.hpp"

namespace java_lens
{

std::string_view to_string(Visibility visibility) noexcept
{
  switch (visibility) {
    case Visibility::Public:
      return "public";
    case Visibility::Private:
      return "private";
    case Visibility::Protected:
      return "protected";
    case Visibility::Package:
      return "package";
  }
  return "package";
}

MethodSummary to_method_summary(const MethodDecl & decl)
{
  MethodSummary out;
  out.name = decl.name;
  out.params_count = decl.params_count;
  out.visibility = decl.visibility;
  out.is_static = decl.is_static;
  out.start_line = decl.start_line;
  return out;
}

}  // namespace java_lens
