#include "brite/checker/fixture.h"

#include <sstream>

namespace brite {


std::string RenderFixture(const std::string& name, const Vector<DiagnosticPtr>& diagnostics) {
  std::ostringstream oss;
  oss << "# Checker Test: `" << name << "`\n";

  if (diagnostics.empty()) {
    return oss.str();
  }

  DiagnosticPrinter printer;
  oss << "\n## Errors\n\n";
  for (auto& diagnostic : diagnostics) {
    auto explained = printer.Explain(diagnostic.get());

    oss << "- (";
    diagnostic->position().Print(oss);
    oss << ") " << explained.message << "\n";

    for (auto& related : explained.related) {
      oss << "  - (";
      related.position.Print(oss);
      oss << ") " << related.message << "\n";
    }
  }

  return oss.str();
}


}  // namespace brite
