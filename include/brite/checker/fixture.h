#ifndef BRITE_CHECKER_FIXTURE_H_
#define BRITE_CHECKER_FIXTURE_H_

#include <string>

#include "brite/checker/diagnostic.h"
#include "brite/util/vector.h"

namespace brite {


// the markdown a golden checker test is compared against
std::string RenderFixture(const std::string& name, const Vector<DiagnosticPtr>& diagnostics);


}  // namespace brite

#endif  // BRITE_CHECKER_FIXTURE_H_
