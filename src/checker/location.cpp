#include "brite/checker/location.h"

#include <ostream>

namespace brite {


void SourceRange::Print(std::ostream& stream) const {
  stream << start.line << ":" << start.column << "-" << end.line << ":" << end.column;
}


}  // namespace brite
