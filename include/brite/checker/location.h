#ifndef BRITE_CHECKER_LOCATION_H_
#define BRITE_CHECKER_LOCATION_H_

#include <cstddef>
#include <iostream>
#include <string>

namespace brite {


// lines and columns are 1-based; line 0 marks an unknown location
struct SourceLocation {
  size_t line;
  size_t column;

  SourceLocation(size_t line, size_t column) :
      line(line),
      column(column) {}

  bool operator==(const SourceLocation& other) const { return line == other.line && column == other.column; }

  bool operator<=(const SourceLocation& other) const {
    return line < other.line || (line == other.line && column <= other.column);
  }
};


struct SourceRange {
  SourceLocation start;
  SourceLocation end;

  SourceRange() :
      start(0, 0),
      end(0, 0) {}

  SourceRange(const SourceLocation& start, const SourceLocation& end) :
      start(start),
      end(end) {}

  SourceRange(size_t start_line, size_t start_column, size_t end_line, size_t end_column) :
      start(start_line, start_column),
      end(end_line, end_column) {}

  SourceRange(const SourceRange& start, const SourceRange& end) :
      start(start.start),
      end(end.end) {}

  bool operator==(const SourceRange& other) const { return start == other.start && end == other.end; }

  bool is_known() const { return start.line > 0; }

  // unknown ranges intersect nothing
  bool Intersects(const SourceRange& other) const {
    if (!is_known() || !other.is_known()) {
      return false;
    }
    return start <= other.end && other.start <= end;
  }

  // "line:column-line:column"
  void Print(std::ostream& stream) const;
};


}  // namespace brite

#endif  // BRITE_CHECKER_LOCATION_H_
