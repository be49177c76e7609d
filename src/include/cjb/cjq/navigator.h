#pragma once

#include <cjb/cjq/path_parser.h>
#include <cjb/value.h>

#include <vector>

namespace cjb {
namespace cjq {

// Walks a document along parsed path segments. Results are views into the
// document and share its lifetime.
class Navigator {
  public:
    // Throws cjb::NotFound for a missing key or index and cjb::TypeMismatch
    // when a segment tries to descend into a scalar.
    ValueRef navigate(ValueRef root, const std::vector<PathSegment>& segments) const;

    // `*` expands to every child of an array or object. Returns an empty
    // vector when a wildcard expands nothing.
    std::vector<ValueRef> navigateWildcard(ValueRef root, const std::vector<PathSegment>& segments) const;

  private:
    ValueRef step(ValueRef current, const PathSegment& segment) const;
};

}  // namespace cjq
}  // namespace cjb
