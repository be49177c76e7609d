#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace cjb {
namespace cjq {

// One step of a query path: a member name, an array position, or `*`.
class PathSegment {
  public:
    enum class Type { Key, Index, Wildcard };

    static PathSegment key(const std::string& name);
    static PathSegment index(std::size_t position, const std::string& text);
    static PathSegment wildcard();

    Type type() const { return type_; }
    bool isKey() const { return type_ == Type::Key; }
    bool isIndex() const { return type_ == Type::Index; }
    bool isWildcard() const { return type_ == Type::Wildcard; }

    // Segment as written. For an index this is the digit string, which is
    // also the member name used when the index lands on an object.
    const std::string& text() const { return text_; }
    std::size_t position() const;

  private:
    PathSegment(Type type, std::string text, std::size_t position);

    Type type_;
    std::string text_;
    std::size_t position_;
};

// Splits "a/b/0/*" (or "a.b.0.*" when there is no slash) into segments.
// Throws std::invalid_argument for empty paths and empty segments.
class PathParser {
  public:
    std::vector<PathSegment> parse(const std::string& path) const;

    static bool isDigits(const std::string& segment);
};

bool hasWildcard(const std::vector<PathSegment>& segments);

}  // namespace cjq
}  // namespace cjb
