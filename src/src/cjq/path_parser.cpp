#include <cjb/cjq/path_parser.h>

#include <cctype>
#include <limits>
#include <stdexcept>
#include <utility>

namespace cjb {
namespace cjq {

PathSegment PathSegment::key(const std::string& name) { return PathSegment(Type::Key, name, 0); }

PathSegment PathSegment::index(std::size_t position, const std::string& text) {
    return PathSegment(Type::Index, text, position);
}

PathSegment PathSegment::wildcard() { return PathSegment(Type::Wildcard, "*", 0); }

PathSegment::PathSegment(Type type, std::string text, std::size_t position)
    : type_(type), text_(std::move(text)), position_(position) {}

std::size_t PathSegment::position() const {
    if (type_ != Type::Index) throw std::logic_error("path segment '" + text_ + "' is not an index");
    return position_;
}

std::vector<PathSegment> PathParser::parse(const std::string& path) const {
    if (path.empty()) throw std::invalid_argument("Path cannot be empty");

    const char separator =
                (path.find('/') == std::string::npos and path.find('.') != std::string::npos) ? '.' : '/';

    if (path.front() == separator or path.back() == separator) {
        std::string msg = "Path cannot start or end with '";
        msg += separator;
        msg += "'";
        throw std::invalid_argument(msg);
    }

    std::vector<PathSegment> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t stop = path.find(separator, start);
        if (stop == std::string::npos) stop = path.size();
        std::string segment = path.substr(start, stop - start);
        if (segment.empty()) throw std::invalid_argument("Path cannot contain empty segments");

        if (segment == "*") {
            segments.push_back(PathSegment::wildcard());
        } else if (isDigits(segment)) {
            unsigned long long position = 0;
            try {
                position = std::stoull(segment);
            } catch (const std::out_of_range&) {
                position = std::numeric_limits<unsigned long long>::max();
            }
            segments.push_back(PathSegment::index(static_cast<std::size_t>(position), segment));
        } else if (segment[0] == '-' and isDigits(segment.substr(1))) {
            throw std::invalid_argument("Array indices must be non-negative: " + segment);
        } else {
            segments.push_back(PathSegment::key(segment));
        }
        start = stop + 1;
    }
    return segments;
}

bool PathParser::isDigits(const std::string& segment) {
    if (segment.empty()) return false;
    for (char c : segment) {
        if (not std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool hasWildcard(const std::vector<PathSegment>& segments) {
    for (auto const& s : segments) {
        if (s.isWildcard()) return true;
    }
    return false;
}

}  // namespace cjq
}  // namespace cjb
