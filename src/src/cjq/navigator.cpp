#include <cjb/cjq/navigator.h>

#include <sstream>
#include <stdexcept>

namespace cjb {
namespace cjq {

ValueRef Navigator::step(ValueRef current, const PathSegment& segment) const {
    if (not current.is_container()) {
        std::ostringstream oss;
        oss << "Cannot descend into " << kind_name(current.kind()) << " with '" << segment.text() << "'";
        throw TypeMismatch(oss.str());
    }
    // Digit segments name a position in arrays and a member in objects.
    if (segment.isIndex() and current.is_array()) return current.at(segment.position());
    if (not current.is_object()) {
        std::ostringstream oss;
        oss << "Key '" << segment.text() << "' used on an array";
        throw TypeMismatch(oss.str());
    }
    return current.at(segment.text());
}

ValueRef Navigator::navigate(ValueRef root, const std::vector<PathSegment>& segments) const {
    ValueRef current = root;
    for (auto const& segment : segments) {
        if (segment.isWildcard())
            throw std::invalid_argument("Wildcards require navigateWildcard(), not navigate()");
        current = step(current, segment);
    }
    return current;
}

std::vector<ValueRef> Navigator::navigateWildcard(ValueRef root,
                                                  const std::vector<PathSegment>& segments) const {
    std::vector<ValueRef> results;
    std::vector<ValueRef> frontier{root};

    for (auto const& segment : segments) {
        std::vector<ValueRef> next;
        for (ValueRef node : frontier) {
            if (segment.isWildcard()) {
                if (not node.is_container()) {
                    std::ostringstream oss;
                    oss << "Cannot expand '*' on " << kind_name(node.kind());
                    throw TypeMismatch(oss.str());
                }
                for (ValueRef child : node) next.push_back(child);
            } else {
                next.push_back(step(node, segment));
            }
        }
        frontier.swap(next);
    }

    results.swap(frontier);
    return results;
}

}  // namespace cjq
}  // namespace cjb
