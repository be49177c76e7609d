#include <cjb/kind.h>

namespace cjb {

const char* kind_name(Kind kind) noexcept {
    switch (kind) {
        case Kind::Null:
            return "null";
        case Kind::Boolean:
            return "boolean";
        case Kind::Number:
            return "number";
        case Kind::String:
            return "string";
        case Kind::Array:
            return "array";
        case Kind::Object:
            return "object";
        case Kind::Raw:
            return "raw";
        case Kind::Invalid:
            break;
    }
    return "invalid";
}

}  // namespace cjb
