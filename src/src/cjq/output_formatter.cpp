#include <cjb/cjq/output_formatter.h>

#include <sstream>

namespace cjb {
namespace cjq {

std::string OutputFormatter::formatRaw(ValueRef value) const {
    switch (value.kind()) {
        case Kind::String:
            return value.as_string();
        case Kind::Raw:
            return value.as_raw();
        case Kind::Boolean:
            return value.as_bool() ? "true" : "false";
        case Kind::Null:
        case Kind::Number:
            // cJSON's own number formatting
            return value.dump(Format::Compact);
        case Kind::Array:
        case Kind::Object:
            return value.dump(format_);
        case Kind::Invalid:
            break;
    }
    throw TypeMismatch("cannot format a value of invalid kind");
}

std::string OutputFormatter::formatRaw(const std::vector<ValueRef>& values) const {
    std::ostringstream oss;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << "\n";
        oss << formatRaw(values[i]);
    }
    return oss.str();
}

std::string OutputFormatter::formatJson(ValueRef value) const { return value.dump(format_); }

std::string OutputFormatter::formatJson(const std::vector<ValueRef>& values) const {
    Value gathered = Value::array();
    for (ValueRef v : values) gathered.append(v.clone());
    return gathered.dump(format_);
}

}  // namespace cjq
}  // namespace cjb
