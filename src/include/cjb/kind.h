#pragma once

#include <string>

namespace cjb {

enum class Kind {
    Invalid,
    Null,
    Boolean,
    Number,
    String,
    Array,
    Object,
    Raw
};

// Lower-case name used in error messages and by cjq.
const char* kind_name(Kind kind) noexcept;

}  // namespace cjb
