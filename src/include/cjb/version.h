#pragma once

#include <string>

#define CJB_VERSION_MAJOR 1
#define CJB_VERSION_MINOR 0
#define CJB_VERSION_PATCH 0

namespace cjb {

struct LibraryVersion {
    int major;
    int minor;
    int patch;
};

// Version of the cJSON headers cjb was compiled against.
LibraryVersion header_version() noexcept;

// Version string reported by the linked cJSON library, e.g. "1.7.17".
std::string library_version();

// Maximum array/object nesting cJSON accepts when parsing.
int nesting_limit() noexcept;

}  // namespace cjb
