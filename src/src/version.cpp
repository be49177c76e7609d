#include <cjb/version.h>

#include <cjson/cJSON.h>

namespace cjb {

LibraryVersion header_version() noexcept {
    return LibraryVersion{CJSON_VERSION_MAJOR, CJSON_VERSION_MINOR, CJSON_VERSION_PATCH};
}

std::string library_version() { return cJSON_Version(); }

int nesting_limit() noexcept { return CJSON_NESTING_LIMIT; }

}  // namespace cjb
