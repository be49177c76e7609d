#include <cjb/hooks.h>

#include <cjson/cJSON.h>

namespace cjb {

void set_allocator(MallocFn malloc_fn, FreeFn free_fn) {
    cJSON_Hooks hooks;
    hooks.malloc_fn = malloc_fn;
    hooks.free_fn = free_fn;
    cJSON_InitHooks(&hooks);
}

void reset_allocator() { cJSON_InitHooks(nullptr); }

}  // namespace cjb
