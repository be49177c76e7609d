#pragma once

#include <cstddef>

namespace cjb {

using MallocFn = void* (*)(std::size_t size);
using FreeFn = void (*)(void* ptr);

// Route every cJSON allocation through the given functions. Process-wide:
// must not race with any other cjb call, and every tree allocated before the
// switch must be destroyed before the switch happens.
// Passing nullptr for either function selects the C library default for it.
void set_allocator(MallocFn malloc_fn, FreeFn free_fn);

// Back to malloc/free.
void reset_allocator();

}  // namespace cjb
