#pragma once

#include <atomic>
#include <cstddef>

// Live counts of the reference-shared runtime values. Bumped by their
// constructors/destructors, so a test can check that a run left nothing behind.
namespace MemoryTracking {
extern std::atomic<size_t> g_list_count;
extern std::atomic<size_t> g_dict_count;
extern std::atomic<size_t> g_instance_count;
extern std::atomic<size_t> g_function_count;
extern std::atomic<size_t> g_class_count;

inline size_t live_containers() {
    return g_list_count.load() + g_dict_count.load() + g_instance_count.load();
}
}  // namespace MemoryTracking
