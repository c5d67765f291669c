#include "memory_tracking.hpp"

namespace MemoryTracking {
std::atomic<size_t> g_list_count{0};
std::atomic<size_t> g_dict_count{0};
std::atomic<size_t> g_instance_count{0};
std::atomic<size_t> g_function_count{0};
std::atomic<size_t> g_class_count{0};
}  // namespace MemoryTracking
