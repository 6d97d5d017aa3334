// storage for the dynamic dispatcher and the allocator implementation, compiled once
#include <vulkan/vulkan.hpp>
VULKAN_HPP_DEFAULT_DISPATCH_LOADER_DYNAMIC_STORAGE
#define VMA_IMPLEMENTATION
#include <vk_mem_alloc.h>
