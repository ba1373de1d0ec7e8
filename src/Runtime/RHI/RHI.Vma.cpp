// RHI.Vma.cpp – *no* `module;` here, this is just a normal TU.

#include <cstdlib>
#include <cstdio>

#define VK_NO_PROTOTYPES
#include <volk.h>

// VMA config – must match everywhere you include vk_mem_alloc.h
#define VMA_IMPLEMENTATION
#define VMA_STATIC_VULKAN_FUNCTIONS 0
#define VMA_DYNAMIC_VULKAN_FUNCTIONS 1
#define VMA_USE_NULLABILITY_ANNOTATIONS 0

#include <vk_mem_alloc.h>
