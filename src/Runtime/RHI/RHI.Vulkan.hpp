#pragma once

// Every translation unit that touches Vulkan goes through this header so
// VK_NO_PROTOTYPES is never forgotten (volk owns the function pointers).
#ifndef VK_NO_PROTOTYPES
    #define VK_NO_PROTOTYPES
#endif

#include <volk.h>
#include <cstdio>

// VMA declarations only. VMA_IMPLEMENTATION lives in RHI.Vma.cpp.
#include <vk_mem_alloc.h>

// For Vulkan calls that have no recoverable path: log and continue.
#ifndef NDEBUG
    #define VK_CHECK(x)                                                              \
        do {                                                                         \
            VkResult result = x;                                                     \
            if (result != VK_SUCCESS) {                                              \
                fprintf(stderr, "Vulkan Error: %s failed with result %d at %s:%d\n", \
                       #x, result, __FILE__, __LINE__);                              \
            }                                                                        \
        } while(0)
#else
    #define VK_CHECK(x) (void)(x)
#endif
