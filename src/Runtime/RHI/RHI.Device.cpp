module;
#include <vector>
#include <string>
#include <set>
#include <functional>

#include "RHI.Vulkan.hpp"

module RHI:Device.Impl;
import :Device;
import Core;

namespace RHI
{
    const std::vector<const char*> DEVICE_EXTENSIONS = {
        VK_KHR_SWAPCHAIN_EXTENSION_NAME
    };

    VulkanDevice::VulkanDevice(VulkanContext& context, VkSurfaceKHR surface)
        : m_Surface(surface)
    {
        PickPhysicalDevice(context.GetInstance());
        if (m_PhysicalDevice == VK_NULL_HANDLE)
        {
            m_IsValid = false;
            return;
        }

        CreateLogicalDevice(context);
        if (m_Device == VK_NULL_HANDLE || !m_IsValid)
        {
            m_IsValid = false;
            return;
        }

        CreateCommandPool();
    }

    VulkanDevice::~VulkanDevice()
    {
        if (m_Device) vkDeviceWaitIdle(m_Device);

        // Nothing is in flight any more: run every parked deleter.
        for (auto& fn : m_PendingDeletions) fn();
        m_PendingDeletions.clear();
        for (auto& queue : m_DeletionQueue)
        {
            for (auto& fn : queue) fn();
            queue.clear();
        }

        if (m_CommandPool) vkDestroyCommandPool(m_Device, m_CommandPool, nullptr);
        if (m_Allocator) vmaDestroyAllocator(m_Allocator);
        if (m_Device) vkDestroyDevice(m_Device, nullptr);
    }

    VkResult VulkanDevice::SubmitToGraphicsQueue(const VkSubmitInfo& submitInfo, VkFence fence)
    {
        return vkQueueSubmit(m_GraphicsQueue, 1, &submitInfo, fence);
    }

    VkResult VulkanDevice::Present(const VkPresentInfoKHR& presentInfo)
    {
        return vkQueuePresentKHR(m_PresentQueue, &presentInfo);
    }

    void VulkanDevice::SafeDestroy(std::function<void()>&& deleteFn)
    {
        m_PendingDeletions.push_back(std::move(deleteFn));
    }

    void VulkanDevice::CommitDeletions(uint32_t frameIndex)
    {
        auto& queue = m_DeletionQueue[frameIndex % MAX_FRAMES_IN_FLIGHT];
        for (auto& fn : m_PendingDeletions) queue.push_back(std::move(fn));
        m_PendingDeletions.clear();
    }

    void VulkanDevice::FlushDeletionQueue(uint32_t frameIndex)
    {
        auto& queue = m_DeletionQueue[frameIndex % MAX_FRAMES_IN_FLIGHT];
        for (auto& fn : queue) fn();
        queue.clear();
    }

    size_t VulkanDevice::GetPendingDeletionCount() const
    {
        size_t count = m_PendingDeletions.size();
        for (const auto& queue : m_DeletionQueue) count += queue.size();
        return count;
    }

    void VulkanDevice::WaitIdle() const
    {
        if (m_Device) VK_CHECK(vkDeviceWaitIdle(m_Device));
    }

    void VulkanDevice::PickPhysicalDevice(VkInstance instance)
    {
        uint32_t deviceCount = 0;
        vkEnumeratePhysicalDevices(instance, &deviceCount, nullptr);

        if (deviceCount == 0)
        {
            Core::Log::Error("Failed to find GPUs with Vulkan support!");
            m_IsValid = false;
            return;
        }

        std::vector<VkPhysicalDevice> devices(deviceCount);
        vkEnumeratePhysicalDevices(instance, &deviceCount, devices.data());

        // Prefer a discrete GPU, otherwise take the first suitable one.
        for (const auto& device : devices)
        {
            if (!IsDeviceSuitable(device)) continue;

            VkPhysicalDeviceProperties props;
            vkGetPhysicalDeviceProperties(device, &props);
            if (m_PhysicalDevice == VK_NULL_HANDLE || props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU)
            {
                m_PhysicalDevice = device;
            }
            if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) break;
        }

        if (m_PhysicalDevice == VK_NULL_HANDLE)
        {
            Core::Log::Error("Failed to find a suitable GPU! Checked {} devices.", deviceCount);
            m_IsValid = false;
        }
        else
        {
            VkPhysicalDeviceProperties props;
            vkGetPhysicalDeviceProperties(m_PhysicalDevice, &props);
            Core::Log::Info("Selected GPU: {}", props.deviceName);
            m_MaxSamplerAnisotropy = props.limits.maxSamplerAnisotropy;
        }
    }

    void VulkanDevice::CreateLogicalDevice(VulkanContext& context)
    {
        m_Indices = FindQueueFamilies(m_PhysicalDevice);

        std::vector<VkDeviceQueueCreateInfo> queueCreateInfos;
        std::set<uint32_t> uniqueQueueFamilies;
        uniqueQueueFamilies.insert(m_Indices.GraphicsFamily.value());
        if (m_Indices.PresentFamily.has_value())
            uniqueQueueFamilies.insert(m_Indices.PresentFamily.value());

        float queuePriority = 1.0f;
        for (uint32_t queueFamily : uniqueQueueFamilies)
        {
            VkDeviceQueueCreateInfo queueCreateInfo{};
            queueCreateInfo.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
            queueCreateInfo.queueFamilyIndex = queueFamily;
            queueCreateInfo.queueCount = 1;
            queueCreateInfo.pQueuePriorities = &queuePriority;
            queueCreateInfos.push_back(queueCreateInfo);
        }

        VkPhysicalDeviceVulkan13Features supported13{};
        supported13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
        VkPhysicalDeviceFeatures2 supported{};
        supported.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
        supported.pNext = &supported13;
        vkGetPhysicalDeviceFeatures2(m_PhysicalDevice, &supported);

        if (!supported13.dynamicRendering || !supported13.synchronization2)
        {
            Core::Log::Error("Vulkan 1.3 dynamic rendering / synchronization2 not supported by the selected GPU!");
            m_IsValid = false;
            return;
        }

        // Enable only what the renderer uses.
        VkPhysicalDeviceVulkan13Features features13{};
        features13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
        features13.dynamicRendering = VK_TRUE;
        features13.synchronization2 = VK_TRUE;

        VkPhysicalDeviceFeatures2 features2{};
        features2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
        features2.pNext = &features13;
        features2.features.samplerAnisotropy = supported.features.samplerAnisotropy;
        m_SamplerAnisotropy = supported.features.samplerAnisotropy == VK_TRUE;

        VkDeviceCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
        createInfo.pNext = &features2;
        createInfo.queueCreateInfoCount = static_cast<uint32_t>(queueCreateInfos.size());
        createInfo.pQueueCreateInfos = queueCreateInfos.data();

        std::vector<const char*> enabledExtensions;
        if (m_Surface != VK_NULL_HANDLE)
        {
            enabledExtensions = DEVICE_EXTENSIONS;
        }

        createInfo.enabledExtensionCount = static_cast<uint32_t>(enabledExtensions.size());
        createInfo.ppEnabledExtensionNames = enabledExtensions.data();
        createInfo.enabledLayerCount = 0;

        if (VkResult result = vkCreateDevice(m_PhysicalDevice, &createInfo, nullptr, &m_Device); result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create logical device! Error Code: {}", static_cast<int>(result));
            m_Device = VK_NULL_HANDLE;
            m_IsValid = false;
            return;
        }

        volkLoadDevice(m_Device);

        VmaVulkanFunctions vulkanFunctions = {};
        vulkanFunctions.vkGetInstanceProcAddr = vkGetInstanceProcAddr;
        vulkanFunctions.vkGetDeviceProcAddr = vkGetDeviceProcAddr;

        VmaAllocatorCreateInfo allocatorInfo = {};
        allocatorInfo.vulkanApiVersion = VK_API_VERSION_1_3;
        allocatorInfo.physicalDevice = m_PhysicalDevice;
        allocatorInfo.device = m_Device;
        allocatorInfo.instance = context.GetInstance();
        allocatorInfo.pVulkanFunctions = &vulkanFunctions;

        if (vmaCreateAllocator(&allocatorInfo, &m_Allocator) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create VMA allocator!");
            m_IsValid = false;
            return;
        }

        vkGetDeviceQueue(m_Device, m_Indices.GraphicsFamily.value(), 0, &m_GraphicsQueue);
        if (m_Indices.PresentFamily.has_value())
        {
            vkGetDeviceQueue(m_Device, m_Indices.PresentFamily.value(), 0, &m_PresentQueue);
        }
    }

    void VulkanDevice::CreateCommandPool()
    {
        VkCommandPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        poolInfo.flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT | VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
        poolInfo.queueFamilyIndex = m_Indices.GraphicsFamily.value();

        if (vkCreateCommandPool(m_Device, &poolInfo, nullptr, &m_CommandPool) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create command pool!");
            m_IsValid = false;
        }
    }

    bool VulkanDevice::IsDeviceSuitable(VkPhysicalDevice device)
    {
        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties(device, &props);

        if (props.apiVersion < VK_API_VERSION_1_3)
        {
            Core::Log::Warn("GPU '{}' rejected: Vulkan 1.3 not supported.", props.deviceName);
            return false;
        }

        QueueFamilyIndices indices = FindQueueFamilies(device);
        bool extensionsSupported = CheckDeviceExtensionSupport(device);

        bool swapChainAdequate = true;
        if (extensionsSupported && m_Surface != VK_NULL_HANDLE)
        {
            uint32_t formatCount = 0;
            vkGetPhysicalDeviceSurfaceFormatsKHR(device, m_Surface, &formatCount, nullptr);

            uint32_t presentModeCount = 0;
            vkGetPhysicalDeviceSurfacePresentModesKHR(device, m_Surface, &presentModeCount, nullptr);

            swapChainAdequate = (formatCount != 0) && (presentModeCount != 0);
        }

        // Diagnostics
        if (!indices.GraphicsFamily.has_value())
            Core::Log::Warn("GPU '{}' rejected: No Graphics Queue.", props.deviceName);

        if (m_Surface != VK_NULL_HANDLE && !indices.PresentFamily.has_value())
            Core::Log::Warn("GPU '{}' rejected: No Presentation Queue support.", props.deviceName);

        if (!extensionsSupported)
            Core::Log::Warn("GPU '{}' rejected: Missing required extensions.", props.deviceName);

        if (!swapChainAdequate)
            Core::Log::Warn("GPU '{}' rejected: Swapchain incompatible (formats/modes).", props.deviceName);

        return indices.IsComplete(m_Surface != VK_NULL_HANDLE) && extensionsSupported && swapChainAdequate;
    }

    bool VulkanDevice::CheckDeviceExtensionSupport(VkPhysicalDevice device)
    {
        if (m_Surface == VK_NULL_HANDLE) return true;

        uint32_t extensionCount;
        vkEnumerateDeviceExtensionProperties(device, nullptr, &extensionCount, nullptr);

        std::vector<VkExtensionProperties> availableExtensions(extensionCount);
        vkEnumerateDeviceExtensionProperties(device, nullptr, &extensionCount, availableExtensions.data());

        std::set<std::string> requiredExtensions(DEVICE_EXTENSIONS.begin(), DEVICE_EXTENSIONS.end());
        for (const auto& extension : availableExtensions)
        {
            requiredExtensions.erase(extension.extensionName);
        }

        return requiredExtensions.empty();
    }

    QueueFamilyIndices VulkanDevice::FindQueueFamilies(VkPhysicalDevice device)
    {
        QueueFamilyIndices indices;
        uint32_t queueFamilyCount = 0;

        vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, nullptr);

        std::vector<VkQueueFamilyProperties> queueFamilies(queueFamilyCount);
        vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, queueFamilies.data());

        for (uint32_t i = 0; i < queueFamilyCount; ++i)
        {
            if ((queueFamilies[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) && !indices.GraphicsFamily.has_value())
            {
                indices.GraphicsFamily = i;
            }

            if (m_Surface != VK_NULL_HANDLE)
            {
                VkBool32 presentSupport = VK_FALSE;
                vkGetPhysicalDeviceSurfaceSupportKHR(device, i, m_Surface, &presentSupport);
                // Prefer the graphics family for presentation so one queue serves both.
                if (presentSupport && (!indices.PresentFamily.has_value() || indices.GraphicsFamily == i))
                {
                    indices.PresentFamily = i;
                }
            }
        }
        return indices;
    }

    SwapchainSupportDetails VulkanDevice::QuerySwapchainSupport() const
    {
        SwapchainSupportDetails details;
        if (m_Surface == VK_NULL_HANDLE) return details;

        vkGetPhysicalDeviceSurfaceCapabilitiesKHR(m_PhysicalDevice, m_Surface, &details.Capabilities);

        uint32_t formatCount;
        vkGetPhysicalDeviceSurfaceFormatsKHR(m_PhysicalDevice, m_Surface, &formatCount, nullptr);
        if (formatCount != 0)
        {
            details.Formats.resize(formatCount);
            vkGetPhysicalDeviceSurfaceFormatsKHR(m_PhysicalDevice, m_Surface, &formatCount, details.Formats.data());
        }

        uint32_t presentModeCount;
        vkGetPhysicalDeviceSurfacePresentModesKHR(m_PhysicalDevice, m_Surface, &presentModeCount, nullptr);
        if (presentModeCount != 0)
        {
            details.PresentModes.resize(presentModeCount);
            vkGetPhysicalDeviceSurfacePresentModesKHR(m_PhysicalDevice, m_Surface, &presentModeCount,
                                                      details.PresentModes.data());
        }
        return details;
    }
}
