module;
#include <cstdint>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:Descriptors;

import :Device;

export namespace RHI
{
    class DescriptorLayout
    {
    public:
        DescriptorLayout(VulkanDevice& device, std::vector<VkDescriptorSetLayoutBinding> bindings);
        ~DescriptorLayout();

        DescriptorLayout(const DescriptorLayout&) = delete;
        DescriptorLayout& operator=(const DescriptorLayout&) = delete;

        [[nodiscard]] VkDescriptorSetLayout GetHandle() const { return m_Layout; }
        [[nodiscard]] const std::vector<VkDescriptorSetLayoutBinding>& GetBindings() const { return m_Bindings; }
        [[nodiscard]] bool IsValid() const { return m_IsValid; }

    private:
        VulkanDevice& m_Device;
        std::vector<VkDescriptorSetLayoutBinding> m_Bindings;
        bool m_IsValid = true;
        VkDescriptorSetLayout m_Layout = VK_NULL_HANDLE;
    };

    class DescriptorPool
    {
    public:
        DescriptorPool(VulkanDevice& device, const std::vector<VkDescriptorPoolSize>& sizes, uint32_t maxSets);
        ~DescriptorPool();

        DescriptorPool(const DescriptorPool&) = delete;
        DescriptorPool& operator=(const DescriptorPool&) = delete;

        // Allocate a single set from the pool using the given layout
        [[nodiscard]] VkDescriptorSet Allocate(VkDescriptorSetLayout layout);
        [[nodiscard]] bool IsValid() const { return m_IsValid; }

    private:
        VulkanDevice& m_Device;
        bool m_IsValid = true;
        VkDescriptorPool m_Pool = VK_NULL_HANDLE;
    };

    // Immediate descriptor writes. The set must not be in use by a pending submission.
    void WriteBufferDescriptor(const VulkanDevice& device, VkDescriptorSet set, uint32_t binding,
                               VkDescriptorType type, VkBuffer buffer, VkDeviceSize range);
    void WriteImageDescriptor(const VulkanDevice& device, VkDescriptorSet set, uint32_t binding, VkImageView view);
    void WriteSamplerDescriptor(const VulkanDevice& device, VkDescriptorSet set, uint32_t binding, VkSampler sampler);
}
