module;
#include "RHI.Vulkan.hpp"
#include <vector>

module RHI:Descriptors.Impl;
import :Descriptors;
import Core;

namespace RHI
{
    // --- Descriptor Layout ---
    DescriptorLayout::DescriptorLayout(VulkanDevice& device, std::vector<VkDescriptorSetLayoutBinding> bindings)
        : m_Device(device), m_Bindings(std::move(bindings))
    {
        VkDescriptorSetLayoutCreateInfo layoutInfo{};
        layoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
        layoutInfo.bindingCount = static_cast<uint32_t>(m_Bindings.size());
        layoutInfo.pBindings = m_Bindings.data();

        if (vkCreateDescriptorSetLayout(m_Device.GetLogicalDevice(), &layoutInfo, nullptr, &m_Layout) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create descriptor set layout ({} bindings)!", m_Bindings.size());
            m_Layout = VK_NULL_HANDLE;
            m_IsValid = false;
        }
    }

    DescriptorLayout::~DescriptorLayout()
    {
        if (m_Layout) vkDestroyDescriptorSetLayout(m_Device.GetLogicalDevice(), m_Layout, nullptr);
    }

    // --- Descriptor Pool ---
    DescriptorPool::DescriptorPool(VulkanDevice& device, const std::vector<VkDescriptorPoolSize>& sizes,
                                   uint32_t maxSets)
        : m_Device(device)
    {
        VkDescriptorPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
        poolInfo.poolSizeCount = static_cast<uint32_t>(sizes.size());
        poolInfo.pPoolSizes = sizes.data();
        poolInfo.maxSets = maxSets;

        if (vkCreateDescriptorPool(m_Device.GetLogicalDevice(), &poolInfo, nullptr, &m_Pool) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create descriptor pool (maxSets={})!", maxSets);
            m_Pool = VK_NULL_HANDLE;
            m_IsValid = false;
        }
    }

    DescriptorPool::~DescriptorPool()
    {
        if (!m_Pool) return;
        // Sets may still be referenced by in-flight command buffers.
        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        VkDescriptorPool pool = m_Pool;
        m_Device.SafeDestroy([logicalDevice, pool]()
        {
            vkDestroyDescriptorPool(logicalDevice, pool, nullptr);
        });
    }

    VkDescriptorSet DescriptorPool::Allocate(VkDescriptorSetLayout layout)
    {
        if (!m_IsValid) return VK_NULL_HANDLE;

        VkDescriptorSetAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
        allocInfo.descriptorPool = m_Pool;
        allocInfo.descriptorSetCount = 1;
        allocInfo.pSetLayouts = &layout;

        VkDescriptorSet set = VK_NULL_HANDLE;
        if (vkAllocateDescriptorSets(m_Device.GetLogicalDevice(), &allocInfo, &set) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to allocate descriptor set!");
            return VK_NULL_HANDLE;
        }
        return set;
    }

    void WriteBufferDescriptor(const VulkanDevice& device, VkDescriptorSet set, uint32_t binding,
                               VkDescriptorType type, VkBuffer buffer, VkDeviceSize range)
    {
        VkDescriptorBufferInfo bufferInfo{};
        bufferInfo.buffer = buffer;
        bufferInfo.offset = 0;
        bufferInfo.range = range;

        VkWriteDescriptorSet write{};
        write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        write.dstSet = set;
        write.dstBinding = binding;
        write.descriptorCount = 1;
        write.descriptorType = type;
        write.pBufferInfo = &bufferInfo;

        vkUpdateDescriptorSets(device.GetLogicalDevice(), 1, &write, 0, nullptr);
    }

    void WriteImageDescriptor(const VulkanDevice& device, VkDescriptorSet set, uint32_t binding, VkImageView view)
    {
        VkDescriptorImageInfo imageInfo{};
        imageInfo.imageView = view;
        imageInfo.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;

        VkWriteDescriptorSet write{};
        write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        write.dstSet = set;
        write.dstBinding = binding;
        write.descriptorCount = 1;
        write.descriptorType = VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE;
        write.pImageInfo = &imageInfo;

        vkUpdateDescriptorSets(device.GetLogicalDevice(), 1, &write, 0, nullptr);
    }

    void WriteSamplerDescriptor(const VulkanDevice& device, VkDescriptorSet set, uint32_t binding, VkSampler sampler)
    {
        VkDescriptorImageInfo imageInfo{};
        imageInfo.sampler = sampler;

        VkWriteDescriptorSet write{};
        write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        write.dstSet = set;
        write.dstBinding = binding;
        write.descriptorCount = 1;
        write.descriptorType = VK_DESCRIPTOR_TYPE_SAMPLER;
        write.pImageInfo = &imageInfo;

        vkUpdateDescriptorSets(device.GetLogicalDevice(), 1, &write, 0, nullptr);
    }
}
