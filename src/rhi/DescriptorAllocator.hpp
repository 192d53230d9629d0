#pragma once
#include "core/Base.hpp"
#include <vector>
#include <volk.h>

namespace Batchline
{
    /**
     * @brief Growable descriptor set allocator.
     * Sets are allocated from the current pool; a full pool is retired and a new one is grabbed.
     * ResetPools() recycles every pool at once, so sets allocated here live until the next reset.
     */
    class DescriptorAllocator
    {
    public:
        DescriptorAllocator( VkDevice device, const VolkDeviceTable* api );
        ~DescriptorAllocator();

        DescriptorAllocator( const DescriptorAllocator& )            = delete;
        DescriptorAllocator& operator=( const DescriptorAllocator& ) = delete;

        void Shutdown();

        // Returns OUT_OF_MEMORY when no pool can satisfy the request
        Result Allocate( VkDescriptorSetLayout layout, VkDescriptorSet& outSet );

        void ResetPools();

    private:
        VkDescriptorPool GrabPool();
        VkDescriptorPool CreatePool( uint32_t maxSets );

    private:
        VkDevice               m_device;
        const VolkDeviceTable* m_api;

        VkDescriptorPool              m_currentPool = VK_NULL_HANDLE;
        std::vector<VkDescriptorPool> m_usedPools;
        std::vector<VkDescriptorPool> m_freePools;
    };
} // namespace Batchline
