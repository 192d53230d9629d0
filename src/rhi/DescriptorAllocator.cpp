#include "rhi/DescriptorAllocator.hpp"

#include <array>

namespace Batchline
{
    static constexpr uint32_t MAX_SETS_PER_POOL = 256;

    // Camera UBOs, culling SSBOs and atlas samplers
    static constexpr std::array<VkDescriptorPoolSize, 3> POOL_SIZES = { { { VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, 256 },
                                                                          { VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 768 },
                                                                          { VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 256 } } };

    DescriptorAllocator::DescriptorAllocator( VkDevice device, const VolkDeviceTable* api )
        : m_device( device )
        , m_api( api )
    {
    }

    DescriptorAllocator::~DescriptorAllocator()
    {
        Shutdown();
    }

    void DescriptorAllocator::Shutdown()
    {
        for( auto p: m_freePools )
        {
            m_api->vkDestroyDescriptorPool( m_device, p, nullptr );
        }
        for( auto p: m_usedPools )
        {
            m_api->vkDestroyDescriptorPool( m_device, p, nullptr );
        }

        m_freePools.clear();
        m_usedPools.clear();
        m_currentPool = VK_NULL_HANDLE;
    }

    Result DescriptorAllocator::Allocate( VkDescriptorSetLayout layout, VkDescriptorSet& outSet )
    {
        if( m_currentPool == VK_NULL_HANDLE )
        {
            m_currentPool = GrabPool();
            if( m_currentPool == VK_NULL_HANDLE )
                return Result::OUT_OF_MEMORY;
            m_usedPools.push_back( m_currentPool );
        }

        VkDescriptorSetAllocateInfo allocInfo = { VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO };
        allocInfo.descriptorPool              = m_currentPool;
        allocInfo.descriptorSetCount          = 1;
        allocInfo.pSetLayouts                 = &layout;

        VkResult result = m_api->vkAllocateDescriptorSets( m_device, &allocInfo, &outSet );

        // Pool exhausted or fragmented, retry once on a fresh pool
        if( result == VK_ERROR_OUT_OF_POOL_MEMORY || result == VK_ERROR_FRAGMENTED_POOL )
        {
            m_currentPool = GrabPool();
            if( m_currentPool == VK_NULL_HANDLE )
                return Result::OUT_OF_MEMORY;
            m_usedPools.push_back( m_currentPool );

            allocInfo.descriptorPool = m_currentPool;
            result                   = m_api->vkAllocateDescriptorSets( m_device, &allocInfo, &outSet );
        }

        if( result != VK_SUCCESS )
        {
            BL_CORE_ERROR( "Failed to allocate descriptor set! Error: {}", ( int )result );
            return Result::OUT_OF_MEMORY;
        }

        return Result::SUCCESS;
    }

    void DescriptorAllocator::ResetPools()
    {
        for( auto p: m_usedPools )
        {
            m_api->vkResetDescriptorPool( m_device, p, 0 );
            m_freePools.push_back( p );
        }

        m_usedPools.clear();
        m_currentPool = VK_NULL_HANDLE;
    }

    VkDescriptorPool DescriptorAllocator::GrabPool()
    {
        if( !m_freePools.empty() )
        {
            VkDescriptorPool pool = m_freePools.back();
            m_freePools.pop_back();
            return pool;
        }

        return CreatePool( MAX_SETS_PER_POOL );
    }

    VkDescriptorPool DescriptorAllocator::CreatePool( uint32_t maxSets )
    {
        VkDescriptorPoolCreateInfo poolInfo = { VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO };
        poolInfo.maxSets                    = maxSets;
        poolInfo.poolSizeCount              = static_cast<uint32_t>( POOL_SIZES.size() );
        poolInfo.pPoolSizes                 = POOL_SIZES.data();

        VkDescriptorPool pool = VK_NULL_HANDLE;
        if( m_api->vkCreateDescriptorPool( m_device, &poolInfo, nullptr, &pool ) != VK_SUCCESS )
        {
            BL_CORE_CRITICAL( "Failed to create descriptor pool!" );
            return VK_NULL_HANDLE;
        }

        return pool;
    }
} // namespace Batchline
