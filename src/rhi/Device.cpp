#include "rhi/Device.hpp"

#include "core/FileSystem.hpp"
#include "rhi/RHI.hpp"
#include <sstream>
#include <vector>

namespace Batchline
{
    Device::Device( VkPhysicalDevice physicalDevice )
        : m_physicalDevice( physicalDevice )
    {
    }

    Device::~Device()
    {
        Shutdown();
    }

    Result Device::Init()
    {
        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties( m_physicalDevice, &props );
        m_name = props.deviceName;

        const int32_t family = FindUniversalQueueFamily();
        if( family < 0 )
        {
            BL_CORE_ERROR( "Adapter '{}' has no graphics+compute queue family!", m_name );
            return Result::FAIL;
        }

        float                   queuePriority   = 1.0f;
        VkDeviceQueueCreateInfo queueCreateInfo = { VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO };
        queueCreateInfo.queueFamilyIndex        = static_cast<uint32_t>( family );
        queueCreateInfo.queueCount              = 1;
        queueCreateInfo.pQueuePriorities        = &queuePriority;

        VkPhysicalDeviceVulkan12Features features12 = { VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES };
        features12.timelineSemaphore                = VK_TRUE;

        VkPhysicalDeviceVulkan13Features features13 = { VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES };
        features13.pNext                            = &features12;
        features13.synchronization2                 = VK_TRUE;
        features13.dynamicRendering                 = VK_TRUE;

        VkPhysicalDeviceFeatures2 deviceFeatures2 = { VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2 };
        deviceFeatures2.pNext                     = &features13;

        // Rendering is headless into caller-owned textures, no swapchain extension
        VkDeviceCreateInfo createInfo   = { VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO };
        createInfo.pNext                = &deviceFeatures2;
        createInfo.queueCreateInfoCount = 1;
        createInfo.pQueueCreateInfos    = &queueCreateInfo;

        if( vkCreateDevice( m_physicalDevice, &createInfo, nullptr, &m_device ) != VK_SUCCESS )
        {
            BL_CORE_ERROR( "Failed to create logical device on '{}'!", m_name );
            m_device = VK_NULL_HANDLE;
            return Result::FAIL;
        }

        volkLoadDeviceTable( &m_api, m_device );

        m_graphicsQueue = CreateRef<Queue>( m_device, m_api, static_cast<uint32_t>( family ), QueueType::GRAPHICS );
        if( m_graphicsQueue->GetTimelineSemaphore() == VK_NULL_HANDLE )
        {
            return Result::FAIL;
        }

        // VMA goes through the device table like everything else
        VmaVulkanFunctions vmaVulkanFunctions                      = {};
        vmaVulkanFunctions.vkGetInstanceProcAddr                   = vkGetInstanceProcAddr;
        vmaVulkanFunctions.vkGetDeviceProcAddr                     = vkGetDeviceProcAddr;
        vmaVulkanFunctions.vkGetPhysicalDeviceProperties           = vkGetPhysicalDeviceProperties;
        vmaVulkanFunctions.vkGetPhysicalDeviceMemoryProperties     = vkGetPhysicalDeviceMemoryProperties;
        vmaVulkanFunctions.vkGetPhysicalDeviceMemoryProperties2KHR = vkGetPhysicalDeviceMemoryProperties2;

        vmaVulkanFunctions.vkAllocateMemory               = m_api.vkAllocateMemory;
        vmaVulkanFunctions.vkFreeMemory                   = m_api.vkFreeMemory;
        vmaVulkanFunctions.vkMapMemory                    = m_api.vkMapMemory;
        vmaVulkanFunctions.vkUnmapMemory                  = m_api.vkUnmapMemory;
        vmaVulkanFunctions.vkFlushMappedMemoryRanges      = m_api.vkFlushMappedMemoryRanges;
        vmaVulkanFunctions.vkInvalidateMappedMemoryRanges = m_api.vkInvalidateMappedMemoryRanges;
        vmaVulkanFunctions.vkBindBufferMemory             = m_api.vkBindBufferMemory;
        vmaVulkanFunctions.vkBindImageMemory              = m_api.vkBindImageMemory;
        vmaVulkanFunctions.vkGetBufferMemoryRequirements  = m_api.vkGetBufferMemoryRequirements;
        vmaVulkanFunctions.vkGetImageMemoryRequirements   = m_api.vkGetImageMemoryRequirements;
        vmaVulkanFunctions.vkCreateBuffer                 = m_api.vkCreateBuffer;
        vmaVulkanFunctions.vkDestroyBuffer                = m_api.vkDestroyBuffer;
        vmaVulkanFunctions.vkCreateImage                  = m_api.vkCreateImage;
        vmaVulkanFunctions.vkDestroyImage                 = m_api.vkDestroyImage;
        vmaVulkanFunctions.vkCmdCopyBuffer                = m_api.vkCmdCopyBuffer;

        vmaVulkanFunctions.vkGetBufferMemoryRequirements2KHR = m_api.vkGetBufferMemoryRequirements2;
        vmaVulkanFunctions.vkGetImageMemoryRequirements2KHR  = m_api.vkGetImageMemoryRequirements2;
        vmaVulkanFunctions.vkBindBufferMemory2KHR            = m_api.vkBindBufferMemory2;
        vmaVulkanFunctions.vkBindImageMemory2KHR             = m_api.vkBindImageMemory2;

        VmaAllocatorCreateInfo allocatorInfo = {};
        allocatorInfo.physicalDevice         = m_physicalDevice;
        allocatorInfo.device                 = m_device;
        allocatorInfo.instance               = RHI::GetInstance();
        allocatorInfo.vulkanApiVersion       = VK_API_VERSION_1_3;
        allocatorInfo.pVulkanFunctions       = &vmaVulkanFunctions;

        if( vmaCreateAllocator( &allocatorInfo, &m_allocator ) != VK_SUCCESS )
        {
            BL_CORE_ERROR( "Failed to create VMA allocator!" );
            m_allocator = VK_NULL_HANDLE;
            return Result::FAIL;
        }

        m_descriptorAllocator = CreateScope<DescriptorAllocator>( m_device, &m_api );

        BL_CORE_INFO( "Logical device '{}' initialized, universal queue family {}.", m_name, family );
        return Result::SUCCESS;
    }

    void Device::Shutdown()
    {
        if( m_device == VK_NULL_HANDLE )
            return;

        m_api.vkDeviceWaitIdle( m_device );

        if( m_descriptorAllocator )
        {
            m_descriptorAllocator->Shutdown();
            m_descriptorAllocator.reset();
        }

        {
            std::lock_guard<std::mutex> lock( m_poolMutex );
            m_threadPools.clear();
        }

        m_graphicsQueue.reset();

        if( m_allocator != VK_NULL_HANDLE )
        {
            vmaDestroyAllocator( m_allocator );
            m_allocator = VK_NULL_HANDLE;
        }

        m_api.vkDestroyDevice( m_device, nullptr );
        m_device = VK_NULL_HANDLE;
    }

    VkCommandPool Device::GetOrCreateThreadLocalPool( uint32_t queueFamilyIndex )
    {
        std::thread::id tid = std::this_thread::get_id();

        std::lock_guard<std::mutex> lock( m_poolMutex );
        auto&                       familyMap = m_threadPools[ tid ];

        auto it = familyMap.find( queueFamilyIndex );
        if( it != familyMap.end() )
        {
            return it->second.handle;
        }

        VkCommandPoolCreateInfo poolInfo = { VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO };
        poolInfo.queueFamilyIndex        = queueFamilyIndex;
        poolInfo.flags                   = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT | VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;

        VkCommandPool pool = VK_NULL_HANDLE;
        if( m_api.vkCreateCommandPool( m_device, &poolInfo, nullptr, &pool ) != VK_SUCCESS )
        {
            BL_CORE_ERROR( "Failed to create thread-local command pool!" );
            return VK_NULL_HANDLE;
        }

        PoolInfo info;
        info.handle = pool;
        info.device = m_device;
        info.api    = &m_api;

        familyMap[ queueFamilyIndex ] = std::move( info );

        std::stringstream ss;
        ss << tid;
        BL_CORE_TRACE( "Created CommandPool for ThreadID: {} Family: {}", ss.str(), queueFamilyIndex );

        return pool;
    }

    Ref<CommandBuffer> Device::CreateCommandBuffer( QueueType type )
    {
        if( type == QueueType::TRANSFER || type == QueueType::_MAX_ENUM )
        {
            BL_CORE_ERROR( "Device only exposes the universal queue, {} command buffers are not supported.", ( int )type );
            return nullptr;
        }

        VkCommandPool pool = GetOrCreateThreadLocalPool( m_graphicsQueue->GetFamilyIndex() );
        if( pool == VK_NULL_HANDLE )
            return nullptr;

        VkCommandBufferAllocateInfo allocInfo = { VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO };
        allocInfo.commandPool                 = pool;
        allocInfo.level                       = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        allocInfo.commandBufferCount          = 1;

        VkCommandBuffer cmdBuffer = VK_NULL_HANDLE;
        if( m_api.vkAllocateCommandBuffers( m_device, &allocInfo, &cmdBuffer ) != VK_SUCCESS )
        {
            BL_CORE_ERROR( "Failed to allocate command buffer!" );
            return nullptr;
        }

        return CreateRef<CommandBuffer>( m_device, &m_api, pool, cmdBuffer, type );
    }

    Ref<Buffer> Device::CreateBuffer( const BufferDesc& desc )
    {
        auto buffer = CreateRef<Buffer>( m_allocator, m_device, &m_api );
        if( buffer->Create( desc ) != Result::SUCCESS )
        {
            return nullptr;
        }
        return buffer;
    }

    Ref<Texture> Device::CreateTexture( const TextureDesc& desc )
    {
        auto texture = CreateRef<Texture>( m_allocator, m_device, &m_api );
        if( texture->Create( desc ) != Result::SUCCESS )
        {
            return nullptr;
        }
        return texture;
    }

    Ref<Sampler> Device::CreateSampler( const SamplerDesc& desc )
    {
        auto sampler = CreateRef<Sampler>( m_device, &m_api, desc );
        if( !sampler->IsValid() )
        {
            return nullptr;
        }
        return sampler;
    }

    Ref<Shader> Device::CreateShader( const std::string& filepath )
    {
        auto shader = CreateRef<Shader>( m_device, &m_api, FileSystem::GetPath( filepath ).string() );
        if( !shader->IsValid() )
        {
            return nullptr;
        }
        return shader;
    }

    Ref<ComputePipeline> Device::CreateComputePipeline( const ComputePipelineDesc& desc )
    {
        auto pipeline = CreateRef<ComputePipeline>( m_device, &m_api, desc );
        if( !pipeline->IsValid() )
        {
            return nullptr;
        }
        return pipeline;
    }

    Ref<GraphicsPipeline> Device::CreateGraphicsPipeline( const GraphicsPipelineDesc& desc )
    {
        auto pipeline = CreateRef<GraphicsPipeline>( m_device, &m_api, desc );
        if( !pipeline->IsValid() )
        {
            return nullptr;
        }
        return pipeline;
    }

    Result Device::AllocateDescriptor( VkDescriptorSetLayout layout, VkDescriptorSet& outSet )
    {
        if( !m_descriptorAllocator )
        {
            return Result::FAIL;
        }
        return m_descriptorAllocator->Allocate( layout, outSet );
    }

    void Device::ResetDescriptorPools()
    {
        if( m_descriptorAllocator )
        {
            m_descriptorAllocator->ResetPools();
        }
    }

    void Device::UpdateDescriptorSets( const std::vector<VkWriteDescriptorSet>& writes )
    {
        if( writes.empty() )
            return;
        m_api.vkUpdateDescriptorSets( m_device, static_cast<uint32_t>( writes.size() ), writes.data(), 0, nullptr );
    }

    Result Device::WaitForQueue( const Ref<Queue>& queue, uint64_t waitValue, uint64_t timeout )
    {
        if( !queue )
            return Result::INVALID_ARGS;

        VkSemaphore timelineSem = queue->GetTimelineSemaphore();

        VkSemaphoreWaitInfo waitInfo = { VK_STRUCTURE_TYPE_SEMAPHORE_WAIT_INFO };
        waitInfo.semaphoreCount      = 1;
        waitInfo.pSemaphores         = &timelineSem;
        waitInfo.pValues             = &waitValue;

        VkResult result = m_api.vkWaitSemaphores( m_device, &waitInfo, timeout );
        if( result == VK_SUCCESS )
            return Result::SUCCESS;
        if( result == VK_TIMEOUT )
            return Result::TIMEOUT;

        BL_CORE_ERROR( "WaitForQueue failed for value {}! Error: {}", waitValue, ( int )result );
        return result == VK_ERROR_DEVICE_LOST ? Result::DEVICE_DISPATCH_FAILURE : Result::FAIL;
    }

    void Device::WaitIdle()
    {
        if( m_device != VK_NULL_HANDLE )
        {
            m_api.vkDeviceWaitIdle( m_device );
        }
    }

    int32_t Device::FindUniversalQueueFamily() const
    {
        uint32_t queueFamilyCount = 0;
        vkGetPhysicalDeviceQueueFamilyProperties( m_physicalDevice, &queueFamilyCount, nullptr );

        std::vector<VkQueueFamilyProperties> queueFamilies( queueFamilyCount );
        vkGetPhysicalDeviceQueueFamilyProperties( m_physicalDevice, &queueFamilyCount, queueFamilies.data() );

        // Graphics families implicitly support transfer; compute is required for the culling pass
        for( uint32_t i = 0; i < queueFamilyCount; ++i )
        {
            const VkQueueFlags flags = queueFamilies[ i ].queueFlags;
            if( ( flags & VK_QUEUE_GRAPHICS_BIT ) && ( flags & VK_QUEUE_COMPUTE_BIT ) )
            {
                return static_cast<int32_t>( i );
            }
        }
        return -1;
    }
} // namespace Batchline
