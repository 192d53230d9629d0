#pragma once
#include "core/Base.hpp"
#include "rhi/Buffer.hpp"
#include "rhi/CommandBuffer.hpp"
#include "rhi/DescriptorAllocator.hpp"
#include "rhi/Pipeline.hpp"
#include "rhi/Queue.hpp"
#include "rhi/Sampler.hpp"
#include "rhi/Shader.hpp"
#include "rhi/Texture.hpp"
#include <map>
#include <mutex>
#include <thread>
#include <vk_mem_alloc.h>
#include <volk.h>

namespace Batchline
{
    /**
     * @brief Logical device with one universal queue, a VMA allocator and thread-local command pools.
     * Culling, uploads and draws of a frame are all recorded into one graphics command buffer, so compute work
     * runs on the graphics family and GetComputeQueue() aliases the graphics queue.
     */
    class Device
    {
    public:
        Device( VkPhysicalDevice physicalDevice );
        ~Device();

        Device( const Device& )            = delete;
        Device& operator=( const Device& ) = delete;

        Result Init();
        void   Shutdown();

        Ref<CommandBuffer>    CreateCommandBuffer( QueueType type = QueueType::GRAPHICS );
        Ref<Buffer>           CreateBuffer( const BufferDesc& desc );
        Ref<Texture>          CreateTexture( const TextureDesc& desc );
        Ref<Sampler>          CreateSampler( const SamplerDesc& desc = {} );
        Ref<ComputePipeline>  CreateComputePipeline( const ComputePipelineDesc& desc );
        Ref<GraphicsPipeline> CreateGraphicsPipeline( const GraphicsPipelineDesc& desc );

        /**
         * @brief Compiles (or loads the cached SPIR-V of) a GLSL file resolved against the asset root.
         * Throws std::runtime_error when the file is missing.
         */
        Ref<Shader> CreateShader( const std::string& filepath );

        Result AllocateDescriptor( VkDescriptorSetLayout layout, VkDescriptorSet& outSet );
        void   ResetDescriptorPools();
        void   UpdateDescriptorSets( const std::vector<VkWriteDescriptorSet>& writes );

        /**
         * @brief Waits for a value on the queue's timeline semaphore.
         * @return SUCCESS, TIMEOUT, DEVICE_DISPATCH_FAILURE on device loss, FAIL otherwise.
         */
        Result WaitForQueue( const Ref<Queue>& queue, uint64_t waitValue, uint64_t timeout = UINT64_MAX );

        // Blocks until all submitted work finished. Used before tearing resources down.
        void WaitIdle();

        Ref<Queue> GetGraphicsQueue() const { return m_graphicsQueue; }
        Ref<Queue> GetComputeQueue() const { return m_graphicsQueue; }

        VkDevice               GetHandle() const { return m_device; }
        VkPhysicalDevice       GetPhysicalDevice() const { return m_physicalDevice; }
        VmaAllocator           GetAllocator() const { return m_allocator; }
        const VolkDeviceTable& GetAPI() const { return m_api; }
        const std::string&     GetName() const { return m_name; }

    private:
        int32_t       FindUniversalQueueFamily() const;
        VkCommandPool GetOrCreateThreadLocalPool( uint32_t queueFamilyIndex );

    private:
        VkPhysicalDevice m_physicalDevice;
        VkDevice         m_device    = VK_NULL_HANDLE;
        VmaAllocator     m_allocator = VK_NULL_HANDLE;
        VolkDeviceTable  m_api       = {};
        std::string      m_name;

        Ref<Queue>                 m_graphicsQueue;
        Scope<DescriptorAllocator> m_descriptorAllocator;

        struct PoolInfo
        {
            VkCommandPool          handle = VK_NULL_HANDLE;
            VkDevice               device = VK_NULL_HANDLE;
            const VolkDeviceTable* api    = nullptr;

            PoolInfo() = default;
            PoolInfo( PoolInfo&& other ) noexcept
                : handle( other.handle )
                , device( other.device )
                , api( other.api )
            {
                other.handle = VK_NULL_HANDLE;
                other.api    = nullptr;
            }
            PoolInfo& operator=( PoolInfo&& other ) noexcept
            {
                if( this != &other )
                {
                    if( handle && api )
                        api->vkDestroyCommandPool( device, handle, nullptr );

                    handle       = other.handle;
                    device       = other.device;
                    api          = other.api;
                    other.handle = VK_NULL_HANDLE;
                    other.api    = nullptr;
                }
                return *this;
            }
            ~PoolInfo()
            {
                if( handle && api )
                    api->vkDestroyCommandPool( device, handle, nullptr );
            }
        };

        // ThreadID -> (QueueFamilyIndex -> pool)
        std::map<std::thread::id, std::map<uint32_t, PoolInfo>> m_threadPools;
        std::mutex                                              m_poolMutex;
    };
} // namespace Batchline
