#pragma once
#include "core/Base.hpp"
#include "rhi/Queue.hpp"
#include <vector>
#include <volk.h>

namespace Batchline
{
    class ComputePipeline;
    class GraphicsPipeline;
    class Buffer;

    struct RenderingAttachmentInfo
    {
        VkImageView         imageView  = VK_NULL_HANDLE;
        VkAttachmentLoadOp  loadOp     = VK_ATTACHMENT_LOAD_OP_CLEAR;
        VkAttachmentStoreOp storeOp    = VK_ATTACHMENT_STORE_OP_STORE;
        VkClearValue        clearValue = { { { 0.0f, 0.0f, 0.0f, 1.0f } } };
        VkImageLayout       layout     = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
    };

    struct RenderingInfo
    {
        VkRect2D                             renderArea = {};
        std::vector<RenderingAttachmentInfo> colorAttachments;
    };

    /**
     * @brief Owning wrapper of a primary command buffer allocated from a thread-local pool.
     */
    class CommandBuffer
    {
    public:
        CommandBuffer( VkDevice device, const VolkDeviceTable* api, VkCommandPool pool, VkCommandBuffer buffer, QueueType type );
        ~CommandBuffer();

        CommandBuffer( const CommandBuffer& )            = delete;
        CommandBuffer& operator=( const CommandBuffer& ) = delete;

        Result Begin( VkCommandBufferUsageFlags flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT );
        Result End();

        // Dynamic rendering
        void BeginRendering( const RenderingInfo& info );
        void EndRendering();

        void SetViewport( float x, float y, float width, float height, float minDepth = 0.0f, float maxDepth = 1.0f );
        void SetScissor( int32_t x, int32_t y, uint32_t width, uint32_t height );

        void BindComputePipeline( const ComputePipeline& pipeline );
        void BindGraphicsPipeline( const GraphicsPipeline& pipeline );
        void BindDescriptorSets( VkPipelineBindPoint bindPoint, VkPipelineLayout layout, uint32_t firstSet, const std::vector<VkDescriptorSet>& sets );

        void BindVertexBuffer( uint32_t binding, const Buffer& buffer, VkDeviceSize offset = 0 );
        void BindIndexBuffer( const Buffer& buffer, VkDeviceSize offset, VkIndexType indexType );

        template<typename T>
        void PushConstants( VkPipelineLayout layout, VkShaderStageFlags stageFlags, uint32_t offset, const T& data )
        {
            m_api->vkCmdPushConstants( m_commandBuffer, layout, stageFlags, offset, sizeof( T ), &data );
        }

        // Transfers
        void CopyBuffer( const Buffer& src, VkDeviceSize srcOffset, const Buffer& dst, VkDeviceSize dstOffset, VkDeviceSize size );
        // Inline update, size must be a multiple of 4 and at most 65536 bytes
        void UpdateBuffer( const Buffer& dst, VkDeviceSize offset, VkDeviceSize size, const void* data );
        // Image must be in TRANSFER_DST_OPTIMAL. Copies the whole first mip.
        void CopyBufferToImage( const Buffer& src, VkDeviceSize srcOffset, VkImage image, uint32_t width, uint32_t height );
        // Image must be in TRANSFER_SRC_OPTIMAL
        void CopyImageToBuffer( VkImage image, uint32_t width, uint32_t height, const Buffer& dst, VkDeviceSize dstOffset );

        void Dispatch( uint32_t groupCountX, uint32_t groupCountY = 1, uint32_t groupCountZ = 1 );
        void Draw( uint32_t vertexCount, uint32_t instanceCount, uint32_t firstVertex, uint32_t firstInstance );
        void DrawIndexed( uint32_t indexCount, uint32_t instanceCount, uint32_t firstIndex, int32_t vertexOffset, uint32_t firstInstance );
        void DrawIndirect( const Buffer& argsBuffer, VkDeviceSize offset, uint32_t drawCount, uint32_t stride );

        // Synchronization2 barriers
        void BufferBarrier( const Buffer& buffer, VkPipelineStageFlags2 srcStage, VkAccessFlags2 srcAccess, VkPipelineStageFlags2 dstStage,
                            VkAccessFlags2 dstAccess );
        void TransitionImageLayout( VkImage image, VkImageLayout oldLayout, VkImageLayout newLayout,
                                    VkImageAspectFlags aspectMask = VK_IMAGE_ASPECT_COLOR_BIT );

        VkCommandBuffer GetHandle() const { return m_commandBuffer; }
        QueueType       GetType() const { return m_type; }

    private:
        VkDevice               m_device;
        const VolkDeviceTable* m_api;
        VkCommandPool          m_pool;
        VkCommandBuffer        m_commandBuffer;
        QueueType              m_type;
    };
} // namespace Batchline
