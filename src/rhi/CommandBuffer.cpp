#include "rhi/CommandBuffer.hpp"

#include "rhi/Buffer.hpp"
#include "rhi/Pipeline.hpp"

namespace Batchline
{
    CommandBuffer::CommandBuffer( VkDevice device, const VolkDeviceTable* api, VkCommandPool pool, VkCommandBuffer buffer, QueueType type )
        : m_device( device )
        , m_api( api )
        , m_pool( pool )
        , m_commandBuffer( buffer )
        , m_type( type )
    {
    }

    CommandBuffer::~CommandBuffer()
    {
        if( m_commandBuffer != VK_NULL_HANDLE )
        {
            m_api->vkFreeCommandBuffers( m_device, m_pool, 1, &m_commandBuffer );
        }
    }

    Result CommandBuffer::Begin( VkCommandBufferUsageFlags flags )
    {
        VkCommandBufferBeginInfo beginInfo = { VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO };
        beginInfo.flags                    = flags;
        if( m_api->vkBeginCommandBuffer( m_commandBuffer, &beginInfo ) != VK_SUCCESS )
        {
            BL_CORE_ERROR( "vkBeginCommandBuffer failed!" );
            return Result::FAIL;
        }
        return Result::SUCCESS;
    }

    Result CommandBuffer::End()
    {
        if( m_api->vkEndCommandBuffer( m_commandBuffer ) != VK_SUCCESS )
        {
            BL_CORE_ERROR( "vkEndCommandBuffer failed!" );
            return Result::FAIL;
        }
        return Result::SUCCESS;
    }

    void CommandBuffer::BeginRendering( const RenderingInfo& info )
    {
        BL_CORE_ASSERT( m_type == QueueType::GRAPHICS, "BeginRendering requires a GRAPHICS queue!" );

        std::vector<VkRenderingAttachmentInfo> colorAttachments;
        colorAttachments.reserve( info.colorAttachments.size() );
        for( const auto& att: info.colorAttachments )
        {
            VkRenderingAttachmentInfo vkAtt = { VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO };
            vkAtt.imageView                 = att.imageView;
            vkAtt.imageLayout               = att.layout;
            vkAtt.loadOp                    = att.loadOp;
            vkAtt.storeOp                   = att.storeOp;
            vkAtt.clearValue                = att.clearValue;
            colorAttachments.push_back( vkAtt );
        }

        VkRenderingInfo renderInfo      = { VK_STRUCTURE_TYPE_RENDERING_INFO };
        renderInfo.renderArea           = info.renderArea;
        renderInfo.layerCount           = 1;
        renderInfo.colorAttachmentCount = static_cast<uint32_t>( colorAttachments.size() );
        renderInfo.pColorAttachments    = colorAttachments.data();

        m_api->vkCmdBeginRendering( m_commandBuffer, &renderInfo );
    }

    void CommandBuffer::EndRendering()
    {
        m_api->vkCmdEndRendering( m_commandBuffer );
    }

    void CommandBuffer::SetViewport( float x, float y, float width, float height, float minDepth, float maxDepth )
    {
        VkViewport viewport{};
        viewport.x        = x;
        viewport.y        = y;
        viewport.width    = width;
        viewport.height   = height;
        viewport.minDepth = minDepth;
        viewport.maxDepth = maxDepth;
        m_api->vkCmdSetViewport( m_commandBuffer, 0, 1, &viewport );
    }

    void CommandBuffer::SetScissor( int32_t x, int32_t y, uint32_t width, uint32_t height )
    {
        VkRect2D scissor{};
        scissor.offset = { x, y };
        scissor.extent = { width, height };
        m_api->vkCmdSetScissor( m_commandBuffer, 0, 1, &scissor );
    }

    void CommandBuffer::BindComputePipeline( const ComputePipeline& pipeline )
    {
        m_api->vkCmdBindPipeline( m_commandBuffer, VK_PIPELINE_BIND_POINT_COMPUTE, pipeline.GetHandle() );
    }

    void CommandBuffer::BindGraphicsPipeline( const GraphicsPipeline& pipeline )
    {
        BL_CORE_ASSERT( m_type == QueueType::GRAPHICS, "BindGraphicsPipeline requires a GRAPHICS queue!" );
        m_api->vkCmdBindPipeline( m_commandBuffer, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline.GetHandle() );
    }

    void CommandBuffer::BindDescriptorSets( VkPipelineBindPoint bindPoint, VkPipelineLayout layout, uint32_t firstSet,
                                            const std::vector<VkDescriptorSet>& sets )
    {
        if( !sets.empty() )
        {
            m_api->vkCmdBindDescriptorSets( m_commandBuffer, bindPoint, layout, firstSet, static_cast<uint32_t>( sets.size() ), sets.data(), 0,
                                            nullptr );
        }
    }

    void CommandBuffer::BindVertexBuffer( uint32_t binding, const Buffer& buffer, VkDeviceSize offset )
    {
        VkBuffer handle = buffer.GetHandle();
        m_api->vkCmdBindVertexBuffers( m_commandBuffer, binding, 1, &handle, &offset );
    }

    void CommandBuffer::BindIndexBuffer( const Buffer& buffer, VkDeviceSize offset, VkIndexType indexType )
    {
        m_api->vkCmdBindIndexBuffer( m_commandBuffer, buffer.GetHandle(), offset, indexType );
    }

    void CommandBuffer::CopyBuffer( const Buffer& src, VkDeviceSize srcOffset, const Buffer& dst, VkDeviceSize dstOffset, VkDeviceSize size )
    {
        VkBufferCopy region{};
        region.srcOffset = srcOffset;
        region.dstOffset = dstOffset;
        region.size      = size;
        m_api->vkCmdCopyBuffer( m_commandBuffer, src.GetHandle(), dst.GetHandle(), 1, &region );
    }

    void CommandBuffer::UpdateBuffer( const Buffer& dst, VkDeviceSize offset, VkDeviceSize size, const void* data )
    {
        BL_CORE_ASSERT( size % 4 == 0 && size <= 65536, "vkCmdUpdateBuffer size must be a multiple of 4 and at most 64KB" );
        m_api->vkCmdUpdateBuffer( m_commandBuffer, dst.GetHandle(), offset, size, data );
    }

    void CommandBuffer::CopyBufferToImage( const Buffer& src, VkDeviceSize srcOffset, VkImage image, uint32_t width, uint32_t height )
    {
        VkBufferImageCopy region{};
        region.bufferOffset     = srcOffset;
        region.imageSubresource = { VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1 };
        region.imageExtent      = { width, height, 1 };
        m_api->vkCmdCopyBufferToImage( m_commandBuffer, src.GetHandle(), image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region );
    }

    void CommandBuffer::CopyImageToBuffer( VkImage image, uint32_t width, uint32_t height, const Buffer& dst, VkDeviceSize dstOffset )
    {
        VkBufferImageCopy region{};
        region.bufferOffset     = dstOffset;
        region.imageSubresource = { VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1 };
        region.imageExtent      = { width, height, 1 };
        m_api->vkCmdCopyImageToBuffer( m_commandBuffer, image, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, dst.GetHandle(), 1, &region );
    }

    void CommandBuffer::Dispatch( uint32_t groupCountX, uint32_t groupCountY, uint32_t groupCountZ )
    {
        m_api->vkCmdDispatch( m_commandBuffer, groupCountX, groupCountY, groupCountZ );
    }

    void CommandBuffer::Draw( uint32_t vertexCount, uint32_t instanceCount, uint32_t firstVertex, uint32_t firstInstance )
    {
        m_api->vkCmdDraw( m_commandBuffer, vertexCount, instanceCount, firstVertex, firstInstance );
    }

    void CommandBuffer::DrawIndexed( uint32_t indexCount, uint32_t instanceCount, uint32_t firstIndex, int32_t vertexOffset, uint32_t firstInstance )
    {
        m_api->vkCmdDrawIndexed( m_commandBuffer, indexCount, instanceCount, firstIndex, vertexOffset, firstInstance );
    }

    void CommandBuffer::DrawIndirect( const Buffer& argsBuffer, VkDeviceSize offset, uint32_t drawCount, uint32_t stride )
    {
        m_api->vkCmdDrawIndirect( m_commandBuffer, argsBuffer.GetHandle(), offset, drawCount, stride );
    }

    void CommandBuffer::BufferBarrier( const Buffer& buffer, VkPipelineStageFlags2 srcStage, VkAccessFlags2 srcAccess, VkPipelineStageFlags2 dstStage,
                                       VkAccessFlags2 dstAccess )
    {
        VkBufferMemoryBarrier2 barrier = { VK_STRUCTURE_TYPE_BUFFER_MEMORY_BARRIER_2 };
        barrier.srcStageMask           = srcStage;
        barrier.srcAccessMask          = srcAccess;
        barrier.dstStageMask           = dstStage;
        barrier.dstAccessMask          = dstAccess;
        barrier.srcQueueFamilyIndex    = VK_QUEUE_FAMILY_IGNORED;
        barrier.dstQueueFamilyIndex    = VK_QUEUE_FAMILY_IGNORED;
        barrier.buffer                 = buffer.GetHandle();
        barrier.offset                 = 0;
        barrier.size                   = VK_WHOLE_SIZE;

        VkDependencyInfo dependency         = { VK_STRUCTURE_TYPE_DEPENDENCY_INFO };
        dependency.bufferMemoryBarrierCount = 1;
        dependency.pBufferMemoryBarriers    = &barrier;
        m_api->vkCmdPipelineBarrier2( m_commandBuffer, &dependency );
    }

    void CommandBuffer::TransitionImageLayout( VkImage image, VkImageLayout oldLayout, VkImageLayout newLayout, VkImageAspectFlags aspectMask )
    {
        VkImageMemoryBarrier2 barrier           = { VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2 };
        barrier.oldLayout                       = oldLayout;
        barrier.newLayout                       = newLayout;
        barrier.srcQueueFamilyIndex             = VK_QUEUE_FAMILY_IGNORED;
        barrier.dstQueueFamilyIndex             = VK_QUEUE_FAMILY_IGNORED;
        barrier.image                           = image;
        barrier.subresourceRange.aspectMask     = aspectMask;
        barrier.subresourceRange.baseMipLevel   = 0;
        barrier.subresourceRange.levelCount     = 1;
        barrier.subresourceRange.baseArrayLayer = 0;
        barrier.subresourceRange.layerCount     = 1;

        // Common transitions get tight masks, anything else falls back to a full barrier
        if( oldLayout == VK_IMAGE_LAYOUT_UNDEFINED && newLayout == VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL )
        {
            barrier.srcStageMask  = VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT;
            barrier.srcAccessMask = 0;
            barrier.dstStageMask  = VK_PIPELINE_STAGE_2_TRANSFER_BIT;
            barrier.dstAccessMask = VK_ACCESS_2_TRANSFER_WRITE_BIT;
        }
        else if( oldLayout == VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL && newLayout == VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL )
        {
            barrier.srcStageMask  = VK_PIPELINE_STAGE_2_TRANSFER_BIT;
            barrier.srcAccessMask = VK_ACCESS_2_TRANSFER_WRITE_BIT;
            barrier.dstStageMask  = VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT;
            barrier.dstAccessMask = VK_ACCESS_2_SHADER_SAMPLED_READ_BIT;
        }
        else if( newLayout == VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL )
        {
            barrier.srcStageMask  = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
            barrier.srcAccessMask = VK_ACCESS_2_MEMORY_READ_BIT | VK_ACCESS_2_MEMORY_WRITE_BIT;
            barrier.dstStageMask  = VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT;
            barrier.dstAccessMask = VK_ACCESS_2_COLOR_ATTACHMENT_READ_BIT | VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT;
        }
        else
        {
            barrier.srcStageMask  = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
            barrier.srcAccessMask = VK_ACCESS_2_MEMORY_WRITE_BIT;
            barrier.dstStageMask  = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
            barrier.dstAccessMask = VK_ACCESS_2_MEMORY_READ_BIT | VK_ACCESS_2_MEMORY_WRITE_BIT;
        }

        VkDependencyInfo dependency        = { VK_STRUCTURE_TYPE_DEPENDENCY_INFO };
        dependency.imageMemoryBarrierCount = 1;
        dependency.pImageMemoryBarriers    = &barrier;
        m_api->vkCmdPipelineBarrier2( m_commandBuffer, &dependency );
    }
} // namespace Batchline
