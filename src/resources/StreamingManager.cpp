#include "resources/StreamingManager.hpp"

namespace Batchline
{
    StreamingManager::StreamingManager( Ref<Device> device, const StreamingConfig& config )
        : m_device( device )
        , m_config( config )
    {
    }

    StreamingManager::~StreamingManager()
    {
        Shutdown();
    }

    Result StreamingManager::Init()
    {
        for( FrameSlot& frame: m_frames )
        {
            frame.upload.buffer   = m_device->CreateBuffer( { m_config.uploadHeapSize, BufferType::UPLOAD } );
            frame.readback.buffer = m_device->CreateBuffer( { m_config.readbackHeapSize, BufferType::READBACK } );
            if( !frame.upload.buffer || !frame.readback.buffer )
            {
                BL_CORE_ERROR( "[StreamingManager] Failed to create staging heaps." );
                Shutdown();
                return Result::OUT_OF_MEMORY;
            }
        }

        BL_CORE_INFO( "[StreamingManager] {} frame slots, {} KB upload heap each.", FRAMES_IN_FLIGHT, m_config.uploadHeapSize >> 10 );
        return Result::SUCCESS;
    }

    void StreamingManager::Shutdown()
    {
        for( FrameSlot& frame: m_frames )
        {
            if( frame.retireValue != 0 )
            {
                // Staging memory may still be read by the GPU. Nothing to recover from here, teardown proceeds anyway.
                if( m_device->WaitForQueue( m_device->GetGraphicsQueue(), frame.retireValue ) != Result::SUCCESS )
                {
                    BL_CORE_WARN( "[StreamingManager] Frame slot wait failed during shutdown." );
                }
            }
            frame = FrameSlot{};
        }
    }

    Result StreamingManager::BeginFrame( uint64_t timeoutNs )
    {
        m_frameIndex     = ( m_frameIndex + 1 ) % FRAMES_IN_FLIGHT;
        FrameSlot& frame = m_frames[ m_frameIndex ];

        if( frame.retireValue != 0 )
        {
            Result result = m_device->WaitForQueue( m_device->GetGraphicsQueue(), frame.retireValue, timeoutNs );
            if( result != Result::SUCCESS )
            {
                BL_CORE_ERROR( "[StreamingManager] Waiting for frame slot {} failed: {}", m_frameIndex, toString( result ) );
                return result;
            }
        }

        frame.upload.offset   = 0;
        frame.readback.offset = 0;
        frame.upload.retired.clear();
        frame.readback.retired.clear();
        frame.retireValue = 0;
        return Result::SUCCESS;
    }

    void StreamingManager::EndFrame( uint64_t signalValue )
    {
        m_frames[ m_frameIndex ].retireValue = signalValue;
    }

    TransientAllocation StreamingManager::Allocate( Heap& heap, BufferType type, VkDeviceSize size, VkDeviceSize alignment )
    {
        if( size == 0 || !heap.buffer )
            return {};

        VkDeviceSize offset = ( heap.offset + alignment - 1 ) & ~( alignment - 1 );
        if( offset + size > heap.buffer->GetSize() )
        {
            VkDeviceSize newSize = heap.buffer->GetSize() * 2;
            while( newSize < size )
                newSize *= 2;

            Ref<Buffer> grown = m_device->CreateBuffer( { newSize, type } );
            if( !grown )
            {
                BL_CORE_ERROR( "[StreamingManager] Could not grow staging heap to {} bytes.", newSize );
                return {};
            }

            BL_CORE_WARN( "[StreamingManager] Staging heap grown to {} KB.", newSize >> 10 );
            heap.retired.push_back( heap.buffer );
            heap.buffer = grown;
            offset      = 0;
        }

        heap.offset = offset + size;

        TransientAllocation allocation;
        allocation.buffer     = heap.buffer;
        allocation.offset     = offset;
        allocation.size       = size;
        allocation.mappedData = static_cast<uint8_t*>( heap.buffer->GetMappedData() ) + offset;
        return allocation;
    }

    TransientAllocation StreamingManager::AllocateUpload( VkDeviceSize size, VkDeviceSize alignment )
    {
        return Allocate( m_frames[ m_frameIndex ].upload, BufferType::UPLOAD, size, alignment );
    }

    Result StreamingManager::UploadToBuffer( CommandBuffer& cmd, const Buffer& dst, const void* data, VkDeviceSize size, VkDeviceSize dstOffset )
    {
        if( dstOffset + size > dst.GetSize() )
        {
            BL_CORE_ERROR( "[StreamingManager] Upload of {} bytes at {} overruns a {} byte buffer.", size, dstOffset, dst.GetSize() );
            return Result::BUFFER_OVERFLOW;
        }

        TransientAllocation staging = AllocateUpload( size );
        if( !staging.IsValid() )
            return Result::OUT_OF_MEMORY;

        Result result = staging.buffer->Write( data, size, staging.offset );
        if( result != Result::SUCCESS )
            return result;

        cmd.CopyBuffer( *staging.buffer, staging.offset, dst, dstOffset, size );
        return Result::SUCCESS;
    }

    Result StreamingManager::UploadToTexture( CommandBuffer& cmd, Texture& dst, const void* pixels, VkDeviceSize size )
    {
        TransientAllocation staging = AllocateUpload( size );
        if( !staging.IsValid() )
            return Result::OUT_OF_MEMORY;

        Result result = staging.buffer->Write( pixels, size, staging.offset );
        if( result != Result::SUCCESS )
            return result;

        dst.TransitionLayout( cmd, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL );
        cmd.CopyBufferToImage( *staging.buffer, staging.offset, dst.GetImage(), dst.GetWidth(), dst.GetHeight() );
        dst.TransitionLayout( cmd, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL );
        return Result::SUCCESS;
    }

    TransientAllocation StreamingManager::CaptureBuffer( CommandBuffer& cmd, const Buffer& src, VkDeviceSize size, VkDeviceSize srcOffset )
    {
        TransientAllocation readback = Allocate( m_frames[ m_frameIndex ].readback, BufferType::READBACK, size, 16 );
        if( !readback.IsValid() )
            return {};

        cmd.BufferBarrier( src, VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT, VK_ACCESS_2_MEMORY_WRITE_BIT, VK_PIPELINE_STAGE_2_TRANSFER_BIT,
                           VK_ACCESS_2_TRANSFER_READ_BIT );
        cmd.CopyBuffer( src, srcOffset, *readback.buffer, readback.offset, size );
        return readback;
    }

    TransientAllocation StreamingManager::CaptureTexture( CommandBuffer& cmd, Texture& src, uint32_t bytesPerPixel )
    {
        const VkDeviceSize  size     = static_cast<VkDeviceSize>( src.GetWidth() ) * src.GetHeight() * bytesPerPixel;
        TransientAllocation readback = Allocate( m_frames[ m_frameIndex ].readback, BufferType::READBACK, size, 16 );
        if( !readback.IsValid() )
            return {};

        src.TransitionLayout( cmd, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL );
        cmd.CopyImageToBuffer( src.GetImage(), src.GetWidth(), src.GetHeight(), *readback.buffer, readback.offset );
        return readback;
    }
} // namespace Batchline
