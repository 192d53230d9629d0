#include "rhi/Buffer.hpp"

#include <cstring>

namespace Batchline
{
    Buffer::Buffer( VmaAllocator allocator, VkDevice device, const VolkDeviceTable* api )
        : m_allocator( allocator )
        , m_device( device )
        , m_api( api )
    {
    }

    Buffer::~Buffer()
    {
        Destroy();
    }

    Result Buffer::Create( const BufferDesc& desc )
    {
        if( desc.size == 0 )
        {
            BL_CORE_ERROR( "Buffer::Create called with size 0." );
            return Result::INVALID_ARGS;
        }

        Destroy();
        m_size = desc.size;
        m_type = desc.type;

        VkBufferCreateInfo bufferInfo = { VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO };
        bufferInfo.size               = desc.size;
        bufferInfo.sharingMode        = VK_SHARING_MODE_EXCLUSIVE;

        VmaAllocationCreateInfo allocInfo = {};
        allocInfo.usage                   = VMA_MEMORY_USAGE_AUTO;

        switch( desc.type )
        {
            case BufferType::UPLOAD:
                bufferInfo.usage = VK_BUFFER_USAGE_TRANSFER_SRC_BIT;
                allocInfo.flags  = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
                break;

            case BufferType::READBACK:
                bufferInfo.usage = VK_BUFFER_USAGE_TRANSFER_DST_BIT;
                allocInfo.flags  = VMA_ALLOCATION_CREATE_HOST_ACCESS_RANDOM_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
                break;

            case BufferType::STORAGE:
                bufferInfo.usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT | VK_BUFFER_USAGE_TRANSFER_SRC_BIT;
                allocInfo.usage  = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;
                break;

            case BufferType::UNIFORM:
                bufferInfo.usage = VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
                allocInfo.flags  = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
                break;

            case BufferType::INSTANCE:
                // Culling reads and writes it as an SSBO, the instanced pipelines read it as a vertex stream
                bufferInfo.usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT | VK_BUFFER_USAGE_VERTEX_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT |
                                   VK_BUFFER_USAGE_TRANSFER_SRC_BIT;
                allocInfo.usage = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;
                break;

            case BufferType::VERTEX:
                bufferInfo.usage = VK_BUFFER_USAGE_VERTEX_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT;
                allocInfo.usage  = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;
                break;

            case BufferType::INDEX:
                bufferInfo.usage = VK_BUFFER_USAGE_INDEX_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT;
                allocInfo.usage  = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;
                break;

            case BufferType::INDIRECT:
                // Compute writes the instance count in place
                bufferInfo.usage = VK_BUFFER_USAGE_INDIRECT_BUFFER_BIT | VK_BUFFER_USAGE_STORAGE_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT |
                                   VK_BUFFER_USAGE_TRANSFER_SRC_BIT;
                allocInfo.usage = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;
                break;
        }
        bufferInfo.usage |= desc.additionalUsage;

        VmaAllocationInfo resultInfo;
        if( vmaCreateBuffer( m_allocator, &bufferInfo, &allocInfo, &m_buffer, &m_allocation, &resultInfo ) != VK_SUCCESS )
        {
            BL_CORE_CRITICAL( "Failed to create buffer of {} bytes!", desc.size );
            m_buffer     = VK_NULL_HANDLE;
            m_allocation = VK_NULL_HANDLE;
            return Result::OUT_OF_MEMORY;
        }

        if( allocInfo.flags & VMA_ALLOCATION_CREATE_MAPPED_BIT )
        {
            m_mappedData = resultInfo.pMappedData;
        }

        return Result::SUCCESS;
    }

    void Buffer::Destroy()
    {
        if( m_buffer != VK_NULL_HANDLE )
        {
            m_mappedData = nullptr;
            vmaDestroyBuffer( m_allocator, m_buffer, m_allocation );
            m_buffer     = VK_NULL_HANDLE;
            m_allocation = VK_NULL_HANDLE;
        }
    }

    Result Buffer::Write( const void* data, size_t size, size_t offset )
    {
        if( !m_mappedData )
        {
            BL_CORE_ERROR( "Buffer::Write on a buffer that is not host visible." );
            return Result::INVALID_ARGS;
        }
        if( offset + size > m_size )
        {
            BL_CORE_ERROR( "Buffer::Write out of range ({} + {} > {}).", offset, size, m_size );
            return Result::BUFFER_OVERFLOW;
        }

        std::memcpy( static_cast<uint8_t*>( m_mappedData ) + offset, data, size );
        if( vmaFlushAllocation( m_allocator, m_allocation, offset, size ) != VK_SUCCESS )
            return Result::FAIL;
        return Result::SUCCESS;
    }

    Result Buffer::Read( void* outData, size_t size, size_t offset )
    {
        if( !m_mappedData )
        {
            BL_CORE_ERROR( "Buffer::Read on a buffer that is not host visible." );
            return Result::INVALID_ARGS;
        }
        if( offset + size > m_size )
        {
            BL_CORE_ERROR( "Buffer::Read out of range ({} + {} > {}).", offset, size, m_size );
            return Result::BUFFER_OVERFLOW;
        }

        // Make device writes visible on non-coherent memory
        if( vmaInvalidateAllocation( m_allocator, m_allocation, offset, size ) != VK_SUCCESS )
            return Result::FAIL;

        std::memcpy( outData, static_cast<const uint8_t*>( m_mappedData ) + offset, size );
        return Result::SUCCESS;
    }

    VkDescriptorBufferInfo Buffer::GetDescriptorInfo( VkDeviceSize offset, VkDeviceSize range ) const
    {
        VkDescriptorBufferInfo info{};
        info.buffer = m_buffer;
        info.offset = offset;
        info.range  = range;
        return info;
    }
} // namespace Batchline
