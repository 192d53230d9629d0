#pragma once
#include "core/Base.hpp"
#include <vk_mem_alloc.h>
#include <volk.h>

namespace Batchline
{
    // Intended usage and memory location of a buffer
    enum class BufferType
    {
        UPLOAD,   // host visible staging, transfer source
        READBACK, // host visible, transfer destination
        STORAGE,  // device local SSBO
        UNIFORM,  // host visible UBO, rewritten every frame
        INSTANCE, // device local, SSBO for culling and per-instance vertex stream
        VERTEX,
        INDEX,
        INDIRECT // device local draw arguments, writable by compute
    };

    struct BufferDesc
    {
        VkDeviceSize size = 0;
        BufferType   type = BufferType::STORAGE;

        // Extra usage flags on top of the ones implied by type
        VkBufferUsageFlags additionalUsage = 0;
    };

    class Buffer
    {
    public:
        Buffer( VmaAllocator allocator, VkDevice device, const VolkDeviceTable* api );
        ~Buffer();

        Buffer( const Buffer& )            = delete;
        Buffer& operator=( const Buffer& ) = delete;

        Result Create( const BufferDesc& desc );
        void   Destroy();

        bool IsHostVisible() const { return m_mappedData != nullptr; }

        /**
         * @brief Host access. Only valid for UPLOAD, READBACK and UNIFORM buffers (persistently mapped).
         */
        Result Write( const void* data, size_t size, size_t offset = 0 );
        Result Read( void* outData, size_t size, size_t offset = 0 );
        void*  GetMappedData() const { return m_mappedData; }

        VkDescriptorBufferInfo GetDescriptorInfo( VkDeviceSize offset = 0, VkDeviceSize range = VK_WHOLE_SIZE ) const;

        VkBuffer     GetHandle() const { return m_buffer; }
        VkDeviceSize GetSize() const { return m_size; }
        BufferType   GetType() const { return m_type; }

    private:
        VmaAllocator           m_allocator;
        VkDevice               m_device;
        const VolkDeviceTable* m_api;
        VkBuffer               m_buffer     = VK_NULL_HANDLE;
        VmaAllocation          m_allocation = VK_NULL_HANDLE;
        VkDeviceSize           m_size       = 0;
        BufferType             m_type       = BufferType::STORAGE;
        void*                  m_mappedData = nullptr;
    };
} // namespace Batchline
