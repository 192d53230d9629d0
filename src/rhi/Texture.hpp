#pragma once
#include "core/Base.hpp"
#include <vk_mem_alloc.h>
#include <volk.h>

namespace Batchline
{
    class CommandBuffer;

    enum class TextureUsage : uint32_t
    {
        NONE          = 0,
        SAMPLED       = 1 << 0, // atlas read by the sprite and glyph pipelines
        RENDER_TARGET = 1 << 1, // color attachment of dynamic rendering
        TRANSFER_SRC  = 1 << 2,
        TRANSFER_DST  = 1 << 3
    };

    inline TextureUsage operator|( TextureUsage a, TextureUsage b )
    {
        return static_cast<TextureUsage>( static_cast<uint32_t>( a ) | static_cast<uint32_t>( b ) );
    }
    inline bool HasFlag( TextureUsage value, TextureUsage flag )
    {
        return ( static_cast<uint32_t>( value ) & static_cast<uint32_t>( flag ) ) == static_cast<uint32_t>( flag );
    }

    struct TextureDesc
    {
        uint32_t     width  = 1;
        uint32_t     height = 1;
        VkFormat     format = VK_FORMAT_R8G8B8A8_UNORM;
        TextureUsage usage  = TextureUsage::SAMPLED | TextureUsage::TRANSFER_DST;
    };

    /**
     * @brief Single-mip 2D image with a view. Tracks its layout so callers only name the target layout.
     */
    class Texture
    {
    public:
        Texture( VmaAllocator allocator, VkDevice device, const VolkDeviceTable* api );
        ~Texture();

        Texture( const Texture& )            = delete;
        Texture& operator=( const Texture& ) = delete;

        Result Create( const TextureDesc& desc );
        void   Destroy();

        // Records a layout transition; a no-op if already in newLayout
        void TransitionLayout( CommandBuffer& cmd, VkImageLayout newLayout );
        // Forgets the tracked layout after recorded transitions were dropped. The next transition
        // starts from UNDEFINED and discards the contents.
        void DiscardLayout() { m_currentLayout = VK_IMAGE_LAYOUT_UNDEFINED; }

        VkDescriptorImageInfo GetDescriptorInfo( VkSampler sampler, VkImageLayout layout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL ) const;

        VkImage       GetImage() const { return m_image; }
        VkImageView   GetView() const { return m_view; }
        uint32_t      GetWidth() const { return m_width; }
        uint32_t      GetHeight() const { return m_height; }
        VkFormat      GetFormat() const { return m_format; }
        VkImageLayout GetCurrentLayout() const { return m_currentLayout; }

    private:
        VmaAllocator           m_allocator;
        VkDevice               m_device;
        const VolkDeviceTable* m_api;

        VkImage       m_image      = VK_NULL_HANDLE;
        VkImageView   m_view       = VK_NULL_HANDLE;
        VmaAllocation m_allocation = VK_NULL_HANDLE;

        uint32_t      m_width         = 0;
        uint32_t      m_height        = 0;
        VkFormat      m_format        = VK_FORMAT_UNDEFINED;
        VkImageLayout m_currentLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    };
} // namespace Batchline
