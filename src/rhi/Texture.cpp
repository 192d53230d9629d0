#include "rhi/Texture.hpp"

#include "rhi/CommandBuffer.hpp"

namespace Batchline
{
    Texture::Texture( VmaAllocator allocator, VkDevice device, const VolkDeviceTable* api )
        : m_allocator( allocator )
        , m_device( device )
        , m_api( api )
    {
    }

    Texture::~Texture()
    {
        Destroy();
    }

    void Texture::Destroy()
    {
        if( m_view != VK_NULL_HANDLE )
        {
            m_api->vkDestroyImageView( m_device, m_view, nullptr );
            m_view = VK_NULL_HANDLE;
        }
        if( m_image != VK_NULL_HANDLE )
        {
            vmaDestroyImage( m_allocator, m_image, m_allocation );
            m_image      = VK_NULL_HANDLE;
            m_allocation = VK_NULL_HANDLE;
        }
        m_currentLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    }

    Result Texture::Create( const TextureDesc& desc )
    {
        if( desc.width == 0 || desc.height == 0 )
        {
            BL_CORE_ERROR( "Texture::Create called with an empty extent ({}x{}).", desc.width, desc.height );
            return Result::INVALID_ARGS;
        }

        Destroy();
        m_width  = desc.width;
        m_height = desc.height;
        m_format = desc.format;

        VkImageUsageFlags usageFlags = 0;
        if( HasFlag( desc.usage, TextureUsage::SAMPLED ) )
            usageFlags |= VK_IMAGE_USAGE_SAMPLED_BIT;
        if( HasFlag( desc.usage, TextureUsage::RENDER_TARGET ) )
            usageFlags |= VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
        if( HasFlag( desc.usage, TextureUsage::TRANSFER_SRC ) )
            usageFlags |= VK_IMAGE_USAGE_TRANSFER_SRC_BIT;
        if( HasFlag( desc.usage, TextureUsage::TRANSFER_DST ) )
            usageFlags |= VK_IMAGE_USAGE_TRANSFER_DST_BIT;

        VkImageCreateInfo imageInfo = { VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO };
        imageInfo.imageType         = VK_IMAGE_TYPE_2D;
        imageInfo.extent            = { m_width, m_height, 1 };
        imageInfo.mipLevels         = 1;
        imageInfo.arrayLayers       = 1;
        imageInfo.format            = m_format;
        imageInfo.tiling            = VK_IMAGE_TILING_OPTIMAL;
        imageInfo.initialLayout     = VK_IMAGE_LAYOUT_UNDEFINED;
        imageInfo.usage             = usageFlags;
        imageInfo.sharingMode       = VK_SHARING_MODE_EXCLUSIVE;
        imageInfo.samples           = VK_SAMPLE_COUNT_1_BIT;

        VmaAllocationCreateInfo allocInfo = {};
        allocInfo.usage                   = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;

        if( vmaCreateImage( m_allocator, &imageInfo, &allocInfo, &m_image, &m_allocation, nullptr ) != VK_SUCCESS )
        {
            BL_CORE_CRITICAL( "Failed to create {}x{} texture image!", m_width, m_height );
            m_image      = VK_NULL_HANDLE;
            m_allocation = VK_NULL_HANDLE;
            return Result::OUT_OF_MEMORY;
        }

        VkImageViewCreateInfo viewInfo           = { VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO };
        viewInfo.image                           = m_image;
        viewInfo.viewType                        = VK_IMAGE_VIEW_TYPE_2D;
        viewInfo.format                          = m_format;
        viewInfo.subresourceRange.aspectMask     = VK_IMAGE_ASPECT_COLOR_BIT;
        viewInfo.subresourceRange.baseMipLevel   = 0;
        viewInfo.subresourceRange.levelCount     = 1;
        viewInfo.subresourceRange.baseArrayLayer = 0;
        viewInfo.subresourceRange.layerCount     = 1;

        if( m_api->vkCreateImageView( m_device, &viewInfo, nullptr, &m_view ) != VK_SUCCESS )
        {
            BL_CORE_CRITICAL( "Failed to create texture image view!" );
            Destroy();
            return Result::FAIL;
        }

        return Result::SUCCESS;
    }

    void Texture::TransitionLayout( CommandBuffer& cmd, VkImageLayout newLayout )
    {
        if( m_currentLayout == newLayout )
            return;

        cmd.TransitionImageLayout( m_image, m_currentLayout, newLayout );
        m_currentLayout = newLayout;
    }

    VkDescriptorImageInfo Texture::GetDescriptorInfo( VkSampler sampler, VkImageLayout layout ) const
    {
        VkDescriptorImageInfo info{};
        info.imageLayout = layout;
        info.imageView   = m_view;
        info.sampler     = sampler;
        return info;
    }
} // namespace Batchline
