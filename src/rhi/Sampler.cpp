#include "rhi/Sampler.hpp"

namespace Batchline
{
    Sampler::Sampler( VkDevice device, const VolkDeviceTable* api, const SamplerDesc& desc )
        : m_device( device )
        , m_api( api )
    {
        VkSamplerCreateInfo createInfo     = { VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO };
        createInfo.magFilter               = desc.magFilter;
        createInfo.minFilter               = desc.minFilter;
        createInfo.addressModeU            = desc.addressModeU;
        createInfo.addressModeV            = desc.addressModeV;
        createInfo.addressModeW            = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
        createInfo.mipmapMode              = desc.mipmapMode;
        createInfo.anisotropyEnable        = VK_FALSE;
        createInfo.maxAnisotropy           = 1.0f;
        createInfo.borderColor             = VK_BORDER_COLOR_FLOAT_TRANSPARENT_BLACK;
        createInfo.unnormalizedCoordinates = VK_FALSE;
        createInfo.compareEnable           = VK_FALSE;
        createInfo.compareOp               = VK_COMPARE_OP_ALWAYS;
        createInfo.minLod                  = 0.0f;
        createInfo.maxLod                  = 0.0f; // atlases carry a single level

        if( m_api->vkCreateSampler( m_device, &createInfo, nullptr, &m_sampler ) != VK_SUCCESS )
        {
            BL_CORE_CRITICAL( "Failed to create sampler!" );
            m_sampler = VK_NULL_HANDLE;
        }
    }

    Sampler::~Sampler()
    {
        if( m_sampler != VK_NULL_HANDLE )
        {
            m_api->vkDestroySampler( m_device, m_sampler, nullptr );
        }
    }
} // namespace Batchline
