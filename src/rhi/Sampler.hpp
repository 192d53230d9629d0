#pragma once
#include "core/Base.hpp"
#include <volk.h>

namespace Batchline
{
    // Atlas sampling defaults: linear filtering, clamped so neighbouring atlas cells never bleed in
    struct SamplerDesc
    {
        VkFilter             magFilter    = VK_FILTER_LINEAR;
        VkFilter             minFilter    = VK_FILTER_LINEAR;
        VkSamplerAddressMode addressModeU = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
        VkSamplerAddressMode addressModeV = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
        VkSamplerMipmapMode  mipmapMode   = VK_SAMPLER_MIPMAP_MODE_NEAREST;
    };

    class Sampler
    {
    public:
        Sampler( VkDevice device, const VolkDeviceTable* api, const SamplerDesc& desc );
        ~Sampler();

        Sampler( const Sampler& )            = delete;
        Sampler& operator=( const Sampler& ) = delete;

        bool      IsValid() const { return m_sampler != VK_NULL_HANDLE; }
        VkSampler GetHandle() const { return m_sampler; }

    private:
        VkDevice               m_device;
        const VolkDeviceTable* m_api;
        VkSampler              m_sampler = VK_NULL_HANDLE;
    };
} // namespace Batchline
