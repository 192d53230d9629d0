#pragma once
#include "core/Base.hpp"
#include "rhi/Shader.hpp"
#include <deque>
#include <string>
#include <vector>
#include <volk.h>

namespace Batchline
{
    class Buffer;
    class Device;
    class Sampler;
    class Texture;

    /**
     * @brief Name-addressed wrapper around one VkDescriptorSet.
     * Resources are matched against the reflected shader variable names, queued with Set() and written by Build().
     */
    class BindingGroup
    {
    public:
        BindingGroup( Ref<Device> device, VkDescriptorSet set, uint32_t setIndex, const ShaderReflectionData& layoutMap );
        ~BindingGroup() = default;

        // Returns INVALID_ARGS if the shader has no such resource in this set
        Result Set( const std::string& name, const Buffer& buffer, VkDeviceSize offset = 0, VkDeviceSize range = VK_WHOLE_SIZE );
        Result Set( const std::string& name, const Texture& texture, const Sampler& sampler );

        // Flushes the queued writes. Must be called before the set is bound.
        void Build();

        VkDescriptorSet GetHandle() const { return m_set; }
        uint32_t        GetSetIndex() const { return m_setIndex; }

    private:
        const ShaderResource* Find( const std::string& name ) const;

    private:
        Ref<Device>          m_device;
        VkDescriptorSet      m_set;
        uint32_t             m_setIndex;
        ShaderReflectionData m_layoutMap;

        std::vector<VkWriteDescriptorSet> m_pendingWrites;
        // Deques keep element addresses stable while writes point into them
        std::deque<VkDescriptorBufferInfo> m_bufferInfos;
        std::deque<VkDescriptorImageInfo>  m_imageInfos;
    };
} // namespace Batchline
