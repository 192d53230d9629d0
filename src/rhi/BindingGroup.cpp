#include "rhi/BindingGroup.hpp"

#include "rhi/Device.hpp"

namespace Batchline
{
    static VkDescriptorType MapResourceTypeToVulkan( ShaderResourceType type )
    {
        switch( type )
        {
            case ShaderResourceType::UNIFORM_BUFFER:
                return VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
            case ShaderResourceType::STORAGE_BUFFER:
                return VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
            case ShaderResourceType::SAMPLED_IMAGE:
                return VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
            case ShaderResourceType::STORAGE_IMAGE:
                return VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
            default:
                return VK_DESCRIPTOR_TYPE_MAX_ENUM;
        }
    }

    BindingGroup::BindingGroup( Ref<Device> device, VkDescriptorSet set, uint32_t setIndex, const ShaderReflectionData& layoutMap )
        : m_device( device )
        , m_set( set )
        , m_setIndex( setIndex )
        , m_layoutMap( layoutMap )
    {
    }

    const ShaderResource* BindingGroup::Find( const std::string& name ) const
    {
        auto it = m_layoutMap.find( name );
        if( it == m_layoutMap.end() || it->second.set != m_setIndex || it->second.type == ShaderResourceType::PUSH_CONSTANT )
        {
            BL_CORE_WARN( "[BindingGroup] Set {} has no resource named '{}'.", m_setIndex, name );
            return nullptr;
        }
        return &it->second;
    }

    Result BindingGroup::Set( const std::string& name, const Buffer& buffer, VkDeviceSize offset, VkDeviceSize range )
    {
        const ShaderResource* resource = Find( name );
        if( !resource )
            return Result::INVALID_ARGS;

        if( resource->type != ShaderResourceType::UNIFORM_BUFFER && resource->type != ShaderResourceType::STORAGE_BUFFER )
        {
            BL_CORE_WARN( "[BindingGroup] '{}' is not a buffer binding.", name );
            return Result::INVALID_ARGS;
        }

        VkDescriptorBufferInfo& bufInfo = m_bufferInfos.emplace_back( buffer.GetDescriptorInfo( offset, range ) );

        VkWriteDescriptorSet write = { VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET };
        write.dstSet               = m_set;
        write.dstBinding           = resource->binding;
        write.dstArrayElement      = 0;
        write.descriptorType       = MapResourceTypeToVulkan( resource->type );
        write.descriptorCount      = 1;
        write.pBufferInfo          = &bufInfo;

        m_pendingWrites.push_back( write );
        return Result::SUCCESS;
    }

    Result BindingGroup::Set( const std::string& name, const Texture& texture, const Sampler& sampler )
    {
        const ShaderResource* resource = Find( name );
        if( !resource )
            return Result::INVALID_ARGS;

        if( resource->type != ShaderResourceType::SAMPLED_IMAGE )
        {
            BL_CORE_WARN( "[BindingGroup] '{}' is not a combined image sampler.", name );
            return Result::INVALID_ARGS;
        }

        VkDescriptorImageInfo& imageInfo = m_imageInfos.emplace_back( texture.GetDescriptorInfo( sampler.GetHandle() ) );

        VkWriteDescriptorSet write = { VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET };
        write.dstSet               = m_set;
        write.dstBinding           = resource->binding;
        write.dstArrayElement      = 0;
        write.descriptorType       = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
        write.descriptorCount      = 1;
        write.pImageInfo           = &imageInfo;

        m_pendingWrites.push_back( write );
        return Result::SUCCESS;
    }

    void BindingGroup::Build()
    {
        if( m_pendingWrites.empty() )
            return;

        m_device->UpdateDescriptorSets( m_pendingWrites );

        m_pendingWrites.clear();
        m_bufferInfos.clear();
        m_imageInfos.clear();
    }
} // namespace Batchline
