#include "compute/ComputeKernel.hpp"

namespace Batchline
{
    ComputeKernel::ComputeKernel( Ref<Device> device, Ref<ComputePipeline> pipeline, std::string name, uint32_t groupSizeX )
        : m_device( device )
        , m_pipeline( pipeline )
        , m_name( std::move( name ) )
        , m_groupSizeX( groupSizeX == 0 ? 1 : groupSizeX )
    {
    }

    Ref<BindingGroup> ComputeKernel::CreateBindingGroup( uint32_t setIndex )
    {
        VkDescriptorSetLayout layout = m_pipeline->GetDescriptorSetLayout( setIndex );
        if( layout == VK_NULL_HANDLE )
        {
            BL_CORE_ERROR( "[ComputeKernel] '{}' has no descriptor set {}", m_name, setIndex );
            return nullptr;
        }

        VkDescriptorSet set = VK_NULL_HANDLE;
        if( m_device->AllocateDescriptor( layout, set ) != Result::SUCCESS )
        {
            BL_CORE_ERROR( "[ComputeKernel] Failed to allocate descriptor set for '{}'", m_name );
            return nullptr;
        }

        return CreateRef<BindingGroup>( m_device, set, setIndex, m_pipeline->GetReflectionData() );
    }

    void ComputeKernel::Bind( CommandBuffer& cmd, const BindingGroup& group )
    {
        cmd.BindComputePipeline( *m_pipeline );
        cmd.BindDescriptorSets( VK_PIPELINE_BIND_POINT_COMPUTE, m_pipeline->GetLayout(), group.GetSetIndex(), { group.GetHandle() } );
    }
} // namespace Batchline
