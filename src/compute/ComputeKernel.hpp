#pragma once
#include "rhi/BindingGroup.hpp"
#include "rhi/CommandBuffer.hpp"
#include "rhi/Device.hpp"
#include "rhi/Pipeline.hpp"
#include <string>

namespace Batchline
{
    /**
     * @brief A compute pipeline plus its workgroup size.
     * Creates binding groups matching the shader layout and records push constants + dispatch.
     */
    class ComputeKernel
    {
    public:
        ComputeKernel( Ref<Device> device, Ref<ComputePipeline> pipeline, std::string name, uint32_t groupSizeX );

        /**
         * @brief Allocates a descriptor set for the given set index from the device's descriptor allocator.
         * The set lives until the next Device::ResetDescriptorPools().
         */
        Ref<BindingGroup> CreateBindingGroup( uint32_t setIndex = 0 );

        uint32_t GetGroupCount( uint32_t elementCount ) const { return ( elementCount + m_groupSizeX - 1 ) / m_groupSizeX; }

        template<typename TPush>
        void Dispatch( CommandBuffer& cmd, const BindingGroup& group, uint32_t groupCountX, const TPush& pushConstants )
        {
            Bind( cmd, group );
            cmd.PushConstants( m_pipeline->GetLayout(), VK_SHADER_STAGE_COMPUTE_BIT, 0, pushConstants );
            cmd.Dispatch( groupCountX );
        }

        const std::string& GetName() const { return m_name; }
        uint32_t           GetGroupSize() const { return m_groupSizeX; }

    private:
        void Bind( CommandBuffer& cmd, const BindingGroup& group );

    private:
        Ref<Device>          m_device;
        Ref<ComputePipeline> m_pipeline;
        std::string          m_name;
        uint32_t             m_groupSizeX;
    };
} // namespace Batchline
