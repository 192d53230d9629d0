#include "renderer/IndirectDrawAssembler.hpp"

#include "rhi/Device.hpp"

namespace Batchline
{
    Result IndirectDrawAssembler::Init( const Ref<Device>& device )
    {
        for( DrawClass drawClass: ALL_DRAW_CLASSES )
        {
            Ref<Buffer> buffer = device->CreateBuffer( { sizeof( IndirectDrawArgs ), BufferType::INDIRECT } );
            if( !buffer )
            {
                BL_CORE_ERROR( "IndirectDrawAssembler: failed to create the {} argument buffer.", toString( drawClass ) );
                Shutdown();
                return Result::OUT_OF_MEMORY;
            }
            m_argsBuffers[ ToIndex( drawClass ) ] = buffer;
        }
        return Result::SUCCESS;
    }

    void IndirectDrawAssembler::Shutdown()
    {
        for( Ref<Buffer>& buffer: m_argsBuffers )
        {
            buffer.reset();
        }
    }

    IndirectDrawArgs IndirectDrawAssembler::MakeResetArgs( uint32_t vertexCount )
    {
        IndirectDrawArgs args;
        args.vertexCount   = vertexCount;
        args.instanceCount = 0;
        args.firstVertex   = 0;
        args.firstInstance = 0;
        return args;
    }

    Result IndirectDrawAssembler::RecordReset( CommandBuffer& cmd, DrawClass drawClass, uint32_t vertexCount ) const
    {
        const Ref<Buffer>& buffer = GetArgsBuffer( drawClass );
        if( !buffer )
            return Result::INVALID_OBJECT;

        const IndirectDrawArgs args = MakeResetArgs( vertexCount );

        cmd.BufferBarrier( *buffer, VK_PIPELINE_STAGE_2_DRAW_INDIRECT_BIT, 0, VK_PIPELINE_STAGE_2_TRANSFER_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT );
        cmd.UpdateBuffer( *buffer, 0, sizeof( IndirectDrawArgs ), &args );
        cmd.BufferBarrier( *buffer, VK_PIPELINE_STAGE_2_TRANSFER_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT, VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT,
                           VK_ACCESS_2_SHADER_STORAGE_READ_BIT | VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT );
        return Result::SUCCESS;
    }

    Result IndirectDrawAssembler::RecordDraw( CommandBuffer& cmd, DrawClass drawClass ) const
    {
        const Ref<Buffer>& buffer = GetArgsBuffer( drawClass );
        if( !buffer )
            return Result::INVALID_OBJECT;

        cmd.DrawIndirect( *buffer, 0, 1, sizeof( IndirectDrawArgs ) );
        return Result::SUCCESS;
    }
} // namespace Batchline
