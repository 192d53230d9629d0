#include "renderer/culling/CullingStage.hpp"

#include "core/jobs/JobSystem.hpp"
#include "renderer/culling/CullingMath.hpp"
#include <algorithm>
#include <atomic>

namespace Batchline
{
    Result CullingStage::ExecuteOnHost( const CullingUniforms& uniforms, const uint32_t* input, uint32_t* output, uint64_t outputWords,
                                        IndirectDrawArgs& args, JobSystem* jobs )
    {
        if( uniforms.instanceCount == 0 )
            return Result::SUCCESS;

        if( input == nullptr || output == nullptr || uniforms.strideWords == 0 || uniforms.strideWords % InstanceLayout::BLOCK_WORDS != 0 )
        {
            BL_CORE_ERROR( "CullingStage: invalid input (stride {} words).", uniforms.strideWords );
            return Result::INVALID_ARGS;
        }

        // Survivors are appended after whatever the counter already holds
        const uint64_t required = ( static_cast<uint64_t>( args.instanceCount ) + uniforms.instanceCount ) * uniforms.strideWords;
        if( outputWords < required )
        {
            BL_CORE_ERROR( "CullingStage: output holds {} words, {} required.", outputWords, required );
            return Result::BUFFER_OVERFLOW;
        }

        const uint32_t groupCount = GetWorkgroupCount( uniforms.instanceCount, WORKGROUP_SIZE );
        auto           workgroup  = [ & ]( uint32_t group ) {
            for( uint32_t local = 0; local < WORKGROUP_SIZE; ++local )
            {
                RunInvocation( group * WORKGROUP_SIZE + local, uniforms, input, output, args );
            }
        };

        if( jobs != nullptr && jobs->IsRunning() )
        {
            jobs->Dispatch( groupCount, workgroup );
            jobs->Wait();
        }
        else
        {
            for( uint32_t group = 0; group < groupCount; ++group )
            {
                workgroup( group );
            }
        }

        return Result::SUCCESS;
    }

    void CullingStage::RunInvocation( uint32_t index, const CullingUniforms& uniforms, const uint32_t* input, uint32_t* output,
                                      IndirectDrawArgs& args )
    {
        // Idle lanes past the batch tail
        if( index >= uniforms.instanceCount )
            return;

        const uint32_t* record = input + static_cast<uint64_t>( index ) * uniforms.strideWords;
        if( !CullingMath::IsRecordVisible( record, uniforms ) )
            return;

        std::atomic_ref<uint32_t> counter( args.instanceCount );
        const uint32_t            slot = counter.fetch_add( 1, std::memory_order_relaxed );

        std::copy_n( record, uniforms.strideWords, output + static_cast<uint64_t>( slot ) * uniforms.strideWords );
    }
} // namespace Batchline
