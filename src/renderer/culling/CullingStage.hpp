#pragma once
#include "renderer/culling/CullingUniforms.hpp"

namespace Batchline
{
    class JobSystem;

    /**
     * @brief Host executor of the visibility culling pass.
     *
     * Runs the same per-invocation program as cull_instances.comp: one job per workgroup, a relaxed atomic
     * fetch-add on args.instanceCount to reserve the output slot, then an independent copy of the record.
     * Used by the host backend and as the reference the GPU path is tested against.
     */
    class CullingStage
    {
    public:
        static constexpr uint32_t WORKGROUP_SIZE = 64;

        /**
         * @param input         uniforms.instanceCount records of uniforms.strideWords words
         * @param output        Compacted survivors. Must hold at least uniforms.instanceCount records.
         * @param outputWords   Size of output in words
         * @param args          Indirect args. instanceCount is incremented once per visible record.
         * @param jobs          Optional. Runs serially when null.
         */
        static Result ExecuteOnHost( const CullingUniforms& uniforms, const uint32_t* input, uint32_t* output, uint64_t outputWords,
                                     IndirectDrawArgs& args, JobSystem* jobs );

    private:
        static void RunInvocation( uint32_t index, const CullingUniforms& uniforms, const uint32_t* input, uint32_t* output,
                                   IndirectDrawArgs& args );
    };
} // namespace Batchline
