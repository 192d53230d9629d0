#pragma once
#include "renderer/Types.hpp"
#include "renderer/culling/CullingUniforms.hpp"

namespace Batchline
{
    class ImmediateBatch;
    class Texture;
    class Sampler;

    /**
     * @brief Executes the per-frame command stream produced by the FrameOrchestrator.
     *
     * A frame is BeginFrame, UpdateCamera, then per non-empty class UploadInstances, ResetIndirectArgs,
     * DispatchCulling, Barrier and DrawIndirect, then an optional DrawImmediate and EndFrame. AbortFrame
     * replaces EndFrame when the orchestrator gives up on a frame after DEVICE_DISPATCH_FAILURE.
     */
    class FrameBackend
    {
    public:
        virtual ~FrameBackend() = default;

        virtual Result BeginFrame()                                   = 0;
        virtual Result UpdateCamera( const CameraUniform& camera )    = 0;

        /**
         * @param words count records of InstanceLayout::StrideWords( drawClass ) words
         */
        virtual Result UploadInstances( DrawClass drawClass, const uint32_t* words, uint32_t count ) = 0;

        virtual Result ResetIndirectArgs( DrawClass drawClass, uint32_t vertexCount )                                  = 0;
        virtual Result DispatchCulling( DrawClass drawClass, const CullingUniforms& uniforms, uint32_t groupCount ) = 0;

        // Makes the culling writes visible to the indirect draw and the vertex stage
        virtual Result Barrier( DrawClass drawClass ) = 0;

        virtual Result DrawIndirect( DrawClass drawClass )        = 0;
        virtual Result DrawImmediate( const ImmediateBatch& batch ) = 0;

        virtual Result EndFrame()   = 0;
        virtual void   AbortFrame() = 0;

        virtual Result SetAtlas( Ref<Texture> atlas, Ref<Sampler> sampler )
        {
            (void)atlas;
            (void)sampler;
            return Result::NOT_IMPLEMENTED;
        }

        virtual const char* GetName() const = 0;
    };
} // namespace Batchline
