#pragma once
#include "renderer/FrameBackend.hpp"
#include <string>
#include <vector>

namespace Batchline
{
    class JobSystem;

    /**
     * @brief CPU implementation of the frame backend.
     * Culls through CullingStage on the job system and keeps every class's compacted output and indirect args
     * until the next upload of that class, so tests can check the visible set without a GPU.
     */
    class HostFrameBackend : public FrameBackend
    {
    public:
        struct Counters
        {
            uint32_t beginFrames   = 0;
            uint32_t cameras       = 0;
            uint32_t uploads       = 0;
            uint32_t resets        = 0;
            uint32_t dispatches    = 0;
            uint32_t barriers      = 0;
            uint32_t draws         = 0;
            uint32_t immediates    = 0;
            uint32_t endFrames     = 0;
            uint32_t abortedFrames = 0;
        };

        explicit HostFrameBackend( JobSystem* jobs = nullptr );

        Result BeginFrame() override;
        Result UpdateCamera( const CameraUniform& camera ) override;
        Result UploadInstances( DrawClass drawClass, const uint32_t* words, uint32_t count ) override;
        Result ResetIndirectArgs( DrawClass drawClass, uint32_t vertexCount ) override;
        Result DispatchCulling( DrawClass drawClass, const CullingUniforms& uniforms, uint32_t groupCount ) override;
        Result Barrier( DrawClass drawClass ) override;
        Result DrawIndirect( DrawClass drawClass ) override;
        Result DrawImmediate( const ImmediateBatch& batch ) override;
        Result EndFrame() override;
        void   AbortFrame() override;

        const char* GetName() const override { return "Host"; }

        /**
         * @brief The next DispatchCulling returns result without culling.
         */
        void FailNextDispatch( Result result ) { m_nextDispatchFailure = result; }
        void FailNextCameraUpdate( Result result ) { m_nextCameraFailure = result; }

        const IndirectDrawArgs& GetArgs( DrawClass drawClass ) const { return m_classes[ ToIndex( drawClass ) ].args; }

        // Compacted records, args.instanceCount * stride words
        std::vector<uint32_t> GetVisibleWords( DrawClass drawClass ) const;

        uint32_t GetUploadedCount( DrawClass drawClass ) const { return m_classes[ ToIndex( drawClass ) ].count; }

        const Counters&                 GetCounters() const { return m_counters; }
        const std::vector<std::string>& GetCalls() const { return m_calls; }
        const CameraUniform&            GetLastCamera() const { return m_camera; }
        uint32_t                        GetImmediateIndexCount() const { return m_immediateIndices; }
        bool                            IsRecording() const { return m_recording; }

        void ClearCalls() { m_calls.clear(); }

    private:
        Result CheckRecording( const char* call );
        void   Record( const char* call, DrawClass drawClass );

    private:
        struct ClassState
        {
            std::vector<uint32_t> input;
            std::vector<uint32_t> output;
            IndirectDrawArgs      args;
            uint32_t              count = 0;
        };

        JobSystem*                               m_jobs;
        std::array<ClassState, DRAW_CLASS_COUNT> m_classes;
        CameraUniform                            m_camera;
        Counters                                 m_counters;
        std::vector<std::string>                 m_calls;
        uint32_t                                 m_immediateIndices = 0;
        bool                                     m_recording        = false;
        Result                                   m_nextDispatchFailure = Result::SUCCESS;
        Result                                   m_nextCameraFailure   = Result::SUCCESS;
    };
} // namespace Batchline
