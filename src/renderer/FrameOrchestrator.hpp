#pragma once
#include "renderer/Camera2D.hpp"
#include "renderer/FrameBackend.hpp"
#include "renderer/ImmediateBatch.hpp"
#include "renderer/InstanceBatch.hpp"
#include "renderer/TextRun.hpp"
#include <string_view>

namespace Batchline
{
    struct FrameStats
    {
        uint32_t dispatches         = 0;
        uint32_t draws              = 0;
        uint32_t skippedClasses     = 0;
        uint32_t submittedInstances = 0;
        uint32_t rejectedObjects    = 0;
    };

    /**
     * @brief Owns the per-class batches and drives one frame through a FrameBackend.
     *
     * Submit() encodes and queues objects. EndFrame() uploads each non-empty class, resets its indirect args,
     * culls it, fences the cull against the draw and records the indirect draw, in PRIMITIVE, QUAD, SPRITE,
     * GLYPH order, then draws the immediate batch and clears everything for the next frame.
     */
    class FrameOrchestrator
    {
    public:
        FrameOrchestrator();

        Result Init( Ref<FrameBackend> backend, const RendererConfig& config = {} );
        void   Shutdown();

        // Drops anything queued since the last EndFrame
        void BeginFrame();

        /**
         * @return INVALID_OBJECT for malformed objects, BUFFER_OVERFLOW once the class is full. The object is
         *         skipped either way and the frame goes on.
         */
        Result Submit( const DrawObject& object );

        /**
         * @brief Lays a string out with TextRun and submits its glyphs.
         * @return The first failing Submit result, or SUCCESS.
         */
        Result SubmitText( std::string_view text, const FontMetrics& font, const TextStyle& style );

        ImmediateBatch& GetImmediate() { return m_immediate; }

        // Camera uniform and culling bound for the next EndFrame
        void SetCamera( const Camera2D& camera );
        // Overrides the culling bound until the next SetCamera
        void SetCullingBounds( const CullingUniforms& bounds );

        Result SetAtlas( Ref<Texture> atlas, Ref<Sampler> sampler );

        /**
         * @brief Records and submits the frame.
         * @return DEVICE_DISPATCH_FAILURE if the backend lost the device (the rest of the frame is dropped),
         *         otherwise the first error of a skipped class, or SUCCESS.
         */
        Result EndFrame();

        const FrameStats&    GetLastFrameStats() const { return m_lastStats; }
        const InstanceBatch& GetBatch( DrawClass drawClass ) const { return m_batches[ ToIndex( drawClass ) ]; }
        const Ref<FrameBackend>& GetBackend() const { return m_backend; }
        const RendererConfig&    GetConfig() const { return m_config; }

    private:
        Result   RecordClass( InstanceBatch& batch, FrameStats& stats );
        void     ClearBatches();
        // Non-empty classes, overflowed ones included
        uint32_t CountPendingClasses() const;

    private:
        Ref<FrameBackend>          m_backend;
        RendererConfig             m_config;
        std::vector<InstanceBatch> m_batches;
        ImmediateBatch             m_immediate;

        CameraUniform   m_camera;
        CullingUniforms m_cullingBounds;

        FrameStats m_lastStats;
        uint32_t   m_rejectedObjects = 0;
    };
} // namespace Batchline
