#include "renderer/FrameOrchestrator.hpp"

#include "renderer/InstanceEncoder.hpp"

namespace Batchline
{
    FrameOrchestrator::FrameOrchestrator() = default;

    Result FrameOrchestrator::Init( Ref<FrameBackend> backend, const RendererConfig& config )
    {
        if( !backend )
            return Result::INVALID_ARGS;

        if( config.cullWorkgroupSize == 0 || config.verticesPerInstance == 0 )
        {
            BL_CORE_ERROR( "FrameOrchestrator: workgroup size and vertices per instance must be non-zero." );
            return Result::INVALID_ARGS;
        }

        m_backend = backend;
        m_config  = config;

        m_batches.clear();
        m_batches.reserve( DRAW_CLASS_COUNT );
        for( DrawClass drawClass: ALL_DRAW_CLASSES )
        {
            m_batches.emplace_back( drawClass, m_config.GetBatchConfig( drawClass ) );
        }
        m_immediate = ImmediateBatch( m_config.immediate );

        BL_CORE_INFO( "FrameOrchestrator initialized on the {} backend.", m_backend->GetName() );
        return Result::SUCCESS;
    }

    void FrameOrchestrator::Shutdown()
    {
        m_batches.clear();
        m_immediate.Clear();
        m_backend.reset();
    }

    void FrameOrchestrator::ClearBatches()
    {
        for( InstanceBatch& batch: m_batches )
        {
            batch.Clear();
        }
        m_immediate.Clear();
        m_rejectedObjects = 0;
    }

    uint32_t FrameOrchestrator::CountPendingClasses() const
    {
        uint32_t pending = 0;
        for( const InstanceBatch& batch: m_batches )
        {
            if( !batch.IsEmpty() )
                pending++;
        }
        return pending;
    }

    void FrameOrchestrator::BeginFrame()
    {
        ClearBatches();
    }

    Result FrameOrchestrator::Submit( const DrawObject& object )
    {
        if( m_batches.empty() )
            return Result::INVALID_OBJECT;

        InstanceRecord record;
        Result         result = InstanceEncoder::Encode( object, record );
        if( result != Result::SUCCESS )
        {
            m_rejectedObjects++;
            BL_CORE_WARN( "FrameOrchestrator: {} object rejected ({}).", toString( object.drawClass ), toString( result ) );
            return result;
        }

        return m_batches[ ToIndex( record.drawClass ) ].Push( record );
    }

    Result FrameOrchestrator::SubmitText( std::string_view text, const FontMetrics& font, const TextStyle& style )
    {
        std::vector<DrawObject> glyphs;
        TextRun::Layout( text, font, style, glyphs );

        Result first = Result::SUCCESS;
        for( const DrawObject& glyph: glyphs )
        {
            Result result = Submit( glyph );
            if( result != Result::SUCCESS && first == Result::SUCCESS )
                first = result;
        }
        return first;
    }

    void FrameOrchestrator::SetCamera( const Camera2D& camera )
    {
        m_camera        = camera.GetUniform();
        m_cullingBounds = camera.GetCullingUniforms();
    }

    void FrameOrchestrator::SetCullingBounds( const CullingUniforms& bounds )
    {
        m_cullingBounds = bounds;
    }

    Result FrameOrchestrator::SetAtlas( Ref<Texture> atlas, Ref<Sampler> sampler )
    {
        if( !m_backend )
            return Result::INVALID_OBJECT;
        return m_backend->SetAtlas( atlas, sampler );
    }

    Result FrameOrchestrator::RecordClass( InstanceBatch& batch, FrameStats& stats )
    {
        const DrawClass drawClass = batch.GetDrawClass();

        Result result = batch.Upload( *m_backend );
        if( result != Result::SUCCESS )
            return result;

        result = m_backend->ResetIndirectArgs( drawClass, m_config.verticesPerInstance );
        if( result != Result::SUCCESS )
            return result;

        const CullingUniforms uniforms = m_cullingBounds.ForBatch( drawClass, batch.GetCount() );
        result = m_backend->DispatchCulling( drawClass, uniforms, GetWorkgroupCount( batch.GetCount(), m_config.cullWorkgroupSize ) );
        if( result != Result::SUCCESS )
            return result;
        stats.dispatches++;

        result = m_backend->Barrier( drawClass );
        if( result != Result::SUCCESS )
            return result;

        result = m_backend->DrawIndirect( drawClass );
        if( result != Result::SUCCESS )
            return result;
        stats.draws++;

        stats.submittedInstances += batch.GetCount();
        return Result::SUCCESS;
    }

    Result FrameOrchestrator::EndFrame()
    {
        if( !m_backend )
            return Result::INVALID_OBJECT;

        FrameStats stats;
        stats.rejectedObjects = m_rejectedObjects;

        Result result = m_backend->BeginFrame();
        if( result != Result::SUCCESS )
        {
            BL_CORE_ERROR( "FrameOrchestrator: backend could not begin the frame ({}).", toString( result ) );
            stats.skippedClasses = DRAW_CLASS_COUNT;
            m_lastStats          = stats;
            ClearBatches();
            return result;
        }

        result = m_backend->UpdateCamera( m_camera );
        if( result != Result::SUCCESS )
        {
            // Classes are never drawn with a stale camera
            BL_CORE_ERROR( "FrameOrchestrator: camera update failed ({}), frame dropped.", toString( result ) );
            m_backend->AbortFrame();
            stats.skippedClasses = CountPendingClasses();
            m_lastStats          = stats;
            ClearBatches();
            return result;
        }

        Result firstError = Result::SUCCESS;

        for( InstanceBatch& batch: m_batches )
        {
            if( batch.IsEmpty() )
                continue;

            if( batch.IsOverflowed() )
            {
                BL_CORE_ERROR( "FrameOrchestrator: {} overflowed its cap, not drawn this frame.", toString( batch.GetDrawClass() ) );
                stats.skippedClasses++;
                if( firstError == Result::SUCCESS )
                    firstError = Result::BUFFER_OVERFLOW;
                continue;
            }

            result = RecordClass( batch, stats );
            if( result == Result::DEVICE_DISPATCH_FAILURE )
            {
                firstError = result;
                break;
            }

            if( result != Result::SUCCESS )
            {
                BL_CORE_ERROR( "FrameOrchestrator: {} skipped ({}).", toString( batch.GetDrawClass() ), toString( result ) );
                stats.skippedClasses++;
                if( firstError == Result::SUCCESS )
                    firstError = result;
            }
        }

        if( firstError != Result::DEVICE_DISPATCH_FAILURE && !m_immediate.IsEmpty() )
        {
            result = m_backend->DrawImmediate( m_immediate );
            if( result == Result::DEVICE_DISPATCH_FAILURE || ( result != Result::SUCCESS && firstError == Result::SUCCESS ) )
                firstError = result;
        }

        if( firstError == Result::DEVICE_DISPATCH_FAILURE )
        {
            BL_CORE_CRITICAL( "FrameOrchestrator: device dispatch failure, frame dropped." );
            m_backend->AbortFrame();

            // Everything not drawn yet counts as skipped
            const uint32_t pending = CountPendingClasses();
            stats.skippedClasses   = pending > stats.draws ? pending - stats.draws : 0;
            m_lastStats            = stats;
            ClearBatches();
            return firstError;
        }

        result      = m_backend->EndFrame();
        m_lastStats = stats;
        ClearBatches();

        if( result != Result::SUCCESS )
        {
            BL_CORE_ERROR( "FrameOrchestrator: backend failed to end the frame ({}).", toString( result ) );
            return result;
        }
        return firstError;
    }
} // namespace Batchline
