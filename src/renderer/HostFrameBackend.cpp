#include "renderer/HostFrameBackend.hpp"

#include "renderer/ImmediateBatch.hpp"
#include "renderer/IndirectDrawAssembler.hpp"
#include "renderer/culling/CullingStage.hpp"

namespace Batchline
{
    HostFrameBackend::HostFrameBackend( JobSystem* jobs )
        : m_jobs( jobs )
    {
    }

    Result HostFrameBackend::CheckRecording( const char* call )
    {
        if( !m_recording )
        {
            BL_CORE_ERROR( "HostFrameBackend::{} called outside of a frame.", call );
            return Result::FAIL;
        }
        return Result::SUCCESS;
    }

    void HostFrameBackend::Record( const char* call, DrawClass drawClass )
    {
        m_calls.push_back( std::string( call ) + ":" + std::string( toString( drawClass ) ) );
    }

    Result HostFrameBackend::BeginFrame()
    {
        if( m_recording )
        {
            BL_CORE_ERROR( "HostFrameBackend::BeginFrame while a frame is open." );
            return Result::FAIL;
        }

        m_recording        = true;
        m_immediateIndices = 0;
        m_counters.beginFrames++;
        m_calls.push_back( "BeginFrame" );
        return Result::SUCCESS;
    }

    Result HostFrameBackend::UpdateCamera( const CameraUniform& camera )
    {
        Result result = CheckRecording( "UpdateCamera" );
        if( result != Result::SUCCESS )
            return result;

        m_calls.push_back( "UpdateCamera" );
        if( m_nextCameraFailure != Result::SUCCESS )
        {
            result              = m_nextCameraFailure;
            m_nextCameraFailure = Result::SUCCESS;
            BL_CORE_WARN( "HostFrameBackend: injected camera update failure {}.", toString( result ) );
            return result;
        }

        m_camera = camera;
        m_counters.cameras++;
        return Result::SUCCESS;
    }

    Result HostFrameBackend::UploadInstances( DrawClass drawClass, const uint32_t* words, uint32_t count )
    {
        Result result = CheckRecording( "UploadInstances" );
        if( result != Result::SUCCESS )
            return result;

        if( words == nullptr && count > 0 )
            return Result::INVALID_ARGS;

        const uint64_t wordCount = static_cast<uint64_t>( count ) * InstanceLayout::StrideWords( drawClass );

        ClassState& state = m_classes[ ToIndex( drawClass ) ];
        state.input.assign( words, words + wordCount );
        state.output.assign( wordCount, 0u );
        state.count = count;

        m_counters.uploads++;
        Record( "Upload", drawClass );
        return Result::SUCCESS;
    }

    Result HostFrameBackend::ResetIndirectArgs( DrawClass drawClass, uint32_t vertexCount )
    {
        Result result = CheckRecording( "ResetIndirectArgs" );
        if( result != Result::SUCCESS )
            return result;

        m_classes[ ToIndex( drawClass ) ].args = IndirectDrawAssembler::MakeResetArgs( vertexCount );
        m_counters.resets++;
        Record( "Reset", drawClass );
        return Result::SUCCESS;
    }

    Result HostFrameBackend::DispatchCulling( DrawClass drawClass, const CullingUniforms& uniforms, uint32_t groupCount )
    {
        Result result = CheckRecording( "DispatchCulling" );
        if( result != Result::SUCCESS )
            return result;

        if( m_nextDispatchFailure != Result::SUCCESS )
        {
            result                = m_nextDispatchFailure;
            m_nextDispatchFailure = Result::SUCCESS;
            BL_CORE_WARN( "HostFrameBackend: injected dispatch failure {} for {}.", toString( result ), toString( drawClass ) );
            return result;
        }

        ClassState& state = m_classes[ ToIndex( drawClass ) ];
        if( uniforms.instanceCount > state.count || groupCount * CullingStage::WORKGROUP_SIZE < uniforms.instanceCount )
        {
            BL_CORE_ERROR( "HostFrameBackend: dispatch of {} instances in {} groups for a batch of {}.", uniforms.instanceCount, groupCount,
                           state.count );
            return Result::INVALID_ARGS;
        }

        result = CullingStage::ExecuteOnHost( uniforms, state.input.data(), state.output.data(), state.output.size(), state.args, m_jobs );
        if( result != Result::SUCCESS )
            return result;

        m_counters.dispatches++;
        Record( "Dispatch", drawClass );
        return Result::SUCCESS;
    }

    Result HostFrameBackend::Barrier( DrawClass drawClass )
    {
        Result result = CheckRecording( "Barrier" );
        if( result != Result::SUCCESS )
            return result;

        m_counters.barriers++;
        Record( "Barrier", drawClass );
        return Result::SUCCESS;
    }

    Result HostFrameBackend::DrawIndirect( DrawClass drawClass )
    {
        Result result = CheckRecording( "DrawIndirect" );
        if( result != Result::SUCCESS )
            return result;

        m_counters.draws++;
        Record( "Draw", drawClass );
        return Result::SUCCESS;
    }

    Result HostFrameBackend::DrawImmediate( const ImmediateBatch& batch )
    {
        Result result = CheckRecording( "DrawImmediate" );
        if( result != Result::SUCCESS )
            return result;

        m_immediateIndices = batch.GetIndexCount();
        m_counters.immediates++;
        m_calls.push_back( "DrawImmediate" );
        return Result::SUCCESS;
    }

    Result HostFrameBackend::EndFrame()
    {
        Result result = CheckRecording( "EndFrame" );
        if( result != Result::SUCCESS )
            return result;

        m_recording = false;
        m_counters.endFrames++;
        m_calls.push_back( "EndFrame" );
        return Result::SUCCESS;
    }

    void HostFrameBackend::AbortFrame()
    {
        m_recording = false;
        m_counters.abortedFrames++;
        m_calls.push_back( "AbortFrame" );
    }

    std::vector<uint32_t> HostFrameBackend::GetVisibleWords( DrawClass drawClass ) const
    {
        const ClassState& state = m_classes[ ToIndex( drawClass ) ];
        const size_t      words = static_cast<size_t>( state.args.instanceCount ) * InstanceLayout::StrideWords( drawClass );
        if( words > state.output.size() )
            return state.output;
        return std::vector<uint32_t>( state.output.begin(), state.output.begin() + words );
    }
} // namespace Batchline
