#include "renderer/VulkanFrameBackend.hpp"

#include "compute/ComputeKernel.hpp"
#include "renderer/ImmediateBatch.hpp"
#include "renderer/InstanceBatch.hpp"
#include "renderer/culling/CullingStage.hpp"
#include "rhi/BindingGroup.hpp"
#include <algorithm>
#include <stdexcept>

namespace Batchline
{
    static constexpr const char* CULL_SHADER = "shaders/compute/cull_instances.comp";

    static constexpr uint32_t CAMERA_SET = 0;
    static constexpr uint32_t ATLAS_SET  = 1;

    static constexpr VkPipelineStageFlags2 INSTANCE_CONSUMER_STAGES =
        VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT | VK_PIPELINE_STAGE_2_VERTEX_ATTRIBUTE_INPUT_BIT;

    VulkanFrameBackend::VulkanFrameBackend( Ref<Device> device, const VulkanBackendConfig& config )
        : m_device( device )
        , m_config( config )
    {
    }

    VulkanFrameBackend::~VulkanFrameBackend()
    {
        Shutdown();
    }

    Result VulkanFrameBackend::Init()
    {
        if( m_initialized )
            return Result::SUCCESS;

        if( !m_device )
            return Result::INVALID_ARGS;

        Result result = m_pipelines.Init( m_device, m_config.colorFormat );
        if( result != Result::SUCCESS )
            return result;

        try
        {
            ComputePipelineDesc cullDesc;
            cullDesc.shader = m_device->CreateShader( CULL_SHADER );
            Ref<ComputePipeline> pipeline = cullDesc.shader ? m_device->CreateComputePipeline( cullDesc ) : nullptr;
            if( !pipeline )
            {
                BL_CORE_ERROR( "VulkanFrameBackend: culling pipeline could not be created." );
                return Result::FAIL;
            }
            m_cullKernel = CreateScope<ComputeKernel>( m_device, pipeline, "CullInstances", CullingStage::WORKGROUP_SIZE );
        }
        catch( const std::runtime_error& e )
        {
            BL_CORE_ERROR( "VulkanFrameBackend: {}", e.what() );
            return Result::FAIL;
        }

        m_streaming = CreateScope<StreamingManager>( m_device, m_config.streaming );
        result      = m_streaming->Init();
        if( result != Result::SUCCESS )
            return result;

        result = m_assembler.Init( m_device );
        if( result != Result::SUCCESS )
            return result;

        for( DrawClass drawClass: ALL_DRAW_CLASSES )
        {
            result = EnsureClassCapacity( drawClass, std::max( m_config.initialInstanceCapacity, 1u ) );
            if( result != Result::SUCCESS )
                return result;
        }

        for( FrameResources& frame: m_frames )
        {
            frame.cameraBuffer = m_device->CreateBuffer( { sizeof( CameraUniform ), BufferType::UNIFORM } );
            if( !frame.cameraBuffer )
                return Result::OUT_OF_MEMORY;

            // Set 0 layouts are identical across the pipelines, so one set serves all of them
            frame.cameraGroup = CreateGraphicsBindingGroup( *m_pipelines.Get( DrawClass::QUAD ), CAMERA_SET );
            if( !frame.cameraGroup || frame.cameraGroup->Set( "camera", *frame.cameraBuffer ) != Result::SUCCESS )
                return Result::FAIL;
            frame.cameraGroup->Build();

            frame.atlasGroup = CreateGraphicsBindingGroup( *m_pipelines.Get( DrawClass::SPRITE ), ATLAS_SET );
            if( !frame.atlasGroup )
                return Result::FAIL;

            for( DrawClass drawClass: ALL_DRAW_CLASSES )
            {
                frame.cullGroups[ ToIndex( drawClass ) ] = m_cullKernel->CreateBindingGroup( 0 );
                if( !frame.cullGroups[ ToIndex( drawClass ) ] )
                    return Result::FAIL;
            }
        }

        if( !m_target )
        {
            TextureDesc targetDesc;
            targetDesc.width  = m_config.targetWidth;
            targetDesc.height = m_config.targetHeight;
            targetDesc.format = m_config.colorFormat;
            targetDesc.usage  = TextureUsage::RENDER_TARGET | TextureUsage::TRANSFER_SRC | TextureUsage::SAMPLED;
            m_target          = m_device->CreateTexture( targetDesc );
            if( !m_target )
                return Result::OUT_OF_MEMORY;
        }

        const auto& quad = PipelineSet::GetUnitQuad();
        m_unitQuad       = CreateDeviceBuffer( sizeof( quad ), BufferType::VERTEX );
        if( !m_unitQuad )
            return Result::OUT_OF_MEMORY;

        result = ExecuteAndWait( [ & ]( CommandBuffer& cmd ) {
            cmd.UpdateBuffer( *m_unitQuad, 0, sizeof( quad ), quad.data() );
            cmd.BufferBarrier( *m_unitQuad, VK_PIPELINE_STAGE_2_TRANSFER_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT,
                               VK_PIPELINE_STAGE_2_VERTEX_ATTRIBUTE_INPUT_BIT, VK_ACCESS_2_VERTEX_ATTRIBUTE_READ_BIT );
            return Result::SUCCESS;
        } );
        if( result != Result::SUCCESS )
            return result;

        // 1x1 white atlas until the client provides one, so SPRITE draws stay valid
        const uint32_t white = 0xFFFFFFFFu;
        m_atlas              = CreateAtlasTexture( 1, 1, &white );
        m_atlasSampler       = m_device->CreateSampler();
        if( !m_atlas || !m_atlasSampler )
            return Result::FAIL;

        m_initialized = true;
        BL_CORE_INFO( "VulkanFrameBackend ready on '{}' ({}x{} target).", m_device->GetName(), m_target->GetWidth(), m_target->GetHeight() );
        return Result::SUCCESS;
    }

    void VulkanFrameBackend::Shutdown()
    {
        if( !m_device )
            return;

        if( m_recording )
            AbortFrame();

        m_device->WaitIdle();

        if( m_streaming )
        {
            m_streaming->Shutdown();
            m_streaming.reset();
        }

        for( FrameResources& frame: m_frames )
        {
            frame = FrameResources{};
        }
        for( ClassResources& resources: m_classes )
        {
            resources = ClassResources{};
        }

        m_assembler.Shutdown();
        m_pipelines.Shutdown();
        m_cullKernel.reset();
        m_unitQuad.reset();
        m_immediateVertices.reset();
        m_immediateIndices.reset();
        m_atlas.reset();
        m_atlasSampler.reset();
        m_target.reset();
        m_initialized = false;
    }

    Result VulkanFrameBackend::CheckRecording( const char* call ) const
    {
        if( !m_recording )
        {
            BL_CORE_ERROR( "VulkanFrameBackend::{} called outside of a frame.", call );
            return Result::FAIL;
        }
        return Result::SUCCESS;
    }

    Result VulkanFrameBackend::MapFrameFailure( Result result ) const
    {
        // A GPU that stops retiring frames is treated like a lost device
        if( result == Result::TIMEOUT )
            return Result::DEVICE_DISPATCH_FAILURE;
        return result;
    }

    Ref<Buffer> VulkanFrameBackend::CreateDeviceBuffer( VkDeviceSize size, BufferType type )
    {
        Ref<Buffer> buffer = m_device->CreateBuffer( { size, type } );
        if( !buffer )
        {
            BL_CORE_ERROR( "VulkanFrameBackend: failed to allocate {} bytes.", size );
        }
        return buffer;
    }

    Ref<BindingGroup> VulkanFrameBackend::CreateGraphicsBindingGroup( const GraphicsPipeline& pipeline, uint32_t setIndex )
    {
        VkDescriptorSetLayout layout = pipeline.GetDescriptorSetLayout( setIndex );
        if( layout == VK_NULL_HANDLE )
        {
            BL_CORE_ERROR( "VulkanFrameBackend: pipeline has no descriptor set {}.", setIndex );
            return nullptr;
        }

        VkDescriptorSet set = VK_NULL_HANDLE;
        if( m_device->AllocateDescriptor( layout, set ) != Result::SUCCESS )
            return nullptr;

        return CreateRef<BindingGroup>( m_device, set, setIndex, pipeline.GetReflectionData() );
    }

    Result VulkanFrameBackend::EnsureClassCapacity( DrawClass drawClass, uint32_t count )
    {
        ClassResources& resources = m_classes[ ToIndex( drawClass ) ];
        if( count <= resources.capacity && resources.instances && resources.visible )
            return Result::SUCCESS;

        const uint64_t capacity = ComputeGrownCapacity( resources.capacity, count, m_config.initialInstanceCapacity );
        const uint64_t bytes    = capacity * InstanceLayout::StrideBytes( drawClass );

        Ref<Buffer> instances = CreateDeviceBuffer( bytes, BufferType::INSTANCE );
        Ref<Buffer> visible   = CreateDeviceBuffer( bytes, BufferType::INSTANCE );
        if( !instances || !visible )
            return Result::OUT_OF_MEMORY;

        // The replaced buffers may still be read by the previous frame
        if( m_recording )
        {
            FrameResources& frame = m_frames[ m_streaming->GetFrameIndex() ];
            if( resources.instances )
                frame.retired.push_back( resources.instances );
            if( resources.visible )
                frame.retired.push_back( resources.visible );
        }
        else
        {
            m_device->WaitIdle();
        }

        resources.instances = instances;
        resources.visible   = visible;
        resources.capacity  = static_cast<uint32_t>( capacity );
        resources.generation++;

        BL_CORE_TRACE( "VulkanFrameBackend: {} buffers hold {} instances.", toString( drawClass ), capacity );
        return Result::SUCCESS;
    }

    Result VulkanFrameBackend::BeginFrame()
    {
        if( !m_initialized )
            return Result::INVALID_OBJECT;

        if( m_recording )
        {
            BL_CORE_ERROR( "VulkanFrameBackend::BeginFrame while a frame is open." );
            return Result::FAIL;
        }

        Result result = m_streaming->BeginFrame( m_config.frameTimeoutNs );
        if( result != Result::SUCCESS )
            return MapFrameFailure( result );

        FrameResources& frame = m_frames[ m_streaming->GetFrameIndex() ];
        frame.retired.clear();
        frame.retiredTextures.clear();
        frame.retiredSamplers.clear();

        frame.cmd = m_device->CreateCommandBuffer( QueueType::GRAPHICS );
        if( !frame.cmd )
            return Result::FAIL;

        result = frame.cmd->Begin();
        if( result != Result::SUCCESS )
            return result;

        m_pendingDraws.clear();
        m_immediateIndexCount = 0;
        m_recording           = true;
        return Result::SUCCESS;
    }

    Result VulkanFrameBackend::UpdateCamera( const CameraUniform& camera )
    {
        Result result = CheckRecording( "UpdateCamera" );
        if( result != Result::SUCCESS )
            return result;

        // The slot's previous reader retired in BeginFrame
        return m_frames[ m_streaming->GetFrameIndex() ].cameraBuffer->Write( &camera, sizeof( CameraUniform ) );
    }

    Result VulkanFrameBackend::UploadInstances( DrawClass drawClass, const uint32_t* words, uint32_t count )
    {
        Result result = CheckRecording( "UploadInstances" );
        if( result != Result::SUCCESS )
            return result;

        if( words == nullptr || count == 0 )
            return Result::INVALID_ARGS;

        result = EnsureClassCapacity( drawClass, count );
        if( result != Result::SUCCESS )
            return result;

        ClassResources& resources = m_classes[ ToIndex( drawClass ) ];
        CommandBuffer&  cmd       = *m_frames[ m_streaming->GetFrameIndex() ].cmd;
        const uint64_t  bytes     = static_cast<uint64_t>( count ) * InstanceLayout::StrideBytes( drawClass );

        cmd.BufferBarrier( *resources.instances, INSTANCE_CONSUMER_STAGES, 0, VK_PIPELINE_STAGE_2_TRANSFER_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT );

        result = m_streaming->UploadToBuffer( cmd, *resources.instances, words, bytes );
        if( result != Result::SUCCESS )
            return result;

        cmd.BufferBarrier( *resources.instances, VK_PIPELINE_STAGE_2_TRANSFER_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT,
                           VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, VK_ACCESS_2_SHADER_STORAGE_READ_BIT );

        resources.count = count;
        return Result::SUCCESS;
    }

    Result VulkanFrameBackend::ResetIndirectArgs( DrawClass drawClass, uint32_t vertexCount )
    {
        Result result = CheckRecording( "ResetIndirectArgs" );
        if( result != Result::SUCCESS )
            return result;

        return m_assembler.RecordReset( *m_frames[ m_streaming->GetFrameIndex() ].cmd, drawClass, vertexCount );
    }

    Result VulkanFrameBackend::DispatchCulling( DrawClass drawClass, const CullingUniforms& uniforms, uint32_t groupCount )
    {
        Result result = CheckRecording( "DispatchCulling" );
        if( result != Result::SUCCESS )
            return result;

        ClassResources& resources = m_classes[ ToIndex( drawClass ) ];
        FrameResources& frame     = m_frames[ m_streaming->GetFrameIndex() ];
        const uint32_t  index     = ToIndex( drawClass );

        if( uniforms.instanceCount > resources.count || groupCount < m_cullKernel->GetGroupCount( uniforms.instanceCount ) )
        {
            BL_CORE_ERROR( "VulkanFrameBackend: culling {} instances of a {} batch in {} groups of {}.", uniforms.instanceCount,
                           resources.count, groupCount, m_cullKernel->GetGroupSize() );
            return Result::INVALID_ARGS;
        }

        BindingGroup& group = *frame.cullGroups[ index ];
        if( frame.cullGenerations[ index ] != resources.generation )
        {
            const Ref<Buffer>& args = m_assembler.GetArgsBuffer( drawClass );
            if( group.Set( "inputInstances", *resources.instances ) != Result::SUCCESS ||
                group.Set( "visibleInstances", *resources.visible ) != Result::SUCCESS || group.Set( "drawArgs", *args ) != Result::SUCCESS )
            {
                return Result::FAIL;
            }
            group.Build();
            frame.cullGenerations[ index ] = resources.generation;
        }

        CommandBuffer& cmd = *frame.cmd;
        // Last frame's vertex fetch of the compacted records must finish before they are overwritten
        cmd.BufferBarrier( *resources.visible, VK_PIPELINE_STAGE_2_VERTEX_ATTRIBUTE_INPUT_BIT, 0, VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT,
                           VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT );

        m_cullKernel->Dispatch( cmd, group, groupCount, uniforms );
        return Result::SUCCESS;
    }

    Result VulkanFrameBackend::Barrier( DrawClass drawClass )
    {
        Result result = CheckRecording( "Barrier" );
        if( result != Result::SUCCESS )
            return result;

        CommandBuffer&     cmd  = *m_frames[ m_streaming->GetFrameIndex() ].cmd;
        const Ref<Buffer>& args = m_assembler.GetArgsBuffer( drawClass );

        constexpr VkPipelineStageFlags2 dstStages = VK_PIPELINE_STAGE_2_DRAW_INDIRECT_BIT | VK_PIPELINE_STAGE_2_VERTEX_ATTRIBUTE_INPUT_BIT;
        constexpr VkAccessFlags2        dstAccess = VK_ACCESS_2_INDIRECT_COMMAND_READ_BIT | VK_ACCESS_2_VERTEX_ATTRIBUTE_READ_BIT;

        cmd.BufferBarrier( *args, VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT, dstStages, dstAccess );
        cmd.BufferBarrier( *m_classes[ ToIndex( drawClass ) ].visible, VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT, VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT,
                           dstStages, dstAccess );
        return Result::SUCCESS;
    }

    Result VulkanFrameBackend::DrawIndirect( DrawClass drawClass )
    {
        Result result = CheckRecording( "DrawIndirect" );
        if( result != Result::SUCCESS )
            return result;

        // Replayed inside the rendering scope by EndFrame
        m_pendingDraws.push_back( drawClass );
        return Result::SUCCESS;
    }

    Result VulkanFrameBackend::UploadImmediate( const ImmediateBatch& batch )
    {
        CommandBuffer& cmd = *m_frames[ m_streaming->GetFrameIndex() ].cmd;

        const VkDeviceSize vertexBytes = batch.GetVertices().size() * sizeof( ImmediateVertex );
        const VkDeviceSize indexBytes  = batch.GetIndices().size() * sizeof( uint32_t );

        auto ensure = [ & ]( Ref<Buffer>& buffer, VkDeviceSize bytes, BufferType type ) {
            if( buffer && buffer->GetSize() >= bytes )
                return Result::SUCCESS;

            const VkDeviceSize size  = ComputeGrownCapacity( buffer ? buffer->GetSize() : 0, bytes, 64ull << 10 );
            Ref<Buffer>        grown = CreateDeviceBuffer( size, type );
            if( !grown )
                return Result::OUT_OF_MEMORY;
            if( buffer )
                m_frames[ m_streaming->GetFrameIndex() ].retired.push_back( buffer );
            buffer = grown;
            return Result::SUCCESS;
        };

        Result result = ensure( m_immediateVertices, vertexBytes, BufferType::VERTEX );
        if( result == Result::SUCCESS )
            result = ensure( m_immediateIndices, indexBytes, BufferType::INDEX );
        if( result != Result::SUCCESS )
            return result;

        cmd.BufferBarrier( *m_immediateVertices, VK_PIPELINE_STAGE_2_VERTEX_ATTRIBUTE_INPUT_BIT, 0, VK_PIPELINE_STAGE_2_TRANSFER_BIT,
                           VK_ACCESS_2_TRANSFER_WRITE_BIT );
        cmd.BufferBarrier( *m_immediateIndices, VK_PIPELINE_STAGE_2_INDEX_INPUT_BIT, 0, VK_PIPELINE_STAGE_2_TRANSFER_BIT,
                           VK_ACCESS_2_TRANSFER_WRITE_BIT );

        result = m_streaming->UploadToBuffer( cmd, *m_immediateVertices, batch.GetVertices().data(), vertexBytes );
        if( result == Result::SUCCESS )
            result = m_streaming->UploadToBuffer( cmd, *m_immediateIndices, batch.GetIndices().data(), indexBytes );
        if( result != Result::SUCCESS )
            return result;

        cmd.BufferBarrier( *m_immediateVertices, VK_PIPELINE_STAGE_2_TRANSFER_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT,
                           VK_PIPELINE_STAGE_2_VERTEX_ATTRIBUTE_INPUT_BIT, VK_ACCESS_2_VERTEX_ATTRIBUTE_READ_BIT );
        cmd.BufferBarrier( *m_immediateIndices, VK_PIPELINE_STAGE_2_TRANSFER_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT,
                           VK_PIPELINE_STAGE_2_INDEX_INPUT_BIT, VK_ACCESS_2_INDEX_READ_BIT );
        return Result::SUCCESS;
    }

    Result VulkanFrameBackend::DrawImmediate( const ImmediateBatch& batch )
    {
        Result result = CheckRecording( "DrawImmediate" );
        if( result != Result::SUCCESS )
            return result;

        if( batch.IsEmpty() )
            return Result::SUCCESS;

        result = UploadImmediate( batch );
        if( result != Result::SUCCESS )
            return result;

        m_immediateIndexCount = batch.GetIndexCount();
        return Result::SUCCESS;
    }

    Result VulkanFrameBackend::RefreshAtlasGroup( FrameResources& frame )
    {
        if( frame.atlasGeneration == m_atlasGeneration )
            return Result::SUCCESS;

        Result result = frame.atlasGroup->Set( "atlas", *m_atlas, *m_atlasSampler );
        if( result != Result::SUCCESS )
            return result;

        frame.atlasGroup->Build();
        frame.atlasGeneration = m_atlasGeneration;
        return Result::SUCCESS;
    }

    Result VulkanFrameBackend::RecordInstancedDraw( CommandBuffer& cmd, FrameResources& frame, DrawClass drawClass )
    {
        const GraphicsPipeline& pipeline = *m_pipelines.Get( drawClass );

        cmd.BindGraphicsPipeline( pipeline );

        std::vector<VkDescriptorSet> sets = { frame.cameraGroup->GetHandle() };
        if( PipelineSet::UsesAtlas( drawClass ) )
        {
            Result result = RefreshAtlasGroup( frame );
            if( result != Result::SUCCESS )
                return result;
            sets.push_back( frame.atlasGroup->GetHandle() );
        }
        cmd.BindDescriptorSets( VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline.GetLayout(), CAMERA_SET, sets );

        cmd.BindVertexBuffer( 0, *m_unitQuad );
        cmd.BindVertexBuffer( 1, *m_classes[ ToIndex( drawClass ) ].visible );
        return m_assembler.RecordDraw( cmd, drawClass );
    }

    Result VulkanFrameBackend::RecordImmediateDraw( CommandBuffer& cmd, FrameResources& frame )
    {
        const GraphicsPipeline& pipeline = *m_pipelines.GetImmediate();

        cmd.BindGraphicsPipeline( pipeline );
        cmd.BindDescriptorSets( VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline.GetLayout(), CAMERA_SET, { frame.cameraGroup->GetHandle() } );
        cmd.BindVertexBuffer( 0, *m_immediateVertices );
        cmd.BindIndexBuffer( *m_immediateIndices, 0, VK_INDEX_TYPE_UINT32 );
        cmd.DrawIndexed( m_immediateIndexCount, 1, 0, 0, 0 );
        return Result::SUCCESS;
    }

    Result VulkanFrameBackend::EndFrame()
    {
        Result result = CheckRecording( "EndFrame" );
        if( result != Result::SUCCESS )
            return result;

        FrameResources& frame = m_frames[ m_streaming->GetFrameIndex() ];
        CommandBuffer&  cmd   = *frame.cmd;

        m_target->TransitionLayout( cmd, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL );

        RenderingAttachmentInfo color;
        color.imageView  = m_target->GetView();
        color.clearValue = { { { m_config.clearColor.r, m_config.clearColor.g, m_config.clearColor.b, m_config.clearColor.a } } };

        RenderingInfo rendering;
        rendering.renderArea = { { 0, 0 }, { m_target->GetWidth(), m_target->GetHeight() } };
        rendering.colorAttachments.push_back( color );

        cmd.BeginRendering( rendering );
        cmd.SetViewport( 0.0f, 0.0f, static_cast<float>( m_target->GetWidth() ), static_cast<float>( m_target->GetHeight() ) );
        cmd.SetScissor( 0, 0, m_target->GetWidth(), m_target->GetHeight() );

        for( DrawClass drawClass: m_pendingDraws )
        {
            result = RecordInstancedDraw( cmd, frame, drawClass );
            if( result != Result::SUCCESS )
            {
                BL_CORE_ERROR( "VulkanFrameBackend: {} draw not recorded ({}).", toString( drawClass ), toString( result ) );
                break;
            }
        }

        if( result == Result::SUCCESS && m_immediateIndexCount > 0 )
            result = RecordImmediateDraw( cmd, frame );

        cmd.EndRendering();
        m_target->TransitionLayout( cmd, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL );

        const Result endResult = cmd.End();
        if( endResult != Result::SUCCESS )
        {
            ReleaseFrame();
            return endResult;
        }

        uint64_t signalValue = 0;
        Result   submitted   = m_device->GetGraphicsQueue()->Submit( cmd.GetHandle(), signalValue );
        if( submitted != Result::SUCCESS )
        {
            ReleaseFrame();
            return submitted;
        }

        m_streaming->EndFrame( signalValue );
        m_pendingDraws.clear();
        m_recording = false;
        return result;
    }

    void VulkanFrameBackend::ReleaseFrame()
    {
        // Transitions recorded into the dropped command buffer never ran
        m_target->DiscardLayout();

        // Nothing of this slot reached the GPU, it can be reused right away
        m_streaming->EndFrame( 0 );
        m_pendingDraws.clear();
        m_immediateIndexCount = 0;
        m_recording           = false;
    }

    void VulkanFrameBackend::AbortFrame()
    {
        if( !m_recording )
            return;

        BL_CORE_WARN( "VulkanFrameBackend: frame aborted, command buffer dropped." );
        m_frames[ m_streaming->GetFrameIndex() ].cmd.reset();
        ReleaseFrame();
    }

    Result VulkanFrameBackend::SetAtlas( Ref<Texture> atlas, Ref<Sampler> sampler )
    {
        if( !atlas )
            return Result::INVALID_ARGS;

        Ref<Sampler> newSampler = sampler ? sampler : m_device->CreateSampler();
        if( !newSampler )
            return Result::FAIL;

        Retire( atlas != m_atlas ? m_atlas : nullptr, newSampler != m_atlasSampler ? m_atlasSampler : nullptr );
        m_atlas        = atlas;
        m_atlasSampler = newSampler;

        // Slots pick the new atlas up the next time they draw
        m_atlasGeneration++;
        return Result::SUCCESS;
    }

    Result VulkanFrameBackend::SetRenderTarget( Ref<Texture> target )
    {
        if( !target || target->GetFormat() != m_config.colorFormat )
        {
            BL_CORE_ERROR( "VulkanFrameBackend: render target must use the pipeline color format." );
            return Result::INVALID_ARGS;
        }
        if( m_recording )
            return Result::FAIL;

        if( target != m_target )
            Retire( m_target );
        m_target = target;
        return Result::SUCCESS;
    }

    void VulkanFrameBackend::Retire( Ref<Texture> texture, Ref<Sampler> sampler )
    {
        // Any slot still in flight may sample or render into them
        for( FrameResources& frame: m_frames )
        {
            if( texture )
                frame.retiredTextures.push_back( texture );
            if( sampler )
                frame.retiredSamplers.push_back( sampler );
        }
    }

    Result VulkanFrameBackend::ExecuteAndWait( const std::function<Result( CommandBuffer& )>& record )
    {
        if( m_recording )
        {
            BL_CORE_ERROR( "VulkanFrameBackend: one-off submission while a frame is open." );
            return Result::FAIL;
        }

        Ref<CommandBuffer> cmd = m_device->CreateCommandBuffer( QueueType::GRAPHICS );
        if( !cmd )
            return Result::FAIL;

        Result result = cmd->Begin();
        if( result != Result::SUCCESS )
            return result;

        result = record( *cmd );
        if( result != Result::SUCCESS )
            return result;

        result = cmd->End();
        if( result != Result::SUCCESS )
            return result;

        Ref<Queue> queue       = m_device->GetGraphicsQueue();
        uint64_t   signalValue = 0;
        result                 = queue->Submit( cmd->GetHandle(), signalValue );
        if( result != Result::SUCCESS )
            return result;

        return MapFrameFailure( m_device->WaitForQueue( queue, signalValue, m_config.frameTimeoutNs ) );
    }

    Ref<Texture> VulkanFrameBackend::CreateAtlasTexture( uint32_t width, uint32_t height, const void* pixels )
    {
        if( width == 0 || height == 0 || pixels == nullptr )
            return nullptr;

        TextureDesc desc;
        desc.width  = width;
        desc.height = height;
        desc.format = VK_FORMAT_R8G8B8A8_UNORM;
        desc.usage  = TextureUsage::SAMPLED | TextureUsage::TRANSFER_DST;

        Ref<Texture> texture = m_device->CreateTexture( desc );
        if( !texture )
            return nullptr;

        const VkDeviceSize size   = static_cast<VkDeviceSize>( width ) * height * 4;
        Result             result = ExecuteAndWait( [ & ]( CommandBuffer& cmd ) { return m_streaming->UploadToTexture( cmd, *texture, pixels, size ); } );
        if( result != Result::SUCCESS )
        {
            BL_CORE_ERROR( "VulkanFrameBackend: atlas upload failed ({}).", toString( result ) );
            return nullptr;
        }
        return texture;
    }

    Result VulkanFrameBackend::DebugReadback( DrawClass drawClass, IndirectDrawArgs& outArgs, std::vector<uint32_t>* outVisibleWords )
    {
        if( !m_initialized )
            return Result::INVALID_OBJECT;

        const ClassResources& resources = m_classes[ ToIndex( drawClass ) ];
        const Ref<Buffer>&    args      = m_assembler.GetArgsBuffer( drawClass );
        const VkDeviceSize    visibleBytes =
            outVisibleWords ? static_cast<VkDeviceSize>( resources.count ) * InstanceLayout::StrideBytes( drawClass ) : 0;

        TransientAllocation argsCopy;
        TransientAllocation visibleCopy;

        Result result = ExecuteAndWait( [ & ]( CommandBuffer& cmd ) {
            argsCopy = m_streaming->CaptureBuffer( cmd, *args, sizeof( IndirectDrawArgs ) );
            if( visibleBytes > 0 )
                visibleCopy = m_streaming->CaptureBuffer( cmd, *resources.visible, visibleBytes );
            if( !argsCopy.IsValid() || ( visibleBytes > 0 && !visibleCopy.IsValid() ) )
                return Result::OUT_OF_MEMORY;

            cmd.BufferBarrier( *argsCopy.buffer, VK_PIPELINE_STAGE_2_TRANSFER_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT, VK_PIPELINE_STAGE_2_HOST_BIT,
                               VK_ACCESS_2_HOST_READ_BIT );
            // The second capture may have landed in a grown heap
            if( visibleCopy.IsValid() && visibleCopy.buffer != argsCopy.buffer )
                cmd.BufferBarrier( *visibleCopy.buffer, VK_PIPELINE_STAGE_2_TRANSFER_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT,
                                   VK_PIPELINE_STAGE_2_HOST_BIT, VK_ACCESS_2_HOST_READ_BIT );
            return Result::SUCCESS;
        } );
        if( result != Result::SUCCESS )
            return result;

        result = argsCopy.buffer->Read( &outArgs, sizeof( IndirectDrawArgs ), argsCopy.offset );
        if( result != Result::SUCCESS || !outVisibleWords )
            return result;

        const uint64_t visibleWords = static_cast<uint64_t>( std::min( outArgs.instanceCount, resources.count ) ) * InstanceLayout::StrideWords( drawClass );
        outVisibleWords->resize( visibleWords );
        if( visibleWords == 0 )
            return Result::SUCCESS;
        return visibleCopy.buffer->Read( outVisibleWords->data(), visibleWords * sizeof( uint32_t ), visibleCopy.offset );
    }

    Result VulkanFrameBackend::ReadbackTarget( std::vector<uint8_t>& outPixels )
    {
        if( !m_initialized )
            return Result::INVALID_OBJECT;

        if( m_config.colorFormat != VK_FORMAT_R8G8B8A8_UNORM && m_config.colorFormat != VK_FORMAT_B8G8R8A8_UNORM )
            return Result::NOT_IMPLEMENTED;

        TransientAllocation pixels;
        Result              result = ExecuteAndWait( [ & ]( CommandBuffer& cmd ) {
            pixels = m_streaming->CaptureTexture( cmd, *m_target, 4 );
            if( !pixels.IsValid() )
                return Result::OUT_OF_MEMORY;

            cmd.BufferBarrier( *pixels.buffer, VK_PIPELINE_STAGE_2_TRANSFER_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT, VK_PIPELINE_STAGE_2_HOST_BIT,
                               VK_ACCESS_2_HOST_READ_BIT );
            return Result::SUCCESS;
        } );
        if( result != Result::SUCCESS )
            return result;

        outPixels.resize( pixels.size );
        return pixels.buffer->Read( outPixels.data(), pixels.size, pixels.offset );
    }
} // namespace Batchline
