#pragma once
#include "renderer/FrameBackend.hpp"
#include "renderer/IndirectDrawAssembler.hpp"
#include "renderer/PipelineSet.hpp"
#include "resources/StreamingManager.hpp"
#include <functional>

namespace Batchline
{
    class BindingGroup;
    class ComputeKernel;

    struct VulkanBackendConfig
    {
        VkFormat colorFormat = VK_FORMAT_R8G8B8A8_UNORM;
        Color    clearColor  = Colors::Black;

        // Size of the render target created by Init(). Replace it with SetRenderTarget().
        uint32_t targetWidth  = 1280;
        uint32_t targetHeight = 720;

        // Instances per class the device buffers start with
        uint32_t initialInstanceCapacity = 512;

        StreamingConfig streaming;

        // Waits on the GPU longer than this fail the frame with DEVICE_DISPATCH_FAILURE
        uint64_t frameTimeoutNs = 5'000'000'000ull;
    };

    /**
     * @brief Records a frame into one graphics command buffer and submits it to the universal queue.
     *
     * Uploads, argument resets and culling dispatches are recorded as they arrive. Draws are collected and
     * replayed by EndFrame() inside a single dynamic rendering scope on the render target, which is left in
     * TRANSFER_SRC_OPTIMAL afterwards. Instance, visible and argument buffers are shared by all frame slots and
     * guarded by barriers; camera uniforms and descriptor sets exist once per slot.
     */
    class VulkanFrameBackend : public FrameBackend
    {
    public:
        VulkanFrameBackend( Ref<Device> device, const VulkanBackendConfig& config = {} );
        ~VulkanFrameBackend() override;

        VulkanFrameBackend( const VulkanFrameBackend& )            = delete;
        VulkanFrameBackend& operator=( const VulkanFrameBackend& ) = delete;

        /**
         * @return FAIL if a shader is missing or a pipeline cannot be built, OUT_OF_MEMORY on allocation failure.
         */
        Result Init();
        void   Shutdown();

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

        Result SetAtlas( Ref<Texture> atlas, Ref<Sampler> sampler ) override;

        const char* GetName() const override { return "Vulkan"; }

        // Must be created with TextureUsage::RENDER_TARGET and the configured color format
        Result       SetRenderTarget( Ref<Texture> target );
        Ref<Texture> GetRenderTarget() const { return m_target; }

        /**
         * @brief Creates a sampled RGBA8 texture and uploads pixels (width * height * 4 bytes). Blocks until done.
         */
        Ref<Texture> CreateAtlasTexture( uint32_t width, uint32_t height, const void* pixels );

        /**
         * @brief Copies a class's indirect args (and optionally its compacted records) back to the host.
         * Debug only: waits for the GPU. Call between frames.
         */
        Result DebugReadback( DrawClass drawClass, IndirectDrawArgs& outArgs, std::vector<uint32_t>* outVisibleWords = nullptr );

        // Copies the last rendered target (RGBA8) back to the host. Debug only.
        Result ReadbackTarget( std::vector<uint8_t>& outPixels );

        const Ref<Device>& GetDevice() const { return m_device; }

    private:
        struct ClassResources
        {
            Ref<Buffer> instances;
            Ref<Buffer> visible;
            uint32_t    capacity   = 0;
            uint32_t    count      = 0;
            uint64_t    generation = 1;
        };

        struct FrameResources
        {
            Ref<CommandBuffer>                                cmd;
            Ref<Buffer>                                       cameraBuffer;
            Ref<BindingGroup>                                 cameraGroup;
            Ref<BindingGroup>                                 atlasGroup;
            uint64_t                                          atlasGeneration = 0;
            std::array<Ref<BindingGroup>, DRAW_CLASS_COUNT>   cullGroups;
            std::array<uint64_t, DRAW_CLASS_COUNT>            cullGenerations = {};
            // Resources replaced while this slot's commands may still use them
            std::vector<Ref<Buffer>>                          retired;
            std::vector<Ref<Texture>>                         retiredTextures;
            std::vector<Ref<Sampler>>                         retiredSamplers;
        };

        Result CheckRecording( const char* call ) const;
        Result EnsureClassCapacity( DrawClass drawClass, uint32_t count );
        Result RefreshAtlasGroup( FrameResources& frame );
        Result RecordInstancedDraw( CommandBuffer& cmd, FrameResources& frame, DrawClass drawClass );
        Result RecordImmediateDraw( CommandBuffer& cmd, FrameResources& frame );
        Result UploadImmediate( const ImmediateBatch& batch );

        Ref<BindingGroup> CreateGraphicsBindingGroup( const GraphicsPipeline& pipeline, uint32_t setIndex );
        Ref<Buffer>       CreateDeviceBuffer( VkDeviceSize size, BufferType type );

        // Records, submits and waits for a one-off command buffer
        Result ExecuteAndWait( const std::function<Result( CommandBuffer& )>& record );

        Result MapFrameFailure( Result result ) const;
        void   ReleaseFrame();
        // Keeps the objects alive until every frame slot has been reused
        void Retire( Ref<Texture> texture, Ref<Sampler> sampler = nullptr );

    private:
        Ref<Device>         m_device;
        VulkanBackendConfig m_config;

        Scope<StreamingManager> m_streaming;
        Scope<ComputeKernel>    m_cullKernel;
        PipelineSet             m_pipelines;
        IndirectDrawAssembler   m_assembler;

        std::array<ClassResources, DRAW_CLASS_COUNT> m_classes;
        std::array<FrameResources, FRAMES_IN_FLIGHT> m_frames;

        Ref<Buffer> m_unitQuad;
        Ref<Buffer> m_immediateVertices;
        Ref<Buffer> m_immediateIndices;
        uint32_t    m_immediateIndexCount = 0;

        Ref<Texture> m_target;
        Ref<Texture> m_atlas;
        Ref<Sampler> m_atlasSampler;
        uint64_t     m_atlasGeneration = 1;

        std::vector<DrawClass> m_pendingDraws;
        bool                   m_recording   = false;
        bool                   m_initialized = false;
    };
} // namespace Batchline
