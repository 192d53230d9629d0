#include "core/FileSystem.hpp"
#include "core/jobs/JobSystem.hpp"
#include "renderer/FrameOrchestrator.hpp"
#include "renderer/HostFrameBackend.hpp"
#include "renderer/VulkanFrameBackend.hpp"
#include "rhi/RHI.hpp"
#include "runtime/Engine.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <random>

using namespace Batchline;

// =================================================================================================
// Vulkan backend: device culling and drawing
// =================================================================================================

class GpuRenderTest : public ::testing::Test
{
protected:
    static constexpr uint32_t TARGET_SIZE = 64;

    Ref<Device>             device;
    Ref<VulkanFrameBackend> backend;
    FrameOrchestrator       renderer;

    void SetUp() override
    {
        FileSystem::Init();

        if( RHI::IsInitialized() )
            RHI::Shutdown();

        if( RHI::Init( RHIConfig{} ) != Result::SUCCESS || RHI::GetAdapterCount() == 0 )
            return;

        device = RHI::CreateDevice( 0 );
        if( !device )
            return;

        VulkanBackendConfig config;
        config.targetWidth  = TARGET_SIZE;
        config.targetHeight = TARGET_SIZE;
        config.initialInstanceCapacity = 16;

        backend = CreateRef<VulkanFrameBackend>( device, config );
        ASSERT_EQ( backend->Init(), Result::SUCCESS );
        ASSERT_EQ( renderer.Init( backend ), Result::SUCCESS );
        renderer.SetCamera( Camera2D( TARGET_SIZE, TARGET_SIZE ) );
    }

    void TearDown() override
    {
        renderer.Shutdown();
        if( backend )
        {
            backend->Shutdown();
            backend.reset();
        }
        if( device )
        {
            RHI::DestroyDevice( device );
            device.reset();
        }
        if( RHI::IsInitialized() )
            RHI::Shutdown();
    }

    static DrawObject Quad( float32_t x, float32_t y, float32_t size, const Color& color )
    {
        DrawObject object;
        object.drawClass          = DrawClass::QUAD;
        object.transform.position = { x, y, 0.0f };
        object.transform.scale    = { size, size, 1.0f };
        object.color              = color;
        return object;
    }

    static const uint8_t* Pixel( const std::vector<uint8_t>& pixels, uint32_t x, uint32_t y )
    {
        return &pixels[ ( static_cast<size_t>( y ) * TARGET_SIZE + x ) * 4 ];
    }
};

TEST_F( GpuRenderTest, EmptyFrameSubmits )
{
    if( !backend )
        GTEST_SKIP() << "No Vulkan 1.3 device";

    EXPECT_EQ( renderer.EndFrame(), Result::SUCCESS );
    EXPECT_EQ( renderer.EndFrame(), Result::SUCCESS );
    EXPECT_EQ( renderer.EndFrame(), Result::SUCCESS );
}

TEST_F( GpuRenderTest, DeviceCullingMatchesHost )
{
    if( !backend )
        GTEST_SKIP() << "No Vulkan 1.3 device";

    auto              reference = CreateRef<HostFrameBackend>();
    FrameOrchestrator referenceRenderer;
    ASSERT_EQ( referenceRenderer.Init( reference ), Result::SUCCESS );
    referenceRenderer.SetCamera( Camera2D( TARGET_SIZE, TARGET_SIZE ) );

    std::mt19937                          rng( 7 );
    std::uniform_real_distribution<float> coord( -64.0f, 128.0f );

    // Enough instances to force the device buffers to grow past their initial capacity
    for( uint32_t i = 0; i < 3000; ++i )
    {
        const DrawObject object = Quad( coord( rng ), coord( rng ), 4.0f, Colors::White );
        ASSERT_EQ( renderer.Submit( object ), Result::SUCCESS );
        ASSERT_EQ( referenceRenderer.Submit( object ), Result::SUCCESS );
    }

    ASSERT_EQ( renderer.EndFrame(), Result::SUCCESS );
    ASSERT_EQ( referenceRenderer.EndFrame(), Result::SUCCESS );

    IndirectDrawArgs      args;
    std::vector<uint32_t> visible;
    ASSERT_EQ( backend->DebugReadback( DrawClass::QUAD, args, &visible ), Result::SUCCESS );

    EXPECT_EQ( args.vertexCount, 6u );
    EXPECT_EQ( args.firstVertex, 0u );
    EXPECT_EQ( args.firstInstance, 0u );
    EXPECT_EQ( args.instanceCount, reference->GetArgs( DrawClass::QUAD ).instanceCount );
    EXPECT_GT( args.instanceCount, 0u );
    EXPECT_LT( args.instanceCount, 3000u );

    // Same multiset of records, order may differ
    auto split = []( const std::vector<uint32_t>& words ) {
        std::vector<std::vector<uint32_t>> records;
        for( size_t i = 0; i + 8 <= words.size(); i += 8 )
            records.emplace_back( words.begin() + i, words.begin() + i + 8 );
        std::sort( records.begin(), records.end() );
        return records;
    };
    visible.resize( static_cast<size_t>( args.instanceCount ) * 8 );
    EXPECT_EQ( split( visible ), split( reference->GetVisibleWords( DrawClass::QUAD ) ) );

    referenceRenderer.Shutdown();
}

TEST_F( GpuRenderTest, ArgsAreResetEveryFrame )
{
    if( !backend )
        GTEST_SKIP() << "No Vulkan 1.3 device";

    for( uint32_t frame = 0; frame < 4; ++frame )
    {
        renderer.Submit( Quad( 8.0f, 8.0f, 4.0f, Colors::White ) );
        renderer.Submit( Quad( 16.0f, 8.0f, 4.0f, Colors::White ) );
        ASSERT_EQ( renderer.EndFrame(), Result::SUCCESS );
    }

    IndirectDrawArgs args;
    ASSERT_EQ( backend->DebugReadback( DrawClass::QUAD, args ), Result::SUCCESS );
    EXPECT_EQ( args.instanceCount, 2u );
}

TEST_F( GpuRenderTest, DrawsVisibleQuadIntoTarget )
{
    if( !backend )
        GTEST_SKIP() << "No Vulkan 1.3 device";

    renderer.Submit( Quad( 8.0f, 8.0f, 16.0f, Colors::Red ) );
    renderer.Submit( Quad( 40.0f, 40.0f, 8.0f, Colors::Blue ) );
    renderer.GetImmediate().FillRect( { 40.0f, 4.0f }, { 8.0f, 8.0f }, Colors::Green );
    ASSERT_EQ( renderer.EndFrame(), Result::SUCCESS );

    std::vector<uint8_t> pixels;
    ASSERT_EQ( backend->ReadbackTarget( pixels ), Result::SUCCESS );
    ASSERT_EQ( pixels.size(), static_cast<size_t>( TARGET_SIZE ) * TARGET_SIZE * 4 );

    const uint8_t* red = Pixel( pixels, 16, 16 );
    EXPECT_EQ( red[ 0 ], 255 );
    EXPECT_EQ( red[ 1 ], 0 );
    EXPECT_EQ( red[ 2 ], 0 );

    const uint8_t* blue = Pixel( pixels, 44, 44 );
    EXPECT_EQ( blue[ 2 ], 255 );
    EXPECT_EQ( blue[ 0 ], 0 );

    const uint8_t* green = Pixel( pixels, 44, 8 );
    EXPECT_EQ( green[ 1 ], 255 );

    // Cleared background
    const uint8_t* background = Pixel( pixels, 60, 2 );
    EXPECT_EQ( background[ 0 ], 0 );
    EXPECT_EQ( background[ 1 ], 0 );
    EXPECT_EQ( background[ 2 ], 0 );
}

TEST_F( GpuRenderTest, SpriteUsesAtlas )
{
    if( !backend )
        GTEST_SKIP() << "No Vulkan 1.3 device";

    // 2x1 atlas: left texel yellow, right texel cyan
    const uint8_t atlasPixels[] = { 255, 255, 0, 255, 0, 255, 255, 255 };
    Ref<Texture>  atlas         = backend->CreateAtlasTexture( 2, 1, atlasPixels );
    ASSERT_NE( atlas, nullptr );

    SamplerDesc samplerDesc;
    samplerDesc.magFilter = VK_FILTER_NEAREST;
    samplerDesc.minFilter = VK_FILTER_NEAREST;
    ASSERT_EQ( renderer.SetAtlas( atlas, device->CreateSampler( samplerDesc ) ), Result::SUCCESS );

    DrawObject sprite;
    sprite.drawClass          = DrawClass::SPRITE;
    sprite.transform.position = { 16.0f, 16.0f, 0.0f };
    sprite.transform.scale    = { 32.0f, 32.0f, 1.0f };
    sprite.uv                 = AtlasRegion{ 1, 0, 1, 1 }.ToUV( 2, 1 );
    ASSERT_EQ( renderer.Submit( sprite ), Result::SUCCESS );
    ASSERT_EQ( renderer.EndFrame(), Result::SUCCESS );

    std::vector<uint8_t> pixels;
    ASSERT_EQ( backend->ReadbackTarget( pixels ), Result::SUCCESS );

    const uint8_t* texel = Pixel( pixels, 32, 32 );
    EXPECT_EQ( texel[ 0 ], 0 );
    EXPECT_EQ( texel[ 1 ], 255 );
    EXPECT_EQ( texel[ 2 ], 255 );
}

TEST_F( GpuRenderTest, ReplacedAtlasOutlivesFramesInFlight )
{
    if( !backend )
        GTEST_SKIP() << "No Vulkan 1.3 device";

    const uint32_t white = 0xFFFFFFFFu;
    Ref<Texture>   first = backend->CreateAtlasTexture( 1, 1, &white );
    ASSERT_NE( first, nullptr );
    ASSERT_EQ( renderer.SetAtlas( first, nullptr ), Result::SUCCESS );

    DrawObject sprite;
    sprite.drawClass          = DrawClass::SPRITE;
    sprite.transform.position = { 8.0f, 8.0f, 0.0f };
    sprite.transform.scale    = { 16.0f, 16.0f, 1.0f };
    sprite.uv                 = UVRegion{};
    ASSERT_EQ( renderer.Submit( sprite ), Result::SUCCESS );
    ASSERT_EQ( renderer.EndFrame(), Result::SUCCESS );

    std::weak_ptr<Texture> firstWeak = first;
    ASSERT_EQ( renderer.SetAtlas( backend->CreateAtlasTexture( 1, 1, &white ), nullptr ), Result::SUCCESS );
    first.reset();

    // The submitted frame may still sample it
    EXPECT_FALSE( firstWeak.expired() );

    for( uint32_t i = 0; i < FRAMES_IN_FLIGHT; ++i )
    {
        ASSERT_EQ( renderer.Submit( sprite ), Result::SUCCESS );
        ASSERT_EQ( renderer.EndFrame(), Result::SUCCESS );
    }
    EXPECT_TRUE( firstWeak.expired() );
}

TEST_F( GpuRenderTest, ReplacedTargetOutlivesFramesInFlight )
{
    if( !backend )
        GTEST_SKIP() << "No Vulkan 1.3 device";

    ASSERT_EQ( renderer.Submit( Quad( 0.0f, 0.0f, 8.0f, Colors::Red ) ), Result::SUCCESS );
    ASSERT_EQ( renderer.EndFrame(), Result::SUCCESS );

    TextureDesc desc;
    desc.width  = TARGET_SIZE;
    desc.height = TARGET_SIZE;
    desc.format = VK_FORMAT_R8G8B8A8_UNORM;
    desc.usage  = TextureUsage::RENDER_TARGET | TextureUsage::TRANSFER_SRC | TextureUsage::SAMPLED;

    std::weak_ptr<Texture> oldTarget = backend->GetRenderTarget();
    ASSERT_EQ( backend->SetRenderTarget( device->CreateTexture( desc ) ), Result::SUCCESS );
    EXPECT_FALSE( oldTarget.expired() );

    for( uint32_t i = 0; i < FRAMES_IN_FLIGHT; ++i )
        ASSERT_EQ( renderer.EndFrame(), Result::SUCCESS );
    EXPECT_TRUE( oldTarget.expired() );
}

TEST_F( GpuRenderTest, AbortForgetsTargetLayout )
{
    if( !backend )
        GTEST_SKIP() << "No Vulkan 1.3 device";

    ASSERT_EQ( renderer.EndFrame(), Result::SUCCESS );
    EXPECT_EQ( backend->GetRenderTarget()->GetCurrentLayout(), VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL );

    ASSERT_EQ( backend->BeginFrame(), Result::SUCCESS );
    backend->AbortFrame();
    EXPECT_EQ( backend->GetRenderTarget()->GetCurrentLayout(), VK_IMAGE_LAYOUT_UNDEFINED );

    // The next frame transitions from UNDEFINED and still renders
    ASSERT_EQ( renderer.Submit( Quad( 0.0f, 0.0f, 64.0f, Colors::Red ) ), Result::SUCCESS );
    ASSERT_EQ( renderer.EndFrame(), Result::SUCCESS );
    EXPECT_EQ( backend->GetRenderTarget()->GetCurrentLayout(), VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL );

    std::vector<uint8_t> pixels;
    ASSERT_EQ( backend->ReadbackTarget( pixels ), Result::SUCCESS );
    EXPECT_EQ( Pixel( pixels, 32, 32 )[ 0 ], 255 );
}

TEST_F( GpuRenderTest, CallsOutsideFrameFail )
{
    if( !backend )
        GTEST_SKIP() << "No Vulkan 1.3 device";

    EXPECT_NE( backend->DrawIndirect( DrawClass::QUAD ), Result::SUCCESS );
    EXPECT_NE( backend->EndFrame(), Result::SUCCESS );
}

// =================================================================================================
// Engine
// =================================================================================================

TEST( EngineTest, HostBackendRendersWithoutDevice )
{
    EngineConfig config;
    config.backend = BackendType::HOST;
    config.width   = 320;
    config.height  = 240;

    Engine engine;
    ASSERT_EQ( engine.Init( config ), Result::SUCCESS );
    EXPECT_EQ( engine.GetBackendType(), BackendType::HOST );
    ASSERT_NE( engine.GetHostBackend(), nullptr );
    EXPECT_EQ( engine.GetDevice(), nullptr );

    engine.GetRenderer().SetCamera( Camera2D( config.width, config.height ) );
    for( uint32_t frame = 0; frame < 3; ++frame )
    {
        engine.BeginFrame();

        DrawObject quad;
        quad.transform.position = { 10.0f, 10.0f, 0.0f };
        quad.transform.scale    = { 5.0f, 5.0f, 1.0f };
        engine.GetRenderer().Submit( quad );

        EXPECT_EQ( engine.EndFrame(), Result::SUCCESS );
    }

    EXPECT_EQ( engine.GetFrameCount(), 3u );
    EXPECT_EQ( engine.GetHostBackend()->GetCounters().endFrames, 3u );
    EXPECT_EQ( engine.GetHostBackend()->GetArgs( DrawClass::QUAD ).instanceCount, 1u );

    engine.Shutdown();
    EXPECT_FALSE( engine.IsInitialized() );
    EXPECT_EQ( engine.EndFrame(), Result::INVALID_OBJECT );
}

TEST( EngineTest, VulkanRequestFallsBackOrRuns )
{
    EngineConfig config;
    config.backend        = BackendType::VULKAN;
    config.fallbackToHost = true;
    config.width          = 128;
    config.height         = 128;

    Engine engine;
    ASSERT_EQ( engine.Init( config ), Result::SUCCESS );

    if( engine.GetBackendType() == BackendType::VULKAN )
    {
        EXPECT_NE( engine.GetVulkanBackend(), nullptr );
        EXPECT_NE( engine.GetDevice(), nullptr );
    }
    else
    {
        EXPECT_NE( engine.GetHostBackend(), nullptr );
    }

    engine.BeginFrame();
    EXPECT_EQ( engine.EndFrame(), Result::SUCCESS );
}
