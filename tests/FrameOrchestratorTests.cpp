#include "renderer/FrameOrchestrator.hpp"
#include "renderer/HostFrameBackend.hpp"
#include <gtest/gtest.h>

using namespace Batchline;

class FrameOrchestratorTest : public ::testing::Test
{
protected:
    Ref<HostFrameBackend> backend;
    FrameOrchestrator     renderer;

    void SetUp() override
    {
        backend = CreateRef<HostFrameBackend>();

        RendererConfig config;
        config.GetBatchConfig( DrawClass::SPRITE ).maxInstances = 4;
        ASSERT_EQ( renderer.Init( backend, config ), Result::SUCCESS );

        Camera2D camera( 800, 600 );
        renderer.SetCamera( camera );
    }

    void TearDown() override { renderer.Shutdown(); }

    static DrawObject Quad( float32_t x, float32_t y )
    {
        DrawObject object;
        object.drawClass          = DrawClass::QUAD;
        object.transform.position = { x, y, 0.0f };
        object.transform.scale    = { 10.0f, 10.0f, 1.0f };
        return object;
    }

    static DrawObject Sprite( float32_t x, float32_t y )
    {
        DrawObject object = Quad( x, y );
        object.drawClass  = DrawClass::SPRITE;
        object.uv         = UVRegion{};
        return object;
    }

    static DrawObject Point( float32_t x, float32_t y )
    {
        DrawObject object = Quad( x, y );
        object.drawClass  = DrawClass::PRIMITIVE;
        return object;
    }
};

TEST_F( FrameOrchestratorTest, InitRejectsMissingBackend )
{
    FrameOrchestrator other;
    EXPECT_EQ( other.Init( nullptr ), Result::INVALID_ARGS );

    RendererConfig config;
    config.cullWorkgroupSize = 0;
    EXPECT_EQ( other.Init( backend, config ), Result::INVALID_ARGS );

    // Not initialized
    EXPECT_EQ( other.EndFrame(), Result::INVALID_OBJECT );
}

TEST_F( FrameOrchestratorTest, EmptyFrameOnlyTouchesCamera )
{
    EXPECT_EQ( renderer.EndFrame(), Result::SUCCESS );

    const std::vector<std::string> expected = { "BeginFrame", "UpdateCamera", "EndFrame" };
    EXPECT_EQ( backend->GetCalls(), expected );
    EXPECT_EQ( renderer.GetLastFrameStats().dispatches, 0u );
    EXPECT_EQ( renderer.GetLastFrameStats().draws, 0u );
}

TEST_F( FrameOrchestratorTest, RecordsClassesInFixedOrder )
{
    // Submitted out of class order on purpose
    ASSERT_EQ( renderer.Submit( Sprite( 100.0f, 100.0f ) ), Result::SUCCESS );
    ASSERT_EQ( renderer.Submit( Quad( 10.0f, 10.0f ) ), Result::SUCCESS );
    ASSERT_EQ( renderer.Submit( Point( 50.0f, 50.0f ) ), Result::SUCCESS );

    ASSERT_EQ( renderer.EndFrame(), Result::SUCCESS );

    const std::vector<std::string> expected = {
        "BeginFrame",     "UpdateCamera",    "Upload:PRIMITIVE", "Reset:PRIMITIVE", "Dispatch:PRIMITIVE", "Barrier:PRIMITIVE",
        "Draw:PRIMITIVE", "Upload:QUAD",     "Reset:QUAD",       "Dispatch:QUAD",   "Barrier:QUAD",       "Draw:QUAD",
        "Upload:SPRITE",  "Reset:SPRITE",    "Dispatch:SPRITE",  "Barrier:SPRITE",  "Draw:SPRITE",        "EndFrame" };
    EXPECT_EQ( backend->GetCalls(), expected );

    const FrameStats& stats = renderer.GetLastFrameStats();
    EXPECT_EQ( stats.dispatches, 3u );
    EXPECT_EQ( stats.draws, 3u );
    EXPECT_EQ( stats.skippedClasses, 0u );
    EXPECT_EQ( stats.submittedInstances, 3u );
}

TEST_F( FrameOrchestratorTest, CullsAgainstCameraView )
{
    renderer.Submit( Quad( 10.0f, 10.0f ) );
    renderer.Submit( Quad( 5000.0f, 10.0f ) );
    renderer.Submit( Quad( 790.0f, 590.0f ) );
    renderer.Submit( Quad( -30.0f, 300.0f ) );

    ASSERT_EQ( renderer.EndFrame(), Result::SUCCESS );

    const IndirectDrawArgs& args = backend->GetArgs( DrawClass::QUAD );
    EXPECT_EQ( args.vertexCount, 6u );
    EXPECT_EQ( args.instanceCount, 2u );
    EXPECT_EQ( backend->GetUploadedCount( DrawClass::QUAD ), 4u );
    EXPECT_EQ( backend->GetVisibleWords( DrawClass::QUAD ).size(), 16u );
}

TEST_F( FrameOrchestratorTest, CullingBoundsOverrideCamera )
{
    renderer.SetCullingBounds( CullingUniforms::FromRect( 0.0f, 0.0f, 20.0f, 20.0f ) );
    renderer.Submit( Quad( 10.0f, 10.0f ) );
    renderer.Submit( Quad( 400.0f, 300.0f ) );

    ASSERT_EQ( renderer.EndFrame(), Result::SUCCESS );
    EXPECT_EQ( backend->GetArgs( DrawClass::QUAD ).instanceCount, 1u );
}

TEST_F( FrameOrchestratorTest, CameraUniformReachesBackend )
{
    Camera2D camera( 800, 600 );
    camera.SetZoom( 2.0f );
    renderer.SetCamera( camera );

    ASSERT_EQ( renderer.EndFrame(), Result::SUCCESS );
    EXPECT_EQ( backend->GetLastCamera().viewProjection, camera.GetViewProjection() );
    EXPECT_EQ( backend->GetLastCamera().viewSize, glm::vec2( 800.0f, 600.0f ) );
}

TEST_F( FrameOrchestratorTest, BatchesAreClearedAfterEachFrame )
{
    renderer.Submit( Quad( 10.0f, 10.0f ) );
    ASSERT_EQ( renderer.EndFrame(), Result::SUCCESS );
    EXPECT_TRUE( renderer.GetBatch( DrawClass::QUAD ).IsEmpty() );

    backend->ClearCalls();
    ASSERT_EQ( renderer.EndFrame(), Result::SUCCESS );
    EXPECT_EQ( backend->GetCounters().uploads, 1u );
    EXPECT_EQ( backend->GetCalls().size(), 3u );
}

TEST_F( FrameOrchestratorTest, BeginFrameDropsQueuedObjects )
{
    renderer.Submit( Quad( 10.0f, 10.0f ) );
    renderer.BeginFrame();
    EXPECT_TRUE( renderer.GetBatch( DrawClass::QUAD ).IsEmpty() );
}

TEST_F( FrameOrchestratorTest, OverflowedClassIsSkippedOthersDraw )
{
    for( uint32_t i = 0; i < 4; ++i )
        ASSERT_EQ( renderer.Submit( Sprite( 10.0f, 10.0f ) ), Result::SUCCESS );
    EXPECT_EQ( renderer.Submit( Sprite( 10.0f, 10.0f ) ), Result::BUFFER_OVERFLOW );
    renderer.Submit( Quad( 10.0f, 10.0f ) );

    EXPECT_EQ( renderer.EndFrame(), Result::BUFFER_OVERFLOW );

    const FrameStats& stats = renderer.GetLastFrameStats();
    EXPECT_EQ( stats.draws, 1u );
    EXPECT_EQ( stats.skippedClasses, 1u );
    EXPECT_EQ( backend->GetCounters().endFrames, 1u );

    for( const std::string& call: backend->GetCalls() )
        EXPECT_EQ( call.find( "SPRITE" ), std::string::npos ) << call;

    // Next frame draws sprites again
    backend->ClearCalls();
    renderer.Submit( Sprite( 10.0f, 10.0f ) );
    EXPECT_EQ( renderer.EndFrame(), Result::SUCCESS );
    EXPECT_EQ( renderer.GetLastFrameStats().draws, 1u );
}

TEST_F( FrameOrchestratorTest, InvalidObjectsAreCountedAndSkipped )
{
    DrawObject sprite = Sprite( 10.0f, 10.0f );
    sprite.uv.reset();

    EXPECT_EQ( renderer.Submit( sprite ), Result::INVALID_OBJECT );
    renderer.Submit( Quad( 10.0f, 10.0f ) );

    EXPECT_EQ( renderer.EndFrame(), Result::SUCCESS );
    EXPECT_EQ( renderer.GetLastFrameStats().rejectedObjects, 1u );
    EXPECT_EQ( renderer.GetLastFrameStats().draws, 1u );

    EXPECT_EQ( renderer.EndFrame(), Result::SUCCESS );
    EXPECT_EQ( renderer.GetLastFrameStats().rejectedObjects, 0u );
}

TEST_F( FrameOrchestratorTest, DispatchFailureAbortsFrame )
{
    renderer.Submit( Point( 10.0f, 10.0f ) );
    renderer.Submit( Quad( 10.0f, 10.0f ) );
    renderer.Submit( Sprite( 10.0f, 10.0f ) );
    renderer.GetImmediate().FillRect( { 0.0f, 0.0f }, { 5.0f, 5.0f }, Colors::Red );

    backend->FailNextDispatch( Result::DEVICE_DISPATCH_FAILURE );

    EXPECT_EQ( renderer.EndFrame(), Result::DEVICE_DISPATCH_FAILURE );

    // Nothing after the failed dispatch is recorded
    const std::vector<std::string> expected = { "BeginFrame", "UpdateCamera", "Upload:PRIMITIVE", "Reset:PRIMITIVE", "AbortFrame" };
    EXPECT_EQ( backend->GetCalls(), expected );
    EXPECT_FALSE( backend->IsRecording() );
    EXPECT_EQ( backend->GetCounters().abortedFrames, 1u );
    EXPECT_EQ( backend->GetCounters().endFrames, 0u );

    const FrameStats& stats = renderer.GetLastFrameStats();
    EXPECT_EQ( stats.draws, 0u );
    EXPECT_EQ( stats.skippedClasses, 3u );

    // The batches were dropped and the next frame starts clean
    EXPECT_TRUE( renderer.GetBatch( DrawClass::QUAD ).IsEmpty() );
    EXPECT_TRUE( renderer.GetImmediate().IsEmpty() );
    EXPECT_EQ( renderer.EndFrame(), Result::SUCCESS );
}

TEST_F( FrameOrchestratorTest, CameraUpdateFailureDropsFrame )
{
    renderer.Submit( Quad( 10.0f, 10.0f ) );
    renderer.Submit( Sprite( 10.0f, 10.0f ) );
    backend->FailNextCameraUpdate( Result::FAIL );

    EXPECT_EQ( renderer.EndFrame(), Result::FAIL );

    // No class is drawn with the previous camera
    const std::vector<std::string> expected = { "BeginFrame", "UpdateCamera", "AbortFrame" };
    EXPECT_EQ( backend->GetCalls(), expected );
    EXPECT_EQ( backend->GetCounters().abortedFrames, 1u );
    EXPECT_EQ( backend->GetCounters().endFrames, 0u );

    const FrameStats& stats = renderer.GetLastFrameStats();
    EXPECT_EQ( stats.draws, 0u );
    EXPECT_EQ( stats.dispatches, 0u );
    EXPECT_EQ( stats.skippedClasses, 2u );
    EXPECT_TRUE( renderer.GetBatch( DrawClass::SPRITE ).IsEmpty() );

    backend->ClearCalls();
    renderer.Submit( Quad( 10.0f, 10.0f ) );
    EXPECT_EQ( renderer.EndFrame(), Result::SUCCESS );
    EXPECT_EQ( renderer.GetLastFrameStats().draws, 1u );
}

TEST_F( FrameOrchestratorTest, NonFatalDispatchErrorSkipsOnlyThatClass )
{
    renderer.Submit( Quad( 10.0f, 10.0f ) );
    renderer.Submit( Sprite( 10.0f, 10.0f ) );
    backend->FailNextDispatch( Result::INVALID_ARGS );

    EXPECT_EQ( renderer.EndFrame(), Result::INVALID_ARGS );
    EXPECT_EQ( renderer.GetLastFrameStats().draws, 1u );
    EXPECT_EQ( renderer.GetLastFrameStats().skippedClasses, 1u );
    EXPECT_EQ( backend->GetCounters().endFrames, 1u );
}

TEST_F( FrameOrchestratorTest, ImmediateBatchDrawsAfterInstancedClasses )
{
    renderer.Submit( Quad( 10.0f, 10.0f ) );
    ASSERT_EQ( renderer.GetImmediate().DrawLine( { 0.0f, 0.0f }, { 100.0f, 100.0f }, 2.0f, Colors::Green ), Result::SUCCESS );

    ASSERT_EQ( renderer.EndFrame(), Result::SUCCESS );

    const std::vector<std::string>& calls = backend->GetCalls();
    ASSERT_GE( calls.size(), 2u );
    EXPECT_EQ( calls[ calls.size() - 2 ], "DrawImmediate" );
    EXPECT_EQ( backend->GetImmediateIndexCount(), 6u );
    EXPECT_TRUE( renderer.GetImmediate().IsEmpty() );
}

TEST_F( FrameOrchestratorTest, SubmitTextQueuesGlyphs )
{
    FontMetrics  font;
    GlyphMetrics glyph;
    glyph.size    = { 6.0f, 8.0f };
    glyph.advance = 7.0f;
    font.glyphs[ 'A' ] = glyph;
    font.glyphs[ ' ' ] = GlyphMetrics{ {}, { 0.0f, 0.0f }, { 0.0f, 0.0f }, 4.0f };

    TextStyle style;
    style.pivot = { 100.0f, 100.0f };

    EXPECT_EQ( renderer.SubmitText( "AA A", font, style ), Result::SUCCESS );
    EXPECT_EQ( renderer.GetBatch( DrawClass::GLYPH ).GetCount(), 3u );

    ASSERT_EQ( renderer.EndFrame(), Result::SUCCESS );
    EXPECT_EQ( backend->GetArgs( DrawClass::GLYPH ).instanceCount, 3u );
}

TEST_F( FrameOrchestratorTest, HostBackendRejectsCallsOutsideFrame )
{
    EXPECT_EQ( backend->DrawIndirect( DrawClass::QUAD ), Result::FAIL );
    EXPECT_EQ( backend->EndFrame(), Result::FAIL );

    ASSERT_EQ( backend->BeginFrame(), Result::SUCCESS );
    EXPECT_EQ( backend->BeginFrame(), Result::FAIL );
    EXPECT_EQ( backend->EndFrame(), Result::SUCCESS );
}

TEST_F( FrameOrchestratorTest, HostBackendValidatesDispatchSize )
{
    ASSERT_EQ( backend->BeginFrame(), Result::SUCCESS );

    std::vector<uint32_t> words( 8 * 100, 0u );
    ASSERT_EQ( backend->UploadInstances( DrawClass::QUAD, words.data(), 100 ), Result::SUCCESS );
    ASSERT_EQ( backend->ResetIndirectArgs( DrawClass::QUAD, 6 ), Result::SUCCESS );

    CullingUniforms u = CullingUniforms{}.ForBatch( DrawClass::QUAD, 100 );
    EXPECT_EQ( backend->DispatchCulling( DrawClass::QUAD, u, 1 ), Result::INVALID_ARGS );

    u.instanceCount = 101;
    EXPECT_EQ( backend->DispatchCulling( DrawClass::QUAD, u, 2 ), Result::INVALID_ARGS );

    u.instanceCount = 100;
    EXPECT_EQ( backend->DispatchCulling( DrawClass::QUAD, u, 2 ), Result::SUCCESS );

    backend->AbortFrame();
    EXPECT_FALSE( backend->IsRecording() );
}
