#include <Batchline.h>

#include <cmath>
#include <fstream>
#include <string>

using namespace Batchline;

namespace
{
    constexpr uint32_t ATLAS_SIZE  = 64;
    constexpr uint32_t CELL_SIZE   = 16;
    constexpr uint32_t FRAME_COUNT = 120;

    // 4x4 grid of colored cells. Cells 0-3 form a walk cycle, cell 15 is a solid glyph block.
    std::vector<uint32_t> BuildAtlasPixels()
    {
        std::vector<uint32_t> pixels( ATLAS_SIZE * ATLAS_SIZE );
        for( uint32_t y = 0; y < ATLAS_SIZE; ++y )
        {
            for( uint32_t x = 0; x < ATLAS_SIZE; ++x )
            {
                const uint32_t cell   = ( y / CELL_SIZE ) * 4 + x / CELL_SIZE;
                const bool     border = ( x % CELL_SIZE ) == 0 || ( y % CELL_SIZE ) == 0;
                const uint8_t  r      = static_cast<uint8_t>( 64 + cell * 12 );
                const uint8_t  g      = static_cast<uint8_t>( border ? 0 : 255 - cell * 10 );
                const uint8_t  b      = static_cast<uint8_t>( 128 );
                pixels[ y * ATLAS_SIZE + x ] = cell == 15 ? 0xFFFFFFFFu : ( 0xFFu << 24 ) | ( b << 16 ) | ( g << 8 ) | r;
            }
        }
        return pixels;
    }

    FontMetrics BuildBlockFont()
    {
        FontMetrics font;
        font.lineHeight = 12.0f;

        const UVRegion block = AtlasRegion{ 3 * CELL_SIZE, 3 * CELL_SIZE, CELL_SIZE, CELL_SIZE }.ToUV( ATLAS_SIZE, ATLAS_SIZE );
        for( uint32_t c = '!'; c <= '~'; ++c )
        {
            font.glyphs[ c ] = GlyphMetrics{ block, { 7.0f, 10.0f }, { 0.0f, 0.0f }, 8.0f };
        }
        font.glyphs[ ' ' ] = GlyphMetrics{ block, { 0.0f, 0.0f }, { 0.0f, 0.0f }, 8.0f };
        return font;
    }

    void WritePPM( const std::string& path, const std::vector<uint8_t>& rgba, uint32_t width, uint32_t height )
    {
        std::ofstream file( path, std::ios::binary );
        if( !file )
        {
            BL_ERROR( "Cannot write {}", path );
            return;
        }
        file << "P6\n" << width << " " << height << "\n255\n";
        for( size_t i = 0; i + 3 < rgba.size(); i += 4 )
        {
            file.write( reinterpret_cast<const char*>( &rgba[ i ] ), 3 );
        }
        BL_INFO( "Frame written to {}", path );
    }
} // namespace

int main()
{
    Engine       engine;
    EngineConfig config;
    config.width  = 800;
    config.height = 600;

    if( engine.Init( config ) != Result::SUCCESS )
    {
        return 1;
    }
    BL_INFO( "Sandbox running on the {} backend.", engine.GetBackendType() == BackendType::VULKAN ? "Vulkan" : "host" );

    FrameOrchestrator& renderer = engine.GetRenderer();

    if( auto vulkan = engine.GetVulkanBackend() )
    {
        const std::vector<uint32_t> pixels = BuildAtlasPixels();
        Ref<Texture>                atlas  = vulkan->CreateAtlasTexture( ATLAS_SIZE, ATLAS_SIZE, pixels.data() );
        if( !atlas || renderer.SetAtlas( atlas, nullptr ) != Result::SUCCESS )
        {
            BL_WARN( "Atlas not available, sprites use the default white texture." );
        }
    }

    std::vector<AnimationFrame> walk;
    for( uint32_t i = 0; i < 4; ++i )
    {
        walk.push_back( { AtlasRegion{ i * CELL_SIZE, 0, CELL_SIZE, CELL_SIZE }, 0.1f } );
    }
    SpriteAnimation   animation( walk, ATLAS_SIZE, ATLAS_SIZE, { 3.0f, 3.0f } );
    const FontMetrics font = BuildBlockFont();

    Camera2D camera( config.width, config.height );

    const float32_t dt = 1.0f / 60.0f;
    for( uint32_t frame = 0; frame < FRAME_COUNT; ++frame )
    {
        const float32_t time = frame * dt;
        engine.BeginFrame();

        camera.SetPosition( { 400.0f + 200.0f * std::sin( time ), 300.0f } );
        camera.SetZoom( 1.0f + 0.25f * std::sin( time * 0.5f ) );
        renderer.SetCamera( camera );

        // A grid wider than the view, so culling has something to reject
        for( int32_t y = 0; y < 40; ++y )
        {
            for( int32_t x = 0; x < 80; ++x )
            {
                DrawObject quad;
                quad.drawClass          = DrawClass::QUAD;
                quad.transform.position = { x * 20.0f - 400.0f, y * 20.0f - 100.0f, 0.0f };
                quad.transform.scale    = { 16.0f, 16.0f, 1.0f };
                quad.color              = ( x + y ) % 2 ? Colors::Gray : Colors::Cyan;
                renderer.Submit( quad );
            }
        }

        for( int32_t i = 0; i < 200; ++i )
        {
            DrawObject point;
            point.drawClass          = DrawClass::PRIMITIVE;
            point.transform.position = { std::fmod( i * 37.0f, 1200.0f ) - 200.0f, std::fmod( i * 53.0f, 800.0f ) - 100.0f, 0.0f };
            point.color              = Colors::Yellow;
            renderer.Submit( point );
        }

        animation.Update( dt );
        for( int32_t i = 0; i < 12; ++i )
        {
            DrawObject sprite;
            sprite.drawClass          = DrawClass::SPRITE;
            sprite.transform.position = { 100.0f + i * 60.0f, 250.0f, 0.0f };
            sprite.transform.rotation = { 0.0f, 0.0f, time + i * 0.3f };
            animation.Apply( sprite );
            renderer.Submit( sprite );
        }

        TextStyle style;
        style.pivot    = { 40.0f, 40.0f };
        style.scale    = 2.0f;
        style.rotation = 0.1f * std::sin( time );
        style.color    = Colors::Orange;
        renderer.SubmitText( "BATCHLINE\nframe " + std::to_string( frame ), font, style );

        ImmediateBatch& overlay = renderer.GetImmediate();
        overlay.FillRect( { 10.0f, 560.0f }, { 200.0f * ( frame + 1 ) / FRAME_COUNT, 20.0f }, Colors::Green );
        overlay.DrawLine( { 0.0f, 0.0f }, { 800.0f, 600.0f }, 2.0f, Colors::Red );
        overlay.DrawTriangle( { 760.0f, 20.0f }, { 790.0f, 20.0f }, { 775.0f, 50.0f }, Colors::Magenta );

        const Result result = engine.EndFrame();
        if( result == Result::DEVICE_DISPATCH_FAILURE )
        {
            BL_CRITICAL( "Device lost, stopping." );
            break;
        }

        if( frame % 30 == 0 )
        {
            const FrameStats& stats = renderer.GetLastFrameStats();
            BL_INFO( "Frame {}: {} instances, {} dispatches, {} draws, {} skipped ({})", frame, stats.submittedInstances, stats.dispatches,
                     stats.draws, stats.skippedClasses, toString( result ) );
        }
    }

    if( auto vulkan = engine.GetVulkanBackend() )
    {
        IndirectDrawArgs args;
        if( vulkan->DebugReadback( DrawClass::QUAD, args ) == Result::SUCCESS )
        {
            BL_INFO( "Last frame drew {} of {} quads.", args.instanceCount, 80 * 40 );
        }

        std::vector<uint8_t> pixels;
        if( vulkan->ReadbackTarget( pixels ) == Result::SUCCESS )
        {
            WritePPM( "sandbox.ppm", pixels, config.width, config.height );
        }
    }
    else if( auto host = engine.GetHostBackend() )
    {
        BL_INFO( "Last frame drew {} of {} quads.", host->GetArgs( DrawClass::QUAD ).instanceCount, 80 * 40 );
    }

    engine.Shutdown();
    return 0;
}
