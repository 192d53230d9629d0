#include "core/jobs/JobSystem.hpp"
#include "renderer/IndirectDrawAssembler.hpp"
#include "renderer/InstanceEncoder.hpp"
#include "renderer/culling/CullingMath.hpp"
#include "renderer/culling/CullingStage.hpp"
#include <algorithm>
#include <cstddef>
#include <glm/gtc/matrix_transform.hpp>
#include <gtest/gtest.h>
#include <random>

using namespace Batchline;

namespace
{
    std::vector<uint32_t> EncodeAll( const std::vector<DrawObject>& objects )
    {
        std::vector<uint32_t> words;
        for( const DrawObject& object: objects )
        {
            InstanceRecord record;
            EXPECT_EQ( InstanceEncoder::Encode( object, record ), Result::SUCCESS );
            words.insert( words.end(), record.words.begin(), record.words.begin() + record.StrideWords() );
        }
        return words;
    }

    DrawObject Quad( float32_t x, float32_t y, float32_t w, float32_t h )
    {
        DrawObject object;
        object.drawClass          = DrawClass::QUAD;
        object.transform.position = { x, y, 0.0f };
        object.transform.scale    = { w, h, 1.0f };
        return object;
    }

    DrawObject Point( float32_t x, float32_t y )
    {
        DrawObject object;
        object.drawClass          = DrawClass::PRIMITIVE;
        object.transform.position = { x, y, 0.0f };
        return object;
    }

    DrawObject Sprite( float32_t x, float32_t y, float32_t w, float32_t h, float32_t rotation )
    {
        DrawObject object;
        object.drawClass            = DrawClass::SPRITE;
        object.transform.position   = { x, y, 0.0f };
        object.transform.scale      = { w, h, 1.0f };
        object.transform.rotation.z = rotation;
        object.uv                   = UVRegion{};
        return object;
    }

    struct CullResult
    {
        IndirectDrawArgs      args;
        std::vector<uint32_t> visible;
    };

    CullResult Cull( DrawClass drawClass, const std::vector<uint32_t>& input, const CullingUniforms& bounds, JobSystem* jobs = nullptr )
    {
        const uint32_t        stride = InstanceLayout::StrideWords( drawClass );
        const uint32_t        count  = static_cast<uint32_t>( input.size() / stride );
        const CullingUniforms u      = bounds.ForBatch( drawClass, count );

        CullResult result;
        result.args = IndirectDrawAssembler::MakeResetArgs( 6 );
        std::vector<uint32_t> output( input.size(), 0u );
        EXPECT_EQ( CullingStage::ExecuteOnHost( u, input.data(), output.data(), output.size(), result.args, jobs ), Result::SUCCESS );
        output.resize( static_cast<size_t>( result.args.instanceCount ) * stride );
        result.visible = std::move( output );
        return result;
    }

    std::vector<std::vector<uint32_t>> SplitRecords( const std::vector<uint32_t>& words, uint32_t stride )
    {
        std::vector<std::vector<uint32_t>> records;
        for( size_t i = 0; i + stride <= words.size(); i += stride )
        {
            records.emplace_back( words.begin() + i, words.begin() + i + stride );
        }
        std::sort( records.begin(), records.end() );
        return records;
    }
} // namespace

TEST( CullingUniformsTest, LayoutMatchesPushConstantBlock )
{
    EXPECT_EQ( sizeof( CullingUniforms ), 112u );
    EXPECT_EQ( offsetof( CullingUniforms, instanceCount ), 96u );
    EXPECT_EQ( offsetof( CullingUniforms, marginWord ), 108u );
}

TEST( CullingUniformsTest, DefaultPlanesAcceptEverything )
{
    CullingUniforms u;
    EXPECT_TRUE( CullingMath::IsPointInside( u, { -1e6f, 1e6f, 0.0f } ) );
}

TEST( CullingUniformsTest, RectEdgesAreInside )
{
    const CullingUniforms u = CullingUniforms::FromRect( 0.0f, 0.0f, 100.0f, 50.0f );

    EXPECT_TRUE( CullingMath::IsPointInside( u, { 0.0f, 0.0f, 0.0f } ) );
    EXPECT_TRUE( CullingMath::IsPointInside( u, { 100.0f, 50.0f, 0.0f } ) );
    EXPECT_TRUE( CullingMath::IsPointInside( u, { 50.0f, 25.0f, 0.0f } ) );
    EXPECT_FALSE( CullingMath::IsPointInside( u, { 100.5f, 25.0f, 0.0f } ) );
    EXPECT_FALSE( CullingMath::IsPointInside( u, { 50.0f, -0.5f, 0.0f } ) );
}

TEST( CullingUniformsTest, ViewProjectionMatchesRect )
{
    const glm::mat4       proj = glm::ortho( 0.0f, 200.0f, 0.0f, 100.0f, -1.0f, 1.0f );
    const CullingUniforms u    = CullingUniforms::FromViewProjection( proj );

    EXPECT_TRUE( CullingMath::IsPointInside( u, { 10.0f, 10.0f, 0.0f } ) );
    EXPECT_TRUE( CullingMath::IsPointInside( u, { 199.0f, 99.0f, 0.0f } ) );
    EXPECT_FALSE( CullingMath::IsPointInside( u, { 201.0f, 50.0f, 0.0f } ) );
    EXPECT_FALSE( CullingMath::IsPointInside( u, { 100.0f, -1.0f, 0.0f } ) );
}

TEST( CullingUniformsTest, ForBatchFillsClassFields )
{
    const CullingUniforms bounds = CullingUniforms::FromRect( 0.0f, 0.0f, 10.0f, 10.0f );

    const CullingUniforms quad = bounds.ForBatch( DrawClass::QUAD, 7 );
    EXPECT_EQ( quad.instanceCount, 7u );
    EXPECT_EQ( quad.strideWords, 8u );
    EXPECT_EQ( quad.shapeWord, InstanceLayout::NO_WORD );

    const CullingUniforms glyph = bounds.ForBatch( DrawClass::GLYPH, 3 );
    EXPECT_EQ( glyph.strideWords, 16u );
    EXPECT_EQ( glyph.shapeWord, InstanceLayout::SHAPE );
    EXPECT_EQ( glyph.marginWord, InstanceLayout::MARGIN );
    EXPECT_EQ( glyph.planes[ 1 ], bounds.planes[ 1 ] );
}

TEST( CullingUniformsTest, WorkgroupCountRoundsUp )
{
    EXPECT_EQ( GetWorkgroupCount( 0, 64 ), 0u );
    EXPECT_EQ( GetWorkgroupCount( 1, 64 ), 1u );
    EXPECT_EQ( GetWorkgroupCount( 64, 64 ), 1u );
    EXPECT_EQ( GetWorkgroupCount( 65, 64 ), 2u );
}

TEST( HostCullingTest, KeepsOverlappingAreasAndDropsOthers )
{
    const CullingUniforms bounds = CullingUniforms::FromRect( 0.0f, 0.0f, 100.0f, 100.0f );
    const auto            input  = EncodeAll( { Quad( 10, 10, 5, 5 ), Quad( 200, 10, 5, 5 ), Quad( -4, -4, 5, 5 ), Quad( -20, 50, 5, 5 ) } );

    const CullResult result = Cull( DrawClass::QUAD, input, bounds );

    EXPECT_EQ( result.args.instanceCount, 2u );
    EXPECT_EQ( result.args.vertexCount, 6u );
    EXPECT_EQ( result.args.firstVertex, 0u );
    EXPECT_EQ( result.args.firstInstance, 0u );
}

TEST( HostCullingTest, ZeroSizeIsTestedAsPoint )
{
    const CullingUniforms bounds = CullingUniforms::FromRect( 0.0f, 0.0f, 100.0f, 100.0f );
    const auto            input  = EncodeAll( { Point( 100.0f, 100.0f ), Point( 100.1f, 50.0f ), Point( 0.0f, 0.0f ) } );

    const CullResult result = Cull( DrawClass::PRIMITIVE, input, bounds );
    EXPECT_EQ( result.args.instanceCount, 2u );
}

TEST( HostCullingTest, HugeExtentFallsBackToPointTest )
{
    const CullingUniforms bounds = CullingUniforms::FromRect( 0.0f, 0.0f, 100.0f, 100.0f );

    // The box would overlap, the position alone does not
    const auto       input  = EncodeAll( { Quad( -50.0f, 50.0f, 20000.0f, 10.0f ) } );
    const CullResult result = Cull( DrawClass::QUAD, input, bounds );
    EXPECT_EQ( result.args.instanceCount, 0u );
}

TEST( HostCullingTest, RotatedSpriteMarginKeepsCornerInView )
{
    const CullingUniforms bounds = CullingUniforms::FromRect( 0.0f, 0.0f, 100.0f, 100.0f );

    // Unrotated box ends 1 unit left of the view. Rotated by 45 degrees a corner reaches into it.
    const auto unrotated = EncodeAll( { Sprite( -41.0f, 40.0f, 40.0f, 20.0f, 0.0f ) } );
    const auto rotated   = EncodeAll( { Sprite( -41.0f, 40.0f, 40.0f, 20.0f, 0.785398f ) } );

    EXPECT_EQ( Cull( DrawClass::SPRITE, unrotated, bounds ).args.instanceCount, 0u );
    EXPECT_EQ( Cull( DrawClass::SPRITE, rotated, bounds ).args.instanceCount, 1u );
}

TEST( HostCullingTest, ExplicitPointTagOverridesSize )
{
    const CullingUniforms bounds = CullingUniforms::FromRect( 0.0f, 0.0f, 100.0f, 100.0f );

    InstanceRecord record;
    ASSERT_EQ( InstanceEncoder::Encode( Sprite( -10.0f, 10.0f, 20.0f, 20.0f, 0.0f ), record ), Result::SUCCESS );
    record.words[ InstanceLayout::SHAPE ] = InstanceLayout::SHAPE_POINT;

    std::vector<uint32_t> input( record.words.begin(), record.words.end() );
    EXPECT_EQ( Cull( DrawClass::SPRITE, input, bounds ).args.instanceCount, 0u );

    record.words[ InstanceLayout::SHAPE ] = InstanceLayout::SHAPE_AREA;
    input.assign( record.words.begin(), record.words.end() );
    EXPECT_EQ( Cull( DrawClass::SPRITE, input, bounds ).args.instanceCount, 1u );
}

TEST( HostCullingTest, SurvivorsAreExactCopiesOfVisibleInputs )
{
    std::mt19937                          rng( 1234 );
    std::uniform_real_distribution<float> coord( -500.0f, 1500.0f );
    std::uniform_real_distribution<float> extent( 0.0f, 80.0f );

    std::vector<DrawObject> objects;
    for( uint32_t i = 0; i < 1000; ++i )
    {
        objects.push_back( Quad( coord( rng ), coord( rng ), extent( rng ), extent( rng ) ) );
    }

    const CullingUniforms bounds = CullingUniforms::FromRect( 0.0f, 0.0f, 1000.0f, 1000.0f );
    const auto            input  = EncodeAll( objects );
    const CullResult      result = Cull( DrawClass::QUAD, input, bounds );

    // Expected set from the per-record predicate
    const CullingUniforms u = bounds.ForBatch( DrawClass::QUAD, 1000 );
    std::vector<uint32_t> expected;
    for( uint32_t i = 0; i < 1000; ++i )
    {
        const uint32_t* record = input.data() + i * 8;
        if( CullingMath::IsRecordVisible( record, u ) )
            expected.insert( expected.end(), record, record + 8 );
    }

    ASSERT_GT( result.args.instanceCount, 0u );
    ASSERT_LT( result.args.instanceCount, 1000u );
    EXPECT_EQ( result.args.instanceCount * 8u, expected.size() );
    EXPECT_EQ( SplitRecords( result.visible, 8 ), SplitRecords( expected, 8 ) );
}

TEST( HostCullingTest, ParallelExecutionFindsSameSet )
{
    JobSystem         jobs;
    JobSystem::Config config;
    config.workerCount = 4;
    ASSERT_EQ( jobs.Initialize( config ), Result::SUCCESS );

    std::mt19937                          rng( 99 );
    std::uniform_real_distribution<float> coord( -300.0f, 900.0f );

    std::vector<DrawObject> objects;
    for( uint32_t i = 0; i < 5000; ++i )
    {
        objects.push_back( Sprite( coord( rng ), coord( rng ), 16.0f, 16.0f, coord( rng ) * 0.01f ) );
    }

    const CullingUniforms bounds   = CullingUniforms::FromRect( 0.0f, 0.0f, 640.0f, 480.0f );
    const auto            input    = EncodeAll( objects );
    const CullResult      serial   = Cull( DrawClass::SPRITE, input, bounds );
    const CullResult      parallel = Cull( DrawClass::SPRITE, input, bounds, &jobs );

    EXPECT_EQ( serial.args.instanceCount, parallel.args.instanceCount );
    EXPECT_EQ( SplitRecords( serial.visible, 16 ), SplitRecords( parallel.visible, 16 ) );

    jobs.Shutdown();
}

TEST( HostCullingTest, RepeatAfterResetGivesSameResult )
{
    JobSystem         jobs;
    JobSystem::Config config;
    config.workerCount = 3;
    ASSERT_EQ( jobs.Initialize( config ), Result::SUCCESS );

    std::mt19937                          rng( 7 );
    std::uniform_real_distribution<float> coord( -200.0f, 600.0f );

    std::vector<DrawObject> objects;
    for( uint32_t i = 0; i < 700; ++i )
        objects.push_back( Quad( coord( rng ), coord( rng ), 12.0f, 12.0f ) );

    const auto            input = EncodeAll( objects );
    const CullingUniforms u     = CullingUniforms::FromRect( 0.0f, 0.0f, 400.0f, 400.0f ).ForBatch( DrawClass::QUAD, 700 );

    // Same batch, same output buffer, arguments reset between runs
    std::vector<uint32_t> output( input.size(), 0u );
    IndirectDrawArgs      args = IndirectDrawAssembler::MakeResetArgs( 6 );
    ASSERT_EQ( CullingStage::ExecuteOnHost( u, input.data(), output.data(), output.size(), args, &jobs ), Result::SUCCESS );
    const uint32_t              firstCount = args.instanceCount;
    const std::vector<uint32_t> first( output.begin(), output.begin() + firstCount * 8 );

    args = IndirectDrawAssembler::MakeResetArgs( 6 );
    ASSERT_EQ( CullingStage::ExecuteOnHost( u, input.data(), output.data(), output.size(), args, &jobs ), Result::SUCCESS );
    const std::vector<uint32_t> second( output.begin(), output.begin() + args.instanceCount * 8 );

    ASSERT_GT( firstCount, 0u );
    EXPECT_EQ( args.instanceCount, firstCount );
    EXPECT_EQ( args.vertexCount, 6u );
    EXPECT_EQ( SplitRecords( first, 8 ), SplitRecords( second, 8 ) );

    jobs.Shutdown();
}

TEST( HostCullingTest, HalfOfPointsInsideView )
{
    const CullingUniforms bounds = CullingUniforms::FromRect( 0.0f, 0.0f, 100.0f, 100.0f );

    // Even indices inside the view, odd ones left of it
    std::vector<DrawObject> objects;
    std::vector<DrawObject> inside;
    for( uint32_t i = 0; i < 100; ++i )
    {
        const float32_t y = static_cast<float32_t>( i );
        objects.push_back( i % 2 == 0 ? Point( 50.0f, y ) : Point( -50.0f, y ) );
        if( i % 2 == 0 )
            inside.push_back( objects.back() );
    }

    const CullResult result = Cull( DrawClass::PRIMITIVE, EncodeAll( objects ), bounds );
    EXPECT_EQ( result.args.instanceCount, 50u );
    EXPECT_EQ( SplitRecords( result.visible, 8 ), SplitRecords( EncodeAll( inside ), 8 ) );
}

TEST( HostCullingTest, PartialWorkgroupIdlesPastTail )
{
    const CullingUniforms bounds = CullingUniforms::FromRect( 0.0f, 0.0f, 100.0f, 100.0f );

    std::vector<DrawObject> objects;
    for( uint32_t i = 0; i < 65; ++i )
        objects.push_back( Quad( 1.0f, 1.0f, 1.0f, 1.0f ) );

    const CullResult result = Cull( DrawClass::QUAD, EncodeAll( objects ), bounds );
    EXPECT_EQ( result.args.instanceCount, 65u );
}

TEST( HostCullingTest, EmptyBatchTouchesNothing )
{
    IndirectDrawArgs args = IndirectDrawAssembler::MakeResetArgs( 6 );
    CullingUniforms  u;
    EXPECT_EQ( CullingStage::ExecuteOnHost( u, nullptr, nullptr, 0, args, nullptr ), Result::SUCCESS );
    EXPECT_EQ( args.instanceCount, 0u );
}

TEST( HostCullingTest, RejectsUndersizedOutput )
{
    const auto      input = EncodeAll( { Quad( 1, 1, 1, 1 ), Quad( 2, 2, 1, 1 ) } );
    CullingUniforms u     = CullingUniforms::FromRect( 0.0f, 0.0f, 10.0f, 10.0f ).ForBatch( DrawClass::QUAD, 2 );

    std::vector<uint32_t> output( 8, 0u );
    IndirectDrawArgs      args = IndirectDrawAssembler::MakeResetArgs( 6 );
    EXPECT_EQ( CullingStage::ExecuteOnHost( u, input.data(), output.data(), output.size(), args, nullptr ), Result::BUFFER_OVERFLOW );

    u.strideWords = 12;
    EXPECT_EQ( CullingStage::ExecuteOnHost( u, input.data(), output.data(), output.size(), args, nullptr ), Result::INVALID_ARGS );
}

TEST( IndirectDrawAssemblerTest, ResetArgsZeroInstances )
{
    const IndirectDrawArgs args = IndirectDrawAssembler::MakeResetArgs( 6 );
    EXPECT_EQ( args.vertexCount, 6u );
    EXPECT_EQ( args.instanceCount, 0u );
    EXPECT_EQ( args.firstVertex, 0u );
    EXPECT_EQ( args.firstInstance, 0u );
}
