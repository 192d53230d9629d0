#include "renderer/HostFrameBackend.hpp"
#include "renderer/InstanceBatch.hpp"
#include "renderer/InstanceEncoder.hpp"
#include <gtest/gtest.h>

using namespace Batchline;

namespace
{
    InstanceRecord MakeQuadRecord( float32_t x, float32_t y )
    {
        DrawObject object;
        object.drawClass          = DrawClass::QUAD;
        object.transform.position = { x, y, 0.0f };
        object.transform.scale    = { 4.0f, 4.0f, 1.0f };

        InstanceRecord record;
        InstanceEncoder::Encode( object, record );
        return record;
    }
} // namespace

TEST( GrownCapacityTest, DoublesFromInitial )
{
    EXPECT_EQ( ComputeGrownCapacity( 0, 1, 512 ), 512u );
    EXPECT_EQ( ComputeGrownCapacity( 512, 513, 512 ), 1024u );
    EXPECT_EQ( ComputeGrownCapacity( 512, 5000, 512 ), 8192u );
    EXPECT_EQ( ComputeGrownCapacity( 0, 3, 0 ), 4u );
}

TEST( GrownCapacityTest, NeverShrinks )
{
    EXPECT_EQ( ComputeGrownCapacity( 4096, 10, 512 ), 4096u );
    EXPECT_EQ( ComputeGrownCapacity( 4096, 4096, 512 ), 4096u );
}

TEST( InstanceBatchTest, StartsEmpty )
{
    InstanceBatch batch( DrawClass::SPRITE, BatchConfig{} );

    EXPECT_TRUE( batch.IsEmpty() );
    EXPECT_EQ( batch.GetCount(), 0u );
    EXPECT_EQ( batch.GetCapacity(), 0u );
    EXPECT_EQ( batch.GetStrideWords(), 16u );
    EXPECT_EQ( batch.GetSizeBytes(), 0u );
}

TEST( InstanceBatchTest, PushKeepsSubmissionOrder )
{
    InstanceBatch batch( DrawClass::QUAD, BatchConfig{ 2, 1000 } );

    for( uint32_t i = 0; i < 10; ++i )
    {
        ASSERT_EQ( batch.Push( MakeQuadRecord( static_cast<float32_t>( i ), 0.0f ) ), Result::SUCCESS );
    }

    EXPECT_EQ( batch.GetCount(), 10u );
    EXPECT_EQ( batch.GetSizeBytes(), 10u * 32u );
    for( uint32_t i = 0; i < 10; ++i )
    {
        EXPECT_FLOAT_EQ( batch.GetRecord( i ).GetFloat( InstanceLayout::POSITION ), static_cast<float32_t>( i ) );
    }
}

TEST( InstanceBatchTest, GrowsByDoublingAndKeepsCapacityAfterClear )
{
    InstanceBatch batch( DrawClass::QUAD, BatchConfig{ 4, 1000 } );

    batch.Push( MakeQuadRecord( 0.0f, 0.0f ) );
    EXPECT_EQ( batch.GetCapacity(), 4u );

    for( uint32_t i = 0; i < 4; ++i )
        batch.Push( MakeQuadRecord( 0.0f, 0.0f ) );
    EXPECT_EQ( batch.GetCapacity(), 8u );

    batch.Clear();
    EXPECT_TRUE( batch.IsEmpty() );
    EXPECT_EQ( batch.GetCapacity(), 8u );
}

TEST( InstanceBatchTest, CapacityIsClampedToHardCap )
{
    InstanceBatch batch( DrawClass::QUAD, BatchConfig{ 4, 6 } );

    for( uint32_t i = 0; i < 6; ++i )
        ASSERT_EQ( batch.Push( MakeQuadRecord( 0.0f, 0.0f ) ), Result::SUCCESS );

    EXPECT_EQ( batch.GetCapacity(), 6u );
}

TEST( InstanceBatchTest, OverflowFlagsBatchUntilClear )
{
    InstanceBatch batch( DrawClass::QUAD, BatchConfig{ 2, 3 } );

    for( uint32_t i = 0; i < 3; ++i )
        ASSERT_EQ( batch.Push( MakeQuadRecord( 0.0f, 0.0f ) ), Result::SUCCESS );

    EXPECT_FALSE( batch.IsOverflowed() );
    EXPECT_EQ( batch.Push( MakeQuadRecord( 0.0f, 0.0f ) ), Result::BUFFER_OVERFLOW );
    EXPECT_TRUE( batch.IsOverflowed() );
    EXPECT_EQ( batch.GetCount(), 3u );

    batch.Clear();
    EXPECT_FALSE( batch.IsOverflowed() );
    EXPECT_EQ( batch.Push( MakeQuadRecord( 0.0f, 0.0f ) ), Result::SUCCESS );
}

TEST( InstanceBatchTest, RejectsRecordOfOtherClass )
{
    InstanceBatch batch( DrawClass::SPRITE, BatchConfig{} );

    EXPECT_EQ( batch.Push( MakeQuadRecord( 0.0f, 0.0f ) ), Result::INVALID_ARGS );
    EXPECT_TRUE( batch.IsEmpty() );
}

TEST( InstanceBatchTest, UploadHandsRecordsToBackend )
{
    HostFrameBackend backend;
    InstanceBatch    batch( DrawClass::QUAD, BatchConfig{} );

    ASSERT_EQ( backend.BeginFrame(), Result::SUCCESS );

    // Empty batch does not reach the backend
    EXPECT_EQ( batch.Upload( backend ), Result::SUCCESS );
    EXPECT_EQ( backend.GetCounters().uploads, 0u );

    batch.Push( MakeQuadRecord( 1.0f, 2.0f ) );
    batch.Push( MakeQuadRecord( 3.0f, 4.0f ) );
    EXPECT_EQ( batch.Upload( backend ), Result::SUCCESS );
    EXPECT_EQ( backend.GetCounters().uploads, 1u );
    EXPECT_EQ( backend.GetUploadedCount( DrawClass::QUAD ), 2u );

    EXPECT_EQ( backend.EndFrame(), Result::SUCCESS );
}
