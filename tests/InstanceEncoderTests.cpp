#include "renderer/InstanceEncoder.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>

using namespace Batchline;
using namespace Batchline::InstanceLayout;

namespace
{
    DrawObject MakeObject( DrawClass drawClass, glm::vec2 position, glm::vec2 size )
    {
        DrawObject object;
        object.drawClass          = drawClass;
        object.transform.position = glm::vec3( position, 0.0f );
        object.transform.scale    = glm::vec3( size, 1.0f );
        if( drawClass == DrawClass::SPRITE || drawClass == DrawClass::GLYPH )
        {
            object.uv = UVRegion{ { 0.25f, 0.5f }, { 0.125f, 0.25f } };
        }
        return object;
    }
} // namespace

TEST( InstanceLayoutTest, StridesAreWholeBlocks )
{
    for( DrawClass drawClass: ALL_DRAW_CLASSES )
    {
        EXPECT_EQ( StrideWords( drawClass ) % BLOCK_WORDS, 0u ) << toString( drawClass );
        EXPECT_LE( StrideWords( drawClass ), MAX_WORDS );
    }
    EXPECT_EQ( StrideBytes( DrawClass::PRIMITIVE ), 32u );
    EXPECT_EQ( StrideBytes( DrawClass::QUAD ), 32u );
    EXPECT_EQ( StrideBytes( DrawClass::SPRITE ), 64u );
    EXPECT_EQ( StrideBytes( DrawClass::GLYPH ), 64u );

    EXPECT_EQ( ShapeWord( DrawClass::QUAD ), NO_WORD );
    EXPECT_EQ( ShapeWord( DrawClass::SPRITE ), SHAPE );
    EXPECT_EQ( MarginWord( DrawClass::GLYPH ), MARGIN );
}

TEST( InstanceEncoderTest, QuadWritesPositionSizeColor )
{
    DrawObject object = MakeObject( DrawClass::QUAD, { 10.0f, 20.0f }, { 30.0f, 40.0f } );
    object.color      = Color::RGBA( 0.1f, 0.2f, 0.3f, 0.4f );

    InstanceRecord record;
    ASSERT_EQ( InstanceEncoder::Encode( object, record ), Result::SUCCESS );

    EXPECT_EQ( record.drawClass, DrawClass::QUAD );
    EXPECT_EQ( record.GetVec2( POSITION ), glm::vec2( 10.0f, 20.0f ) );
    EXPECT_EQ( record.GetVec2( SIZE ), glm::vec2( 30.0f, 40.0f ) );
    EXPECT_EQ( record.GetVec4( QUAD_COLOR ), glm::vec4( 0.1f, 0.2f, 0.3f, 0.4f ) );

    // Second block stays zeroed for 32-byte classes
    for( uint32_t w = BLOCK_WORDS; w < MAX_WORDS; ++w )
        EXPECT_EQ( record.words[ w ], 0u );
}

TEST( InstanceEncoderTest, PrimitiveIgnoresScaleAndWritesPointMarker )
{
    DrawObject object = MakeObject( DrawClass::PRIMITIVE, { 5.0f, 6.0f }, { 100.0f, 100.0f } );

    InstanceRecord record;
    ASSERT_EQ( InstanceEncoder::Encode( object, record ), Result::SUCCESS );

    EXPECT_EQ( record.GetVec2( POSITION ), glm::vec2( 5.0f, 6.0f ) );
    EXPECT_EQ( record.GetVec2( SIZE ), glm::vec2( 0.0f, 0.0f ) );
}

TEST( InstanceEncoderTest, SpriteCarriesShapeTagAndUV )
{
    DrawObject object           = MakeObject( DrawClass::SPRITE, { 1.0f, 2.0f }, { 16.0f, 32.0f } );
    object.transform.position.z = 0.75f;
    object.transform.rotation.z = 0.5f;

    InstanceRecord record;
    ASSERT_EQ( InstanceEncoder::Encode( object, record ), Result::SUCCESS );

    EXPECT_EQ( record.words[ SHAPE ], SHAPE_AREA );
    EXPECT_FLOAT_EQ( record.GetFloat( ROTATION ), 0.5f );
    EXPECT_FLOAT_EQ( record.GetFloat( EXTRA ), 0.75f );
    EXPECT_EQ( record.GetVec2( SPRITE_UV_OFFSET ), glm::vec2( 0.25f, 0.5f ) );
    EXPECT_EQ( record.GetVec2( SPRITE_UV_SCALE ), glm::vec2( 0.125f, 0.25f ) );
    EXPECT_GT( record.GetFloat( MARGIN ), 0.0f );
}

TEST( InstanceEncoderTest, UnrotatedSpriteHasNoMargin )
{
    InstanceRecord record;
    ASSERT_EQ( InstanceEncoder::Encode( MakeObject( DrawClass::SPRITE, { 0.0f, 0.0f }, { 8.0f, 8.0f } ), record ), Result::SUCCESS );
    EXPECT_EQ( record.GetFloat( MARGIN ), 0.0f );
}

TEST( InstanceEncoderTest, SpriteMarginCoversRotatedCorners )
{
    const glm::vec2 size( 40.0f, 10.0f );
    const float32_t margin = InstanceEncoder::ComputeSpriteMargin( size, 1.0f );

    // Half diagonal minus half of the short side
    const float32_t expected = 0.5f * std::sqrt( 40.0f * 40.0f + 10.0f * 10.0f ) - 5.0f;
    EXPECT_NEAR( margin, expected, 1e-4f );

    // Any rotated corner stays within the expanded box
    const glm::vec2 center = size * 0.5f;
    for( float32_t angle = 0.0f; angle < 6.3f; angle += 0.1f )
    {
        const float32_t c = std::cos( angle );
        const float32_t s = std::sin( angle );
        const glm::vec2 corner( 20.0f, 5.0f );
        const glm::vec2 rotated = center + glm::vec2( c * corner.x - s * corner.y, s * corner.x + c * corner.y );
        EXPECT_GE( rotated.x, -margin - 1e-3f );
        EXPECT_LE( rotated.x, size.x + margin + 1e-3f );
        EXPECT_GE( rotated.y, -margin - 1e-3f );
        EXPECT_LE( rotated.y, size.y + margin + 1e-3f );
    }
}

TEST( InstanceEncoderTest, GlyphPacksUVAsUnorm16 )
{
    DrawObject object            = MakeObject( DrawClass::GLYPH, { 100.0f, 50.0f }, { 8.0f, 12.0f } );
    object.transform.pivotOffset = { 24.0f, -3.0f };
    object.glyphScale            = 2.0f;

    InstanceRecord record;
    ASSERT_EQ( InstanceEncoder::Encode( object, record ), Result::SUCCESS );

    EXPECT_EQ( record.words[ SHAPE ], SHAPE_AREA );
    EXPECT_FLOAT_EQ( record.GetFloat( EXTRA ), 2.0f );
    EXPECT_EQ( record.GetVec2( GLYPH_PIVOT_OFFSET ), glm::vec2( 24.0f, -3.0f ) );

    const glm::vec2 uvOffset = InstanceEncoder::UnpackUnorm16x2( record.words[ GLYPH_UV_OFFSET ] );
    const glm::vec2 uvScale  = InstanceEncoder::UnpackUnorm16x2( record.words[ GLYPH_UV_SCALE ] );
    EXPECT_NEAR( uvOffset.x, 0.25f, 1.0f / 65535.0f );
    EXPECT_NEAR( uvOffset.y, 0.5f, 1.0f / 65535.0f );
    EXPECT_NEAR( uvScale.x, 0.125f, 1.0f / 65535.0f );
    EXPECT_NEAR( uvScale.y, 0.25f, 1.0f / 65535.0f );

    const float32_t expectedMargin = ( glm::length( glm::vec2( 24.0f, -3.0f ) ) + glm::length( glm::vec2( 8.0f, 12.0f ) ) ) * 2.0f;
    EXPECT_NEAR( record.GetFloat( MARGIN ), expectedMargin, 1e-3f );
}

TEST( InstanceEncoderTest, PackUnormClampsOutOfRange )
{
    const uint32_t packed = InstanceEncoder::PackUnorm16x2( { -0.5f, 1.5f } );
    EXPECT_EQ( packed & 0xFFFFu, 0u );
    EXPECT_EQ( packed >> 16, 0xFFFFu );
}

TEST( InstanceEncoderTest, PackUnormPutsXInLowHalf )
{
    // 0.5 rounds to 32768, 0.25 to 16384
    const uint32_t packed = InstanceEncoder::PackUnorm16x2( { 0.5f, 0.25f } );
    EXPECT_EQ( packed & 0xFFFFu, 32768u );
    EXPECT_EQ( packed >> 16, 16384u );

    const glm::vec2 unpacked = InstanceEncoder::UnpackUnorm16x2( 0xFFFF0000u );
    EXPECT_FLOAT_EQ( unpacked.x, 0.0f );
    EXPECT_FLOAT_EQ( unpacked.y, 1.0f );
}

TEST( InstanceEncoderTest, MissingUVIsRejected )
{
    DrawObject sprite = MakeObject( DrawClass::SPRITE, { 0.0f, 0.0f }, { 4.0f, 4.0f } );
    sprite.uv.reset();

    InstanceRecord record;
    EXPECT_EQ( InstanceEncoder::Encode( sprite, record ), Result::INVALID_OBJECT );

    DrawObject glyph = MakeObject( DrawClass::GLYPH, { 0.0f, 0.0f }, { 4.0f, 4.0f } );
    glyph.uv.reset();
    EXPECT_EQ( InstanceEncoder::Encode( glyph, record ), Result::INVALID_OBJECT );
}

TEST( InstanceEncoderTest, NonFiniteTransformIsRejected )
{
    DrawObject object           = MakeObject( DrawClass::QUAD, { 0.0f, 0.0f }, { 4.0f, 4.0f } );
    object.transform.position.x = std::numeric_limits<float32_t>::quiet_NaN();

    InstanceRecord record;
    EXPECT_EQ( InstanceEncoder::Encode( object, record ), Result::INVALID_OBJECT );

    object                      = MakeObject( DrawClass::GLYPH, { 0.0f, 0.0f }, { 4.0f, 4.0f } );
    object.glyphScale           = std::numeric_limits<float32_t>::infinity();
    EXPECT_EQ( InstanceEncoder::Encode( object, record ), Result::INVALID_OBJECT );
}

TEST( InstanceEncoderTest, DecodeRestoresSprite )
{
    DrawObject object           = MakeObject( DrawClass::SPRITE, { -7.0f, 3.5f }, { 12.0f, 6.0f } );
    object.transform.rotation.z = -1.25f;
    object.color                = Colors::Orange;

    InstanceRecord record;
    ASSERT_EQ( InstanceEncoder::Encode( object, record ), Result::SUCCESS );

    DrawObject decoded;
    ASSERT_EQ( InstanceEncoder::Decode( record, decoded ), Result::SUCCESS );

    EXPECT_EQ( decoded.drawClass, DrawClass::SPRITE );
    EXPECT_EQ( decoded.transform.position, object.transform.position );
    EXPECT_EQ( decoded.transform.scale, object.transform.scale );
    EXPECT_FLOAT_EQ( decoded.transform.rotation.z, -1.25f );
    EXPECT_EQ( decoded.color, Colors::Orange );
    ASSERT_TRUE( decoded.uv.has_value() );
    EXPECT_EQ( decoded.uv->offset, object.uv->offset );
}

TEST( InstanceEncoderTest, DecodeInvertsEncodeForEveryClass )
{
    for( DrawClass drawClass: ALL_DRAW_CLASSES )
    {
        DrawObject object            = MakeObject( drawClass, { 41.5f, -9.25f }, { 6.0f, 10.0f } );
        object.color                 = Color::RGBA( 0.1f, 0.2f, 0.3f, 0.4f );
        object.transform.rotation.z  = 0.75f;
        object.transform.pivotOffset = { 3.0f, -2.0f };
        object.glyphScale            = 1.5f;
        if( object.uv )
            object.uv = UVRegion{ { 0.3f, 0.7f }, { 0.05f, 0.125f } };

        InstanceRecord record;
        ASSERT_EQ( InstanceEncoder::Encode( object, record ), Result::SUCCESS ) << toString( drawClass );

        DrawObject decoded;
        ASSERT_EQ( InstanceEncoder::Decode( record, decoded ), Result::SUCCESS ) << toString( drawClass );

        EXPECT_EQ( decoded.drawClass, drawClass );
        EXPECT_EQ( glm::vec2( decoded.transform.position ), glm::vec2( 41.5f, -9.25f ) ) << toString( drawClass );
        EXPECT_EQ( decoded.color, object.color ) << toString( drawClass );

        switch( drawClass )
        {
            case DrawClass::PRIMITIVE:
                EXPECT_EQ( glm::vec2( decoded.transform.scale ), glm::vec2( 0.0f ) );
                EXPECT_FALSE( decoded.uv.has_value() );
                break;

            case DrawClass::QUAD:
                EXPECT_EQ( glm::vec2( decoded.transform.scale ), glm::vec2( 6.0f, 10.0f ) );
                EXPECT_FALSE( decoded.uv.has_value() );
                break;

            case DrawClass::SPRITE:
                EXPECT_EQ( glm::vec2( decoded.transform.scale ), glm::vec2( 6.0f, 10.0f ) );
                EXPECT_FLOAT_EQ( decoded.transform.rotation.z, 0.75f );
                ASSERT_TRUE( decoded.uv.has_value() );
                EXPECT_EQ( decoded.uv->offset, object.uv->offset );
                EXPECT_EQ( decoded.uv->scale, object.uv->scale );
                break;

            case DrawClass::GLYPH:
                EXPECT_EQ( glm::vec2( decoded.transform.scale ), glm::vec2( 6.0f, 10.0f ) );
                EXPECT_FLOAT_EQ( decoded.transform.rotation.z, 0.75f );
                EXPECT_EQ( decoded.transform.pivotOffset, glm::vec2( 3.0f, -2.0f ) );
                EXPECT_FLOAT_EQ( decoded.glyphScale, 1.5f );
                ASSERT_TRUE( decoded.uv.has_value() );
                EXPECT_NEAR( decoded.uv->offset.x, 0.3f, 1.0f / 65535.0f );
                EXPECT_NEAR( decoded.uv->offset.y, 0.7f, 1.0f / 65535.0f );
                EXPECT_NEAR( decoded.uv->scale.x, 0.05f, 1.0f / 65535.0f );
                EXPECT_NEAR( decoded.uv->scale.y, 0.125f, 1.0f / 65535.0f );
                break;

            default:
                FAIL() << "unexpected class";
        }
    }
}
