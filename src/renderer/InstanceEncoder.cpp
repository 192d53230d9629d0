#include "renderer/InstanceEncoder.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <glm/packing.hpp>

namespace Batchline
{
    namespace
    {
        bool IsFinite( const glm::vec3& v )
        {
            return std::isfinite( v.x ) && std::isfinite( v.y ) && std::isfinite( v.z );
        }

        bool RequiresUV( DrawClass drawClass )
        {
            return drawClass == DrawClass::SPRITE || drawClass == DrawClass::GLYPH;
        }
    } // namespace

    float32_t InstanceRecord::GetFloat( uint32_t word ) const
    {
        float32_t value;
        std::memcpy( &value, &words[ word ], sizeof( float32_t ) );
        return value;
    }

    void InstanceRecord::SetFloat( uint32_t word, float32_t value )
    {
        std::memcpy( &words[ word ], &value, sizeof( float32_t ) );
    }

    glm::vec2 InstanceRecord::GetVec2( uint32_t word ) const
    {
        return glm::vec2( GetFloat( word ), GetFloat( word + 1 ) );
    }

    void InstanceRecord::SetVec2( uint32_t word, const glm::vec2& value )
    {
        SetFloat( word, value.x );
        SetFloat( word + 1, value.y );
    }

    glm::vec4 InstanceRecord::GetVec4( uint32_t word ) const
    {
        return glm::vec4( GetFloat( word ), GetFloat( word + 1 ), GetFloat( word + 2 ), GetFloat( word + 3 ) );
    }

    void InstanceRecord::SetVec4( uint32_t word, const glm::vec4& value )
    {
        SetFloat( word, value.x );
        SetFloat( word + 1, value.y );
        SetFloat( word + 2, value.z );
        SetFloat( word + 3, value.w );
    }

    Result InstanceEncoder::Encode( const DrawObject& object, InstanceRecord& out )
    {
        const Transform& t = object.transform;

        if( object.drawClass >= DrawClass::_MAX_ENUM )
            return Result::INVALID_ARGS;

        if( !IsFinite( t.position ) || !IsFinite( t.scale ) || !IsFinite( t.rotation ) || !std::isfinite( t.pivotOffset.x ) ||
            !std::isfinite( t.pivotOffset.y ) || !std::isfinite( object.glyphScale ) )
        {
            return Result::INVALID_OBJECT;
        }

        if( RequiresUV( object.drawClass ) && !object.uv.has_value() )
        {
            return Result::INVALID_OBJECT;
        }

        out           = InstanceRecord{};
        out.drawClass = object.drawClass;

        const glm::vec2 position( t.position );
        const glm::vec2 size( t.scale );
        using namespace InstanceLayout;

        switch( object.drawClass )
        {
            case DrawClass::PRIMITIVE:
                out.SetVec2( POSITION, position );
                out.SetVec2( SIZE, glm::vec2( 0.0f ) );
                out.SetVec4( QUAD_COLOR, object.color.ToVec4() );
                break;

            case DrawClass::QUAD:
                out.SetVec2( POSITION, position );
                out.SetVec2( SIZE, size );
                out.SetVec4( QUAD_COLOR, object.color.ToVec4() );
                break;

            case DrawClass::SPRITE:
                out.SetVec2( POSITION, position );
                out.SetVec2( SIZE, size );
                out.SetFloat( ROTATION, t.rotation.z );
                out.words[ SHAPE ] = SHAPE_AREA;
                out.SetFloat( MARGIN, ComputeSpriteMargin( size, t.rotation.z ) );
                out.SetFloat( EXTRA, t.position.z );
                out.SetVec4( COLOR, object.color.ToVec4() );
                out.SetVec2( SPRITE_UV_OFFSET, object.uv->offset );
                out.SetVec2( SPRITE_UV_SCALE, object.uv->scale );
                break;

            case DrawClass::GLYPH:
                out.SetVec2( POSITION, position );
                out.SetVec2( SIZE, size );
                out.SetFloat( ROTATION, t.rotation.z );
                out.words[ SHAPE ] = SHAPE_AREA;
                out.SetFloat( MARGIN, ComputeGlyphMargin( t.pivotOffset, size, object.glyphScale ) );
                out.SetFloat( EXTRA, object.glyphScale );
                out.SetVec4( COLOR, object.color.ToVec4() );
                out.SetVec2( GLYPH_PIVOT_OFFSET, t.pivotOffset );
                out.words[ GLYPH_UV_OFFSET ] = PackUnorm16x2( object.uv->offset );
                out.words[ GLYPH_UV_SCALE ]  = PackUnorm16x2( object.uv->scale );
                break;

            default:
                return Result::INVALID_ARGS;
        }

        return Result::SUCCESS;
    }

    Result InstanceEncoder::Decode( const InstanceRecord& record, DrawObject& out )
    {
        using namespace InstanceLayout;

        out           = DrawObject{};
        out.drawClass = record.drawClass;

        const glm::vec2 position = record.GetVec2( POSITION );
        const glm::vec2 size     = record.GetVec2( SIZE );

        out.transform.position = glm::vec3( position, 0.0f );
        out.transform.scale    = glm::vec3( size, 1.0f );

        switch( record.drawClass )
        {
            case DrawClass::PRIMITIVE:
            case DrawClass::QUAD:
            {
                const glm::vec4 c = record.GetVec4( QUAD_COLOR );
                out.color         = Color::RGBA( c.r, c.g, c.b, c.a );
                break;
            }

            case DrawClass::SPRITE:
            {
                const glm::vec4 c           = record.GetVec4( COLOR );
                out.color                   = Color::RGBA( c.r, c.g, c.b, c.a );
                out.transform.rotation.z    = record.GetFloat( ROTATION );
                out.transform.position.z    = record.GetFloat( EXTRA );
                out.uv                      = UVRegion{ record.GetVec2( SPRITE_UV_OFFSET ), record.GetVec2( SPRITE_UV_SCALE ) };
                break;
            }

            case DrawClass::GLYPH:
            {
                const glm::vec4 c         = record.GetVec4( COLOR );
                out.color                 = Color::RGBA( c.r, c.g, c.b, c.a );
                out.transform.rotation.z  = record.GetFloat( ROTATION );
                out.transform.pivotOffset = record.GetVec2( GLYPH_PIVOT_OFFSET );
                out.glyphScale            = record.GetFloat( EXTRA );
                out.uv = UVRegion{ UnpackUnorm16x2( record.words[ GLYPH_UV_OFFSET ] ), UnpackUnorm16x2( record.words[ GLYPH_UV_SCALE ] ) };
                break;
            }

            default:
                return Result::INVALID_ARGS;
        }

        return Result::SUCCESS;
    }

    float32_t InstanceEncoder::ComputeSpriteMargin( const glm::vec2& size, float32_t rotation )
    {
        if( rotation == 0.0f )
            return 0.0f;

        // Rotation about the center stays inside the circle of radius |size| / 2
        const float32_t radius = 0.5f * glm::length( size );
        const float32_t inner  = 0.5f * std::min( std::abs( size.x ), std::abs( size.y ) );
        return radius - inner;
    }

    float32_t InstanceEncoder::ComputeGlyphMargin( const glm::vec2& pivotOffset, const glm::vec2& size, float32_t scale )
    {
        // Every corner lies within ( |offset| + |size| ) * |scale| of the pivot
        return ( glm::length( pivotOffset ) + glm::length( size ) ) * std::abs( scale );
    }

    uint32_t InstanceEncoder::PackUnorm16x2( const glm::vec2& value )
    {
        return glm::packUnorm2x16( value );
    }

    glm::vec2 InstanceEncoder::UnpackUnorm16x2( uint32_t packed )
    {
        return glm::unpackUnorm2x16( packed );
    }
} // namespace Batchline
