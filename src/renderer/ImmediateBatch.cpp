#include "renderer/ImmediateBatch.hpp"

#include <array>
#include <cmath>

namespace Batchline
{
    ImmediateBatch::ImmediateBatch( const ImmediateConfig& config )
        : m_config( config )
    {
        m_vertices.reserve( m_config.initialVertexCapacity );
        m_indices.reserve( m_config.initialVertexCapacity * 3 / 2 );
    }

    Result ImmediateBatch::Reserve( uint32_t vertexCount )
    {
        if( m_vertices.size() + vertexCount > m_config.maxVertices )
        {
            BL_CORE_ERROR( "ImmediateBatch: vertex limit {} reached.", m_config.maxVertices );
            return Result::BUFFER_OVERFLOW;
        }
        return Result::SUCCESS;
    }

    Result ImmediateBatch::PushQuad( const glm::vec2 corners[ 4 ], const glm::vec4& color )
    {
        Result result = Reserve( 4 );
        if( result != Result::SUCCESS )
            return result;

        static const glm::vec2 uvs[ 4 ] = { { 0.0f, 0.0f }, { 1.0f, 0.0f }, { 0.0f, 1.0f }, { 1.0f, 1.0f } };

        const uint32_t base = static_cast<uint32_t>( m_vertices.size() );
        for( uint32_t i = 0; i < 4; ++i )
        {
            m_vertices.push_back( { corners[ i ], uvs[ i ], color } );
        }

        m_indices.insert( m_indices.end(), { base, base + 1, base + 2, base + 2, base + 1, base + 3 } );
        return Result::SUCCESS;
    }

    Result ImmediateBatch::FillRect( const glm::vec2& position, const glm::vec2& size, const Color& color )
    {
        const glm::vec2 corners[ 4 ] = { position, { position.x + size.x, position.y }, { position.x, position.y + size.y },
                                         position + size };
        return PushQuad( corners, color.ToVec4() );
    }

    Result ImmediateBatch::DrawLine( const glm::vec2& from, const glm::vec2& to, float32_t thickness, const Color& color )
    {
        const glm::vec2 dir = to - from;
        if( glm::length( dir ) <= 0.0f || thickness <= 0.0f )
            return Result::INVALID_ARGS;

        const glm::vec2 unit         = glm::normalize( dir );
        const glm::vec2 normal       = glm::vec2( -unit.y, unit.x ) * ( thickness * 0.5f );
        const glm::vec2 corners[ 4 ] = { from + normal, to + normal, from - normal, to - normal };
        return PushQuad( corners, color.ToVec4() );
    }

    Result ImmediateBatch::StrokeRect( const glm::vec2& position, const glm::vec2& size, float32_t thickness, const Color& color )
    {
        if( size.x == 0.0f || size.y == 0.0f || thickness <= 0.0f )
            return Result::INVALID_ARGS;

        // All four edges or none
        Result result = Reserve( 16 );
        if( result != Result::SUCCESS )
            return result;

        // Horizontal edges run past the corners so the outline has no notches
        const glm::vec2 overhang( std::copysign( thickness * 0.5f, size.x ), 0.0f );
        const glm::vec2 topLeft     = position;
        const glm::vec2 topRight    = { position.x + size.x, position.y };
        const glm::vec2 bottomLeft  = { position.x, position.y + size.y };
        const glm::vec2 bottomRight = position + size;

        const std::array<Result, 4> edges = { DrawLine( topLeft - overhang, topRight + overhang, thickness, color ),
                                              DrawLine( topRight, bottomRight, thickness, color ),
                                              DrawLine( bottomRight + overhang, bottomLeft - overhang, thickness, color ),
                                              DrawLine( bottomLeft, topLeft, thickness, color ) };
        for( Result edge: edges )
        {
            if( edge != Result::SUCCESS )
                return edge;
        }
        return Result::SUCCESS;
    }

    Result ImmediateBatch::DrawTriangle( const glm::vec2& a, const glm::vec2& b, const glm::vec2& c, const Color& color )
    {
        Result result = Reserve( 3 );
        if( result != Result::SUCCESS )
            return result;

        const glm::vec4 rgba = color.ToVec4();
        const uint32_t  base = static_cast<uint32_t>( m_vertices.size() );
        m_vertices.push_back( { a, { 0.0f, 0.0f }, rgba } );
        m_vertices.push_back( { b, { 1.0f, 0.0f }, rgba } );
        m_vertices.push_back( { c, { 0.0f, 1.0f }, rgba } );
        m_indices.insert( m_indices.end(), { base, base + 1, base + 2 } );
        return Result::SUCCESS;
    }

    void ImmediateBatch::Clear()
    {
        m_vertices.clear();
        m_indices.clear();
    }
} // namespace Batchline
