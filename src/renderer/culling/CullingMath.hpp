#pragma once
#include "renderer/culling/CullingUniforms.hpp"
#include <cstring>

namespace Batchline::CullingMath
{
    // Size heuristic for records without a usable shape tag
    constexpr float32_t MAX_AREA_EXTENT = 10000.0f;

    inline float32_t ReadFloat( const uint32_t* record, uint32_t word )
    {
        float32_t value;
        std::memcpy( &value, &record[ word ], sizeof( float32_t ) );
        return value;
    }

    inline bool IsArea( const uint32_t* record, const CullingUniforms& u )
    {
        if( u.shapeWord != InstanceLayout::NO_WORD )
        {
            const uint32_t tag = record[ u.shapeWord ];
            if( tag == InstanceLayout::SHAPE_POINT )
                return false;
            if( tag == InstanceLayout::SHAPE_AREA )
                return true;
        }

        const float32_t sx = ReadFloat( record, InstanceLayout::SIZE );
        const float32_t sy = ReadFloat( record, InstanceLayout::SIZE + 1 );
        return sx > 0.0f && sx < MAX_AREA_EXTENT && sy > 0.0f && sy < MAX_AREA_EXTENT;
    }

    inline bool IsPointInside( const CullingUniforms& u, const glm::vec3& p )
    {
        for( const glm::vec4& plane: u.planes )
        {
            if( glm::dot( glm::vec3( plane ), p ) + plane.w < 0.0f )
                return false;
        }
        return true;
    }

    inline bool IsBoxVisible( const CullingUniforms& u, const glm::vec3& minCorner, const glm::vec3& maxCorner )
    {
        for( const glm::vec4& plane: u.planes )
        {
            // Corner furthest along the plane normal
            const glm::vec3 positive( plane.x >= 0.0f ? maxCorner.x : minCorner.x, plane.y >= 0.0f ? maxCorner.y : minCorner.y,
                                      plane.z >= 0.0f ? maxCorner.z : minCorner.z );
            if( glm::dot( glm::vec3( plane ), positive ) + plane.w < 0.0f )
                return false;
        }
        return true;
    }

    /**
     * @brief Visibility of one record. Same decision as cull_instances.comp.
     */
    inline bool IsRecordVisible( const uint32_t* record, const CullingUniforms& u )
    {
        const glm::vec3 position( ReadFloat( record, InstanceLayout::POSITION ), ReadFloat( record, InstanceLayout::POSITION + 1 ), 0.0f );

        if( !IsArea( record, u ) )
            return IsPointInside( u, position );

        const glm::vec3 size( ReadFloat( record, InstanceLayout::SIZE ), ReadFloat( record, InstanceLayout::SIZE + 1 ), 0.0f );
        const float32_t margin = u.marginWord != InstanceLayout::NO_WORD ? ReadFloat( record, u.marginWord ) : 0.0f;
        const glm::vec3 expand( margin, margin, 0.0f );

        const glm::vec3 minCorner = glm::min( position, position + size ) - expand;
        const glm::vec3 maxCorner = glm::max( position, position + size ) + expand;
        return IsBoxVisible( u, minCorner, maxCorner );
    }
} // namespace Batchline::CullingMath
