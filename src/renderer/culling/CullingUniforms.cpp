#include "renderer/culling/CullingUniforms.hpp"

namespace Batchline
{
    CullingUniforms CullingUniforms::FromRect( float32_t x, float32_t y, float32_t width, float32_t height )
    {
        CullingUniforms u;
        u.planes[ 0 ] = glm::vec4( 1.0f, 0.0f, 0.0f, -x );           // left
        u.planes[ 1 ] = glm::vec4( -1.0f, 0.0f, 0.0f, x + width );   // right
        u.planes[ 2 ] = glm::vec4( 0.0f, 1.0f, 0.0f, -y );           // top
        u.planes[ 3 ] = glm::vec4( 0.0f, -1.0f, 0.0f, y + height );  // bottom
        u.planes[ 4 ] = glm::vec4( 0.0f, 0.0f, 0.0f, 1.0f );
        u.planes[ 5 ] = glm::vec4( 0.0f, 0.0f, 0.0f, 1.0f );
        return u;
    }

    CullingUniforms CullingUniforms::FromViewProjection( const glm::mat4& m )
    {
        // Gribb-Hartmann on the rows of a column-major matrix
        const glm::vec4 row0( m[ 0 ][ 0 ], m[ 1 ][ 0 ], m[ 2 ][ 0 ], m[ 3 ][ 0 ] );
        const glm::vec4 row1( m[ 0 ][ 1 ], m[ 1 ][ 1 ], m[ 2 ][ 1 ], m[ 3 ][ 1 ] );
        const glm::vec4 row2( m[ 0 ][ 2 ], m[ 1 ][ 2 ], m[ 2 ][ 2 ], m[ 3 ][ 2 ] );
        const glm::vec4 row3( m[ 0 ][ 3 ], m[ 1 ][ 3 ], m[ 2 ][ 3 ], m[ 3 ][ 3 ] );

        CullingUniforms u;
        u.planes[ 0 ] = row3 + row0; // left
        u.planes[ 1 ] = row3 - row0; // right
        u.planes[ 2 ] = row3 + row1; // top (Vulkan y points down)
        u.planes[ 3 ] = row3 - row1; // bottom
        u.planes[ 4 ] = row2;        // near, z in [0, w]
        u.planes[ 5 ] = row3 - row2; // far

        for( glm::vec4& plane: u.planes )
        {
            const float32_t len = glm::length( glm::vec3( plane ) );
            if( len > 0.0f )
                plane /= len;
        }
        return u;
    }

    CullingUniforms CullingUniforms::ForBatch( DrawClass drawClass, uint32_t count ) const
    {
        CullingUniforms u = *this;
        u.instanceCount   = count;
        u.strideWords     = InstanceLayout::StrideWords( drawClass );
        u.shapeWord       = InstanceLayout::ShapeWord( drawClass );
        u.marginWord      = InstanceLayout::MarginWord( drawClass );
        return u;
    }
} // namespace Batchline
