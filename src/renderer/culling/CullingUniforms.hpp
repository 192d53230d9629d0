#pragma once
#include "renderer/InstanceLayout.hpp"

namespace Batchline
{
    /**
     * @brief Push constant block of cull_instances.comp (std430 compatible, 112 bytes).
     *
     * A plane ( n, d ) keeps p when dot( n, p ) + d >= 0. Unused planes are ( 0, 0, 0, 1 ) and always pass.
     */
    struct CullingUniforms
    {
        glm::vec4 planes[ 6 ] = { glm::vec4( 0, 0, 0, 1 ), glm::vec4( 0, 0, 0, 1 ), glm::vec4( 0, 0, 0, 1 ),
                                  glm::vec4( 0, 0, 0, 1 ), glm::vec4( 0, 0, 0, 1 ), glm::vec4( 0, 0, 0, 1 ) };
        uint32_t  instanceCount = 0;
        uint32_t  strideWords   = InstanceLayout::BLOCK_WORDS;
        uint32_t  shapeWord     = InstanceLayout::NO_WORD;
        uint32_t  marginWord    = InstanceLayout::NO_WORD;

        /**
         * @brief Screen/world rect bound. Points on an edge are inside.
         */
        static CullingUniforms FromRect( float32_t x, float32_t y, float32_t width, float32_t height );

        /**
         * @brief Frustum bound from a Vulkan (0..1 depth) view-projection. Planes are normalized.
         */
        static CullingUniforms FromViewProjection( const glm::mat4& viewProjection );

        /**
         * @brief Fills the per-dispatch fields for one batch of the given class.
         */
        CullingUniforms ForBatch( DrawClass drawClass, uint32_t count ) const;
    };
    static_assert( sizeof( CullingUniforms ) == 112 );

    constexpr uint32_t GetWorkgroupCount( uint32_t count, uint32_t workgroupSize )
    {
        return ( count + workgroupSize - 1 ) / workgroupSize;
    }
} // namespace Batchline
