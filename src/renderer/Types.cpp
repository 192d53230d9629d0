#include "renderer/Types.hpp"

namespace Batchline
{
    UVRegion AtlasRegion::ToUV( uint32_t atlasWidth, uint32_t atlasHeight ) const
    {
        UVRegion uv;
        if( atlasWidth == 0 || atlasHeight == 0 )
        {
            BL_CORE_WARN( "AtlasRegion::ToUV called with an empty atlas." );
            uv.scale = { 0.0f, 0.0f };
            return uv;
        }

        const glm::vec2 size( static_cast<float32_t>( atlasWidth ), static_cast<float32_t>( atlasHeight ) );
        uv.offset = glm::vec2( static_cast<float32_t>( x ), static_cast<float32_t>( y ) ) / size;
        uv.scale  = glm::vec2( static_cast<float32_t>( w ), static_cast<float32_t>( h ) ) / size;
        return uv;
    }
} // namespace Batchline
