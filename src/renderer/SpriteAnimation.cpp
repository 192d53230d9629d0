#include "renderer/SpriteAnimation.hpp"

namespace Batchline
{
    SpriteAnimation::SpriteAnimation( std::vector<AnimationFrame> frames, uint32_t atlasWidth, uint32_t atlasHeight, glm::vec2 renderScale )
        : m_frames( std::move( frames ) )
        , m_atlasWidth( atlasWidth )
        , m_atlasHeight( atlasHeight )
        , m_renderScale( renderScale )
    {
        if( m_frames.empty() )
        {
            BL_CORE_WARN( "SpriteAnimation created without frames." );
        }
    }

    void SpriteAnimation::Update( float32_t dt )
    {
        if( m_frames.size() <= 1 )
            return;

        m_elapsed += dt;

        const float32_t duration = m_frames[ m_current ].duration;
        if( m_elapsed >= duration )
        {
            m_elapsed -= duration;
            m_current = ( m_current + 1 ) % static_cast<uint32_t>( m_frames.size() );
        }
    }

    void SpriteAnimation::SetFrame( uint32_t index )
    {
        if( index < m_frames.size() )
        {
            m_current = index;
            m_elapsed = 0.0f;
        }
    }

    void SpriteAnimation::Reset()
    {
        SetFrame( 0 );
    }

    UVRegion SpriteAnimation::GetUV() const
    {
        if( m_frames.empty() )
            return UVRegion{};
        return m_frames[ m_current ].region.ToUV( m_atlasWidth, m_atlasHeight );
    }

    glm::vec2 SpriteAnimation::GetSize() const
    {
        if( m_frames.empty() )
            return { 0.0f, 0.0f };
        const AtlasRegion& region = m_frames[ m_current ].region;
        return glm::vec2( static_cast<float32_t>( region.w ), static_cast<float32_t>( region.h ) ) * m_renderScale;
    }

    void SpriteAnimation::Apply( DrawObject& sprite ) const
    {
        const glm::vec2 size     = GetSize();
        sprite.uv                = GetUV();
        sprite.transform.scale.x = size.x;
        sprite.transform.scale.y = size.y;
    }
} // namespace Batchline
