#pragma once
#include "renderer/Types.hpp"
#include <vector>

namespace Batchline
{
    struct AnimationFrame
    {
        AtlasRegion region;
        float32_t   duration = 0.1f; // seconds
    };

    /**
     * @brief Flip-book animation over atlas regions.
     * Update() advances at most one frame per call and wraps to the first frame after the last one.
     */
    class SpriteAnimation
    {
    public:
        SpriteAnimation( std::vector<AnimationFrame> frames, uint32_t atlasWidth, uint32_t atlasHeight, glm::vec2 renderScale = { 1.0f, 1.0f } );

        bool IsValid() const { return !m_frames.empty(); }

        void Update( float32_t dt );

        // Ignored when out of range
        void SetFrame( uint32_t index );
        void Reset();

        uint32_t GetCurrentFrame() const { return m_current; }
        uint32_t GetFrameCount() const { return static_cast<uint32_t>( m_frames.size() ); }

        UVRegion  GetUV() const;
        // Frame size in pixels times the render scale
        glm::vec2 GetSize() const;

        /**
         * @brief Writes the current frame's UV region and size into a SPRITE draw object.
         */
        void Apply( DrawObject& sprite ) const;

    private:
        std::vector<AnimationFrame> m_frames;
        uint32_t                    m_atlasWidth;
        uint32_t                    m_atlasHeight;
        glm::vec2                   m_renderScale;

        uint32_t  m_current = 0;
        float32_t m_elapsed = 0.0f;
    };
} // namespace Batchline
