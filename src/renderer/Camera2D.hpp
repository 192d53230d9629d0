#pragma once
#include "renderer/Types.hpp"
#include "renderer/culling/CullingUniforms.hpp"
#include <glm/glm.hpp>

namespace Batchline
{
    struct WorldRect
    {
        float32_t x      = 0.0f;
        float32_t y      = 0.0f;
        float32_t width  = 0.0f;
        float32_t height = 0.0f;
    };

    /**
     * @brief Orthographic 2D camera. World units are pixels at zoom 1, y grows downwards.
     * The position is the world point shown at the center of the viewport. Rotation turns the view
     * counter-clockwise on screen.
     */
    class Camera2D
    {
    public:
        Camera2D( uint32_t viewportWidth, uint32_t viewportHeight );

        void OnResize( uint32_t width, uint32_t height );

        void SetPosition( const glm::vec2& position );
        void SetZoom( float32_t zoom );
        void SetRotation( float32_t radians );

        // Moves by a screen-space delta, so panning feels the same at any zoom and rotation
        void Pan( const glm::vec2& screenDelta );

        const glm::vec2& GetPosition() const { return m_position; }
        float32_t        GetZoom() const { return m_zoom; }
        float32_t        GetRotation() const { return m_rotation; }
        glm::vec2        GetViewportSize() const { return { static_cast<float32_t>( m_width ), static_cast<float32_t>( m_height ) }; }

        const glm::mat4& GetView() const { return m_viewMatrix; }
        const glm::mat4& GetProjection() const { return m_projectionMatrix; }
        const glm::mat4& GetViewProjection() const { return m_viewProjection; }

        glm::vec2 ScreenToWorld( const glm::vec2& screen ) const;
        glm::vec2 WorldToScreen( const glm::vec2& world ) const;

        /**
         * @brief Axis aligned world rect covering the viewport. Conservative when rotated.
         */
        WorldRect GetVisibleRect() const;

        CameraUniform   GetUniform() const;
        CullingUniforms GetCullingUniforms() const;

    private:
        void RecalculateView();
        void RecalculateProjection();

    private:
        uint32_t m_width;
        uint32_t m_height;

        glm::vec2 m_position = { 0.0f, 0.0f };
        float32_t m_zoom     = 1.0f;
        float32_t m_rotation = 0.0f;

        glm::mat4 m_viewMatrix       = glm::mat4( 1.0f );
        glm::mat4 m_inverseView      = glm::mat4( 1.0f );
        glm::mat4 m_projectionMatrix = glm::mat4( 1.0f );
        glm::mat4 m_viewProjection   = glm::mat4( 1.0f );
    };
} // namespace Batchline
