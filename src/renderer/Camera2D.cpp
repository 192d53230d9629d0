#include "renderer/Camera2D.hpp"

#include <algorithm>
#include <cmath>
#include <glm/gtc/matrix_transform.hpp>

namespace Batchline
{
    static constexpr float32_t MIN_ZOOM = 1e-4f;

    Camera2D::Camera2D( uint32_t viewportWidth, uint32_t viewportHeight )
        : m_width( viewportWidth )
        , m_height( viewportHeight )
    {
        m_position = { m_width * 0.5f, m_height * 0.5f };
        RecalculateProjection();
        RecalculateView();
    }

    void Camera2D::OnResize( uint32_t width, uint32_t height )
    {
        if( width == 0 || height == 0 )
            return;
        m_width  = width;
        m_height = height;
        RecalculateProjection();
        RecalculateView();
    }

    void Camera2D::SetPosition( const glm::vec2& position )
    {
        m_position = position;
        RecalculateView();
    }

    void Camera2D::SetZoom( float32_t zoom )
    {
        if( !std::isfinite( zoom ) || zoom < MIN_ZOOM )
        {
            BL_CORE_WARN( "Camera2D: zoom {} clamped to {}", zoom, MIN_ZOOM );
            zoom = MIN_ZOOM;
        }
        m_zoom = zoom;
        RecalculateView();
    }

    void Camera2D::SetRotation( float32_t radians )
    {
        m_rotation = radians;
        RecalculateView();
    }

    void Camera2D::Pan( const glm::vec2& screenDelta )
    {
        // Screen delta back through rotation and zoom, translation excluded
        const glm::vec4 world = m_inverseView * glm::vec4( screenDelta, 0.0f, 0.0f );
        m_position += glm::vec2( world );
        RecalculateView();
    }

    void Camera2D::RecalculateProjection()
    {
        // y-down pixels: (0,0) maps to NDC (-1,-1), which is the top-left corner in Vulkan
        m_projectionMatrix = glm::ortho( 0.0f, static_cast<float32_t>( m_width ), 0.0f, static_cast<float32_t>( m_height ) );
    }

    void Camera2D::RecalculateView()
    {
        glm::mat4 view = glm::translate( glm::mat4( 1.0f ), glm::vec3( m_width * 0.5f, m_height * 0.5f, 0.0f ) );
        view           = glm::scale( view, glm::vec3( m_zoom, m_zoom, 1.0f ) );
        view           = glm::rotate( view, -m_rotation, glm::vec3( 0.0f, 0.0f, 1.0f ) );
        view           = glm::translate( view, glm::vec3( -m_position, 0.0f ) );

        m_viewMatrix     = view;
        m_inverseView    = glm::inverse( view );
        m_viewProjection = m_projectionMatrix * m_viewMatrix;
    }

    glm::vec2 Camera2D::ScreenToWorld( const glm::vec2& screen ) const
    {
        return glm::vec2( m_inverseView * glm::vec4( screen, 0.0f, 1.0f ) );
    }

    glm::vec2 Camera2D::WorldToScreen( const glm::vec2& world ) const
    {
        return glm::vec2( m_viewMatrix * glm::vec4( world, 0.0f, 1.0f ) );
    }

    WorldRect Camera2D::GetVisibleRect() const
    {
        const float32_t w = static_cast<float32_t>( m_width );
        const float32_t h = static_cast<float32_t>( m_height );

        const glm::vec2 corners[ 4 ] = { ScreenToWorld( { 0.0f, 0.0f } ), ScreenToWorld( { w, 0.0f } ), ScreenToWorld( { 0.0f, h } ),
                                         ScreenToWorld( { w, h } ) };

        glm::vec2 minCorner = corners[ 0 ];
        glm::vec2 maxCorner = corners[ 0 ];
        for( const glm::vec2& c: corners )
        {
            minCorner = glm::min( minCorner, c );
            maxCorner = glm::max( maxCorner, c );
        }

        return WorldRect{ minCorner.x, minCorner.y, maxCorner.x - minCorner.x, maxCorner.y - minCorner.y };
    }

    CameraUniform Camera2D::GetUniform() const
    {
        CameraUniform uniform;
        uniform.viewProjection = m_viewProjection;
        uniform.viewSize       = GetViewportSize();
        return uniform;
    }

    CullingUniforms Camera2D::GetCullingUniforms() const
    {
        const WorldRect rect = GetVisibleRect();
        return CullingUniforms::FromRect( rect.x, rect.y, rect.width, rect.height );
    }
} // namespace Batchline
