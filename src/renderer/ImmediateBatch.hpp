#pragma once
#include "renderer/RendererConfig.hpp"

namespace Batchline
{
    /**
     * @brief Vertex of the immediate pipeline. Matches the layout of shaders/graphics/immediate.vert.
     */
    struct ImmediateVertex
    {
        glm::vec2 position;
        glm::vec2 uv;
        glm::vec4 color;
    };
    static_assert( sizeof( ImmediateVertex ) == 32 );

    /**
     * @brief CPU-built indexed triangles drawn after the instanced classes. Not culled.
     * For debug overlays and shapes that do not fit an instance layout.
     */
    class ImmediateBatch
    {
    public:
        explicit ImmediateBatch( const ImmediateConfig& config = {} );

        Result FillRect( const glm::vec2& position, const glm::vec2& size, const Color& color );
        Result DrawLine( const glm::vec2& from, const glm::vec2& to, float32_t thickness, const Color& color );
        // Outline of the rect, thickness centered on its edges
        Result StrokeRect( const glm::vec2& position, const glm::vec2& size, float32_t thickness, const Color& color );
        Result DrawTriangle( const glm::vec2& a, const glm::vec2& b, const glm::vec2& c, const Color& color );

        void Clear();

        bool IsEmpty() const { return m_indices.empty(); }

        uint32_t GetVertexCount() const { return static_cast<uint32_t>( m_vertices.size() ); }
        uint32_t GetIndexCount() const { return static_cast<uint32_t>( m_indices.size() ); }

        const std::vector<ImmediateVertex>& GetVertices() const { return m_vertices; }
        const std::vector<uint32_t>&        GetIndices() const { return m_indices; }

    private:
        Result Reserve( uint32_t vertexCount );
        Result PushQuad( const glm::vec2 corners[ 4 ], const glm::vec4& color );

    private:
        ImmediateConfig              m_config;
        std::vector<ImmediateVertex> m_vertices;
        std::vector<uint32_t>        m_indices;
    };
} // namespace Batchline
