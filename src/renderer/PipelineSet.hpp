#pragma once
#include "renderer/Types.hpp"
#include "rhi/Pipeline.hpp"
#include <array>

namespace Batchline
{
    class Device;

    /**
     * @brief Corner of the static unit quad shared by the instanced pipelines (vertex binding 0).
     */
    struct QuadVertex
    {
        glm::vec2 position;
        glm::vec2 uv;
        glm::vec4 color;
    };
    static_assert( sizeof( QuadVertex ) == 32 );

    constexpr uint32_t QUAD_VERTEX_COUNT = 6;

    /**
     * @brief The graphics pipelines of the instanced classes plus the immediate pipeline.
     *
     * PRIMITIVE and QUAD share one pipeline. Every pipeline keeps the camera uniform at set 0, binding 0;
     * SPRITE and GLYPH sample the atlas at set 1, binding 0. Built once; camera changes only rewrite the uniform.
     */
    class PipelineSet
    {
    public:
        PipelineSet() = default;

        /**
         * @return FAIL if a shader is missing or does not compile, or a pipeline cannot be created.
         */
        Result Init( const Ref<Device>& device, VkFormat colorFormat );
        void   Shutdown();

        const Ref<GraphicsPipeline>& Get( DrawClass drawClass ) const;
        const Ref<GraphicsPipeline>& GetImmediate() const { return m_immediate; }

        static const std::array<QuadVertex, QUAD_VERTEX_COUNT>& GetUnitQuad();

        static VertexBindingDesc GetQuadVertexBinding();
        static VertexBindingDesc GetInstanceBinding( DrawClass drawClass );
        static VertexBindingDesc GetImmediateVertexBinding();

        static bool UsesAtlas( DrawClass drawClass ) { return drawClass == DrawClass::SPRITE || drawClass == DrawClass::GLYPH; }

    private:
        Ref<GraphicsPipeline> CreatePipeline( const Ref<Device>& device, const std::string& name, std::vector<VertexBindingDesc> bindings,
                                              VkFormat colorFormat );

    private:
        Ref<GraphicsPipeline> m_quad;
        Ref<GraphicsPipeline> m_sprite;
        Ref<GraphicsPipeline> m_glyph;
        Ref<GraphicsPipeline> m_immediate;
    };
} // namespace Batchline
