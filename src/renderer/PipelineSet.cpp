#include "renderer/PipelineSet.hpp"

#include "renderer/ImmediateBatch.hpp"
#include "renderer/InstanceLayout.hpp"
#include "rhi/Device.hpp"
#include <cstddef>
#include <stdexcept>

namespace Batchline
{
    static constexpr uint32_t INSTANCE_BINDING = 1;
    // Locations 0-2 belong to the unit quad
    static constexpr uint32_t FIRST_INSTANCE_LOCATION = 3;

    static uint32_t WordOffset( uint32_t word )
    {
        return word * sizeof( uint32_t );
    }

    const std::array<QuadVertex, QUAD_VERTEX_COUNT>& PipelineSet::GetUnitQuad()
    {
        static const glm::vec4                                 white = { 1.0f, 1.0f, 1.0f, 1.0f };
        static const std::array<QuadVertex, QUAD_VERTEX_COUNT> quad  = { {
            { { 0.0f, 0.0f }, { 0.0f, 0.0f }, white },
            { { 1.0f, 0.0f }, { 1.0f, 0.0f }, white },
            { { 0.0f, 1.0f }, { 0.0f, 1.0f }, white },
            { { 0.0f, 1.0f }, { 0.0f, 1.0f }, white },
            { { 1.0f, 0.0f }, { 1.0f, 0.0f }, white },
            { { 1.0f, 1.0f }, { 1.0f, 1.0f }, white },
        } };
        return quad;
    }

    VertexBindingDesc PipelineSet::GetQuadVertexBinding()
    {
        VertexBindingDesc binding;
        binding.binding    = 0;
        binding.stride     = sizeof( QuadVertex );
        binding.inputRate  = VK_VERTEX_INPUT_RATE_VERTEX;
        binding.attributes = {
            { 0, VK_FORMAT_R32G32_SFLOAT, offsetof( QuadVertex, position ) },
            { 1, VK_FORMAT_R32G32_SFLOAT, offsetof( QuadVertex, uv ) },
            { 2, VK_FORMAT_R32G32B32A32_SFLOAT, offsetof( QuadVertex, color ) },
        };
        return binding;
    }

    VertexBindingDesc PipelineSet::GetInstanceBinding( DrawClass drawClass )
    {
        using namespace InstanceLayout;

        VertexBindingDesc binding;
        binding.binding   = INSTANCE_BINDING;
        binding.stride    = StrideBytes( drawClass );
        binding.inputRate = VK_VERTEX_INPUT_RATE_INSTANCE;

        const uint32_t loc = FIRST_INSTANCE_LOCATION;
        switch( drawClass )
        {
            case DrawClass::PRIMITIVE:
            case DrawClass::QUAD:
                binding.attributes = {
                    { loc + 0, VK_FORMAT_R32G32_SFLOAT, WordOffset( POSITION ) },
                    { loc + 1, VK_FORMAT_R32G32_SFLOAT, WordOffset( SIZE ) },
                    { loc + 2, VK_FORMAT_R32G32B32A32_SFLOAT, WordOffset( QUAD_COLOR ) },
                };
                break;

            case DrawClass::SPRITE:
                binding.attributes = {
                    { loc + 0, VK_FORMAT_R32G32_SFLOAT, WordOffset( POSITION ) },
                    { loc + 1, VK_FORMAT_R32G32_SFLOAT, WordOffset( SIZE ) },
                    { loc + 2, VK_FORMAT_R32_SFLOAT, WordOffset( ROTATION ) },
                    { loc + 3, VK_FORMAT_R32_SFLOAT, WordOffset( EXTRA ) },
                    { loc + 4, VK_FORMAT_R32G32B32A32_SFLOAT, WordOffset( COLOR ) },
                    { loc + 5, VK_FORMAT_R32G32_SFLOAT, WordOffset( SPRITE_UV_OFFSET ) },
                    { loc + 6, VK_FORMAT_R32G32_SFLOAT, WordOffset( SPRITE_UV_SCALE ) },
                };
                break;

            case DrawClass::GLYPH:
                binding.attributes = {
                    { loc + 0, VK_FORMAT_R32G32_SFLOAT, WordOffset( POSITION ) },
                    { loc + 1, VK_FORMAT_R32G32_SFLOAT, WordOffset( SIZE ) },
                    { loc + 2, VK_FORMAT_R32_SFLOAT, WordOffset( ROTATION ) },
                    { loc + 3, VK_FORMAT_R32_SFLOAT, WordOffset( EXTRA ) },
                    { loc + 4, VK_FORMAT_R32G32B32A32_SFLOAT, WordOffset( COLOR ) },
                    { loc + 5, VK_FORMAT_R32G32_SFLOAT, WordOffset( GLYPH_PIVOT_OFFSET ) },
                    { loc + 6, VK_FORMAT_R16G16_UNORM, WordOffset( GLYPH_UV_OFFSET ) },
                    { loc + 7, VK_FORMAT_R16G16_UNORM, WordOffset( GLYPH_UV_SCALE ) },
                };
                break;

            default:
                break;
        }
        return binding;
    }

    VertexBindingDesc PipelineSet::GetImmediateVertexBinding()
    {
        VertexBindingDesc binding;
        binding.binding    = 0;
        binding.stride     = sizeof( ImmediateVertex );
        binding.inputRate  = VK_VERTEX_INPUT_RATE_VERTEX;
        binding.attributes = {
            { 0, VK_FORMAT_R32G32_SFLOAT, offsetof( ImmediateVertex, position ) },
            { 1, VK_FORMAT_R32G32_SFLOAT, offsetof( ImmediateVertex, uv ) },
            { 2, VK_FORMAT_R32G32B32A32_SFLOAT, offsetof( ImmediateVertex, color ) },
        };
        return binding;
    }

    Ref<GraphicsPipeline> PipelineSet::CreatePipeline( const Ref<Device>& device, const std::string& name,
                                                       std::vector<VertexBindingDesc> bindings, VkFormat colorFormat )
    {
        GraphicsPipelineDesc desc;
        desc.vertexShader           = device->CreateShader( "shaders/graphics/" + name + ".vert" );
        desc.fragmentShader         = device->CreateShader( "shaders/graphics/" + name + ".frag" );
        desc.vertexBindings         = std::move( bindings );
        desc.colorAttachmentFormats = { colorFormat };

        if( !desc.vertexShader || !desc.fragmentShader )
        {
            BL_CORE_ERROR( "PipelineSet: shaders of '{}' failed to compile.", name );
            return nullptr;
        }

        Ref<GraphicsPipeline> pipeline = device->CreateGraphicsPipeline( desc );
        if( !pipeline )
        {
            BL_CORE_ERROR( "PipelineSet: pipeline '{}' could not be created.", name );
        }
        return pipeline;
    }

    Result PipelineSet::Init( const Ref<Device>& device, VkFormat colorFormat )
    {
        try
        {
            m_quad      = CreatePipeline( device, "quad", { GetQuadVertexBinding(), GetInstanceBinding( DrawClass::QUAD ) }, colorFormat );
            m_sprite    = CreatePipeline( device, "sprite", { GetQuadVertexBinding(), GetInstanceBinding( DrawClass::SPRITE ) }, colorFormat );
            m_glyph     = CreatePipeline( device, "glyph", { GetQuadVertexBinding(), GetInstanceBinding( DrawClass::GLYPH ) }, colorFormat );
            m_immediate = CreatePipeline( device, "immediate", { GetImmediateVertexBinding() }, colorFormat );
        }
        catch( const std::runtime_error& e )
        {
            BL_CORE_ERROR( "PipelineSet: {}", e.what() );
            Shutdown();
            return Result::FAIL;
        }

        if( !m_quad || !m_sprite || !m_glyph || !m_immediate )
        {
            Shutdown();
            return Result::FAIL;
        }

        BL_CORE_INFO( "PipelineSet: 4 graphics pipelines ready." );
        return Result::SUCCESS;
    }

    void PipelineSet::Shutdown()
    {
        m_quad.reset();
        m_sprite.reset();
        m_glyph.reset();
        m_immediate.reset();
    }

    const Ref<GraphicsPipeline>& PipelineSet::Get( DrawClass drawClass ) const
    {
        switch( drawClass )
        {
            case DrawClass::SPRITE:
                return m_sprite;
            case DrawClass::GLYPH:
                return m_glyph;
            default:
                return m_quad;
        }
    }
} // namespace Batchline
