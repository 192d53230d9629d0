#pragma once
#include "core/Base.hpp"
#include <array>
#include <glm/glm.hpp>
#include <optional>

namespace Batchline
{
    /**
     * @brief The instanced draw classes. Each one owns a batch, an indirect argument block and a pipeline.
     */
    enum class DrawClass : uint32_t
    {
        PRIMITIVE = 0,
        QUAD,
        SPRITE,
        GLYPH,
        _MAX_ENUM
    };

    constexpr uint32_t DRAW_CLASS_COUNT = static_cast<uint32_t>( DrawClass::_MAX_ENUM );

    constexpr std::array<DrawClass, DRAW_CLASS_COUNT> ALL_DRAW_CLASSES = { DrawClass::PRIMITIVE, DrawClass::QUAD, DrawClass::SPRITE,
                                                                           DrawClass::GLYPH };

    inline uint32_t ToIndex( DrawClass drawClass )
    {
        return static_cast<uint32_t>( drawClass );
    }

    inline std::string_view toString( DrawClass drawClass )
    {
        switch( drawClass )
        {
            case DrawClass::PRIMITIVE:
                return "PRIMITIVE";
            case DrawClass::QUAD:
                return "QUAD";
            case DrawClass::SPRITE:
                return "SPRITE";
            case DrawClass::GLYPH:
                return "GLYPH";
            default:
                return "UNKNOWN";
        }
    }

    struct Color
    {
        float32_t r = 0.0f;
        float32_t g = 0.0f;
        float32_t b = 0.0f;
        float32_t a = 1.0f;

        static constexpr Color RGB( float32_t r, float32_t g, float32_t b ) { return Color{ r, g, b, 1.0f }; }
        static constexpr Color RGBA( float32_t r, float32_t g, float32_t b, float32_t a ) { return Color{ r, g, b, a }; }

        glm::vec4 ToVec4() const { return glm::vec4( r, g, b, a ); }

        bool operator==( const Color& other ) const = default;
    };

    namespace Colors
    {
        inline constexpr Color Red     = Color::RGB( 1.0f, 0.0f, 0.0f );
        inline constexpr Color Green   = Color::RGB( 0.0f, 1.0f, 0.0f );
        inline constexpr Color Blue    = Color::RGB( 0.0f, 0.0f, 1.0f );
        inline constexpr Color White   = Color::RGB( 1.0f, 1.0f, 1.0f );
        inline constexpr Color Black   = Color::RGB( 0.0f, 0.0f, 0.0f );
        inline constexpr Color Yellow  = Color::RGB( 1.0f, 1.0f, 0.0f );
        inline constexpr Color Cyan    = Color::RGB( 0.0f, 1.0f, 1.0f );
        inline constexpr Color Magenta = Color::RGB( 1.0f, 0.0f, 1.0f );
        inline constexpr Color Gray    = Color::RGB( 0.5f, 0.5f, 0.5f );
        inline constexpr Color Orange  = Color::RGB( 1.0f, 0.65f, 0.0f );
        inline constexpr Color Purple  = Color::RGB( 0.5f, 0.0f, 0.5f );
        inline constexpr Color Brown   = Color::RGB( 0.6f, 0.3f, 0.0f );
        inline constexpr Color Pink    = Color::RGB( 1.0f, 0.75f, 0.8f );
    } // namespace Colors

    /**
     * @brief Sub-rectangle of the shared atlas in normalized [0,1] space.
     */
    struct UVRegion
    {
        glm::vec2 offset = { 0.0f, 0.0f };
        glm::vec2 scale  = { 1.0f, 1.0f };
    };

    /**
     * @brief Sub-rectangle of the atlas in pixels.
     */
    struct AtlasRegion
    {
        uint32_t x = 0;
        uint32_t y = 0;
        uint32_t w = 0;
        uint32_t h = 0;

        UVRegion ToUV( uint32_t atlasWidth, uint32_t atlasHeight ) const;
    };

    struct Transform
    {
        glm::vec3 position = { 0.0f, 0.0f, 0.0f };
        glm::vec3 scale    = { 1.0f, 1.0f, 1.0f };
        // Euler angles in radians. Only z is consumed by the 2D pipelines.
        glm::vec3 rotation = { 0.0f, 0.0f, 0.0f };
        // Glyphs: offset of the glyph's top-left corner from the shared pivot (position), unscaled.
        glm::vec2 pivotOffset = { 0.0f, 0.0f };
    };

    /**
     * @brief A draw request as handed over by the scene layer.
     * For QUAD, SPRITE and GLYPH the scale is the size in world units. PRIMITIVE ignores it.
     */
    struct DrawObject
    {
        DrawClass               drawClass = DrawClass::QUAD;
        Transform               transform;
        Color                   color = Colors::White;
        std::optional<UVRegion> uv;
        float32_t               glyphScale = 1.0f;
    };

    /**
     * @brief Mirrors VkDrawIndirectCommand.
     */
    struct IndirectDrawArgs
    {
        uint32_t vertexCount   = 0;
        uint32_t instanceCount = 0;
        uint32_t firstVertex   = 0;
        uint32_t firstInstance = 0;
    };
    static_assert( sizeof( IndirectDrawArgs ) == 16 );

    /**
     * @brief std140 camera block bound at set 0, binding 0 of every pipeline.
     */
    struct CameraUniform
    {
        glm::mat4 viewProjection = glm::mat4( 1.0f );
        glm::vec2 viewSize       = { 0.0f, 0.0f };
        glm::vec2 _pad           = { 0.0f, 0.0f };
    };
    static_assert( sizeof( CameraUniform ) == 80 );

} // namespace Batchline
