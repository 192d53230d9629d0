#pragma once
#include "renderer/Types.hpp"

namespace Batchline
{
    /**
     * @brief Word offsets of the instance records consumed by the culling shader and the instanced pipelines.
     *
     * Every stride is a whole number of 32-byte blocks. Words 0-1 always hold the position and words 2-3
     * the size (or the (0,0) point marker). Must stay in sync with assets/shaders.
     */
    namespace InstanceLayout
    {
        constexpr uint32_t BLOCK_WORDS = 8;
        constexpr uint32_t MAX_WORDS   = 16;

        // Explicit shape tags (64-byte layouts only)
        constexpr uint32_t SHAPE_AUTO  = 0;
        constexpr uint32_t SHAPE_POINT = 1;
        constexpr uint32_t SHAPE_AREA  = 2;

        // Marks an absent optional word in CullingUniforms
        constexpr uint32_t NO_WORD = 0xFFFFFFFFu;

        // Shared
        constexpr uint32_t POSITION = 0;
        constexpr uint32_t SIZE     = 2;

        // PRIMITIVE / QUAD (8 words)
        constexpr uint32_t QUAD_COLOR = 4;

        // SPRITE / GLYPH (16 words)
        constexpr uint32_t ROTATION = 4;
        constexpr uint32_t SHAPE    = 5;
        constexpr uint32_t MARGIN   = 6;
        constexpr uint32_t EXTRA    = 7; // SPRITE: depth, GLYPH: scale
        constexpr uint32_t COLOR    = 8;

        constexpr uint32_t SPRITE_UV_OFFSET = 12;
        constexpr uint32_t SPRITE_UV_SCALE  = 14;

        constexpr uint32_t GLYPH_PIVOT_OFFSET = 12;
        constexpr uint32_t GLYPH_UV_OFFSET    = 14; // unorm16x2
        constexpr uint32_t GLYPH_UV_SCALE     = 15; // unorm16x2

        constexpr uint32_t StrideWords( DrawClass drawClass )
        {
            return ( drawClass == DrawClass::SPRITE || drawClass == DrawClass::GLYPH ) ? 2 * BLOCK_WORDS : BLOCK_WORDS;
        }

        constexpr uint32_t StrideBytes( DrawClass drawClass )
        {
            return StrideWords( drawClass ) * sizeof( uint32_t );
        }

        constexpr uint32_t ShapeWord( DrawClass drawClass )
        {
            return StrideWords( drawClass ) > BLOCK_WORDS ? SHAPE : NO_WORD;
        }

        constexpr uint32_t MarginWord( DrawClass drawClass )
        {
            return StrideWords( drawClass ) > BLOCK_WORDS ? MARGIN : NO_WORD;
        }

        static_assert( StrideBytes( DrawClass::QUAD ) == 32 );
        static_assert( StrideBytes( DrawClass::SPRITE ) == 64 );
    } // namespace InstanceLayout

    /**
     * @brief One encoded instance. Only the first StrideWords( drawClass ) words are meaningful.
     */
    struct InstanceRecord
    {
        DrawClass                                       drawClass = DrawClass::QUAD;
        std::array<uint32_t, InstanceLayout::MAX_WORDS> words     = {};

        uint32_t        StrideWords() const { return InstanceLayout::StrideWords( drawClass ); }
        const uint32_t* Data() const { return words.data(); }

        float32_t GetFloat( uint32_t word ) const;
        void      SetFloat( uint32_t word, float32_t value );
        glm::vec2 GetVec2( uint32_t word ) const;
        void      SetVec2( uint32_t word, const glm::vec2& value );
        glm::vec4 GetVec4( uint32_t word ) const;
        void      SetVec4( uint32_t word, const glm::vec4& value );
    };
} // namespace Batchline
