#include "renderer/TextRun.hpp"

#include <algorithm>

namespace Batchline
{
    static constexpr uint32_t FALLBACK_CODEPOINT = '?';

    const GlyphMetrics* FontMetrics::Find( uint32_t codepoint ) const
    {
        auto it = glyphs.find( codepoint );
        if( it != glyphs.end() )
            return &it->second;

        it = glyphs.find( FALLBACK_CODEPOINT );
        return it != glyphs.end() ? &it->second : nullptr;
    }

    uint32_t TextRun::Layout( std::string_view text, const FontMetrics& font, const TextStyle& style, std::vector<DrawObject>& out )
    {
        uint32_t  emitted = 0;
        glm::vec2 pen     = { 0.0f, 0.0f };

        for( char c: text )
        {
            if( c == '\n' )
            {
                pen.x = 0.0f;
                pen.y += font.lineHeight;
                continue;
            }

            const GlyphMetrics* glyph = font.Find( static_cast<uint8_t>( c ) );
            if( !glyph )
            {
                BL_CORE_TRACE( "TextRun: no glyph for {:#x}, skipped.", static_cast<uint32_t>( static_cast<uint8_t>( c ) ) );
                continue;
            }

            if( glyph->size.x > 0.0f && glyph->size.y > 0.0f )
            {
                DrawObject object;
                object.drawClass                 = DrawClass::GLYPH;
                object.transform.position        = glm::vec3( style.pivot, style.depth );
                object.transform.scale           = glm::vec3( glyph->size, 1.0f );
                object.transform.rotation        = glm::vec3( 0.0f, 0.0f, style.rotation );
                object.transform.pivotOffset     = pen + glyph->bearing;
                object.color                     = style.color;
                object.uv                        = glyph->uv;
                object.glyphScale                = style.scale;
                out.push_back( object );
                ++emitted;
            }

            pen.x += glyph->advance;
        }

        return emitted;
    }

    glm::vec2 TextRun::Measure( std::string_view text, const FontMetrics& font )
    {
        float32_t width    = 0.0f;
        float32_t line     = 0.0f;
        uint32_t  lines    = text.empty() ? 0 : 1;

        for( char c: text )
        {
            if( c == '\n' )
            {
                width = std::max( width, line );
                line  = 0.0f;
                ++lines;
                continue;
            }

            if( const GlyphMetrics* glyph = font.Find( static_cast<uint8_t>( c ) ) )
                line += glyph->advance;
        }

        width = std::max( width, line );
        return { width, lines * font.lineHeight };
    }
} // namespace Batchline
