#pragma once
#include "renderer/Types.hpp"
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Batchline
{
    /**
     * @brief Placement of one glyph in the atlas, in unscaled font pixels.
     */
    struct GlyphMetrics
    {
        UVRegion  uv;
        glm::vec2 size    = { 0.0f, 0.0f };
        // Top-left corner relative to the pen position on the baseline
        glm::vec2 bearing = { 0.0f, 0.0f };
        float32_t advance = 0.0f;
    };

    struct FontMetrics
    {
        std::unordered_map<uint32_t, GlyphMetrics> glyphs;
        float32_t                                  lineHeight = 16.0f;

        const GlyphMetrics* Find( uint32_t codepoint ) const;
    };

    struct TextStyle
    {
        glm::vec2 pivot    = { 0.0f, 0.0f };
        float32_t scale    = 1.0f;
        float32_t rotation = 0.0f;
        Color     color    = Colors::White;
        float32_t depth    = 0.0f;
    };

    /**
     * @brief Lays a string out as GLYPH draw objects that share one pivot.
     * Every glyph keeps its offset from the pivot so the whole run rotates and scales as a unit.
     */
    class TextRun
    {
    public:
        /**
         * @brief Appends one GLYPH object per visible character to out.
         * '\n' starts a new line. Glyphs without area only advance the pen. Unknown characters use '?'
         * when the font has it and are skipped otherwise.
         * @return Number of objects appended.
         */
        static uint32_t Layout( std::string_view text, const FontMetrics& font, const TextStyle& style, std::vector<DrawObject>& out );

        /**
         * @brief Unscaled extent of the laid out text.
         */
        static glm::vec2 Measure( std::string_view text, const FontMetrics& font );
    };
} // namespace Batchline
