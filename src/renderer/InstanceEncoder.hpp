#pragma once
#include "renderer/InstanceLayout.hpp"

namespace Batchline
{
    /**
     * @brief Packs draw requests into the fixed-stride instance records of their draw class.
     *
     * Stateless. PRIMITIVE and QUAD share the 32-byte (position, size, color) layout, PRIMITIVE always
     * writing the (0,0) point marker. SPRITE and GLYPH use two blocks and carry an explicit shape tag plus a
     * conservative cull margin covering their rotation.
     */
    class InstanceEncoder
    {
    public:
        /**
         * @brief Encodes one object.
         * @return INVALID_OBJECT if a required UV region is missing or the transform is not finite.
         */
        static Result Encode( const DrawObject& object, InstanceRecord& out );

        /**
         * @brief Rebuilds the draw request a record was encoded from.
         * Fields the class does not store come back as defaults. GLYPH UVs are quantized to 1/65535.
         */
        static Result Decode( const InstanceRecord& record, DrawObject& out );

        static float32_t ComputeSpriteMargin( const glm::vec2& size, float32_t rotation );
        static float32_t ComputeGlyphMargin( const glm::vec2& pivotOffset, const glm::vec2& size, float32_t scale );

        static uint32_t  PackUnorm16x2( const glm::vec2& value );
        static glm::vec2 UnpackUnorm16x2( uint32_t packed );
    };
} // namespace Batchline
