#pragma once
#include "renderer/Types.hpp"
#include <array>

namespace Batchline
{
    class Buffer;
    class CommandBuffer;
    class Device;

    /**
     * @brief Owns the indirect argument block of every draw class.
     *
     * Each block is reset to { vertexCount, 0, 0, 0 } before the class is culled; the culling pass then bumps
     * instanceCount once per visible instance and the draw consumes the block as-is. The count stays on the GPU.
     */
    class IndirectDrawAssembler
    {
    public:
        IndirectDrawAssembler() = default;

        Result Init( const Ref<Device>& device );
        void   Shutdown();

        static IndirectDrawArgs MakeResetArgs( uint32_t vertexCount );

        /**
         * @brief Records the reset and makes it visible to the culling shader.
         * Waits for the previous frame's indirect read of the same block first.
         */
        Result RecordReset( CommandBuffer& cmd, DrawClass drawClass, uint32_t vertexCount ) const;

        // One vkCmdDrawIndirect of a single command
        Result RecordDraw( CommandBuffer& cmd, DrawClass drawClass ) const;

        const Ref<Buffer>& GetArgsBuffer( DrawClass drawClass ) const { return m_argsBuffers[ ToIndex( drawClass ) ]; }

    private:
        std::array<Ref<Buffer>, DRAW_CLASS_COUNT> m_argsBuffers;
    };
} // namespace Batchline
