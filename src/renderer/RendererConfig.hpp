#pragma once
#include "renderer/Types.hpp"
#include <array>

namespace Batchline
{
    struct BatchConfig
    {
        // Instances allocated on first use. Grows by doubling.
        uint32_t initialCapacity = 512;
        // Hard cap. Pushing past it fails with BUFFER_OVERFLOW and the class is not drawn that frame.
        uint32_t maxInstances = 1u << 20;
    };

    struct ImmediateConfig
    {
        uint32_t initialVertexCapacity = 1024;
        uint32_t maxVertices           = 1u << 18;
    };

    struct RendererConfig
    {
        std::array<BatchConfig, DRAW_CLASS_COUNT> batches;
        ImmediateConfig                           immediate;

        // Must match local_size_x of cull_instances.comp
        uint32_t cullWorkgroupSize = 64;
        // Two triangles per instance
        uint32_t verticesPerInstance = 6;

        const BatchConfig& GetBatchConfig( DrawClass drawClass ) const { return batches[ ToIndex( drawClass ) ]; }
        BatchConfig&       GetBatchConfig( DrawClass drawClass ) { return batches[ ToIndex( drawClass ) ]; }
    };
} // namespace Batchline
