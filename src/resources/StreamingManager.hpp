#pragma once
#include "core/Base.hpp"
#include "rhi/Buffer.hpp"
#include "rhi/CommandBuffer.hpp"
#include "rhi/Device.hpp"
#include <array>
#include <vector>

namespace Batchline
{
    // Frames the host may record ahead of the GPU
    constexpr uint32_t FRAMES_IN_FLIGHT = 2;

    /**
     * @brief A sub-range of a frame slot's staging heap.
     */
    struct TransientAllocation
    {
        Ref<Buffer>  buffer;
        VkDeviceSize offset     = 0;
        VkDeviceSize size       = 0;
        void*        mappedData = nullptr;

        bool IsValid() const { return buffer != nullptr; }
    };

    struct StreamingConfig
    {
        VkDeviceSize uploadHeapSize   = 4ull << 20;
        VkDeviceSize readbackHeapSize = 64ull << 10;
    };

    /**
     * @brief Per-frame-slot linear staging heaps for host to device uploads and debug readbacks.
     *
     * Copies are recorded into the caller's command buffer, so they are ordered with the rest of the frame.
     * A slot's heap is rewound only after the queue's timeline semaphore passed the value recorded for it by
     * EndFrame(). A heap that runs out is replaced by one twice as large; the old one is kept until the slot
     * comes around again.
     */
    class StreamingManager
    {
    public:
        StreamingManager( Ref<Device> device, const StreamingConfig& config = {} );
        ~StreamingManager();

        Result Init();
        void   Shutdown();

        /**
         * @brief Moves to the next slot and blocks until the GPU retired it.
         * @return The WaitForQueue result (TIMEOUT, DEVICE_DISPATCH_FAILURE) on failure.
         */
        Result BeginFrame( uint64_t timeoutNs = UINT64_MAX );

        // Timeline value signalled by the submission that consumes this slot
        void EndFrame( uint64_t signalValue );

        TransientAllocation AllocateUpload( VkDeviceSize size, VkDeviceSize alignment = 16 );

        Result UploadToBuffer( CommandBuffer& cmd, const Buffer& dst, const void* data, VkDeviceSize size, VkDeviceSize dstOffset = 0 );

        // Uploads tightly packed pixels and leaves the texture in SHADER_READ_ONLY_OPTIMAL
        Result UploadToTexture( CommandBuffer& cmd, Texture& dst, const void* pixels, VkDeviceSize size );

        /**
         * @brief Records a copy of src into the readback heap. Valid once the submission containing cmd completed.
         */
        TransientAllocation CaptureBuffer( CommandBuffer& cmd, const Buffer& src, VkDeviceSize size, VkDeviceSize srcOffset = 0 );

        // Leaves the texture in TRANSFER_SRC_OPTIMAL
        TransientAllocation CaptureTexture( CommandBuffer& cmd, Texture& src, uint32_t bytesPerPixel );

        uint32_t GetFrameIndex() const { return m_frameIndex; }

    private:
        struct Heap
        {
            Ref<Buffer>              buffer;
            VkDeviceSize             offset = 0;
            std::vector<Ref<Buffer>> retired;
        };

        struct FrameSlot
        {
            Heap     upload;
            Heap     readback;
            uint64_t retireValue = 0;
        };

        TransientAllocation Allocate( Heap& heap, BufferType type, VkDeviceSize size, VkDeviceSize alignment );

    private:
        Ref<Device>                               m_device;
        StreamingConfig                           m_config;
        std::array<FrameSlot, FRAMES_IN_FLIGHT>   m_frames;
        uint32_t                                  m_frameIndex = FRAMES_IN_FLIGHT - 1;
    };
} // namespace Batchline
