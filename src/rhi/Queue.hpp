#pragma once

#include "core/Base.hpp"
#include <mutex>
#include <volk.h>

namespace Batchline
{
    enum class QueueType
    {
        GRAPHICS,
        COMPUTE,
        TRANSFER,
        _MAX_ENUM,
    };

    /**
     * @brief A device queue with its own timeline semaphore.
     * Every submission signals the next timeline value, which is what the host waits on. No fences.
     */
    class Queue
    {
    public:
        Queue( VkDevice device, const VolkDeviceTable& api, uint32_t queueFamilyIndex, QueueType type );
        ~Queue();

        Queue( const Queue& )            = delete;
        Queue& operator=( const Queue& ) = delete;

        /**
         * @brief Submits with vkQueueSubmit2.
         * @param outSignalValue Timeline value signalled when the work completes.
         * @return DEVICE_DISPATCH_FAILURE on device loss, FAIL on other errors.
         */
        Result Submit( VkCommandBuffer commandBuffer, uint64_t& outSignalValue );

        VkQueue     GetHandle() const { return m_queue; }
        uint32_t    GetFamilyIndex() const { return m_queueFamilyIndex; }
        QueueType   GetType() const { return m_type; }
        VkSemaphore GetTimelineSemaphore() const { return m_timelineSemaphore; }

    private:
        VkDevice               m_device;
        const VolkDeviceTable& m_api;
        VkQueue                m_queue = VK_NULL_HANDLE;
        uint32_t               m_queueFamilyIndex;
        QueueType              m_type;
        std::mutex             m_mutex;

        VkSemaphore m_timelineSemaphore = VK_NULL_HANDLE;
        uint64_t    m_nextValue         = 1;
    };
} // namespace Batchline
