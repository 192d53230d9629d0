#include "rhi/Queue.hpp"

namespace Batchline
{
    Queue::Queue( VkDevice device, const VolkDeviceTable& api, uint32_t queueFamilyIndex, QueueType type )
        : m_device( device )
        , m_api( api )
        , m_queueFamilyIndex( queueFamilyIndex )
        , m_type( type )
    {
        m_api.vkGetDeviceQueue( m_device, m_queueFamilyIndex, 0, &m_queue );

        VkSemaphoreTypeCreateInfo timelineCreateInfo = { VK_STRUCTURE_TYPE_SEMAPHORE_TYPE_CREATE_INFO };
        timelineCreateInfo.semaphoreType             = VK_SEMAPHORE_TYPE_TIMELINE;
        timelineCreateInfo.initialValue              = 0;

        VkSemaphoreCreateInfo createInfo = { VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO };
        createInfo.pNext                 = &timelineCreateInfo;

        VkResult result = m_api.vkCreateSemaphore( m_device, &createInfo, nullptr, &m_timelineSemaphore );
        if( result != VK_SUCCESS )
        {
            BL_CORE_CRITICAL( "Failed to create timeline semaphore for queue family {}! Error: {}", m_queueFamilyIndex, ( int )result );
            m_timelineSemaphore = VK_NULL_HANDLE;
        }
    }

    Queue::~Queue()
    {
        if( m_timelineSemaphore != VK_NULL_HANDLE )
        {
            m_api.vkDestroySemaphore( m_device, m_timelineSemaphore, nullptr );
        }
    }

    Result Queue::Submit( VkCommandBuffer commandBuffer, uint64_t& outSignalValue )
    {
        std::lock_guard<std::mutex> lock( m_mutex );

        VkCommandBufferSubmitInfo cmdInfo = { VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO };
        cmdInfo.commandBuffer             = commandBuffer;

        const uint64_t signalValue = m_nextValue;

        VkSemaphoreSubmitInfo signalInfo = { VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO };
        signalInfo.semaphore             = m_timelineSemaphore;
        signalInfo.value                 = signalValue;
        signalInfo.stageMask             = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;

        VkSubmitInfo2 submitInfo            = { VK_STRUCTURE_TYPE_SUBMIT_INFO_2 };
        submitInfo.commandBufferInfoCount   = 1;
        submitInfo.pCommandBufferInfos      = &cmdInfo;
        submitInfo.signalSemaphoreInfoCount = 1;
        submitInfo.pSignalSemaphoreInfos    = &signalInfo;

        VkResult result = m_api.vkQueueSubmit2( m_queue, 1, &submitInfo, VK_NULL_HANDLE );
        if( result != VK_SUCCESS )
        {
            BL_CORE_CRITICAL( "vkQueueSubmit2 failed! Error: {}", ( int )result );
            return result == VK_ERROR_DEVICE_LOST ? Result::DEVICE_DISPATCH_FAILURE : Result::FAIL;
        }

        // Only consume the value once the submission is accepted
        ++m_nextValue;
        outSignalValue = signalValue;
        return Result::SUCCESS;
    }
} // namespace Batchline
