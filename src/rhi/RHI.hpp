#pragma once

#include "core/Base.hpp"
#include "rhi/Device.hpp"
#include <volk.h>

namespace Batchline
{
    struct RHIConfig
    {
        bool_t enableValidation = false;
    };

    /**
     * @brief Process-wide Vulkan instance. Loads volk, creates the instance and lists adapters.
     */
    class RHI
    {
    public:
        static Result Init( RHIConfig config );
        static void   Shutdown();

        // Returns nullptr if the adapter is missing or lacks Vulkan 1.3
        static Ref<Device> CreateDevice( uint32_t adapterIndex );
        static void        DestroyDevice( Ref<Device> device );

        static bool_t     IsInitialized() { return s_initialized; }
        static VkInstance GetInstance() { return s_instance; }
        static uint32_t   GetAdapterCount() { return static_cast<uint32_t>( s_physicalDevices.size() ); }

    private:
        static Result CreateInstance( bool_t enableValidation );
        static void   SetupDebugMessenger();
        static void   EnumeratePhysicalDevices();

    private:
        static VkInstance                    s_instance;
        static VkDebugUtilsMessengerEXT      s_debugMessenger;
        static std::vector<VkPhysicalDevice> s_physicalDevices;
        static bool_t                        s_initialized;
        static RHIConfig                     s_config;
    };
} // namespace Batchline
