#include "rhi/RHI.hpp"

namespace Batchline
{
    VkInstance                    RHI::s_instance        = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT      RHI::s_debugMessenger  = VK_NULL_HANDLE;
    std::vector<VkPhysicalDevice> RHI::s_physicalDevices = {};
    bool_t                        RHI::s_initialized     = false;
    RHIConfig                     RHI::s_config          = {};

    static VKAPI_ATTR VkBool32 VKAPI_CALL DebugCallback( VkDebugUtilsMessageSeverityFlagBitsEXT      messageSeverity,
                                                         VkDebugUtilsMessageTypeFlagsEXT             messageType,
                                                         const VkDebugUtilsMessengerCallbackDataEXT* pCallbackData, void* pUserData )
    {
        ( void )messageType;
        ( void )pUserData;
        if( messageSeverity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT )
        {
            BL_CORE_ERROR( "Validation: {0}", pCallbackData->pMessage );
        }
        else
        {
            BL_CORE_WARN( "Validation: {0}", pCallbackData->pMessage );
        }
        return VK_FALSE;
    }

    Result RHI::Init( RHIConfig config )
    {
        if( s_initialized )
        {
            BL_CORE_WARN( "RHI already initialized!" );
            return Result::SUCCESS;
        }

        if( volkInitialize() != VK_SUCCESS )
        {
            BL_CORE_ERROR( "Failed to initialize volk, no Vulkan loader found." );
            return Result::FAIL;
        }

        s_config = config;
        if( CreateInstance( s_config.enableValidation ) != Result::SUCCESS )
        {
            BL_CORE_ERROR( "Failed to create Vulkan instance!" );
            volkFinalize();
            return Result::FAIL;
        }
        volkLoadInstance( s_instance );

        if( s_config.enableValidation )
        {
            SetupDebugMessenger();
        }

        EnumeratePhysicalDevices();

        BL_CORE_INFO( "Vulkan RHI initialized with {} physical device(s).", s_physicalDevices.size() );
        s_initialized = true;
        return Result::SUCCESS;
    }

    void RHI::Shutdown()
    {
        if( !s_initialized )
        {
            return;
        }

        if( s_debugMessenger != VK_NULL_HANDLE )
        {
            vkDestroyDebugUtilsMessengerEXT( s_instance, s_debugMessenger, nullptr );
            s_debugMessenger = VK_NULL_HANDLE;
        }
        s_physicalDevices.clear();

        if( s_instance != VK_NULL_HANDLE )
        {
            vkDestroyInstance( s_instance, nullptr );
            s_instance = VK_NULL_HANDLE;
        }
        volkFinalize();
        s_initialized = false;
        BL_CORE_INFO( "Vulkan RHI shutdown complete." );
    }

    Ref<Device> RHI::CreateDevice( uint32_t adapterIndex )
    {
        if( !s_initialized )
        {
            BL_CORE_ERROR( "RHI not initialized! Cannot create device." );
            return nullptr;
        }

        if( adapterIndex >= s_physicalDevices.size() )
        {
            BL_CORE_ERROR( "Invalid adapter index: {}. Only {} physical devices available.", adapterIndex, s_physicalDevices.size() );
            return nullptr;
        }

        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties( s_physicalDevices[ adapterIndex ], &props );
        if( props.apiVersion < VK_API_VERSION_1_3 )
        {
            BL_CORE_ERROR( "Adapter '{}' only supports Vulkan {}.{}, 1.3 is required.", props.deviceName, VK_API_VERSION_MAJOR( props.apiVersion ),
                           VK_API_VERSION_MINOR( props.apiVersion ) );
            return nullptr;
        }

        auto device = CreateRef<Device>( s_physicalDevices[ adapterIndex ] );
        if( device->Init() != Result::SUCCESS )
        {
            BL_CORE_ERROR( "Failed to initialize device for adapter index: {}.", adapterIndex );
            return nullptr;
        }

        return device;
    }

    void RHI::DestroyDevice( Ref<Device> device )
    {
        if( device )
        {
            device->Shutdown();
        }
    }

    Result RHI::CreateInstance( bool_t enableValidation )
    {
        VkApplicationInfo appInfo = { VK_STRUCTURE_TYPE_APPLICATION_INFO };
        appInfo.pApplicationName  = "Batchline";
        appInfo.pEngineName       = "Batchline";
        appInfo.apiVersion        = VK_API_VERSION_1_3;

        std::vector<const char*> extensions;
        std::vector<const char*> layers;
        if( enableValidation )
        {
            extensions.push_back( VK_EXT_DEBUG_UTILS_EXTENSION_NAME );
            layers.push_back( "VK_LAYER_KHRONOS_validation" );
        }

        VkInstanceCreateInfo createInfo    = { VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO };
        createInfo.pApplicationInfo        = &appInfo;
        createInfo.enabledExtensionCount   = static_cast<uint32_t>( extensions.size() );
        createInfo.ppEnabledExtensionNames = extensions.data();
        createInfo.enabledLayerCount       = static_cast<uint32_t>( layers.size() );
        createInfo.ppEnabledLayerNames     = layers.data();

        return vkCreateInstance( &createInfo, nullptr, &s_instance ) == VK_SUCCESS ? Result::SUCCESS : Result::FAIL;
    }

    void RHI::SetupDebugMessenger()
    {
        VkDebugUtilsMessengerCreateInfoEXT createInfo = { VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT };
        createInfo.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
        createInfo.messageType     = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT;
        createInfo.pfnUserCallback = DebugCallback;

        if( vkCreateDebugUtilsMessengerEXT == nullptr ||
            vkCreateDebugUtilsMessengerEXT( s_instance, &createInfo, nullptr, &s_debugMessenger ) != VK_SUCCESS )
        {
            BL_CORE_WARN( "Validation requested but the debug messenger could not be created." );
            s_debugMessenger = VK_NULL_HANDLE;
        }
    }

    void RHI::EnumeratePhysicalDevices()
    {
        uint32_t count = 0;
        vkEnumeratePhysicalDevices( s_instance, &count, nullptr );
        if( count == 0 )
        {
            BL_CORE_WARN( "No Vulkan GPUs found." );
            return;
        }

        s_physicalDevices.resize( count );
        vkEnumeratePhysicalDevices( s_instance, &count, s_physicalDevices.data() );

        for( const auto& device: s_physicalDevices )
        {
            VkPhysicalDeviceProperties props;
            vkGetPhysicalDeviceProperties( device, &props );
            BL_CORE_INFO( "  - {0} (API: {1}.{2})", props.deviceName, VK_API_VERSION_MAJOR( props.apiVersion ), VK_API_VERSION_MINOR( props.apiVersion ) );
        }
    }
} // namespace Batchline
