#pragma once
#include "core/Base.hpp"
#include "core/jobs/JobSystem.hpp"
#include "renderer/FrameOrchestrator.hpp"
#include "renderer/RendererConfig.hpp"
#include "renderer/VulkanFrameBackend.hpp"

namespace Batchline
{
    class Device;
    class HostFrameBackend;

    enum class BackendType
    {
        VULKAN,
        HOST
    };

    struct EngineConfig
    {
        uint32_t    width            = 1280;
        uint32_t    height           = 720;
        BackendType backend          = BackendType::VULKAN;
        bool        enableValidation = false;
        // Use the host backend when no usable Vulkan 1.3 adapter exists
        bool     fallbackToHost = true;
        uint32_t adapterIndex   = 0;

        JobSystem::Config   jobs;
        RendererConfig      renderer;
        VulkanBackendConfig vulkan;
    };

    /**
     * @brief Engine root. Brings up logging, the asset root, the job system and, for the Vulkan backend, the
     * instance, device and frame backend, then hands out the FrameOrchestrator. Renders off-screen only.
     */
    class Engine
    {
    public:
        Engine();
        ~Engine();

        Engine( const Engine& )            = delete;
        Engine& operator=( const Engine& ) = delete;

        Result Init( const EngineConfig& config );
        void   Shutdown();

        // --- Frame Orchestration ---
        void   BeginFrame();
        Result EndFrame();

        // --- Accessors ---
        FrameOrchestrator&      GetRenderer() { return m_orchestrator; }
        Ref<Device>             GetDevice() const { return m_device; }
        Ref<VulkanFrameBackend> GetVulkanBackend() const { return m_vulkanBackend; }
        Ref<HostFrameBackend>   GetHostBackend() const { return m_hostBackend; }
        JobSystem&              GetJobSystem() { return m_jobSystem; }

        BackendType GetBackendType() const { return m_backendType; }
        uint64_t    GetFrameCount() const { return m_frameCounter; }
        bool        IsInitialized() const { return m_initialized; }

    private:
        Result InitVulkan();

    private:
        bool         m_initialized = false;
        EngineConfig m_config;
        BackendType  m_backendType = BackendType::HOST;

        JobSystem               m_jobSystem;
        Ref<Device>             m_device;
        Ref<VulkanFrameBackend> m_vulkanBackend;
        Ref<HostFrameBackend>   m_hostBackend;
        FrameOrchestrator       m_orchestrator;

        uint64_t m_frameCounter = 0;
    };
} // namespace Batchline
