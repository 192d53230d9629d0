#include "runtime/Engine.hpp"

#include "core/FileSystem.hpp"
#include "renderer/HostFrameBackend.hpp"
#include "rhi/RHI.hpp"

namespace Batchline
{
    Engine::Engine() = default;

    Engine::~Engine()
    {
        Shutdown();
    }

    Result Engine::Init( const EngineConfig& config )
    {
        Log::Init();
        FileSystem::Init();

        if( m_initialized )
        {
            BL_CORE_WARN( "[Engine] Already initialized!" );
            return Result::SUCCESS;
        }

        m_config = config;
        BL_CORE_INFO( "[Engine] Init: {} backend ({}x{})", m_config.backend == BackendType::VULKAN ? "VULKAN" : "HOST", m_config.width,
                      m_config.height );

        // 1. Workers for host-side passes
        Result result = m_jobSystem.Initialize( m_config.jobs );
        if( result != Result::SUCCESS )
            return result;

        // 2. Backend
        Ref<FrameBackend> backend;
        if( m_config.backend == BackendType::VULKAN )
        {
            result = InitVulkan();
            if( result == Result::SUCCESS )
            {
                backend       = m_vulkanBackend;
                m_backendType = BackendType::VULKAN;
            }
            else if( !m_config.fallbackToHost )
            {
                BL_CORE_CRITICAL( "[Engine] Vulkan backend unavailable ({}).", toString( result ) );
                Shutdown();
                return result;
            }
            else
            {
                BL_CORE_WARN( "[Engine] Vulkan backend unavailable ({}), falling back to the host backend.", toString( result ) );
                m_vulkanBackend.reset();
                if( m_device )
                {
                    RHI::DestroyDevice( m_device );
                    m_device.reset();
                }
                RHI::Shutdown();
            }
        }

        if( !backend )
        {
            m_hostBackend = CreateRef<HostFrameBackend>( &m_jobSystem );
            backend       = m_hostBackend;
            m_backendType = BackendType::HOST;
        }

        // 3. Orchestrator
        result = m_orchestrator.Init( backend, m_config.renderer );
        if( result != Result::SUCCESS )
        {
            Shutdown();
            return result;
        }

        m_initialized = true;
        return Result::SUCCESS;
    }

    Result Engine::InitVulkan()
    {
        RHIConfig rhiConfig;
        rhiConfig.enableValidation = m_config.enableValidation;

        Result result = RHI::Init( rhiConfig );
        if( result != Result::SUCCESS )
            return result;

        m_device = RHI::CreateDevice( m_config.adapterIndex );
        if( !m_device )
            return Result::FAIL;

        VulkanBackendConfig backendConfig = m_config.vulkan;
        backendConfig.targetWidth         = m_config.width;
        backendConfig.targetHeight        = m_config.height;

        m_vulkanBackend = CreateRef<VulkanFrameBackend>( m_device, backendConfig );
        return m_vulkanBackend->Init();
    }

    void Engine::Shutdown()
    {
        m_orchestrator.Shutdown();

        if( m_vulkanBackend )
        {
            m_vulkanBackend->Shutdown();
            m_vulkanBackend.reset();
        }
        m_hostBackend.reset();

        if( m_device )
        {
            RHI::DestroyDevice( m_device );
            m_device.reset();
        }
        if( RHI::IsInitialized() )
            RHI::Shutdown();

        m_jobSystem.Shutdown();
        m_initialized = false;
    }

    void Engine::BeginFrame()
    {
        m_frameCounter++;
        m_orchestrator.BeginFrame();
    }

    Result Engine::EndFrame()
    {
        if( !m_initialized )
            return Result::INVALID_OBJECT;
        return m_orchestrator.EndFrame();
    }
} // namespace Batchline
