#pragma once

#include <memory>
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace Batchline
{
    class Log
    {
    public:
        static void Init();

        inline static std::shared_ptr<spdlog::logger>& GetCoreLogger() { return s_coreLogger; }
        inline static std::shared_ptr<spdlog::logger>& GetClientLogger() { return s_clientLogger; }

    private:
        static std::shared_ptr<spdlog::logger> s_coreLogger;
        static std::shared_ptr<spdlog::logger> s_clientLogger;
    };
} // namespace Batchline

#define BL_CORE_TRACE( ... )    ::Batchline::Log::GetCoreLogger()->trace( __VA_ARGS__ )
#define BL_CORE_INFO( ... )     ::Batchline::Log::GetCoreLogger()->info( __VA_ARGS__ )
#define BL_CORE_WARN( ... )     ::Batchline::Log::GetCoreLogger()->warn( __VA_ARGS__ )
#define BL_CORE_ERROR( ... )    ::Batchline::Log::GetCoreLogger()->error( __VA_ARGS__ )
#define BL_CORE_CRITICAL( ... ) ::Batchline::Log::GetCoreLogger()->critical( __VA_ARGS__ )

#define BL_TRACE( ... )    ::Batchline::Log::GetClientLogger()->trace( __VA_ARGS__ )
#define BL_INFO( ... )     ::Batchline::Log::GetClientLogger()->info( __VA_ARGS__ )
#define BL_WARN( ... )     ::Batchline::Log::GetClientLogger()->warn( __VA_ARGS__ )
#define BL_ERROR( ... )    ::Batchline::Log::GetClientLogger()->error( __VA_ARGS__ )
#define BL_CRITICAL( ... ) ::Batchline::Log::GetClientLogger()->critical( __VA_ARGS__ )
