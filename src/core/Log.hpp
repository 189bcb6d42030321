#pragma once

#include <memory>
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace Wire3D
{
    class Log
    {
    public:
        // Safe to call more than once; only the first call creates the loggers.
        static void Init();

        // Both getters create the loggers on first use, so the core logs without an explicit Init().
        inline static std::shared_ptr<spdlog::logger>& GetCoreLogger()
        {
            if( !s_coreLogger )
                Init();
            return s_coreLogger;
        }

        inline static std::shared_ptr<spdlog::logger>& GetClientLogger()
        {
            if( !s_clientLogger )
                Init();
            return s_clientLogger;
        }

    private:
        static std::shared_ptr<spdlog::logger> s_coreLogger;
        static std::shared_ptr<spdlog::logger> s_clientLogger;
    };
} // namespace Wire3D

#define W3D_CORE_TRACE( ... )    ::Wire3D::Log::GetCoreLogger()->trace( __VA_ARGS__ )
#define W3D_CORE_INFO( ... )     ::Wire3D::Log::GetCoreLogger()->info( __VA_ARGS__ )
#define W3D_CORE_WARN( ... )     ::Wire3D::Log::GetCoreLogger()->warn( __VA_ARGS__ )
#define W3D_CORE_ERROR( ... )    ::Wire3D::Log::GetCoreLogger()->error( __VA_ARGS__ )
#define W3D_CORE_CRITICAL( ... ) ::Wire3D::Log::GetCoreLogger()->critical( __VA_ARGS__ )

#define W3D_TRACE( ... )    ::Wire3D::Log::GetClientLogger()->trace( __VA_ARGS__ )
#define W3D_INFO( ... )     ::Wire3D::Log::GetClientLogger()->info( __VA_ARGS__ )
#define W3D_WARN( ... )     ::Wire3D::Log::GetClientLogger()->warn( __VA_ARGS__ )
#define W3D_ERROR( ... )    ::Wire3D::Log::GetClientLogger()->error( __VA_ARGS__ )
#define W3D_CRITICAL( ... ) ::Wire3D::Log::GetClientLogger()->critical( __VA_ARGS__ )
