#pragma once
#include <chrono>
#include <cstdint>

namespace Wire3D
{
    /**
     * @brief Per-frame clock for the render loop.
     * Call Tick() once per frame. FPS is averaged over a fixed window so the
     * reported value does not jitter from frame to frame.
     */
    class FrameTimer
    {
    public:
        using Clock     = std::chrono::steady_clock;
        using TimePoint = Clock::time_point;

        explicit FrameTimer( float fpsWindowSeconds = 3.0f )
            : m_fpsWindow( fpsWindowSeconds )
        {
            m_start = m_last = m_fpsStart = Clock::now();
        }

        void Tick() { Tick( Clock::now() ); }

        void Tick( TimePoint now )
        {
            m_time      = Seconds( now - m_start );
            m_deltaTime = Seconds( now - m_last );
            m_last      = now;

            ++m_fpsFrames;
            float window = Seconds( now - m_fpsStart );
            if( window >= m_fpsWindow )
            {
                m_fps       = static_cast<float>( m_fpsFrames ) / window;
                m_fpsStart  = now;
                m_fpsFrames = 0;
            }
        }

        // Seconds since construction, as of the last Tick()
        float GetTime() const { return m_time; }
        float GetDeltaTime() const { return m_deltaTime; }
        float GetFps() const { return m_fps; }

        TimePoint GetStartPoint() const { return m_start; }

    private:
        static float Seconds( Clock::duration d ) { return std::chrono::duration<float>( d ).count(); }

    private:
        TimePoint m_start;
        TimePoint m_last;
        TimePoint m_fpsStart;

        float    m_fpsWindow;
        float    m_time      = 0.0f;
        float    m_deltaTime = 0.01f;
        float    m_fps       = 30.0f;
        uint32_t m_fpsFrames = 0;
    };
} // namespace Wire3D
