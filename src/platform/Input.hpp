#pragma once
#include "core/Base.hpp"

namespace Wire3D
{
    class Input
    {
    public:
        // Use GLFW key codes (e.g. GLFW_KEY_SPACE)
        static bool IsKeyPressed( int keycode );

        // True only on the first poll that sees the key down
        static bool WasKeyPressed( int keycode );

        static bool HasContext();

    private:
        // Input needs access to the active window handle
        static void SetContext( void* windowHandle );

        friend class Window;
    };
} // namespace Wire3D
