#include "platform/Input.hpp"

#include <GLFW/glfw3.h>
#include <unordered_map>

namespace Wire3D
{
    static GLFWwindow*                   s_ActiveWindow = nullptr;
    static std::unordered_map<int, bool> s_KeyLatch;

    void Input::SetContext( void* windowHandle )
    {
        s_ActiveWindow = static_cast<GLFWwindow*>( windowHandle );
        s_KeyLatch.clear();
    }

    bool Input::HasContext()
    {
        return s_ActiveWindow != nullptr;
    }

    bool Input::IsKeyPressed( int keycode )
    {
        if( !s_ActiveWindow )
            return false;
        auto state = glfwGetKey( s_ActiveWindow, keycode );
        return state == GLFW_PRESS || state == GLFW_REPEAT;
    }

    bool Input::WasKeyPressed( int keycode )
    {
        bool  pressed = IsKeyPressed( keycode );
        bool& latched = s_KeyLatch[ keycode ];
        bool  edge    = pressed && !latched;
        latched       = pressed;
        return edge;
    }
} // namespace Wire3D
