#pragma once
#include "core/Base.hpp"
#include "renderer/Surface.hpp"
#include <string>

struct GLFWwindow;

namespace Wire3D
{
    struct WindowConfig
    {
        std::string title       = "Wire3D";
        uint32_t    width       = 800;
        uint32_t    height      = 600;
        bool        vsync       = true;
        PixelFormat pixelFormat = PixelFormat::ABGR8888;
    };

    /**
     * @brief GLFW window that shows a software framebuffer.
     * Uses a legacy OpenGL context only to copy pixels to the screen.
     */
    class Window
    {
    public:
        Window( const WindowConfig& config );
        ~Window();

        Window( const Window& )            = delete;
        Window& operator=( const Window& ) = delete;

        // Returns false if GLFW or the window could not be created
        bool IsValid() const { return m_window != nullptr; }

        void OnUpdate();

        // Copies the surface to the window, row 0 at the top. Sizes must match the framebuffer.
        void Present( const Surface& surface );

        // Returns the actual framebuffer size (pixels)
        void GetFramebufferSize( uint32_t& width, uint32_t& height ) const;

        // Returns true if the user requested to close the window (e.g. clicked X)
        bool IsClosed() const;

        void SetTitle( const std::string& title );

        PixelFormat GetPixelFormat() const { return m_data.pixelFormat; }

    private:
        void Init( const WindowConfig& config );
        void Shutdown();

    private:
        struct WindowData
        {
            std::string title;
            uint32_t    width, height;
            bool        vsync;
            PixelFormat pixelFormat;
        };

        WindowData  m_data;
        GLFWwindow* m_window = nullptr;
    };
} // namespace Wire3D
