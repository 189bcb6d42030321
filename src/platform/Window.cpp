#include "platform/Window.hpp"

#include "platform/Input.hpp"
#include <GLFW/glfw3.h>

namespace Wire3D
{
    static bool s_GLFWInitialized = false;

    static void GLFWErrorCallback( int error, const char* description )
    {
        W3D_CORE_ERROR( "GLFW Error ({0}): {1}", error, description );
    }

    Window::Window( const WindowConfig& config )
    {
        Init( config );
    }

    Window::~Window()
    {
        Shutdown();
    }

    void Window::Init( const WindowConfig& config )
    {
        m_data.title       = config.title;
        m_data.width       = config.width;
        m_data.height      = config.height;
        m_data.vsync       = config.vsync;
        m_data.pixelFormat = config.pixelFormat;

        W3D_CORE_INFO( "Creating window {0} ({1}x{2}, {3})", config.title, config.width, config.height, toString( config.pixelFormat ) );

        if( !s_GLFWInitialized )
        {
            glfwSetErrorCallback( GLFWErrorCallback );
            if( !glfwInit() )
            {
                W3D_CORE_ERROR( "Could not initialize GLFW!" );
                return;
            }
            s_GLFWInitialized = true;
        }

        // glDrawPixels needs a compatibility context
        glfwWindowHint( GLFW_CLIENT_API, GLFW_OPENGL_API );
        glfwWindowHint( GLFW_CONTEXT_VERSION_MAJOR, 2 );
        glfwWindowHint( GLFW_CONTEXT_VERSION_MINOR, 1 );
        glfwWindowHint( GLFW_RESIZABLE, GLFW_TRUE );

        m_window = glfwCreateWindow( ( int )m_data.width, ( int )m_data.height, m_data.title.c_str(), nullptr, nullptr );
        if( !m_window )
        {
            W3D_CORE_ERROR( "Could not create GLFW window!" );
            return;
        }

        glfwMakeContextCurrent( m_window );
        glfwSwapInterval( m_data.vsync ? 1 : 0 );

        // Initialize Input context
        Input::SetContext( m_window );
    }

    void Window::Shutdown()
    {
        if( m_window )
        {
            Input::SetContext( nullptr );
            glfwDestroyWindow( m_window );
            m_window = nullptr;
        }
    }

    void Window::OnUpdate()
    {
        glfwPollEvents();
    }

    void Window::Present( const Surface& surface )
    {
        if( !m_window || surface.GetWidth() == 0 || surface.GetHeight() == 0 )
            return;

        if( surface.GetPixelFormat() != m_data.pixelFormat )
            W3D_CORE_WARN( "Window: presenting {} pixels to a {} window", toString( surface.GetPixelFormat() ), toString( m_data.pixelFormat ) );

        uint32_t fbWidth, fbHeight;
        GetFramebufferSize( fbWidth, fbHeight );
        glViewport( 0, 0, ( GLsizei )fbWidth, ( GLsizei )fbHeight );

        // ABGR8888 keeps R in the low byte, RGBX8888 in the high byte of the native uint32_t.
        GLenum type = surface.GetPixelFormat() == PixelFormat::RGBX8888 ? GL_UNSIGNED_INT_8_8_8_8 : GL_UNSIGNED_INT_8_8_8_8_REV;

        // Surface rows go top to bottom, GL rows bottom to top.
        glRasterPos2f( -1.0f, 1.0f );
        glPixelZoom( ( float )fbWidth / ( float )surface.GetWidth(), -( float )fbHeight / ( float )surface.GetHeight() );
        glDrawPixels( ( GLsizei )surface.GetWidth(), ( GLsizei )surface.GetHeight(), GL_RGBA, type, surface.GetData() );

        glfwSwapBuffers( m_window );
    }

    void Window::GetFramebufferSize( uint32_t& width, uint32_t& height ) const
    {
        int w = 0, h = 0;
        if( m_window )
            glfwGetFramebufferSize( m_window, &w, &h );
        width  = static_cast<uint32_t>( w );
        height = static_cast<uint32_t>( h );
    }

    bool Window::IsClosed() const
    {
        return !m_window || glfwWindowShouldClose( m_window );
    }

    void Window::SetTitle( const std::string& title )
    {
        m_data.title = title;
        if( m_window )
            glfwSetWindowTitle( m_window, title.c_str() );
    }
} // namespace Wire3D
