#include "CameraController.hpp"
#include "core/Log.hpp"
#include "core/Timer.hpp"
#include "platform/Input.hpp"
#include "platform/Window.hpp"
#include "renderer/Render.hpp"
#include "resources/ObjLoader.hpp"
#include "resources/ShapeGenerator.hpp"
#include <GLFW/glfw3.h>
#include <string>
#include <vector>

using namespace Wire3D;

struct SandboxConfig
{
    WindowConfig window;
    RenderConfig render;

    std::string meshPath;
    uint32_t    meshColor = 0x00FF00;

    float orbitRadius = 5.0f;
    float orbitHeight = 3.0f;

    uint64_t fpsReportInterval = 1000; // frames
};

static SandboxConfig ParseArguments( int argc, char** argv )
{
    SandboxConfig config;
    config.window.title = "Wire3D Sandbox";

    for( int i = 1; i < argc; ++i )
    {
        std::string arg = argv[ i ];
        if( arg == "--edges" )
            config.render.strategy = RasterStrategy::CLIP_SPACE_EDGES;
        else if( arg == "--rgbx" )
            config.window.pixelFormat = PixelFormat::RGBX8888;
        else
            config.meshPath = arg;
    }
    return config;
}

int main( int argc, char** argv )
{
    Log::Init();

    SandboxConfig config = ParseArguments( argc, argv );

    Window window( config.window );
    if( !window.IsValid() )
    {
        W3D_CRITICAL( "Sandbox: no window, exiting" );
        return 1;
    }

    Render render( config.render );

    std::vector<Primitive> scene;

    Primitive triangle = ShapeGenerator::CreateTriangle( 1.0f, config.meshColor );
    scene.push_back( ShapeGenerator::CreateCube( 1.5f, 0xFFFFFF ) );

    if( !config.meshPath.empty() )
    {
        Primitive     mesh;
        ObjParseError error;
        mesh.color = config.meshColor;
        if( ObjLoader::LoadFromFile( config.meshPath, mesh, &error ) == Result::SUCCESS )
            scene.push_back( std::move( mesh ) );
        else
            W3D_ERROR( "Sandbox: '{}' line {}: {}", config.meshPath, error.line, error.message );
    }

    uint32_t width, height;
    window.GetFramebufferSize( width, height );
    FrameBuffer frameBuffer( width, height, config.window.pixelFormat );

    CameraController controller( config.orbitRadius, config.orbitHeight );
    FrameTimer       timer;
    uint64_t         frame = 0;

    while( !window.IsClosed() )
    {
        window.OnUpdate();
        timer.Tick();

        if( Input::WasKeyPressed( GLFW_KEY_ESCAPE ) )
            break;
        if( Input::WasKeyPressed( GLFW_KEY_TAB ) )
        {
            render.SetStrategy( render.GetStrategy() == RasterStrategy::PROJECTED_POLYGON ? RasterStrategy::CLIP_SPACE_EDGES
                                                                                          : RasterStrategy::PROJECTED_POLYGON );
            W3D_INFO( "Sandbox: switched to {}", toString( render.GetStrategy() ) );
        }

        // The target surface follows the window between frames
        window.GetFramebufferSize( width, height );
        if( width == 0 || height == 0 )
            continue;
        frameBuffer.Resize( width, height );

        ShapeGenerator::AnimateTriangle( triangle, 1.0f, timer.GetTime() );
        controller.OnUpdate( render.GetCamera(), timer.GetDeltaTime() );

        RenderContext context = render.BeginFrame( frameBuffer );
        context.Draw( triangle );
        for( const Primitive& primitive: scene )
            context.Draw( primitive );
        context.EndFrame();

        window.Present( frameBuffer );

        if( frame % config.fpsReportInterval == 0 )
            W3D_INFO( "FPS: {:.1f}", timer.GetFps() );
        ++frame;
    }

    return 0;
}
