#include "renderer/Render.hpp"

#include <algorithm>

namespace Wire3D
{
    Render::Render( const RenderConfig& config )
        : m_strategy( config.strategy )
    {
        Log::Init();

        if( m_camera.SetProjection( config.nearClip, config.farClip, config.projectionSize ) != Result::SUCCESS )
            W3D_CORE_WARN( "Render: keeping the default projection" );

        W3D_CORE_INFO( "Render: created with {} rasterizer", toString( m_strategy ) );
    }

    RenderContext Render::BeginFrame( Surface& surface )
    {
        uint32_t* pixels = surface.GetData();
        std::fill( pixels, pixels + surface.GetPixelCount(), OpaqueBlack( surface.GetPixelFormat() ) );

        if( m_camera.Resize( surface.GetWidth(), surface.GetHeight() ) )
            W3D_CORE_TRACE( "Render: camera fitted to {}x{}", surface.GetWidth(), surface.GetHeight() );

        ++m_frameCount;
        return RenderContext( m_camera, surface, m_strategy );
    }
} // namespace Wire3D
