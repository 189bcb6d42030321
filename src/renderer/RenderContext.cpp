#include "renderer/RenderContext.hpp"

#include <utility>

namespace Wire3D
{
    RenderContext::RenderContext( const Camera& camera, Surface& surface, RasterStrategy strategy )
        : m_rasterizer( CreateFaceRasterizer( strategy, camera, surface ) )
        , m_strategy( strategy )
        , m_width( surface.GetWidth() )
        , m_height( surface.GetHeight() )
    {
    }

    RenderContext::RenderContext( RenderContext&& other ) noexcept
        : m_rasterizer( std::move( other.m_rasterizer ) )
        , m_strategy( other.m_strategy )
        , m_width( other.m_width )
        , m_height( other.m_height )
        , m_pixelsWritten( other.m_pixelsWritten )
    {
    }

    RenderContext& RenderContext::operator=( RenderContext&& other ) noexcept
    {
        if( this != &other )
        {
            m_rasterizer    = std::move( other.m_rasterizer );
            m_strategy      = other.m_strategy;
            m_width         = other.m_width;
            m_height        = other.m_height;
            m_pixelsWritten = other.m_pixelsWritten;
        }
        return *this;
    }

    uint32_t RenderContext::Draw( const Primitive& primitive )
    {
        W3D_CORE_ASSERT( IsActive(), "Draw called on a finished RenderContext" );
        if( !IsActive() )
            return 0;

        m_rasterizer->BeginPrimitive( primitive );

        uint32_t written = 0;
        for( const Face& face: primitive.GetFaces() )
            written += m_rasterizer->RasterizeFace( primitive, face );

        m_pixelsWritten += written;
        return written;
    }

    void RenderContext::EndFrame()
    {
        m_rasterizer.reset();
    }
} // namespace Wire3D
