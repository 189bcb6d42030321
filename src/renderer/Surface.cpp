#include "renderer/Surface.hpp"

#include <algorithm>

namespace Wire3D
{
    std::string_view toString( PixelFormat format )
    {
        switch( format )
        {
            case PixelFormat::ABGR8888:
                return "ABGR8888";
            case PixelFormat::RGBX8888:
                return "RGBX8888";
            default:
                return "UNKNOWN";
        }
    }

    uint32_t PackColor( uint32_t rgb, PixelFormat format )
    {
        uint32_t r = ( rgb >> 16 ) & 0xFF;
        uint32_t g = ( rgb >> 8 ) & 0xFF;
        uint32_t b = rgb & 0xFF;

        switch( format )
        {
            case PixelFormat::RGBX8888:
                return ( r << 24 ) | ( g << 16 ) | ( b << 8 ) | 0xFFu;
            case PixelFormat::ABGR8888:
            default:
                return 0xFF000000u | ( b << 16 ) | ( g << 8 ) | r;
        }
    }

    FrameBuffer::FrameBuffer( uint32_t width, uint32_t height, PixelFormat format )
        : m_width( width )
        , m_height( height )
        , m_format( format )
        , m_pixels( static_cast<size_t>( width ) * height, OpaqueBlack( format ) )
    {
    }

    bool FrameBuffer::Resize( uint32_t width, uint32_t height )
    {
        if( width == m_width && height == m_height )
            return false;

        m_width  = width;
        m_height = height;
        m_pixels.assign( static_cast<size_t>( width ) * height, OpaqueBlack( m_format ) );
        return true;
    }

    void FrameBuffer::Clear( uint32_t pixel )
    {
        std::fill( m_pixels.begin(), m_pixels.end(), pixel );
    }

    uint32_t FrameBuffer::GetPixel( uint32_t x, uint32_t y ) const
    {
        if( x >= m_width || y >= m_height )
            return 0;
        return m_pixels[ static_cast<size_t>( y ) * m_width + x ];
    }
} // namespace Wire3D
