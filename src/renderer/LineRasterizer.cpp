#include "renderer/LineRasterizer.hpp"

#include <cstddef>
#include <utility>

namespace Wire3D
{
    LineRasterizer::LineRasterizer( Surface& surface )
        : m_pixels( surface.GetData() )
        , m_width( surface.GetWidth() )
        , m_height( surface.GetHeight() )
    {
    }

    void LineRasterizer::SetPixel( uint32_t x, uint32_t y, uint32_t color )
    {
        W3D_CORE_ASSERT( Contains( x, y ), "SetPixel outside the surface" );
        m_pixels[ static_cast<size_t>( y ) * m_width + x ] = color;
    }

    uint32_t LineRasterizer::DrawLine( uint32_t x1, uint32_t y1, uint32_t x2, uint32_t y2, uint32_t color )
    {
        W3D_CORE_ASSERT( Contains( x1, y1 ) && Contains( x2, y2 ), "DrawLine endpoint outside the surface" );

        int32_t dx = x2 > x1 ? static_cast<int32_t>( x2 - x1 ) : static_cast<int32_t>( x1 - x2 );
        int32_t dy = y2 > y1 ? static_cast<int32_t>( y2 - y1 ) : static_cast<int32_t>( y1 - y2 );

        bool xMajor = dx >= dy;

        // Always walk the major axis forward so a -> b and b -> a touch the same pixels.
        if( ( xMajor && x1 > x2 ) || ( !xMajor && y1 > y2 ) )
        {
            std::swap( x1, x2 );
            std::swap( y1, y2 );
        }

        const ptrdiff_t stride = static_cast<ptrdiff_t>( m_width );
        const ptrdiff_t sx     = x2 < x1 ? -1 : 1;
        const ptrdiff_t sy     = y2 < y1 ? -stride : stride;

        int32_t   major     = xMajor ? dx : dy;
        int32_t   minor     = xMajor ? dy : dx;
        ptrdiff_t majorStep = xMajor ? sx : sy;
        ptrdiff_t minorStep = xMajor ? sy : sx;

        const int32_t keep    = 2 * minor;
        const int32_t advance = 2 * minor - 2 * major;
        int32_t       error   = 2 * minor - major;

        // Both endpoints are inside the surface, so every intermediate pixel is too.
        uint32_t* pixel = m_pixels + static_cast<ptrdiff_t>( y1 ) * stride + x1;
        *pixel          = color;

        for( int32_t n = major; n != 0; --n )
        {
            pixel += majorStep;
            if( error < 0 )
            {
                error += keep;
            }
            else
            {
                pixel += minorStep;
                error += advance;
            }
            *pixel = color;
        }

        return static_cast<uint32_t>( major ) + 1;
    }
} // namespace Wire3D
