#pragma once
#include "core/Base.hpp"
#include "renderer/Surface.hpp"

namespace Wire3D
{
    /**
     * @brief Integer incremental (Bresenham) line drawing into a Surface.
     * Callers must keep every coordinate inside [0, width) x [0, height); the inner loop
     * walks the pixel pointer without bounds checks.
     */
    class LineRasterizer
    {
    public:
        explicit LineRasterizer( Surface& surface );

        // Writes max(|dx|, |dy|) + 1 pixels, both endpoints included. Returns the count.
        uint32_t DrawLine( uint32_t x1, uint32_t y1, uint32_t x2, uint32_t y2, uint32_t color );

        void SetPixel( uint32_t x, uint32_t y, uint32_t color );

        bool Contains( uint32_t x, uint32_t y ) const { return x < m_width && y < m_height; }

    private:
        uint32_t* m_pixels;
        uint32_t  m_width;
        uint32_t  m_height;
    };
} // namespace Wire3D
