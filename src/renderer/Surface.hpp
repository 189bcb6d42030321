#pragma once
#include "core/Base.hpp"

namespace Wire3D
{
    /**
     * @brief Channel order of a 32-bit pixel, read as a native uint32_t.
     * ABGR8888: 0xAABBGGRR. RGBX8888: 0xRRGGBBXX.
     * The presenter must agree with the surface on this value.
     */
    enum class PixelFormat : uint8_t
    {
        ABGR8888,
        RGBX8888,
    };

    std::string_view toString( PixelFormat format );

    // Packs a 0xRRGGBB colour with an opaque alpha/X channel.
    uint32_t PackColor( uint32_t rgb, PixelFormat format );

    inline uint32_t OpaqueBlack( PixelFormat format )
    {
        return PackColor( 0x000000, format );
    }

    /**
     * @brief Target surface contract consumed by the renderer.
     * The renderer never allocates or resizes a surface.
     */
    class Surface
    {
    public:
        virtual ~Surface() = default;

        virtual uint32_t*       GetData()              = 0;
        virtual const uint32_t* GetData() const        = 0;
        virtual uint32_t        GetWidth() const       = 0;
        virtual uint32_t        GetHeight() const      = 0;
        virtual PixelFormat     GetPixelFormat() const = 0;

        size_t GetPixelCount() const { return static_cast<size_t>( GetWidth() ) * GetHeight(); }
    };

    /**
     * @brief CPU-owned pixel buffer, initialized to opaque black.
     */
    class FrameBuffer : public Surface
    {
    public:
        FrameBuffer( uint32_t width, uint32_t height, PixelFormat format = PixelFormat::ABGR8888 );

        uint32_t*       GetData() override { return m_pixels.data(); }
        const uint32_t* GetData() const override { return m_pixels.data(); }
        uint32_t        GetWidth() const override { return m_width; }
        uint32_t        GetHeight() const override { return m_height; }
        PixelFormat     GetPixelFormat() const override { return m_format; }

        // Returns true if the buffer was reallocated. Contents are reset to opaque black.
        bool Resize( uint32_t width, uint32_t height );

        void Clear( uint32_t pixel );

        // Bounds-checked read, returns 0 outside the buffer
        uint32_t GetPixel( uint32_t x, uint32_t y ) const;

    private:
        uint32_t              m_width  = 0;
        uint32_t              m_height = 0;
        PixelFormat           m_format;
        std::vector<uint32_t> m_pixels;
    };
} // namespace Wire3D
