#pragma once
#include "core/Base.hpp"
#include "renderer/Camera.hpp"
#include "renderer/FaceRasterizer.hpp"
#include "renderer/Surface.hpp"
#include "resources/Primitive.hpp"

namespace Wire3D
{
    class Render;

    /**
     * @brief One frame of drawing into a borrowed surface.
     * Created by Render::BeginFrame() and valid until EndFrame(). It must not be kept
     * past the frame; the surface and the camera are only borrowed.
     */
    class RenderContext
    {
    public:
        ~RenderContext() = default;

        RenderContext( RenderContext&& other ) noexcept;
        RenderContext& operator=( RenderContext&& other ) noexcept;

        RenderContext( const RenderContext& )            = delete;
        RenderContext& operator=( const RenderContext& ) = delete;

        // Returns the number of pixel writes performed for the primitive.
        uint32_t Draw( const Primitive& primitive );

        void EndFrame();

        bool           IsActive() const { return m_rasterizer != nullptr; }
        RasterStrategy GetStrategy() const { return m_strategy; }

        uint32_t GetWidth() const { return m_width; }
        uint32_t GetHeight() const { return m_height; }

        // Pixel writes since BeginFrame()
        uint64_t GetPixelsWritten() const { return m_pixelsWritten; }

    private:
        RenderContext( const Camera& camera, Surface& surface, RasterStrategy strategy );

        friend class Render;

    private:
        Scope<FaceRasterizer> m_rasterizer;
        RasterStrategy        m_strategy;

        uint32_t m_width         = 0;
        uint32_t m_height        = 0;
        uint64_t m_pixelsWritten = 0;
    };
} // namespace Wire3D
