#pragma once
#include "core/Base.hpp"
#include "renderer/Camera.hpp"
#include "renderer/FaceRasterizer.hpp"
#include "renderer/RenderContext.hpp"
#include "renderer/Surface.hpp"

namespace Wire3D
{
    struct RenderConfig
    {
        RasterStrategy strategy = RasterStrategy::PROJECTED_POLYGON;

        // Initial projection of the owned camera
        float nearClip       = 0.05f;
        float farClip        = 100.0f;
        Vec2  projectionSize = { 0.1f, 0.1f };
    };

    /**
     * @brief Software renderer front end.
     * Owns the camera and hands out one RenderContext per frame.
     */
    class Render
    {
    public:
        explicit Render( const RenderConfig& config = RenderConfig() );

        // Clears the surface to opaque black and fits the camera to its extent.
        RenderContext BeginFrame( Surface& surface );

        Camera&       GetCamera() { return m_camera; }
        const Camera& GetCamera() const { return m_camera; }

        void           SetStrategy( RasterStrategy strategy ) { m_strategy = strategy; }
        RasterStrategy GetStrategy() const { return m_strategy; }

        uint64_t GetFrameCount() const { return m_frameCount; }

    private:
        Camera         m_camera;
        RasterStrategy m_strategy;
        uint64_t       m_frameCount = 0;
    };
} // namespace Wire3D
