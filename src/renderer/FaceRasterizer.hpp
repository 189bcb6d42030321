#pragma once
#include "core/Base.hpp"
#include "renderer/Camera.hpp"
#include "renderer/LineRasterizer.hpp"
#include "resources/Primitive.hpp"

namespace Wire3D
{
    enum class RasterStrategy : uint8_t
    {
        PROJECTED_POLYGON, // Camera basis projection, whole-face rejection, bottom vertex marker
        CLIP_SPACE_EDGES,  // View-projection matrix, per-edge rejection
    };

    std::string_view toString( RasterStrategy strategy );

    /**
     * @brief Flat light divisor of a face: 1 / clamp( n.x + n.y + n.z, 0.1, 1 ), truncated.
     * Kept as the renderer has always shaded faces; it is not a Lambert term.
     */
    uint32_t ComputeLightDivisor( const Vec3& normal );

    // Divides each channel of a 0xRRGGBB colour by the divisor.
    uint32_t ShadeColor( uint32_t rgb, uint32_t divisor );

    /**
     * @brief Draws the faces of one primitive into a surface for one frame.
     * Implementations are created per RenderContext and snapshot the camera state they
     * need in BeginPrimitive().
     */
    class FaceRasterizer
    {
    public:
        FaceRasterizer( const Camera& camera, Surface& surface )
            : m_camera( camera )
            , m_surface( surface )
            , m_lines( surface )
        {
        }

        virtual ~FaceRasterizer() = default;

        virtual RasterStrategy GetStrategy() const = 0;

        // Called once per Draw() before any face of the primitive.
        virtual void BeginPrimitive( const Primitive& primitive ) = 0;

        // Returns the number of pixel writes performed for this face.
        virtual uint32_t RasterizeFace( const Primitive& primitive, const Face& face ) = 0;

    protected:
        uint32_t ComputeFaceColor( const Primitive& primitive, const Face& face ) const;

    protected:
        const Camera&  m_camera;
        Surface&       m_surface;
        LineRasterizer m_lines;
    };

    Scope<FaceRasterizer> CreateFaceRasterizer( RasterStrategy strategy, const Camera& camera, Surface& surface );
} // namespace Wire3D
