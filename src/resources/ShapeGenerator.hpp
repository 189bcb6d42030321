#pragma once
#include "resources/Primitive.hpp"

namespace Wire3D
{
    class ShapeGenerator
    {
    public:
        // Three vertices on a circle in the XY plane, first one on +Y, facing +Z.
        static Primitive CreateTriangle( float radius = 1.0f, uint32_t color = 0x00FF00 );

        // Six quads around the origin, one face normal each.
        static Primitive CreateCube( float halfSize = 0.5f, uint32_t color = 0xFFFFFF );

        // Moves the triangle's vertices around the circle by angle (radians).
        static void AnimateTriangle( Primitive& triangle, float radius, float angle );
    };
} // namespace Wire3D
