#include "resources/ShapeGenerator.hpp"

#include <cmath>
#include <glm/gtc/constants.hpp>

namespace Wire3D
{
    Primitive ShapeGenerator::CreateTriangle( float radius, uint32_t color )
    {
        Primitive triangle;
        triangle.color = color;

        // Slot 0 is the reserved origin
        triangle.positions.resize( 4, Vec3( 0.0f ) );
        AnimateTriangle( triangle, radius, 0.0f );

        triangle.AddFace( { 1, 2, 3 }, Vec3( 0.0f, 0.0f, 1.0f ) );
        return triangle;
    }

    void ShapeGenerator::AnimateTriangle( Primitive& triangle, float radius, float angle )
    {
        const float deltaAlpha = glm::two_pi<float>() / 3.0f;

        for( uint32_t i = 0; i < 3; ++i )
        {
            float alpha                 = angle + static_cast<float>( i ) * deltaAlpha;
            triangle.positions[ i + 1 ] = Vec3( std::sin( alpha ) * radius, std::cos( alpha ) * radius, 0.0f );
        }
    }

    Primitive ShapeGenerator::CreateCube( float halfSize, uint32_t color )
    {
        Primitive cube;
        cube.color = color;

        float s = halfSize;
        cube.positions.reserve( 9 );
        cube.positions.push_back( Vec3( 0.0f ) );
        cube.positions.push_back( Vec3( -s, -s, s ) );  // 1
        cube.positions.push_back( Vec3( s, -s, s ) );   // 2
        cube.positions.push_back( Vec3( s, s, s ) );    // 3
        cube.positions.push_back( Vec3( -s, s, s ) );   // 4
        cube.positions.push_back( Vec3( -s, -s, -s ) ); // 5
        cube.positions.push_back( Vec3( s, -s, -s ) );  // 6
        cube.positions.push_back( Vec3( s, s, -s ) );   // 7
        cube.positions.push_back( Vec3( -s, s, -s ) );  // 8

        // Faces: Front, Back, Right, Left, Top, Bottom (CCW from outside)
        cube.AddFace( { 1, 2, 3, 4 }, { 0, 0, 1 } );
        cube.AddFace( { 6, 5, 8, 7 }, { 0, 0, -1 } );
        cube.AddFace( { 2, 6, 7, 3 }, { 1, 0, 0 } );
        cube.AddFace( { 5, 1, 4, 8 }, { -1, 0, 0 } );
        cube.AddFace( { 4, 3, 7, 8 }, { 0, 1, 0 } );
        cube.AddFace( { 5, 6, 2, 1 }, { 0, -1, 0 } );

        return cube;
    }
} // namespace Wire3D
