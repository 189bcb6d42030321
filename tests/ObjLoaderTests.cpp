#include "resources/ObjLoader.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace Wire3D;

namespace
{
    const char* kQuad = "# unit quad\n"
                        "o quad\n"
                        "v 0 0 0\n"
                        "v 1 0 0\n"
                        "v 1 1 0\n"
                        "v 0 1 0\n"
                        "vt 0 0\n"
                        "s off\n"
                        "f 1 2 3 4\n";
} // namespace

TEST( ObjLoader, ParsesPositionsAndFaces )
{
    Primitive primitive;
    primitive.color = 0x336699;

    ASSERT_EQ( ObjLoader::ParseString( kQuad, primitive ), Result::SUCCESS );
    EXPECT_EQ( primitive.Validate(), Result::SUCCESS );

    // Slot 0 stays reserved so OBJ indices map directly
    ASSERT_EQ( primitive.positions.size(), 5u );
    EXPECT_FLOAT_EQ( primitive.positions[ 2 ].x, 1.0f );
    EXPECT_EQ( primitive.indices, ( std::vector<uint32_t>{ 4, 0, 1, 2, 3, 4 } ) );
    EXPECT_EQ( primitive.color, 0x336699u );

    // Counter-clockwise in XY faces +Z
    EXPECT_NEAR( primitive.GetFaceNormal( 0 ).z, 1.0f, 1e-6f );
}

TEST( ObjLoader, FaceVertexForms )
{
    const char* text = "v 0 0 0\n"
                       "v 1 0 0\n"
                       "v 0 1 0\n"
                       "vt 0 0\n"
                       "vn 1 0 0\n"
                       "f 1/1 2/1 3/1\n"
                       "f 1//1 2//1 3//1\n"
                       "f 1/1/1 2/1/1 3/1/1\n"
                       "f -3 -2 -1\n";

    Primitive primitive;
    ASSERT_EQ( ObjLoader::ParseString( text, primitive ), Result::SUCCESS );
    ASSERT_EQ( primitive.GetFaceCount(), 4u );

    std::vector<Vec3> normals;
    for( const Face& face: primitive.GetFaces() )
    {
        ASSERT_EQ( face.vertexCount, 3u );
        EXPECT_EQ( face[ 0 ], 1u );
        EXPECT_EQ( face[ 2 ], 3u );
        normals.push_back( primitive.GetFaceNormal( face.normalIndex ) );
    }

    // Faces with vn on every vertex use them, the others get the geometric normal
    EXPECT_NEAR( normals[ 0 ].z, 1.0f, 1e-6f );
    EXPECT_NEAR( normals[ 1 ].x, 1.0f, 1e-6f );
    EXPECT_NEAR( normals[ 2 ].x, 1.0f, 1e-6f );
    EXPECT_NEAR( normals[ 3 ].z, 1.0f, 1e-6f );
}

TEST( ObjLoader, DegenerateFaceGetsUpNormal )
{
    Primitive primitive;
    ASSERT_EQ( ObjLoader::ParseString( "v 0 0 0\nv 1 1 1\nv 2 2 2\nf 1 2 3\n", primitive ), Result::SUCCESS );
    EXPECT_FLOAT_EQ( primitive.GetFaceNormal( 0 ).y, 1.0f );
}

TEST( ObjLoader, ErrorsReportTheLine )
{
    struct Case
    {
        const char* text;
        uint32_t    line;
    };

    const Case cases[] = {
        { "v 0 0 0\nv 1 0 0\nf 1 2\n", 3 },               // too few vertices
        { "v 0 0 0\nf 1 2 3\n", 2 },                      // position out of range
        { "v 0 0\n", 1 },                                 // missing coordinate
        { "v 0 zero 0\n", 1 },                            // malformed number
        { "v 0 0 0\nv 1 0 0\nv 0 1 0\nf 1//2 2 3\n", 4 }, // normal out of range
        { "v 0 0 0\n\nbogus 1 2\n", 3 },                  // unknown record
        { "v 0 0 0\nf 0 1 1\n", 2 },                      // zero index
    };

    for( const Case& c: cases )
    {
        Primitive primitive;
        primitive.AddFace( { 0, 0, 0 }, Vec3( 0.0f, 0.0f, 1.0f ) );
        const std::vector<uint32_t> before = primitive.indices;

        ObjParseError error;
        EXPECT_EQ( ObjLoader::ParseString( c.text, primitive, &error ), Result::INVALID_ARGS ) << c.text;
        EXPECT_EQ( error.line, c.line ) << c.text;
        EXPECT_FALSE( error.message.empty() );

        // Output untouched on failure
        EXPECT_EQ( primitive.indices, before );
        EXPECT_EQ( primitive.positions.size(), 1u );
    }
}

TEST( ObjLoader, LoadFromFile )
{
    std::filesystem::path path = std::filesystem::temp_directory_path() / "wire3d_objloader_quad.obj";
    {
        std::ofstream file( path );
        ASSERT_TRUE( file.is_open() );
        file << kQuad;
    }

    Primitive primitive;
    EXPECT_EQ( ObjLoader::LoadFromFile( path, primitive ), Result::SUCCESS );
    EXPECT_EQ( primitive.GetFaceCount(), 1u );

    std::error_code ec;
    std::filesystem::remove( path, ec );

    ObjParseError error;
    EXPECT_EQ( ObjLoader::LoadFromFile( path, primitive, &error ), Result::FAIL );
    EXPECT_EQ( error.line, 0u );
    EXPECT_EQ( primitive.GetFaceCount(), 1u );
}
