#pragma once
#include "core/Base.hpp"
#include "resources/Primitive.hpp"
#include <filesystem>
#include <istream>
#include <string>

namespace Wire3D
{
    struct ObjParseError
    {
        uint32_t    line = 0; // 1-based, 0 when the error is not tied to a line
        std::string message;
    };

    /**
     * @brief Wavefront OBJ reader producing the Primitive face encoding.
     * Reads v, vn and f records (i, i/t, i//n, i/t/n, negative indices allowed) and
     * derives one normal per face. On failure the output primitive is left untouched.
     */
    class ObjLoader
    {
    public:
        static Result Parse( std::istream& stream, Primitive& outPrimitive, ObjParseError* outError = nullptr );

        static Result ParseString( const std::string& text, Primitive& outPrimitive, ObjParseError* outError = nullptr );

        static Result LoadFromFile( const std::filesystem::path& path, Primitive& outPrimitive, ObjParseError* outError = nullptr );
    };
} // namespace Wire3D
