#include "resources/ObjLoader.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace Wire3D
{
    namespace
    {
        bool ParseFloat( const std::string& token, float& out )
        {
            if( token.empty() )
                return false;

            const char* begin = token.c_str();
            char*       end   = nullptr;
            errno             = 0;
            out               = std::strtof( begin, &end );
            return errno == 0 && end == begin + token.size();
        }

        bool ParseIndex( const std::string& token, long& out )
        {
            if( token.empty() )
                return false;

            const char* begin = token.c_str();
            char*       end   = nullptr;
            errno             = 0;
            out               = std::strtol( begin, &end, 10 );
            return errno == 0 && end == begin + token.size();
        }

        // OBJ references are 1-based, negative values count back from the last element.
        bool ResolveIndex( long index, size_t count, uint32_t& out )
        {
            if( index > 0 && static_cast<size_t>( index ) <= count )
            {
                out = static_cast<uint32_t>( index );
                return true;
            }
            if( index < 0 && static_cast<size_t>( -index ) <= count )
            {
                out = static_cast<uint32_t>( static_cast<long>( count ) + 1 + index );
                return true;
            }
            return false;
        }

        std::vector<std::string> Split( const std::string& text, char separator )
        {
            std::vector<std::string> parts;
            std::string              current;
            for( char c: text )
            {
                if( c == separator )
                {
                    parts.push_back( current );
                    current.clear();
                }
                else
                {
                    current.push_back( c );
                }
            }
            parts.push_back( current );
            return parts;
        }

        Vec3 NewellNormal( const std::vector<Vec3>& positions, const std::vector<uint32_t>& face )
        {
            Vec3 normal( 0.0f );
            for( size_t i = 0; i < face.size(); ++i )
            {
                const Vec3& a = positions[ face[ i ] ];
                const Vec3& b = positions[ face[ ( i + 1 ) % face.size() ] ];
                normal.x += ( a.y - b.y ) * ( a.z + b.z );
                normal.y += ( a.z - b.z ) * ( a.x + b.x );
                normal.z += ( a.x - b.x ) * ( a.y + b.y );
            }
            return normal;
        }

        class ObjParser
        {
        public:
            Result Run( std::istream& stream, Primitive& outPrimitive, ObjParseError* outError );

        private:
            bool ParseVertex( std::istringstream& tokens );
            bool ParseNormal( std::istringstream& tokens );
            bool ParseFace( std::istringstream& tokens );

            bool Fail( std::string message )
            {
                m_error.line    = m_line;
                m_error.message = std::move( message );
                return false;
            }

        private:
            Primitive         m_primitive;
            std::vector<Vec3> m_objNormals;
            uint32_t          m_line = 0;
            ObjParseError     m_error;
        };

        Result ObjParser::Run( std::istream& stream, Primitive& outPrimitive, ObjParseError* outError )
        {
            m_primitive.color = outPrimitive.color;
            m_primitive.positions.push_back( Vec3( 0.0f ) );
            m_primitive.normals.push_back( Vec3( 0.0f, 1.0f, 0.0f ) );

            std::string line;
            bool        ok = true;
            while( ok && std::getline( stream, line ) )
            {
                ++m_line;

                size_t comment = line.find( '#' );
                if( comment != std::string::npos )
                    line.erase( comment );

                std::istringstream tokens( line );
                std::string        keyword;
                if( !( tokens >> keyword ) )
                    continue;

                if( keyword == "v" )
                    ok = ParseVertex( tokens );
                else if( keyword == "vn" )
                    ok = ParseNormal( tokens );
                else if( keyword == "f" )
                    ok = ParseFace( tokens );
                else if( keyword == "vt" || keyword == "vp" || keyword == "o" || keyword == "g" || keyword == "s" || keyword == "usemtl" ||
                         keyword == "mtllib" )
                    continue;
                else
                    ok = Fail( "unknown record '" + keyword + "'" );
            }

            if( !ok )
            {
                W3D_CORE_ERROR( "ObjLoader: line {}: {}", m_error.line, m_error.message );
                if( outError )
                    *outError = m_error;
                return Result::INVALID_ARGS;
            }

            W3D_CORE_INFO( "ObjLoader: {} positions, {} faces", m_primitive.positions.size() - 1, m_primitive.normals.size() - 1 );
            outPrimitive = std::move( m_primitive );
            return Result::SUCCESS;
        }

        bool ObjParser::ParseVertex( std::istringstream& tokens )
        {
            Vec3        position;
            std::string token;
            for( int i = 0; i < 3; ++i )
            {
                if( !( tokens >> token ) )
                    return Fail( "vertex needs 3 coordinates" );
                if( !ParseFloat( token, position[ i ] ) )
                    return Fail( "malformed coordinate '" + token + "'" );
            }

            // Optional w, ignored
            float w;
            if( tokens >> token && !ParseFloat( token, w ) )
                return Fail( "malformed coordinate '" + token + "'" );

            m_primitive.positions.push_back( position );
            return true;
        }

        bool ObjParser::ParseNormal( std::istringstream& tokens )
        {
            Vec3        normal;
            std::string token;
            for( int i = 0; i < 3; ++i )
            {
                if( !( tokens >> token ) )
                    return Fail( "normal needs 3 components" );
                if( !ParseFloat( token, normal[ i ] ) )
                    return Fail( "malformed normal component '" + token + "'" );
            }

            m_objNormals.push_back( normal );
            return true;
        }

        bool ObjParser::ParseFace( std::istringstream& tokens )
        {
            const size_t positionCount = m_primitive.positions.size() - 1;

            std::vector<uint32_t> face;
            Vec3                  normalSum( 0.0f );
            bool                  allNormals = true;

            std::string token;
            while( tokens >> token )
            {
                std::vector<std::string> parts = Split( token, '/' );
                if( parts.size() > 3 )
                    return Fail( "malformed face vertex '" + token + "'" );

                long     index = 0;
                uint32_t position;
                if( !ParseIndex( parts[ 0 ], index ) )
                    return Fail( "malformed face vertex '" + token + "'" );
                if( !ResolveIndex( index, positionCount, position ) )
                    return Fail( "position index " + std::to_string( index ) + " out of range (" + std::to_string( positionCount ) + " defined)" );
                face.push_back( position );

                if( parts.size() == 3 && !parts[ 2 ].empty() )
                {
                    uint32_t normal;
                    if( !ParseIndex( parts[ 2 ], index ) )
                        return Fail( "malformed face vertex '" + token + "'" );
                    if( !ResolveIndex( index, m_objNormals.size(), normal ) )
                        return Fail( "normal index " + std::to_string( index ) + " out of range (" + std::to_string( m_objNormals.size() ) + " defined)" );
                    normalSum += m_objNormals[ normal - 1 ];
                }
                else
                {
                    allNormals = false;
                }
            }

            if( face.size() < 3 )
                return Fail( "face needs at least 3 vertices" );

            Vec3 normal = allNormals ? normalSum : NewellNormal( m_primitive.positions, face );
            normal      = Math::CanNormalize( normal ) ? Math::Normalize( normal ) : Vec3( 0.0f, 1.0f, 0.0f );

            m_primitive.AddFace( face, normal );
            return true;
        }
    } // namespace

    Result ObjLoader::Parse( std::istream& stream, Primitive& outPrimitive, ObjParseError* outError )
    {
        ObjParser parser;
        return parser.Run( stream, outPrimitive, outError );
    }

    Result ObjLoader::ParseString( const std::string& text, Primitive& outPrimitive, ObjParseError* outError )
    {
        std::istringstream stream( text );
        return Parse( stream, outPrimitive, outError );
    }

    Result ObjLoader::LoadFromFile( const std::filesystem::path& path, Primitive& outPrimitive, ObjParseError* outError )
    {
        std::ifstream file( path );
        if( !file.is_open() )
        {
            W3D_CORE_ERROR( "ObjLoader: cannot open '{}'", path.string() );
            if( outError )
            {
                outError->line    = 0;
                outError->message = "cannot open '" + path.string() + "'";
            }
            return Result::FAIL;
        }

        W3D_CORE_INFO( "ObjLoader: loading '{}'", path.string() );
        return Parse( file, outPrimitive, outError );
    }
} // namespace Wire3D
