#include "resources/Primitive.hpp"

namespace Wire3D
{
    FaceIterator::FaceIterator( const uint32_t* cursor, const uint32_t* end )
        : m_cursor( cursor )
        , m_end( end )
    {
        Decode();
    }

    FaceIterator& FaceIterator::operator++()
    {
        m_cursor += 2 + m_face.vertexCount;
        Decode();
        return *this;
    }

    void FaceIterator::Decode()
    {
        if( m_cursor == m_end )
            return;

        // Truncated header or body: stop instead of reading past the buffer.
        if( m_end - m_cursor < 2 || static_cast<size_t>( m_end - m_cursor - 2 ) < m_cursor[ 0 ] )
        {
            m_cursor = m_end;
            m_face   = Face{};
            return;
        }

        m_face.vertexCount     = m_cursor[ 0 ];
        m_face.normalIndex     = m_cursor[ 1 ];
        m_face.positionIndices = m_cursor + 2;
    }

    uint32_t Primitive::GetFaceCount() const
    {
        uint32_t count = 0;
        for( const Face& face: GetFaces() )
        {
            ( void )face;
            ++count;
        }
        return count;
    }

    Result Primitive::Validate() const
    {
        size_t cursor = 0;
        while( cursor < indices.size() )
        {
            if( indices.size() - cursor < 2 )
            {
                W3D_CORE_ERROR( "Primitive: truncated face header at offset {}", cursor );
                return Result::INVALID_ARGS;
            }

            uint32_t vertexCount = indices[ cursor ];
            uint32_t normalIndex = indices[ cursor + 1 ];
            if( indices.size() - cursor - 2 < vertexCount )
            {
                W3D_CORE_ERROR( "Primitive: face at offset {} declares {} vertices past the end of the buffer", cursor, vertexCount );
                return Result::INVALID_ARGS;
            }
            if( static_cast<size_t>( normalIndex ) + 1 >= normals.size() )
            {
                W3D_CORE_ERROR( "Primitive: face at offset {} uses normal {} of {}", cursor, normalIndex,
                                normals.empty() ? 0 : normals.size() - 1 );
                return Result::INVALID_ARGS;
            }
            for( uint32_t i = 0; i < vertexCount; ++i )
            {
                if( indices[ cursor + 2 + i ] >= positions.size() )
                {
                    W3D_CORE_ERROR( "Primitive: face at offset {} uses position {} of {}", cursor, indices[ cursor + 2 + i ], positions.size() );
                    return Result::INVALID_ARGS;
                }
            }

            cursor += 2 + static_cast<size_t>( vertexCount );
        }
        return Result::SUCCESS;
    }

    void Primitive::AddFace( const std::vector<uint32_t>& positionIndices, const Vec3& normal )
    {
        if( positions.empty() )
            positions.push_back( Vec3( 0.0f ) );
        if( normals.empty() )
            normals.push_back( Vec3( 0.0f, 1.0f, 0.0f ) );

        indices.push_back( static_cast<uint32_t>( positionIndices.size() ) );
        indices.push_back( static_cast<uint32_t>( normals.size() - 1 ) );
        indices.insert( indices.end(), positionIndices.begin(), positionIndices.end() );

        normals.push_back( normal );
    }
} // namespace Wire3D
