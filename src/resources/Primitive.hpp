#pragma once
#include "core/Base.hpp"
#include "math/Math.hpp"
#include <iterator>

namespace Wire3D
{
    /**
     * @brief One decoded face of a Primitive's index buffer.
     * positionIndices points into the owning buffer and is only valid while it is unchanged.
     */
    struct Face
    {
        const uint32_t* positionIndices = nullptr;
        uint32_t        vertexCount     = 0;
        uint32_t        normalIndex     = 0;

        uint32_t operator[]( uint32_t i ) const { return positionIndices[ i ]; }
    };

    /**
     * @brief Forward iterator over the face encoding
     * [ vertexCount, normalIndex, p0 .. p(vertexCount-1) ] repeated back-to-back.
     * A header that would run past the end of the buffer terminates the sequence.
     */
    class FaceIterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = Face;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const Face*;
        using reference         = const Face&;

        FaceIterator() = default;
        FaceIterator( const uint32_t* cursor, const uint32_t* end );

        reference operator*() const { return m_face; }
        pointer   operator->() const { return &m_face; }

        FaceIterator& operator++();
        FaceIterator  operator++( int )
        {
            FaceIterator tmp = *this;
            ++( *this );
            return tmp;
        }

        bool operator==( const FaceIterator& other ) const { return m_cursor == other.m_cursor; }
        bool operator!=( const FaceIterator& other ) const { return m_cursor != other.m_cursor; }

    private:
        void Decode();

    private:
        const uint32_t* m_cursor = nullptr;
        const uint32_t* m_end    = nullptr;
        Face            m_face;
    };

    class FaceRange
    {
    public:
        explicit FaceRange( const std::vector<uint32_t>& indices )
            : m_begin( indices.data() )
            , m_end( indices.data() + indices.size() )
        {
        }

        FaceIterator begin() const { return FaceIterator( m_begin, m_end ); }
        FaceIterator end() const { return FaceIterator( m_end, m_end ); }

    private:
        const uint32_t* m_begin;
        const uint32_t* m_end;
    };

    /**
     * @brief Indexed polygon mesh drawn as wireframe.
     * positions[ 0 ] and normals[ 0 ] are reserved fallbacks (origin, up).
     * Position indices address positions directly; a face's normalIndex addresses the
     * per-face normal list that starts at normals[ 1 ].
     */
    struct Primitive
    {
        std::vector<Vec3>     positions;
        std::vector<Vec3>     normals;
        std::vector<uint32_t> indices;
        uint32_t              color = 0xFFFFFF; // 0xRRGGBB

        FaceRange GetFaces() const { return FaceRange( indices ); }

        const Vec3& GetFaceNormal( uint32_t normalIndex ) const
        {
            W3D_CORE_ASSERT( normalIndex + 1 < normals.size(), "Face normal index out of range" );
            return normals[ normalIndex + 1 ];
        }

        uint32_t GetFaceCount() const;

        // Checks every face header and index against the buffers.
        Result Validate() const;

        // Appends a face with a new face normal. Reserves slot 0 on first use.
        void AddFace( const std::vector<uint32_t>& positionIndices, const Vec3& normal );
    };
} // namespace Wire3D
