#include "DSTriMesh.h"
#include <cstdint>
#include <unordered_map>

namespace DS
{

void TriMesh::addMesh( const TriMesh& other )
{
    const int shift = int( points.size() );
    points.insert( points.end(), other.points.begin(), other.points.end() );
    tris.reserve( tris.size() + other.tris.size() );
    for ( const auto& t : other.tris )
        tris.push_back( { t[0] + shift, t[1] + shift, t[2] + shift } );
}

Box3f TriMesh::computeBoundingBox() const
{
    Box3f box;
    for ( const auto& p : points )
        box.include( p );
    return box;
}

double TriMesh::volume() const
{
    double res = 0;
    for ( const auto& t : tris )
    {
        const Vector3d a{ points[t[0]] };
        const Vector3d b{ points[t[1]] };
        const Vector3d c{ points[t[2]] };
        res += mixed( a, b, c );
    }
    return res / 6;
}

double TriMesh::area() const
{
    double res = 0;
    for ( const auto& t : tris )
    {
        const Vector3d a{ points[t[0]] };
        const Vector3d b{ points[t[1]] };
        const Vector3d c{ points[t[2]] };
        res += cross( b - a, c - a ).length();
    }
    return res / 2;
}

bool TriMesh::isClosed() const
{
    if ( tris.empty() )
        return false;
    auto key = [] ( int a, int b )
    {
        return ( uint64_t( uint32_t( a ) ) << 32 ) | uint32_t( b );
    };
    std::unordered_map<uint64_t, int> directedEdges;
    directedEdges.reserve( tris.size() * 3 );
    for ( const auto& t : tris )
    {
        for ( int i = 0; i < 3; ++i )
        {
            const int a = t[i];
            const int b = t[( i + 1 ) % 3];
            if ( a == b || ++directedEdges[key( a, b )] > 1 )
                return false;
        }
    }
    for ( const auto& directedEdge : directedEdges )
    {
        const auto edge = directedEdge.first;
        const int a = int( edge >> 32 );
        const int b = int( edge & 0xFFFFFFFFu );
        if ( !directedEdges.contains( key( b, a ) ) )
            return false;
    }
    return true;
}

} //namespace DS
