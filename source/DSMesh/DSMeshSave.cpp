#include "DSMeshSave.h"
#include "DSTriMesh.h"
#include "DSStringConvert.h"
#include "DSTimer.h"
#include "DSPch/DSFmt.h"
#include <cstdint>
#include <cstring>
#include <fstream>

namespace DS
{

namespace MeshSave
{

namespace
{

std::vector<int> getNotDegenTris( const TriMesh & mesh )
{
    std::vector<int> res;
    res.reserve( mesh.numTris() );
    for ( int t = 0; t < int( mesh.numTris() ); ++t )
    {
        const Vector3d a{ mesh.points[mesh.tris[t][0]] };
        const Vector3d b{ mesh.points[mesh.tris[t][1]] };
        const Vector3d c{ mesh.points[mesh.tris[t][2]] };
        if ( cross( b - a, c - a ).lengthSq() > 0 )
            res.push_back( t );
    }
    return res;
}

} //anonymous namespace

Expected<void> toBinaryStl( const TriMesh & mesh, const std::filesystem::path & file, const SaveSettings & settings )
{
    std::ofstream out( file, std::ofstream::binary );
    if ( !out )
        return unexpected( std::string( "Cannot open file for writing " ) + utf8string( file ) );

    return toBinaryStl( mesh, out, settings );
}

Expected<void> toBinaryStl( const TriMesh & mesh, std::ostream & out, const SaveSettings & settings )
{
    DS_TIMER;

    char header[80] = {};
    std::strncpy( header, settings.solidName.c_str(), sizeof( header ) - 1 );
    out.write( header, 80 );

    const auto notDegenTris = getNotDegenTris( mesh );
    auto numTris = (std::uint32_t)notDegenTris.size();
    out.write( ( const char* )&numTris, 4 );

    for ( int t : notDegenTris )
    {
        const auto & tri = mesh.tris[t];
        // perform normal computation in double-precision to get exactly the same single-precision result on all platforms
        const Vector3d ad{ mesh.points[tri[0]] };
        const Vector3d bd{ mesh.points[tri[1]] };
        const Vector3d cd{ mesh.points[tri[2]] };
        const Vector3f normal( cross( bd - ad, cd - ad ).normalized() );
        const Vector3f & ap = mesh.points[tri[0]];
        const Vector3f & bp = mesh.points[tri[1]];
        const Vector3f & cp = mesh.points[tri[2]];

        out.write( (const char*)&normal, 12 );
        out.write( (const char*)&ap, 12 );
        out.write( (const char*)&bp, 12 );
        out.write( (const char*)&cp, 12 );
        std::uint16_t attr{ 0 };
        out.write( ( const char* )&attr, 2 );
    }

    if ( !out )
        return unexpected( std::string( "Error saving in binary STL-format" ) );
    return {};
}

Expected<void> toAsciiStl( const TriMesh & mesh, const std::filesystem::path & file, const SaveSettings & settings )
{
    std::ofstream out( file, std::ofstream::binary );
    if ( !out )
        return unexpected( std::string( "Cannot open file for writing " ) + utf8string( file ) );

    return toAsciiStl( mesh, out, settings );
}

Expected<void> toAsciiStl( const TriMesh & mesh, std::ostream & out, const SaveSettings & settings )
{
    DS_TIMER;

    out << "solid " << settings.solidName << "\n";
    const auto notDegenTris = getNotDegenTris( mesh );
    for ( int t : notDegenTris )
    {
        const auto & tri = mesh.tris[t];
        const auto & ap = mesh.points[tri[0]];
        const auto & bp = mesh.points[tri[1]];
        const auto & cp = mesh.points[tri[2]];
        const auto normal = cross( bp - ap, cp - ap ).normalized();
        out << fmt::format( "facet normal {} {} {}\n", normal.x, normal.y, normal.z );
        out << "outer loop\n";
        for ( const auto & p : { ap, bp, cp } )
            out << fmt::format( "vertex {} {} {}\n", p.x, p.y, p.z );
        out << "endloop\n";
        out << "endfacet\n";
    }
    out << "endsolid " << settings.solidName << "\n";

    if ( !out )
        return unexpected( std::string( "Error saving in ASCII STL-format" ) );
    return {};
}

Expected<void> toAnySupportedFormat( const TriMesh & mesh, const std::filesystem::path & file, const SaveSettings & settings )
{
    auto ext = toLower( utf8string( file.extension() ) );
    if ( ext == ".stl" )
        return toBinaryStl( mesh, file, settings );
    return unexpectedUnsupportedFileExtension();
}

} // namespace MeshSave

} // namespace DS
