#pragma once

#include "DSMeshFwd.h"
#include "DSExpected.h"
#include <filesystem>
#include <ostream>
#include <string>

namespace DS
{

namespace MeshSave
{

/// \defgroup MeshSaveGroup Mesh Save
/// \ingroup IOGroup
/// \{

struct SaveSettings
{
    /// name written in the header of binary STL and after `solid` keyword of ASCII STL
    std::string solidName = "DuoSign";
};

/// saves in binary .stl file, degenerate triangles are skipped
DSMESH_API Expected<void> toBinaryStl( const TriMesh & mesh, const std::filesystem::path & file, const SaveSettings & settings = {} );
DSMESH_API Expected<void> toBinaryStl( const TriMesh & mesh, std::ostream & out, const SaveSettings & settings = {} );

/// saves in textual .stl file, degenerate triangles are skipped
DSMESH_API Expected<void> toAsciiStl( const TriMesh & mesh, const std::filesystem::path & file, const SaveSettings & settings = {} );
DSMESH_API Expected<void> toAsciiStl( const TriMesh & mesh, std::ostream & out, const SaveSettings & settings = {} );

/// detects the format from file extension and save mesh to it
DSMESH_API Expected<void> toAnySupportedFormat( const TriMesh & mesh, const std::filesystem::path & file, const SaveSettings & settings = {} );

/// \}

} // namespace MeshSave

} // namespace DS
