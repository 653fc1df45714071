#pragma once

#include "DSMeshFwd.h"

#include <filesystem>

namespace DS
{

/// helper class to create a temporary folder; the folder will be removed on the object's destruction
class UniqueTemporaryFolder
{
public:
    /// creates new folder in temp directory
    DSMESH_API UniqueTemporaryFolder();
    /// removes folder with all its content
    DSMESH_API ~UniqueTemporaryFolder();

    UniqueTemporaryFolder( const UniqueTemporaryFolder& ) = delete;
    UniqueTemporaryFolder& operator=( const UniqueTemporaryFolder& ) = delete;

    explicit operator bool() const
    {
        return !folder_.empty();
    }
    operator const std::filesystem::path& ( ) const
    {
        return folder_;
    }
    std::filesystem::path operator /( const std::filesystem::path& child ) const
    {
        return folder_ / child;
    }

private:
    std::filesystem::path folder_;
};

} // namespace DS
