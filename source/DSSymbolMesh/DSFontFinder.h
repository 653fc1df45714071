#pragma once

#include "DSSymbolMeshFwd.h"
#include "DSMesh/DSExpected.h"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace DS
{

struct FontInfo
{
    std::string family;
    std::string style;
    std::filesystem::path path;
    // index of the face in font collection file
    int faceIndex = 0;
};

/// finds font files by family names scanning font directories
class DSSYMBOLMESH_CLASS FontFinder
{
public:
    /// finder over system font directories
    DSSYMBOLMESH_API static FontFinder& instance();

    /// finder over given directories, they are scanned on first request
    DSSYMBOLMESH_API explicit FontFinder( std::vector<std::filesystem::path> dirs );

    /// all scalable fonts found in the directories
    DSSYMBOLMESH_API const std::vector<FontInfo>& fonts() const;

    /// sorted unique family names
    [[nodiscard]] DSSYMBOLMESH_API std::vector<std::string> availableFamilies() const;

    /// finds font of given family (case-insensitive), regular style is preferred;
    /// "Family Style" names like "Arial Black" are matched as well
    [[nodiscard]] DSSYMBOLMESH_API Expected<FontInfo> findFamily( const std::string& family ) const;

    /// resolves font file path or family name;
    /// if allowFallback then similar families and common system families are tried when requested one is missing
    [[nodiscard]] DSSYMBOLMESH_API Expected<FontInfo> resolve( const std::string& fontNameOrPath, bool allowFallback = true ) const;

    /// families tried when requested font is missing
    [[nodiscard]] DSSYMBOLMESH_API static const std::vector<std::string>& fallbackFamilies();

private:
    void scan_() const;

    std::vector<std::filesystem::path> dirs_;
    mutable std::once_flag scanned_;
    mutable std::vector<FontInfo> fonts_;
};

/// sorted family names of all fonts installed in the system
[[nodiscard]] DSSYMBOLMESH_API std::vector<std::string> availableFontFamilies();

}
