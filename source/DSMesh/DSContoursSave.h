#pragma once

#include "DSMeshFwd.h"
#include "DSExpected.h"
#include "DSVector2.h"
#include <filesystem>
#include <ostream>
#include <string>

namespace DS
{

namespace ContoursSave
{

/// \defgroup ContoursSaveGroup Contours Save
/// \ingroup IOGroup
/// \{

/// closed contours filled with even-odd rule, coordinates are in image space (y looks down)
struct SvgShape
{
    Contours2d contours;
    std::string fill = "none";
    std::string stroke = "none";
    double strokeWidth = 1.0;
};

struct SvgLabel
{
    Vector2d pos;
    /// UTF8-encoded text
    std::string text;
    double fontSize = 12.0;
    std::string fontFamily = "sans-serif";
    std::string fill = "black";
    /// start, middle or end
    std::string anchor = "middle";
};

struct SvgScene
{
    Vector2d size{ 450, 400 };
    std::string background = "white";
    std::vector<SvgShape> shapes;
    std::vector<SvgLabel> labels;
};

/// saves in .svg file
DSMESH_API Expected<void> toSvg( const SvgScene& scene, const std::filesystem::path& file );
DSMESH_API Expected<void> toSvg( const SvgScene& scene, std::ostream& out );

/// \}

} // namespace ContoursSave

} // namespace DS
