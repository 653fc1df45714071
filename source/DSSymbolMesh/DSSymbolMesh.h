#pragma once

#include "DSSymbolMeshFwd.h"

#include "DSMesh/DSVector2.h"
#include "DSMesh/DSExpected.h"

#include <string>
#include <filesystem>

namespace DS
{

enum AlignType {
    Left,
    Center,
    Right,
};

struct SymbolMeshParams
{
    // Text that will be converted in contours, UTF8-encoded, lines are separated with '\n'
    std::string text;
    // Detailization of Bezier curves on font glyphs
    int fontDetalization{5};
    // Additional offset between symbols
    // X: In symbol size: 1.0 adds one "space", 0.5 adds half "space".
    // Y: In symbol size: 1.0 adds one base height, 0.5 adds half base height
    Vector2d symbolsDistanceAdditionalOffset{ 0.0, 0.0 };
    // alignment of the lines relative to the longest one
    AlignType align{AlignType::Left};
    // Path to font file
    std::filesystem::path pathToFontFile;
    // index of the face in font collection file
    int faceIndex{ 0 };
    // size of the font em square in output units
    double fontSize{ 1.0 };
};

// converts text string into set of closed contours (the first point is not repeated at the end);
// overlapping parts of glyphs are merged, outer outlines are counter-clockwise, glyph counters are clockwise;
// the baseline of the first line passes through the origin, the first symbol starts near x = 0
DSSYMBOLMESH_API Expected<Contours2d> createSymbolContours( const SymbolMeshParams& params );

}
