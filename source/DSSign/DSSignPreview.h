#pragma once

#include "DSSignFwd.h"
#include "DSMesh/DSExpected.h"
#include "DSMesh/DSVector2.h"
#include "DSMesh/DSBox.h"
#include "DSMesh/DSContoursSave.h"

#include <filesystem>
#include <string>
#include <vector>

namespace DS
{

/// 2D picture of the sign on the preview canvas, y axis looks down
struct PreviewLayout
{
    Vector2d canvasSize{ 450, 400 };
    /// canvas pixels in one mm
    double scale = 1;
    /// plate rectangle on the canvas
    Box2d plateRect;
    std::string plateFill = "#FFD700";
    std::string plateOutline = "#CCA300";

    /// center of the text on the canvas
    Vector2d textCenter;
    /// font size in pixels including heaviness adjustment
    double fontSize = 12;
    std::string textColor = "#000000";
    bool boldWeight = false;
    /// the text is drawn once for each offset to simulate boldness
    std::vector<Vector2d> textOffsets;

    /// "{width}mm × {height}mm" below the plate
    std::string dimensionCaption;
    Vector2d captionPos;
};

/// border between the canvas edge and the plate, pixels
inline constexpr double cPreviewBorder = 20;

/// computes the canvas picture of the sign form without building any geometry
[[nodiscard]] DSSIGN_API PreviewLayout calcPreviewLayout( const SignParams& params, const Vector2d& canvasSize = { 450, 400 } );

/// converts real plate and glyph contours of generated sign in canvas scene
[[nodiscard]] DSSIGN_API ContoursSave::SvgScene makePreviewScene( const GeneratedSign& sign, const Vector2d& canvasSize = { 450, 400 } );

/// saves the preview of generated sign to .svg file
DSSIGN_API Expected<void> savePreviewSvg( const GeneratedSign& sign, const std::filesystem::path& file,
    const Vector2d& canvasSize = { 450, 400 } );

} //namespace DS
