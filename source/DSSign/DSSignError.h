#pragma once

#include "DSSignFwd.h"
#include "DSMesh/DSExpected.h"

#include <optional>
#include <string>
#include <vector>

namespace DS
{

/// error of sign generation or export
struct SignError
{
    enum class Kind
    {
        Validation, ///< parameters are out of range
        Geometry,   ///< solids cannot be built
        StlExport,  ///< file cannot be written
        Font        ///< font cannot be found or read
    };

    Kind kind = Kind::Geometry;
    /// field for validation errors, operation for geometry errors, layer for export errors, font name for font errors
    std::string subject;
    /// message, details or reason
    std::string message;
    /// optional valid range of the field, e.g. "10-500"
    std::optional<std::string> validRange;
    /// hints for the user attached to export errors
    std::vector<std::string> suggestions;

    [[nodiscard]] DSSIGN_API static SignError validation( std::string field, std::string message, std::optional<std::string> validRange = {} );
    [[nodiscard]] DSSIGN_API static SignError geometry( std::string operation, std::string details );
    [[nodiscard]] DSSIGN_API static SignError stlExport( std::string layer, std::string reason, std::vector<std::string> suggestions = {} );
    [[nodiscard]] DSSIGN_API static SignError font( std::string fontName, std::string reason );

    /// full message shown to the user
    [[nodiscard]] DSSIGN_API std::string what() const;
};

template<class T>
using SignExpected = Expected<T, SignError>;

} //namespace DS
