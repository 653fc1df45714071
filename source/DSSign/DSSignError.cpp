#include "DSSignError.h"
#include "DSPch/DSFmt.h"

namespace DS
{

SignError SignError::validation( std::string field, std::string message, std::optional<std::string> validRange )
{
    SignError res;
    res.kind = Kind::Validation;
    res.subject = std::move( field );
    res.message = std::move( message );
    res.validRange = std::move( validRange );
    return res;
}

SignError SignError::geometry( std::string operation, std::string details )
{
    SignError res;
    res.kind = Kind::Geometry;
    res.subject = std::move( operation );
    res.message = std::move( details );
    return res;
}

SignError SignError::stlExport( std::string layer, std::string reason, std::vector<std::string> suggestions )
{
    SignError res;
    res.kind = Kind::StlExport;
    res.subject = std::move( layer );
    res.message = std::move( reason );
    res.suggestions = std::move( suggestions );
    return res;
}

SignError SignError::font( std::string fontName, std::string reason )
{
    SignError res;
    res.kind = Kind::Font;
    res.subject = std::move( fontName );
    res.message = std::move( reason );
    return res;
}

std::string SignError::what() const
{
    switch ( kind )
    {
    case Kind::Validation:
    {
        auto res = fmt::format( "Validation error for {}: {}", subject, message );
        if ( validRange && !validRange->empty() )
            res += fmt::format( " (valid range: {})", *validRange );
        return res;
    }
    case Kind::Geometry:
        return fmt::format( "Geometry error during {}: {}", subject, message );
    case Kind::StlExport:
    {
        auto res = fmt::format( "Failed to export {}: {}", subject, message );
        if ( !suggestions.empty() )
        {
            res += "\nSuggestions:";
            for ( const auto& s : suggestions )
                res += fmt::format( "\n  \xE2\x80\xA2 {}", s );
        }
        return res;
    }
    case Kind::Font:
        return fmt::format( "Font error with '{}': {}", subject, message );
    }
    return message;
}

} //namespace DS
