#include "DSContoursSave.h"
#include "DSStringConvert.h"
#include "DSTimer.h"
#include "DSPch/DSFmt.h"
#include <fstream>

namespace DS
{

namespace ContoursSave
{

namespace
{

std::string escapeXml( const std::string& str )
{
    std::string res;
    res.reserve( str.size() );
    for ( char c : str )
    {
        switch ( c )
        {
        case '&': res += "&amp;"; break;
        case '<': res += "&lt;"; break;
        case '>': res += "&gt;"; break;
        case '"': res += "&quot;"; break;
        case '\'': res += "&apos;"; break;
        default: res += c;
        }
    }
    return res;
}

} //anonymous namespace

Expected<void> toSvg( const SvgScene& scene, const std::filesystem::path& file )
{
    std::ofstream out( file, std::ofstream::binary );
    if ( !out )
        return unexpected( std::string( "Cannot open file for writing " ) + utf8string( file ) );

    return toSvg( scene, out );
}

Expected<void> toSvg( const SvgScene& scene, std::ostream& out )
{
    DS_TIMER;

    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << fmt::format( "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"{0}\" height=\"{1}\" viewBox=\"0 0 {0} {1}\">\n",
        scene.size.x, scene.size.y );
    out << fmt::format( "<rect width=\"100%\" height=\"100%\" fill=\"{}\"/>\n", escapeXml( scene.background ) );

    for ( const auto& shape : scene.shapes )
    {
        std::string d;
        for ( const auto& contour : shape.contours )
        {
            if ( contour.empty() )
                continue;
            d += fmt::format( "M{:.3f} {:.3f}", contour[0].x, contour[0].y );
            for ( size_t i = 1; i < contour.size(); ++i )
                d += fmt::format( " L{:.3f} {:.3f}", contour[i].x, contour[i].y );
            d += " Z ";
        }
        if ( d.empty() )
            continue;
        out << fmt::format( "<path d=\"{}\" fill=\"{}\" fill-rule=\"evenodd\" stroke=\"{}\" stroke-width=\"{}\"/>\n",
            d, escapeXml( shape.fill ), escapeXml( shape.stroke ), shape.strokeWidth );
    }

    for ( const auto& label : scene.labels )
    {
        out << fmt::format( "<text x=\"{:.1f}\" y=\"{:.1f}\" font-family=\"{}\" font-size=\"{}\" fill=\"{}\" text-anchor=\"{}\">{}</text>\n",
            label.pos.x, label.pos.y, escapeXml( label.fontFamily ), label.fontSize, escapeXml( label.fill ),
            escapeXml( label.anchor ), escapeXml( label.text ) );
    }
    out << "</svg>\n";

    if ( !out )
        return unexpected( std::string( "Error saving in SVG-format" ) );
    return {};
}

} // namespace ContoursSave

} // namespace DS
