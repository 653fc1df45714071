#include "DSSign/DSSignGenerator.h"
#include "DSSign/DSSignPreview.h"
#include "DSSign/DSSignSettings.h"
#include "DSMesh/DSConfig.h"
#include "DSMesh/DSStringConvert.h"
#include "DSMesh/DSSystem.h"
#include "DSSymbolMesh/DSFontFinder.h"
#include "DSPch/DSJson.h"
#include "DSPch/DSSpdlog.h"
#include <boost/program_options.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <iostream>

namespace po = boost::program_options;

namespace
{

// copies explicitly given options over (params), all options are copied if there is no preset
void applyOptions( const po::variables_map& vm, bool presetLoaded, DS::SignParams& params )
{
    auto given = [&] ( const char* name )
    {
        return vm.count( name ) && ( !presetLoaded || !vm[name].defaulted() );
    };
    if ( given( "text" ) )
        params.text = vm["text"].as<std::string>();
    if ( given( "width" ) )
        params.width = vm["width"].as<double>();
    if ( given( "height" ) )
        params.height = vm["height"].as<double>();
    if ( given( "font" ) )
        params.fontFamily = vm["font"].as<std::string>();
    if ( vm.count( "font-size" ) )
        params.fontSize = vm["font-size"].as<double>();
    if ( given( "heaviness" ) )
        params.heaviness = vm["heaviness"].as<int>();
    if ( given( "bottom-thickness" ) )
        params.bottomThickness = vm["bottom-thickness"].as<double>();
    if ( given( "top-thickness" ) )
        params.topThickness = vm["top-thickness"].as<double>();
    if ( given( "corner-radius" ) )
        params.cornerRadius = vm["corner-radius"].as<double>();
    if ( !presetLoaded || vm.count( "font-size" ) || vm.count( "no-auto-size" ) )
        params.autoSize = !vm.count( "no-auto-size" ) && !vm.count( "font-size" );
}

void printUsage( const po::options_description& options )
{
    std::cerr <<
        "signgen generates two-layer bi-color signs for 3D printing\n"
        "Usage: signgen TEXT [options]\n"
        << options << "\n";
}

} //anonymous namespace

// can throw
static int mainInternal( int argc, char **argv )
{
    po::options_description generalOptions( "General options" );
    generalOptions.add_options()
        ( "help", "produce help message" )
        ( "text", po::value<std::string>(), "text to display on the sign" )
        ( "output-dir", po::value<std::string>()->default_value( "output" ), "output directory for STL files" )
        ( "debug", "enable debug logging" )
        ( "list-fonts", "print font families installed in the system" )
        ;

    po::options_description signOptions( "Sign options" );
    signOptions.add_options()
        ( "width", po::value<double>()->default_value( 100 ), "sign width in mm" )
        ( "height", po::value<double>()->default_value( 25 ), "sign height in mm" )
        ( "font", po::value<std::string>()->default_value( "Arial" ), "font family or path to font file" )
        ( "font-size", po::value<double>(), "font size in mm (auto-calculated if not specified)" )
        ( "heaviness", po::value<int>()->default_value( 50 ), "text heaviness 0-100" )
        ( "bottom-thickness", po::value<double>()->default_value( 1.0 ), "bottom layer thickness in mm" )
        ( "top-thickness", po::value<double>()->default_value( 1.0 ), "top layer thickness in mm" )
        ( "corner-radius", po::value<double>()->default_value( 2.0 ), "radius of sign corners in mm" )
        ( "no-auto-size", "disable automatic font sizing" )
        ( "strict-font", "fail if the font is not installed instead of using a similar one" )
        ;

    po::options_description extraOptions( "Settings and output" );
    extraOptions.add_options()
        ( "config", po::value<std::string>(), "path to config file with presets and validation ranges" )
        ( "preset", po::value<std::string>(), "start from stored preset" )
        ( "save-preset", po::value<std::string>(), "store parameters as named preset" )
        ( "preview-svg", "save 2D preview of the sign in SVG file" )
        ( "ascii", "write textual STL files" )
        ;

    po::options_description allOptions( "Available options" );
    allOptions.add( generalOptions ).add( signOptions ).add( extraOptions );

    po::positional_options_description p;
    p.add( "text", 1 );

    po::variables_map vm;
    try
    {
        po::store( po::command_line_parser( argc, argv ).options( allOptions ).positional( p ).run(), vm );
        po::notify( vm );
    }
    catch ( const po::error& e )
    {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage( allOptions );
        return 1;
    }

    if ( vm.count( "help" ) )
    {
        printUsage( allOptions );
        return 0;
    }

    DS::setupLoggerByDefault( vm.count( "debug" ) > 0 );

    if ( vm.count( "list-fonts" ) )
    {
        for ( const auto& family : DS::availableFontFamilies() )
            std::cout << family << "\n";
        return 0;
    }

    if ( !vm.count( "text" ) )
    {
        printUsage( allOptions );
        return 1;
    }

    const bool useConfig = vm.count( "config" ) || vm.count( "preset" ) || vm.count( "save-preset" );
    auto& config = DS::Config::instance();
    if ( useConfig )
    {
        DS::setupSignConfigDefaults( config );
        if ( vm.count( "config" ) )
            config.resetToFile( DS::pathFromUtf8( vm["config"].as<std::string>() ) );
        else
            config.reset( DS::cSignAppName );
    }

    DS::SignParams params;
    bool presetLoaded = false;
    if ( vm.count( "preset" ) )
    {
        const auto name = vm["preset"].as<std::string>();
        auto preset = config.loadPreset( name );
        if ( !preset )
        {
            std::cerr << "\n\xE2\x9D\x8C Error: Preset '" << name << "' not found\n";
            return 1;
        }
        DS::deserializeFromJson( *preset, params );
        presetLoaded = true;
    }
    applyOptions( vm, presetLoaded, params );

    if ( vm.count( "save-preset" ) )
    {
        Json::Value preset;
        DS::serializeToJson( params, preset );
        config.savePreset( vm["save-preset"].as<std::string>(), preset );
        if ( auto res = config.writeToFile(); !res )
            spdlog::warn( res.error() );
    }

    DS::SignGeneratorSettings settings;
    settings.outputDir = DS::pathFromUtf8( vm["output-dir"].as<std::string>() );
    settings.allowFontFallback = !vm.count( "strict-font" );
    settings.asciiStl = vm.count( "ascii" ) > 0;
    if ( useConfig )
        settings.ranges = DS::loadValidationRanges( config );
    const DS::SignGenerator generator( settings );

    spdlog::info( "Generating sign: '{}'", params.text );
    auto sign = generator.generate( params, true );
    if ( !sign )
    {
        spdlog::error( "Generation failed: {}", sign.error().what() );
        std::cerr << "\n\xE2\x9D\x8C Error: " << sign.error().what() << "\n";
        return 1;
    }

    auto files = generator.exportStl( *sign, params.text, params.heaviness );
    if ( !files )
    {
        spdlog::error( "Generation failed: {}", files.error().what() );
        std::cerr << "\n\xE2\x9D\x8C Error: " << files.error().what() << "\n";
        return 1;
    }

    if ( vm.count( "preview-svg" ) )
    {
        auto svgPath = generator.stlPath( params.text, params.heaviness, DS::SignLayer::Combined );
        svgPath.replace_extension( ".svg" );
        if ( auto res = DS::savePreviewSvg( *sign, svgPath ); !res )
        {
            spdlog::error( "Preview export failed: {}", res.error() );
            std::cerr << "\n\xE2\x9D\x8C Error: " << res.error() << "\n";
            return 1;
        }
        files->push_back( svgPath );
    }

    std::cout << "\n\xE2\x9C\x85 Successfully generated " << files->size() << " files:\n";
    for ( const auto& file : *files )
        std::cout << "  - " << DS::utf8string( file.filename() ) << "\n";
    std::cout << "\nFiles saved to: " << DS::utf8string( generator.outputDir() ) << "\n";
    return 0;
}

int main( int argc, char **argv )
{
    try
    {
        return mainInternal( argc, argv );
    }
    catch ( const std::exception& e )
    {
        std::cerr << "Exception: " << boost::diagnostic_information( e );
        return 1;
    }
}
