#include "DSSignSession.h"
#include "DSSignGenerator.h"
#include "DSSignSettings.h"
#include "DSFontParams.h"
#include "DSMesh/DSConfig.h"
#include "DSMesh/DSStringConvert.h"
#include "DSPch/DSJson.h"
#include "DSPch/DSSpdlog.h"

#include <algorithm>

namespace DS
{

namespace
{

const std::vector<std::string>& coreFonts()
{
    static const std::vector<std::string> fonts =
    {
        "Arial", "Helvetica", "Verdana", "Tahoma", "Impact", "Trebuchet MS"
    };
    return fonts;
}

const std::vector<std::string>& platformFonts()
{
#if defined( __APPLE__ )
    static const std::vector<std::string> fonts =
    {
        "Helvetica Neue", "Avenir", "Futura", "Gill Sans", "SF Pro Display"
    };
#elif defined( _WIN32 )
    static const std::vector<std::string> fonts =
    {
        "Calibri", "Segoe UI", "Century Gothic", "Franklin Gothic"
    };
#else
    static const std::vector<std::string> fonts =
    {
        "DejaVu Sans", "Liberation Sans", "Ubuntu", "Cantarell"
    };
#endif
    return fonts;
}

} //anonymous namespace

SignSession::SignSession( Config& config )
    : config_( config )
{
    setupSignConfigDefaults( config_ );
    loadDefaults();
}

void SignSession::loadDefaults()
{
    params_ = loadDefaultParams( config_ );
}

void SignSession::saveCurrentAsDefaults()
{
    saveDefaultParams( config_, params_ );
}

void SignSession::resetToDefaults()
{
    params_ = SignParams{};
    params_.fontSize = 16.0;
    deserializeFromJson( getDefaultSignConfig()["defaults"], params_ );
    status_ = "Reset to defaults";
}

bool SignSession::setHeavinessPreset( const std::string& preset )
{
    const auto value = heavinessFromPreset( preset );
    if ( !value )
        return false;
    params_.heaviness = *value;
    return true;
}

std::string SignSession::heavinessLabel() const
{
    return fmt::format( "Text Weight: {} ({})", heavinessPresetName( params_.heaviness ), params_.heaviness );
}

std::vector<std::string> SignSession::availableFonts() const
{
    std::vector<std::string> res = coreFonts();
    res.insert( res.end(), platformFonts().begin(), platformFonts().end() );
    for ( auto& f : getFavoriteFonts( config_ ) )
        res.push_back( std::move( f ) );
    std::sort( res.begin(), res.end() );
    res.erase( std::unique( res.begin(), res.end() ), res.end() );
    return res;
}

bool SignSession::setFontPreset( const std::string& font )
{
    const auto fonts = availableFonts();
    if ( std::find( fonts.begin(), fonts.end(), font ) == fonts.end() )
        return false;
    params_.fontFamily = font;
    return true;
}

InputCheck SignSession::validateInputs() const
{
    const SignValidator validator( loadValidationRanges( config_ ) );
    const bool autoSize = params_.isAutoSize();
    const double fontSize = autoSize ? 12.0 : *params_.fontSize;

    InputCheck res;
    res.report = validator.preValidateAll( params_.text, params_.width, params_.height, fontSize,
        params_.heaviness, params_.bottomThickness, params_.topThickness, autoSize );
    for ( const auto& w : res.report.warnings )
        spdlog::warn( w );

    if ( res.report.valid && !autoSize )
    {
        res.cutThrough = validator.willTextCutThrough( params_.text, fontSize, params_.heaviness,
            params_.width, params_.height, params_.topThickness );
        res.needsConfirmation = res.cutThrough->willCut && res.cutThrough->confidence > 70;
    }
    return res;
}

GenerationStart SignSession::startGeneration( bool cutThroughConfirmed )
{
    if ( worker_.isOrdered() )
        return GenerationStart::Busy;

    const auto check = validateInputs();
    if ( !check.report.valid )
    {
        lastMessage_.clear();
        for ( const auto& e : check.report.errors )
        {
            if ( !lastMessage_.empty() )
                lastMessage_ += '\n';
            lastMessage_ += e;
        }
        status_ = "Validation failed";
        return GenerationStart::InvalidInputs;
    }
    if ( check.needsConfirmation && !cutThroughConfirmed )
    {
        lastMessage_ = fmt::format( "Text may cut completely through the top layer (confidence: {}%).\n"
            "This will cause the top layer STL export to fail.", check.cutThrough->confidence );
        return GenerationStart::NeedsConfirmation;
    }

    SignGeneratorSettings settings;
    settings.outputDir = pathFromUtf8( getOutputDirectory( config_ ) );
    settings.ranges = loadValidationRanges( config_ );
    status_ = "Generating STL files...";

    const bool started = worker_.order( "Generate sign", [this, settings, params = params_] () -> std::function<void()>
    {
        const SignGenerator generator( settings );
        auto sign = generator.generate( params, true );
        if ( !sign )
        {
            auto msg = sign.error().what();
            spdlog::error( "Generation failed: {}", msg );
            return [this, msg] { onGenerationFailed_( msg ); };
        }
        auto files = generator.exportStl( *sign, params.text, params.heaviness );
        if ( !files )
        {
            auto msg = files.error().what();
            spdlog::error( "Generation failed: {}", msg );
            return [this, msg] { onGenerationFailed_( msg ); };
        }
        return [this, created = std::move( *files ), dir = settings.outputDir] () mutable
        {
            onGenerationComplete_( std::move( created ), dir );
        };
    }, [this] ( const std::string& msg ) { onGenerationFailed_( msg ); } );
    return started ? GenerationStart::Started : GenerationStart::Busy;
}

bool SignSession::processFinished()
{
    return worker_.processFinished();
}

void SignSession::waitForGeneration()
{
    worker_.wait();
}

void SignSession::onGenerationComplete_( std::vector<std::filesystem::path> files, const std::filesystem::path& outputDir )
{
    lastFailed_ = false;
    status_ = fmt::format( "\xE2\x9C\x85 Generated {} files", files.size() );

    std::string fileList;
    for ( const auto& f : files )
    {
        if ( !fileList.empty() )
            fileList += '\n';
        fileList += utf8string( f.filename() );
    }
    lastMessage_ = fmt::format( "STL files generated successfully!\n\nCreated files:\n{}\n\nFiles saved to: {}",
        fileList, utf8string( outputDir ) );

    if ( !files.empty() )
        config_.pushFileStack( "recent_files", files.front() );
    lastCreatedFiles_ = std::move( files );
}

void SignSession::onGenerationFailed_( const std::string& errorMsg )
{
    lastFailed_ = true;
    lastCreatedFiles_.clear();
    status_ = "\xE2\x9D\x8C Generation failed";
    if ( toLower( errorMsg ).find( "text cutout may have removed all material" ) != std::string::npos )
    {
        lastMessage_ =
            "Text has cut completely through the top layer!\n\n"
            "Try one of these solutions:\n"
            "\xE2\x80\xA2 Reduce font size\n"
            "\xE2\x80\xA2 Reduce text heaviness\n"
            "\xE2\x80\xA2 Increase top layer thickness\n"
            "\xE2\x80\xA2 Use shorter text";
    }
    else
    {
        lastMessage_ = "Failed to generate STL files:\n\n" + errorMsg;
    }
}

std::vector<std::filesystem::path> SignSession::recentFiles() const
{
    return config_.getFileStack( "recent_files" );
}

void SignSession::savePreset( const std::string& name )
{
    Json::Value preset{ Json::objectValue };
    serializeToJson( params_, preset );
    config_.savePreset( name, preset );
}

bool SignSession::loadPreset( const std::string& name )
{
    const auto preset = config_.loadPreset( name );
    if ( !preset )
        return false;
    deserializeFromJson( *preset, params_ );
    status_ = "Preset loaded";
    return true;
}

bool SignSession::deletePreset( const std::string& name )
{
    return config_.deletePreset( name );
}

bool SignSession::renamePreset( const std::string& oldName, const std::string& newName )
{
    return config_.renamePreset( oldName, newName );
}

std::vector<std::string> SignSession::presetNames() const
{
    return config_.getPresetNames();
}

Expected<void> SignSession::exportSettings( const std::filesystem::path& path ) const
{
    return config_.exportToFile( path );
}

Expected<void> SignSession::importSettings( const std::filesystem::path& path )
{
    DS_RETURN_IF_UNEXPECTED( config_.importFromFile( path ) )
    loadDefaults();
    return {};
}

SuggestedParams SignSession::suggestOptimalParameters() const
{
    return SignValidator( loadValidationRanges( config_ ) ).suggestParameters( params_.text, params_.width, params_.height );
}

void SignSession::applySuggestion( const SuggestedParams& suggestion )
{
    params_.fontSize = suggestion.fontSize;
    params_.heaviness = suggestion.heaviness;
    params_.autoSize = suggestion.autoSize;
    params_.bottomThickness = suggestion.bottomThickness;
    params_.topThickness = suggestion.topThickness;
}

PreviewLayout SignSession::preview() const
{
    return calcPreviewLayout( params_ );
}

} //namespace DS
