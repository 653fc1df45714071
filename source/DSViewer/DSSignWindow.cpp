#include "DSSignWindow.h"
#include "DSSign/DSSignPreview.h"
#include "DSMesh/DSConfig.h"
#include "DSMesh/DSStringConvert.h"
#include "DSPch/DSFmt.h"
#include "DSPch/DSSpdlog.h"

#include <imgui.h>

#include <algorithm>
#include <cfloat>
#include <cstdlib>
#include <cstring>

namespace DS
{

namespace
{

constexpr float cFormWidth = 380;
constexpr float cStatusHeight = 60;

// "#RRGGBB" to packed ImGui color, black for malformed strings
ImU32 toImColor( const std::string& hex )
{
    if ( hex.size() != 7 || hex[0] != '#' )
        return IM_COL32( 0, 0, 0, 255 );
    const auto value = std::strtoul( hex.c_str() + 1, nullptr, 16 );
    return IM_COL32( ( value >> 16 ) & 0xFF, ( value >> 8 ) & 0xFF, value & 0xFF, 255 );
}

template <size_t N>
void copyToBuffer( const std::string& str, std::array<char, N>& buf )
{
    const auto len = std::min( str.size(), N - 1 );
    std::memcpy( buf.data(), str.data(), len );
    buf[len] = '\0';
}

void saveConfig( Config& config )
{
    if ( auto res = config.writeToFile(); !res )
        spdlog::warn( "Cannot save settings: {}", res.error() );
}

} //anonymous namespace

SignWindow::SignWindow( SignSession& session )
    : session_( session )
    , fonts_( session.availableFonts() )
{
}

bool SignWindow::draw()
{
    if ( session_.processFinished() )
        showMessage_( session_.lastGenerationFailed() ? "Error" : "Success", session_.lastMessage() );

    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos( viewport->WorkPos );
    ImGui::SetNextWindowSize( viewport->WorkSize );
    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_MenuBar;
    ImGui::Begin( "DuoSign", nullptr, flags );

    drawMenuBar_();

    const ImVec2 avail = ImGui::GetContentRegionAvail();
    ImGui::BeginChild( "Form", ImVec2( cFormWidth, avail.y - cStatusHeight ), true );
    drawForm_();
    ImGui::EndChild();

    ImGui::SameLine();
    ImGui::BeginChild( "Preview", ImVec2( 0, avail.y - cStatusHeight ), true );
    drawPreview_( ImGui::GetContentRegionAvail() );
    ImGui::EndChild();

    drawStatus_();
    drawPopups_();

    ImGui::End();
    return !quit_;
}

void SignWindow::drawMenuBar_()
{
    if ( !ImGui::BeginMenuBar() )
        return;

    if ( ImGui::BeginMenu( "File" ) )
    {
        if ( ImGui::MenuItem( "Import Settings..." ) )
        {
            pathAction_ = PathAction::Import;
            openPath_ = true;
        }
        if ( ImGui::MenuItem( "Export Settings..." ) )
        {
            pathAction_ = PathAction::Export;
            openPath_ = true;
        }
        if ( ImGui::BeginMenu( "Recent Files" ) )
        {
            const auto recent = session_.recentFiles();
            if ( recent.empty() )
                ImGui::MenuItem( "(empty)", nullptr, false, false );
            for ( const auto& file : recent )
                ImGui::MenuItem( utf8string( file ).c_str(), nullptr, false, false );
            ImGui::EndMenu();
        }
        ImGui::Separator();
        if ( ImGui::MenuItem( "Exit" ) )
            quit_ = true;
        ImGui::EndMenu();
    }

    if ( ImGui::BeginMenu( "Presets" ) )
    {
        if ( ImGui::MenuItem( "Save Preset..." ) )
        {
            presetNameBuf_[0] = '\0';
            openSavePreset_ = true;
        }
        const auto names = session_.presetNames();
        if ( ImGui::BeginMenu( "Load Preset", !names.empty() ) )
        {
            for ( const auto& name : names )
                if ( ImGui::MenuItem( name.c_str() ) && !session_.loadPreset( name ) )
                    showMessage_( "Error", fmt::format( "Preset '{}' not found", name ) );
            ImGui::EndMenu();
        }
        if ( ImGui::BeginMenu( "Delete Preset", !names.empty() ) )
        {
            for ( const auto& name : names )
            {
                if ( ImGui::MenuItem( name.c_str() ) && session_.deletePreset( name ) )
                    saveConfig( session_.config() );
            }
            ImGui::EndMenu();
        }
        ImGui::EndMenu();
    }

    if ( ImGui::BeginMenu( "Settings" ) )
    {
        if ( ImGui::MenuItem( "Suggest Parameters" ) )
            session_.applySuggestion( session_.suggestOptimalParameters() );
        if ( ImGui::MenuItem( "Save as Defaults" ) )
        {
            session_.saveCurrentAsDefaults();
            saveConfig( session_.config() );
        }
        if ( ImGui::MenuItem( "Reset to Defaults" ) )
            session_.resetToDefaults();
        ImGui::EndMenu();
    }

    ImGui::EndMenuBar();
}

void SignWindow::drawForm_()
{
    auto& params = session_.params();

    // the text can be replaced by presets, import or reset
    if ( params.text != textBuf_.data() )
        copyToBuffer( params.text, textBuf_ );

    ImGui::TextUnformatted( "Sign Text" );
    if ( ImGui::InputTextMultiline( "##Text", textBuf_.data(), textBuf_.size(), ImVec2( -FLT_MIN, 70 ) ) )
        params.text = textBuf_.data();

    ImGui::Separator();
    ImGui::TextUnformatted( "Dimensions" );
    ImGui::InputDouble( "Width (mm)", &params.width, 1.0, 10.0, "%.1f" );
    ImGui::InputDouble( "Height (mm)", &params.height, 1.0, 10.0, "%.1f" );
    ImGui::InputDouble( "Corner Radius (mm)", &params.cornerRadius, 0.5, 1.0, "%.1f" );

    ImGui::Separator();
    ImGui::TextUnformatted( "Font" );
    if ( ImGui::BeginCombo( "Family", params.fontFamily.c_str() ) )
    {
        for ( const auto& font : fonts_ )
        {
            const bool selected = font == params.fontFamily;
            if ( ImGui::Selectable( font.c_str(), selected ) )
                session_.setFontPreset( font );
            if ( selected )
                ImGui::SetItemDefaultFocus();
        }
        ImGui::EndCombo();
    }

    ImGui::Checkbox( "Auto-size font", &params.autoSize );
    ImGui::BeginDisabled( params.autoSize );
    double fontSize = params.fontSize.value_or( 16.0 );
    if ( ImGui::InputDouble( "Font Size (mm)", &fontSize, 0.5, 2.0, "%.1f" ) )
        params.fontSize = fontSize;
    ImGui::EndDisabled();

    ImGui::Separator();
    ImGui::TextUnformatted( session_.heavinessLabel().c_str() );
    ImGui::SliderInt( "##Heaviness", &params.heaviness, 0, 100 );
    bool first = true;
    for ( const char* preset : { "Light", "Regular", "Bold", "Extra Bold" } )
    {
        if ( !first )
            ImGui::SameLine();
        first = false;
        if ( ImGui::Button( preset ) )
            session_.setHeavinessPreset( preset );
    }

    ImGui::Separator();
    ImGui::TextUnformatted( "Layer Thickness" );
    ImGui::InputDouble( "Bottom (mm)", &params.bottomThickness, 0.1, 0.5, "%.2f" );
    ImGui::InputDouble( "Top (mm)", &params.topThickness, 0.1, 0.5, "%.2f" );

    ImGui::Separator();
    const auto check = session_.validateInputs();
    for ( const auto& error : check.report.errors )
        ImGui::TextColored( ImVec4( 0.9f, 0.2f, 0.2f, 1.0f ), "%s", error.c_str() );
    for ( const auto& warning : check.report.warnings )
        ImGui::TextColored( ImVec4( 0.95f, 0.6f, 0.1f, 1.0f ), "%s", warning.c_str() );
    if ( check.cutThrough && check.cutThrough->willCut )
        ImGui::TextColored( ImVec4( 0.95f, 0.6f, 0.1f, 1.0f ),
            "Text may cut through the top layer (confidence: %d%%)", check.cutThrough->confidence );

    ImGui::Spacing();
    ImGui::BeginDisabled( session_.isGenerating() );
    if ( ImGui::Button( "Generate STL Files", ImVec2( -FLT_MIN, 0 ) ) )
        generate_( false );
    ImGui::EndDisabled();
}

void SignWindow::drawPreview_( const ImVec2& size )
{
    if ( size.x <= 0 || size.y <= 0 )
        return;
    const auto& params = session_.params();
    const auto layout = calcPreviewLayout( params, Vector2d( size.x, size.y ) );

    const ImVec2 origin = ImGui::GetCursorScreenPos();
    ImGui::InvisibleButton( "##Canvas", size );
    ImDrawList* drawList = ImGui::GetWindowDrawList();
    auto toScreen = [&origin] ( const Vector2d& p )
    {
        return ImVec2( origin.x + float( p.x ), origin.y + float( p.y ) );
    };

    drawList->AddRectFilled( origin, ImVec2( origin.x + size.x, origin.y + size.y ), IM_COL32( 255, 255, 255, 255 ) );
    if ( layout.plateRect.valid() )
    {
        const float rounding = float( params.cornerRadius * layout.scale );
        const ImVec2 p0 = toScreen( layout.plateRect.min );
        const ImVec2 p1 = toScreen( layout.plateRect.max );
        drawList->AddRectFilled( p0, p1, toImColor( layout.plateFill ), rounding );
        drawList->AddRect( p0, p1, toImColor( layout.plateOutline ), rounding );
    }

    ImFont* font = ImGui::GetFont();
    const float fontSize = float( layout.fontSize );
    const ImU32 textColor = toImColor( layout.textColor );
    const auto lines = split( params.text, '\n' );
    const float lineHeight = fontSize;
    const float top = float( layout.textCenter.y ) - 0.5f * lineHeight * float( lines.size() );
    for ( size_t i = 0; i < lines.size(); ++i )
    {
        const auto& line = lines[i];
        const ImVec2 lineSize = font->CalcTextSizeA( fontSize, FLT_MAX, 0.0f, line.c_str() );
        const ImVec2 linePos( origin.x + float( layout.textCenter.x ) - 0.5f * lineSize.x,
            origin.y + top + lineHeight * float( i ) );
        for ( const auto& offset : layout.textOffsets )
            drawList->AddText( font, fontSize, ImVec2( linePos.x + float( offset.x ), linePos.y + float( offset.y ) ),
                textColor, line.c_str() );
    }

    const ImVec2 captionSize = ImGui::CalcTextSize( layout.dimensionCaption.c_str() );
    const ImVec2 captionPos = toScreen( layout.captionPos );
    drawList->AddText( ImVec2( captionPos.x - 0.5f * captionSize.x, captionPos.y - 0.5f * captionSize.y ),
        IM_COL32( 80, 80, 80, 255 ), layout.dimensionCaption.c_str() );
}

void SignWindow::drawStatus_()
{
    ImGui::Separator();
    if ( session_.isGenerating() )
        ImGui::TextUnformatted( "Generating STL files..." );
    else
        ImGui::TextUnformatted( session_.status().empty() ? "Ready" : session_.status().c_str() );
    const auto& files = session_.lastCreatedFiles();
    if ( !files.empty() )
        ImGui::TextDisabled( "Last output: %s", utf8string( files.front().parent_path() ).c_str() );
}

void SignWindow::drawPopups_()
{
    if ( openSavePreset_ )
    {
        ImGui::OpenPopup( "Save Preset" );
        openSavePreset_ = false;
    }
    if ( openPath_ )
    {
        ImGui::OpenPopup( "Settings File" );
        openPath_ = false;
    }
    if ( openConfirmCut_ )
    {
        ImGui::OpenPopup( "Warning" );
        openConfirmCut_ = false;
    }
    if ( openMessage_ )
    {
        ImGui::OpenPopup( "###Message" );
        openMessage_ = false;
    }

    if ( ImGui::BeginPopupModal( "Save Preset", nullptr, ImGuiWindowFlags_AlwaysAutoResize ) )
    {
        ImGui::InputText( "Preset name", presetNameBuf_.data(), presetNameBuf_.size() );
        const std::string name = presetNameBuf_.data();
        ImGui::BeginDisabled( name.empty() );
        if ( ImGui::Button( "Save" ) )
        {
            session_.savePreset( name );
            saveConfig( session_.config() );
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndDisabled();
        ImGui::SameLine();
        if ( ImGui::Button( "Cancel" ) )
            ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
    }

    if ( ImGui::BeginPopupModal( "Settings File", nullptr, ImGuiWindowFlags_AlwaysAutoResize ) )
    {
        const bool importing = pathAction_ == PathAction::Import;
        ImGui::TextUnformatted( importing ? "Import settings from JSON file" : "Export settings to JSON file" );
        ImGui::InputText( "Path", pathBuf_.data(), pathBuf_.size() );
        if ( ImGui::Button( importing ? "Import" : "Export" ) )
        {
            const auto path = pathFromUtf8( pathBuf_.data() );
            auto res = importing ? session_.importSettings( path ) : session_.exportSettings( path );
            ImGui::CloseCurrentPopup();
            if ( !res )
                showMessage_( "Error", res.error() );
            else if ( importing )
                saveConfig( session_.config() );
        }
        ImGui::SameLine();
        if ( ImGui::Button( "Cancel" ) )
            ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
    }

    if ( ImGui::BeginPopupModal( "Warning", nullptr, ImGuiWindowFlags_AlwaysAutoResize ) )
    {
        ImGui::TextUnformatted( session_.lastMessage().c_str() );
        ImGui::TextUnformatted( "Do you want to continue anyway?" );
        if ( ImGui::Button( "Yes" ) )
        {
            ImGui::CloseCurrentPopup();
            generate_( true );
        }
        ImGui::SameLine();
        if ( ImGui::Button( "No" ) )
            ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
    }

    const std::string messageId = messageTitle_ + "###Message";
    if ( ImGui::BeginPopupModal( messageId.c_str(), nullptr, ImGuiWindowFlags_AlwaysAutoResize ) )
    {
        ImGui::TextUnformatted( messageText_.c_str() );
        if ( ImGui::Button( "OK" ) )
            ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
    }
}

void SignWindow::generate_( bool cutThroughConfirmed )
{
    switch ( session_.startGeneration( cutThroughConfirmed ) )
    {
    case GenerationStart::Started:
        break;
    case GenerationStart::InvalidInputs:
        showMessage_( "Validation Error", session_.lastMessage() );
        break;
    case GenerationStart::NeedsConfirmation:
        openConfirmCut_ = true;
        break;
    case GenerationStart::Busy:
        spdlog::info( "Generation is already running" );
        break;
    }
}

void SignWindow::showMessage_( std::string title, std::string text )
{
    messageTitle_ = std::move( title );
    messageText_ = std::move( text );
    openMessage_ = true;
}

} //namespace DS
