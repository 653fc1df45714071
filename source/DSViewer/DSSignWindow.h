#pragma once

#include "DSSign/DSSignSession.h"

#include <array>
#include <string>
#include <vector>

struct ImVec2;

namespace DS
{

/// ImGui form of the sign: menu, parameter widgets, preview canvas and generation status;
/// it only draws and forwards user actions to the session
class SignWindow
{
public:
    explicit SignWindow( SignSession& session );

    /// draws the whole form in the main viewport and applies finished generation;
    /// returns false when the user has chosen to quit
    bool draw();

private:
    void drawMenuBar_();
    void drawForm_();
    void drawPreview_( const ImVec2& size );
    void drawStatus_();
    void drawPopups_();

    void generate_( bool cutThroughConfirmed );
    void showMessage_( std::string title, std::string text );

    SignSession& session_;
    std::vector<std::string> fonts_;

    std::array<char, 1024> textBuf_{};
    std::array<char, 256> presetNameBuf_{};
    std::array<char, 1024> pathBuf_{};

    enum class PathAction
    {
        Import,
        Export
    } pathAction_ = PathAction::Export;

    bool openSavePreset_ = false;
    bool openPath_ = false;
    bool openConfirmCut_ = false;
    bool openMessage_ = false;
    std::string messageTitle_;
    std::string messageText_;

    bool quit_ = false;
};

} //namespace DS
