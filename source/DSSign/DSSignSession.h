#pragma once

#include "DSSignFwd.h"
#include "DSSignParams.h"
#include "DSSignValidator.h"
#include "DSSignPreview.h"
#include "DSSignWorker.h"
#include "DSMesh/DSExpected.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace DS
{

/// checks made before generation is started
struct InputCheck
{
    ValidationReport report;
    /// estimated only for manual font size
    std::optional<CutThroughEstimate> cutThrough;
    /// the user shall confirm generation because the text may cut through the top layer
    bool needsConfirmation = false;
};

enum class GenerationStart
{
    Started,
    InvalidInputs,
    NeedsConfirmation,
    Busy
};

/// state of the sign form: parameters backed by config, presets, recent files and background generation
class DSSIGN_CLASS SignSession
{
public:
    /// installs sign defaults in the config and loads form values from its "defaults" section
    DSSIGN_API explicit SignSession( Config& config );

    SignParams& params() { return params_; }
    const SignParams& params() const { return params_; }
    Config& config() { return config_; }

    /// loads form values from "defaults" section of the config
    DSSIGN_API void loadDefaults();
    /// stores form values in "defaults" section of the config
    DSSIGN_API void saveCurrentAsDefaults();
    /// sets form values from built-in defaults
    DSSIGN_API void resetToDefaults();

    /// sets heaviness of named preset (Light, Regular, Bold, Extra Bold), returns false for unknown name
    DSSIGN_API bool setHeavinessPreset( const std::string& preset );
    /// "Text Weight: {preset} ({value})"
    [[nodiscard]] DSSIGN_API std::string heavinessLabel() const;

    /// sorted unique font families: common ones, platform ones and favorites from config
    [[nodiscard]] DSSIGN_API std::vector<std::string> availableFonts() const;
    /// sets font family if it is in available fonts
    DSSIGN_API bool setFontPreset( const std::string& font );

    /// validates current form values, automatic size is checked with 12mm
    [[nodiscard]] DSSIGN_API InputCheck validateInputs() const;

    /// validates inputs and starts generation and export in background;
    /// if the text may cut through the top layer then generation is started only when confirmed
    DSSIGN_API GenerationStart startGeneration( bool cutThroughConfirmed = false );
    /// applies results of finished generation, call it periodically from the owner thread
    DSSIGN_API bool processFinished();
    /// blocks until the running generation finishes and applies its results
    DSSIGN_API void waitForGeneration();
    [[nodiscard]] bool isGenerating() const { return worker_.isOrdered(); }

    /// one line status, e.g. "Generated 3 files"
    const std::string& status() const { return status_; }
    /// detailed message of the last generation
    const std::string& lastMessage() const { return lastMessage_; }
    /// files created by the last successful generation
    const std::vector<std::filesystem::path>& lastCreatedFiles() const { return lastCreatedFiles_; }
    /// true if the last generation has failed
    bool lastGenerationFailed() const { return lastFailed_; }

    /// most recent first
    [[nodiscard]] DSSIGN_API std::vector<std::filesystem::path> recentFiles() const;

    /// stores current form values as named preset
    DSSIGN_API void savePreset( const std::string& name );
    /// applies named preset to the form, returns false if it does not exist
    DSSIGN_API bool loadPreset( const std::string& name );
    DSSIGN_API bool deletePreset( const std::string& name );
    DSSIGN_API bool renamePreset( const std::string& oldName, const std::string& newName );
    [[nodiscard]] DSSIGN_API std::vector<std::string> presetNames() const;

    /// writes whole config to given file
    DSSIGN_API Expected<void> exportSettings( const std::filesystem::path& path ) const;
    /// reads whole config from given file and reloads form values
    DSSIGN_API Expected<void> importSettings( const std::filesystem::path& path );

    /// recommends parameters for current text and dimensions
    [[nodiscard]] DSSIGN_API SuggestedParams suggestOptimalParameters() const;
    /// applies recommended font size, heaviness, thicknesses and auto-size flag
    DSSIGN_API void applySuggestion( const SuggestedParams& suggestion );

    /// canvas picture of current form values
    [[nodiscard]] DSSIGN_API PreviewLayout preview() const;

private:
    void onGenerationComplete_( std::vector<std::filesystem::path> files, const std::filesystem::path& outputDir );
    void onGenerationFailed_( const std::string& errorMsg );

    Config& config_;
    SignParams params_;
    std::string status_;
    std::string lastMessage_;
    std::vector<std::filesystem::path> lastCreatedFiles_;
    bool lastFailed_ = false;
    // the last member: its thread is joined before other members are destroyed
    SignWorker worker_;
};

} //namespace DS
