#include <DSSign/DSFontParams.h>
#include <DSMesh/DSGTest.h>
#include <string>

namespace DS
{

TEST( DSSign, HeavinessLabels )
{
    EXPECT_EQ( weightLabel( 0 ), "light" );
    EXPECT_EQ( weightLabel( 25 ), "light" );
    EXPECT_EQ( weightLabel( 26 ), "regular" );
    EXPECT_EQ( weightLabel( 50 ), "regular" );
    EXPECT_EQ( weightLabel( 75 ), "bold" );
    EXPECT_EQ( weightLabel( 76 ), "extrabold" );
    EXPECT_EQ( weightLabel( 100 ), "extrabold" );

    EXPECT_EQ( heavinessPresetName( 10 ), "Light" );
    EXPECT_EQ( heavinessPresetName( 50 ), "Regular" );
    EXPECT_EQ( heavinessPresetName( 60 ), "Bold" );
    EXPECT_EQ( heavinessPresetName( 90 ), "Extra Bold" );
}

TEST( DSSign, HeavinessPresets )
{
    EXPECT_EQ( heavinessFromPreset( "Light" ), 15 );
    EXPECT_EQ( heavinessFromPreset( "Regular" ), 50 );
    EXPECT_EQ( heavinessFromPreset( "Bold" ), 75 );
    EXPECT_EQ( heavinessFromPreset( "Extra Bold" ), 90 );
    EXPECT_FALSE( heavinessFromPreset( "Heavy" ).has_value() );

    for ( const char* name : { "Light", "Regular", "Bold", "Extra Bold" } )
        EXPECT_EQ( heavinessPresetName( *heavinessFromPreset( name ) ), name );
}

TEST( DSSign, FontParamsByHeaviness )
{
    auto light = calcFontParams( 0, "Arial" );
    EXPECT_EQ( light.fontFamily, "Arial" );
    EXPECT_EQ( light.style, FontStyle::Light );
    EXPECT_DOUBLE_EQ( light.sizeMultiplier, 0.90 );
    EXPECT_DOUBLE_EQ( light.strokeOffset, 0.0 );
    EXPECT_DOUBLE_EQ( light.cutDepthMultiplier, 1.0 );

    EXPECT_DOUBLE_EQ( calcFontParams( 25, "Arial" ).sizeMultiplier, 0.95 );
    EXPECT_EQ( calcFontParams( 50, "Arial" ).style, FontStyle::Regular );
    EXPECT_DOUBLE_EQ( calcFontParams( 50, "Arial" ).sizeMultiplier, 1.05 );
    EXPECT_EQ( calcFontParams( 75, "Arial" ).style, FontStyle::Bold );
    EXPECT_EQ( calcFontParams( 100, "Arial" ).style, FontStyle::ExtraBold );
    EXPECT_DOUBLE_EQ( calcFontParams( 100, "Arial" ).sizeMultiplier, 1.35 );
    EXPECT_NEAR( calcFontParams( 60, "Arial" ).sizeMultiplier, 1.17, 1e-12 );

    for ( int h = 0; h <= 100; ++h )
    {
        const auto params = calcFontParams( h, "Arial" );
        double base = 0.90;
        if ( params.style == FontStyle::Regular )
            base = 1.00;
        else if ( params.style == FontStyle::Bold )
            base = 1.15;
        else if ( params.style == FontStyle::ExtraBold )
            base = 1.30;
        EXPECT_GE( params.sizeMultiplier, base ) << h;
        EXPECT_LE( params.sizeMultiplier, base + 0.05 + 1e-12 ) << h;
    }

    // heavier text is never smaller, also at the borders of the styles
    for ( int h = 0; h < 100; ++h )
        EXPECT_GT( calcFontParams( h + 1, "Arial" ).sizeMultiplier, calcFontParams( h, "Arial" ).sizeMultiplier ) << h;

    EXPECT_STREQ( asString( FontStyle::ExtraBold ), "ExtraBold" );
}

TEST( DSSign, FontWidthFactor )
{
    EXPECT_DOUBLE_EQ( fontWidthFactor( "Impact" ), 0.45 );
    EXPECT_DOUBLE_EQ( fontWidthFactor( "Verdana" ), 0.65 );
    EXPECT_DOUBLE_EQ( fontWidthFactor( "Unknown Sans" ), 0.55 );
}

TEST( DSSign, AutoFontSize )
{
    EXPECT_DOUBLE_EQ( calcAutoFontSize( "LABEL", 100, 25, "Arial", 50 ), 15.0 );
    EXPECT_DOUBLE_EQ( calcAutoFontSize( "AB\nCD", 100, 25, "Arial", 50 ), 7.5 );
    EXPECT_DOUBLE_EQ( calcAutoFontSize( "A", 500, 200, "Arial", 50 ), 50.0 );
    EXPECT_DOUBLE_EQ( calcAutoFontSize( std::string( 100, 'A' ), 100, 25, "Arial", 50 ), 5.0 );
    EXPECT_DOUBLE_EQ( calcAutoFontSize( "", 100, 25, "Arial", 50 ), 15.0 );

    // width-limited text gets smaller with heavier weight and wider font
    const double regular = calcAutoFontSize( "EMERGENCY EXIT", 100, 50, "Arial", 0 );
    EXPECT_GT( regular, calcAutoFontSize( "EMERGENCY EXIT", 100, 50, "Arial", 100 ) );
    EXPECT_GT( regular, calcAutoFontSize( "EMERGENCY EXIT", 100, 50, "Verdana", 0 ) );
    // codepoints are counted, not bytes
    EXPECT_DOUBLE_EQ( calcAutoFontSize( "ÄÖÜ", 30, 100, "Arial", 0 ), calcAutoFontSize( "AOU", 30, 100, "Arial", 0 ) );
}

} //namespace DS
