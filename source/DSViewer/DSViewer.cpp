#include "DSSignWindow.h"
#include "DSSign/DSSignSession.h"
#include "DSSign/DSSignSettings.h"
#include "DSMesh/DSConfig.h"
#include "DSMesh/DSSystem.h"
#include "DSPch/DSSpdlog.h"

#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>
#include <GLFW/glfw3.h>

#include <cstring>
#include <exception>
#include <iostream>

namespace
{

void glfwErrorCallback( int error, const char* description )
{
    spdlog::error( "GLFW error {}: {}", error, description );
}

DS::WindowGeometry currentGeometry( GLFWwindow* window, const DS::WindowGeometry& initial )
{
    auto res = initial;
    glfwGetWindowSize( window, &res.size.x, &res.size.y );
    DS::Vector2i pos;
    glfwGetWindowPos( window, &pos.x, &pos.y );
    res.position = pos;
    return res;
}

// returns process exit code
int runViewer( DS::Config& config )
{
    glfwSetErrorCallback( glfwErrorCallback );
    if ( !glfwInit() )
    {
        spdlog::error( "Failed to initialize GLFW" );
        return 1;
    }

    const auto geometry = DS::loadWindowGeometry( config );

    glfwDefaultWindowHints();
    glfwWindowHint( GLFW_CONTEXT_VERSION_MAJOR, 3 );
    glfwWindowHint( GLFW_CONTEXT_VERSION_MINOR, 3 );
    glfwWindowHint( GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE );
    glfwWindowHint( GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE );
    glfwWindowHint( GLFW_RESIZABLE, geometry.resizable ? GLFW_TRUE : GLFW_FALSE );

    GLFWwindow* window = glfwCreateWindow( geometry.size.x, geometry.size.y,
        "DuoSign - Bi-Color Sign Generator", nullptr, nullptr );
    if ( !window )
    {
        spdlog::error( "Failed creating main window" );
        glfwTerminate();
        return 1;
    }
    glfwSetWindowSizeLimits( window, geometry.minSize.x, geometry.minSize.y, GLFW_DONT_CARE, GLFW_DONT_CARE );
    if ( geometry.position )
        glfwSetWindowPos( window, geometry.position->x, geometry.position->y );

    glfwMakeContextCurrent( window );
    glfwSwapInterval( 1 );

    ImGuiContext* guiContext = ImGui::CreateContext();
    ImGui::SetCurrentContext( guiContext );
    ImGui::GetIO().IniFilename = nullptr;
    ImGui::StyleColorsLight();

    if ( !ImGui_ImplGlfw_InitForOpenGL( window, true ) )
    {
        spdlog::error( "Failed to initialize Dear ImGui" );
        ImGui::DestroyContext( guiContext );
        glfwDestroyWindow( window );
        glfwTerminate();
        return 1;
    }
    if ( !ImGui_ImplOpenGL3_Init( "#version 150" ) )
    {
        spdlog::error( "Failed to initialize OpenGL for Dear ImGui" );
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext( guiContext );
        glfwDestroyWindow( window );
        glfwTerminate();
        return 1;
    }

    {
        DS::SignSession session( config );
        DS::SignWindow signWindow( session );
        spdlog::info( "Main window opened" );

        bool running = true;
        while ( running && !glfwWindowShouldClose( window ) )
        {
            // wake up regularly to pick up the result of background generation
            glfwWaitEventsTimeout( 1.0 / 30.0 );

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            running = signWindow.draw();

            ImGui::Render();
            int bufSize[2];
            glfwGetFramebufferSize( window, &bufSize[0], &bufSize[1] );
            glViewport( 0, 0, bufSize[0], bufSize[1] );
            glClearColor( 0.94f, 0.94f, 0.94f, 1.0f );
            glClear( GL_COLOR_BUFFER_BIT );
            ImGui_ImplOpenGL3_RenderDrawData( ImGui::GetDrawData() );
            glfwSwapBuffers( window );
        }

        if ( session.isGenerating() )
        {
            spdlog::info( "Waiting for generation to finish" );
            session.waitForGeneration();
        }
        DS::saveWindowGeometry( config, currentGeometry( window, geometry ) );
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext( guiContext );
    glfwDestroyWindow( window );
    glfwTerminate();

    if ( auto res = config.writeToFile(); !res )
        spdlog::warn( "Cannot save settings: {}", res.error() );
    spdlog::info( "Main window closed" );
    return 0;
}

} //anonymous namespace

int main( int argc, char** argv )
{
    bool verbose = false;
    for ( int i = 1; i < argc; ++i )
        if ( std::strcmp( argv[i], "--debug" ) == 0 )
            verbose = true;

    try
    {
        DS::setupLoggerByDefault( verbose );
        auto& config = DS::Config::instance();
        config.reset( DS::cSignAppName );
        return runViewer( config );
    }
    catch ( const std::exception& e )
    {
        std::cerr << "Exception: " << e.what() << "\n";
        return 1;
    }
}
