/**
 * @file    main.cpp
 * @brief   BoxAnnotator - Entry Point
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Entry point of the dataset command-line tool. The interactive editor
 * embeds bxa_core directly and does not go through here.
 */

#include "cli/cli_app.hpp"

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace {

// =============================================================================
// Platform-specific console setup
// =============================================================================

void setup_console() {
#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut != INVALID_HANDLE_VALUE) {
        DWORD dwMode = 0;
        if (GetConsoleMode(hOut, &dwMode)) {
            dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
            SetConsoleMode(hOut, dwMode);
        }
    }
#endif
}

}  // anonymous namespace

int main(int argc, char** argv) {

    // Set up console for platforms
    setup_console();

    return bxa::cli::run(argc, argv);
}
