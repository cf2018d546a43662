// Anima Engine - desktop pets
// Main entry point

#include "../include/App.h"
#include <iostream>

int main(int argc, char* argv[]) {
    AnimaEngine::App app;

    if (!app.Init(argc, argv)) {
        std::cerr << "Failed to initialize application" << std::endl;
        return 1;
    }

    app.Run();
    app.Shutdown();

    return 0;
}
