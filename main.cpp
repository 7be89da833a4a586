#include "app/StreamScribeApp.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        streamscribe::app::StreamScribeApp app(std::cout, std::cerr);
        return app.Run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[StreamScribe] Fatal: " << e.what() << std::endl;
        return 1;
    }
}
