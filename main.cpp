#include "app/ChronoLensApp.hpp"

#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    chronolens::app::ChronoLensApp app(std::move(args));
    return app.Run();
}
