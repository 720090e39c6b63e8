#include "semroute/cli/app.hpp"

int main(int argc, char** argv) {
    semroute::cli::App app;
    return app.run(argc, argv);
}
