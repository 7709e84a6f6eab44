#include "pricesched/cli/app.hpp"

int main(int argc, char** argv) {
    pricesched::cli::App app;
    return app.run(argc, argv);
}
