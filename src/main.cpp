#include "core/app.hpp"

int main(int argc, char** argv) {
    kindle::App app;
    return app.run(argc, argv);
}
