#include "paddock/app.hpp"

int main(int argc, char *argv[]) {
    paddock::App app;
    return app.run(argc, argv);
}
