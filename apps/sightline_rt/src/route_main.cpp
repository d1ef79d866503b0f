#include "sightline_rt/route_app.hpp"
#include <cstdio>
#include <cstdlib>
#include <print>

int main(int argc, char **argv) {
    try {
        sightline_rt::RouteApp app(argc, argv);
        return app.Launch();
    } catch(std::exception &e) {
        std::println(stderr, "Uncaught exception: {}", e.what());
        return EXIT_FAILURE;
    }
}
