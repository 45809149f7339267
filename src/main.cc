#include "arguments.hpp"
#include "engine.hpp"

int main(int argc, char *argv[]) {
    Arguments arguments{argc, argv};
    return runEngine(arguments);
}
