#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "spdlog/spdlog.h"

// Test executable for all of the ferry unit tests, which live beside their sources as *_unittests.cpp files.
int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::debug);
    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
