// tests/test_main.cpp
//
// Only translation unit in citadel_tests that defines DOCTEST_CONFIG_IMPLEMENT.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

int main(int argc, char** argv)
{
    doctest::Context context;
    context.setOption("order-by", "file");
    context.applyCommandLine(argc, argv);

    return context.run();
}
