#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest.h"

int main(int argc, const char** argv)
{
    doctest::Context context;
    context.applyCommandLine(argc, argv);

    int test_result = context.run(); // run queries, or run tests unless --no-run

    if (context.shouldExit()) // honor query flags and --exit
        return test_result;

    return test_result;
}
