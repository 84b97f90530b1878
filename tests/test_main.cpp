// Only translation unit in hustle_tests that implements doctest.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

#include <cstdlib>
#include <cstring>

namespace
{
bool EnvTruthy(const char* value)
{
    return value != nullptr && value[0] != '\0' && std::strcmp(value, "0") != 0;
}
} // namespace

int main(int argc, char** argv)
{
    doctest::Context context;
    context.setOption("order-by", "name");
    context.setOption("no-path-filenames", true);

    if (EnvTruthy(std::getenv("CI")))
    {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    context.applyCommandLine(argc, argv);
    return context.run();
}
