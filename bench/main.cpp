// bench/main.cpp - benchmark entry point
// nanobench needs implementation defined in exactly one translation unit

#define ANKERL_NANOBENCH_IMPLEMENT
#include <nanobench.h>

namespace bench
{
    void run_command_builder_benchmarks();
} // namespace bench

int main()
{
    bench::run_command_builder_benchmarks();
    return 0;
}
