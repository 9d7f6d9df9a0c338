/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <iostream>
#include <epochwise/common/test.hpp>
#include <epochwise/common/timer.hpp>

int main(const int argc, const char **argv)
{
    using namespace epochwise;
    const timer t { "run-test", logger::level::info };
    if (argc >= 2) {
        std::cerr << fmt::format("using test-filter mask: {}\n", argv[1]);
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    // run() reports whether any test failed
    const bool failed = boost::ut::cfg<boost::ut::override>.run();
    return failed ? 1 : 0;
}
