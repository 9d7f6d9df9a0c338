/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <epochwise/common/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace epochwise;
    return cli::run(argc, argv);
}
