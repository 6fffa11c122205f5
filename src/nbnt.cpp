/* This file is part of NBNT project.
 * Copyright (c) 2025 NBNT contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <nbnt/cli.hpp>

int main(const int argc, const char **argv)
{
    return nbnt::cli::run(argc, argv);
}
