/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Entry point of the C++ unit tests.
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "fgl_conv.h"
#include "fgl_error.h"

#include <cstdio>
#include <cstring>

#include "gtest_include.h"

int main(int argc, char **argv)
{
    // Consume --config KEY VALUE pairs, pass the rest to GoogleTest.
    int nArgOut = 1;
    for (int i = 1; i < argc; i++)
    {
        if (strcmp(argv[i], "--config") == 0)
        {
            if (i + 2 >= argc)
            {
                fprintf(stderr, "--config option given without key and "
                                "value argument.\n");
                return 1;
            }
            FGLSetConfigOption(argv[i + 1], argv[i + 2]);
            i += 2;
        }
        else
        {
            argv[nArgOut++] = argv[i];
        }
    }
    argc = nArgOut;

    ::testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS();
}
