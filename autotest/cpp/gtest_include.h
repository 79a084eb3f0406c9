/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Include GoogleTest, and test helpers.
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#ifndef GTEST_INCLUDE_H_INCLUDED
#define GTEST_INCLUDE_H_INCLUDED

#include <gtest/gtest.h>

#include <vector>

#include "fg_geometry.h"
#include "fgl_error.h"

/** Silence errors for the lifetime of the object, and check the last one. */
class FGLErrorCollector
{
    std::vector<FGLErrorHandlerAccumulatorStruct> m_aoErrors{};

    FGLErrorCollector(const FGLErrorCollector &) = delete;
    FGLErrorCollector &operator=(const FGLErrorCollector &) = delete;

  public:
    FGLErrorCollector()
    {
        FGLErrorReset();
        FGLInstallErrorHandlerAccumulator(m_aoErrors);
    }

    ~FGLErrorCollector()
    {
        FGLUninstallErrorHandlerAccumulator();
    }

    const std::vector<FGLErrorHandlerAccumulatorStruct> &GetErrors() const
    {
        return m_aoErrors;
    }

    /** Number of FE_Failure messages received */
    int GetFailureCount() const
    {
        int nCount = 0;
        for (const auto &sError : m_aoErrors)
        {
            if (sError.type == FE_Failure)
                ++nCount;
        }
        return nCount;
    }
};

/** Axis aligned square ring polygon from (dfMinX, dfMinY) to (dfMaxX,
 * dfMaxY) */
inline FGPolygon FGTestMakeRectangle(double dfMinX, double dfMinY,
                                     double dfMaxX, double dfMaxY)
{
    FGPolygon oPolygon;
    oPolygon.addRing(FGLinearRing{{dfMinX, dfMinY},
                                  {dfMinX, dfMaxY},
                                  {dfMaxX, dfMaxY},
                                  {dfMaxX, dfMinY},
                                  {dfMinX, dfMinY}});
    return oPolygon;
}

#endif /* GTEST_INCLUDE_H_INCLUDED */
