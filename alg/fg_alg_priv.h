/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Prototypes and definitions for the low level scan conversion
 *           and polygon enumeration code.
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#ifndef FG_ALG_PRIV_H_INCLUDED
#define FG_ALG_PRIV_H_INCLUDED

/*! @cond Doxygen_Suppress */

#include "fg_alg.h"

#include <vector>

/************************************************************************/
/*      Low level rasterizer API.                                       */
/*                                                                      */
/*      Coordinates are in (fractional) grid space: x is the column,    */
/*      y the row. A part is a sequence of panPartSize[i] vertices.     */
/************************************************************************/

typedef void (*llScanlineFunc)(void *, int nY, int nXStart, int nXEnd);
typedef void (*llPointFunc)(void *, int nY, int nX);

void FGdllImagePoint(int nRasterXSize, int nRasterYSize, int nPartCount,
                     const int *panPartSize, const double *padfX,
                     const double *padfY, llPointFunc pfnPointFunc,
                     void *pCBData);

void FGdllImageLine(int nRasterXSize, int nRasterYSize, int nPartCount,
                    const int *panPartSize, const double *padfX,
                    const double *padfY, llPointFunc pfnPointFunc,
                    void *pCBData);

void FGdllImageLineAllTouched(int nRasterXSize, int nRasterYSize,
                              int nPartCount, const int *panPartSize,
                              const double *padfX, const double *padfY,
                              bool bClosedParts, llPointFunc pfnPointFunc,
                              void *pCBData);

void FGdllImageFilledPolygon(int nRasterXSize, int nRasterYSize,
                             int nPartCount, const int *panPartSize,
                             const double *padfX, const double *padfY,
                             llScanlineFunc pfnScanlineFunc, void *pCBData);

/************************************************************************/
/*                          Polygon Enumerator                          */
/************************************************************************/

/** Assigns a polygon id to every cell of a grid, one line at a time, and
 * records which ids were merged into which (union-find). Masked cells get
 * the id -1. */
template <class DataType, class EqualityTest> class FGRasterPolygonEnumeratorT

{
  private:
    void MergePolygon(int nSrcId, int nDstId);
    int NewPolygon();

    FGL_DISALLOW_COPY_ASSIGN(FGRasterPolygonEnumeratorT)

  public:  // these are intended to be readonly.
    std::vector<GInt32> anPolyIdMap{};

    int nNextPolygonId = 0;

    int nConnectedness = 0;

  public:
    explicit FGRasterPolygonEnumeratorT(int nConnectedness = 4);

    bool ProcessLine(const DataType *panLastLineVal,
                     const DataType *panThisLineVal,
                     const GInt32 *panLastLineId, GInt32 *panThisLineId,
                     const GByte *pabyThisLineMask, int nXSize);

    void CompleteMerges();
};

/** Values are compared exactly: two cells belong to the same region only
 * if they hold the same value. */
struct FGExactEqualityTest
{
    bool operator()(double a, double b) const
    {
        return a == b;
    }
};

typedef FGRasterPolygonEnumeratorT<double, FGExactEqualityTest>
    FGRasterPolygonEnumerator;

/*! @endcond */

#endif /* FG_ALG_PRIV_H_INCLUDED */
