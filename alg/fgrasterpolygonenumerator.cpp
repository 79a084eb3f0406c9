/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Raster Polygon Enumerator
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "fg_alg_priv.h"

#include <cstddef>
#include <new>

/*! @cond Doxygen_Suppress */

/************************************************************************/
/*                    FGRasterPolygonEnumeratorT()                      */
/************************************************************************/

template <class DataType, class EqualityTest>
FGRasterPolygonEnumeratorT<DataType, EqualityTest>::FGRasterPolygonEnumeratorT(
    int nConnectednessIn)
    : nConnectedness(nConnectednessIn)

{
}

/************************************************************************/
/*                            MergePolygon()                            */
/*                                                                      */
/*      Update the polygon map to indicate the merger of two polygons.  */
/************************************************************************/

template <class DataType, class EqualityTest>
void FGRasterPolygonEnumeratorT<DataType, EqualityTest>::MergePolygon(
    int nSrcId, int nDstIdInit)

{
    // Figure out the final dest id.
    int nDstIdFinal = nDstIdInit;
    while (anPolyIdMap[nDstIdFinal] != nDstIdFinal)
        nDstIdFinal = anPolyIdMap[nDstIdFinal];

    // Map the whole intermediate chain to it.
    int nDstIdCur = nDstIdInit;
    while (anPolyIdMap[nDstIdCur] != nDstIdCur)
    {
        int nNextDstId = anPolyIdMap[nDstIdCur];
        anPolyIdMap[nDstIdCur] = nDstIdFinal;
        nDstIdCur = nNextDstId;
    }

    // And map the whole source chain to it too (can be done in one pass).
    while (anPolyIdMap[nSrcId] != nSrcId)
    {
        int nNextSrcId = anPolyIdMap[nSrcId];
        anPolyIdMap[nSrcId] = nDstIdFinal;
        nSrcId = nNextSrcId;
    }
    anPolyIdMap[nSrcId] = nDstIdFinal;
}

/************************************************************************/
/*                             NewPolygon()                             */
/*                                                                      */
/*      Allocate a new polygon id.  Throws std::bad_alloc when the      */
/*      maps cannot grow.                                               */
/************************************************************************/

template <class DataType, class EqualityTest>
int FGRasterPolygonEnumeratorT<DataType, EqualityTest>::NewPolygon()

{
    const int nPolyId = nNextPolygonId;

    anPolyIdMap.push_back(nPolyId);

    nNextPolygonId++;

    return nPolyId;
}

/************************************************************************/
/*                           CompleteMerges()                           */
/*                                                                      */
/*      Make a pass through the maps, ensuring every polygon id         */
/*      points to the final id it should use, not an intermediate       */
/*      value.                                                          */
/************************************************************************/

template <class DataType, class EqualityTest>
void FGRasterPolygonEnumeratorT<DataType, EqualityTest>::CompleteMerges()

{
    int nFinalPolyCount = 0;

    for (int iPoly = 0; iPoly < nNextPolygonId; iPoly++)
    {
        // Figure out the final id.
        int nId = anPolyIdMap[iPoly];
        while (nId != anPolyIdMap[nId])
        {
            nId = anPolyIdMap[nId];
        }

        // Then map the whole intermediate chain to it.
        int nIdCur = anPolyIdMap[iPoly];
        anPolyIdMap[iPoly] = nId;
        while (nIdCur != anPolyIdMap[nIdCur])
        {
            int nNextId = anPolyIdMap[nIdCur];
            anPolyIdMap[nIdCur] = nId;
            nIdCur = nNextId;
        }

        if (anPolyIdMap[iPoly] == iPoly)
            nFinalPolyCount++;
    }

    FGLDebug("FGRasterPolygonEnumerator",
             "Counted %d polygon fragments forming %d final polygons.",
             nNextPolygonId, nFinalPolyCount);
}

/************************************************************************/
/*                            ProcessLine()                             */
/*                                                                      */
/*      Assign ids to polygons, one line at a time.  Cells whose mask   */
/*      value is zero get the id -1 and never join a polygon.           */
/************************************************************************/

template <class DataType, class EqualityTest>
bool FGRasterPolygonEnumeratorT<DataType, EqualityTest>::ProcessLine(
    const DataType *panLastLineVal, const DataType *panThisLineVal,
    const GInt32 *panLastLineId, GInt32 *panThisLineId,
    const GByte *pabyThisLineMask, int nXSize)

{
    EqualityTest eq;

    const auto IsMasked = [pabyThisLineMask](int i)
    { return pabyThisLineMask != nullptr && pabyThisLineMask[i] == 0; };

    try
    {
/* -------------------------------------------------------------------- */
/*      Special case for the first line.                                */
/* -------------------------------------------------------------------- */
        if (panLastLineVal == nullptr)
        {
            for (int i = 0; i < nXSize; i++)
            {
                if (IsMasked(i))
                {
                    panThisLineId[i] = -1;
                }
                else if (i == 0 || panThisLineId[i - 1] == -1 ||
                         !(eq.operator()(panThisLineVal[i],
                                         panThisLineVal[i - 1])))
                {
                    panThisLineId[i] = NewPolygon();
                }
                else
                {
                    panThisLineId[i] = panThisLineId[i - 1];
                }
            }

            return true;
        }

/* -------------------------------------------------------------------- */
/*      Process each cell comparing to the previous cell, and to        */
/*      the last line.  A neighbour with the id -1 is masked, and       */
/*      never matches.                                                  */
/* -------------------------------------------------------------------- */
        const auto SameAsAbove = [&](int iAbove, int i)
        {
            return panLastLineId[iAbove] != -1 &&
                   eq.operator()(panLastLineVal[iAbove], panThisLineVal[i]);
        };

        for (int i = 0; i < nXSize; i++)
        {
            if (IsMasked(i))
            {
                panThisLineId[i] = -1;
            }
            else if (i > 0 && panThisLineId[i - 1] != -1 &&
                     eq.operator()(panThisLineVal[i], panThisLineVal[i - 1]))
            {
                panThisLineId[i] = panThisLineId[i - 1];

                if (SameAsAbove(i, i) &&
                    (anPolyIdMap[panLastLineId[i]] !=
                     anPolyIdMap[panThisLineId[i]]))
                {
                    MergePolygon(panLastLineId[i], panThisLineId[i]);
                }

                if (nConnectedness == 8 && SameAsAbove(i - 1, i) &&
                    (anPolyIdMap[panLastLineId[i - 1]] !=
                     anPolyIdMap[panThisLineId[i]]))
                {
                    MergePolygon(panLastLineId[i - 1], panThisLineId[i]);
                }

                if (nConnectedness == 8 && i < nXSize - 1 &&
                    SameAsAbove(i + 1, i) &&
                    (anPolyIdMap[panLastLineId[i + 1]] !=
                     anPolyIdMap[panThisLineId[i]]))
                {
                    MergePolygon(panLastLineId[i + 1], panThisLineId[i]);
                }
            }
            else if (SameAsAbove(i, i))
            {
                panThisLineId[i] = panLastLineId[i];
            }
            else if (i > 0 && nConnectedness == 8 && SameAsAbove(i - 1, i))
            {
                panThisLineId[i] = panLastLineId[i - 1];

                if (i < nXSize - 1 && SameAsAbove(i + 1, i) &&
                    (anPolyIdMap[panLastLineId[i + 1]] !=
                     anPolyIdMap[panThisLineId[i]]))
                {
                    MergePolygon(panLastLineId[i + 1], panThisLineId[i]);
                }
            }
            else if (i < nXSize - 1 && nConnectedness == 8 &&
                     SameAsAbove(i + 1, i))
            {
                panThisLineId[i] = panLastLineId[i + 1];
            }
            else
            {
                panThisLineId[i] = NewPolygon();
            }
        }

        return true;
    }
    catch (const std::bad_alloc &)
    {
        FGLError(FE_Failure, FGLE_OutOfMemory,
                 "Out of memory in FGRasterPolygonEnumerator::ProcessLine");
        return false;
    }
}

template class FGRasterPolygonEnumeratorT<double, FGExactEqualityTest>;

/*! @endcond */
