/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Vector polygon, line and point scan conversion code.
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "fg_alg_priv.h"

#include <cmath>
#include <cstdlib>

#include <algorithm>
#include <utility>
#include <vector>

/************************************************************************/
/*                         ClipSegmentParams()                          */
/*                                                                      */
/*      Liang-Barsky clipping of the segment (x0,y0)+t*(dx,dy),         */
/*      t in [0,1], against a rectangle. On success *pdfT0 and          */
/*      *pdfT1 hold the parametric range inside the rectangle.          */
/************************************************************************/

static bool ClipSegmentParams(double dfX0, double dfY0, double dfDX,
                              double dfDY, double dfXMin, double dfYMin,
                              double dfXMax, double dfYMax, double *pdfT0,
                              double *pdfT1)
{
    const double adfP[4] = {-dfDX, dfDX, -dfDY, dfDY};
    const double adfQ[4] = {dfX0 - dfXMin, dfXMax - dfX0, dfY0 - dfYMin,
                            dfYMax - dfY0};

    double dfT0 = 0.0;
    double dfT1 = 1.0;
    for (int i = 0; i < 4; i++)
    {
        if (adfP[i] == 0.0)
        {
            if (adfQ[i] < 0.0)
                return false;
            continue;
        }

        const double dfR = adfQ[i] / adfP[i];
        if (adfP[i] < 0.0)
        {
            if (dfR > dfT1)
                return false;
            if (dfR > dfT0)
                dfT0 = dfR;
        }
        else
        {
            if (dfR < dfT0)
                return false;
            if (dfR < dfT1)
                dfT1 = dfR;
        }
    }

    *pdfT0 = dfT0;
    *pdfT1 = dfT1;
    return true;
}

/************************************************************************/
/*                          ClipSegmentToBox()                          */
/*                                                                      */
/*      Cohen-Sutherland clipping of a segment against a rectangle.     */
/*      An end point outside the rectangle is moved onto the edge it    */
/*      crosses, its other coordinate being interpolated from that      */
/*      end point.                                                      */
/************************************************************************/

static int GetOutCode(double dfX, double dfY, double dfXMin, double dfYMin,
                      double dfXMax, double dfYMax)
{
    int nCode = 0;
    if (dfX < dfXMin)
        nCode |= 1;
    else if (dfX > dfXMax)
        nCode |= 2;
    if (dfY < dfYMin)
        nCode |= 4;
    else if (dfY > dfYMax)
        nCode |= 8;
    return nCode;
}

static bool ClipSegmentToBox(double *pdfX0, double *pdfY0, double *pdfX1,
                             double *pdfY1, double dfXMin, double dfYMin,
                             double dfXMax, double dfYMax)
{
    int nCode0 = GetOutCode(*pdfX0, *pdfY0, dfXMin, dfYMin, dfXMax, dfYMax);
    int nCode1 = GetOutCode(*pdfX1, *pdfY1, dfXMin, dfYMin, dfXMax, dfYMax);

    // Each step puts one coordinate exactly on an edge.
    for (int nIter = 0; nIter < 8; nIter++)
    {
        if ((nCode0 | nCode1) == 0)
            return true;
        if ((nCode0 & nCode1) != 0)
            return false;

        const bool bMoveFirst = nCode0 != 0;
        const int nCode = bMoveFirst ? nCode0 : nCode1;
        const double dfXOut = bMoveFirst ? *pdfX0 : *pdfX1;
        const double dfYOut = bMoveFirst ? *pdfY0 : *pdfY1;
        const double dfDX = *pdfX1 - *pdfX0;
        const double dfDY = *pdfY1 - *pdfY0;

        double dfX = 0;
        double dfY = 0;
        if (nCode & (1 | 2))
        {
            dfX = (nCode & 1) ? dfXMin : dfXMax;
            dfY = dfYOut + dfDY * ((dfX - dfXOut) / dfDX);
        }
        else
        {
            dfY = (nCode & 4) ? dfYMin : dfYMax;
            dfX = dfXOut + dfDX * ((dfY - dfYOut) / dfDY);
        }

        if (bMoveFirst)
        {
            *pdfX0 = dfX;
            *pdfY0 = dfY;
            nCode0 = GetOutCode(dfX, dfY, dfXMin, dfYMin, dfXMax, dfYMax);
        }
        else
        {
            *pdfX1 = dfX;
            *pdfY1 = dfY;
            nCode1 = GetOutCode(dfX, dfY, dfXMin, dfYMin, dfXMax, dfYMax);
        }
    }

    return (nCode0 | nCode1) == 0;
}

/************************************************************************/
/*                      FGdllImageFilledPolygon()                       */
/*                                                                      */
/*      Perform scanline conversion of the passed multi-ring            */
/*      polygon.  Note the polygon does not need to be explicitly       */
/*      closed.  The scanline function is only called with spans        */
/*      clipped to the grid.                                            */
/*                                                                      */
/*      A cell is considered inside the polygon if its centre falls     */
/*      inside the polygon.  Each row is sampled on its centre line     */
/*      (y + 0.5); an edge from y1 to y2 (y1 < y2) crosses it when      */
/*      y1 <= y + 0.5 < y2, and horizontal edges never do.  Along the   */
/*      row, the cells whose centre lies in [xleft, xright) are         */
/*      burnt.  The polygon thus includes its lower/left boundary and   */
/*      excludes its upper/right one, and adjacent polygons tile.       */
/************************************************************************/

void FGdllImageFilledPolygon(int nRasterXSize, int nRasterYSize,
                             int nPartCount, const int *panPartSize,
                             const double *padfX, const double *padfY,
                             llScanlineFunc pfnScanlineFunc, void *pCBData)
{
    if (!nPartCount)
    {
        return;
    }

    int n = 0;
    for (int part = 0; part < nPartCount; part++)
        n += panPartSize[part];

    if (n < 3)
        return;

    std::vector<double> polyInts(n);

    double dminy = padfY[0];
    double dmaxy = padfY[0];
    for (int i = 1; i < n; i++)
    {
        if (padfY[i] < dminy)
        {
            dminy = padfY[i];
        }
        if (padfY[i] > dmaxy)
        {
            dmaxy = padfY[i];
        }
    }

    // Rows whose centre line is within the vertical extent.
    const double dfMinRow = std::max(0.0, std::ceil(dminy - 0.5));
    const double dfMaxRow =
        std::min(static_cast<double>(nRasterYSize) - 1, std::floor(dmaxy - 0.5));
    if (dfMinRow > dfMaxRow)
        return;

    const int miny = static_cast<int>(dfMinRow);
    const int maxy = static_cast<int>(dfMaxRow);
    const double dfMaxX = static_cast<double>(nRasterXSize) - 1;

    for (int y = miny; y <= maxy; y++)
    {
        int partoffset = 0;

        const double dy = y + 0.5;  // Center height of line.

        int part = 0;
        int ints = 0;

        for (int i = 0; i < n; i++)
        {
            if (i == partoffset + panPartSize[part])
            {
                partoffset += panPartSize[part];
                part++;
            }

            int ind1 = 0;
            int ind2 = 0;
            if (i == partoffset)
            {
                ind1 = partoffset + panPartSize[part] - 1;
                ind2 = partoffset;
            }
            else
            {
                ind1 = i - 1;
                ind2 = i;
            }

            double dy1 = padfY[ind1];
            double dy2 = padfY[ind2];

            if ((dy1 < dy && dy2 < dy) || (dy1 > dy && dy2 > dy))
                continue;

            double dx1 = 0.0;
            double dx2 = 0.0;
            if (dy1 < dy2)
            {
                dx1 = padfX[ind1];
                dx2 = padfX[ind2];
            }
            else if (dy1 > dy2)
            {
                std::swap(dy1, dy2);
                dx2 = padfX[ind1];
                dx1 = padfX[ind2];
            }
            else
            {
                // Horizontal edges do not cross any centre line they do
                // not lie on, and the edges adjacent to them bound the span.
                continue;
            }

            if (dy < dy2 && dy >= dy1)
            {
                polyInts[ints++] =
                    (dy - dy1) * (dx2 - dx1) / (dy2 - dy1) + dx1;
            }
        }

        std::sort(polyInts.begin(), polyInts.begin() + ints);

        for (int i = 0; i + 1 < ints; i += 2)
        {
            // Cells whose centre (col + 0.5) is in [xleft, xright).
            const double dfStart = std::ceil(polyInts[i] - 0.5);
            const double dfEnd = std::ceil(polyInts[i + 1] - 0.5) - 1;
            if (dfStart > dfMaxX || dfEnd < 0 || dfStart > dfEnd)
                continue;

            pfnScanlineFunc(pCBData, y,
                            static_cast<int>(std::max(0.0, dfStart)),
                            static_cast<int>(std::min(dfMaxX, dfEnd)));
        }
    }
}

/************************************************************************/
/*                          FGdllImagePoint()                           */
/************************************************************************/

void FGdllImagePoint(int nRasterXSize, int nRasterYSize, int nPartCount,
                     const int *panPartSize, const double *padfX,
                     const double *padfY, llPointFunc pfnPointFunc,
                     void *pCBData)
{
    int n = 0;
    for (int part = 0; part < nPartCount; part++)
        n += panPartSize[part];

    for (int i = 0; i < n; i++)
    {
        const double dfX = std::floor(padfX[i]);
        const double dfY = std::floor(padfY[i]);

        if (0 <= dfX && dfX < nRasterXSize && 0 <= dfY && dfY < nRasterYSize)
            pfnPointFunc(pCBData, static_cast<int>(dfY),
                         static_cast<int>(dfX));
    }
}

/************************************************************************/
/*                           FGdllImageLine()                           */
/*                                                                      */
/*      Bresenham walk between the cells holding the vertices.  The     */
/*      end point of a segment is only burnt for the last segment of    */
/*      a part, as it is the start point of the next one.               */
/************************************************************************/

void FGdllImageLine(int nRasterXSize, int nRasterYSize, int nPartCount,
                    const int *panPartSize, const double *padfX,
                    const double *padfY, llPointFunc pfnPointFunc,
                    void *pCBData)
{
    if (!nPartCount)
        return;

    // Segments are clipped to this box before walking them, so that far
    // away vertices do not make the walk long or overflow an int.
    const double dfBoxXMin = -1.0;
    const double dfBoxYMin = -1.0;
    const double dfBoxXMax = static_cast<double>(nRasterXSize) + 1;
    const double dfBoxYMax = static_cast<double>(nRasterYSize) + 1;

    for (int i = 0, n = 0; i < nPartCount; n += panPartSize[i++])
    {
        for (int j = 1; j < panPartSize[i]; j++)
        {
            double dfX0 = padfX[n + j - 1];
            double dfY0 = padfY[n + j - 1];
            double dfX1 = padfX[n + j];
            double dfY1 = padfY[n + j];

            if (!ClipSegmentToBox(&dfX0, &dfY0, &dfX1, &dfY1, dfBoxXMin,
                                  dfBoxYMin, dfBoxXMax, dfBoxYMax))
                continue;

            int iX = static_cast<int>(std::floor(dfX0));
            int iY = static_cast<int>(std::floor(dfY0));

            const int iX1 = static_cast<int>(std::floor(dfX1));
            const int iY1 = static_cast<int>(std::floor(dfY1));

            int nDeltaX = std::abs(iX1 - iX);
            int nDeltaY = std::abs(iY1 - iY);

            // Step direction depends on line direction.
            const int nXStep = (iX > iX1) ? -1 : 1;
            const int nYStep = (iY > iY1) ? -1 : 1;

            // Determine the line slope.
            if (nDeltaX >= nDeltaY)
            {
                const int nXError = nDeltaY << 1;
                const int nYError = nXError - (nDeltaX << 1);
                int nError = nXError - nDeltaX;

                if (j != panPartSize[i] - 1)
                {
                    nDeltaX--;
                }

                while (nDeltaX-- >= 0)
                {
                    if (0 <= iX && iX < nRasterXSize && 0 <= iY &&
                        iY < nRasterYSize)
                        pfnPointFunc(pCBData, iY, iX);

                    iX += nXStep;
                    if (nError > 0)
                    {
                        iY += nYStep;
                        nError += nYError;
                    }
                    else
                    {
                        nError += nXError;
                    }
                }
            }
            else
            {
                const int nXError = nDeltaX << 1;
                const int nYError = nXError - (nDeltaY << 1);
                int nError = nXError - nDeltaY;

                if (j != panPartSize[i] - 1)
                {
                    nDeltaY--;
                }

                while (nDeltaY-- >= 0)
                {
                    if (0 <= iX && iX < nRasterXSize && 0 <= iY &&
                        iY < nRasterYSize)
                        pfnPointFunc(pCBData, iY, iX);

                    iY += nYStep;
                    if (nError > 0)
                    {
                        iX += nXStep;
                        nError += nYError;
                    }
                    else
                    {
                        nError += nXError;
                    }
                }
            }
        }
    }
}

/************************************************************************/
/*                       BurnSegmentAllTouched()                        */
/*                                                                      */
/*      Burn every cell whose interior is crossed by the segment.       */
/************************************************************************/

static void BurnSegmentAllTouched(int nRasterXSize, int nRasterYSize,
                                  double dfX0, double dfY0, double dfX1,
                                  double dfY1, llPointFunc pfnPointFunc,
                                  void *pCBData)
{
    if (dfX0 == dfX1 && dfY0 == dfY1)
        return;

    /* -------------------------------------------------------------------- */
    /*      Special case for vertical lines.                                */
    /* -------------------------------------------------------------------- */
    if (dfX0 == dfX1)
    {
        // A segment on a column boundary does not enter any cell.
        if (std::floor(dfX0) == dfX0)
            return;

        const double dfCol = std::floor(dfX0);
        if (dfCol < 0 || dfCol >= nRasterXSize)
            return;

        const double dfStart = std::max(0.0, std::floor(std::min(dfY0, dfY1)));
        const double dfEnd =
            std::min(static_cast<double>(nRasterYSize) - 1,
                     std::ceil(std::max(dfY0, dfY1)) - 1);
        if (dfStart > dfEnd)
            return;

        const int iX = static_cast<int>(dfCol);
        for (int iY = static_cast<int>(dfStart); iY <= static_cast<int>(dfEnd);
             iY++)
        {
            pfnPointFunc(pCBData, iY, iX);
        }
        return;
    }

    /* -------------------------------------------------------------------- */
    /*      Special case for horizontal lines.                              */
    /* -------------------------------------------------------------------- */
    if (dfY0 == dfY1)
    {
        // A segment on a row boundary does not enter any cell.
        if (std::floor(dfY0) == dfY0)
            return;

        const double dfRow = std::floor(dfY0);
        if (dfRow < 0 || dfRow >= nRasterYSize)
            return;

        const double dfStart = std::max(0.0, std::floor(std::min(dfX0, dfX1)));
        const double dfEnd =
            std::min(static_cast<double>(nRasterXSize) - 1,
                     std::ceil(std::max(dfX0, dfX1)) - 1);
        if (dfStart > dfEnd)
            return;

        const int iY = static_cast<int>(dfRow);
        for (int iX = static_cast<int>(dfStart); iX <= static_cast<int>(dfEnd);
             iX++)
        {
            pfnPointFunc(pCBData, iY, iX);
        }
        return;
    }

    /* -------------------------------------------------------------------- */
    /*      General case: split the segment at every grid line it           */
    /*      crosses, and burn the cell holding the middle of each piece.    */
    /*      Pieces of null length (a crossing exactly at a cell corner)     */
    /*      are skipped, so that cells only touched at a corner or at an    */
    /*      end point lying on a grid line are not burnt.                   */
    /* -------------------------------------------------------------------- */
    const double dfDX = dfX1 - dfX0;
    const double dfDY = dfY1 - dfY0;
    double dfT0 = 0.0;
    double dfT1 = 1.0;
    if (!ClipSegmentParams(dfX0, dfY0, dfDX, dfDY, 0.0, 0.0,
                           static_cast<double>(nRasterXSize),
                           static_cast<double>(nRasterYSize), &dfT0, &dfT1) ||
        !(dfT0 < dfT1))
        return;

    std::vector<double> adfT;
    adfT.push_back(dfT0);
    adfT.push_back(dfT1);

    const double dfXA = dfX0 + dfT0 * dfDX;
    const double dfXB = dfX0 + dfT1 * dfDX;
    const int nXFirst = static_cast<int>(std::ceil(std::min(dfXA, dfXB)));
    const int nXLast = static_cast<int>(std::floor(std::max(dfXA, dfXB)));
    for (int k = nXFirst; k <= nXLast; k++)
    {
        const double dfT = (k - dfX0) / dfDX;
        if (dfT > dfT0 && dfT < dfT1)
            adfT.push_back(dfT);
    }

    const double dfYA = dfY0 + dfT0 * dfDY;
    const double dfYB = dfY0 + dfT1 * dfDY;
    const int nYFirst = static_cast<int>(std::ceil(std::min(dfYA, dfYB)));
    const int nYLast = static_cast<int>(std::floor(std::max(dfYA, dfYB)));
    for (int k = nYFirst; k <= nYLast; k++)
    {
        const double dfT = (k - dfY0) / dfDY;
        if (dfT > dfT0 && dfT < dfT1)
            adfT.push_back(dfT);
    }

    std::sort(adfT.begin(), adfT.end());

    for (size_t i = 0; i + 1 < adfT.size(); i++)
    {
        if (!(adfT[i] < adfT[i + 1]))
            continue;

        const double dfTMid = (adfT[i] + adfT[i + 1]) * 0.5;
        const double dfCol = std::floor(dfX0 + dfTMid * dfDX);
        const double dfRow = std::floor(dfY0 + dfTMid * dfDY);
        if (dfCol >= 0 && dfCol < nRasterXSize && dfRow >= 0 &&
            dfRow < nRasterYSize)
        {
            pfnPointFunc(pCBData, static_cast<int>(dfRow),
                         static_cast<int>(dfCol));
        }
    }
}

/************************************************************************/
/*                      FGdllImageLineAllTouched()                      */
/*                                                                      */
/*      Burn every cell whose interior is crossed by one of the         */
/*      segments of the parts.  With bClosedParts, the segment from     */
/*      the last vertex of a part back to its first one is included.    */
/************************************************************************/

void FGdllImageLineAllTouched(int nRasterXSize, int nRasterYSize,
                              int nPartCount, const int *panPartSize,
                              const double *padfX, const double *padfY,
                              bool bClosedParts, llPointFunc pfnPointFunc,
                              void *pCBData)

{
    if (!nPartCount)
        return;

    for (int i = 0, n = 0; i < nPartCount; n += panPartSize[i++])
    {
        for (int j = 1; j < panPartSize[i]; j++)
        {
            BurnSegmentAllTouched(nRasterXSize, nRasterYSize,
                                  padfX[n + j - 1], padfY[n + j - 1],
                                  padfX[n + j], padfY[n + j], pfnPointFunc,
                                  pCBData);
        }

        if (bClosedParts && panPartSize[i] > 2)
        {
            const int iLast = n + panPartSize[i] - 1;
            BurnSegmentAllTouched(nRasterXSize, nRasterYSize, padfX[iLast],
                                  padfY[iLast], padfX[n], padfY[n],
                                  pfnPointFunc, pCBData);
        }
    }
}
