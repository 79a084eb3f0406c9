/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Boolean mask of the cells covered by geometries.
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "fg_alg.h"

#include <utility>
#include <vector>

/************************************************************************/
/*                           FGGeometryMask()                           */
/************************************************************************/

/**
 * \brief Build a boolean mask from geometries.
 *
 * Every geometry is burnt with the value 1 into a uint8 grid filled with 0,
 * following the rules of FGRasterizeGeometries(). The result is then
 * turned into a FGT_Bool grid following the masked array convention: cells
 * covered by a geometry are false (not masked) and the other cells true.
 * With bInvert, covered cells are true.
 *
 * oOutGrid is only replaced on success.
 *
 * @return FE_None on success, FE_Failure otherwise (FGLE_IllegalArg for a
 * non-positive shape).
 */
FGLErr FGGeometryMask(const std::vector<FGGeometry> &aoGeometries,
                      int nYSize, int nXSize,
                      const FGGeoTransform &oTransform, bool bAllTouched,
                      bool bInvert, FGGrid &oOutGrid)
{
    if (nYSize <= 0 || nXSize <= 0)
    {
        FGLError(FE_Failure, FGLE_IllegalArg,
                 "Invalid mask shape (%d, %d): both dimensions must be "
                 "positive.",
                 nYSize, nXSize);
        return FE_Failure;
    }

    FGGrid oCoverage;
    if (oCoverage.Create(nYSize, nXSize, FGT_UInt8) != FE_None)
        return FE_Failure;
    oCoverage.Fill(0);

    std::vector<const FGGeometry *> apoGeometries;
    apoGeometries.reserve(aoGeometries.size());
    for (const auto &oGeom : aoGeometries)
        apoGeometries.push_back(&oGeom);

    FGRasterizeOptions sOptions;
    sOptions.bAllTouched = bAllTouched;
    sOptions.eDataType = FGT_UInt8;
    sOptions.dfDefaultValue = 1;

    if (FGRasterizeGeometries(oCoverage, static_cast<int>(apoGeometries.size()),
                              apoGeometries.data(), nullptr, oTransform,
                              sOptions) != FE_None)
        return FE_Failure;

    FGGrid oMask;
    if (oMask.Create(nYSize, nXSize, FGT_Bool) != FE_None)
        return FE_Failure;

    const GByte byCovered = bInvert ? 1 : 0;
    const GByte byOutside = bInvert ? 0 : 1;
    for (int iY = 0; iY < nYSize; iY++)
    {
        const GByte *pabySrc = oCoverage.GetLine<GByte>(iY);
        GByte *pabyDst = oMask.GetLine<GByte>(iY);
        for (int iX = 0; iX < nXSize; iX++)
            pabyDst[iX] = pabySrc[iX] ? byCovered : byOutside;
    }

    oOutGrid = std::move(oMask);
    return FE_None;
}
