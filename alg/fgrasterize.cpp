/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Vector rasterization.
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "fg_alg.h"
#include "fg_alg_priv.h"

#include <cstdlib>

#include <algorithm>
#include <utility>
#include <vector>

#include "fgl_string.h"

namespace
{

typedef struct
{
    GByte *pabyChunkBuf;
    int nXSize;
    int nYSize;
    FGDataType eType;
    double dfBurnValue;
} FGRasterizeInfo;

}  // namespace

/************************************************************************/
/*                        gvBurnScanlineBasic()                         */
/************************************************************************/
template <typename T>
static inline void gvBurnScanlineBasic(FGRasterizeInfo *psInfo, int nY,
                                       int nXStart, int nXEnd)

{
    T *pData = reinterpret_cast<T *>(psInfo->pabyChunkBuf) +
               static_cast<size_t>(nY) * psInfo->nXSize;
    std::fill(pData + nXStart, pData + nXEnd + 1,
              static_cast<T>(psInfo->dfBurnValue));
}

/************************************************************************/
/*                           gvBurnScanline()                           */
/************************************************************************/
static void gvBurnScanline(void *pCBData, int nY, int nXStart, int nXEnd)

{
    FGRasterizeInfo *psInfo = static_cast<FGRasterizeInfo *>(pCBData);

    if (nXStart > nXEnd)
        return;

    switch (psInfo->eType)
    {
        case FGT_UInt8:
            gvBurnScanlineBasic<GByte>(psInfo, nY, nXStart, nXEnd);
            break;
        case FGT_Int16:
            gvBurnScanlineBasic<GInt16>(psInfo, nY, nXStart, nXEnd);
            break;
        case FGT_UInt16:
            gvBurnScanlineBasic<GUInt16>(psInfo, nY, nXStart, nXEnd);
            break;
        case FGT_Int32:
            gvBurnScanlineBasic<GInt32>(psInfo, nY, nXStart, nXEnd);
            break;
        case FGT_UInt32:
            gvBurnScanlineBasic<GUInt32>(psInfo, nY, nXStart, nXEnd);
            break;
        case FGT_Float32:
            gvBurnScanlineBasic<float>(psInfo, nY, nXStart, nXEnd);
            break;
        case FGT_Float64:
            gvBurnScanlineBasic<double>(psInfo, nY, nXStart, nXEnd);
            break;
        default:
            break;
    }
}

/************************************************************************/
/*                          gvBurnPointBasic()                          */
/************************************************************************/
template <typename T>
static inline void gvBurnPointBasic(FGRasterizeInfo *psInfo, int nY, int nX)

{
    T *pData = reinterpret_cast<T *>(psInfo->pabyChunkBuf) +
               static_cast<size_t>(nY) * psInfo->nXSize + nX;
    *pData = static_cast<T>(psInfo->dfBurnValue);
}

/************************************************************************/
/*                            gvBurnPoint()                             */
/************************************************************************/
static void gvBurnPoint(void *pCBData, int nY, int nX)

{
    FGRasterizeInfo *psInfo = static_cast<FGRasterizeInfo *>(pCBData);

    switch (psInfo->eType)
    {
        case FGT_UInt8:
            gvBurnPointBasic<GByte>(psInfo, nY, nX);
            break;
        case FGT_Int16:
            gvBurnPointBasic<GInt16>(psInfo, nY, nX);
            break;
        case FGT_UInt16:
            gvBurnPointBasic<GUInt16>(psInfo, nY, nX);
            break;
        case FGT_Int32:
            gvBurnPointBasic<GInt32>(psInfo, nY, nX);
            break;
        case FGT_UInt32:
            gvBurnPointBasic<GUInt32>(psInfo, nY, nX);
            break;
        case FGT_Float32:
            gvBurnPointBasic<float>(psInfo, nY, nX);
            break;
        case FGT_Float64:
            gvBurnPointBasic<double>(psInfo, nY, nX);
            break;
        default:
            break;
    }
}

/************************************************************************/
/*                     FGCollectRingsFromGeometry()                     */
/*                                                                      */
/*      Append the vertices of a line or ring, mapped into grid         */
/*      space, as a new part.                                           */
/************************************************************************/

static void FGCollectRingsFromGeometry(const FGLineString &oLine,
                                       const FGGeoTransform &oTransform,
                                       std::vector<double> &aPointX,
                                       std::vector<double> &aPointY,
                                       std::vector<int> &aPartSize)
{
    const int nCount = oLine.getNumPoints();
    if (nCount == 0)
        return;

    const size_t nNewCount = aPointX.size() + static_cast<size_t>(nCount);
    aPointX.reserve(nNewCount);
    aPointY.reserve(nNewCount);
    for (const auto &oPoint : oLine.getPoints())
    {
        double dfCol = 0.0;
        double dfRow = 0.0;
        oTransform.Apply(oPoint.x, oPoint.y, &dfCol, &dfRow);
        aPointX.push_back(dfCol);
        aPointY.push_back(dfRow);
    }
    aPartSize.push_back(nCount);
}

namespace
{

/************************************************************************/
/*                            FGShapeBurner                             */
/*                                                                      */
/*      Geometry visitor doing the scan conversion of one geometry.     */
/*      Parts of multi-geometries are converted one at a time.          */
/************************************************************************/

class FGShapeBurner
{
    FGRasterizeInfo *m_psInfo;
    const FGGeoTransform &m_oTransform;
    bool m_bAllTouched;

  public:
    FGShapeBurner(FGRasterizeInfo *psInfo, const FGGeoTransform &oTransform,
                  bool bAllTouched)
        : m_psInfo(psInfo), m_oTransform(oTransform),
          m_bAllTouched(bAllTouched)
    {
    }

    void operator()(const FGPoint &oPoint)
    {
        double dfCol = 0.0;
        double dfRow = 0.0;
        m_oTransform.Apply(oPoint.getX(), oPoint.getY(), &dfCol, &dfRow);
        const int nPartSize = 1;
        FGdllImagePoint(m_psInfo->nXSize, m_psInfo->nYSize, 1, &nPartSize,
                        &dfCol, &dfRow, gvBurnPoint, m_psInfo);
    }

    void operator()(const FGLineString &oLine)
    {
        std::vector<double> aPointX;
        std::vector<double> aPointY;
        std::vector<int> aPartSize;
        FGCollectRingsFromGeometry(oLine, m_oTransform, aPointX, aPointY,
                                   aPartSize);
        if (aPartSize.empty())
            return;

        // Lines have no interior: both rules use the same walk.
        FGdllImageLine(m_psInfo->nXSize, m_psInfo->nYSize,
                       static_cast<int>(aPartSize.size()), aPartSize.data(),
                       aPointX.data(), aPointY.data(), gvBurnPoint, m_psInfo);
    }

    void operator()(const FGPolygon &oPolygon)
    {
        std::vector<double> aPointX;
        std::vector<double> aPointY;
        std::vector<int> aPartSize;
        for (const auto &oRing : oPolygon.getRings())
        {
            FGCollectRingsFromGeometry(oRing, m_oTransform, aPointX, aPointY,
                                       aPartSize);
        }
        if (aPartSize.empty())
            return;

        FGdllImageFilledPolygon(
            m_psInfo->nXSize, m_psInfo->nYSize,
            static_cast<int>(aPartSize.size()), aPartSize.data(),
            aPointX.data(), aPointY.data(), gvBurnScanline, m_psInfo);
        if (m_bAllTouched)
        {
            FGdllImageLineAllTouched(
                m_psInfo->nXSize, m_psInfo->nYSize,
                static_cast<int>(aPartSize.size()), aPartSize.data(),
                aPointX.data(), aPointY.data(),
                /* bClosedParts = */ true, gvBurnPoint, m_psInfo);
        }
    }

    template <class PartT>
    void operator()(const FGMultiGeometryT<PartT> &oCollection)
    {
        for (const auto &oPart : oCollection)
            (*this)(oPart);
    }
};

}  // namespace

/************************************************************************/
/*                       gv_rasterize_one_shape()                       */
/************************************************************************/
static void gv_rasterize_one_shape(FGRasterizeInfo *psInfo,
                                   const FGGeometry &oShape,
                                   const FGGeoTransform &oTransform,
                                   bool bAllTouched)
{
    if (oShape.IsEmpty())
        return;

    if (!oShape.IsFinite())
    {
        FGLDebug("FG_RASTERIZE",
                 "Skipping %s geometry with non-finite coordinates.",
                 oShape.getGeometryName());
        return;
    }

    oShape.Visit(FGShapeBurner(psInfo, oTransform, bAllTouched));
}

/************************************************************************/
/*                        FGValidateBurnValues()                        */
/*                                                                      */
/*      Check every value against the data type before anything is     */
/*      written.                                                        */
/************************************************************************/

static FGLErr FGValidateBurnValues(FGDataType eDataType, int nValueCount,
                                   const double *padfValues,
                                   double dfDefaultValue)
{
    if (FGValidateValue(eDataType, dfDefaultValue) != FE_None)
        return FE_Failure;

    if (padfValues == nullptr)
        return FE_None;

    for (int i = 0; i < nValueCount; i++)
    {
        if (FGValidateValue(eDataType, padfValues[i]) != FE_None)
            return FE_Failure;
    }
    return FE_None;
}

/************************************************************************/
/*                     FGRasterizeOptionsFromList()                     */
/************************************************************************/

/**
 * \brief Parse rasterization options from a name=value list.
 *
 * Options that do not appear in the list keep the value they have in
 * *psOptions.
 *
 * Recognized options:
 * <ul>
 * <li>ALL_TOUCHED=YES/NO: whether to burn all cells touched by a polygon,
 * and not only those whose centre is inside.</li>
 * <li>DATA_TYPE=name: output data type (uint8, int16, ..., float64).</li>
 * <li>FILL=number: background value of a freshly allocated grid.</li>
 * <li>DEFAULT_VALUE=number: value burnt for shapes that carry none.</li>
 * </ul>
 *
 * @return FE_None on success, FE_Failure if an option value is invalid
 * (*psOptions is then left unchanged).
 */
FGLErr FGRasterizeOptionsFromList(FGLConstList papszOptions,
                                  FGRasterizeOptions *psOptions)
{
    VALIDATE_POINTER1(psOptions, "FGRasterizeOptionsFromList", FE_Failure);

    FGRasterizeOptions sOptions = *psOptions;
    sOptions.bAllTouched =
        FGLFetchBool(papszOptions, "ALL_TOUCHED", sOptions.bAllTouched);

    const char *pszOpt = FGLFetchNameValue(papszOptions, "DATA_TYPE");
    if (pszOpt)
    {
        sOptions.eDataType = FGGetDataTypeByName(pszOpt);
        if (sOptions.eDataType == FGT_Unknown)
        {
            FGLError(FE_Failure, FGLE_UnsupportedDataType,
                     "Unrecognized value '%s' for DATA_TYPE.", pszOpt);
            return FE_Failure;
        }
    }

    const auto FetchNumber = [papszOptions](const char *pszKey, double *pdfVal)
    {
        const char *pszVal = FGLFetchNameValue(papszOptions, pszKey);
        if (pszVal == nullptr)
            return true;
        if (FGLGetValueType(pszVal) == FGL_VALUE_STRING)
        {
            FGLError(FE_Failure, FGLE_IllegalArg,
                     "Unrecognized value '%s' for %s.", pszVal, pszKey);
            return false;
        }
        *pdfVal = strtod(pszVal, nullptr);
        return true;
    };

    if (!FetchNumber("FILL", &sOptions.dfFill) ||
        !FetchNumber("DEFAULT_VALUE", &sOptions.dfDefaultValue))
        return FE_Failure;

    *psOptions = sOptions;
    return FE_None;
}

/************************************************************************/
/*                       FGRasterizeGeometries()                        */
/************************************************************************/

/**
 * \brief Burn geometries into an existing grid.
 *
 * Geometries are burnt in order: where two of them cover the same cell,
 * the later one wins. Coverage follows the default rule (cells whose
 * centre is inside a polygon), or the all-touched rule when
 * sOptions.bAllTouched is set. Points burn the cell holding them and line
 * strings the cells of a Bresenham walk along them, under both rules.
 *
 * Every burn value and the default value are validated against the grid
 * data type before any cell is written. sOptions.eDataType and
 * sOptions.dfFill are not used.
 *
 * @param oGrid the grid to update, holding one of the supported data types.
 * @param nGeomCount the number of geometries being passed in
 * papoGeometries.
 * @param papoGeometries the array of geometries to burn in.
 * @param padfGeomBurnValues the array of values to burn, one per geometry,
 * or nullptr to burn sOptions.dfDefaultValue for every geometry.
 * @param oTransform the geometry to grid space transform.
 * @param sOptions rasterization options.
 *
 * @return FE_None on success or FE_Failure on error.
 */
FGLErr FGRasterizeGeometries(FGGrid &oGrid, int nGeomCount,
                             const FGGeometry *const *papoGeometries,
                             const double *padfGeomBurnValues,
                             const FGGeoTransform &oTransform,
                             const FGRasterizeOptions &sOptions)
{
    if (oGrid.IsEmpty())
    {
        FGLError(FE_Failure, FGLE_IllegalArg,
                 "Cannot rasterize into an unallocated grid.");
        return FE_Failure;
    }

    if (nGeomCount == 0)
        return FE_None;

    VALIDATE_POINTER1(papoGeometries, "FGRasterizeGeometries", FE_Failure);
    for (int i = 0; i < nGeomCount; i++)
    {
        if (papoGeometries[i] == nullptr)
        {
            FGLError(FE_Failure, FGLE_IllegalArg,
                     "Geometry %d to rasterize is NULL.", i);
            return FE_Failure;
        }
    }

    const FGDataType eType = oGrid.GetDataType();
    if (FGValidateBurnValues(eType, nGeomCount, padfGeomBurnValues,
                             sOptions.dfDefaultValue) != FE_None)
        return FE_Failure;

    FGRasterizeInfo sInfo;
    sInfo.pabyChunkBuf = oGrid.GetData();
    sInfo.nXSize = oGrid.GetXSize();
    sInfo.nYSize = oGrid.GetYSize();
    sInfo.eType = eType;
    sInfo.dfBurnValue = sOptions.dfDefaultValue;

    for (int i = 0; i < nGeomCount; i++)
    {
        if (padfGeomBurnValues)
            sInfo.dfBurnValue = padfGeomBurnValues[i];

        gv_rasterize_one_shape(&sInfo, *papoGeometries[i], oTransform,
                               sOptions.bAllTouched);
    }

    FGLDebug("FG_RASTERIZE", "Burnt %d geometries into a %d x %d %s grid%s.",
             nGeomCount, sInfo.nYSize, sInfo.nXSize, FGGetDataTypeName(eType),
             sOptions.bAllTouched ? " (all touched)" : "");

    return FE_None;
}

/************************************************************************/
/*                          CollectShapes()                             */
/*                                                                      */
/*      Split shapes into the geometry and value arrays expected by     */
/*      FGRasterizeGeometries(). Bare geometries get the default        */
/*      value.                                                          */
/************************************************************************/

static void CollectShapes(const std::vector<FGShape> &aoShapes,
                          double dfDefaultValue,
                          std::vector<const FGGeometry *> &apoGeometries,
                          std::vector<double> &adfValues)
{
    apoGeometries.reserve(aoShapes.size());
    adfValues.reserve(aoShapes.size());
    for (const auto &oShape : aoShapes)
    {
        apoGeometries.push_back(&oShape.oGeometry);
        adfValues.push_back(oShape.bHasValue ? oShape.dfValue
                                             : dfDefaultValue);
    }
}

/************************************************************************/
/*                            FGRasterize()                             */
/************************************************************************/

/**
 * \brief Burn shapes into a newly allocated grid.
 *
 * The grid has nYSize rows and nXSize columns, and is pre-filled with
 * sOptions.dfFill. Its data type is sOptions.eDataType, or when that is
 * FGT_Unknown, the smallest supported data type holding exactly every burn
 * value, the fill value and the default value.
 *
 * oOutGrid is only replaced on success.
 *
 * @return FE_None on success, FE_Failure otherwise: FGLE_EmptyInput if
 * aoShapes is empty, FGLE_IllegalArg for a non-positive shape,
 * FGLE_UnsupportedDataType or FGLE_ValueRange if a value or the data type
 * is invalid.
 */
FGLErr FGRasterize(const std::vector<FGShape> &aoShapes, int nYSize,
                   int nXSize, const FGGeoTransform &oTransform,
                   const FGRasterizeOptions &sOptions, FGGrid &oOutGrid)
{
    if (aoShapes.empty())
    {
        FGLError(FE_Failure, FGLE_EmptyInput,
                 "No shapes to rasterize, and no output grid given.");
        return FE_Failure;
    }

    if (nYSize <= 0 || nXSize <= 0)
    {
        FGLError(FE_Failure, FGLE_IllegalArg,
                 "Invalid output shape (%d, %d): both dimensions must be "
                 "positive.",
                 nYSize, nXSize);
        return FE_Failure;
    }

    std::vector<const FGGeometry *> apoGeometries;
    std::vector<double> adfValues;
    CollectShapes(aoShapes, sOptions.dfDefaultValue, apoGeometries,
                  adfValues);

/* -------------------------------------------------------------------- */
/*      Resolve the output data type.                                   */
/* -------------------------------------------------------------------- */
    FGDataType eType = sOptions.eDataType;
    if (eType == FGT_Unknown)
    {
        std::vector<double> adfAllValues(adfValues);
        adfAllValues.push_back(sOptions.dfFill);
        adfAllValues.push_back(sOptions.dfDefaultValue);
        eType = FGInferDataType(adfAllValues);
        if (eType == FGT_Unknown)
            return FE_Failure;

        FGLDebug("FG_RASTERIZE", "Inferred data type %s from %d values.",
                 FGGetDataTypeName(eType),
                 static_cast<int>(adfAllValues.size()));
    }

/* -------------------------------------------------------------------- */
/*      Validate everything before allocating and writing.              */
/* -------------------------------------------------------------------- */
    if (FGValidateValue(eType, sOptions.dfFill) != FE_None ||
        FGValidateBurnValues(eType, static_cast<int>(adfValues.size()),
                             adfValues.data(),
                             sOptions.dfDefaultValue) != FE_None)
        return FE_Failure;

    FGGrid oGrid;
    if (oGrid.Create(nYSize, nXSize, eType) != FE_None)
        return FE_Failure;
    oGrid.Fill(sOptions.dfFill);

    if (FGRasterizeGeometries(oGrid, static_cast<int>(apoGeometries.size()),
                              apoGeometries.data(), adfValues.data(),
                              oTransform, sOptions) != FE_None)
        return FE_Failure;

    oOutGrid = std::move(oGrid);
    return FE_None;
}

/************************************************************************/
/*                         FGRasterizeInPlace()                         */
/************************************************************************/

/**
 * \brief Burn shapes into an existing grid.
 *
 * The data type of oGrid governs validation: sOptions.eDataType is ignored
 * if it differs, and sOptions.dfFill is not used. An empty list of shapes
 * leaves the grid untouched.
 *
 * @param nYSize expected number of rows, or 0 to accept any.
 * @param nXSize expected number of columns, or 0 to accept any.
 *
 * @return FE_None on success, FE_Failure otherwise: FGLE_ShapeMismatch if
 * the grid shape differs from the stated one, FGLE_ValueRange or
 * FGLE_UnsupportedDataType if a value does not fit the grid.
 */
FGLErr FGRasterizeInPlace(const std::vector<FGShape> &aoShapes,
                          const FGGeoTransform &oTransform,
                          const FGRasterizeOptions &sOptions, FGGrid &oGrid,
                          int nYSize, int nXSize)
{
    if (oGrid.IsEmpty())
    {
        FGLError(FE_Failure, FGLE_IllegalArg,
                 "Cannot rasterize into an unallocated grid.");
        return FE_Failure;
    }

    if ((nYSize != 0 && nYSize != oGrid.GetYSize()) ||
        (nXSize != 0 && nXSize != oGrid.GetXSize()))
    {
        FGLError(FE_Failure, FGLE_ShapeMismatch,
                 "Output grid shape (%d, %d) does not match requested shape "
                 "(%d, %d).",
                 oGrid.GetYSize(), oGrid.GetXSize(), nYSize, nXSize);
        return FE_Failure;
    }

    if (sOptions.eDataType != FGT_Unknown &&
        sOptions.eDataType != oGrid.GetDataType())
    {
        FGLDebug("FG_RASTERIZE",
                 "Ignoring requested data type %s, using the one of the "
                 "output grid (%s).",
                 FGGetDataTypeName(sOptions.eDataType),
                 FGGetDataTypeName(oGrid.GetDataType()));
    }

    if (aoShapes.empty())
        return FE_None;

    std::vector<const FGGeometry *> apoGeometries;
    std::vector<double> adfValues;
    CollectShapes(aoShapes, sOptions.dfDefaultValue, apoGeometries,
                  adfValues);

    return FGRasterizeGeometries(oGrid, static_cast<int>(apoGeometries.size()),
                                 apoGeometries.data(), adfValues.data(),
                                 oTransform, sOptions);
}
