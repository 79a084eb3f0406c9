/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Grid to Polygon Converter
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "fg_alg.h"

#include <algorithm>
#include <deque>
#include <limits>
#include <memory>
#include <new>
#include <utility>
#include <vector>

#include "fg_alg_priv.h"
#include "fgl_string.h"

#include "polygonize_polygonizer.h"

using namespace featgrid::polygonizer;

/************************************************************************/
/*                      FGShapeGenerator::Private                       */
/************************************************************************/

struct FGShapeGenerator::Private
{
    const FGGrid *poGrid = nullptr;
    const FGGrid *poMask = nullptr;
    int nXSize = 0;
    int nYSize = 0;

    FGRasterPolygonEnumerator oFirstEnum;
    FGRasterPolygonEnumerator oSecondEnum;

    std::vector<double> adfLastLineVal{};
    std::vector<double> adfThisLineVal{};
    std::vector<GInt32> anLastLineId{};
    std::vector<GInt32> anThisLineId{};
    std::vector<GInt32> anFinalLineId{};
    std::vector<GByte> abyMaskLine{};
    std::vector<TwoArm> aoLastLineArm{};
    std::vector<TwoArm> aoThisLineArm{};

    std::deque<FGShape> oQueue{};
    std::unique_ptr<ShapeCollector<double>> poCollector{};
    std::unique_ptr<Polygonizer<GInt32, double>> poPolygonizer{};

    // Next line of the second pass, up to nYSize included.
    int iY = 0;
    FGLErr eErr = FE_None;

    explicit Private(int nConnectedness)
        : oFirstEnum(nConnectedness), oSecondEnum(nConnectedness)
    {
    }

    void ReadLine(int iLine);
    bool FirstPass();
    bool ProcessNextLine();
};

/************************************************************************/
/*                              ReadLine()                              */
/*                                                                      */
/*      Fetch the values of a line, and its mask when there is one.     */
/************************************************************************/

void FGShapeGenerator::Private::ReadLine(int iLine)
{
    poGrid->ReadLine(iLine, adfThisLineVal.data());
    if (poMask != nullptr)
    {
        for (int iX = 0; iX < nXSize; iX++)
            abyMaskLine[iX] = poMask->GetValue(iLine, iX) != 0.0 ? 1 : 0;
    }
}

/************************************************************************/
/*                             FirstPass()                              */
/*                                                                      */
/*      The first pass over the grid is only used to build up the       */
/*      polygon id map so we will know in advance what polygons are     */
/*      what on the second pass.                                        */
/************************************************************************/

bool FGShapeGenerator::Private::FirstPass()
{
    const GByte *pabyMask = poMask ? abyMaskLine.data() : nullptr;

    for (int iLine = 0; iLine < nYSize; iLine++)
    {
        ReadLine(iLine);

        const bool bOK =
            iLine == 0
                ? oFirstEnum.ProcessLine(nullptr, adfThisLineVal.data(),
                                         nullptr, anThisLineId.data(),
                                         pabyMask, nXSize)
                : oFirstEnum.ProcessLine(
                      adfLastLineVal.data(), adfThisLineVal.data(),
                      anLastLineId.data(), anThisLineId.data(), pabyMask,
                      nXSize);
        if (!bOK)
            return false;

        std::swap(adfLastLineVal, adfThisLineVal);
        std::swap(anLastLineId, anThisLineId);
    }

    // Make every polygon id point to the final id it should use.
    oFirstEnum.CompleteMerges();
    return true;
}

/************************************************************************/
/*                          ProcessNextLine()                           */
/*                                                                      */
/*      One step of the second pass, during which the polygon edges     */
/*      are traced.  Line nYSize is a virtual line made of the outer    */
/*      polygon, that completes the polygons of the last line.         */
/************************************************************************/

bool FGShapeGenerator::Private::ProcessNextLine()
{
    if (iY < nYSize)
    {
        ReadLine(iY);

        // Redo the same thing done in the first pass, and map the ids to
        // their final value.
        const GByte *pabyMask = poMask ? abyMaskLine.data() : nullptr;
        const bool bOK =
            iY == 0 ? oSecondEnum.ProcessLine(nullptr, adfThisLineVal.data(),
                                              nullptr, anThisLineId.data(),
                                              pabyMask, nXSize)
                    : oSecondEnum.ProcessLine(
                          adfLastLineVal.data(), adfThisLineVal.data(),
                          anLastLineId.data(), anThisLineId.data(), pabyMask,
                          nXSize);
        if (!bOK)
            return false;

        for (int iX = 0; iX < nXSize; iX++)
        {
            anFinalLineId[iX] = anThisLineId[iX] == -1
                                    ? -1
                                    : oFirstEnum.anPolyIdMap[anThisLineId[iX]];
        }
    }
    else
    {
        std::fill(anFinalLineId.begin(), anFinalLineId.end(),
                  Polygonizer<GInt32, double>::THE_OUTER_POLYGON_ID);
    }

    if (!poPolygonizer->processLine(
            anFinalLineId.data(), adfLastLineVal.data(), aoThisLineArm.data(),
            aoLastLineArm.data(), static_cast<IndexType>(iY),
            static_cast<IndexType>(nXSize)))
        return false;

    std::swap(adfLastLineVal, adfThisLineVal);
    std::swap(anLastLineId, anThisLineId);
    std::swap(aoThisLineArm, aoLastLineArm);
    ++iY;

    if (iY > nYSize)
    {
        FGLDebug("FG_POLYGONIZE", "Emitted %d polygons from a %d x %d grid.",
                 poCollector->getReceivedCount(), nYSize, nXSize);
    }
    return true;
}

/************************************************************************/
/*                          FGShapeGenerator                            */
/************************************************************************/

FGShapeGenerator::FGShapeGenerator() = default;

FGShapeGenerator::~FGShapeGenerator() = default;

/**
 * \brief Fetch the next shape.
 *
 * Lines of the grid are only processed until at least one more polygon is
 * complete.
 *
 * @param oShape receives the polygon and the value of its cells.
 * @return true if a shape was fetched, false when the sequence is exhausted
 * or an error occurred (see GetErr()).
 */
bool FGShapeGenerator::GetNextShape(FGShape &oShape)
{
    Private *psPriv = m_poPrivate.get();
    if (psPriv->eErr != FE_None)
        return false;

    while (psPriv->oQueue.empty() && psPriv->iY <= psPriv->nYSize)
    {
        if (!psPriv->ProcessNextLine())
        {
            psPriv->eErr = FE_Failure;
            psPriv->oQueue.clear();
            return false;
        }
    }

    if (psPriv->oQueue.empty())
        return false;

    oShape = std::move(psPriv->oQueue.front());
    psPriv->oQueue.pop_front();
    return true;
}

/** FE_Failure if the generation of shapes stopped on an error. */
FGLErr FGShapeGenerator::GetErr() const
{
    return m_poPrivate->eErr;
}

/************************************************************************/
/*                    FGPolygonizeOptionsFromList()                     */
/************************************************************************/

/**
 * \brief Parse polygonization options from a name=value list.
 *
 * <ul>
 * <li>8CONNECTED=8: May be set to "8" to use 8 connectedness. Otherwise 4
 * connectedness will be applied to the algorithm.</li>
 * </ul>
 */
FGLErr FGPolygonizeOptionsFromList(FGLConstList papszOptions,
                                   FGPolygonizeOptions *psOptions)
{
    VALIDATE_POINTER1(psOptions, "FGPolygonizeOptionsFromList", FE_Failure);

    const char *pszOpt = FGLFetchNameValue(papszOptions, "8CONNECTED");
    if (pszOpt == nullptr)
        psOptions->nConnectedness = 4;
    else if (EQUAL(pszOpt, "4") || EQUAL(pszOpt, "NO"))
        psOptions->nConnectedness = 4;
    else
        psOptions->nConnectedness = 8;
    return FE_None;
}

/************************************************************************/
/*                       FGCreateShapeGenerator()                       */
/************************************************************************/

/**
 * \brief Create a generator of the polygons of a grid.
 *
 * Connected cells of equal value are grouped into polygons. Each polygon
 * has an exterior ring and one ring per hole, with vertices on the cell
 * corners mapped to geometry space by the inverse of oTransform.
 *
 * The first pass over the grid, that finds which cells belong to the same
 * polygon, is done here. Outlines are traced while shapes are fetched.
 *
 * @param oGrid grid of any supported data type, or of FGT_Bool.
 * @param poMask optional grid of the same shape. Cells where it is zero do
 * not belong to any polygon.
 * @param oTransform the geometry to grid space transform.
 * @param sOptions polygonization options.
 *
 * @return a generator, or nullptr on error (FGLE_ShapeMismatch for a mask
 * of another shape, FGLE_SingularTransform when oTransform has no inverse).
 */
std::unique_ptr<FGShapeGenerator>
FGCreateShapeGenerator(const FGGrid &oGrid, const FGGrid *poMask,
                       const FGGeoTransform &oTransform,
                       const FGPolygonizeOptions &sOptions)
{
    if (oGrid.IsEmpty())
    {
        FGLError(FE_Failure, FGLE_IllegalArg,
                 "Cannot polygonize an unallocated grid.");
        return nullptr;
    }

    if (poMask != nullptr &&
        (poMask->GetYSize() != oGrid.GetYSize() ||
         poMask->GetXSize() != oGrid.GetXSize()))
    {
        FGLError(FE_Failure, FGLE_ShapeMismatch,
                 "Mask shape (%d, %d) does not match grid shape (%d, %d).",
                 poMask->GetYSize(), poMask->GetXSize(), oGrid.GetYSize(),
                 oGrid.GetXSize());
        return nullptr;
    }

    if (sOptions.nConnectedness != 4 && sOptions.nConnectedness != 8)
    {
        FGLError(FE_Failure, FGLE_IllegalArg,
                 "Invalid connectedness %d: must be 4 or 8.",
                 sOptions.nConnectedness);
        return nullptr;
    }

    const int nXSize = oGrid.GetXSize();
    const int nYSize = oGrid.GetYSize();
    if (nXSize > std::numeric_limits<int>::max() - 2)
    {
        FGLError(FE_Failure, FGLE_IllegalArg, "Too wide grid");
        return nullptr;
    }

    FGGeoTransform oInvTransform;
    if (!oTransform.GetInverse(oInvTransform))
        return nullptr;

    std::unique_ptr<FGShapeGenerator> poGenerator(new FGShapeGenerator());
    try
    {
        auto psPriv = std::make_unique<FGShapeGenerator::Private>(
            sOptions.nConnectedness);
        psPriv->poGrid = &oGrid;
        psPriv->poMask = poMask;
        psPriv->nXSize = nXSize;
        psPriv->nYSize = nYSize;

        psPriv->adfLastLineVal.resize(nXSize);
        psPriv->adfThisLineVal.resize(nXSize);
        psPriv->anLastLineId.resize(nXSize);
        psPriv->anThisLineId.resize(nXSize);
        psPriv->anFinalLineId.resize(nXSize);
        if (poMask != nullptr)
            psPriv->abyMaskLine.resize(nXSize);

        if (!psPriv->FirstPass())
            return nullptr;

        psPriv->poCollector = std::make_unique<ShapeCollector<double>>(
            oInvTransform, psPriv->oQueue);
        psPriv->poPolygonizer = std::make_unique<Polygonizer<GInt32, double>>(
            -1, psPriv->poCollector.get());

        psPriv->aoLastLineArm.resize(static_cast<size_t>(nXSize) + 2);
        psPriv->aoThisLineArm.resize(static_cast<size_t>(nXSize) + 2);
        for (auto &oArm : psPriv->aoLastLineArm)
            oArm.poPolyInside = psPriv->poPolygonizer->getTheOuterPolygon();

        poGenerator->m_poPrivate = std::move(psPriv);
    }
    catch (const std::bad_alloc &)
    {
        FGLError(FE_Failure, FGLE_OutOfMemory,
                 "Cannot allocate polygonizer buffers for a %d x %d grid.",
                 nYSize, nXSize);
        return nullptr;
    }

    return poGenerator;
}

/************************************************************************/
/*                            FGPolygonize()                            */
/************************************************************************/

/**
 * \brief Collect all the polygons of a grid.
 *
 * Same as draining the generator returned by FGCreateShapeGenerator().
 * aoShapes is only replaced on success.
 */
FGLErr FGPolygonize(const FGGrid &oGrid, const FGGrid *poMask,
                    const FGGeoTransform &oTransform,
                    const FGPolygonizeOptions &sOptions,
                    std::vector<FGShape> &aoShapes)
{
    auto poGenerator =
        FGCreateShapeGenerator(oGrid, poMask, oTransform, sOptions);
    if (!poGenerator)
        return FE_Failure;

    std::vector<FGShape> aoCollected;
    FGShape oShape;
    while (poGenerator->GetNextShape(oShape))
        aoCollected.push_back(std::move(oShape));

    if (poGenerator->GetErr() != FE_None)
        return FE_Failure;

    aoShapes = std::move(aoCollected);
    return FE_None;
}
