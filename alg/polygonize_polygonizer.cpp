/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Implements The Two-Arm Chains EdgeTracing Algorithm
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

/*! @cond Doxygen_Suppress */

#include "polygonize_polygonizer.h"

#include <new>
#include <utility>

namespace featgrid
{
namespace polygonizer
{

IndexedArc RPolygon::newArc(bool bFollowRighthand)
{
    const std::size_t iArcIndex = oArcs.size();
    const auto &oNewArc =
        oArcs.emplace_back(static_cast<unsigned>(iArcIndex), bFollowRighthand);
    return IndexedArc{oNewArc.poArc.get(), iArcIndex};
}

void RPolygon::setArcConnection(const IndexedArc &oArc,
                                const IndexedArc &oNextArc)
{
    oArcs[oArc.iIndex].nConnection = static_cast<unsigned>(oNextArc.iIndex);
}

void RPolygon::updateBottomRightPos(IndexType iRow, IndexType iCol)
{
    iBottomRightRow = iRow;
    iBottomRightCol = iCol;
}

/************************************************************************/
/*                       ProcessArmConnections()                        */
/*                                                                      */
/*      Every cell owns two arms starting at its top-left corner: a     */
/*      horizontal one along its top side, and a vertical one along     */
/*      its left side.  An arm is solid when it separates two           */
/*      different polygons, virtual otherwise.  The corner is handled   */
/*      according to the kind of the four arms meeting at it: the       */
/*      current cell arms, the vertical arm of the cell above and the   */
/*      horizontal arm of the cell on the left.  Depending on that      */
/*      kind, arcs are started, passed on to the current arms, or       */
/*      closed by linking them together.                                */
/************************************************************************/

static void ProcessArmConnections(TwoArm *poCurrent, TwoArm *poAbove,
                                  TwoArm *poLeft)
{
    poCurrent->poPolyInside->updateBottomRightPos(poCurrent->iRow,
                                                  poCurrent->iCol);
    poCurrent->bSolidVertical = poCurrent->poPolyInside != poLeft->poPolyInside;
    poCurrent->bSolidHorizontal =
        poCurrent->poPolyInside != poAbove->poPolyInside;
    poCurrent->poPolyAbove = poAbove->poPolyInside;
    poCurrent->poPolyLeft = poLeft->poPolyInside;

    const Point oCorner{poCurrent->iRow, poCurrent->iCol};

    // Start the two arcs of the current polygon at this corner.
    const auto StartInnerArcs = [poCurrent, &oCorner]()
    {
        RPolygon *poPoly = poCurrent->poPolyInside;
        poCurrent->oArcVerInner = poPoly->newArc(true);
        poCurrent->oArcHorInner = poPoly->newArc(false);
        poPoly->setArcConnection(poCurrent->oArcHorInner,
                                 poCurrent->oArcVerInner);
        poCurrent->oArcVerInner.poArc->push_back(oCorner);
    };

    // Start the two arcs of the polygon surrounding this corner.
    const auto StartOuterArcs = [poCurrent, &oCorner](RPolygon *poPoly)
    {
        poCurrent->oArcHorOuter = poPoly->newArc(true);
        poCurrent->oArcVerOuter = poPoly->newArc(false);
        poPoly->setArcConnection(poCurrent->oArcVerOuter,
                                 poCurrent->oArcHorOuter);
        poCurrent->oArcHorOuter.poArc->push_back(oCorner);
    };

    // Join the outer arc coming from the left with the one coming from
    // above: they both bound the polygon of the top-left cell.
    const auto CloseTopLeftArcs = [poAbove, poLeft, &oCorner]()
    {
        poLeft->oArcHorOuter.poArc->push_back(oCorner);
        poLeft->poPolyAbove->setArcConnection(poLeft->oArcHorOuter,
                                              poAbove->oArcVerOuter);
    };

    constexpr int BIT_CUR_HORIZ = 0;
    constexpr int BIT_CUR_VERT = 1;
    constexpr int BIT_LEFT = 2;
    constexpr int BIT_ABOVE = 3;

    const int nArmConnectionType =
        (static_cast<int>(poAbove->bSolidVertical) << BIT_ABOVE) |
        (static_cast<int>(poLeft->bSolidHorizontal) << BIT_LEFT) |
        (static_cast<int>(poCurrent->bSolidVertical) << BIT_CUR_VERT) |
        (static_cast<int>(poCurrent->bSolidHorizontal) << BIT_CUR_HORIZ);

    constexpr int ABOVE_SOLID = 1 << BIT_ABOVE;
    constexpr int LEFT_SOLID = 1 << BIT_LEFT;
    constexpr int CUR_VERT_SOLID = 1 << BIT_CUR_VERT;
    constexpr int CUR_HORIZ_SOLID = 1 << BIT_CUR_HORIZ;

    switch (nArmConnectionType)
    {
        case 0:
            // Inside a polygon.
            break;

        case CUR_VERT_SOLID | CUR_HORIZ_SOLID:  // 3
            StartInnerArcs();
            StartOuterArcs(poAbove->poPolyInside);
            break;

        case LEFT_SOLID | CUR_HORIZ_SOLID:  // 5
            poCurrent->oArcHorInner = poLeft->oArcHorInner;
            poCurrent->oArcHorOuter = poLeft->oArcHorOuter;
            break;

        case LEFT_SOLID | CUR_VERT_SOLID:  // 6
            poCurrent->oArcVerInner = poLeft->oArcHorOuter;
            poCurrent->oArcVerOuter = poLeft->oArcHorInner;
            poCurrent->oArcVerInner.poArc->push_back(oCorner);
            poCurrent->oArcVerOuter.poArc->push_back(oCorner);
            break;

        case LEFT_SOLID | CUR_VERT_SOLID | CUR_HORIZ_SOLID:  // 7
            poCurrent->oArcHorOuter = poLeft->oArcHorOuter;
            poCurrent->oArcVerOuter = poLeft->oArcHorInner;
            poLeft->oArcHorInner.poArc->push_back(oCorner);
            StartInnerArcs();
            break;

        case ABOVE_SOLID | CUR_HORIZ_SOLID:  // 9
            poCurrent->oArcHorOuter = poAbove->oArcVerInner;
            poCurrent->oArcHorInner = poAbove->oArcVerOuter;
            poCurrent->oArcHorOuter.poArc->push_back(oCorner);
            poCurrent->oArcHorInner.poArc->push_back(oCorner);
            break;

        case ABOVE_SOLID | CUR_VERT_SOLID:  // 10
            poCurrent->oArcVerInner = poAbove->oArcVerInner;
            poCurrent->oArcVerOuter = poAbove->oArcVerOuter;
            break;

        case ABOVE_SOLID | CUR_VERT_SOLID | CUR_HORIZ_SOLID:  // 11
            poCurrent->oArcHorOuter = poAbove->oArcVerInner;
            poCurrent->oArcVerOuter = poAbove->oArcVerOuter;
            poCurrent->oArcHorOuter.poArc->push_back(oCorner);
            StartInnerArcs();
            break;

        case ABOVE_SOLID | LEFT_SOLID:  // 12
            CloseTopLeftArcs();
            poAbove->oArcVerInner.poArc->push_back(oCorner);
            poCurrent->poPolyInside->setArcConnection(poAbove->oArcVerInner,
                                                      poLeft->oArcHorInner);
            break;

        case ABOVE_SOLID | LEFT_SOLID | CUR_HORIZ_SOLID:  // 13
            CloseTopLeftArcs();
            poCurrent->oArcHorOuter = poAbove->oArcVerInner;
            poCurrent->oArcHorInner = poLeft->oArcHorInner;
            poCurrent->oArcHorOuter.poArc->push_back(oCorner);
            break;

        case ABOVE_SOLID | LEFT_SOLID | CUR_VERT_SOLID:  // 14
            CloseTopLeftArcs();
            poCurrent->oArcVerInner = poAbove->oArcVerInner;
            poCurrent->oArcVerOuter = poLeft->oArcHorInner;
            poCurrent->oArcVerOuter.poArc->push_back(oCorner);
            break;

        case ABOVE_SOLID | LEFT_SOLID | CUR_VERT_SOLID | CUR_HORIZ_SOLID:  // 15
            if (poAbove->poPolyLeft == poCurrent->poPolyInside)
            {
                // The top-left and current cells (main diagonal) are in
                // the same polygon.
                poCurrent->oArcVerInner = poLeft->oArcHorOuter;
                poCurrent->oArcHorInner = poAbove->oArcVerOuter;
                poCurrent->oArcVerInner.poArc->push_back(oCorner);
                poCurrent->oArcHorInner.poArc->push_back(oCorner);
            }
            else
            {
                CloseTopLeftArcs();
                StartInnerArcs();
            }

            if (poAbove->poPolyInside == poLeft->poPolyInside)
            {
                // The top-right and bottom-left cells (secondary diagonal)
                // are in the same polygon.
                poAbove->poPolyInside->setArcConnection(poAbove->oArcVerInner,
                                                        poLeft->oArcHorInner);
                poAbove->oArcVerInner.poArc->push_back(oCorner);
                StartOuterArcs(poAbove->poPolyInside);
            }
            else
            {
                poCurrent->oArcHorOuter = poAbove->oArcVerInner;
                poCurrent->oArcVerOuter = poLeft->oArcHorInner;
                poCurrent->oArcHorOuter.poArc->push_back(oCorner);
                poCurrent->oArcVerOuter.poArc->push_back(oCorner);
            }
            break;

        default:
            // Types 1, 2, 4 and 8 cannot happen: a solid arm never ends
            // alone at a corner.
            break;
    }
}

template <typename PolyIdType, typename DataType>
Polygonizer<PolyIdType, DataType>::Polygonizer(
    PolyIdType nInvalidPolyId, PolygonReceiver<DataType> *poPolygonReceiver)
    : nInvalidPolyId_(nInvalidPolyId), poPolygonReceiver_(poPolygonReceiver)
{
    poTheOuterPolygon_ = createPolygon(THE_OUTER_POLYGON_ID);
}

template <typename PolyIdType, typename DataType>
RPolygon *Polygonizer<PolyIdType, DataType>::getPolygon(PolyIdType nPolygonId)
{
    const auto oIter = oPolygonMap_.find(nPolygonId);
    if (oIter == oPolygonMap_.end())
    {
        return createPolygon(nPolygonId);
    }
    return oIter->second.get();
}

template <typename PolyIdType, typename DataType>
RPolygon *
Polygonizer<PolyIdType, DataType>::createPolygon(PolyIdType nPolygonId)
{
    auto &poPolygon = oPolygonMap_[nPolygonId];
    poPolygon = std::make_unique<RPolygon>();
    return poPolygon.get();
}

template <typename PolyIdType, typename DataType>
void Polygonizer<PolyIdType, DataType>::destroyPolygon(PolyIdType nPolygonId)
{
    oPolygonMap_.erase(nPolygonId);
}

/************************************************************************/
/*                            processLine()                             */
/*                                                                      */
/*      Trace the arms of one line of cells, then hand over the         */
/*      polygons that did not extend to this line: they are complete.   */
/*      panThisLineId holds the final polygon ids of line nCurrentRow   */
/*      (all THE_OUTER_POLYGON_ID past the last line) and               */
/*      panLastLineVal the values of the line before it.                */
/************************************************************************/

template <typename PolyIdType, typename DataType>
bool Polygonizer<PolyIdType, DataType>::processLine(
    const PolyIdType *panThisLineId, const DataType *panLastLineVal,
    TwoArm *poThisLineArm, TwoArm *poLastLineArm, const IndexType nCurrentRow,
    const IndexType nCols)
{
    try
    {
        // Arms 0 and nCols + 1 are sentinels on the outer polygon.
        TwoArm *poLeft = poThisLineArm;
        poLeft->poPolyInside = poTheOuterPolygon_;
        poLastLineArm[nCols + 1].poPolyInside = poTheOuterPolygon_;

        for (IndexType col = 0; col <= nCols; ++col)
        {
            TwoArm *poCurrent = poThisLineArm + col + 1;
            poCurrent->iRow = nCurrentRow;
            poCurrent->iCol = col;
            poCurrent->poPolyInside = col < nCols
                                          ? getPolygon(panThisLineId[col])
                                          : poTheOuterPolygon_;
            ProcessArmConnections(poCurrent, poLastLineArm + col + 1,
                                  poThisLineArm + col);
        }

        std::vector<PolyIdType> anCompletedIds;
        for (const auto &oEntry : oPolygonMap_)
        {
            if (oEntry.second->iBottomRightRow + 1 == nCurrentRow)
                anCompletedIds.push_back(oEntry.first);
        }

        for (const PolyIdType nPolyId : anCompletedIds)
        {
            RPolygon *poPolygon = oPolygonMap_[nPolyId].get();

            // Masked cells form polygons too, they are not emitted.
            if (nPolyId != nInvalidPolyId_)
            {
                poPolygonReceiver_->receive(
                    poPolygon, panLastLineVal[poPolygon->iBottomRightCol]);
            }

            destroyPolygon(nPolyId);
        }
        return true;
    }
    catch (const std::bad_alloc &)
    {
        FGLError(FE_Failure, FGLE_OutOfMemory,
                 "Out of memory in Polygonizer::processLine");
        return false;
    }
}

/************************************************************************/
/*                           ShapeCollector                             */
/************************************************************************/

template <typename DataType>
ShapeCollector<DataType>::ShapeCollector(const FGGeoTransform &oInvTransform,
                                         std::deque<FGShape> &oQueue)
    : PolygonReceiver<DataType>(), oInvTransform_(oInvTransform),
      oQueue_(oQueue)
{
}

template <typename DataType>
void ShapeCollector<DataType>::receive(RPolygon *poPolygon,
                                       DataType nPolygonCellValue)
{
    std::vector<bool> oAccessedArc(poPolygon->oArcs.size(), false);

    FGPolygon oPolygon;

    const auto AddArcToRing =
        [this, poPolygon](std::size_t iArcIndex, std::vector<FGRawPoint> &aoRing)
    {
        const auto &oArc = poPolygon->oArcs[iArcIndex];
        const std::size_t nArcPointCount = oArc.poArc->size();
        for (std::size_t i = 0; i < nArcPointCount; ++i)
        {
            const Point &oCorner =
                (*oArc.poArc)[oArc.bFollowRighthand
                                  ? i
                                  : (nArcPointCount - i - 1)];

            double dfX = 0.0;
            double dfY = 0.0;
            // Corners are (row, col); the inverse maps (col, row) to (x, y).
            oInvTransform_.Apply(static_cast<double>(oCorner[1]),
                                 static_cast<double>(oCorner[0]), &dfX, &dfY);
            aoRing.emplace_back(dfX, dfY);
        }
    };

    // The ring through arc 0 is the exterior one; any other ring is a hole.
    for (std::size_t iFirstArcIndex = 0; iFirstArcIndex < oAccessedArc.size();
         ++iFirstArcIndex)
    {
        if (oAccessedArc[iFirstArcIndex])
            continue;

        std::vector<FGRawPoint> aoRing;
        std::size_t iArcIndex = iFirstArcIndex;
        do
        {
            AddArcToRing(iArcIndex, aoRing);
            oAccessedArc[iArcIndex] = true;
            iArcIndex = poPolygon->oArcs[iArcIndex].nConnection;
        } while (iArcIndex != iFirstArcIndex);

        FGLinearRing oRing(std::move(aoRing));
        oRing.closeRings();
        oPolygon.addRing(std::move(oRing));
    }

    oQueue_.emplace_back(FGGeometry(std::move(oPolygon)),
                         static_cast<double>(nPolygonCellValue));
    ++nReceived_;
}

template class Polygonizer<GInt32, double>;

template class ShapeCollector<double>;

}  // namespace polygonizer
}  // namespace featgrid

/*! @endcond */
