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

#ifndef POLYGONIZE_POLYGONIZER_H_INCLUDED
#define POLYGONIZE_POLYGONIZER_H_INCLUDED

/*! @cond Doxygen_Suppress */

// Implements Junhua Teng, Fahui Wang, Yu Liu: An Efficient Algorithm for
// Raster-to-Vector Data Conversion: https://doi.org/10.1080/10824000809480639

#include <array>
#include <cstdint>
#include <deque>
#include <limits>
#include <map>
#include <memory>
#include <vector>

#include "fg_alg.h"

namespace featgrid
{
namespace polygonizer
{

using IndexType = std::uint32_t;
// (row, col) of a cell corner
using Point = std::array<IndexType, 2>;
using Arc = std::vector<Point>;

struct IndexedArc
{
    Arc *poArc;
    std::size_t iIndex;
};

/**
 * A raster polygon(RPolygon) is formed by a list of arcs in order.
 * Each arc has two properties:
 *     1. does the arc follows the right-hand rule respect to the area it bounds
 *     2. the next arc of the current arc
 */
struct RPolygon
{
    IndexType iBottomRightRow{0};
    IndexType iBottomRightCol{0};

    struct ArcStruct
    {
        std::unique_ptr<Arc> poArc{};
        // index of the arc following this one on its ring
        unsigned nConnection = 0;
        bool bFollowRighthand = false;

        ArcStruct(unsigned nConnectionIn, bool bFollowRighthandIn)
            : poArc(std::make_unique<Arc>()), nConnection(nConnectionIn),
              bFollowRighthand(bFollowRighthandIn)
        {
        }
    };

    // Arc 0 is always on the exterior ring: it starts at the top-left
    // corner of the first cell of the polygon met in scan order.
    std::vector<ArcStruct> oArcs{};

    RPolygon() = default;

    RPolygon(const RPolygon &) = delete;

    RPolygon &operator=(const RPolygon &) = delete;

    IndexedArc newArc(bool bFollowRighthand);

    void setArcConnection(const IndexedArc &oArc, const IndexedArc &oNextArc);

    void updateBottomRightPos(IndexType iRow, IndexType iCol);
};

/**
 * Arm class is used to record the tracings of both arcs and polygons.
 */
struct TwoArm
{
    IndexType iRow{0};
    IndexType iCol{0};

    RPolygon *poPolyInside{nullptr};
    RPolygon *poPolyAbove{nullptr};
    RPolygon *poPolyLeft{nullptr};

    IndexedArc oArcHorOuter{};
    IndexedArc oArcHorInner{};
    IndexedArc oArcVerInner{};
    IndexedArc oArcVerOuter{};

    bool bSolidHorizontal{false};
    bool bSolidVertical{false};
};

template <typename DataType> class PolygonReceiver
{
  public:
    PolygonReceiver() = default;

    PolygonReceiver(const PolygonReceiver<DataType> &) = delete;

    virtual ~PolygonReceiver() = default;

    PolygonReceiver<DataType> &
    operator=(const PolygonReceiver<DataType> &) = delete;

    virtual void receive(RPolygon *poPolygon, DataType nPolygonCellValue) = 0;
};

/**
 * Polygonizer is used to manage polygon memory and do the edge tracing process
 */
template <typename PolyIdType, typename DataType> class Polygonizer
{
  public:
    static constexpr PolyIdType THE_OUTER_POLYGON_ID =
        std::numeric_limits<PolyIdType>::max();

  private:
    using PolygonMap = std::map<PolyIdType, std::unique_ptr<RPolygon>>;

    PolyIdType nInvalidPolyId_;
    RPolygon *poTheOuterPolygon_{nullptr};
    PolygonMap oPolygonMap_{};

    PolygonReceiver<DataType> *poPolygonReceiver_;

    RPolygon *getPolygon(PolyIdType nPolygonId);

    RPolygon *createPolygon(PolyIdType nPolygonId);

    void destroyPolygon(PolyIdType nPolygonId);

  public:
    explicit Polygonizer(PolyIdType nInvalidPolyId,
                         PolygonReceiver<DataType> *poPolygonReceiver);

    Polygonizer(const Polygonizer<PolyIdType, DataType> &) = delete;

    Polygonizer<PolyIdType, DataType> &
    operator=(const Polygonizer<PolyIdType, DataType> &) = delete;

    RPolygon *getTheOuterPolygon() const
    {
        return poTheOuterPolygon_;
    }

    bool processLine(const PolyIdType *panThisLineId,
                     const DataType *panLastLineVal, TwoArm *poThisLineArm,
                     TwoArm *poLastLineArm, IndexType nCurrentRow,
                     IndexType nCols);
};

/**
 * Turn raster polygon objects into shapes, with their vertices mapped to
 * geometry space, and queue them.
 */
template <typename DataType>
class ShapeCollector : public PolygonReceiver<DataType>
{
    FGGeoTransform oInvTransform_;
    std::deque<FGShape> &oQueue_;
    int nReceived_{0};

  public:
    ShapeCollector(const FGGeoTransform &oInvTransform,
                   std::deque<FGShape> &oQueue);

    ShapeCollector(const ShapeCollector<DataType> &) = delete;

    ShapeCollector<DataType> &
    operator=(const ShapeCollector<DataType> &) = delete;

    void receive(RPolygon *poPolygon, DataType nPolygonCellValue) override;

    int getReceivedCount() const
    {
        return nReceived_;
    }
};

}  // namespace polygonizer
}  // namespace featgrid

/*! @endcond */

#endif /* POLYGONIZE_POLYGONIZER_H_INCLUDED */
