/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Simple feature geometry classes
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "fg_geometry.h"

#include <cmath>

namespace
{

struct GeometryTypeName
{
    FGwkbGeometryType eType;
    const char *pszName;
};

constexpr GeometryTypeName asGeometryTypeNames[] = {
    {FGwkbPoint, "Point"},
    {FGwkbLineString, "LineString"},
    {FGwkbPolygon, "Polygon"},
    {FGwkbMultiPoint, "MultiPoint"},
    {FGwkbMultiLineString, "MultiLineString"},
    {FGwkbMultiPolygon, "MultiPolygon"},
};

bool ArePointsFinite(const std::vector<FGRawPoint> &aoPoints)
{
    for (const auto &oPoint : aoPoints)
    {
        if (!std::isfinite(oPoint.x) || !std::isfinite(oPoint.y))
            return false;
    }
    return true;
}

}  // namespace

/************************************************************************/
/*                        FGGeometryTypeToName()                        */
/************************************************************************/

/** GeoJSON style name of a geometry type ("Point", "MultiPolygon", ...),
 * or nullptr for FGwkbUnknown. */
const char *FGGeometryTypeToName(FGwkbGeometryType eType)
{
    for (const auto &sEntry : asGeometryTypeNames)
    {
        if (sEntry.eType == eType)
            return sEntry.pszName;
    }
    return nullptr;
}

/** Geometry type from its GeoJSON style name (case sensitive). */
FGwkbGeometryType FGGeometryTypeFromName(const char *pszName)
{
    if (pszName == nullptr)
        return FGwkbUnknown;
    for (const auto &sEntry : asGeometryTypeNames)
    {
        if (strcmp(sEntry.pszName, pszName) == 0)
            return sEntry.eType;
    }
    return FGwkbUnknown;
}

/************************************************************************/
/*                               FGPoint                                */
/************************************************************************/

void FGPoint::getEnvelope(FGEnvelope *psEnvelope) const
{
    *psEnvelope = FGEnvelope();
    psEnvelope->Merge(m_oPos.x, m_oPos.y);
}

bool FGPoint::IsFinite() const
{
    return std::isfinite(m_oPos.x) && std::isfinite(m_oPos.y);
}

/************************************************************************/
/*                             FGLineString                             */
/************************************************************************/

/** Whether the first and last vertices are equal. */
bool FGLineString::get_IsClosed() const
{
    return !m_aoPoints.empty() && m_aoPoints.front() == m_aoPoints.back();
}

void FGLineString::getEnvelope(FGEnvelope *psEnvelope) const
{
    *psEnvelope = FGEnvelope();
    for (const auto &oPoint : m_aoPoints)
        psEnvelope->Merge(oPoint.x, oPoint.y);
}

bool FGLineString::IsFinite() const
{
    return ArePointsFinite(m_aoPoints);
}

/************************************************************************/
/*                            isClockwise()                             */
/************************************************************************/

/**
 * Returns true if the ring has clockwise winding (in a y-up frame).
 *
 * @return true if clockwise otherwise false.
 */
bool FGLinearRing::isClockwise() const
{
    const int nPointCount = getNumPoints();
    if (nPointCount < 2)
        return false;

    double dfSum = 0.0;

    for (int iVert = 0; iVert < nPointCount - 1; iVert++)
    {
        dfSum += m_aoPoints[iVert].x * m_aoPoints[iVert + 1].y -
                 m_aoPoints[iVert].y * m_aoPoints[iVert + 1].x;
    }

    dfSum += m_aoPoints[nPointCount - 1].x * m_aoPoints[0].y -
             m_aoPoints[nPointCount - 1].y * m_aoPoints[0].x;

    return dfSum < 0.0;
}

/************************************************************************/
/*                              get_Area()                              */
/************************************************************************/

/** Unsigned area enclosed by the ring (shoelace formula). */
double FGLinearRing::get_Area() const
{
    const int nPointCount = getNumPoints();
    if (nPointCount < 2)
        return 0.0;

    // Shift to the first vertex to limit cancellation.
    const double dfX0 = m_aoPoints[0].x;
    const double dfY0 = m_aoPoints[0].y;
    double dfAreaSum = 0.0;
    for (int i = 1; i < nPointCount - 1; i++)
    {
        dfAreaSum += (m_aoPoints[i].x - dfX0) * (m_aoPoints[i + 1].y - dfY0) -
                     (m_aoPoints[i + 1].x - dfX0) * (m_aoPoints[i].y - dfY0);
    }

    return 0.5 * fabs(dfAreaSum);
}

/************************************************************************/
/*                             closeRings()                             */
/************************************************************************/

/** Append a copy of the first vertex if the ring is not closed. */
void FGLinearRing::closeRings()
{
    if (m_aoPoints.size() < 2)
        return;

    if (!get_IsClosed())
        m_aoPoints.push_back(m_aoPoints.front());
}

/************************************************************************/
/*                              FGPolygon                               */
/************************************************************************/

/** A polygon without any vertex in its exterior ring is empty. */
bool FGPolygon::IsEmpty() const
{
    return m_aoRings.empty() || m_aoRings[0].IsEmpty();
}

void FGPolygon::getEnvelope(FGEnvelope *psEnvelope) const
{
    // Holes are within the exterior ring.
    if (!m_aoRings.empty())
        m_aoRings[0].getEnvelope(psEnvelope);
    else
        *psEnvelope = FGEnvelope();
}

bool FGPolygon::IsFinite() const
{
    for (const auto &oRing : m_aoRings)
    {
        if (!oRing.IsFinite())
            return false;
    }
    return true;
}

/** Area of the exterior ring minus the area of the holes. */
double FGPolygon::get_Area() const
{
    double dfArea = 0.0;
    for (size_t iRing = 0; iRing < m_aoRings.size(); ++iRing)
    {
        if (iRing == 0)
            dfArea = m_aoRings[iRing].get_Area();
        else
            dfArea -= m_aoRings[iRing].get_Area();
    }
    return dfArea;
}

/** Force every ring to be closed. */
void FGPolygon::closeRings()
{
    for (auto &oRing : m_aoRings)
        oRing.closeRings();
}

/************************************************************************/
/*                              FGGeometry                              */
/************************************************************************/

namespace
{

struct GeometryTypeVisitor
{
    FGwkbGeometryType operator()(const FGPoint &) const
    {
        return FGwkbPoint;
    }

    FGwkbGeometryType operator()(const FGLineString &) const
    {
        return FGwkbLineString;
    }

    FGwkbGeometryType operator()(const FGPolygon &) const
    {
        return FGwkbPolygon;
    }

    FGwkbGeometryType operator()(const FGMultiPoint &) const
    {
        return FGwkbMultiPoint;
    }

    FGwkbGeometryType operator()(const FGMultiLineString &) const
    {
        return FGwkbMultiLineString;
    }

    FGwkbGeometryType operator()(const FGMultiPolygon &) const
    {
        return FGwkbMultiPolygon;
    }
};

}  // namespace

FGwkbGeometryType FGGeometry::getGeometryType() const
{
    return Visit(GeometryTypeVisitor());
}

/** GeoJSON style name of the geometry type. */
const char *FGGeometry::getGeometryName() const
{
    return FGGeometryTypeToName(getGeometryType());
}

bool FGGeometry::IsEmpty() const
{
    return Visit([](const auto &oGeom) { return oGeom.IsEmpty(); });
}

/** Merge the bounding box of the geometry into psEnvelope. */
/** Bounding box of the geometry. The previous content of *psEnvelope is
 * replaced, not merged with. */
void FGGeometry::getEnvelope(FGEnvelope *psEnvelope) const
{
    Visit([psEnvelope](const auto &oGeom) { oGeom.getEnvelope(psEnvelope); });
}

/** Whether every coordinate is a finite number. */
bool FGGeometry::IsFinite() const
{
    return Visit([](const auto &oGeom) { return oGeom.IsFinite(); });
}
