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

#ifndef FG_GEOMETRY_H_INCLUDED
#define FG_GEOMETRY_H_INCLUDED

#include "fgl_port.h"

#include <algorithm>
#include <initializer_list>
#include <limits>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/**
 * \file fg_geometry.h
 *
 * Simple feature geometry classes. Geometries are plain values in 2D; a
 * FGGeometry holds exactly one of the six supported kinds.
 */

/** List of geometry types, numbered as in the WKB encoding */
typedef enum
{
    FGwkbUnknown = 0,
    FGwkbPoint = 1,
    FGwkbLineString = 2,
    FGwkbPolygon = 3,
    FGwkbMultiPoint = 4,
    FGwkbMultiLineString = 5,
    FGwkbMultiPolygon = 6
} FGwkbGeometryType;

const char FGL_DLL *FGGeometryTypeToName(FGwkbGeometryType eType);
FGwkbGeometryType FGL_DLL FGGeometryTypeFromName(const char *pszName);

/************************************************************************/
/*                              FGRawPoint                              */
/************************************************************************/

/** Simple container for a position. */
class FGL_DLL FGRawPoint
{
  public:
    /** Constructor */
    FGRawPoint() = default;

    /** Constructor */
    FGRawPoint(double xIn, double yIn) : x(xIn), y(yIn)
    {
    }

    /** x */
    double x = 0.0;
    /** y */
    double y = 0.0;

    bool operator==(const FGRawPoint &other) const
    {
        return x == other.x && y == other.y;
    }

    bool operator!=(const FGRawPoint &other) const
    {
        return !(operator==(other));
    }
};

/************************************************************************/
/*                              FGEnvelope                              */
/************************************************************************/

/** Simple container for a bounding region (rectangle). An envelope that
 * has never been merged with a position is not initialized. */
class FGL_DLL FGEnvelope
{
  public:
    FGEnvelope()
        : MinX(std::numeric_limits<double>::infinity()),
          MaxX(-std::numeric_limits<double>::infinity()),
          MinY(std::numeric_limits<double>::infinity()),
          MaxY(-std::numeric_limits<double>::infinity())
    {
    }

    /** Minimum X value */
    double MinX;
    /** Maximum X value */
    double MaxX;
    /** Minimum Y value */
    double MinY;
    /** Maximum Y value */
    double MaxY;

    /** Return whether the object has been initialized */
    bool IsInit() const
    {
        return MinX != std::numeric_limits<double>::infinity();
    }

    /** Update the current object by computing its union with the position */
    void Merge(double dfX, double dfY)
    {
        MinX = std::min(MinX, dfX);
        MaxX = std::max(MaxX, dfX);
        MinY = std::min(MinY, dfY);
        MaxY = std::max(MaxY, dfY);
    }

    /** Update the current object by computing its union with the other
     * rectangle */
    void Merge(const FGEnvelope &sOther)
    {
        MinX = std::min(MinX, sOther.MinX);
        MaxX = std::max(MaxX, sOther.MaxX);
        MinY = std::min(MinY, sOther.MinY);
        MaxY = std::max(MaxY, sOther.MaxY);
    }

    /** Return whether the current rectangle intersects the other rectangle */
    bool Intersects(const FGEnvelope &other) const
    {
        return MinX <= other.MaxX && MaxX >= other.MinX &&
               MinY <= other.MaxY && MaxY >= other.MinY;
    }
};

/************************************************************************/
/*                               FGPoint                                */
/************************************************************************/

/** Point class. */
class FGL_DLL FGPoint
{
  public:
    FGPoint() = default;
    FGPoint(double xIn, double yIn) : m_oPos(xIn, yIn)
    {
    }

    double getX() const
    {
        return m_oPos.x;
    }

    double getY() const
    {
        return m_oPos.y;
    }

    void setX(double xIn)
    {
        m_oPos.x = xIn;
    }

    void setY(double yIn)
    {
        m_oPos.y = yIn;
    }

    /** A point always holds a position. */
    bool IsEmpty() const
    {
        return false;
    }

    void getEnvelope(FGEnvelope *psEnvelope) const;
    bool IsFinite() const;

    bool operator==(const FGPoint &other) const
    {
        return m_oPos == other.m_oPos;
    }

  private:
    FGRawPoint m_oPos{};
};

/************************************************************************/
/*                             FGLineString                             */
/************************************************************************/

/** Concrete representation of a multi-vertex line. */
class FGL_DLL FGLineString
{
  public:
    FGLineString() = default;
    FGLineString(std::initializer_list<FGRawPoint> aoPoints)
        : m_aoPoints(aoPoints)
    {
    }
    explicit FGLineString(std::vector<FGRawPoint> aoPoints)
        : m_aoPoints(std::move(aoPoints))
    {
    }

    int getNumPoints() const
    {
        return static_cast<int>(m_aoPoints.size());
    }

    double getX(int i) const
    {
        return m_aoPoints[i].x;
    }

    double getY(int i) const
    {
        return m_aoPoints[i].y;
    }

    const FGRawPoint &getPoint(int i) const
    {
        return m_aoPoints[i];
    }

    /** Vertices, in order */
    const std::vector<FGRawPoint> &getPoints() const
    {
        return m_aoPoints;
    }

    void addPoint(double x, double y)
    {
        m_aoPoints.emplace_back(x, y);
    }

    void setPoints(std::vector<FGRawPoint> aoPoints)
    {
        m_aoPoints = std::move(aoPoints);
    }

    void empty()
    {
        m_aoPoints.clear();
    }

    bool IsEmpty() const
    {
        return m_aoPoints.empty();
    }

    bool get_IsClosed() const;
    void getEnvelope(FGEnvelope *psEnvelope) const;
    bool IsFinite() const;

    bool operator==(const FGLineString &other) const
    {
        return m_aoPoints == other.m_aoPoints;
    }

  protected:
    std::vector<FGRawPoint> m_aoPoints{};
};

/************************************************************************/
/*                             FGLinearRing                             */
/************************************************************************/

/** Concrete representation of a closed ring. Rings only appear as parts
 * of a FGPolygon. */
class FGL_DLL FGLinearRing : public FGLineString
{
  public:
    using FGLineString::FGLineString;

    bool isClockwise() const;
    double get_Area() const;
    void closeRings();
};

/************************************************************************/
/*                              FGPolygon                               */
/************************************************************************/

/** Concrete class representing polygons: an exterior ring, and zero or
 * more interior rings (holes). */
class FGL_DLL FGPolygon
{
  public:
    FGPolygon() = default;

    /** Append a ring. The first ring added is the exterior one. */
    void addRing(FGLinearRing oRing)
    {
        m_aoRings.push_back(std::move(oRing));
    }

    /** Exterior ring, or nullptr for an empty polygon */
    const FGLinearRing *getExteriorRing() const
    {
        return m_aoRings.empty() ? nullptr : &m_aoRings[0];
    }

    int getNumInteriorRings() const
    {
        return m_aoRings.empty() ? 0 : static_cast<int>(m_aoRings.size()) - 1;
    }

    const FGLinearRing *getInteriorRing(int iRing) const
    {
        if (iRing < 0 || iRing >= getNumInteriorRings())
            return nullptr;
        return &m_aoRings[iRing + 1];
    }

    /** Exterior ring followed by the interior rings */
    const std::vector<FGLinearRing> &getRings() const
    {
        return m_aoRings;
    }

    bool IsEmpty() const;
    void getEnvelope(FGEnvelope *psEnvelope) const;
    bool IsFinite() const;
    double get_Area() const;
    void closeRings();

    bool operator==(const FGPolygon &other) const
    {
        return m_aoRings == other.m_aoRings;
    }

  private:
    std::vector<FGLinearRing> m_aoRings{};
};

/************************************************************************/
/*                           FGMultiGeometryT                           */
/************************************************************************/

/** Homogeneous collection of geometries of one kind. */
template <class PartT> class FGMultiGeometryT
{
  public:
    FGMultiGeometryT() = default;
    FGMultiGeometryT(std::initializer_list<PartT> aoParts) : m_aoParts(aoParts)
    {
    }

    void addGeometry(PartT oPart)
    {
        m_aoParts.push_back(std::move(oPart));
    }

    int getNumGeometries() const
    {
        return static_cast<int>(m_aoParts.size());
    }

    const PartT &getGeometryRef(int i) const
    {
        return m_aoParts[i];
    }

    typename std::vector<PartT>::const_iterator begin() const
    {
        return m_aoParts.begin();
    }

    typename std::vector<PartT>::const_iterator end() const
    {
        return m_aoParts.end();
    }

    /** Empty when it has no part, or only empty parts */
    bool IsEmpty() const
    {
        for (const auto &oPart : m_aoParts)
        {
            if (!oPart.IsEmpty())
                return false;
        }
        return true;
    }

    void getEnvelope(FGEnvelope *psEnvelope) const
    {
        *psEnvelope = FGEnvelope();
        FGEnvelope oPartEnv;
        for (const auto &oPart : m_aoParts)
        {
            oPart.getEnvelope(&oPartEnv);
            psEnvelope->Merge(oPartEnv);
        }
    }

    bool IsFinite() const
    {
        for (const auto &oPart : m_aoParts)
        {
            if (!oPart.IsFinite())
                return false;
        }
        return true;
    }

    bool operator==(const FGMultiGeometryT &other) const
    {
        return m_aoParts == other.m_aoParts;
    }

  private:
    std::vector<PartT> m_aoParts{};
};

/** A collection of points. */
typedef FGMultiGeometryT<FGPoint> FGMultiPoint;
/** A collection of line strings. */
typedef FGMultiGeometryT<FGLineString> FGMultiLineString;
/** A collection of non-overlapping polygons. */
typedef FGMultiGeometryT<FGPolygon> FGMultiPolygon;

/************************************************************************/
/*                              FGGeometry                              */
/************************************************************************/

/** Any supported geometry: a closed set of alternatives.
 *
 * A default constructed geometry is an empty line string.
 */
class FGL_DLL FGGeometry
{
  public:
    typedef std::variant<FGPoint, FGLineString, FGPolygon, FGMultiPoint,
                         FGMultiLineString, FGMultiPolygon>
        Variant;

    FGGeometry() = default;

    /** Wrap one of the concrete geometry classes */
    template <class T,
              class = typename std::enable_if<
                  std::is_constructible<Variant, T &&>::value &&
                  !std::is_same<typename std::decay<T>::type,
                                FGGeometry>::value>::type>
    FGGeometry(T &&oGeom) : m_oGeom(std::forward<T>(oGeom))
    {
    }

    FGwkbGeometryType getGeometryType() const;
    const char *getGeometryName() const;

    bool IsEmpty() const;
    void getEnvelope(FGEnvelope *psEnvelope) const;
    bool IsFinite() const;

    /** Concrete geometry, or nullptr if the geometry is of another kind */
    template <class T> const T *get() const
    {
        return std::get_if<T>(&m_oGeom);
    }

    /** Apply a visitor that accepts every alternative */
    template <class Visitor> decltype(auto) Visit(Visitor &&oVisitor) const
    {
        return std::visit(std::forward<Visitor>(oVisitor), m_oGeom);
    }

    bool operator==(const FGGeometry &other) const
    {
        return m_oGeom == other.m_oGeom;
    }

    bool operator!=(const FGGeometry &other) const
    {
        return !(operator==(other));
    }

  private:
    Variant m_oGeom{std::in_place_type<FGLineString>};
};

#endif /* FG_GEOMETRY_H_INCLUDED */
