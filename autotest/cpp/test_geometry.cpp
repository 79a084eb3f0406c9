/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Test the simple feature geometry classes.
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "fg_geometry.h"

#include <cmath>
#include <limits>
#include <string>
#include <type_traits>

#include "gtest_include.h"

namespace
{

// Common fixture with test data
struct test_geometry : public ::testing::Test
{
};

// Test geometry type names
TEST_F(test_geometry, getGeometryName)
{
    EXPECT_STREQ(FGGeometry(FGPoint(1, 2)).getGeometryName(), "Point");
    EXPECT_STREQ(FGGeometry(FGLineString{{0, 0}, {1, 1}}).getGeometryName(),
                 "LineString");
    EXPECT_STREQ(
        FGGeometry(FGTestMakeRectangle(0, 0, 1, 1)).getGeometryName(),
        "Polygon");
    EXPECT_STREQ(FGGeometry(FGMultiPoint{}).getGeometryName(), "MultiPoint");
    EXPECT_STREQ(FGGeometry(FGMultiLineString{}).getGeometryName(),
                 "MultiLineString");
    EXPECT_STREQ(FGGeometry(FGMultiPolygon{}).getGeometryName(),
                 "MultiPolygon");

    EXPECT_EQ(FGGeometry(FGMultiPolygon{}).getGeometryType(),
              FGwkbMultiPolygon);
    EXPECT_EQ(FGGeometryTypeFromName("LineString"), FGwkbLineString);
    EXPECT_EQ(FGGeometryTypeFromName("linestring"), FGwkbUnknown);
    EXPECT_EQ(FGGeometryTypeToName(FGwkbUnknown), nullptr);
}

// Test IsEmpty()
TEST_F(test_geometry, IsEmpty)
{
    EXPECT_TRUE(FGGeometry().IsEmpty());
    EXPECT_FALSE(FGGeometry(FGPoint(0, 0)).IsEmpty());
    EXPECT_TRUE(FGGeometry(FGPolygon()).IsEmpty());
    EXPECT_FALSE(FGGeometry(FGTestMakeRectangle(0, 0, 1, 1)).IsEmpty());
    EXPECT_TRUE(FGGeometry(FGMultiPolygon{FGPolygon()}).IsEmpty());
    EXPECT_FALSE(
        FGGeometry(FGMultiPolygon{FGPolygon(), FGTestMakeRectangle(0, 0, 1, 1)})
            .IsEmpty());
}

// Test IsFinite()
TEST_F(test_geometry, IsFinite)
{
    const double dfNaN = std::numeric_limits<double>::quiet_NaN();
    const double dfInf = std::numeric_limits<double>::infinity();
    EXPECT_TRUE(FGGeometry(FGPoint(0, 0)).IsFinite());
    EXPECT_FALSE(FGGeometry(FGPoint(dfNaN, 0)).IsFinite());
    EXPECT_FALSE(FGGeometry(FGLineString{{0, 0}, {dfInf, 1}}).IsFinite());
    EXPECT_FALSE(
        FGGeometry(FGMultiPolygon{FGTestMakeRectangle(0, 0, 1, dfNaN)})
            .IsFinite());
}

// Test FGLinearRing
TEST_F(test_geometry, FGLinearRing)
{
    FGLinearRing oRing{{0, 0}, {0, 2}, {3, 2}, {3, 0}};
    EXPECT_FALSE(oRing.get_IsClosed());
    oRing.closeRings();
    EXPECT_TRUE(oRing.get_IsClosed());
    EXPECT_EQ(oRing.getNumPoints(), 5);
    EXPECT_DOUBLE_EQ(oRing.get_Area(), 6.0);
    EXPECT_TRUE(oRing.isClockwise());

    FGLinearRing oReversed{{0, 0}, {3, 0}, {3, 2}, {0, 2}, {0, 0}};
    EXPECT_FALSE(oReversed.isClockwise());
    EXPECT_DOUBLE_EQ(oReversed.get_Area(), 6.0);
}

// Test FGPolygon
TEST_F(test_geometry, FGPolygon)
{
    FGPolygon oPolygon = FGTestMakeRectangle(0, 0, 10, 10);
    oPolygon.addRing(FGLinearRing{{2, 2}, {4, 2}, {4, 4}, {2, 4}, {2, 2}});
    EXPECT_EQ(oPolygon.getNumInteriorRings(), 1);
    ASSERT_NE(oPolygon.getExteriorRing(), nullptr);
    EXPECT_DOUBLE_EQ(oPolygon.getExteriorRing()->get_Area(), 100.0);
    EXPECT_DOUBLE_EQ(oPolygon.getInteriorRing(0)->get_Area(), 4.0);
    EXPECT_DOUBLE_EQ(oPolygon.get_Area(), 96.0);

    FGEnvelope sEnvelope;
    EXPECT_FALSE(sEnvelope.IsInit());
    oPolygon.getEnvelope(&sEnvelope);
    EXPECT_TRUE(sEnvelope.IsInit());
    EXPECT_EQ(sEnvelope.MinX, 0);
    EXPECT_EQ(sEnvelope.MaxX, 10);
    EXPECT_EQ(sEnvelope.MinY, 0);
    EXPECT_EQ(sEnvelope.MaxY, 10);

    EXPECT_EQ(FGPolygon().getExteriorRing(), nullptr);
}

// Test multi geometries
TEST_F(test_geometry, FGMultiGeometryT)
{
    FGMultiLineString oMulti;
    oMulti.addGeometry(FGLineString{{0, 0}, {1, 0}});
    oMulti.addGeometry(FGLineString{{5, 5}, {6, 7}, {8, 9}});
    EXPECT_EQ(oMulti.getNumGeometries(), 2);
    EXPECT_EQ(oMulti.getGeometryRef(1).getNumPoints(), 3);

    int nPoints = 0;
    for (const auto &oLine : oMulti)
        nPoints += oLine.getNumPoints();
    EXPECT_EQ(nPoints, 5);

    FGEnvelope sEnvelope;
    FGGeometry(oMulti).getEnvelope(&sEnvelope);
    EXPECT_EQ(sEnvelope.MaxX, 8);
    EXPECT_EQ(sEnvelope.MaxY, 9);
}

// getEnvelope() replaces the envelope it is given
TEST_F(test_geometry, getEnvelope_reused)
{
    FGEnvelope sEnvelope;
    FGGeometry(FGTestMakeRectangle(0, 1, 2, 3)).getEnvelope(&sEnvelope);
    EXPECT_EQ(sEnvelope.MinY, 1);

    FGGeometry(FGTestMakeRectangle(5, 6, 7, 8)).getEnvelope(&sEnvelope);
    EXPECT_EQ(sEnvelope.MinX, 5);
    EXPECT_EQ(sEnvelope.MinY, 6);
    EXPECT_EQ(sEnvelope.MaxX, 7);
    EXPECT_EQ(sEnvelope.MaxY, 8);

    FGGeometry(FGPoint(-1, -2)).getEnvelope(&sEnvelope);
    EXPECT_EQ(sEnvelope.MinX, -1);
    EXPECT_EQ(sEnvelope.MaxX, -1);
    EXPECT_EQ(sEnvelope.MaxY, -2);

    FGGeometry(FGMultiPoint{FGPoint(3, 4), FGPoint(1, 9)})
        .getEnvelope(&sEnvelope);
    EXPECT_EQ(sEnvelope.MinX, 1);
    EXPECT_EQ(sEnvelope.MaxX, 3);
    EXPECT_EQ(sEnvelope.MinY, 4);
    EXPECT_EQ(sEnvelope.MaxY, 9);

    FGGeometry(FGPolygon()).getEnvelope(&sEnvelope);
    EXPECT_FALSE(sEnvelope.IsInit());
}

// Test the typed accessor and the visitor
TEST_F(test_geometry, Visit)
{
    const FGGeometry oGeom(FGLineString{{0, 0}, {1, 0}, {1, 1}});
    EXPECT_EQ(oGeom.get<FGPolygon>(), nullptr);
    ASSERT_NE(oGeom.get<FGLineString>(), nullptr);
    EXPECT_EQ(oGeom.get<FGLineString>()->getNumPoints(), 3);

    const std::string osName = oGeom.Visit(
        [](const auto &oConcrete) -> std::string
        {
            using T = typename std::decay<decltype(oConcrete)>::type;
            return std::is_same<T, FGLineString>::value ? "line" : "other";
        });
    EXPECT_EQ(osName, "line");
}

// Test equality
TEST_F(test_geometry, equality)
{
    EXPECT_EQ(FGGeometry(FGPoint(1, 2)), FGGeometry(FGPoint(1, 2)));
    EXPECT_NE(FGGeometry(FGPoint(1, 2)), FGGeometry(FGPoint(2, 1)));
    EXPECT_NE(FGGeometry(FGPoint(1, 2)),
              FGGeometry(FGMultiPoint{FGPoint(1, 2)}));
    EXPECT_EQ(FGGeometry(FGTestMakeRectangle(0, 0, 1, 1)),
              FGGeometry(FGTestMakeRectangle(0, 0, 1, 1)));
}

}  // namespace
