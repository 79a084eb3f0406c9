/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Test boolean masks built from geometries.
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "fg_alg.h"

#include <vector>

#include "gtest_include.h"

namespace
{

// Common fixture with test data
struct test_geometry_mask : public ::testing::Test
{
    const FGGeoTransform oGT{1, 0, 0, 0, -1, 0};

    // 3x3 block of dfValue in a 10x10 uint8 grid, zeros elsewhere
    static FGGrid MakeTruth(double dfValue)
    {
        FGGrid oGrid;
        EXPECT_EQ(oGrid.Create(10, 10, FGT_UInt8), FE_None);
        for (int iY = 2; iY < 5; iY++)
        {
            for (int iX = 2; iX < 5; iX++)
                oGrid.SetValue(iY, iX, dfValue);
        }
        return oGrid;
    }

    // Geometry of the block, as given back by the polygonizer
    FGGeometry GetBlockGeometry() const
    {
        std::vector<FGShape> aoShapes;
        EXPECT_EQ(FGPolygonize(MakeTruth(10), nullptr, oGT,
                               FGPolygonizeOptions(), aoShapes),
                  FE_None);
        if (aoShapes.empty())
            return FGGeometry();
        EXPECT_EQ(aoShapes[0].dfValue, 10);
        return aoShapes[0].oGeometry;
    }
};

// Default polarity: covered cells are false
TEST_F(test_geometry_mask, default_polarity)
{
    const FGGrid oTruth = MakeTruth(1);
    FGGrid oMask;
    ASSERT_EQ(FGGeometryMask({GetBlockGeometry()}, 10, 10, oGT, false, false,
                             oMask),
              FE_None);
    EXPECT_EQ(oMask.GetDataType(), FGT_Bool);
    for (int iY = 0; iY < 10; iY++)
    {
        for (int iX = 0; iX < 10; iX++)
            EXPECT_EQ(oMask.GetValue(iY, iX), 1 - oTruth.GetValue(iY, iX));
    }
}

// Inverted polarity: covered cells are true
TEST_F(test_geometry_mask, invert)
{
    const FGGrid oTruth = MakeTruth(1);
    FGGrid oMask;
    ASSERT_EQ(FGGeometryMask({GetBlockGeometry()}, 10, 10, oGT, false, true,
                             oMask),
              FE_None);
    EXPECT_EQ(oMask.GetDataType(), FGT_Bool);
    for (int iY = 0; iY < 10; iY++)
    {
        for (int iX = 0; iX < 10; iX++)
            EXPECT_EQ(oMask.GetValue(iY, iX), oTruth.GetValue(iY, iX));
    }
}

// The two polarities are complementary, under both coverage rules
TEST_F(test_geometry_mask, complementary)
{
    FGPolygon oTriangle;
    oTriangle.addRing(
        FGLinearRing{{0.3, -0.2}, {7.7, -3.1}, {2.2, -9.4}, {0.3, -0.2}});
    const std::vector<FGGeometry> aoGeoms{FGGeometry(oTriangle),
                                          FGGeometry(FGPoint(9.5, -9.5))};

    for (const bool bAllTouched : {false, true})
    {
        FGGrid oMask;
        FGGrid oInverted;
        ASSERT_EQ(
            FGGeometryMask(aoGeoms, 10, 10, oGT, bAllTouched, false, oMask),
            FE_None);
        ASSERT_EQ(FGGeometryMask(aoGeoms, 10, 10, oGT, bAllTouched, true,
                                 oInverted),
                  FE_None);
        EXPECT_GT(oInverted.CountEqual(1), 1U);
        EXPECT_EQ(oInverted.GetValue(9, 9), 1);
        for (int iY = 0; iY < 10; iY++)
        {
            for (int iX = 0; iX < 10; iX++)
                EXPECT_NE(oMask.GetValue(iY, iX),
                          oInverted.GetValue(iY, iX));
        }
    }
}

// No geometry
TEST_F(test_geometry_mask, no_geometry)
{
    FGGrid oMask;
    ASSERT_EQ(FGGeometryMask({}, 4, 5, oGT, false, false, oMask), FE_None);
    EXPECT_EQ(oMask.GetYSize(), 4);
    EXPECT_EQ(oMask.GetXSize(), 5);
    EXPECT_EQ(oMask.CountEqual(1), 20U);

    ASSERT_EQ(FGGeometryMask({}, 4, 5, oGT, false, true, oMask), FE_None);
    EXPECT_EQ(oMask.CountEqual(0), 20U);
}

// Invalid shape
TEST_F(test_geometry_mask, invalid_shape)
{
    FGLErrorCollector oCollector;
    FGGrid oMask;
    EXPECT_EQ(FGGeometryMask({GetBlockGeometry()}, 10, 0, oGT, false, false,
                             oMask),
              FE_Failure);
    EXPECT_EQ(FGLGetLastErrorNo(), FGLE_IllegalArg);
    EXPECT_TRUE(oMask.IsEmpty());
}

}  // namespace
