/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Test rasterization of geometries into grids.
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "fg_alg.h"

#include <cmath>
#include <limits>
#include <utility>
#include <vector>

#include "gtest_include.h"

namespace
{

// Common fixture with test data
struct test_rasterize : public ::testing::Test
{
    // Square slightly larger than 2 cells, at the top-left of a 10x10 grid.
    static FGGeometry MakeBasicGeometry()
    {
        FGPolygon oPolygon;
        oPolygon.addRing(FGLinearRing{
            {2, 2}, {2, 4.25}, {4.25, 4.25}, {4.25, 2}, {2, 2}});
        return FGGeometry(std::move(oPolygon));
    }

    // Check that cells in rows [nRowStart, nRowEnd) and columns
    // [nColStart, nColEnd) are dfInside, and all others dfOutside.
    static void CheckBlock(const FGGrid &oGrid, int nRowStart, int nRowEnd,
                           int nColStart, int nColEnd, double dfInside,
                           double dfOutside)
    {
        for (int iY = 0; iY < oGrid.GetYSize(); iY++)
        {
            for (int iX = 0; iX < oGrid.GetXSize(); iX++)
            {
                const bool bInside = iY >= nRowStart && iY < nRowEnd &&
                                     iX >= nColStart && iX < nColEnd;
                EXPECT_EQ(oGrid.GetValue(iY, iX),
                          bInside ? dfInside : dfOutside)
                    << "row " << iY << ", col " << iX;
            }
        }
    }

    struct TypedValue
    {
        FGDataType eType;
        double dfValue;
    };

    static std::vector<TypedValue> GetSupportedTypedValues()
    {
        return {
            {FGT_Int16, -32768},          {FGT_Int32, -2147483648.0},
            {FGT_UInt8, 255},             {FGT_UInt16, 65535},
            {FGT_UInt32, 4294967295.0},   {FGT_Float32, 1.434532},
            {FGT_Float64, -98332.133422114},
        };
    }
};

// Default rule: cells whose centre is inside
TEST_F(test_rasterize, basic)
{
    FGGrid oGrid;
    ASSERT_EQ(FGRasterize({FGShape(MakeBasicGeometry())}, 10, 10,
                          FGGeoTransform(), FGRasterizeOptions(), oGrid),
              FE_None);
    EXPECT_EQ(oGrid.GetYSize(), 10);
    EXPECT_EQ(oGrid.GetXSize(), 10);
    EXPECT_EQ(oGrid.GetDataType(), FGT_UInt8);
    CheckBlock(oGrid, 2, 4, 2, 4, 1, 0);
}

// All-touched rule
TEST_F(test_rasterize, all_touched)
{
    FGRasterizeOptions sOptions;
    sOptions.bAllTouched = true;
    FGGrid oGrid;
    ASSERT_EQ(FGRasterize({FGShape(MakeBasicGeometry())}, 10, 10,
                          FGGeoTransform(), sOptions, oGrid),
              FE_None);
    CheckBlock(oGrid, 2, 5, 2, 5, 1, 0);
}

// Burn value and fill value
TEST_F(test_rasterize, value_and_fill)
{
    FGRasterizeOptions sOptions;
    sOptions.dfFill = 1;
    FGGrid oGrid;
    ASSERT_EQ(FGRasterize({FGShape(MakeBasicGeometry(), 5)}, 10, 10,
                          FGGeoTransform(), sOptions, oGrid),
              FE_None);
    EXPECT_EQ(oGrid.GetDataType(), FGT_UInt8);
    CheckBlock(oGrid, 2, 4, 2, 4, 5, 1);
}

// Burn into an existing float64 grid
TEST_F(test_rasterize, in_place)
{
    FGGrid oGrid;
    ASSERT_EQ(oGrid.Create(10, 10, FGT_Float64), FE_None);
    ASSERT_EQ(FGRasterizeInPlace({FGShape(MakeBasicGeometry())},
                                 FGGeoTransform(), FGRasterizeOptions(),
                                 oGrid),
              FE_None);
    EXPECT_EQ(oGrid.GetDataType(), FGT_Float64);
    CheckBlock(oGrid, 2, 4, 2, 4, 1, 0);

    // A stated shape that agrees with the grid is accepted.
    ASSERT_EQ(FGRasterizeInPlace({FGShape(MakeBasicGeometry(), 7)},
                                 FGGeoTransform(), FGRasterizeOptions(),
                                 oGrid, 10, 10),
              FE_None);
    CheckBlock(oGrid, 2, 4, 2, 4, 7, 0);
}

// Requested data types, with the value paired with the geometry
TEST_F(test_rasterize, supported_dtype_paired_value)
{
    for (const auto &sCase : GetSupportedTypedValues())
    {
        FGRasterizeOptions sOptions;
        sOptions.eDataType = sCase.eType;
        FGGrid oGrid;
        ASSERT_EQ(FGRasterize({FGShape(MakeBasicGeometry(), sCase.dfValue)},
                              10, 10, FGGeoTransform(), sOptions, oGrid),
                  FE_None)
            << FGGetDataTypeName(sCase.eType);
        EXPECT_EQ(oGrid.GetDataType(), sCase.eType);

        const double dfStored = sCase.eType == FGT_Float32
                                    ? static_cast<double>(
                                          static_cast<float>(sCase.dfValue))
                                    : sCase.dfValue;
        CheckBlock(oGrid, 2, 4, 2, 4, dfStored, 0);
    }
}

// Requested data types, with the value given as default value
TEST_F(test_rasterize, supported_dtype_default_value)
{
    for (const auto &sCase : GetSupportedTypedValues())
    {
        FGRasterizeOptions sOptions;
        sOptions.eDataType = sCase.eType;
        sOptions.dfDefaultValue = sCase.dfValue;
        FGGrid oGrid;
        ASSERT_EQ(FGRasterize({FGShape(MakeBasicGeometry())}, 10, 10,
                              FGGeoTransform(), sOptions, oGrid),
                  FE_None)
            << FGGetDataTypeName(sCase.eType);
        EXPECT_EQ(oGrid.GetDataType(), sCase.eType);
        EXPECT_EQ(oGrid.CountEqual(0), 96U);
    }
}

// Inferred data types
TEST_F(test_rasterize, inferred_dtype)
{
    for (const auto &sCase : GetSupportedTypedValues())
    {
        FGGrid oGrid;
        ASSERT_EQ(FGRasterize({FGShape(MakeBasicGeometry(), sCase.dfValue)},
                              10, 10, FGGeoTransform(), FGRasterizeOptions(),
                              oGrid),
                  FE_None)
            << FGGetDataTypeName(sCase.eType);

        // 1.434532 has no exact float32 representation.
        EXPECT_EQ(oGrid.GetDataType(), sCase.eType == FGT_Float32
                                           ? FGT_Float64
                                           : sCase.eType);
        for (int iY = 2; iY < 4; iY++)
        {
            for (int iX = 2; iX < 4; iX++)
                EXPECT_DOUBLE_EQ(oGrid.GetValue(iY, iX), sCase.dfValue);
        }
        EXPECT_EQ(oGrid.CountEqual(0), 96U);
    }
}

// The inferred data type does not depend on the order of the shapes
TEST_F(test_rasterize, inferred_dtype_shape_order)
{
    const FGGeometry oLeft(FGTestMakeRectangle(0, 0, 2, 2));
    const FGGeometry oRight(FGTestMakeRectangle(5, 5, 7, 7));

    FGGrid oGrid1;
    ASSERT_EQ(FGRasterize({FGShape(oLeft, 1.5), FGShape(oRight, 70000)}, 10,
                          10, FGGeoTransform(), FGRasterizeOptions(), oGrid1),
              FE_None);
    FGGrid oGrid2;
    ASSERT_EQ(FGRasterize({FGShape(oRight, 70000), FGShape(oLeft, 1.5)}, 10,
                          10, FGGeoTransform(), FGRasterizeOptions(), oGrid2),
              FE_None);

    EXPECT_EQ(oGrid1.GetDataType(), FGT_Float32);
    EXPECT_EQ(oGrid2.GetDataType(), FGT_Float32);
    EXPECT_EQ(oGrid1.GetValue(1, 1), 1.5);
    EXPECT_EQ(oGrid2.GetValue(6, 6), 70000);
}

// Data types that cannot be produced
TEST_F(test_rasterize, unsupported_dtype)
{
    const TypedValue asCases[] = {
        {FGT_Int8, -127},
        {FGT_Int64, 20439845334323.0},
        {FGT_Float16, -9343.232},
    };
    for (const auto &sCase : asCases)
    {
        FGRasterizeOptions sOptions;
        sOptions.eDataType = sCase.eType;

        {
            FGLErrorCollector oCollector;
            FGGrid oGrid;
            EXPECT_EQ(
                FGRasterize({FGShape(MakeBasicGeometry(), sCase.dfValue)}, 10,
                            10, FGGeoTransform(), sOptions, oGrid),
                FE_Failure);
            EXPECT_EQ(FGLGetLastErrorNo(), FGLE_UnsupportedDataType);
            EXPECT_TRUE(oGrid.IsEmpty());
        }

        {
            FGLErrorCollector oCollector;
            FGRasterizeOptions sDefaultOptions(sOptions);
            sDefaultOptions.dfDefaultValue = sCase.dfValue;
            FGGrid oGrid;
            EXPECT_EQ(FGRasterize({FGShape(MakeBasicGeometry())}, 10, 10,
                                  FGGeoTransform(), sDefaultOptions, oGrid),
                      FE_Failure);
            EXPECT_EQ(FGLGetLastErrorNo(), FGLE_UnsupportedDataType);
            EXPECT_TRUE(oGrid.IsEmpty());
        }
    }
}

// Values that do not fit the requested data type
TEST_F(test_rasterize, mismatched_value)
{
    const TypedValue asCases[] = {
        {FGT_UInt8, 3.2423},
        {FGT_UInt8, -2147483648.0},
    };
    for (const auto &sCase : asCases)
    {
        FGRasterizeOptions sOptions;
        sOptions.eDataType = sCase.eType;

        {
            FGLErrorCollector oCollector;
            FGGrid oGrid;
            EXPECT_EQ(
                FGRasterize({FGShape(MakeBasicGeometry(), sCase.dfValue)}, 10,
                            10, FGGeoTransform(), sOptions, oGrid),
                FE_Failure);
            EXPECT_EQ(FGLGetLastErrorNo(), FGLE_ValueRange);
            EXPECT_TRUE(oGrid.IsEmpty());
        }

        {
            FGLErrorCollector oCollector;
            FGRasterizeOptions sDefaultOptions(sOptions);
            sDefaultOptions.dfDefaultValue = sCase.dfValue;
            FGGrid oGrid;
            EXPECT_EQ(FGRasterize({FGShape(MakeBasicGeometry())}, 10, 10,
                                  FGGeoTransform(), sDefaultOptions, oGrid),
                      FE_Failure);
            EXPECT_EQ(FGLGetLastErrorNo(), FGLE_ValueRange);
            EXPECT_TRUE(oGrid.IsEmpty());
        }
    }
}

// A fill value that does not fit the data type
TEST_F(test_rasterize, mismatched_fill)
{
    FGLErrorCollector oCollector;
    FGRasterizeOptions sOptions;
    sOptions.eDataType = FGT_UInt16;
    sOptions.dfFill = -1;
    FGGrid oGrid;
    EXPECT_EQ(FGRasterize({FGShape(MakeBasicGeometry())}, 10, 10,
                          FGGeoTransform(), sOptions, oGrid),
              FE_Failure);
    EXPECT_EQ(FGLGetLastErrorNo(), FGLE_ValueRange);
}

// A failed rasterization leaves the output grid alone
TEST_F(test_rasterize, failure_keeps_output)
{
    FGGrid oGrid;
    ASSERT_EQ(oGrid.Create(3, 3, FGT_Int16), FE_None);
    oGrid.Fill(42);

    FGLErrorCollector oCollector;
    FGRasterizeOptions sOptions;
    sOptions.eDataType = FGT_UInt8;
    EXPECT_EQ(FGRasterize({FGShape(MakeBasicGeometry(), 1000)}, 10, 10,
                          FGGeoTransform(), sOptions, oGrid),
              FE_Failure);
    EXPECT_EQ(oGrid.GetYSize(), 3);
    EXPECT_EQ(oGrid.GetDataType(), FGT_Int16);
    EXPECT_EQ(oGrid.CountEqual(42), 9U);
}

// No shapes
TEST_F(test_rasterize, empty_input)
{
    {
        FGLErrorCollector oCollector;
        FGGrid oGrid;
        EXPECT_EQ(FGRasterize({}, 10, 10, FGGeoTransform(),
                              FGRasterizeOptions(), oGrid),
                  FE_Failure);
        EXPECT_EQ(FGLGetLastErrorNo(), FGLE_EmptyInput);
    }

    {
        // Accepted when there is a grid to burn into
        FGGrid oGrid;
        ASSERT_EQ(oGrid.Create(4, 4, FGT_UInt8), FE_None);
        oGrid.Fill(3);
        EXPECT_EQ(FGRasterizeInPlace({}, FGGeoTransform(),
                                     FGRasterizeOptions(), oGrid),
                  FE_None);
        EXPECT_EQ(oGrid.CountEqual(3), 16U);
    }
}

// Invalid output shapes
TEST_F(test_rasterize, invalid_shape)
{
    FGLErrorCollector oCollector;
    FGGrid oGrid;
    EXPECT_EQ(FGRasterize({FGShape(MakeBasicGeometry())}, 0, 10,
                          FGGeoTransform(), FGRasterizeOptions(), oGrid),
              FE_Failure);
    EXPECT_EQ(FGLGetLastErrorNo(), FGLE_IllegalArg);

    EXPECT_EQ(FGRasterize({FGShape(MakeBasicGeometry())}, 10, -3,
                          FGGeoTransform(), FGRasterizeOptions(), oGrid),
              FE_Failure);
    EXPECT_EQ(FGLGetLastErrorNo(), FGLE_IllegalArg);
}

// Errors specific to burning into an existing grid
TEST_F(test_rasterize, in_place_errors)
{
    {
        FGLErrorCollector oCollector;
        FGGrid oUnallocated;
        EXPECT_EQ(FGRasterizeInPlace({FGShape(MakeBasicGeometry())},
                                     FGGeoTransform(), FGRasterizeOptions(),
                                     oUnallocated),
                  FE_Failure);
        EXPECT_EQ(FGLGetLastErrorNo(), FGLE_IllegalArg);
    }

    FGGrid oGrid;
    ASSERT_EQ(oGrid.Create(10, 10, FGT_UInt8), FE_None);

    {
        FGLErrorCollector oCollector;
        EXPECT_EQ(FGRasterizeInPlace({FGShape(MakeBasicGeometry())},
                                     FGGeoTransform(), FGRasterizeOptions(),
                                     oGrid, 10, 11),
                  FE_Failure);
        EXPECT_EQ(FGLGetLastErrorNo(), FGLE_ShapeMismatch);
    }

    {
        // The grid data type governs validation.
        FGLErrorCollector oCollector;
        FGRasterizeOptions sOptions;
        sOptions.eDataType = FGT_Float64;
        EXPECT_EQ(FGRasterizeInPlace({FGShape(MakeBasicGeometry(), 2.5)},
                                     FGGeoTransform(), sOptions, oGrid),
                  FE_Failure);
        EXPECT_EQ(FGLGetLastErrorNo(), FGLE_ValueRange);
    }

    {
        FGLErrorCollector oCollector;
        EXPECT_EQ(FGRasterizeInPlace(
                      {FGShape(MakeBasicGeometry(), 1),
                       FGShape(FGGeometry(FGTestMakeRectangle(0, 0, 10, 10)),
                               300)},
                      FGGeoTransform(), FGRasterizeOptions(), oGrid),
                  FE_Failure);
        EXPECT_EQ(FGLGetLastErrorNo(), FGLE_ValueRange);
    }

    // Nothing was written by the failed calls.
    EXPECT_EQ(oGrid.CountEqual(0), 100U);
}

// Later shapes win where they overlap earlier ones
TEST_F(test_rasterize, last_wins)
{
    FGGrid oGrid;
    ASSERT_EQ(
        FGRasterize({FGShape(FGGeometry(FGTestMakeRectangle(0, 0, 6, 6)), 1),
                     FGShape(FGGeometry(FGTestMakeRectangle(4, 4, 8, 8)), 2)},
                    10, 10, FGGeoTransform(), FGRasterizeOptions(), oGrid),
        FE_None);
    EXPECT_EQ(oGrid.GetValue(5, 5), 2);
    EXPECT_EQ(oGrid.GetValue(3, 3), 1);
    EXPECT_EQ(oGrid.GetValue(7, 7), 2);
    EXPECT_EQ(oGrid.CountEqual(1), 32U);
    EXPECT_EQ(oGrid.CountEqual(2), 16U);
}

// Polygons sharing an edge tile without gap nor overlap
TEST_F(test_rasterize, shared_edge)
{
    FGGrid oGrid;
    ASSERT_EQ(
        FGRasterize({FGShape(FGGeometry(FGTestMakeRectangle(0, 0, 2, 4)), 1),
                     FGShape(FGGeometry(FGTestMakeRectangle(2, 0, 4, 4)), 2)},
                    4, 4, FGGeoTransform(), FGRasterizeOptions(), oGrid),
        FE_None);
    EXPECT_EQ(oGrid.CountEqual(0), 0U);
    EXPECT_EQ(oGrid.CountEqual(1), 8U);
    EXPECT_EQ(oGrid.CountEqual(2), 8U);
    EXPECT_EQ(oGrid.GetValue(0, 1), 1);
    EXPECT_EQ(oGrid.GetValue(0, 2), 2);
}

// Holes are not burnt
TEST_F(test_rasterize, polygon_with_hole)
{
    FGPolygon oPolygon = FGTestMakeRectangle(0, 0, 10, 10);
    oPolygon.addRing(FGLinearRing{{3, 3}, {6, 3}, {6, 6}, {3, 6}, {3, 3}});

    FGGrid oGrid;
    ASSERT_EQ(FGRasterize({FGShape(FGGeometry(std::move(oPolygon)))}, 10, 10,
                          FGGeoTransform(), FGRasterizeOptions(), oGrid),
              FE_None);
    CheckBlock(oGrid, 3, 6, 3, 6, 0, 1);
}

// Overlapping parts of a multipolygon do not cancel each other
TEST_F(test_rasterize, multipolygon_overlapping_parts)
{
    const FGMultiPolygon oMulti{FGTestMakeRectangle(0, 0, 4, 4),
                                FGTestMakeRectangle(2, 2, 6, 6)};
    FGGrid oGrid;
    ASSERT_EQ(FGRasterize({FGShape(FGGeometry(oMulti))}, 10, 10,
                          FGGeoTransform(), FGRasterizeOptions(), oGrid),
              FE_None);
    EXPECT_EQ(oGrid.CountEqual(1), 28U);
    EXPECT_EQ(oGrid.GetValue(3, 3), 1);
}

// Points burn the cell holding them
TEST_F(test_rasterize, points)
{
    for (const bool bAllTouched : {false, true})
    {
        FGRasterizeOptions sOptions;
        sOptions.bAllTouched = bAllTouched;
        FGGrid oGrid;
        ASSERT_EQ(
            FGRasterize({FGShape(FGGeometry(FGPoint(3.5, 7.2)), 4),
                         FGShape(FGGeometry(FGMultiPoint{FGPoint(0, 0),
                                                         FGPoint(9.99, 0.5),
                                                         FGPoint(10, 10)}),
                                 5)},
                        10, 10, FGGeoTransform(), sOptions, oGrid),
            FE_None);
        EXPECT_EQ(oGrid.GetValue(7, 3), 4);
        EXPECT_EQ(oGrid.GetValue(0, 0), 5);
        EXPECT_EQ(oGrid.GetValue(0, 9), 5);
        EXPECT_EQ(oGrid.CountEqual(0), 97U);
    }
}

// Lines burn the cells of a Bresenham walk
TEST_F(test_rasterize, lines)
{
    for (const bool bAllTouched : {false, true})
    {
        FGRasterizeOptions sOptions;
        sOptions.bAllTouched = bAllTouched;
        FGGrid oGrid;
        ASSERT_EQ(
            FGRasterize(
                {FGShape(FGGeometry(FGLineString{{0.5, 1.5}, {5.5, 1.5}}), 1),
                 FGShape(FGGeometry(FGMultiLineString{
                             FGLineString{{0.5, 4.5}, {3.5, 7.5}}}),
                         2)},
                10, 10, FGGeoTransform(), sOptions, oGrid),
            FE_None);
        for (int iX = 0; iX < 10; iX++)
            EXPECT_EQ(oGrid.GetValue(1, iX), iX < 6 ? 1 : 0);
        EXPECT_EQ(oGrid.CountEqual(1), 6U);
        for (int i = 0; i < 4; i++)
            EXPECT_EQ(oGrid.GetValue(4 + i, i), 2);
        EXPECT_EQ(oGrid.CountEqual(2), 4U);
        EXPECT_EQ(oGrid.CountEqual(0), 90U);
    }
}

// All-touched coverage contains the default coverage
TEST_F(test_rasterize, all_touched_contains_default)
{
    FGPolygon oTriangle;
    oTriangle.addRing(FGLinearRing{
        {1.3, 0.7}, {17.9, 3.1}, {6.2, 18.4}, {1.3, 0.7}});
    // Rotation and scaling
    const FGGeoTransform oGT(0.4, 0.3, 1.5, -0.3, 0.4, 5.2);

    FGGrid oDefault;
    ASSERT_EQ(FGRasterize({FGShape(FGGeometry(oTriangle))}, 12, 12, oGT,
                          FGRasterizeOptions(), oDefault),
              FE_None);
    FGRasterizeOptions sOptions;
    sOptions.bAllTouched = true;
    FGGrid oAllTouched;
    ASSERT_EQ(FGRasterize({FGShape(FGGeometry(oTriangle))}, 12, 12, oGT,
                          sOptions, oAllTouched),
              FE_None);

    EXPECT_GT(oDefault.CountEqual(1), 0U);
    EXPECT_GT(oAllTouched.CountEqual(1), oDefault.CountEqual(1));
    for (int iY = 0; iY < 12; iY++)
    {
        for (int iX = 0; iX < 12; iX++)
        {
            if (oDefault.GetValue(iY, iX) == 1)
                EXPECT_EQ(oAllTouched.GetValue(iY, iX), 1);
        }
    }
}

// Geometry coordinates go through the transform
TEST_F(test_rasterize, transform)
{
    // Two geometry units per cell, y axis pointing up, origin at the
    // bottom-left corner of the grid.
    const FGGeoTransform oGT(0.5, 0, 0, 0, -0.5, 5);
    FGGrid oGrid;
    ASSERT_EQ(FGRasterize({FGShape(FGGeometry(FGTestMakeRectangle(0, 0, 4, 4)))},
                          5, 5, oGT, FGRasterizeOptions(), oGrid),
              FE_None);
    CheckBlock(oGrid, 3, 5, 0, 2, 1, 0);
}

// Geometries outside of the grid, empty or not finite
TEST_F(test_rasterize, outside_empty_non_finite)
{
    const double dfNaN = std::numeric_limits<double>::quiet_NaN();
    FGGrid oGrid;
    ASSERT_EQ(
        FGRasterize(
            {FGShape(FGGeometry(FGTestMakeRectangle(20, 20, 30, 30)), 1),
             FGShape(FGGeometry(FGTestMakeRectangle(-5, -5, 2, 2)), 2),
             FGShape(FGGeometry(FGPolygon()), 3),
             FGShape(FGGeometry(FGTestMakeRectangle(0, 0, dfNaN, 5)), 4),
             FGShape(FGGeometry(FGLineString{{-100, -100}, {-50, -50}}), 5),
             FGShape(FGGeometry(FGMultiPolygon{}), 6)},
            10, 10, FGGeoTransform(), FGRasterizeOptions(), oGrid),
        FE_None);
    CheckBlock(oGrid, 0, 2, 0, 2, 2, 0);
}

// Very far away vertices
TEST_F(test_rasterize, far_away_vertices)
{
    FGRasterizeOptions sOptions;
    sOptions.bAllTouched = true;
    FGGrid oGrid;
    ASSERT_EQ(
        FGRasterize(
            {FGShape(FGGeometry(FGLineString{{-1e12, 2.5}, {1e12, 2.5}})),
             FGShape(FGGeometry(FGTestMakeRectangle(-1e15, 6, 1e15, 8)))},
            10, 10, FGGeoTransform(), sOptions, oGrid),
        FE_None);
    for (int iX = 0; iX < 10; iX++)
    {
        EXPECT_EQ(oGrid.GetValue(2, iX), 1);
        EXPECT_EQ(oGrid.GetValue(6, iX), 1);
        EXPECT_EQ(oGrid.GetValue(7, iX), 1);
        EXPECT_EQ(oGrid.GetValue(5, iX), 0);
    }
}

// Lines whose vertices are much further than the grid size
TEST_F(test_rasterize, far_away_line_vertices)
{
    FGGrid oGrid;
    ASSERT_EQ(
        FGRasterize(
            {FGShape(FGGeometry(FGLineString{{-1e17, 0.5}, {1e17, 0.5}})),
             FGShape(FGGeometry(FGLineString{{4.5, 1e17}, {4.5, -1e17}}),
                     2)},
            10, 10, FGGeoTransform(), FGRasterizeOptions(), oGrid),
        FE_None);
    for (int iX = 0; iX < 10; iX++)
    {
        if (iX != 4)
            EXPECT_EQ(oGrid.GetValue(0, iX), 1) << iX;
    }
    for (int iY = 0; iY < 10; iY++)
        EXPECT_EQ(oGrid.GetValue(iY, 4), 2) << iY;
    EXPECT_EQ(oGrid.CountEqual(0), 81U);
}

// Test FGRasterizeGeometries() without per geometry values
TEST_F(test_rasterize, FGRasterizeGeometries)
{
    FGGrid oGrid;
    ASSERT_EQ(oGrid.Create(10, 10, FGT_Int32), FE_None);
    const FGGeometry oGeom1 = MakeBasicGeometry();
    const FGGeometry oGeom2(FGPoint(9.5, 9.5));
    const FGGeometry *const apoGeoms[] = {&oGeom1, &oGeom2};

    FGRasterizeOptions sOptions;
    sOptions.dfDefaultValue = -12;
    ASSERT_EQ(FGRasterizeGeometries(oGrid, 2, apoGeoms, nullptr,
                                    FGGeoTransform(), sOptions),
              FE_None);
    EXPECT_EQ(oGrid.CountEqual(-12), 5U);
    EXPECT_EQ(oGrid.GetValue(9, 9), -12);

    const double adfValues[] = {7, 8};
    ASSERT_EQ(FGRasterizeGeometries(oGrid, 2, apoGeoms, adfValues,
                                    FGGeoTransform(), sOptions),
              FE_None);
    EXPECT_EQ(oGrid.CountEqual(7), 4U);
    EXPECT_EQ(oGrid.GetValue(9, 9), 8);

    {
        FGLErrorCollector oCollector;
        const FGGeometry *const apoNullGeoms[] = {&oGeom1, nullptr};
        EXPECT_EQ(FGRasterizeGeometries(oGrid, 2, apoNullGeoms, nullptr,
                                        FGGeoTransform(), sOptions),
                  FE_Failure);
        EXPECT_EQ(FGLGetLastErrorNo(), FGLE_IllegalArg);
    }
}

// Test FGRasterizeOptionsFromList()
TEST_F(test_rasterize, FGRasterizeOptionsFromList)
{
    {
        const char *const apszOptions[] = {"ALL_TOUCHED=YES",
                                           "DATA_TYPE=int16", "FILL=-3",
                                           "DEFAULT_VALUE=2.5", nullptr};
        FGRasterizeOptions sOptions;
        ASSERT_EQ(FGRasterizeOptionsFromList(apszOptions, &sOptions),
                  FE_None);
        EXPECT_TRUE(sOptions.bAllTouched);
        EXPECT_EQ(sOptions.eDataType, FGT_Int16);
        EXPECT_EQ(sOptions.dfFill, -3);
        EXPECT_EQ(sOptions.dfDefaultValue, 2.5);
    }

    {
        FGRasterizeOptions sOptions;
        ASSERT_EQ(FGRasterizeOptionsFromList(nullptr, &sOptions), FE_None);
        EXPECT_FALSE(sOptions.bAllTouched);
        EXPECT_EQ(sOptions.eDataType, FGT_Unknown);
        EXPECT_EQ(sOptions.dfFill, 0);
        EXPECT_EQ(sOptions.dfDefaultValue, 1);
    }

    {
        FGLErrorCollector oCollector;
        const char *const apszOptions[] = {"DATA_TYPE=complex64", nullptr};
        FGRasterizeOptions sOptions;
        EXPECT_EQ(FGRasterizeOptionsFromList(apszOptions, &sOptions),
                  FE_Failure);
        EXPECT_EQ(FGLGetLastErrorNo(), FGLE_UnsupportedDataType);
    }

    {
        FGLErrorCollector oCollector;
        const char *const apszOptions[] = {"ALL_TOUCHED=YES", "FILL=abc",
                                           nullptr};
        FGRasterizeOptions sOptions;
        EXPECT_EQ(FGRasterizeOptionsFromList(apszOptions, &sOptions),
                  FE_Failure);
        EXPECT_EQ(FGLGetLastErrorNo(), FGLE_IllegalArg);
        // Left unchanged
        EXPECT_FALSE(sOptions.bAllTouched);
    }

    {
        FGLErrorCollector oCollector;
        EXPECT_EQ(FGRasterizeOptionsFromList(nullptr, nullptr), FE_Failure);
        EXPECT_EQ(FGLGetLastErrorNo(), FGLE_ObjectNull);
    }
}

}  // namespace
