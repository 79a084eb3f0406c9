/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Prototypes, and definitions for the rasterization and
 *           polygonization algorithms.
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#ifndef FG_ALG_H_INCLUDED
#define FG_ALG_H_INCLUDED

/**
 * \file fg_alg.h
 *
 * Public (C++) API for the featgrid algorithms: conversion of vector
 * geometries into a grid (rasterization), the inverse conversion of a grid
 * into polygons (polygonization), and geometry masks.
 */

#include "fg_geometry.h"
#include "fg_geotransform.h"
#include "fg_grid.h"
#include "fgl_error.h"

#include <memory>
#include <utility>
#include <vector>

/************************************************************************/
/*                               FGShape                                */
/************************************************************************/

/** A geometry and its optional burn value.
 *
 * A shape without value (bHasValue == false) burns the default value of
 * the rasterization. Shapes produced by the polygonizer always carry the
 * value of the cells they enclose.
 */
struct FGL_DLL FGShape
{
    FGShape() = default;

    /** Bare geometry */
    explicit FGShape(FGGeometry oGeometryIn)
        : oGeometry(std::move(oGeometryIn))
    {
    }

    /** Geometry paired with a value */
    FGShape(FGGeometry oGeometryIn, double dfValueIn)
        : oGeometry(std::move(oGeometryIn)), dfValue(dfValueIn),
          bHasValue(true)
    {
    }

    FGGeometry oGeometry{};
    double dfValue = 0.0;
    bool bHasValue = false;
};

/************************************************************************/
/*                            Rasterization                             */
/************************************************************************/

/** Options of FGRasterize(), FGRasterizeInPlace() and
 * FGRasterizeGeometries() */
struct FGL_DLL FGRasterizeOptions
{
    /** Burn every cell touched by the geometry, not only the cells whose
     * centre is inside. */
    bool bAllTouched = false;

    /** Output data type. FGT_Unknown means it is inferred from the values. */
    FGDataType eDataType = FGT_Unknown;

    /** Background value of a freshly allocated grid. */
    double dfFill = 0.0;

    /** Value burnt for geometries that carry none. */
    double dfDefaultValue = 1.0;
};

FGLErr FGL_DLL FGRasterizeOptionsFromList(FGLConstList papszOptions,
                                          FGRasterizeOptions *psOptions);

FGLErr FGL_DLL FGRasterizeGeometries(FGGrid &oGrid, int nGeomCount,
                                     const FGGeometry *const *papoGeometries,
                                     const double *padfGeomBurnValues,
                                     const FGGeoTransform &oTransform,
                                     const FGRasterizeOptions &sOptions);

FGLErr FGL_DLL FGRasterize(const std::vector<FGShape> &aoShapes, int nYSize,
                           int nXSize, const FGGeoTransform &oTransform,
                           const FGRasterizeOptions &sOptions,
                           FGGrid &oOutGrid);

FGLErr FGL_DLL FGRasterizeInPlace(const std::vector<FGShape> &aoShapes,
                                  const FGGeoTransform &oTransform,
                                  const FGRasterizeOptions &sOptions,
                                  FGGrid &oGrid, int nYSize = 0,
                                  int nXSize = 0);

/************************************************************************/
/*                            Polygonization                            */
/************************************************************************/

/** Options of FGCreateShapeGenerator() and FGPolygonize() */
struct FGL_DLL FGPolygonizeOptions
{
    /** 4 (edge neighbours) or 8 (edge and corner neighbours) */
    int nConnectedness = 4;
};

FGLErr FGL_DLL FGPolygonizeOptionsFromList(FGLConstList papszOptions,
                                           FGPolygonizeOptions *psOptions);

class FGShapeGenerator;

std::unique_ptr<FGShapeGenerator>
    FGL_DLL FGCreateShapeGenerator(const FGGrid &oGrid, const FGGrid *poMask,
                                   const FGGeoTransform &oTransform,
                                   const FGPolygonizeOptions &sOptions);

/** Lazy sequence of the polygons of a grid.
 *
 * Shapes are produced in a deterministic order: by the row on which their
 * region ends, then by region id. The sequence is single-pass: once
 * GetNextShape() has returned false, it keeps returning false.
 *
 * The grid and mask passed to FGCreateShapeGenerator() must outlive the
 * generator and must not be modified while it is in use.
 */
class FGL_DLL FGShapeGenerator
{
    struct Private;
    std::unique_ptr<Private> m_poPrivate;

    FGShapeGenerator();

    friend std::unique_ptr<FGShapeGenerator>
    FGCreateShapeGenerator(const FGGrid &oGrid, const FGGrid *poMask,
                           const FGGeoTransform &oTransform,
                           const FGPolygonizeOptions &sOptions);

    FGL_DISALLOW_COPY_ASSIGN(FGShapeGenerator)

  public:
    ~FGShapeGenerator();

    bool GetNextShape(FGShape &oShape);

    FGLErr GetErr() const;
};

FGLErr FGL_DLL FGPolygonize(const FGGrid &oGrid, const FGGrid *poMask,
                            const FGGeoTransform &oTransform,
                            const FGPolygonizeOptions &sOptions,
                            std::vector<FGShape> &aoShapes);

/************************************************************************/
/*                            Geometry mask                             */
/************************************************************************/

FGLErr FGL_DLL FGGeometryMask(const std::vector<FGGeometry> &aoGeometries,
                              int nYSize, int nXSize,
                              const FGGeoTransform &oTransform,
                              bool bAllTouched, bool bInvert,
                              FGGrid &oOutGrid);

#endif /* FG_ALG_H_INCLUDED */
