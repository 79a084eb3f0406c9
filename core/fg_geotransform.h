/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Declaration of FGGeoTransform class
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#ifndef FG_GEOTRANSFORM_H_INCLUDED
#define FG_GEOTRANSFORM_H_INCLUDED

#include "fgl_port.h"

#include <utility>

void FGL_DLL FGApplyGeoTransform(const double *padfGeoTransform, double dfX,
                                 double dfY, double *pdfCol, double *pdfRow);
bool FGL_DLL FGInvGeoTransform(const double *gt_in, double *gt_out);

/* ******************************************************************** */
/*                             FGGeoTransform                           */
/* ******************************************************************** */

/** Class that encapsulates an affine transform matrix.
 *
 * It contains 6 coefficients (a, b, c, d, e, f) expressing an affine
 * transformation from geometry (x, y) space to continuous (column, row)
 * grid space, such that
 *
 * \code{.c}
 *  col = a * x + b * y + c;
 *  row = d * x + e * y + f;
 * \endcode
 *
 * The default value is the identity transformation.
 */
class FGL_DLL FGGeoTransform
{
  public:
    // Do not reorder those coefficients: data() exposes them as (a..f).

    /** Column increment per unit of x (a) */
    double colx = 1;

    /** Column increment per unit of y (b) */
    double coly = 0;

    /** Column of the geometry origin (c) */
    double colorig = 0;

    /** Row increment per unit of x (d) */
    double rowx = 0;

    /** Row increment per unit of y (e) */
    double rowy = 1;

    /** Row of the geometry origin (f) */
    double roworig = 0;

    /** Default constructor for an identity transformation matrix. */
    inline FGGeoTransform() = default;

    /** Constructor from a array of 6 double, in (a, b, c, d, e, f) order */
    inline explicit FGGeoTransform(const double coeffs[6])
    {
        static_assert(sizeof(FGGeoTransform) == 6 * sizeof(double),
                      "Wrong size for FGGeoTransform");
        colx = coeffs[0];
        coly = coeffs[1];
        colorig = coeffs[2];
        rowx = coeffs[3];
        rowy = coeffs[4];
        roworig = coeffs[5];
    }

    /** Constructor from the 6 coefficients (a, b, c, d, e, f) */
    inline FGGeoTransform(double a, double b, double c, double d, double e,
                          double f)
        : colx(a), coly(b), colorig(c), rowx(d), rowy(e), roworig(f)
    {
    }

    /** Element accessor. idx must be in [0,5] range */
    template <typename T> inline double operator[](T idx) const
    {
        return *(&colx + idx);
    }

    /** Element accessor. idx must be in [0,5] range */
    template <typename T> inline double &operator[](T idx)
    {
        return *(&colx + idx);
    }

    /** Equality test operator */
    inline bool operator==(const FGGeoTransform &other) const
    {
        return colx == other.colx && coly == other.coly &&
               colorig == other.colorig && rowx == other.rowx &&
               rowy == other.rowy && roworig == other.roworig;
    }

    /** Inequality test operator */
    inline bool operator!=(const FGGeoTransform &other) const
    {
        return !(operator==(other));
    }

    /** Cast to const double* */
    inline const double *data() const
    {
        return &colx;
    }

    /** Cast to double* */
    inline double *data()
    {
        return &colx;
    }

    /**
     * Apply the transform to a geometry space x/y coordinate.
     *
     * @param dfX Input x position.
     * @param dfY Input y position.
     * @param pdfCol output location where the (fractional) column is placed.
     * @param pdfRow output location where the (fractional) row is placed.
     */
    inline void Apply(double dfX, double dfY, double *pdfCol,
                      double *pdfRow) const
    {
        FGApplyGeoTransform(data(), dfX, dfY, pdfCol, pdfRow);
    }

    /** Same as above, returning a (col, row) pair */
    inline std::pair<double, double> Apply(double dfX, double dfY) const
    {
        double dfCol, dfRow;
        FGApplyGeoTransform(data(), dfX, dfY, &dfCol, &dfRow);
        return {dfCol, dfRow};
    }

    /**
     * Invert the transform.
     *
     * The inverse maps (column, row) grid coordinates back into geometry
     * space. A FGLE_SingularTransform error is emitted when the matrix has
     * no (numerically meaningful) inverse.
     *
     * @param[out] inverse Output transform
     *
     * @return true on success or false if the matrix is singular.
     */
    inline bool GetInverse(FGGeoTransform &inverse) const
    {
        return FGInvGeoTransform(data(), inverse.data());
    }

    /** Check whether the transform has no rotation/shear component. */
    inline bool IsAxisAligned() const
    {
        return coly == 0 && rowx == 0;
    }

    /** Check whether the transform is the identity. */
    inline bool IsIdentity() const
    {
        return operator==(FGGeoTransform());
    }
};

#endif /* FG_GEOTRANSFORM_H_INCLUDED */
