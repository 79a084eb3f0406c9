/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Affine transform helpers
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "fg_geotransform.h"

#include "fgl_error.h"

#include <algorithm>
#include <cmath>

/************************************************************************/
/*                        FGApplyGeoTransform()                         */
/************************************************************************/

/**
 * Apply an affine transform to an x/y coordinate.
 *
 * \code{.c}
 *  *pdfCol = padfGeoTransform[0] * dfX + padfGeoTransform[1] * dfY
 *                                      + padfGeoTransform[2];
 *  *pdfRow = padfGeoTransform[3] * dfX + padfGeoTransform[4] * dfY
 *                                      + padfGeoTransform[5];
 * \endcode
 *
 * @param padfGeoTransform Six coefficient transform to apply.
 * @param dfX Input x position.
 * @param dfY Input y position.
 * @param pdfCol output location where the column is placed.
 * @param pdfRow output location where the row is placed.
 */
void FGApplyGeoTransform(const double *padfGeoTransform, double dfX,
                         double dfY, double *pdfCol, double *pdfRow)
{
    *pdfCol = padfGeoTransform[0] * dfX + padfGeoTransform[1] * dfY +
              padfGeoTransform[2];
    *pdfRow = padfGeoTransform[3] * dfX + padfGeoTransform[4] * dfY +
              padfGeoTransform[5];
}

/************************************************************************/
/*                         FGInvGeoTransform()                          */
/************************************************************************/

/**
 * Invert an affine transform.
 *
 * This function will invert a standard 3x2 set of coefficients.
 *
 * @param gt_in Input transform (six doubles - unaltered).
 * @param gt_out Output transform (six doubles - updated).
 *
 * @return true on success or false if the equation is uninvertable.
 */
bool FGInvGeoTransform(const double *gt_in, double *gt_out)
{
    // Special case - no rotation - to avoid computing determinate
    // and potential precision issues.
    if (gt_in[1] == 0.0 && gt_in[3] == 0.0 && gt_in[0] != 0.0 &&
        gt_in[4] != 0.0)
    {
        gt_out[0] = 1.0 / gt_in[0];
        gt_out[1] = 0.0;
        gt_out[2] = -gt_in[2] / gt_in[0];
        gt_out[3] = 0.0;
        gt_out[4] = 1.0 / gt_in[4];
        gt_out[5] = -gt_in[5] / gt_in[4];
        return true;
    }

    // Assume a 3rd row that is [0 0 1].

    // Compute determinate.
    const double det = gt_in[0] * gt_in[4] - gt_in[1] * gt_in[3];
    const double magnitude =
        std::max(std::max(fabs(gt_in[0]), fabs(gt_in[1])),
                 std::max(fabs(gt_in[3]), fabs(gt_in[4])));

    if (fabs(det) <= 1e-10 * magnitude * magnitude)
    {
        FGLError(FE_Failure, FGLE_SingularTransform,
                 "Transform (%g, %g, %g, %g, %g, %g) is not invertible.",
                 gt_in[0], gt_in[1], gt_in[2], gt_in[3], gt_in[4], gt_in[5]);
        return false;
    }

    const double inv_det = 1.0 / det;

    // Compute adjoint, and divide by determinate.
    gt_out[0] = gt_in[4] * inv_det;
    gt_out[1] = -gt_in[1] * inv_det;
    gt_out[3] = -gt_in[3] * inv_det;
    gt_out[4] = gt_in[0] * inv_det;

    gt_out[2] = (gt_in[1] * gt_in[5] - gt_in[2] * gt_in[4]) * inv_det;
    gt_out[5] = (-gt_in[0] * gt_in[5] + gt_in[2] * gt_in[3]) * inv_det;

    return true;
}
