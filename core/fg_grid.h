/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Declaration of FGGrid class
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#ifndef FG_GRID_H_INCLUDED
#define FG_GRID_H_INCLUDED

#include "fg_datatype.h"

#include <vector>

/* ******************************************************************** */
/*                                FGGrid                                */
/* ******************************************************************** */

/** Dense, row-major, in-memory 2D array of one element type.
 *
 * Cells are addressed as [row][col], with the origin at the top-left.
 * A grid holds one of the supported data types, or FGT_Bool (one byte
 * per cell, 0 or 1) for masks.
 */
class FGL_DLL FGGrid
{
  public:
    FGGrid() = default;

    FGLErr Create(int nYSize, int nXSize, FGDataType eDataType);

    /** Number of rows */
    int GetYSize() const
    {
        return m_nYSize;
    }

    /** Number of columns */
    int GetXSize() const
    {
        return m_nXSize;
    }

    /** Element type */
    FGDataType GetDataType() const
    {
        return m_eDataType;
    }

    /** Whether Create() has not been (successfully) called. */
    bool IsEmpty() const
    {
        return m_abyData.empty();
    }

    /** Raw row-major storage */
    GByte *GetData()
    {
        return m_abyData.data();
    }

    /** Raw row-major storage */
    const GByte *GetData() const
    {
        return m_abyData.data();
    }

    /** Start of row iRow, typed. T must match the grid data type. */
    template <class T> T *GetLine(int iRow)
    {
        return reinterpret_cast<T *>(m_abyData.data()) +
               static_cast<size_t>(iRow) * m_nXSize;
    }

    /** Start of row iRow, typed. T must match the grid data type. */
    template <class T> const T *GetLine(int iRow) const
    {
        return reinterpret_cast<const T *>(m_abyData.data()) +
               static_cast<size_t>(iRow) * m_nXSize;
    }

    double GetValue(int iRow, int iCol) const;
    void SetValue(int iRow, int iCol, double dfValue);
    void Fill(double dfValue);

    void ReadLine(int iRow, double *padfValues) const;

    size_t CountEqual(double dfValue) const;

    bool operator==(const FGGrid &other) const;

    /** Inequality test operator */
    bool operator!=(const FGGrid &other) const
    {
        return !(operator==(other));
    }

  private:
    int m_nYSize = 0;
    int m_nXSize = 0;
    FGDataType m_eDataType = FGT_Unknown;
    std::vector<GByte> m_abyData{};

    size_t GetOffset(int iRow, int iCol) const
    {
        return static_cast<size_t>(iRow) * m_nXSize + iCol;
    }
};

#endif /* FG_GRID_H_INCLUDED */
