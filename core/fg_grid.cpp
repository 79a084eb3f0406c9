/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Implementation of FGGrid class
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "fg_grid.h"

#include <algorithm>
#include <limits>
#include <new>

namespace
{

template <class T> double GetValueT(const GByte *pabyData, size_t nOffset)
{
    return static_cast<double>(reinterpret_cast<const T *>(pabyData)[nOffset]);
}

template <class T>
void SetValueT(GByte *pabyData, size_t nOffset, double dfValue)
{
    reinterpret_cast<T *>(pabyData)[nOffset] = static_cast<T>(dfValue);
}

template <class T>
void FillT(GByte *pabyData, size_t nCount, double dfValue)
{
    T *pData = reinterpret_cast<T *>(pabyData);
    std::fill(pData, pData + nCount, static_cast<T>(dfValue));
}

}  // namespace

/************************************************************************/
/*                               Create()                               */
/************************************************************************/

/**
 * \brief Allocate the grid storage, zero initialized.
 *
 * @param nYSize number of rows, strictly positive.
 * @param nXSize number of columns, strictly positive.
 * @param eDataType a supported data type, or FGT_Bool.
 *
 * @return FE_None on success, FE_Failure otherwise (the grid is then left
 * unchanged).
 */
FGLErr FGGrid::Create(int nYSize, int nXSize, FGDataType eDataType)
{
    if (nYSize <= 0 || nXSize <= 0)
    {
        FGLError(FE_Failure, FGLE_IllegalArg,
                 "Invalid grid shape (%d, %d): both dimensions must be "
                 "positive.",
                 nYSize, nXSize);
        return FE_Failure;
    }

    if (eDataType != FGT_Bool && !FGDataTypeIsSupported(eDataType))
    {
        FGLError(FE_Failure, FGLE_UnsupportedDataType,
                 "Cannot create a grid of data type %s.",
                 FGGetDataTypeName(eDataType) ? FGGetDataTypeName(eDataType)
                                              : "unknown");
        return FE_Failure;
    }

    const size_t nCells = static_cast<size_t>(nYSize) * nXSize;
    const size_t nDTSize = FGGetDataTypeSizeBytes(eDataType);
    if (nCells > std::numeric_limits<size_t>::max() / nDTSize)
    {
        FGLError(FE_Failure, FGLE_OutOfMemory,
                 "Grid of %d x %d cells is too large.", nYSize, nXSize);
        return FE_Failure;
    }

    try
    {
        std::vector<GByte> abyData(nCells * nDTSize);
        m_abyData.swap(abyData);
    }
    catch (const std::bad_alloc &)
    {
        FGLError(FE_Failure, FGLE_OutOfMemory,
                 "Cannot allocate grid of %d x %d cells.", nYSize, nXSize);
        return FE_Failure;
    }

    m_nYSize = nYSize;
    m_nXSize = nXSize;
    m_eDataType = eDataType;
    return FE_None;
}

/************************************************************************/
/*                              GetValue()                              */
/************************************************************************/

/** Value of a cell, as a double. Bool cells read as 0 or 1. */
double FGGrid::GetValue(int iRow, int iCol) const
{
    const size_t nOffset = GetOffset(iRow, iCol);
    const GByte *pabyData = m_abyData.data();
    switch (m_eDataType)
    {
        case FGT_Bool:
            return pabyData[nOffset] ? 1.0 : 0.0;
        case FGT_UInt8:
            return GetValueT<GByte>(pabyData, nOffset);
        case FGT_Int16:
            return GetValueT<GInt16>(pabyData, nOffset);
        case FGT_UInt16:
            return GetValueT<GUInt16>(pabyData, nOffset);
        case FGT_Int32:
            return GetValueT<GInt32>(pabyData, nOffset);
        case FGT_UInt32:
            return GetValueT<GUInt32>(pabyData, nOffset);
        case FGT_Float32:
            return GetValueT<float>(pabyData, nOffset);
        case FGT_Float64:
            return GetValueT<double>(pabyData, nOffset);
        default:
            break;
    }
    return 0.0;
}

/************************************************************************/
/*                              SetValue()                              */
/************************************************************************/

/** Set the value of a cell. The value must fit the data type. */
void FGGrid::SetValue(int iRow, int iCol, double dfValue)
{
    const size_t nOffset = GetOffset(iRow, iCol);
    GByte *pabyData = m_abyData.data();
    switch (m_eDataType)
    {
        case FGT_Bool:
            pabyData[nOffset] = dfValue != 0.0 ? 1 : 0;
            break;
        case FGT_UInt8:
            SetValueT<GByte>(pabyData, nOffset, dfValue);
            break;
        case FGT_Int16:
            SetValueT<GInt16>(pabyData, nOffset, dfValue);
            break;
        case FGT_UInt16:
            SetValueT<GUInt16>(pabyData, nOffset, dfValue);
            break;
        case FGT_Int32:
            SetValueT<GInt32>(pabyData, nOffset, dfValue);
            break;
        case FGT_UInt32:
            SetValueT<GUInt32>(pabyData, nOffset, dfValue);
            break;
        case FGT_Float32:
            SetValueT<float>(pabyData, nOffset, dfValue);
            break;
        case FGT_Float64:
            SetValueT<double>(pabyData, nOffset, dfValue);
            break;
        default:
            break;
    }
}

/************************************************************************/
/*                                Fill()                                */
/************************************************************************/

/** Set every cell to dfValue. The value must fit the data type. */
void FGGrid::Fill(double dfValue)
{
    const size_t nCells = static_cast<size_t>(m_nYSize) * m_nXSize;
    GByte *pabyData = m_abyData.data();
    switch (m_eDataType)
    {
        case FGT_Bool:
            std::fill(pabyData, pabyData + nCells,
                      static_cast<GByte>(dfValue != 0.0 ? 1 : 0));
            break;
        case FGT_UInt8:
            FillT<GByte>(pabyData, nCells, dfValue);
            break;
        case FGT_Int16:
            FillT<GInt16>(pabyData, nCells, dfValue);
            break;
        case FGT_UInt16:
            FillT<GUInt16>(pabyData, nCells, dfValue);
            break;
        case FGT_Int32:
            FillT<GInt32>(pabyData, nCells, dfValue);
            break;
        case FGT_UInt32:
            FillT<GUInt32>(pabyData, nCells, dfValue);
            break;
        case FGT_Float32:
            FillT<float>(pabyData, nCells, dfValue);
            break;
        case FGT_Float64:
            FillT<double>(pabyData, nCells, dfValue);
            break;
        default:
            break;
    }
}

/************************************************************************/
/*                              ReadLine()                              */
/************************************************************************/

/** Copy row iRow into padfValues (GetXSize() doubles). */
void FGGrid::ReadLine(int iRow, double *padfValues) const
{
    for (int iCol = 0; iCol < m_nXSize; ++iCol)
        padfValues[iCol] = GetValue(iRow, iCol);
}

/** Number of cells whose value equals dfValue. */
size_t FGGrid::CountEqual(double dfValue) const
{
    size_t nCount = 0;
    for (int iRow = 0; iRow < m_nYSize; ++iRow)
    {
        for (int iCol = 0; iCol < m_nXSize; ++iCol)
        {
            if (GetValue(iRow, iCol) == dfValue)
                ++nCount;
        }
    }
    return nCount;
}

/** Same shape, same data type and same cell contents. */
bool FGGrid::operator==(const FGGrid &other) const
{
    return m_nYSize == other.m_nYSize && m_nXSize == other.m_nXSize &&
           m_eDataType == other.m_eDataType && m_abyData == other.m_abyData;
}
