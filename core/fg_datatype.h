/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Grid element data types and their value ranges
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#ifndef FG_DATATYPE_H_INCLUDED
#define FG_DATATYPE_H_INCLUDED

#include "fgl_error.h"

#include <vector>

/*! Grid element data type */
typedef enum
{
    /*! Unknown or unspecified type */ FGT_Unknown = 0,
    /*! Boolean, stored on one byte (masks only) */ FGT_Bool = 1,
    /*! Eight bit signed integer */ FGT_Int8 = 2,
    /*! Eight bit unsigned integer */ FGT_UInt8 = 3,
    /*! Sixteen bit signed integer */ FGT_Int16 = 4,
    /*! Sixteen bit unsigned integer */ FGT_UInt16 = 5,
    /*! Thirty two bit signed integer */ FGT_Int32 = 6,
    /*! Thirty two bit unsigned integer */ FGT_UInt32 = 7,
    /*! 64 bit signed integer */ FGT_Int64 = 8,
    /*! 64 bit unsigned integer */ FGT_UInt64 = 9,
    /*! Sixteen bit floating point */ FGT_Float16 = 10,
    /*! Thirty two bit floating point */ FGT_Float32 = 11,
    /*! Sixty four bit floating point */ FGT_Float64 = 12,
    FGT_TypeCount = 13 /* maximum type # + 1 */
} FGDataType;

int FGL_DLL FGGetDataTypeSizeBytes(FGDataType);
bool FGL_DLL FGDataTypeIsSigned(FGDataType);
bool FGL_DLL FGDataTypeIsFloating(FGDataType);
bool FGL_DLL FGDataTypeIsInteger(FGDataType);
bool FGL_DLL FGDataTypeGetRange(FGDataType eDataType, double *pdfMin,
                                double *pdfMax);

const char FGL_DLL *FGGetDataTypeName(FGDataType);
FGDataType FGL_DLL FGGetDataTypeByName(const char *);

std::vector<FGDataType> FGL_DLL FGGetSupportedDataTypes();
bool FGL_DLL FGDataTypeIsSupported(FGDataType);

FGDataType FGL_DLL FGFindDataType(int nBits, bool bSigned, bool bFloating);
FGDataType FGL_DLL FGFindDataTypeForValue(double dfValue);
FGDataType FGL_DLL FGDataTypeUnion(FGDataType, FGDataType);
FGDataType FGL_DLL FGDataTypeUnionWithValue(FGDataType eDT, double dfValue);

bool FGL_DLL FGIsValueExactAs(FGDataType eDataType, double dfValue);
FGLErr FGL_DLL FGValidateValue(FGDataType eDataType, double dfValue);
FGDataType FGL_DLL FGInferDataType(const std::vector<double> &adfValues);

#endif /* FG_DATATYPE_H_INCLUDED */
