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

#include "fg_datatype.h"

#include <algorithm>
#include <cfloat>
#include <cmath>
#include <limits>

namespace
{

struct FGDataTypeInfo
{
    FGDataType eType;
    const char *pszName;
    int nBits;
    bool bSigned;
    bool bFloating;
    bool bSupported;
};

// Indexed by FGDataType.
constexpr FGDataTypeInfo asDataTypeInfo[] = {
    {FGT_Unknown, "unknown", 0, false, false, false},
    {FGT_Bool, "bool", 8, false, false, false},
    {FGT_Int8, "int8", 8, true, false, false},
    {FGT_UInt8, "uint8", 8, false, false, true},
    {FGT_Int16, "int16", 16, true, false, true},
    {FGT_UInt16, "uint16", 16, false, false, true},
    {FGT_Int32, "int32", 32, true, false, true},
    {FGT_UInt32, "uint32", 32, false, false, true},
    {FGT_Int64, "int64", 64, true, false, false},
    {FGT_UInt64, "uint64", 64, false, false, false},
    {FGT_Float16, "float16", 16, true, true, false},
    {FGT_Float32, "float32", 32, true, true, true},
    {FGT_Float64, "float64", 64, true, true, true},
};

static_assert(sizeof(asDataTypeInfo) / sizeof(asDataTypeInfo[0]) ==
                  FGT_TypeCount,
              "asDataTypeInfo out of sync with FGDataType");

const FGDataTypeInfo *GetInfo(FGDataType eDataType)
{
    if (eDataType <= FGT_Unknown || eDataType >= FGT_TypeCount)
        return nullptr;
    return &asDataTypeInfo[eDataType];
}

// Bits needed by a type when merged with another one. Bool is not part of
// the arithmetic type lattice.
int GetDataTypeElementSizeBits(FGDataType eDataType)
{
    if (eDataType == FGT_Bool)
        return 0;
    const FGDataTypeInfo *psInfo = GetInfo(eDataType);
    return psInfo ? psInfo->nBits : 0;
}

int GetMinBitsForPair(const bool pabSigned[], const bool pabFloating[],
                      const int panBits[])
{
    if (pabFloating[0] != pabFloating[1])
    {
        const int nNotFloatingTypeIndex = pabFloating[0] ? 1 : 0;
        const int nFloatingTypeIndex = pabFloating[0] ? 0 : 1;

        return std::max(panBits[nFloatingTypeIndex],
                        2 * panBits[nNotFloatingTypeIndex]);
    }

    if (pabSigned[0] != pabSigned[1])
    {
        const int nUnsignedTypeIndex = pabSigned[0] ? 1 : 0;
        const int nSignedTypeIndex = pabSigned[0] ? 0 : 1;

        return std::max(panBits[nSignedTypeIndex],
                        2 * panBits[nUnsignedTypeIndex]);
    }

    return std::max(panBits[0], panBits[1]);
}

/************************************************************************/
/*                         GetMinBitsForValue()                         */
/************************************************************************/

int GetMinBitsForValue(double dfValue)
{
    if (std::round(dfValue) == dfValue)
    {
        if (dfValue <= std::numeric_limits<GByte>::max() &&
            dfValue >= std::numeric_limits<GByte>::min())
            return 8;

        if (dfValue <= std::numeric_limits<GInt16>::max() &&
            dfValue >= std::numeric_limits<GInt16>::min())
            return 16;

        if (dfValue <= std::numeric_limits<GUInt16>::max() &&
            dfValue >= std::numeric_limits<GUInt16>::min())
            return 16;

        if (dfValue <= std::numeric_limits<GInt32>::max() &&
            dfValue >= std::numeric_limits<GInt32>::min())
            return 32;

        if (dfValue <= std::numeric_limits<GUInt32>::max() &&
            dfValue >= std::numeric_limits<GUInt32>::min())
            return 32;
    }
    else if (static_cast<float>(dfValue) == dfValue)
    {
        return 32;
    }

    return 64;
}

}  // namespace

/************************************************************************/
/*                       FGGetDataTypeSizeBytes()                       */
/************************************************************************/

/**
 * \brief Get data type size in bytes.
 *
 * @return the number of bytes or zero if it is not recognised.
 */
int FGGetDataTypeSizeBytes(FGDataType eDataType)
{
    const FGDataTypeInfo *psInfo = GetInfo(eDataType);
    return psInfo ? psInfo->nBits / 8 : 0;
}

/** Is data type signed? Floating point types are signed. */
bool FGDataTypeIsSigned(FGDataType eDataType)
{
    const FGDataTypeInfo *psInfo = GetInfo(eDataType);
    return psInfo != nullptr && psInfo->bSigned;
}

/** Is data type floating point? */
bool FGDataTypeIsFloating(FGDataType eDataType)
{
    const FGDataTypeInfo *psInfo = GetInfo(eDataType);
    return psInfo != nullptr && psInfo->bFloating;
}

/** Is data type an integer one? Bool is not. */
bool FGDataTypeIsInteger(FGDataType eDataType)
{
    const FGDataTypeInfo *psInfo = GetInfo(eDataType);
    return psInfo != nullptr && eDataType != FGT_Bool && !psInfo->bFloating;
}

/************************************************************************/
/*                         FGDataTypeGetRange()                         */
/************************************************************************/

/**
 * \brief Return the range of finite values representable by a data type.
 *
 * The 64 bit integer bounds are returned as the closest doubles.
 *
 * @return false if the data type is not recognised.
 */
bool FGDataTypeGetRange(FGDataType eDataType, double *pdfMin, double *pdfMax)
{
    switch (eDataType)
    {
        case FGT_Bool:
            *pdfMin = 0;
            *pdfMax = 1;
            return true;
        case FGT_Int8:
            *pdfMin = std::numeric_limits<GInt8>::min();
            *pdfMax = std::numeric_limits<GInt8>::max();
            return true;
        case FGT_UInt8:
            *pdfMin = std::numeric_limits<GByte>::min();
            *pdfMax = std::numeric_limits<GByte>::max();
            return true;
        case FGT_Int16:
            *pdfMin = std::numeric_limits<GInt16>::min();
            *pdfMax = std::numeric_limits<GInt16>::max();
            return true;
        case FGT_UInt16:
            *pdfMin = std::numeric_limits<GUInt16>::min();
            *pdfMax = std::numeric_limits<GUInt16>::max();
            return true;
        case FGT_Int32:
            *pdfMin = std::numeric_limits<GInt32>::min();
            *pdfMax = std::numeric_limits<GInt32>::max();
            return true;
        case FGT_UInt32:
            *pdfMin = std::numeric_limits<GUInt32>::min();
            *pdfMax = std::numeric_limits<GUInt32>::max();
            return true;
        case FGT_Int64:
            *pdfMin = static_cast<double>(std::numeric_limits<GInt64>::min());
            *pdfMax = static_cast<double>(std::numeric_limits<GInt64>::max());
            return true;
        case FGT_UInt64:
            *pdfMin = 0;
            *pdfMax = static_cast<double>(std::numeric_limits<GUInt64>::max());
            return true;
        case FGT_Float16:
            *pdfMin = -65504.0;
            *pdfMax = 65504.0;
            return true;
        case FGT_Float32:
            *pdfMin = -static_cast<double>(FLT_MAX);
            *pdfMax = static_cast<double>(FLT_MAX);
            return true;
        case FGT_Float64:
            *pdfMin = -DBL_MAX;
            *pdfMax = DBL_MAX;
            return true;
        case FGT_Unknown:
        case FGT_TypeCount:
            break;
    }
    return false;
}

/************************************************************************/
/*                         FGGetDataTypeName()                          */
/************************************************************************/

/**
 * \brief Get name of data type.
 *
 * Returns a symbolic name for the data type, such as "uint8" or "float32".
 * The returned strings are static strings and should not be modified or
 * freed by the application.
 *
 * @return string corresponding to the type ("unknown" for FGT_Unknown),
 * or nullptr if not recognised.
 */
const char *FGGetDataTypeName(FGDataType eDataType)
{
    if (eDataType == FGT_Unknown)
        return asDataTypeInfo[FGT_Unknown].pszName;
    const FGDataTypeInfo *psInfo = GetInfo(eDataType);
    return psInfo ? psInfo->pszName : nullptr;
}

/************************************************************************/
/*                        FGGetDataTypeByName()                         */
/************************************************************************/

/**
 * \brief Get data type by symbolic name.
 *
 * The comparison is case sensitive: "Float32" is not "float32".
 *
 * @return the data type, or FGT_Unknown if the name is not recognised.
 */
FGDataType FGGetDataTypeByName(const char *pszName)
{
    VALIDATE_POINTER1(pszName, "FGGetDataTypeByName", FGT_Unknown);

    for (const auto &sInfo : asDataTypeInfo)
    {
        if (sInfo.eType != FGT_Unknown && strcmp(sInfo.pszName, pszName) == 0)
            return sInfo.eType;
    }

    return FGT_Unknown;
}

/************************************************************************/
/*                      FGGetSupportedDataTypes()                       */
/************************************************************************/

/** Data types values can be burnt into, in FGDataType order. */
std::vector<FGDataType> FGGetSupportedDataTypes()
{
    std::vector<FGDataType> aeTypes;
    for (const auto &sInfo : asDataTypeInfo)
    {
        if (sInfo.bSupported)
            aeTypes.push_back(sInfo.eType);
    }
    return aeTypes;
}

/** Whether values can be burnt into a grid of that data type. */
bool FGDataTypeIsSupported(FGDataType eDataType)
{
    const FGDataTypeInfo *psInfo = GetInfo(eDataType);
    return psInfo != nullptr && psInfo->bSupported;
}

/************************************************************************/
/*                           FGFindDataType()                           */
/************************************************************************/

/**
 * \brief Finds the smallest supported data type able to support the given
 *  requirements.
 *
 * There is no supported 64 bit integer type: such requirements are
 * promoted to float64.
 *
 * @param nBits number of bits necessary
 * @param bSigned if negative values are necessary
 * @param bFloating if non-integer values are necessary
 */
FGDataType FGFindDataType(int nBits, bool bSigned, bool bFloating)
{
    if (bSigned)
        nBits = std::max(nBits, 16);
    if (bFloating)
        nBits = std::max(nBits, 32);

    if (nBits <= 8)
        return FGT_UInt8;

    if (nBits <= 16)
        return bSigned ? FGT_Int16 : FGT_UInt16;

    if (nBits <= 32)
    {
        if (bFloating)
            return FGT_Float32;
        return bSigned ? FGT_Int32 : FGT_UInt32;
    }

    return FGT_Float64;
}

/************************************************************************/
/*                       FGFindDataTypeForValue()                       */
/************************************************************************/

/**
 * \brief Finds the smallest supported data type able to hold a value.
 *
 * A non-integral value gets float32 if it survives a round trip through
 * float, float64 otherwise. An integral value outside every 32 bit
 * integer range gets float64.
 */
FGDataType FGFindDataTypeForValue(double dfValue)
{
    const bool bFloating = std::round(dfValue) != dfValue;
    const bool bSigned = bFloating || dfValue < 0;
    const int nBits = GetMinBitsForValue(dfValue);

    return FGFindDataType(nBits, bSigned, bFloating);
}

/************************************************************************/
/*                          FGDataTypeUnion()                           */
/************************************************************************/

/**
 * \brief Return the smallest supported data type that can fully express
 * both input data types.
 *
 * Mixing a signed and an unsigned type doubles the width of the unsigned
 * one, mixing an integer and a floating point type doubles the width of the
 * integer one.
 *
 * @return a data type able to express eType1 and eType2, or FGT_Unknown.
 */
FGDataType FGDataTypeUnion(FGDataType eType1, FGDataType eType2)
{
    const int panBits[] = {GetDataTypeElementSizeBits(eType1),
                           GetDataTypeElementSizeBits(eType2)};

    if (panBits[0] == 0 || panBits[1] == 0)
        return FGT_Unknown;

    const bool pabSigned[] = {FGDataTypeIsSigned(eType1),
                              FGDataTypeIsSigned(eType2)};
    const bool bSigned = pabSigned[0] || pabSigned[1];
    const bool pabFloating[] = {FGDataTypeIsFloating(eType1),
                                FGDataTypeIsFloating(eType2)};
    const bool bFloating = pabFloating[0] || pabFloating[1];

    const int nBits = GetMinBitsForPair(pabSigned, pabFloating, panBits);

    return FGFindDataType(nBits, bSigned, bFloating);
}

/** Union a data type with the one found for a value. */
FGDataType FGDataTypeUnionWithValue(FGDataType eDT, double dfValue)
{
    if (eDT == FGT_Float32 && static_cast<float>(dfValue) == dfValue)
        return eDT;

    const FGDataType eDT2 = FGFindDataTypeForValue(dfValue);
    if (eDT == FGT_Unknown)
        return eDT2;
    return FGDataTypeUnion(eDT, eDT2);
}

/************************************************************************/
/*                          FGIsValueExactAs()                          */
/************************************************************************/

/**
 * \brief Test whether a value can be stored in a data type without any
 * change of value.
 */
bool FGIsValueExactAs(FGDataType eDataType, double dfValue)
{
    double dfMin = 0;
    double dfMax = 0;
    if (!std::isfinite(dfValue) || !FGDataTypeGetRange(eDataType, &dfMin, &dfMax))
        return false;

    switch (eDataType)
    {
        case FGT_Float64:
            return true;
        case FGT_Float32:
            return static_cast<double>(static_cast<float>(dfValue)) ==
                   dfValue;
        case FGT_Float16:
            // Not a storage type; only the range is known.
            return dfValue >= dfMin && dfValue <= dfMax;
        case FGT_Int64:
        case FGT_UInt64:
            // dfMax is 2^63 or 2^64, itself out of range.
            return std::round(dfValue) == dfValue && dfValue >= dfMin &&
                   dfValue < dfMax;
        default:
            return std::round(dfValue) == dfValue && dfValue >= dfMin &&
                   dfValue <= dfMax;
    }
}

/************************************************************************/
/*                          FGValidateValue()                           */
/************************************************************************/

/**
 * \brief Check that a burn, fill or default value fits a data type.
 *
 * Values are never clamped or truncated: a data type outside the supported
 * set fails with FGLE_UnsupportedDataType, and a non-finite value, a value
 * out of the range of the type or a value with a fractional part against an
 * integer type fails with FGLE_ValueRange.
 *
 * @return FE_None on success, FE_Failure otherwise.
 */
FGLErr FGValidateValue(FGDataType eDataType, double dfValue)
{
    if (!FGDataTypeIsSupported(eDataType))
    {
        const char *pszName = FGGetDataTypeName(eDataType);
        FGLError(FE_Failure, FGLE_UnsupportedDataType,
                 "Data type %s is not supported.",
                 pszName ? pszName : "unknown");
        return FE_Failure;
    }

    if (!std::isfinite(dfValue))
    {
        FGLError(FE_Failure, FGLE_ValueRange,
                 "Value %g is not a finite number.", dfValue);
        return FE_Failure;
    }

    double dfMin = 0;
    double dfMax = 0;
    FGDataTypeGetRange(eDataType, &dfMin, &dfMax);

    if (FGDataTypeIsInteger(eDataType) && std::round(dfValue) != dfValue)
    {
        FGLError(FE_Failure, FGLE_ValueRange,
                 "Value %.17g has a fractional part and cannot be burnt "
                 "into a %s grid.",
                 dfValue, FGGetDataTypeName(eDataType));
        return FE_Failure;
    }

    if (dfValue < dfMin || dfValue > dfMax)
    {
        FGLError(FE_Failure, FGLE_ValueRange,
                 "Value %.17g is outside of the range [%.17g, %.17g] of "
                 "data type %s.",
                 dfValue, dfMin, dfMax, FGGetDataTypeName(eDataType));
        return FE_Failure;
    }

    return FE_None;
}

/************************************************************************/
/*                          FGInferDataType()                           */
/************************************************************************/

/**
 * \brief Find the smallest supported data type holding every value
 * exactly.
 *
 * The result does not depend on the order of the values.
 *
 * @return the data type, or FGT_Unknown (with an error emitted) when a
 * value is not finite or the set is empty.
 */
FGDataType FGInferDataType(const std::vector<double> &adfValues)
{
    FGDataType eDataType = FGT_Unknown;
    for (const double dfValue : adfValues)
    {
        if (!std::isfinite(dfValue))
        {
            FGLError(FE_Failure, FGLE_ValueRange,
                     "Value %g is not a finite number.", dfValue);
            return FGT_Unknown;
        }
        eDataType = FGDataTypeUnionWithValue(eDataType, dfValue);
    }

    if (eDataType == FGT_Unknown)
    {
        FGLError(FE_Failure, FGLE_UnsupportedDataType,
                 "Cannot infer a data type from an empty set of values.");
        return FGT_Unknown;
    }

    // The pairwise union widens float32 with large integers to float64
    // even when every value fits a float32.
    if (eDataType == FGT_Float64 &&
        std::all_of(adfValues.begin(), adfValues.end(), [](double dfValue)
                    { return FGIsValueExactAs(FGT_Float32, dfValue); }))
    {
        eDataType = FGT_Float32;
    }

    return eDataType;
}
