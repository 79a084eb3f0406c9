/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  String and NAME=VALUE option list helpers
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "fgl_string.h"

#include <cctype>
#include <cmath>
#include <vector>

/************************************************************************/
/*                            FGLVSPrintf()                             */
/************************************************************************/

/** Format a printf() style message into a std::string. */
std::string FGLVSPrintf(const char *fmt, va_list args)
{
    char szBuffer[512] = {};

    va_list wrk_args;
    va_copy(wrk_args, args);
    const int nPR = vsnprintf(szBuffer, sizeof(szBuffer), fmt, wrk_args);
    va_end(wrk_args);

    if (nPR < 0)
        return std::string();
    if (static_cast<size_t>(nPR) < sizeof(szBuffer))
        return std::string(szBuffer, nPR);

    std::vector<char> abyBuffer(static_cast<size_t>(nPR) + 1);
    va_copy(wrk_args, args);
    vsnprintf(abyBuffer.data(), abyBuffer.size(), fmt, wrk_args);
    va_end(wrk_args);
    return std::string(abyBuffer.data(), nPR);
}

/**********************************************************************
 *                       FGLFetchNameValue()
 **********************************************************************/

/** In a list of "Name=Value" pairs, look for the first value associated
 * with the specified name. The search is not case sensitive.
 *
 * Returns a reference to the value in the list, or nullptr if the name is
 * not found.
 */
const char *FGLFetchNameValue(FGLConstList papszStrList, const char *pszName)
{
    if (papszStrList == nullptr || pszName == nullptr)
        return nullptr;

    const size_t nLen = strlen(pszName);
    while (*papszStrList != nullptr)
    {
        if (EQUALN(*papszStrList, pszName, nLen) &&
            (*papszStrList)[nLen] == '=')
        {
            return (*papszStrList) + nLen + 1;
        }
        ++papszStrList;
    }
    return nullptr;
}

/** Same as FGLFetchNameValue() but return pszDefault in case of no match */
const char *FGLFetchNameValueDef(FGLConstList papszStrList,
                                 const char *pszName, const char *pszDefault)
{
    const char *pszResult = FGLFetchNameValue(papszStrList, pszName);
    if (pszResult != nullptr)
        return pszResult;

    return pszDefault;
}

/************************************************************************/
/*                            FGLTestBool()                             */
/************************************************************************/

/**
 * Test what boolean value contained in the string.
 *
 * If pszValue is "NO", "FALSE", "OFF" or "0" will be returned false.
 * Otherwise, true will be returned.
 */
bool FGLTestBool(const char *pszValue)
{
    return !(EQUAL(pszValue, "NO") || EQUAL(pszValue, "FALSE") ||
             EQUAL(pszValue, "OFF") || EQUAL(pszValue, "0"));
}

/**********************************************************************
 *                           FGLFetchBool()
 **********************************************************************/

/** Check for boolean key value.
 *
 * A key that appears without any "=Value" portion is considered true.
 * If the value is NO, FALSE, OFF or 0 it is considered false, any other
 * value is true. If the key doesn't appear at all, bDefault is returned.
 */
bool FGLFetchBool(FGLConstList papszStrList, const char *pszKey, bool bDefault)
{
    for (FGLConstList papszIter = papszStrList;
         papszIter != nullptr && *papszIter != nullptr; ++papszIter)
    {
        if (EQUAL(*papszIter, pszKey))
            return true;
    }

    const char *const pszValue = FGLFetchNameValue(papszStrList, pszKey);
    if (pszValue == nullptr)
        return bDefault;

    return FGLTestBool(pszValue);
}

/************************************************************************/
/*                          FGLGetValueType()                           */
/************************************************************************/

/**
 * Detect the type of the value contained in a string, whether it is
 * a real, an integer or a string.
 * Leading and trailing spaces are skipped in the analysis. A value that
 * overflows to infinity is reported as a string.
 */
FGLValueType FGLGetValueType(const char *pszValue)
{
    if (pszValue == nullptr)
        return FGL_VALUE_STRING;

    while (isspace(static_cast<unsigned char>(*pszValue)))
        ++pszValue;
    if (*pszValue == '\0')
        return FGL_VALUE_STRING;

    // Reject what strtod() accepts beyond plain decimal notation.
    bool bIsReal = false;
    for (const char *pszIter = pszValue; *pszIter != '\0'; ++pszIter)
    {
        const char ch = *pszIter;
        if (ch == '.' || ch == 'e' || ch == 'E')
            bIsReal = true;
        else if (!isdigit(static_cast<unsigned char>(ch)) && ch != '+' &&
                 ch != '-' && !isspace(static_cast<unsigned char>(ch)))
            return FGL_VALUE_STRING;
    }

    char *pszEnd = nullptr;
    const double dfVal = strtod(pszValue, &pszEnd);
    if (pszEnd == pszValue)
        return FGL_VALUE_STRING;
    while (isspace(static_cast<unsigned char>(*pszEnd)))
        ++pszEnd;
    if (*pszEnd != '\0' || std::isinf(dfVal))
        return FGL_VALUE_STRING;

    return bIsReal ? FGL_VALUE_REAL : FGL_VALUE_INTEGER;
}
