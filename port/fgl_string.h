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

#ifndef FGL_STRING_H_INCLUDED
#define FGL_STRING_H_INCLUDED

#include "fgl_port.h"

#include <string>

/**
 * \file fgl_string.h
 *
 * Option lists are null terminated arrays of "NAME=VALUE" strings
 * (FGLConstList). Name lookups are case insensitive.
 */

std::string FGL_DLL FGLVSPrintf(const char *fmt, va_list args);

const char FGL_DLL *FGLFetchNameValue(FGLConstList papszStrList,
                                      const char *pszName);
const char FGL_DLL *FGLFetchNameValueDef(FGLConstList papszStrList,
                                         const char *pszName,
                                         const char *pszDefault);

bool FGL_DLL FGLTestBool(const char *pszValue);
bool FGL_DLL FGLFetchBool(FGLConstList papszStrList, const char *pszKey,
                          bool bDefault);

/** Type of value contained in a string */
typedef enum
{
    FGL_VALUE_STRING,
    FGL_VALUE_REAL,
    FGL_VALUE_INTEGER
} FGLValueType;

FGLValueType FGL_DLL FGLGetValueType(const char *pszValue);

#endif /* FGL_STRING_H_INCLUDED */
