/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  Configuration options
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#ifndef FGL_CONV_H_INCLUDED
#define FGL_CONV_H_INCLUDED

#include "fgl_port.h"

#include <string>

/**
 * \file fgl_conv.h
 *
 * Configuration options: (key, value) pairs set globally or per thread,
 * falling back to environment variables.
 */

const char FGL_DLL *FGLGetConfigOption(const char *, const char *)
    FGL_WARN_UNUSED_RESULT;
const char FGL_DLL *FGLGetThreadLocalConfigOption(const char *, const char *)
    FGL_WARN_UNUSED_RESULT;
void FGL_DLL FGLSetConfigOption(const char *, const char *);
void FGL_DLL FGLSetThreadLocalConfigOption(const char *pszKey,
                                           const char *pszValue);

/** Class that sets a (thread-local) configuration option on construction,
 * and restores its previous value on destruction.
 */
class FGL_DLL FGLConfigOptionSetter
{
    FGL_DISALLOW_COPY_ASSIGN(FGLConfigOptionSetter)

  public:
    FGLConfigOptionSetter(const char *pszKey, const char *pszValue,
                          bool bSetOnlyIfUndefined);
    ~FGLConfigOptionSetter();

  private:
    std::string m_osKey;
    std::string m_osOldValue{};
    bool m_bHadOldValue = false;
    bool m_bRestoreOldValue = false;
};

#endif /* FGL_CONV_H_INCLUDED */
