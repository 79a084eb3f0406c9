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

#include "fgl_conv.h"

#include <map>
#include <mutex>

namespace
{

// Keys are case sensitive, like environment variables.
typedef std::map<std::string, std::string> FGLConfigOptions;

std::mutex hConfigMutex;
FGLConfigOptions goConfigOptions;

FGLConfigOptions &GetThreadLocalConfigOptions()
{
    static thread_local FGLConfigOptions oTLConfigOptions;
    return oTLConfigOptions;
}

// Returned pointers must stay valid after the lock is released: values
// are never moved by std::map, only replaced or erased by a later set.
const char *FetchOption(const FGLConfigOptions &oOptions, const char *pszKey)
{
    const auto oIter = oOptions.find(pszKey);
    if (oIter == oOptions.end())
        return nullptr;
    return oIter->second.c_str();
}

void SetOption(FGLConfigOptions &oOptions, const char *pszKey,
               const char *pszValue)
{
    if (pszValue == nullptr)
        oOptions.erase(pszKey);
    else
        oOptions[pszKey] = pszValue;
}

}  // namespace

/************************************************************************/
/*                         FGLGetConfigOption()                         */
/************************************************************************/

/**
 * Get the value of a configuration option.
 *
 * The value is the value of a (key, value) option set with
 * FGLSetThreadLocalConfigOption() on the current thread, or else with
 * FGLSetConfigOption(). If the given option was not defined either way, it
 * tries to find it in environment variables.
 *
 * Note: the string returned might be short-lived, and in particular it
 * becomes invalid after a call to FGLSetConfigOption() with the same key.
 *
 * @param pszKey the key of the option to retrieve
 * @param pszDefault a default value if the key does not match existing
 *     defined options (may be nullptr)
 * @return the value associated to the key, or the default value if not found
 */
const char *FGLGetConfigOption(const char *pszKey, const char *pszDefault)
{
    const char *pszResult =
        FetchOption(GetThreadLocalConfigOptions(), pszKey);

    if (pszResult == nullptr)
    {
        std::lock_guard<std::mutex> oLock(hConfigMutex);
        pszResult = FetchOption(goConfigOptions, pszKey);
    }

    if (pszResult == nullptr)
        pszResult = getenv(pszKey);

    if (pszResult == nullptr)
        return pszDefault;

    return pszResult;
}

/** Same as FGLGetConfigOption() but only with options set with
 * FGLSetThreadLocalConfigOption() */
const char *FGLGetThreadLocalConfigOption(const char *pszKey,
                                          const char *pszDefault)
{
    const char *pszResult =
        FetchOption(GetThreadLocalConfigOptions(), pszKey);
    if (pszResult == nullptr)
        return pszDefault;
    return pszResult;
}

/************************************************************************/
/*                         FGLSetConfigOption()                         */
/************************************************************************/

/**
 * Set a configuration option that applies to all threads.
 *
 * Options set this way override, for FGLGetConfigOption() point of view,
 * values defined in the environment.
 *
 * @param pszKey the key of the option
 * @param pszValue the value of the option, or nullptr to clear a setting.
 */
void FGLSetConfigOption(const char *pszKey, const char *pszValue)
{
    std::lock_guard<std::mutex> oLock(hConfigMutex);
    SetOption(goConfigOptions, pszKey, pszValue);
}

/************************************************************************/
/*                   FGLSetThreadLocalConfigOption()                    */
/************************************************************************/

/**
 * Set a configuration option that only applies in the current thread.
 *
 * It overrides the effect of FGLSetConfigOption() for the current thread.
 *
 * @param pszKey the key of the option
 * @param pszValue the value of the option, or nullptr to clear a setting.
 */
void FGLSetThreadLocalConfigOption(const char *pszKey, const char *pszValue)
{
    SetOption(GetThreadLocalConfigOptions(), pszKey, pszValue);
}

/************************************************************************/
/*                        FGLConfigOptionSetter()                       */
/************************************************************************/

FGLConfigOptionSetter::FGLConfigOptionSetter(const char *pszKey,
                                             const char *pszValue,
                                             bool bSetOnlyIfUndefined)
    : m_osKey(pszKey)
{
    const char *pszOldValue = FGLGetThreadLocalConfigOption(pszKey, nullptr);
    if (!bSetOnlyIfUndefined || FGLGetConfigOption(pszKey, nullptr) == nullptr)
    {
        m_bRestoreOldValue = true;
        if (pszOldValue)
        {
            m_bHadOldValue = true;
            m_osOldValue = pszOldValue;
        }
        FGLSetThreadLocalConfigOption(pszKey, pszValue);
    }
}

FGLConfigOptionSetter::~FGLConfigOptionSetter()
{
    if (m_bRestoreOldValue)
    {
        FGLSetThreadLocalConfigOption(
            m_osKey.c_str(), m_bHadOldValue ? m_osOldValue.c_str() : nullptr);
    }
}
