/******************************************************************************
 *
 * Project:  featgrid
 * Purpose:  FGL error handling and debug logging
 *
 ******************************************************************************
 * Copyright (c) 2026, featgrid contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "fgl_error.h"

#include "fgl_conv.h"
#include "fgl_string.h"

#include <mutex>

namespace
{

struct FGLErrorHandlerNode
{
    FGLErrorHandler pfnHandler;
    void *pUserData;
};

struct FGLErrorContext
{
    FGLErrorNum nLastErrNo = FGLE_None;
    FGLErr eLastErrType = FE_None;
    std::string osLastErrMsg{};
    GUInt32 nErrorCounter = 0;
    std::vector<FGLErrorHandlerNode> asHandlerStack{};
};

std::recursive_mutex hErrorMutex;
void *pErrorHandlerUserData = nullptr;
FGLErrorHandler pfnErrorHandler = FGLDefaultErrorHandler;

// User data of the handler currently being invoked on this thread.
thread_local void **pActiveUserData = nullptr;

FGLErrorContext &FGLGetErrorContext()
{
    static thread_local FGLErrorContext sCtx;
    return sCtx;
}

/************************************************************************/
/*                         ApplyErrorHandler()                          */
/************************************************************************/

void ApplyErrorHandler(FGLErrorContext &oCtx, FGLErr eErrClass,
                       FGLErrorNum err_no, const char *pszMessage)
{
    if (!oCtx.asHandlerStack.empty())
    {
        // Copy the node: the handler may push or pop handlers.
        FGLErrorHandlerNode sNode = oCtx.asHandlerStack.back();
        pActiveUserData = &sNode.pUserData;
        sNode.pfnHandler(eErrClass, err_no, pszMessage);
    }
    else
    {
        std::lock_guard<std::recursive_mutex> oLock(hErrorMutex);
        if (pfnErrorHandler != nullptr)
        {
            pActiveUserData = &pErrorHandlerUserData;
            pfnErrorHandler(eErrClass, err_no, pszMessage);
        }
    }
    pActiveUserData = nullptr;
}

}  // namespace

/************************************************************************/
/*                     FGLGetErrorHandlerUserData()                     */
/************************************************************************/

/**
 * Fetch the user data for the error context.
 *
 * Inside a handler, returns the user data the handler was installed with
 * through FGLSetErrorHandlerEx() or FGLPushErrorHandlerEx().
 */
void *FGLGetErrorHandlerUserData()
{
    if (pActiveUserData != nullptr)
        return *pActiveUserData;

    FGLErrorContext &oCtx = FGLGetErrorContext();
    if (!oCtx.asHandlerStack.empty())
        return oCtx.asHandlerStack.back().pUserData;

    std::lock_guard<std::recursive_mutex> oLock(hErrorMutex);
    return pErrorHandlerUserData;
}

/**********************************************************************
 *                          FGLError()
 **********************************************************************/

/**
 * Report an error.
 *
 * The error number, class and message are stored for recovery with
 * FGLGetLastErrorNo(), FGLGetLastErrorType() and FGLGetLastErrorMsg(), and
 * the message is then passed to the current error handler: the top of the
 * thread-local handler stack if any, otherwise the process-wide handler
 * (FGLDefaultErrorHandler() unless replaced with FGLSetErrorHandler()).
 *
 * @param eErrClass one of FE_Warning or FE_Failure.
 * @param err_no the error number (FGLE_*) from fgl_error.h.
 * @param fmt a printf() style format string.
 */
void FGLError(FGLErr eErrClass, FGLErrorNum err_no, const char *fmt, ...)
{
    va_list args;

    va_start(args, fmt);
    FGLErrorV(eErrClass, err_no, fmt, args);
    va_end(args);
}

/************************************************************************/
/*                             FGLErrorV()                              */
/************************************************************************/

/** Same as FGLError() but with a va_list */
void FGLErrorV(FGLErr eErrClass, FGLErrorNum err_no, const char *fmt,
               va_list args)
{
    FGLErrorContext &oCtx = FGLGetErrorContext();

    oCtx.osLastErrMsg = FGLVSPrintf(fmt, args);
    oCtx.nLastErrNo = err_no;
    oCtx.eLastErrType = eErrClass;
    if (oCtx.nErrorCounter == ~(0U))
        oCtx.nErrorCounter = 0;
    else
        oCtx.nErrorCounter++;

    // The handler may emit errors itself and overwrite osLastErrMsg.
    const std::string osMsg(oCtx.osLastErrMsg);
    ApplyErrorHandler(oCtx, eErrClass, err_no, osMsg.c_str());
}

/************************************************************************/
/*                              FGLDebug()                              */
/************************************************************************/

/**
 * Display a debugging message.
 *
 * The category argument is used in conjunction with the FGL_DEBUG
 * configuration option to establish if the message should be displayed.
 * If FGL_DEBUG is not set, no debug messages are emitted. If it is set to
 * an empty string or the word "ON" then all debug messages are shown.
 * Otherwise only messages whose category appears somewhere within the
 * FGL_DEBUG value are displayed.
 *
 * @param pszCategory name of the debugging message category.
 * @param pszFormat printf() style format string for message to display.
 */
void FGLDebug(const char *pszCategory, const char *pszFormat, ...)
{
    const char *pszDebug = FGLGetConfigOption("FGL_DEBUG", nullptr);
    if (pszDebug == nullptr)
        return;

    if (!EQUAL(pszDebug, "ON") && !EQUAL(pszDebug, ""))
    {
        const size_t nLen = strlen(pszCategory);

        size_t i = 0;
        for (i = 0; pszDebug[i] != '\0'; i++)
        {
            if (EQUALN(pszCategory, pszDebug + i, nLen))
                break;
        }

        if (pszDebug[i] == '\0')
            return;
    }

    std::string osMessage(pszCategory);
    osMessage += ": ";

    va_list args;
    va_start(args, pszFormat);
    osMessage += FGLVSPrintf(pszFormat, args);
    va_end(args);

    ApplyErrorHandler(FGLGetErrorContext(), FE_Debug, FGLE_None,
                      osMessage.c_str());
}

/**********************************************************************
 *                          FGLErrorReset()
 **********************************************************************/

/**
 * Erase any traces of previous errors.
 */
void FGLErrorReset()
{
    FGLErrorContext &oCtx = FGLGetErrorContext();
    oCtx.nLastErrNo = FGLE_None;
    oCtx.osLastErrMsg.clear();
    oCtx.eLastErrType = FE_None;
    oCtx.nErrorCounter = 0;
}

/** Fetch the last error number of this thread, or FGLE_None. */
FGLErrorNum FGLGetLastErrorNo()
{
    return FGLGetErrorContext().nLastErrNo;
}

/** Fetch the last error class of this thread, or FE_None. */
FGLErr FGLGetLastErrorType()
{
    return FGLGetErrorContext().eLastErrType;
}

/** Fetch the last error message of this thread, or an empty string. */
const char *FGLGetLastErrorMsg()
{
    return FGLGetErrorContext().osLastErrMsg.c_str();
}

/** Number of errors emitted on this thread since the last reset. */
GUInt32 FGLGetErrorCounter()
{
    return FGLGetErrorContext().nErrorCounter;
}

/************************************************************************/
/*                       FGLDefaultErrorHandler()                       */
/************************************************************************/

namespace
{
std::mutex hLogMutex;
FILE *fpLog = stderr;
bool bLogInit = false;
int nErrorCount = 0;
int nMaxErrors = -1;
std::string osErrorSeparator(":");
}  // namespace

/** Default error handler. */
void FGLDefaultErrorHandler(FGLErr eErrClass, FGLErrorNum nError,
                            const char *pszErrorMsg)
{
    std::lock_guard<std::mutex> oLock(hLogMutex);

    if (eErrClass != FE_Debug)
    {
        if (nMaxErrors == -1)
        {
            nMaxErrors =
                atoi(FGLGetConfigOption("FGL_MAX_ERROR_REPORTS", "1000"));
            osErrorSeparator = FGLGetConfigOption("FGL_ERROR_SEPARATOR", ":");
        }

        nErrorCount++;
        if (nErrorCount > nMaxErrors && nMaxErrors > 0)
            return;
    }

    if (!bLogInit)
    {
        bLogInit = true;

        fpLog = stderr;
        const char *pszLog = FGLGetConfigOption("FGL_LOG", nullptr);
        if (pszLog != nullptr)
        {
            const bool bAppend =
                FGLGetConfigOption("FGL_LOG_APPEND", nullptr) != nullptr;
            fpLog = fopen(pszLog, bAppend ? "at" : "wt");
            if (fpLog == nullptr)
                fpLog = stderr;
        }
    }

    if (eErrClass == FE_Debug)
        fprintf(fpLog, "%s\n", pszErrorMsg);
    else if (eErrClass == FE_Warning)
        fprintf(fpLog, "Warning %d: %s\n", nError, pszErrorMsg);
    else
        fprintf(fpLog, "ERROR %d%s %s\n", nError, osErrorSeparator.c_str(),
                pszErrorMsg);

    if (eErrClass != FE_Debug && nMaxErrors > 0 && nErrorCount == nMaxErrors)
    {
        fprintf(fpLog,
                "More than %d errors or warnings have been reported. "
                "No more will be reported from now.\n",
                nMaxErrors);
    }

    fflush(fpLog);
}

/************************************************************************/
/*                        FGLQuietErrorHandler()                        */
/************************************************************************/

/** Error handler that does not do anything, except for debug messages. */
void FGLQuietErrorHandler(FGLErr eErrClass, FGLErrorNum nError,
                          const char *pszErrorMsg)
{
    if (eErrClass == FE_Debug)
        FGLDefaultErrorHandler(eErrClass, nError, pszErrorMsg);
}

/************************************************************************/
/*                        FGLSetErrorHandlerEx()                        */
/************************************************************************/

/**
 * Install custom error handle with user's data.
 *
 * This replaces the process-wide error handler. Thread-local handlers
 * installed with FGLPushErrorHandler() take precedence over it.
 *
 * @param pfnErrorHandlerNew new error handler function, or nullptr to
 * discard errors.
 * @param pUserData user data passed back through
 * FGLGetErrorHandlerUserData().
 *
 * @return returns the previously installed error handler.
 */
FGLErrorHandler FGLSetErrorHandlerEx(FGLErrorHandler pfnErrorHandlerNew,
                                     void *pUserData)
{
    std::lock_guard<std::recursive_mutex> oLock(hErrorMutex);

    FGLErrorHandler pfnOldHandler = pfnErrorHandler;
    pfnErrorHandler = pfnErrorHandlerNew;
    pErrorHandlerUserData = pUserData;
    return pfnOldHandler;
}

/** Same as FGLSetErrorHandlerEx() without user data. */
FGLErrorHandler FGLSetErrorHandler(FGLErrorHandler pfnErrorHandlerNew)
{
    return FGLSetErrorHandlerEx(pfnErrorHandlerNew, nullptr);
}

/************************************************************************/
/*                        FGLPushErrorHandler()                         */
/************************************************************************/

/**
 * Push a new FGLError handler.
 *
 * This pushes a new error handler on the thread-local error handler
 * stack. This handler will be used until removed with
 * FGLPopErrorHandler().
 */
void FGLPushErrorHandler(FGLErrorHandler pfnErrorHandlerNew)
{
    FGLPushErrorHandlerEx(pfnErrorHandlerNew, nullptr);
}

/** Same as FGLPushErrorHandler() with user data. */
void FGLPushErrorHandlerEx(FGLErrorHandler pfnErrorHandlerNew, void *pUserData)
{
    FGLGetErrorContext().asHandlerStack.push_back(
        FGLErrorHandlerNode{pfnErrorHandlerNew, pUserData});
}

/************************************************************************/
/*                         FGLPopErrorHandler()                         */
/************************************************************************/

/**
 * Pop error handler off stack.
 *
 * Discards the current error handler on the error handler stack, and
 * restores the one in use before the last FGLPushErrorHandler() call.
 */
void FGLPopErrorHandler()
{
    FGLErrorContext &oCtx = FGLGetErrorContext();
    if (!oCtx.asHandlerStack.empty())
        oCtx.asHandlerStack.pop_back();
}

/************************************************************************/
/*                        FGLErrorStateBackuper                         */
/************************************************************************/

FGLErrorStateBackuper::FGLErrorStateBackuper(FGLErrorHandler hHandler)
    : m_nLastErrorNum(FGLGetLastErrorNo()),
      m_nLastErrorType(FGLGetLastErrorType()),
      m_osLastErrorMsg(FGLGetLastErrorMsg()), m_bPushedHandler(false)
{
    if (hHandler)
    {
        FGLPushErrorHandler(hHandler);
        m_bPushedHandler = true;
    }
}

FGLErrorStateBackuper::~FGLErrorStateBackuper()
{
    if (m_bPushedHandler)
        FGLPopErrorHandler();

    FGLErrorContext &oCtx = FGLGetErrorContext();
    oCtx.nLastErrNo = m_nLastErrorNum;
    oCtx.eLastErrType = m_nLastErrorType;
    oCtx.osLastErrMsg = m_osLastErrorMsg;
}

/************************************************************************/
/*                     FGLErrorHandlerAccumulator()                     */
/************************************************************************/

static void FGLErrorHandlerAccumulator(FGLErr eErr, FGLErrorNum no,
                                       const char *msg)
{
    auto paoErrors =
        static_cast<std::vector<FGLErrorHandlerAccumulatorStruct> *>(
            FGLGetErrorHandlerUserData());
    paoErrors->emplace_back(eErr, no, msg);
}

/** Push a handler that appends every message (debug ones included) to
 * aoErrors, until FGLUninstallErrorHandlerAccumulator() is called. */
void FGLInstallErrorHandlerAccumulator(
    std::vector<FGLErrorHandlerAccumulatorStruct> &aoErrors)
{
    FGLPushErrorHandlerEx(FGLErrorHandlerAccumulator, &aoErrors);
}

void FGLUninstallErrorHandlerAccumulator()
{
    FGLPopErrorHandler();
}
