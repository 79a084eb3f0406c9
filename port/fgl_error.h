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

#ifndef FGL_ERROR_H_INCLUDED
#define FGL_ERROR_H_INCLUDED

#include "fgl_port.h"

#include <string>
#include <vector>

/**
 * \file fgl_error.h
 *
 * FGL error handling services.
 */

/** Error category */
typedef enum
{
    FE_None = 0,
    FE_Debug = 1,
    FE_Warning = 2,
    FE_Failure = 3
} FGLErr;

/* ==================================================================== */
/*      Well known error codes.                                         */
/* ==================================================================== */

/** Error number */
typedef int FGLErrorNum;

/** No error */
#define FGLE_None 0
/** Application defined error */
#define FGLE_AppDefined 1
/** Out of memory error */
#define FGLE_OutOfMemory 2
/** Illegal argument */
#define FGLE_IllegalArg 5
/** Not supported */
#define FGLE_NotSupported 6
/** NULL object */
#define FGLE_ObjectNull 10

/* 100 - 199 reserved for featgrid algorithms */

/** No geometry given and no output grid to fall back on */
#define FGLE_EmptyInput 100
/** Requested or inferred data type is not in the supported set */
#define FGLE_UnsupportedDataType 101
/** Value cannot be represented exactly in the resolved data type */
#define FGLE_ValueRange 102
/** Inverse requested on a non-invertible transform */
#define FGLE_SingularTransform 103
/** Grid shape disagrees with the stated or expected shape */
#define FGLE_ShapeMismatch 104

void FGL_DLL FGLError(FGLErr eErrClass, FGLErrorNum err_no, const char *fmt,
                      ...) FGL_PRINT_FUNC_FORMAT(3, 4);
void FGL_DLL FGLErrorV(FGLErr, FGLErrorNum, const char *, va_list);
void FGL_DLL FGLErrorReset();
FGLErrorNum FGL_DLL FGLGetLastErrorNo();
FGLErr FGL_DLL FGLGetLastErrorType();
const char FGL_DLL *FGLGetLastErrorMsg();
GUInt32 FGL_DLL FGLGetErrorCounter();
void FGL_DLL *FGLGetErrorHandlerUserData();

/** Callback for a custom error handler */
typedef void (*FGLErrorHandler)(FGLErr, FGLErrorNum, const char *);

void FGL_DLL FGLDefaultErrorHandler(FGLErr, FGLErrorNum, const char *);
void FGL_DLL FGLQuietErrorHandler(FGLErr, FGLErrorNum, const char *);

FGLErrorHandler FGL_DLL FGLSetErrorHandler(FGLErrorHandler);
FGLErrorHandler FGL_DLL FGLSetErrorHandlerEx(FGLErrorHandler, void *);
void FGL_DLL FGLPushErrorHandler(FGLErrorHandler);
void FGL_DLL FGLPushErrorHandlerEx(FGLErrorHandler, void *);
void FGL_DLL FGLPopErrorHandler();

void FGL_DLL FGLDebug(const char *, const char *, ...)
    FGL_PRINT_FUNC_FORMAT(2, 3);

/** Class that installs a (thread-local) error handler on construction, and
 * restore the initial one on destruction.
 */
class FGL_DLL FGLErrorHandlerPusher
{
    FGL_DISALLOW_COPY_ASSIGN(FGLErrorHandlerPusher)

  public:
    /** Constructor that installs a thread-local temporary error handler
     * (typically FGLQuietErrorHandler)
     */
    explicit FGLErrorHandlerPusher(FGLErrorHandler hHandler)
    {
        FGLPushErrorHandler(hHandler);
    }

    /** Constructor that installs a thread-local temporary error handler,
     * and its user data.
     */
    FGLErrorHandlerPusher(FGLErrorHandler hHandler, void *user_data)
    {
        FGLPushErrorHandlerEx(hHandler, user_data);
    }

    /** Destructor that restores the initial error handler. */
    ~FGLErrorHandlerPusher()
    {
        FGLPopErrorHandler();
    }
};

/** Class that saves the error state on construction, and
 * restores it on destruction.
 */
class FGL_DLL FGLErrorStateBackuper
{
    FGL_DISALLOW_COPY_ASSIGN(FGLErrorStateBackuper)

    FGLErrorNum m_nLastErrorNum;
    FGLErr m_nLastErrorType;
    std::string m_osLastErrorMsg;
    bool m_bPushedHandler;

  public:
    explicit FGLErrorStateBackuper(FGLErrorHandler hHandler = nullptr);
    ~FGLErrorStateBackuper();
};

/** One message collected by FGLInstallErrorHandlerAccumulator() */
struct FGL_DLL FGLErrorHandlerAccumulatorStruct
{
    FGLErr type;
    FGLErrorNum no;
    std::string msg{};

    FGLErrorHandlerAccumulatorStruct() : type(FE_None), no(FGLE_None)
    {
    }

    FGLErrorHandlerAccumulatorStruct(FGLErr eErrIn, FGLErrorNum noIn,
                                     const char *msgIn)
        : type(eErrIn), no(noIn), msg(msgIn)
    {
    }
};

void FGL_DLL FGLInstallErrorHandlerAccumulator(
    std::vector<FGLErrorHandlerAccumulatorStruct> &aoErrors);
void FGL_DLL FGLUninstallErrorHandlerAccumulator();

/** Validate that a pointer is not NULL, and return rc if it is NULL */
#define VALIDATE_POINTER1(ptr, func, rc)                                       \
    do                                                                         \
    {                                                                          \
        if (nullptr == ptr)                                                    \
        {                                                                      \
            FGLError(FE_Failure, FGLE_ObjectNull,                              \
                     "Pointer \'%s\' is NULL in \'%s\'.", #ptr, (func));       \
            return (rc);                                                       \
        }                                                                      \
    } while (0)

#endif /* FGL_ERROR_H_INCLUDED */
