/**********************************************************************
 *
 * Project:  GXC - GSIP eXtension Conformance
 * Purpose:  Error handling and debug logging.
 * Author:   GXC contributors
 *
 **********************************************************************
 * Copyright (c) 2024, GXC contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#ifndef GXC_ERROR_H_INCLUDED
#define GXC_ERROR_H_INCLUDED

#include "gxc_port.h"

#include <cstdarg>
#include <memory>
#include <string>

/**
 * \file gxc_error.h
 *
 * GXC error handling services.
 */

/** Error category */
typedef enum
{
    CE_None = 0,
    CE_Debug = 1,
    CE_Warning = 2,
    CE_Failure = 3,
    CE_Fatal = 4
} GXCErr;

/* ==================================================================== */
/*      Well known error codes.                                         */
/* ==================================================================== */

/** Error number */
typedef int GXCErrorNum;

/** No error */
#define GXCE_None 0
/** Application defined error */
#define GXCE_AppDefined 1
/** Out of memory error */
#define GXCE_OutOfMemory 2
/** File I/O error */
#define GXCE_FileIO 3
/** Open failed */
#define GXCE_OpenFailed 4
/** Illegal argument */
#define GXCE_IllegalArg 5
/** Not supported */
#define GXCE_NotSupported 6
/** NULL object */
#define GXCE_ObjectNull 10

/* 100 - 199 reserved for the conformance checker */

/** Type name is not one of the declared extension types */
#define GXCE_UnknownType 100
/** Fragment is not a well formed tree, or XML parsing failed */
#define GXCE_MalformedInput 101

void GXC_DLL GXCError(GXCErr eErrClass, GXCErrorNum err_no, const char *fmt,
                      ...) GXC_PRINT_FUNC_FORMAT(3, 4);
void GXC_DLL GXCErrorV(GXCErr, GXCErrorNum, const char *, va_list);
void GXC_DLL GXCErrorReset();
GXCErrorNum GXC_DLL GXCGetLastErrorNo();
GXCErr GXC_DLL GXCGetLastErrorType();
const char GXC_DLL *GXCGetLastErrorMsg();
GUInt32 GXC_DLL GXCGetErrorCounter();
void GXC_DLL GXCErrorSetState(GXCErr eErrClass, GXCErrorNum err_no,
                              const char *pszMsg);

void GXC_DLL GXCDebug(const char *, const char *, ...)
    GXC_PRINT_FUNC_FORMAT(2, 3);

/** Callback for a custom error handler */
typedef void (*GXCErrorHandler)(GXCErr, GXCErrorNum, const char *);

void GXC_DLL GXCDefaultErrorHandler(GXCErr, GXCErrorNum, const char *);
void GXC_DLL GXCQuietErrorHandler(GXCErr, GXCErrorNum, const char *);

GXCErrorHandler GXC_DLL GXCSetErrorHandler(GXCErrorHandler);
GXCErrorHandler GXC_DLL GXCSetErrorHandlerEx(GXCErrorHandler, void *);
void GXC_DLL GXCPushErrorHandler(GXCErrorHandler);
void GXC_DLL GXCPushErrorHandlerEx(GXCErrorHandler, void *);
void GXC_DLL GXCPopErrorHandler();
void GXC_DLL *GXCGetErrorHandlerUserData();

/** Class that installs a (thread-local) error handler on construction, and
 * restore the initial one on destruction.
 */
class GXC_DLL GXCErrorHandlerPusher
{
  public:
    /** Constructor that installs a thread-local temporary error handler
     * (typically GXCQuietErrorHandler)
     */
    explicit GXCErrorHandlerPusher(GXCErrorHandler hHandler)
    {
        GXCPushErrorHandler(hHandler);
    }

    /** Constructor that installs a thread-local temporary error handler,
     * and its user data.
     */
    GXCErrorHandlerPusher(GXCErrorHandler hHandler, void *user_data)
    {
        GXCPushErrorHandlerEx(hHandler, user_data);
    }

    /** Destructor that restores the initial error handler. */
    ~GXCErrorHandlerPusher()
    {
        GXCPopErrorHandler();
    }

    GXC_DISALLOW_COPY_ASSIGN(GXCErrorHandlerPusher)
};

/** Class that saves the error state on construction, and
 * restores it on destruction.
 */
class GXC_DLL GXCErrorStateBackuper
{
    GXCErrorNum m_nLastErrorNum;
    GXCErr m_nLastErrorType;
    std::string m_osLastErrorMsg;
    GUInt32 m_nLastErrorCounter;
    std::unique_ptr<GXCErrorHandlerPusher> m_poErrorHandlerPusher;

  public:
    /** Constructor that backs up the error state, and optionally installs
     * a thread-local temporary error handler (typically GXCQuietErrorHandler).
     */
    explicit GXCErrorStateBackuper(GXCErrorHandler hHandler = nullptr);

    /** Destructor that restores the error state to its initial state
     * before construction.
     */
    ~GXCErrorStateBackuper();

    GXC_DISALLOW_COPY_ASSIGN(GXCErrorStateBackuper)
};

#endif /* GXC_ERROR_H_INCLUDED */
