/**********************************************************************
 *
 * Project:  GXC - GSIP eXtension Conformance
 * Purpose:  Error handling and debug logging functions.
 * Author:   GXC contributors
 *
 **********************************************************************
 * Copyright (c) 2024, GXC contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "gxc_error.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <mutex>
#include <string>
#include <vector>

#include "gxc_conv.h"
#include "gxc_string.h"

namespace
{

struct GXCErrorHandlerNode
{
    GXCErrorHandler pfnHandler;
    void *pUserData;
};

struct GXCErrorContext
{
    GXCErrorNum nLastErrNo = GXCE_None;
    GXCErr eLastErrType = CE_None;
    std::string osLastErrMsg{};
    GUInt32 nErrorCounter = 0;
    std::vector<GXCErrorHandlerNode> aoHandlerStack{};
    // User data of the handler currently being invoked, if any.
    void *pActiveUserData = nullptr;
    bool bInHandler = false;
};

std::mutex gErrorMutex;
GXCErrorHandler gpfnErrorHandler = GXCDefaultErrorHandler;
void *gpErrorHandlerUserData = nullptr;

std::mutex gLogMutex;
FILE *gfpLog = nullptr;
bool gbLogInit = false;

}  // namespace

/************************************************************************/
/*                         GXCGetErrorContext()                         */
/************************************************************************/

static GXCErrorContext &GXCGetErrorContext()
{
    static thread_local GXCErrorContext sCtx;
    return sCtx;
}

/************************************************************************/
/*                         ApplyErrorHandler()                          */
/************************************************************************/

static void ApplyErrorHandler(GXCErrorContext &oCtx, GXCErr eErrClass,
                              GXCErrorNum err_no, const char *pszMessage)
{
    // A handler that reports an error itself goes to the default handler,
    // otherwise it would recurse into itself.
    if (oCtx.bInHandler)
    {
        GXCDefaultErrorHandler(eErrClass, err_no, pszMessage);
        return;
    }

    oCtx.bInHandler = true;
    if (!oCtx.aoHandlerStack.empty())
    {
        const GXCErrorHandlerNode oNode = oCtx.aoHandlerStack.back();
        oCtx.pActiveUserData = oNode.pUserData;
        oNode.pfnHandler(eErrClass, err_no, pszMessage);
    }
    else
    {
        GXCErrorHandler pfnHandler = nullptr;
        {
            std::lock_guard<std::mutex> oLock(gErrorMutex);
            pfnHandler = gpfnErrorHandler;
            oCtx.pActiveUserData = gpErrorHandlerUserData;
        }
        if (pfnHandler != nullptr)
            pfnHandler(eErrClass, err_no, pszMessage);
    }
    oCtx.pActiveUserData = nullptr;
    oCtx.bInHandler = false;
}

/**********************************************************************
 *                          GXCError()
 **********************************************************************/

/**
 * Report an error.
 *
 * This function reports an error in a manner that can be hooked
 * and reported appropriate by different applications.
 *
 * The effect of this function can be altered by applications by installing
 * a custom error handling using GXCSetErrorHandler() or
 * GXCPushErrorHandler().
 *
 * Regardless of how application error handlers or the default error
 * handler choose to handle an error, the error number, and message will
 * be stored for recovery with GXCGetLastErrorNo() and GXCGetLastErrorMsg().
 *
 * @param eErrClass one of CE_Warning, CE_Failure or CE_Fatal.
 * @param err_no the error number (GXCE_*) from gxc_error.h.
 * @param fmt a printf() style format string.
 */

void GXCError(GXCErr eErrClass, GXCErrorNum err_no, const char *fmt, ...)
{
    va_list args;

    va_start(args, fmt);
    GXCErrorV(eErrClass, err_no, fmt, args);
    va_end(args);
}

/************************************************************************/
/*                             GXCErrorV()                              */
/************************************************************************/

/** Same as GXCError() but with a va_list */
void GXCErrorV(GXCErr eErrClass, GXCErrorNum err_no, const char *fmt,
               va_list args)
{
    GXCErrorContext &oCtx = GXCGetErrorContext();

    // The handler may report errors of its own, which overwrite
    // osLastErrMsg, so it is given its own copy of the message.
    const std::string osMsg = GXCOvPrintf(fmt, args);
    oCtx.osLastErrMsg = osMsg;
    oCtx.nLastErrNo = err_no;
    oCtx.eLastErrType = eErrClass;
    oCtx.nErrorCounter++;

    ApplyErrorHandler(oCtx, eErrClass, err_no, osMsg.c_str());

    if (eErrClass == CE_Fatal)
        abort();
}

/************************************************************************/
/*                              GXCDebug()                              */
/************************************************************************/

/**
 * Display a debugging message.
 *
 * The category argument is used in conjunction with the GXC_DEBUG
 * configuration option to determine if a debug message should be displayed.
 * If GXC_DEBUG is set to ON (or the empty string) all debug messages are
 * emitted, otherwise only those whose category appears in the value.
 *
 * If the GXC_TIMESTAMP configuration option is set, the message is
 * prefixed with the seconds elapsed since the first debug message.
 *
 * @param pszCategory name of the debugging message category.
 * @param pszFormat printf() style format string for message to display.
 */

void GXCDebug(const char *pszCategory, const char *pszFormat, ...)
{
    const char *pszDebug = GXCGetConfigOption("GXC_DEBUG", nullptr);
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

    std::string osMessage;
    if (GXCGetConfigOption("GXC_TIMESTAMP", nullptr) != nullptr)
    {
        using Clock = std::chrono::steady_clock;
        static const Clock::time_point tStart = Clock::now();
        const std::chrono::duration<double> dfElapsed =
            Clock::now() - tStart;
        osMessage = GXCOPrintf("[%.04f] ", dfElapsed.count());
    }

    osMessage += pszCategory;
    osMessage += ": ";

    va_list args;
    va_start(args, pszFormat);
    osMessage += GXCOvPrintf(pszFormat, args);
    va_end(args);

    ApplyErrorHandler(GXCGetErrorContext(), CE_Debug, GXCE_None,
                      osMessage.c_str());
}

/**********************************************************************
 *                          GXCErrorReset()
 **********************************************************************/

/**
 * Erase any traces of previous errors.
 *
 * This is normally used to ensure that an error which has been recovered
 * from does not appear to be still in play with high level functions.
 */

void GXCErrorReset()
{
    GXCErrorContext &oCtx = GXCGetErrorContext();
    oCtx.nLastErrNo = GXCE_None;
    oCtx.osLastErrMsg.clear();
    oCtx.eLastErrType = CE_None;
    oCtx.nErrorCounter = 0;
}

/************************************************************************/
/*                          GXCErrorSetState()                          */
/************************************************************************/

/**
 * Restore an error state, without emitting an error.
 *
 * Can be useful if a routine might call GXCErrorReset() and one wants to
 * preserve the previous error state.
 */

void GXCErrorSetState(GXCErr eErrClass, GXCErrorNum err_no, const char *pszMsg)
{
    GXCErrorContext &oCtx = GXCGetErrorContext();
    oCtx.nLastErrNo = err_no;
    oCtx.osLastErrMsg = pszMsg ? pszMsg : "";
    oCtx.eLastErrType = eErrClass;
}

/** Fetch the last error number. */
GXCErrorNum GXCGetLastErrorNo()
{
    return GXCGetErrorContext().nLastErrNo;
}

/** Fetch the last error type. */
GXCErr GXCGetLastErrorType()
{
    return GXCGetErrorContext().eLastErrType;
}

/**
 * Get the last error message.
 *
 * The returned pointer is to an internal string that should not be
 * altered or freed. It stays valid until the next error on this thread.
 */
const char *GXCGetLastErrorMsg()
{
    return GXCGetErrorContext().osLastErrMsg.c_str();
}

/** Get the number of errors emitted on this thread since the last reset. */
GUInt32 GXCGetErrorCounter()
{
    return GXCGetErrorContext().nErrorCounter;
}

/************************************************************************/
/*                       GXCDefaultErrorHandler()                       */
/************************************************************************/

/** Default error handler. */
void GXCDefaultErrorHandler(GXCErr eErrClass, GXCErrorNum nError,
                            const char *pszErrorMsg)
{
    std::lock_guard<std::mutex> oLock(gLogMutex);

    static int nCount = 0;
    static int nMaxErrors = -1;

    if (eErrClass != CE_Debug)
    {
        if (nMaxErrors == -1)
        {
            nMaxErrors =
                atoi(GXCGetConfigOption("GXC_MAX_ERROR_REPORTS", "1000"));
        }

        nCount++;
        if (nCount > nMaxErrors && nMaxErrors > 0)
            return;
    }

    if (!gbLogInit)
    {
        gbLogInit = true;

        gfpLog = stderr;
        const char *pszLog = GXCGetConfigOption("GXC_LOG", nullptr);
        if (pszLog != nullptr)
        {
            const bool bAppend =
                GXCGetConfigOption("GXC_LOG_APPEND", nullptr) != nullptr;
            gfpLog = fopen(pszLog, bAppend ? "at" : "wt");
            if (gfpLog == nullptr)
                gfpLog = stderr;
        }
    }

    if (eErrClass == CE_Debug)
        fprintf(gfpLog, "%s\n", pszErrorMsg);
    else if (eErrClass == CE_Warning)
        fprintf(gfpLog, "Warning %d: %s\n", nError, pszErrorMsg);
    else
        fprintf(gfpLog, "ERROR %d: %s\n", nError, pszErrorMsg);

    if (eErrClass != CE_Debug && nMaxErrors > 0 && nCount == nMaxErrors)
    {
        fprintf(gfpLog,
                "More than %d errors or warnings have been reported. "
                "No more will be reported from now.\n",
                nMaxErrors);
    }

    fflush(gfpLog);
}

/************************************************************************/
/*                        GXCQuietErrorHandler()                        */
/************************************************************************/

/** Error handler that does not do anything, except for debug messages. */
void GXCQuietErrorHandler(GXCErr eErrClass, GXCErrorNum nError,
                          const char *pszErrorMsg)
{
    if (eErrClass == CE_Debug)
        GXCDefaultErrorHandler(eErrClass, nError, pszErrorMsg);
}

/************************************************************************/
/*                        GXCSetErrorHandlerEx()                        */
/************************************************************************/

/**
 * Install custom error handle with user's data.
 *
 * This replaces the process wide error handler. Thread-local handlers
 * installed with GXCPushErrorHandler() take precedence over it.
 *
 * @param pfnErrorHandlerNew new error handler function, or nullptr to
 * silence errors not caught by a thread-local handler.
 * @param pUserData User data to carry along with the error context.
 * @return returns the previously installed error handler.
 */

GXCErrorHandler GXCSetErrorHandlerEx(GXCErrorHandler pfnErrorHandlerNew,
                                     void *pUserData)
{
    std::lock_guard<std::mutex> oLock(gErrorMutex);
    GXCErrorHandler pfnOldHandler = gpfnErrorHandler;
    gpfnErrorHandler = pfnErrorHandlerNew;
    gpErrorHandlerUserData = pUserData;
    return pfnOldHandler;
}

/** Same as GXCSetErrorHandlerEx() without user data. */
GXCErrorHandler GXCSetErrorHandler(GXCErrorHandler pfnErrorHandlerNew)
{
    return GXCSetErrorHandlerEx(pfnErrorHandlerNew, nullptr);
}

/************************************************************************/
/*                        GXCPushErrorHandler()                         */
/************************************************************************/

/**
 * Push a new GXCError handler.
 *
 * This pushes a new error handler on the thread-local error handler
 * stack.  This handler will be used until removed with GXCPopErrorHandler().
 *
 * @param pfnErrorHandlerNew new error handler function.
 */

void GXCPushErrorHandler(GXCErrorHandler pfnErrorHandlerNew)
{
    GXCPushErrorHandlerEx(pfnErrorHandlerNew, nullptr);
}

/** Push a new GXCError handler with user data on the error context. */
void GXCPushErrorHandlerEx(GXCErrorHandler pfnErrorHandlerNew,
                           void *pUserData)
{
    GXCGetErrorContext().aoHandlerStack.push_back(
        GXCErrorHandlerNode{pfnErrorHandlerNew, pUserData});
}

/************************************************************************/
/*                         GXCPopErrorHandler()                         */
/************************************************************************/

/**
 * Pop error handler off stack.
 *
 * Discards the current error handler on the error handler stack, and restores
 * the one in use before the last GXCPushErrorHandler() call.  This method
 * has no effect if there are no error handlers on the current threads error
 * handler stack.
 */

void GXCPopErrorHandler()
{
    GXCErrorContext &oCtx = GXCGetErrorContext();
    if (!oCtx.aoHandlerStack.empty())
        oCtx.aoHandlerStack.pop_back();
}

/************************************************************************/
/*                     GXCGetErrorHandlerUserData()                     */
/************************************************************************/

/**
 * Fetch the user data for the error context.
 *
 * While a handler runs, this returns the user data it was installed with.
 * Otherwise the user data of the top of the thread-local stack, or of the
 * process wide handler.
 */

void *GXCGetErrorHandlerUserData()
{
    GXCErrorContext &oCtx = GXCGetErrorContext();
    if (oCtx.bInHandler)
        return oCtx.pActiveUserData;
    if (!oCtx.aoHandlerStack.empty())
        return oCtx.aoHandlerStack.back().pUserData;
    std::lock_guard<std::mutex> oLock(gErrorMutex);
    return gpErrorHandlerUserData;
}

/************************************************************************/
/*                        GXCErrorStateBackuper                         */
/************************************************************************/

GXCErrorStateBackuper::GXCErrorStateBackuper(GXCErrorHandler hHandler)
    : m_nLastErrorNum(GXCGetLastErrorNo()),
      m_nLastErrorType(GXCGetLastErrorType()),
      m_osLastErrorMsg(GXCGetLastErrorMsg()),
      m_nLastErrorCounter(GXCGetErrorCounter()),
      m_poErrorHandlerPusher(
          hHandler ? std::make_unique<GXCErrorHandlerPusher>(hHandler)
                   : nullptr)
{
}

GXCErrorStateBackuper::~GXCErrorStateBackuper()
{
    GXCErrorSetState(m_nLastErrorType, m_nLastErrorNum,
                     m_osLastErrorMsg.c_str());
    GXCGetErrorContext().nErrorCounter = m_nLastErrorCounter;
}
