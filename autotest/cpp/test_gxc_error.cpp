/******************************************************************************
 *
 * Project:  GXC - GSIP eXtension Conformance
 * Purpose:  Test error reporting and debug logging.
 * Author:   GXC contributors
 *
 ******************************************************************************
 * Copyright (c) 2024, GXC contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "gxc_conv.h"
#include "gxc_error.h"

#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace
{

struct CollectedError
{
    GXCErr eErrClass;
    GXCErrorNum nErrNo;
    std::string osMsg;
};

struct ErrorCollector
{
    std::vector<CollectedError> aoErrors{};
    // Set when the user data seen from within the handler is this object
    bool bUserDataSeen = false;
};

void CollectingErrorHandler(GXCErr eErrClass, GXCErrorNum nErrNo,
                            const char *pszMsg)
{
    auto poCollector =
        static_cast<ErrorCollector *>(GXCGetErrorHandlerUserData());
    poCollector->aoErrors.push_back({eErrClass, nErrNo, pszMsg});
}

void CheckingUserDataErrorHandler(GXCErr eErrClass, GXCErrorNum nErrNo,
                                  const char *pszMsg)
{
    auto poCollector =
        static_cast<ErrorCollector *>(GXCGetErrorHandlerUserData());
    poCollector->bUserDataSeen = true;
    poCollector->aoErrors.push_back({eErrClass, nErrNo, pszMsg});
}

// Reports an error of its own before recording the message it was given
void ReportingErrorHandler(GXCErr eErrClass, GXCErrorNum nErrNo,
                           const char *pszMsg)
{
    const std::string osNested(4000, 'x');
    GXCError(CE_Warning, GXCE_AppDefined, "%s", osNested.c_str());
    auto poCollector =
        static_cast<ErrorCollector *>(GXCGetErrorHandlerUserData());
    poCollector->aoErrors.push_back({eErrClass, nErrNo, pszMsg});
}

// Common fixture
struct test_gxc_error : public ::testing::Test
{
    void SetUp() override
    {
        GXCErrorReset();
    }

    void TearDown() override
    {
        GXCErrorReset();
    }
};

// Test that GXCError() records the last error state
TEST_F(test_gxc_error, last_error_state)
{
    GXCErrorHandlerPusher oQuiet(GXCQuietErrorHandler);

    EXPECT_EQ(GXCGetLastErrorNo(), GXCE_None);
    EXPECT_EQ(GXCGetLastErrorType(), CE_None);
    EXPECT_STREQ(GXCGetLastErrorMsg(), "");
    EXPECT_EQ(GXCGetErrorCounter(), 0U);

    GXCError(CE_Failure, GXCE_UnknownType, "type %s is %d", "Bogus", 42);
    EXPECT_EQ(GXCGetLastErrorNo(), GXCE_UnknownType);
    EXPECT_EQ(GXCGetLastErrorType(), CE_Failure);
    EXPECT_STREQ(GXCGetLastErrorMsg(), "type Bogus is 42");
    EXPECT_EQ(GXCGetErrorCounter(), 1U);

    GXCError(CE_Warning, GXCE_AppDefined, "second");
    EXPECT_EQ(GXCGetLastErrorNo(), GXCE_AppDefined);
    EXPECT_EQ(GXCGetLastErrorType(), CE_Warning);
    EXPECT_EQ(GXCGetErrorCounter(), 2U);

    GXCErrorReset();
    EXPECT_EQ(GXCGetLastErrorNo(), GXCE_None);
    EXPECT_EQ(GXCGetLastErrorType(), CE_None);
    EXPECT_STREQ(GXCGetLastErrorMsg(), "");
    EXPECT_EQ(GXCGetErrorCounter(), 0U);
}

// Test that long messages are not truncated
TEST_F(test_gxc_error, long_message)
{
    GXCErrorHandlerPusher oQuiet(GXCQuietErrorHandler);

    const std::string osLong(2000, 'x');
    GXCError(CE_Failure, GXCE_AppDefined, "%s|", osLong.c_str());
    EXPECT_EQ(std::string(GXCGetLastErrorMsg()), osLong + "|");
}

// Test the thread-local handler stack
TEST_F(test_gxc_error, push_pop_handler)
{
    ErrorCollector oOuter;
    ErrorCollector oInner;
    {
        GXCErrorHandlerPusher oOuterPusher(CollectingErrorHandler, &oOuter);
        GXCError(CE_Warning, GXCE_AppDefined, "to outer");
        {
            GXCErrorHandlerPusher oInnerPusher(CheckingUserDataErrorHandler,
                                               &oInner);
            GXCError(CE_Failure, GXCE_MalformedInput, "to inner");
        }
        GXCError(CE_Failure, GXCE_IllegalArg, "to outer again");
    }

    ASSERT_EQ(oOuter.aoErrors.size(), 2U);
    EXPECT_EQ(oOuter.aoErrors[0].eErrClass, CE_Warning);
    EXPECT_EQ(oOuter.aoErrors[0].osMsg, "to outer");
    EXPECT_EQ(oOuter.aoErrors[1].nErrNo, GXCE_IllegalArg);

    ASSERT_EQ(oInner.aoErrors.size(), 1U);
    EXPECT_TRUE(oInner.bUserDataSeen);
    EXPECT_EQ(oInner.aoErrors[0].nErrNo, GXCE_MalformedInput);
    EXPECT_EQ(oInner.aoErrors[0].osMsg, "to inner");
}

// A handler may itself report an error without losing its own message
TEST_F(test_gxc_error, error_from_handler)
{
    ErrorCollector oCollector;
    {
        GXCErrorHandlerPusher oPusher(ReportingErrorHandler, &oCollector);
        GXCError(CE_Failure, GXCE_IllegalArg, "outer");
    }

    ASSERT_EQ(oCollector.aoErrors.size(), 1U);
    EXPECT_EQ(oCollector.aoErrors[0].nErrNo, GXCE_IllegalArg);
    EXPECT_EQ(oCollector.aoErrors[0].osMsg, "outer");

    // The last error is the one reported from the handler
    EXPECT_EQ(GXCGetLastErrorType(), CE_Warning);
    EXPECT_EQ(std::string(GXCGetLastErrorMsg()), std::string(4000, 'x'));
    EXPECT_EQ(GXCGetErrorCounter(), 2U);
}

// Popping an empty stack is harmless
TEST_F(test_gxc_error, pop_empty_stack)
{
    GXCPopErrorHandler();
    GXCPopErrorHandler();

    ErrorCollector oCollector;
    GXCPushErrorHandlerEx(CollectingErrorHandler, &oCollector);
    GXCError(CE_Failure, GXCE_AppDefined, "still delivered");
    GXCPopErrorHandler();
    EXPECT_EQ(oCollector.aoErrors.size(), 1U);
}

// Test the process wide handler, used when no thread-local one is pushed
TEST_F(test_gxc_error, set_error_handler)
{
    ErrorCollector oCollector;
    GXCErrorHandler pfnOld =
        GXCSetErrorHandlerEx(CollectingErrorHandler, &oCollector);
    GXCError(CE_Failure, GXCE_FileIO, "global");
    GXCErrorHandler pfnMine = GXCSetErrorHandler(pfnOld);

    EXPECT_EQ(pfnMine, &CollectingErrorHandler);
    ASSERT_EQ(oCollector.aoErrors.size(), 1U);
    EXPECT_EQ(oCollector.aoErrors[0].nErrNo, GXCE_FileIO);
    EXPECT_EQ(oCollector.aoErrors[0].osMsg, "global");
}

// Test GXCErrorStateBackuper
TEST_F(test_gxc_error, error_state_backuper)
{
    GXCErrorHandlerPusher oQuiet(GXCQuietErrorHandler);

    GXCError(CE_Warning, GXCE_AppDefined, "before");
    {
        GXCErrorStateBackuper oBackuper;
        GXCError(CE_Failure, GXCE_MalformedInput, "inside");
        EXPECT_EQ(GXCGetLastErrorNo(), GXCE_MalformedInput);
        EXPECT_EQ(GXCGetErrorCounter(), 2U);
    }
    EXPECT_EQ(GXCGetLastErrorNo(), GXCE_AppDefined);
    EXPECT_EQ(GXCGetLastErrorType(), CE_Warning);
    EXPECT_STREQ(GXCGetLastErrorMsg(), "before");
    EXPECT_EQ(GXCGetErrorCounter(), 1U);

    ErrorCollector oCollector;
    GXCErrorHandlerPusher oCollecting(CollectingErrorHandler, &oCollector);
    {
        GXCErrorStateBackuper oBackuper(GXCQuietErrorHandler);
        GXCError(CE_Failure, GXCE_AppDefined, "silenced");
    }
    EXPECT_TRUE(oCollector.aoErrors.empty());
    EXPECT_STREQ(GXCGetLastErrorMsg(), "before");
}

// Test GXCErrorSetState()
TEST_F(test_gxc_error, error_set_state)
{
    GXCErrorSetState(CE_Failure, GXCE_ObjectNull, "restored");
    EXPECT_EQ(GXCGetLastErrorNo(), GXCE_ObjectNull);
    EXPECT_EQ(GXCGetLastErrorType(), CE_Failure);
    EXPECT_STREQ(GXCGetLastErrorMsg(), "restored");
    EXPECT_EQ(GXCGetErrorCounter(), 0U);
}

// The error state and handler stack belong to the calling thread
TEST_F(test_gxc_error, thread_local_state)
{
    ErrorCollector oMainCollector;
    GXCErrorHandlerPusher oPusher(CollectingErrorHandler, &oMainCollector);

    GXCErrorNum nThreadErrNo = GXCE_None;
    std::thread oThread(
        [&nThreadErrNo]()
        {
            ErrorCollector oThreadCollector;
            GXCErrorHandlerPusher oThreadPusher(CollectingErrorHandler,
                                                &oThreadCollector);
            GXCError(CE_Failure, GXCE_NotSupported, "in thread");
            nThreadErrNo = GXCGetLastErrorNo();
        });
    oThread.join();

    EXPECT_EQ(nThreadErrNo, GXCE_NotSupported);
    EXPECT_TRUE(oMainCollector.aoErrors.empty());
    EXPECT_EQ(GXCGetLastErrorNo(), GXCE_None);
}

// GXCDebug() is only emitted when GXC_DEBUG allows its category
TEST_F(test_gxc_error, debug_filtering)
{
    ErrorCollector oCollector;
    GXCErrorHandlerPusher oPusher(CollectingErrorHandler, &oCollector);

    {
        GXCConfigOptionSetter oSetter("GXC_DEBUG", nullptr, false);
        GXCDebug("GXC", "not emitted");
    }
    EXPECT_TRUE(oCollector.aoErrors.empty());

    {
        GXCConfigOptionSetter oSetter("GXC_DEBUG", "ON", false);
        GXCDebug("GXC", "value=%d", 3);
    }
    ASSERT_EQ(oCollector.aoErrors.size(), 1U);
    EXPECT_EQ(oCollector.aoErrors[0].eErrClass, CE_Debug);
    EXPECT_EQ(oCollector.aoErrors[0].osMsg, "GXC: value=3");

    {
        GXCConfigOptionSetter oSetter("GXC_DEBUG", "PARSER,GXC", false);
        GXCDebug("GXC", "listed");
        GXCDebug("OTHER", "not listed");
    }
    ASSERT_EQ(oCollector.aoErrors.size(), 2U);
    EXPECT_EQ(oCollector.aoErrors[1].osMsg, "GXC: listed");

    // Debug messages do not alter the last error state
    EXPECT_EQ(GXCGetLastErrorNo(), GXCE_None);
    EXPECT_EQ(GXCGetErrorCounter(), 0U);
}

// GXC_TIMESTAMP prefixes debug messages with the elapsed time
TEST_F(test_gxc_error, debug_timestamp)
{
    ErrorCollector oCollector;
    GXCErrorHandlerPusher oPusher(CollectingErrorHandler, &oCollector);
    {
        GXCConfigOptionSetter oDebug("GXC_DEBUG", "ON", false);
        GXCConfigOptionSetter oTimestamp("GXC_TIMESTAMP", "YES", false);
        GXCDebug("GXC", "stamped");
    }
    ASSERT_EQ(oCollector.aoErrors.size(), 1U);
    const std::string &osMsg = oCollector.aoErrors[0].osMsg;
    ASSERT_FALSE(osMsg.empty());
    EXPECT_EQ(osMsg[0], '[');
    EXPECT_NE(osMsg.find("] GXC: stamped"), std::string::npos);
}

}  // namespace
