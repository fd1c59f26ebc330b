/**********************************************************************
 *
 * Project:  GXC - GSIP eXtension Conformance
 * Purpose:  String and formatting helpers.
 * Author:   GXC contributors
 *
 **********************************************************************
 * Copyright (c) 2024, GXC contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#ifndef GXC_STRING_H_INCLUDED
#define GXC_STRING_H_INCLUDED

#include "gxc_port.h"

#include <cstdarg>
#include <string>

/**
 * \file gxc_string.h
 *
 * Various convenience functions for working with strings.
 */

std::string GXC_DLL GXCOPrintf(const char *pszFormat, ...)
    GXC_PRINT_FUNC_FORMAT(1, 2) GXC_WARN_UNUSED_RESULT;
std::string GXC_DLL GXCOvPrintf(const char *pszFormat,
                                va_list args) GXC_WARN_UNUSED_RESULT;

bool GXC_DLL GXCTestBool(const char *pszValue);

const char GXC_DLL *GXCParseNameValue(const char *pszNameValue,
                                      std::string *posKey);

std::string GXC_DLL GXCStripWhitespace(const std::string &osValue);

#endif /* GXC_STRING_H_INCLUDED */
