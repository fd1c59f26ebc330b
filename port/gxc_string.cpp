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

#include "gxc_string.h"

#include <cstdio>
#include <vector>

/************************************************************************/
/*                            GXCOvPrintf()                             */
/************************************************************************/

/** Return a std::string formatted with a vsprintf()-style format and a
 * va_list */
std::string GXCOvPrintf(const char *pszFormat, va_list args)
{
    va_list argsCopy;
    va_copy(argsCopy, args);
    char szBuffer[512];
    const int nPrinted = vsnprintf(szBuffer, sizeof(szBuffer), pszFormat,
                                   argsCopy);
    va_end(argsCopy);

    if (nPrinted < 0)
        return std::string();
    if (static_cast<size_t>(nPrinted) < sizeof(szBuffer))
        return std::string(szBuffer, nPrinted);

    std::vector<char> abyBuffer(static_cast<size_t>(nPrinted) + 1);
    va_copy(argsCopy, args);
    vsnprintf(abyBuffer.data(), abyBuffer.size(), pszFormat, argsCopy);
    va_end(argsCopy);
    return std::string(abyBuffer.data(), nPrinted);
}

/************************************************************************/
/*                             GXCOPrintf()                             */
/************************************************************************/

/** Return a std::string formatted with a sprintf()-style format */
std::string GXCOPrintf(const char *pszFormat, ...)
{
    va_list args;
    va_start(args, pszFormat);
    std::string osRet = GXCOvPrintf(pszFormat, args);
    va_end(args);
    return osRet;
}

/************************************************************************/
/*                            GXCTestBool()                             */
/************************************************************************/

/**
 * Test what boolean value contained in the string.
 *
 * If pszValue is "NO", "FALSE", "OFF" or "0" will be returned false.
 * Otherwise, true will be returned.
 *
 * @param pszValue the string should be tested.
 *
 * @return true or false.
 */

bool GXCTestBool(const char *pszValue)
{
    return !(EQUAL(pszValue, "NO") || EQUAL(pszValue, "FALSE") ||
             EQUAL(pszValue, "OFF") || EQUAL(pszValue, "0"));
}

/**********************************************************************
 *                       GXCParseNameValue()
 **********************************************************************/

/**
 * Parse NAME=VALUE string into name and value components.
 *
 * This function also support "NAME:VALUE" strings and will strip white
 * space from around the delimiter when forming name and value strings.
 *
 * @param pszNameValue string in "NAME=VALUE" format.
 * @param posKey optional pointer though which to return the name
 * portion.
 *
 * @return the value portion (pointing into original string), or nullptr
 * if there is no delimiter.
 */

const char *GXCParseNameValue(const char *pszNameValue, std::string *posKey)
{
    for (size_t i = 0; pszNameValue[i] != '\0'; ++i)
    {
        if (pszNameValue[i] == '=' || pszNameValue[i] == ':')
        {
            const char *pszValue = pszNameValue + i + 1;
            while (*pszValue == ' ' || *pszValue == '\t')
                ++pszValue;

            if (posKey != nullptr)
            {
                while (i > 0 && (pszNameValue[i - 1] == ' ' ||
                                 pszNameValue[i - 1] == '\t'))
                {
                    i--;
                }
                posKey->assign(pszNameValue, i);
            }

            return pszValue;
        }
    }

    return nullptr;
}

/************************************************************************/
/*                         GXCStripWhitespace()                         */
/************************************************************************/

/** Return a copy of the string without leading and trailing white space
 * (space, tab, carriage return and newline). */
std::string GXCStripWhitespace(const std::string &osValue)
{
    const char *pszSpaces = " \t\r\n";
    const size_t nStart = osValue.find_first_not_of(pszSpaces);
    if (nStart == std::string::npos)
        return std::string();
    const size_t nEnd = osValue.find_last_not_of(pszSpaces);
    return osValue.substr(nStart, nEnd - nStart + 1);
}
