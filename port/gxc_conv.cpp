/******************************************************************************
 *
 * Project:  GXC - GSIP eXtension Conformance
 * Purpose:  Configuration option handling.
 * Author:   GXC contributors
 *
 ******************************************************************************
 * Copyright (c) 2024, GXC contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "gxc_conv.h"

#include <cstdlib>
#include <fstream>
#include <map>
#include <mutex>

#include "gxc_error.h"
#include "gxc_string.h"

namespace
{

struct CaseInsensitiveLess
{
    bool operator()(const std::string &a, const std::string &b) const
    {
        return strcasecmp(a.c_str(), b.c_str()) < 0;
    }
};

typedef std::map<std::string, std::string, CaseInsensitiveLess>
    GXCConfigOptionMap;

std::mutex gConfigMutex;
GXCConfigOptionMap gaoConfigOptions;

GXCConfigOptionMap &GetThreadLocalConfigOptions()
{
    static thread_local GXCConfigOptionMap aoTLConfigOptions;
    return aoTLConfigOptions;
}

void SetOptionInMap(GXCConfigOptionMap &oMap, const char *pszKey,
                    const char *pszValue)
{
    if (pszValue == nullptr)
        oMap.erase(pszKey);
    else
        oMap[pszKey] = pszValue;
}

}  // namespace

/************************************************************************/
/*                         GXCGetConfigOption()                         */
/************************************************************************/

/**
 * Get the value of a configuration option.
 *
 * The value is the value of a (key, value) option set with
 * GXCSetThreadLocalConfigOption() or GXCSetConfigOption(), in that order of
 * precedence. If the key is set in neither, the environment variable of
 * the same name is returned.
 *
 * Note: the string returned might be short-lived, and in some cases
 * invalidated by a later call to GXCSetConfigOption() on the same key.
 *
 * @param pszKey the key of the option
 * @param pszDefault a default value if the key does not match existing
 * defined options (may be nullptr)
 * @return the value associated to the key, or the default value if not
 * found.
 */

const char *GXCGetConfigOption(const char *pszKey, const char *pszDefault)
{
    const char *pszResult = GXCGetThreadLocalConfigOption(pszKey, nullptr);

    if (pszResult == nullptr)
    {
        std::lock_guard<std::mutex> oLock(gConfigMutex);
        const auto oIter = gaoConfigOptions.find(pszKey);
        if (oIter != gaoConfigOptions.end())
            pszResult = oIter->second.c_str();
    }

    if (pszResult == nullptr)
        pszResult = getenv(pszKey);

    if (pszResult == nullptr)
        return pszDefault;

    return pszResult;
}

/** Same as GXCGetConfigOption() but only with options set with
 * GXCSetThreadLocalConfigOption() */
const char *GXCGetThreadLocalConfigOption(const char *pszKey,
                                          const char *pszDefault)
{
    const GXCConfigOptionMap &oMap = GetThreadLocalConfigOptions();
    const auto oIter = oMap.find(pszKey);
    if (oIter == oMap.end())
        return pszDefault;
    return oIter->second.c_str();
}

/************************************************************************/
/*                         GXCSetConfigOption()                         */
/************************************************************************/

/**
 * Set a configuration option for GXC.
 *
 * Those options are defined as a (key, value) couple. The value
 * corresponding to a key can be got later with GXCGetConfigOption().
 * GXCSetConfigOption() overrides, from the GXCGetConfigOption() point of
 * view, values defined in the environment.
 *
 * @param pszKey the key of the option
 * @param pszValue the value of the option, or nullptr to clear a setting.
 */

void GXCSetConfigOption(const char *pszKey, const char *pszValue)
{
    std::lock_guard<std::mutex> oLock(gConfigMutex);
    SetOptionInMap(gaoConfigOptions, pszKey, pszValue);
}

/************************************************************************/
/*                   GXCSetThreadLocalConfigOption()                    */
/************************************************************************/

/**
 * Set a configuration option for GXC just for the current thread.
 *
 * This function sets the configuration option that only applies in the
 * current thread, as opposed to GXCSetConfigOption() which sets an option
 * that applies on all threads.
 *
 * @param pszKey the key of the option
 * @param pszValue the value of the option, or nullptr to clear a setting.
 */

void GXCSetThreadLocalConfigOption(const char *pszKey, const char *pszValue)
{
    SetOptionInMap(GetThreadLocalConfigOptions(), pszKey, pszValue);
}

/************************************************************************/
/*                           GXCFreeConfig()                            */
/************************************************************************/

/** Clear the process wide options and those of the current thread. */
void GXCFreeConfig()
{
    {
        std::lock_guard<std::mutex> oLock(gConfigMutex);
        gaoConfigOptions.clear();
    }
    GetThreadLocalConfigOptions().clear();
}

/************************************************************************/
/*                    GXCLoadConfigOptionsFromFile()                    */
/************************************************************************/

/** Load configuration from a given configuration file.
 *
 * A configuration file is a text file in a .ini style format, that lists
 * configuration options and their values.
 * Lines starting with # are comment lines.
 *
 * Example:
 * <pre>
 * [configoptions]
 * # set YES as the value of configuration option GXC_STRICT_RESTRICTION
 * GXC_STRICT_RESTRICTION=YES
 * </pre>
 *
 * @param pszFilename File where to load configuration from.
 * @param bOverrideEnvVars Whether configuration options from the configuration
 *                         file should override environment variables.
 */
void GXCLoadConfigOptionsFromFile(const char *pszFilename,
                                  bool bOverrideEnvVars)
{
    std::ifstream oFile(pszFilename);
    if (!oFile.is_open())
        return;
    GXCDebug("GXC", "Loading configuration from %s", pszFilename);

    std::string osLine;
    bool bInConfigOptions = false;
    while (std::getline(oFile, osLine))
    {
        if (!osLine.empty() && osLine.back() == '\r')
            osLine.pop_back();

        if (osLine.empty() || osLine[0] == '#')
        {
            // Comment line
        }
        else if (osLine == "[configoptions]")
        {
            bInConfigOptions = true;
        }
        else if (osLine[0] == '[')
        {
            bInConfigOptions = false;
        }
        else if (bInConfigOptions)
        {
            std::string osKey;
            const char *pszValue = GXCParseNameValue(osLine.c_str(), &osKey);
            if (pszValue && !osKey.empty())
            {
                if (bOverrideEnvVars || getenv(osKey.c_str()) == nullptr)
                {
                    GXCDebug("GXC", "Setting configuration option %s=%s",
                             osKey.c_str(), pszValue);
                    GXCSetConfigOption(osKey.c_str(), pszValue);
                }
                else
                {
                    GXCDebug("GXC",
                             "Ignoring configuration option %s from "
                             "configuration file as it is already set "
                             "as an environment variable",
                             osKey.c_str());
                }
            }
        }
    }
}

/************************************************************************/
/*               GXCLoadConfigOptionsFromPredefinedFiles()              */
/************************************************************************/

/** Load configuration from a set of predefined files.
 *
 * If the environment variable (or configuration option) GXC_CONFIG_FILE is
 * set, then GXCLoadConfigOptionsFromFile() will be called with the value of
 * this configuration option as the file location.
 *
 * Otherwise GXCLoadConfigOptionsFromFile() will be called with
 * $(HOME)/.gxc/gxcrc.
 *
 * In both cases the value of environment variables previously set wins
 * over the value set in the configuration files.
 */
void GXCLoadConfigOptionsFromPredefinedFiles()
{
    const char *pszFile = GXCGetConfigOption("GXC_CONFIG_FILE", nullptr);
    if (pszFile != nullptr)
    {
        GXCLoadConfigOptionsFromFile(pszFile, false);
        return;
    }

#ifdef _WIN32
    const char *pszHome = GXCGetConfigOption("USERPROFILE", nullptr);
#else
    const char *pszHome = GXCGetConfigOption("HOME", nullptr);
#endif
    if (pszHome != nullptr)
    {
        const std::string osFile = std::string(pszHome) + "/.gxc/gxcrc";
        GXCLoadConfigOptionsFromFile(osFile.c_str(), false);
    }
}

/************************************************************************/
/*                        GXCConfigOptionSetter                         */
/************************************************************************/

GXCConfigOptionSetter::GXCConfigOptionSetter(const char *pszKey,
                                             const char *pszValue,
                                             bool bSetOnlyIfUndefined)
    : m_osKey(pszKey)
{
    const char *pszOldValue = GXCGetThreadLocalConfigOption(pszKey, nullptr);
    if (!bSetOnlyIfUndefined ||
        GXCGetConfigOption(pszKey, nullptr) == nullptr)
    {
        m_bRestoreOldValue = true;
        if (pszOldValue)
        {
            m_bHadOldValue = true;
            m_osOldValue = pszOldValue;
        }
        GXCSetThreadLocalConfigOption(pszKey, pszValue);
    }
}

GXCConfigOptionSetter::~GXCConfigOptionSetter()
{
    if (m_bRestoreOldValue)
    {
        GXCSetThreadLocalConfigOption(
            m_osKey.c_str(), m_bHadOldValue ? m_osOldValue.c_str() : nullptr);
    }
}
