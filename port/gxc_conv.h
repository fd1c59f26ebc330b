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

#ifndef GXC_CONV_H_INCLUDED
#define GXC_CONV_H_INCLUDED

#include "gxc_port.h"

#include <string>

/**
 * \file gxc_conv.h
 *
 * Runtime configuration options.
 *
 * Options are looked up in the thread-local set first, then in the
 * process wide set, then in the environment. Keys are case insensitive.
 */

const char GXC_DLL *GXCGetConfigOption(const char *,
                                       const char *) GXC_WARN_UNUSED_RESULT;
const char GXC_DLL *
GXCGetThreadLocalConfigOption(const char *,
                              const char *) GXC_WARN_UNUSED_RESULT;
void GXC_DLL GXCSetConfigOption(const char *, const char *);
void GXC_DLL GXCSetThreadLocalConfigOption(const char *pszKey,
                                           const char *pszValue);
void GXC_DLL GXCFreeConfig();

void GXC_DLL GXCLoadConfigOptionsFromFile(const char *pszFilename,
                                          bool bOverrideEnvVars);
void GXC_DLL GXCLoadConfigOptionsFromPredefinedFiles();

/** Class that installs a thread-local configuration option on construction,
 * and restores the previous value on destruction.
 */
class GXC_DLL GXCConfigOptionSetter
{
  public:
    GXCConfigOptionSetter(const char *pszKey, const char *pszValue,
                          bool bSetOnlyIfUndefined);
    ~GXCConfigOptionSetter();

  private:
    std::string m_osKey;
    std::string m_osOldValue{};
    bool m_bHadOldValue = false;
    bool m_bRestoreOldValue = false;

    GXC_DISALLOW_COPY_ASSIGN(GXCConfigOptionSetter)
};

#endif /* GXC_CONV_H_INCLUDED */
