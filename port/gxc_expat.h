/******************************************************************************
 *
 * Project:  GXC - GSIP eXtension Conformance
 * Purpose:  Convenience function for parsing with Expat library
 * Author:   GXC contributors
 *
 ******************************************************************************
 * Copyright (c) 2024, GXC contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#ifndef GXC_EXPAT_H_INCLUDED
#define GXC_EXPAT_H_INCLUDED

#include "gxc_port.h"
#include <expat.h>

#include <memory>

/* Compatibility stuff for expat >= 1.95.0 and < 1.95.7 */
#ifndef XMLCALL
#define XMLCALL
#endif
#ifndef XML_STATUS_OK
#define XML_STATUS_OK 1
#define XML_STATUS_ERROR 0
#endif

/** Separator put by expat between namespace URI, local name and prefix. */
constexpr char GXC_EXPAT_NS_SEPARATOR = ' ';

/* Only for internal use ! */
XML_Parser GXC_DLL GXCCreateExpatXMLParser(bool bNamespaceAware);

//! @cond Doxygen_Suppress
struct GXC_DLL GXCExpatUniquePtrDeleter
{
    void operator()(XML_Parser oParser) const
    {
        XML_ParserFree(oParser);
    }
};

//! @endcond

/** Unique pointer type for XML_Parser.
 */
using GXCExpatUniquePtr =
    std::unique_ptr<XML_ParserStruct, GXCExpatUniquePtrDeleter>;

#endif /* GXC_EXPAT_H_INCLUDED */
