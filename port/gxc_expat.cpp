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

#include "gxc_expat.h"

#include <cstdlib>

#include "gxc_error.h"

constexpr size_t GXC_EXPAT_MAX_ALLOWED_ALLOC = 10000000;

static void *GXCExpatMalloc(size_t size)
{
    if (size < GXC_EXPAT_MAX_ALLOWED_ALLOC)
        return malloc(size);

    GXCError(CE_Failure, GXCE_OutOfMemory,
             "Expat tried to malloc %d bytes. File probably corrupted",
             static_cast<int>(size));
    return nullptr;
}

static void *GXCExpatRealloc(void *ptr, size_t size)
{
    if (size < GXC_EXPAT_MAX_ALLOWED_ALLOC)
        return realloc(ptr, size);

    GXCError(CE_Failure, GXCE_OutOfMemory,
             "Expat tried to realloc %d bytes. File probably corrupted",
             static_cast<int>(size));
    free(ptr);
    return nullptr;
}

/************************************************************************/
/*                      GXCCreateExpatXMLParser()                       */
/************************************************************************/

/** Create an expat parser whose allocations are bounded.
 *
 * In namespace aware mode element and attribute names are reported as
 * "uri local prefix" triplets separated by GXC_EXPAT_NS_SEPARATOR.
 */
XML_Parser GXCCreateExpatXMLParser(bool bNamespaceAware)
{
    XML_Memory_Handling_Suite memsuite;
    memsuite.malloc_fcn = GXCExpatMalloc;
    memsuite.realloc_fcn = GXCExpatRealloc;
    memsuite.free_fcn = free;

    if (!bNamespaceAware)
        return XML_ParserCreate_MM(nullptr, &memsuite, nullptr);

    const XML_Char szSep[2] = {GXC_EXPAT_NS_SEPARATOR, '\0'};
    XML_Parser hParser = XML_ParserCreate_MM(nullptr, &memsuite, szSep);
    if (hParser != nullptr)
        XML_SetReturnNSTriplet(hParser, 1);
    return hParser;
}
