/******************************************************************************
 *
 * Project:  GXC - GSIP eXtension Conformance
 * Purpose:  Declared extension types, namespaces and content rules.
 * Author:   GXC contributors
 *
 ******************************************************************************
 * Copyright (c) 2024, GXC contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#ifndef GXC_EXTENSION_TYPES_H_INCLUDED
#define GXC_EXTENSION_TYPES_H_INCLUDED

#include "gxc_port.h"

#include <cstddef>

/** GML 3.2 namespace URI */
#define GXC_GML_NAMESPACE "http://www.opengis.net/gml/3.2"

/** Namespace of the extension elements and of their added properties */
#define GXC_EXT_NAMESPACE "http://metadata.ces.mil/mdr/ns/GSIP/ext"

/** Namespace of the base location instance shape */
#define GXC_BASE_NAMESPACE "http://metadata.ces.mil/mdr/ns/GSIP/base"

/** The only srsName value permitted on a Point_WGS84E_3D */
#define GXC_WGS84E_3D_SRS_NAME                                                 \
    "http://metadata.ces.mil/mdr/ns/GSIP/crs/WGS84E_3D"

/** Closed set of extension types a fragment can be checked against. */
enum class GXCExtensionType
{
    Point_WGS84E_3D,
    GEOLOCInstance
};

const char GXC_DLL *GXCGetExtensionTypeName(GXCExtensionType eType);
bool GXC_DLL GXCGetExtensionTypeFromName(const char *pszName,
                                         GXCExtensionType &eType);

/************************************************************************/
/*                           Content rules                              */
/************************************************************************/

/** Occurrence rule of a known sub-element of a property group. */
struct GXCPropertyRule
{
    const char *pszName;
    int nMinOccurs;
    int nMaxOccurs;
};

/** Kind of optional property group carried by a Point_WGS84E_3D. */
enum class GXCPropertyGroupKind
{
    Resolution,
    Presentation
};

/** An optional child element of a Point_WGS84E_3D holding a group of known
 * sub-elements. The group element itself occurs at most once. */
struct GXCPropertyGroupRule
{
    const char *pszName;
    GXCPropertyGroupKind eKind;
    const GXCPropertyRule *pasChildren;
    size_t nChildCount;
};

/** Local name of the GML direct position child */
constexpr const char *GXC_POS_ELEMENT = "pos";
/** Local name of the GML coordinates child */
constexpr const char *GXC_COORDINATES_ELEMENT = "coordinates";
/** Local name of the CRS attribute */
constexpr const char *GXC_SRSNAME_ATTRIBUTE = "srsName";
/** Local name of the free text property added by GEOLOCInstance */
constexpr const char *GXC_LOCATION_REMARK_ELEMENT = "locationRemark";

bool GXC_DLL GXCIsInheritedGMLProperty(const char *pszLocalName);
const GXCPropertyGroupRule GXC_DLL *
GXCFindPointGroupRule(const char *pszLocalName);
const char GXC_DLL *GXCGetPropertyGroupKindName(GXCPropertyGroupKind eKind);
const GXCPropertyRule GXC_DLL *
GXCFindGroupChildRule(const GXCPropertyGroupRule *psGroup,
                      const char *pszLocalName);

#endif /* GXC_EXTENSION_TYPES_H_INCLUDED */
