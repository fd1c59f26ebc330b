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

#include "gxc_extension_types.h"

#include <cstring>

namespace
{

struct GXCExtensionTypeName
{
    const char *pszName;
    GXCExtensionType eType;
};

// Variant names first, then the schema type names accepted as aliases.
constexpr GXCExtensionTypeName asExtensionTypeNames[] = {
    {"Point_WGS84E_3D", GXCExtensionType::Point_WGS84E_3D},
    {"GEOLOCInstance", GXCExtensionType::GEOLOCInstance},
    {"PointType_WGS84E_3D", GXCExtensionType::Point_WGS84E_3D},
    {"GEOLOCInstanceType", GXCExtensionType::GEOLOCInstance},
};

// Properties of the abstract GML object and geometry lineage.
constexpr const char *apszInheritedGMLProperties[] = {
    "metaDataProperty", "description", "descriptionReference", "identifier",
    "name"};

constexpr GXCPropertyRule asResolutionRules[] = {
    {"horizontalResolution", 0, 1},
    {"verticalResolution", 0, 1},
};

constexpr GXCPropertyRule asAccuracyRules[] = {
    {"horizontalAccuracy", 0, 1},
    {"verticalAccuracy", 0, 1},
};

constexpr GXCPropertyRule asSexagesimalRules[] = {
    {"latitude", 1, 1},
    {"longitude", 1, 1},
    {"height", 0, 1},
};

constexpr GXCPropertyRule asGridMetreRules[] = {
    {"gridZoneDesignator", 1, 1},
    {"squareIdentifier", 1, 1},
    {"easting", 1, 1},
    {"northing", 1, 1},
};

constexpr GXCPropertyRule asZoneMetreRules[] = {
    {"zone", 1, 1},
    {"hemisphere", 0, 1},
    {"easting", 1, 1},
    {"northing", 1, 1},
};

constexpr GXCPropertyRule asQuadrangleRules[] = {
    {"quadrangleName", 1, 1},
    {"cellIdentifier", 0, 1},
};

constexpr GXCPropertyRule asNumericBitRules[] = {
    {"value", 1, 1},
};

template <size_t N>
constexpr size_t CountOf(const GXCPropertyRule (&)[N])
{
    return N;
}

const GXCPropertyGroupRule asPointGroupRules[] = {
    {"resolution", GXCPropertyGroupKind::Resolution, asResolutionRules,
     CountOf(asResolutionRules)},
    {"accuracy", GXCPropertyGroupKind::Resolution, asAccuracyRules,
     CountOf(asAccuracyRules)},
    {"sexagesimal", GXCPropertyGroupKind::Presentation, asSexagesimalRules,
     CountOf(asSexagesimalRules)},
    {"gridMetre", GXCPropertyGroupKind::Presentation, asGridMetreRules,
     CountOf(asGridMetreRules)},
    {"zoneMetre", GXCPropertyGroupKind::Presentation, asZoneMetreRules,
     CountOf(asZoneMetreRules)},
    {"quadrangle", GXCPropertyGroupKind::Presentation, asQuadrangleRules,
     CountOf(asQuadrangleRules)},
    {"numericBit", GXCPropertyGroupKind::Presentation, asNumericBitRules,
     CountOf(asNumericBitRules)},
};

}  // namespace

/************************************************************************/
/*                      GXCGetExtensionTypeName()                       */
/************************************************************************/

/** Return the variant name of an extension type. */
const char *GXCGetExtensionTypeName(GXCExtensionType eType)
{
    switch (eType)
    {
        case GXCExtensionType::Point_WGS84E_3D:
            return "Point_WGS84E_3D";
        case GXCExtensionType::GEOLOCInstance:
            return "GEOLOCInstance";
    }
    return "";
}

/************************************************************************/
/*                    GXCGetPropertyGroupKindName()                     */
/************************************************************************/

/** Return "resolution" or "presentation". */
const char *GXCGetPropertyGroupKindName(GXCPropertyGroupKind eKind)
{
    switch (eKind)
    {
        case GXCPropertyGroupKind::Resolution:
            return "resolution";
        case GXCPropertyGroupKind::Presentation:
            return "presentation";
    }
    return "";
}

/************************************************************************/
/*                    GXCGetExtensionTypeFromName()                     */
/************************************************************************/

/**
 * Map a type name to its extension type.
 *
 * Both the variant names (Point_WGS84E_3D, GEOLOCInstance) and the schema
 * type names (PointType_WGS84E_3D, GEOLOCInstanceType) are recognized.
 * Matching is case sensitive.
 *
 * @return true if the name designates a declared extension type.
 */
bool GXCGetExtensionTypeFromName(const char *pszName, GXCExtensionType &eType)
{
    if (pszName == nullptr)
        return false;
    for (const auto &sEntry : asExtensionTypeNames)
    {
        if (strcmp(sEntry.pszName, pszName) == 0)
        {
            eType = sEntry.eType;
            return true;
        }
    }
    return false;
}

/** Whether a local name is one of the properties inherited unchanged from
 * the abstract GML geometry lineage. */
bool GXCIsInheritedGMLProperty(const char *pszLocalName)
{
    for (const char *pszName : apszInheritedGMLProperties)
    {
        if (strcmp(pszName, pszLocalName) == 0)
            return true;
    }
    return false;
}

/** Find the optional group of a Point_WGS84E_3D with that local name. */
const GXCPropertyGroupRule *GXCFindPointGroupRule(const char *pszLocalName)
{
    for (const auto &sRule : asPointGroupRules)
    {
        if (strcmp(sRule.pszName, pszLocalName) == 0)
            return &sRule;
    }
    return nullptr;
}

/** Find a known sub-element of a group. */
const GXCPropertyRule *
GXCFindGroupChildRule(const GXCPropertyGroupRule *psGroup,
                      const char *pszLocalName)
{
    for (size_t i = 0; i < psGroup->nChildCount; ++i)
    {
        if (strcmp(psGroup->pasChildren[i].pszName, pszLocalName) == 0)
            return &psGroup->pasChildren[i];
    }
    return nullptr;
}
