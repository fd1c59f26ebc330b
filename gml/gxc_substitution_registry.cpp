/******************************************************************************
 *
 * Project:  GXC - GSIP eXtension Conformance
 * Purpose:  Registry of the elements substitutable for abstract heads.
 * Author:   GXC contributors
 *
 ******************************************************************************
 * Copyright (c) 2024, GXC contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "gxc_substitution_registry.h"

#include "gxc_error.h"

/************************************************************************/
/*      GXCSubstitutionGroupRegistry::~GXCSubstitutionGroupRegistry()   */
/************************************************************************/

GXCSubstitutionGroupRegistry::~GXCSubstitutionGroupRegistry() = default;

/************************************************************************/
/*               GXCSubstitutionGroupRegistry::Register()               */
/************************************************************************/

bool GXCSubstitutionGroupRegistry::Register(const MemberInfo &info)
{
    if (info.m_osName.empty())
    {
        GXCError(CE_Failure, GXCE_IllegalArg,
                 "Cannot register a member element without a name");
        return false;
    }
    const QualifiedName oKey(info.m_osNamespace, info.m_osName);
    if (m_mapNameToInfo.find(oKey) != m_mapNameToInfo.end())
    {
        GXCError(CE_Failure, GXCE_AppDefined,
                 "Element '{%s}%s' already registered!",
                 info.m_osNamespace.c_str(), info.m_osName.c_str());
        return false;
    }
    m_mapNameToInfo[oKey] = info;
    GXCDebug("GXC", "Registered {%s}%s as %s", info.m_osNamespace.c_str(),
             info.m_osName.c_str(), GXCGetExtensionTypeName(info.m_eType));
    return true;
}

/************************************************************************/
/*              GXCSubstitutionGroupRegistry::GetMembers()              */
/************************************************************************/

std::vector<GXCExtensionType>
GXCSubstitutionGroupRegistry::GetMembers(const char *pszHeadNamespace,
                                         const char *pszHeadName) const
{
    std::vector<GXCExtensionType> aeTypes;
    if (pszHeadName == nullptr)
        return aeTypes;
    const QualifiedName oHead(pszHeadNamespace ? pszHeadNamespace : "",
                             pszHeadName);
    for (const auto &oIter : m_mapNameToInfo)
    {
        for (const auto &oMemberHead : oIter.second.m_aoHeads)
        {
            if (oMemberHead == oHead)
            {
                aeTypes.push_back(oIter.second.m_eType);
                break;
            }
        }
    }
    return aeTypes;
}

/************************************************************************/
/*               GXCSubstitutionGroupRegistry::GetNames()               */
/************************************************************************/

std::vector<GXCSubstitutionGroupRegistry::QualifiedName>
GXCSubstitutionGroupRegistry::GetNames() const
{
    std::vector<QualifiedName> aoNames;
    for (const auto &oIter : m_mapNameToInfo)
        aoNames.push_back(oIter.first);
    return aoNames;
}

/************************************************************************/
/*               GXCSubstitutionGroupRegistry::Resolve()                */
/************************************************************************/

/**
 * Find the member registered under a qualified element name.
 *
 * @param pszNamespace namespace URI of the element, or nullptr to match the
 * local name in any namespace.
 * @param pszLocalName local name of the element.
 * @return the member information, or nullptr if no member matches.
 */
const GXCSubstitutionGroupRegistry::MemberInfo *
GXCSubstitutionGroupRegistry::Resolve(const char *pszNamespace,
                                      const char *pszLocalName) const
{
    if (pszLocalName == nullptr)
        return nullptr;

    if (pszNamespace != nullptr)
    {
        auto oIter =
            m_mapNameToInfo.find(QualifiedName(pszNamespace, pszLocalName));
        return oIter != m_mapNameToInfo.end() ? &(oIter->second) : nullptr;
    }

    for (const auto &oIter : m_mapNameToInfo)
    {
        if (oIter.first.second == pszLocalName)
            return &(oIter.second);
    }
    return nullptr;
}

/************************************************************************/
/*          GXCSubstitutionGroupRegistry::IsSubstitutableFor()          */
/************************************************************************/

/** Whether the element {pszNamespace}pszLocalName may stand in for the head
 * element {pszHeadNamespace}pszHeadName. */
bool GXCSubstitutionGroupRegistry::IsSubstitutableFor(
    const char *pszNamespace, const char *pszLocalName,
    const char *pszHeadNamespace, const char *pszHeadName) const
{
    if (pszNamespace == nullptr || pszHeadName == nullptr)
        return false;
    const MemberInfo *psInfo = Resolve(pszNamespace, pszLocalName);
    if (psInfo == nullptr)
        return false;
    const QualifiedName oHead(pszHeadNamespace ? pszHeadNamespace : "",
                             pszHeadName);
    for (const auto &oMemberHead : psInfo->m_aoHeads)
    {
        if (oMemberHead == oHead)
            return true;
    }
    return false;
}

/************************************************************************/
/*     GXCGlobalSubstitutionRegistry::GXCGlobalSubstitutionRegistry()   */
/************************************************************************/

GXCGlobalSubstitutionRegistry::GXCGlobalSubstitutionRegistry()
{
    {
        MemberInfo info;
        info.m_osNamespace = GXC_EXT_NAMESPACE;
        info.m_osName = "Point_WGS84E_3D";
        info.m_eType = GXCExtensionType::Point_WGS84E_3D;
        info.m_aoHeads.emplace_back(GXC_GML_NAMESPACE, "AbstractGeometry");
        info.m_aoHeads.emplace_back(GXC_GML_NAMESPACE,
                                    "AbstractGeometricPrimitive");
        GXC_IGNORE_RET_VAL(Register(info));
    }
    {
        MemberInfo info;
        info.m_osNamespace = GXC_EXT_NAMESPACE;
        info.m_osName = "GEOLOCInstance";
        info.m_eType = GXCExtensionType::GEOLOCInstance;
        info.m_aoHeads.emplace_back(GXC_BASE_NAMESPACE,
                                    "AbstractLocationInstance");
        GXC_IGNORE_RET_VAL(Register(info));
    }
}

GXCGlobalSubstitutionRegistry::~GXCGlobalSubstitutionRegistry() = default;

/************************************************************************/
/*             GXCGlobalSubstitutionRegistry::GetSingleton()            */
/************************************************************************/

/* static */ GXCGlobalSubstitutionRegistry &
GXCGlobalSubstitutionRegistry::GetSingleton()
{
    static GXCGlobalSubstitutionRegistry singleton;
    return singleton;
}
