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

#ifndef GXC_SUBSTITUTION_REGISTRY_H_INCLUDED
#define GXC_SUBSTITUTION_REGISTRY_H_INCLUDED

#include "gxc_extension_types.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

/************************************************************************/
/*                      GXCSubstitutionGroupRegistry                    */
/************************************************************************/

/** Registry mapping abstract head elements to the concrete extension
 * elements declared as substitutable for them.
 *
 * Registration is expected to happen before the registry is consulted
 * concurrently. Lookups are const and do not modify the registry.
 */
class GXC_DLL GXCSubstitutionGroupRegistry
{
  public:
    /** Qualified element name: (namespace URI, local name) */
    typedef std::pair<std::string, std::string> QualifiedName;

    virtual ~GXCSubstitutionGroupRegistry();

    /** Member element information */
    class MemberInfo
    {
      public:
        /** Namespace URI of the member element */
        std::string m_osNamespace{};
        /** Local name of the member element */
        std::string m_osName{};
        /** Extension type the member element carries */
        GXCExtensionType m_eType = GXCExtensionType::Point_WGS84E_3D;
        /** Heads the member can stand in for */
        std::vector<QualifiedName> m_aoHeads{};
    };

    /** Register a member element by its MemberInfo structure. */
    bool Register(const MemberInfo &info);

    /** Get the extension types of the members registered for a head. */
    std::vector<GXCExtensionType> GetMembers(const char *pszHeadNamespace,
                                             const char *pszHeadName) const;

    /** Get the qualified names of all registered members. */
    std::vector<QualifiedName> GetNames() const;

    const MemberInfo *Resolve(const char *pszNamespace,
                              const char *pszLocalName) const;

    bool IsSubstitutableFor(const char *pszNamespace, const char *pszLocalName,
                            const char *pszHeadNamespace,
                            const char *pszHeadName) const;

    /** Returns true if there are no members registered. */
    bool empty() const
    {
        return m_mapNameToInfo.empty();
    }

  private:
    std::map<QualifiedName, MemberInfo> m_mapNameToInfo{};
};

/************************************************************************/
/*                     GXCGlobalSubstitutionRegistry                    */
/************************************************************************/

/** Process-wide registry, populated with the declared extension elements. */
class GXC_DLL GXCGlobalSubstitutionRegistry final
    : public GXCSubstitutionGroupRegistry
{
  public:
    static GXCGlobalSubstitutionRegistry &GetSingleton();

    ~GXCGlobalSubstitutionRegistry() override;

  private:
    GXCGlobalSubstitutionRegistry();

    GXC_DISALLOW_COPY_ASSIGN(GXCGlobalSubstitutionRegistry)
};

#endif /* GXC_SUBSTITUTION_REGISTRY_H_INCLUDED */
