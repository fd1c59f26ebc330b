/******************************************************************************
 *
 * Project:  GXC - GSIP eXtension Conformance
 * Purpose:  Conformance checking of fragments against extension types.
 * Author:   GXC contributors
 *
 ******************************************************************************
 * Copyright (c) 2024, GXC contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "gxc_conformance.h"

#include <algorithm>
#include <cstdarg>
#include <cstring>
#include <initializer_list>
#include <map>

#include "gxc_conv.h"
#include "gxc_error.h"
#include "gxc_string.h"
#include "gxc_substitution_registry.h"

namespace
{

constexpr int GXC_MAX_FRAGMENT_DEPTH = 64;

constexpr int PRECEDENCE_ATTRIBUTE = 0;
constexpr int PRECEDENCE_STRUCTURE = 1;

/************************************************************************/
/*                           MatchesName()                              */
/*                                                                      */
/*      Compare a node name against an expected local name. Namespace  */
/*      URIs are only compared when bStrict is set, in which case a     */
/*      nullptr pszNamespace requires the node to be in no namespace.   */
/************************************************************************/

bool MatchesName(const GXCXMLNode *psNode, const char *pszNamespace,
                 const char *pszLocalName, bool bStrict)
{
    if (strcmp(GXCGetXMLLocalName(psNode->pszValue), pszLocalName) != 0)
        return false;
    if (!bStrict)
        return true;
    if (pszNamespace == nullptr)
        return psNode->pszNamespace == nullptr;
    return psNode->pszNamespace != nullptr &&
           strcmp(psNode->pszNamespace, pszNamespace) == 0;
}

bool IsInNamespace(const GXCXMLNode *psNode, const char *pszNamespace)
{
    return psNode->pszNamespace != nullptr &&
           strcmp(psNode->pszNamespace, pszNamespace) == 0;
}

/************************************************************************/
/*                          BuildChildPath()                            */
/************************************************************************/

std::string BuildChildPath(const std::string &osParentPath,
                           const GXCXMLNode *psParent,
                           const GXCXMLNode *psChild)
{
    if (psChild->eType == CXT_Attribute)
        return osParentPath + "/@" + psChild->pszValue;

    int nIndex = 0;
    int nCount = 0;
    for (const GXCXMLNode *psIter = psParent->psChild; psIter != nullptr;
         psIter = psIter->psNext)
    {
        if (psIter->eType == CXT_Element &&
            strcmp(psIter->pszValue, psChild->pszValue) == 0)
        {
            ++nCount;
            if (psIter == psChild)
                nIndex = nCount;
        }
    }

    std::string osPath = osParentPath + "/" + psChild->pszValue;
    if (nCount > 1)
        osPath += GXCOPrintf("[%d]", nIndex);
    return osPath;
}

/************************************************************************/
/*                          GXCCheckContext                             */
/************************************************************************/

class GXCCheckContext
{
  public:
    explicit GXCCheckContext(bool bStrict) : m_bStrict(bStrict)
    {
    }

    bool IsStrict() const
    {
        return m_bStrict;
    }

    bool IndexTree(const GXCXMLNode *psRoot)
    {
        return IndexNode(psRoot, 1);
    }

    int GetDocumentOrder(const GXCXMLNode *psNode) const
    {
        auto oIter = m_oMapDocumentOrder.find(psNode);
        return oIter != m_oMapDocumentOrder.end() ? oIter->second : 0;
    }

    void AddViolation(GXCViolationType eType, const GXCXMLNode *psNode,
                      int nPrecedence, const std::string &osPath,
                      const char *pszFormat, ...) GXC_PRINT_FUNC_FORMAT(6, 7);

    std::vector<GXCViolation> TakeViolations();

  private:
    bool m_bStrict;
    int m_nNextOrder = 0;
    std::map<const GXCXMLNode *, int> m_oMapDocumentOrder{};
    std::vector<GXCViolation> m_aoViolations{};

    bool IndexNode(const GXCXMLNode *psNode, int nDepth);
};

/************************************************************************/
/*                            IndexNode()                               */
/*                                                                      */
/*      Assign preorder ranks to the fragment nodes, while checking     */
/*      that the fragment is a well formed tree.                        */
/************************************************************************/

bool GXCCheckContext::IndexNode(const GXCXMLNode *psNode, int nDepth)
{
    if (nDepth > GXC_MAX_FRAGMENT_DEPTH)
    {
        GXCError(CE_Failure, GXCE_MalformedInput,
                 "Fragment is nested deeper than %d levels",
                 GXC_MAX_FRAGMENT_DEPTH);
        return false;
    }

    if (!m_oMapDocumentOrder.emplace(psNode, m_nNextOrder).second)
    {
        GXCError(CE_Failure, GXCE_MalformedInput,
                 "Fragment is not a tree: node '%s' is reached twice",
                 psNode->pszValue ? psNode->pszValue : "");
        return false;
    }
    ++m_nNextOrder;

    if (psNode->eType == CXT_Element || psNode->eType == CXT_Attribute)
    {
        if (psNode->pszValue == nullptr || psNode->pszValue[0] == '\0')
        {
            GXCError(CE_Failure, GXCE_MalformedInput, "%s without a name",
                     psNode->eType == CXT_Element ? "Element" : "Attribute");
            return false;
        }
    }

    if (psNode->eType == CXT_Attribute)
    {
        if (psNode->psChild == nullptr || psNode->psChild->eType != CXT_Text ||
            psNode->psChild->pszValue == nullptr)
        {
            GXCError(CE_Failure, GXCE_MalformedInput,
                     "Attribute '%s' has no value", psNode->pszValue);
            return false;
        }
    }

    for (const GXCXMLNode *psChild = psNode->psChild; psChild != nullptr;
         psChild = psChild->psNext)
    {
        if (!IndexNode(psChild, nDepth + 1))
            return false;
    }
    return true;
}

/************************************************************************/
/*                           AddViolation()                             */
/************************************************************************/

void GXCCheckContext::AddViolation(GXCViolationType eType,
                                   const GXCXMLNode *psNode, int nPrecedence,
                                   const std::string &osPath,
                                   const char *pszFormat, ...)
{
    GXCViolation oViolation;
    oViolation.eType = eType;
    oViolation.osPath = osPath;
    va_list args;
    va_start(args, pszFormat);
    oViolation.osMessage = GXCOvPrintf(pszFormat, args);
    va_end(args);
    oViolation.nDocumentOrder = GetDocumentOrder(psNode);
    oViolation.nPrecedence = nPrecedence;

    GXCDebug("GXC", "%s: %s: %s", GXCGetViolationTypeName(eType),
             oViolation.osPath.c_str(), oViolation.osMessage.c_str());
    m_aoViolations.push_back(std::move(oViolation));
}

/************************************************************************/
/*                          TakeViolations()                            */
/************************************************************************/

std::vector<GXCViolation> GXCCheckContext::TakeViolations()
{
    std::stable_sort(m_aoViolations.begin(), m_aoViolations.end(),
                     [](const GXCViolation &a, const GXCViolation &b)
                     {
                         if (a.nDocumentOrder != b.nDocumentOrder)
                             return a.nDocumentOrder < b.nDocumentOrder;
                         return a.nPrecedence < b.nPrecedence;
                     });
    return std::move(m_aoViolations);
}

/************************************************************************/
/*                            CheckGroup()                              */
/*                                                                      */
/*      Check the sub-elements of a resolution or presentation group.   */
/************************************************************************/

void CheckGroup(const GXCXMLNode *psGroupNode,
                const GXCPropertyGroupRule *psGroup,
                const std::string &osGroupPath, GXCCheckContext &oCtxt)
{
    std::vector<int> anCounts(psGroup->nChildCount, 0);

    for (const GXCXMLNode *psChild = psGroupNode->psChild; psChild != nullptr;
         psChild = psChild->psNext)
    {
        if (psChild->eType != CXT_Element)
            continue;

        const char *pszLocalName = GXCGetXMLLocalName(psChild->pszValue);
        const GXCPropertyRule *psRule =
            GXCFindGroupChildRule(psGroup, pszLocalName);
        if (psRule != nullptr &&
            (!oCtxt.IsStrict() || IsInNamespace(psChild, GXC_EXT_NAMESPACE)))
        {
            const size_t nIdx =
                static_cast<size_t>(psRule - psGroup->pasChildren);
            if (++anCounts[nIdx] == psRule->nMaxOccurs + 1)
            {
                oCtxt.AddViolation(
                    GXCViolationType::CardinalityViolated, psChild,
                    PRECEDENCE_STRUCTURE,
                    BuildChildPath(osGroupPath, psGroupNode, psChild),
                    "%s occurs more than %d time(s) in %s group %s",
                    psRule->pszName, psRule->nMaxOccurs,
                    GXCGetPropertyGroupKindName(psGroup->eKind),
                    psGroup->pszName);
            }
        }
        else if (oCtxt.IsStrict())
        {
            oCtxt.AddViolation(
                GXCViolationType::UnexpectedContent, psChild,
                PRECEDENCE_STRUCTURE,
                BuildChildPath(osGroupPath, psGroupNode, psChild),
                "%s is not a declared sub-element of %s group %s",
                psChild->pszValue, GXCGetPropertyGroupKindName(psGroup->eKind),
                psGroup->pszName);
        }
    }

    if (!oCtxt.IsStrict())
        return;

    for (size_t i = 0; i < psGroup->nChildCount; ++i)
    {
        const GXCPropertyRule &sRule = psGroup->pasChildren[i];
        if (anCounts[i] < sRule.nMinOccurs)
        {
            oCtxt.AddViolation(GXCViolationType::CardinalityViolated,
                               psGroupNode, PRECEDENCE_STRUCTURE, osGroupPath,
                               "%s group %s requires %s at least %d time(s), "
                               "found %d",
                               GXCGetPropertyGroupKindName(psGroup->eKind),
                               psGroup->pszName, sRule.pszName,
                               sRule.nMinOccurs, anCounts[i]);
        }
    }
}

/************************************************************************/
/*                            CheckPoint()                              */
/************************************************************************/

void CheckPoint(const GXCXMLNode *psRoot, GXCCheckContext &oCtxt)
{
    const bool bStrict = oCtxt.IsStrict();
    const std::string osRootPath = std::string("/") + psRoot->pszValue;

    /* -------------------------------------------------------------------- */
    /*      srsName is fixed to a single value. Checks on the root's own    */
    /*      attributes rank with the root element itself.                   */
    /* -------------------------------------------------------------------- */
    const GXCXMLNode *psSrsName = nullptr;
    for (const GXCXMLNode *psChild = psRoot->psChild; psChild != nullptr;
         psChild = psChild->psNext)
    {
        if (psChild->eType == CXT_Attribute &&
            MatchesName(psChild, nullptr, GXC_SRSNAME_ATTRIBUTE, bStrict))
        {
            psSrsName = psChild;
            break;
        }
    }

    if (psSrsName == nullptr)
    {
        oCtxt.AddViolation(GXCViolationType::FixedValueMismatch, psRoot,
                           PRECEDENCE_ATTRIBUTE,
                           osRootPath + "/@" + GXC_SRSNAME_ATTRIBUTE,
                           "srsName attribute is missing, expected '%s'",
                           GXC_WGS84E_3D_SRS_NAME);
    }
    else if (strcmp(psSrsName->psChild->pszValue, GXC_WGS84E_3D_SRS_NAME) != 0)
    {
        oCtxt.AddViolation(GXCViolationType::FixedValueMismatch, psRoot,
                           PRECEDENCE_ATTRIBUTE,
                           BuildChildPath(osRootPath, psRoot, psSrsName),
                           "srsName is '%s', expected '%s'",
                           psSrsName->psChild->pszValue,
                           GXC_WGS84E_3D_SRS_NAME);
    }

    /* -------------------------------------------------------------------- */
    /*      Walk the child elements.                                        */
    /* -------------------------------------------------------------------- */
    std::vector<const GXCXMLNode *> apsPos;
    std::vector<const GXCXMLNode *> apsCoordinates;
    std::map<std::string, int> oMapGroupCount;

    for (const GXCXMLNode *psChild = psRoot->psChild; psChild != nullptr;
         psChild = psChild->psNext)
    {
        if (psChild->eType != CXT_Element)
            continue;

        const char *pszLocalName = GXCGetXMLLocalName(psChild->pszValue);
        const GXCPropertyGroupRule *psGroup = nullptr;

        if (MatchesName(psChild, GXC_GML_NAMESPACE, GXC_POS_ELEMENT, bStrict))
        {
            apsPos.push_back(psChild);
        }
        else if (MatchesName(psChild, GXC_GML_NAMESPACE,
                             GXC_COORDINATES_ELEMENT, bStrict))
        {
            apsCoordinates.push_back(psChild);
        }
        else if (GXCIsInheritedGMLProperty(pszLocalName) &&
                 (!bStrict || IsInNamespace(psChild, GXC_GML_NAMESPACE)))
        {
            continue;
        }
        else if ((psGroup = GXCFindPointGroupRule(pszLocalName)) != nullptr &&
                 (!bStrict || IsInNamespace(psChild, GXC_EXT_NAMESPACE)))
        {
            const std::string osPath =
                BuildChildPath(osRootPath, psRoot, psChild);
            if (++oMapGroupCount[psGroup->pszName] == 2)
            {
                oCtxt.AddViolation(GXCViolationType::CardinalityViolated,
                                   psChild, PRECEDENCE_STRUCTURE, osPath,
                                   "%s occurs more than once",
                                   psGroup->pszName);
            }
            CheckGroup(psChild, psGroup, osPath, oCtxt);
        }
        else if (bStrict)
        {
            oCtxt.AddViolation(
                GXCViolationType::UnexpectedContent, psChild,
                PRECEDENCE_STRUCTURE,
                BuildChildPath(osRootPath, psRoot, psChild),
                "%s is not permitted by the restricted point type",
                psChild->pszValue);
        }
        else
        {
            GXCDebug("GXC", "Ignoring unrestricted content %s",
                     psChild->pszValue);
        }
    }

    /* -------------------------------------------------------------------- */
    /*      Exactly one of pos and coordinates.                             */
    /* -------------------------------------------------------------------- */
    if (apsPos.empty() && apsCoordinates.empty())
    {
        oCtxt.AddViolation(GXCViolationType::ExclusiveChoiceViolated, psRoot,
                           PRECEDENCE_STRUCTURE, osRootPath,
                           "Neither %s nor %s is present, exactly one is "
                           "required",
                           GXC_POS_ELEMENT, GXC_COORDINATES_ELEMENT);
    }
    else if (!apsPos.empty() && !apsCoordinates.empty())
    {
        const GXCXMLNode *psSecond =
            oCtxt.GetDocumentOrder(apsPos[0]) <
                    oCtxt.GetDocumentOrder(apsCoordinates[0])
                ? apsCoordinates[0]
                : apsPos[0];
        oCtxt.AddViolation(GXCViolationType::ExclusiveChoiceViolated, psSecond,
                           PRECEDENCE_STRUCTURE,
                           BuildChildPath(osRootPath, psRoot, psSecond),
                           "Both %s and %s are present, only one is allowed",
                           GXC_POS_ELEMENT, GXC_COORDINATES_ELEMENT);
    }

    for (const auto *papsCoords : {&apsPos, &apsCoordinates})
    {
        if (papsCoords->size() > 1)
        {
            const GXCXMLNode *psRepeated = (*papsCoords)[1];
            oCtxt.AddViolation(GXCViolationType::CardinalityViolated,
                               psRepeated, PRECEDENCE_STRUCTURE,
                               BuildChildPath(osRootPath, psRoot, psRepeated),
                               "%s occurs %d times, at most once is allowed",
                               GXCGetXMLLocalName(psRepeated->pszValue),
                               static_cast<int>(papsCoords->size()));
        }
    }
}

/************************************************************************/
/*                       CheckGEOLOCInstance()                          */
/*                                                                      */
/*      Content inherited from the base location instance is never      */
/*      rejected, in strict mode neither.                               */
/************************************************************************/

void CheckGEOLOCInstance(const GXCXMLNode *psRoot, GXCCheckContext &oCtxt)
{
    std::vector<const GXCXMLNode *> apsRemarks;
    for (const GXCXMLNode *psChild = psRoot->psChild; psChild != nullptr;
         psChild = psChild->psNext)
    {
        if (psChild->eType == CXT_Element &&
            MatchesName(psChild, GXC_EXT_NAMESPACE,
                        GXC_LOCATION_REMARK_ELEMENT, false))
        {
            apsRemarks.push_back(psChild);
        }
    }

    if (apsRemarks.size() > 1)
    {
        const std::string osRootPath = std::string("/") + psRoot->pszValue;
        oCtxt.AddViolation(GXCViolationType::CardinalityViolated, apsRemarks[1],
                           PRECEDENCE_STRUCTURE,
                           BuildChildPath(osRootPath, psRoot, apsRemarks[1]),
                           "%s occurs %d times, at most once is allowed",
                           GXC_LOCATION_REMARK_ELEMENT,
                           static_cast<int>(apsRemarks.size()));
    }
}

}  // namespace

/************************************************************************/
/*                      GXCGetViolationTypeName()                       */
/************************************************************************/

const char *GXCGetViolationTypeName(GXCViolationType eType)
{
    switch (eType)
    {
        case GXCViolationType::FixedValueMismatch:
            return "FixedValueMismatch";
        case GXCViolationType::ExclusiveChoiceViolated:
            return "ExclusiveChoiceViolated";
        case GXCViolationType::CardinalityViolated:
            return "CardinalityViolated";
        case GXCViolationType::UnexpectedContent:
            return "UnexpectedContent";
    }
    return "";
}

/************************************************************************/
/*                       GXCViolation::operator==()                     */
/************************************************************************/

bool GXCViolation::operator==(const GXCViolation &other) const
{
    return eType == other.eType && osPath == other.osPath &&
           osMessage == other.osMessage &&
           nDocumentOrder == other.nDocumentOrder &&
           nPrecedence == other.nPrecedence;
}

/************************************************************************/
/*                        GXCVerdict::ToString()                        */
/************************************************************************/

/** Render one "<ViolationName>: <path>: <message>" line per violation.
 * An empty string is returned for a conforming fragment. */
std::string GXCVerdict::ToString() const
{
    std::string osRet;
    for (const auto &oViolation : aoViolations)
    {
        osRet += GXCGetViolationTypeName(oViolation.eType);
        osRet += ": ";
        osRet += oViolation.osPath;
        osRet += ": ";
        osRet += oViolation.osMessage;
        osRet += '\n';
    }
    return osRet;
}

bool GXCVerdict::operator==(const GXCVerdict &other) const
{
    return bOK == other.bOK && aoViolations == other.aoViolations;
}

/************************************************************************/
/*                       GXCConformanceChecker()                        */
/************************************************************************/

/** Construct a checker using the global substitution registry, in strict
 * mode if the GXC_STRICT_RESTRICTION configuration option is set to YES. */
GXCConformanceChecker::GXCConformanceChecker()
    : GXCConformanceChecker(
          GXCTestBool(GXCGetConfigOption("GXC_STRICT_RESTRICTION", "NO")))
{
}

GXCConformanceChecker::GXCConformanceChecker(bool bStrict)
    : GXCConformanceChecker(GXCGlobalSubstitutionRegistry::GetSingleton(),
                            bStrict)
{
}

GXCConformanceChecker::GXCConformanceChecker(
    const GXCSubstitutionGroupRegistry &oRegistry, bool bStrict)
    : m_poRegistry(&oRegistry), m_bStrict(bStrict)
{
}

/************************************************************************/
/*                               Check()                                */
/************************************************************************/

/**
 * Check a fragment against the extension type named pszTypeName.
 *
 * @param psFragment root element of the fragment.
 * @param pszTypeName "Point_WGS84E_3D" or "GEOLOCInstance" (or the schema
 * type names "PointType_WGS84E_3D" and "GEOLOCInstanceType").
 * @param oVerdict receives the verdict.
 * @return true if the check could be carried out.
 */
bool GXCConformanceChecker::Check(const GXCXMLNode *psFragment,
                                  const char *pszTypeName,
                                  GXCVerdict &oVerdict) const
{
    oVerdict = GXCVerdict();

    GXCExtensionType eType = GXCExtensionType::Point_WGS84E_3D;
    if (!GXCGetExtensionTypeFromName(pszTypeName, eType))
    {
        GXCError(CE_Failure, GXCE_UnknownType,
                 "Unknown extension type '%s'. Expected Point_WGS84E_3D or "
                 "GEOLOCInstance",
                 pszTypeName ? pszTypeName : "(null)");
        return false;
    }
    return Check(psFragment, eType, oVerdict);
}

bool GXCConformanceChecker::Check(const GXCXMLNode *psFragment,
                                  GXCExtensionType eType,
                                  GXCVerdict &oVerdict) const
{
    oVerdict = GXCVerdict();

    if (psFragment == nullptr)
    {
        GXCError(CE_Failure, GXCE_MalformedInput, "Null fragment");
        return false;
    }
    if (psFragment->eType != CXT_Element)
    {
        GXCError(CE_Failure, GXCE_MalformedInput,
                 "Fragment root is not an element");
        return false;
    }

    GXCCheckContext oCtxt(m_bStrict);
    if (!oCtxt.IndexTree(psFragment))
        return false;

    GXCDebug("GXC", "Checking %s against %s (%s)", psFragment->pszValue,
             GXCGetExtensionTypeName(eType), m_bStrict ? "strict" : "lenient");

    switch (eType)
    {
        case GXCExtensionType::Point_WGS84E_3D:
            CheckPoint(psFragment, oCtxt);
            break;
        case GXCExtensionType::GEOLOCInstance:
            CheckGEOLOCInstance(psFragment, oCtxt);
            break;
    }

    oVerdict.aoViolations = oCtxt.TakeViolations();
    oVerdict.bOK = oVerdict.aoViolations.empty();

    GXCDebug("GXC", "%s: %d violation(s)", GXCGetExtensionTypeName(eType),
             static_cast<int>(oVerdict.aoViolations.size()));
    return true;
}

/************************************************************************/
/*                           CheckElement()                             */
/************************************************************************/

/**
 * Check an element against the extension type it is registered with.
 *
 * The type is resolved from the element name through the substitution
 * group registry. In strict mode the namespace URI must match too.
 */
bool GXCConformanceChecker::CheckElement(const GXCXMLNode *psElement,
                                         GXCVerdict &oVerdict) const
{
    oVerdict = GXCVerdict();

    if (psElement == nullptr || psElement->eType != CXT_Element ||
        psElement->pszValue == nullptr || psElement->pszValue[0] == '\0')
    {
        GXCError(CE_Failure, GXCE_MalformedInput,
                 "Fragment root is not a named element");
        return false;
    }

    const char *pszNamespace = nullptr;
    if (m_bStrict)
        pszNamespace = psElement->pszNamespace ? psElement->pszNamespace : "";

    const GXCSubstitutionGroupRegistry::MemberInfo *psInfo =
        m_poRegistry->Resolve(pszNamespace,
                              GXCGetXMLLocalName(psElement->pszValue));
    if (psInfo == nullptr)
    {
        GXCError(CE_Failure, GXCE_UnknownType,
                 "Element %s is not a registered extension element",
                 psElement->pszValue);
        return false;
    }
    return Check(psElement, psInfo->m_eType, oVerdict);
}
