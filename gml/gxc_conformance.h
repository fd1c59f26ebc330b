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

#ifndef GXC_CONFORMANCE_H_INCLUDED
#define GXC_CONFORMANCE_H_INCLUDED

#include "gxc_extension_types.h"
#include "gxc_minixml.h"

#include <string>
#include <vector>

class GXCSubstitutionGroupRegistry;

/** Kind of constraint a fragment fails to satisfy. */
enum class GXCViolationType
{
    /** An attribute does not carry its fixed value */
    FixedValueMismatch,
    /** Not exactly one of a set of exclusive alternatives is present */
    ExclusiveChoiceViolated,
    /** An element occurs more, or fewer, times than allowed */
    CardinalityViolated,
    /** An element not permitted by the restricted type (strict mode only) */
    UnexpectedContent
};

const char GXC_DLL *GXCGetViolationTypeName(GXCViolationType eType);

/** A constraint violation found in a fragment. */
struct GXC_DLL GXCViolation
{
    GXCViolationType eType = GXCViolationType::FixedValueMismatch;

    /** Location of the offending node, e.g. "/gsip:Point_WGS84E_3D/@srsName" */
    std::string osPath{};

    std::string osMessage{};

    /** Preorder rank of the offending node in the fragment */
    int nDocumentOrder = 0;

    /** 0 for attribute checks, 1 for child structure checks */
    int nPrecedence = 0;

    bool operator==(const GXCViolation &other) const;
    bool operator!=(const GXCViolation &other) const
    {
        return !(*this == other);
    }
};

/** Result of a conformance check. */
struct GXC_DLL GXCVerdict
{
    /** true when aoViolations is empty after a successful check */
    bool bOK = false;

    /** Violations in document order, attribute checks first on ties */
    std::vector<GXCViolation> aoViolations{};

    std::string ToString() const;

    bool operator==(const GXCVerdict &other) const;
    bool operator!=(const GXCVerdict &other) const
    {
        return !(*this == other);
    }
};

/************************************************************************/
/*                        GXCConformanceChecker                         */
/************************************************************************/

/**
 * Checks fragments against the declared extension types.
 *
 * A checker holds no mutable state: its settings are fixed at construction
 * and Check() may be called concurrently on the same instance.
 *
 * Check() returns false, after emitting a CE_Failure error, only when the
 * check cannot be carried out (GXCE_UnknownType or GXCE_MalformedInput). In
 * that case the verdict is left empty. Otherwise it returns true and
 * oVerdict.bOK tells whether the fragment conforms.
 */
class GXC_DLL GXCConformanceChecker
{
  public:
    GXCConformanceChecker();
    explicit GXCConformanceChecker(bool bStrict);
    GXCConformanceChecker(const GXCSubstitutionGroupRegistry &oRegistry,
                          bool bStrict);

    /** Whether restricted content is checked strictly. */
    bool IsStrict() const
    {
        return m_bStrict;
    }

    bool Check(const GXCXMLNode *psFragment, const char *pszTypeName,
               GXCVerdict &oVerdict) const;
    bool Check(const GXCXMLNode *psFragment, GXCExtensionType eType,
               GXCVerdict &oVerdict) const;

    bool CheckElement(const GXCXMLNode *psElement, GXCVerdict &oVerdict) const;

  private:
    const GXCSubstitutionGroupRegistry *m_poRegistry;
    bool m_bStrict;
};

#endif /* GXC_CONFORMANCE_H_INCLUDED */
