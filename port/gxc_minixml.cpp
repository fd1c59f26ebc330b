/**********************************************************************
 *
 * Project:  GXC - GSIP eXtension Conformance
 * Purpose:  Namespace aware XML node tree built from expat callbacks.
 * Author:   GXC contributors
 *
 **********************************************************************
 * Copyright (c) 2024, GXC contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "gxc_minixml.h"

#include <cstdlib>
#include <cstring>

#include <fstream>
#include <sstream>
#include <vector>

#include "gxc_error.h"
#include "gxc_expat.h"
#include "gxc_string.h"

/************************************************************************/
/*                            GXCXMLStrdup()                            */
/************************************************************************/

static char *GXCXMLStrdup(const char *pszString)
{
    if (pszString == nullptr)
        pszString = "";
    char *pszRet = strdup(pszString);
    if (pszRet == nullptr)
    {
        GXCError(CE_Fatal, GXCE_OutOfMemory,
                 "GXCXMLStrdup(): Out of memory allocating %d bytes.",
                 static_cast<int>(strlen(pszString)));
    }
    return pszRet;
}

/************************************************************************/
/*                         GXCCreateXMLNodeNS()                         */
/************************************************************************/

/**
 * \brief Create a node in a namespace.
 *
 * Same as GXCCreateXMLNode(), but the node also records the namespace
 * URI of its name.
 *
 * @param poParent the parent to which this node should be attached as a
 * child. May be nullptr to keep as free standing.
 * @param eType the type of the newly created node
 * @param pszNamespace namespace URI, or nullptr.
 * @param pszQualifiedName the name (or text) of the node.
 *
 * @return the newly created node, now owned by the caller (or parent node).
 */

GXCXMLNode *GXCCreateXMLNodeNS(GXCXMLNode *poParent, GXCXMLNodeType eType,
                               const char *pszNamespace,
                               const char *pszQualifiedName)
{
    GXCXMLNode *psNode =
        static_cast<GXCXMLNode *>(calloc(1, sizeof(GXCXMLNode)));
    if (psNode == nullptr)
    {
        GXCError(CE_Fatal, GXCE_OutOfMemory,
                 "GXCCreateXMLNode(): Out of memory allocating a node.");
        return nullptr;
    }

    psNode->eType = eType;
    psNode->pszValue = GXCXMLStrdup(pszQualifiedName);
    if (pszNamespace != nullptr &&
        (eType == CXT_Element || eType == CXT_Attribute))
        psNode->pszNamespace = GXCXMLStrdup(pszNamespace);

    if (poParent != nullptr)
        GXCAddXMLChild(poParent, psNode);

    return psNode;
}

/************************************************************************/
/*                          GXCCreateXMLNode()                          */
/************************************************************************/

/**
 * \brief Create a document tree item.
 *
 * Create a single node, and optionally attach it to a parent.
 *
 * @param poParent the parent to which this node should be attached as a
 * child. May be nullptr to keep as free standing.
 * @param eType the type of the newly created node
 * @param pszText the value of the newly created node
 *
 * @return the newly created node, now owned by the caller (or parent node).
 */

GXCXMLNode *GXCCreateXMLNode(GXCXMLNode *poParent, GXCXMLNodeType eType,
                             const char *pszText)
{
    return GXCCreateXMLNodeNS(poParent, eType, nullptr, pszText);
}

/************************************************************************/
/*                           GXCAddXMLChild()                           */
/************************************************************************/

/**
 * \brief Add child node to parent.
 *
 * The passed child is added to the list of children of the indicated
 * parent.  Normally the child is added at the end of the parents child
 * list, but attributes (CXT_Attribute) will be inserted after any other
 * attributes but before any other element type.  Ownership of the child
 * node is effectively assumed by the parent node.
 *
 * @param psParent the node to attach the child to.  May not be nullptr.
 *
 * @param psChild the child to add to the parent.  May not be nullptr.
 */

void GXCAddXMLChild(GXCXMLNode *psParent, GXCXMLNode *psChild)
{
    if (psParent->psChild == nullptr)
    {
        psParent->psChild = psChild;
        return;
    }

    // Insert at head of list if first child is not attribute.
    if (psChild->eType == CXT_Attribute &&
        psParent->psChild->eType != CXT_Attribute)
    {
        psChild->psNext = psParent->psChild;
        psParent->psChild = psChild;
        return;
    }

    // Search for end of list.
    GXCXMLNode *psSib = psParent->psChild;
    for (; psSib->psNext != nullptr; psSib = psSib->psNext)
    {
        // Insert attributes if the next node is not an attribute.
        if (psChild->eType == CXT_Attribute && psSib->psNext != nullptr &&
            psSib->psNext->eType != CXT_Attribute)
        {
            psChild->psNext = psSib->psNext;
            psSib->psNext = psChild;
            return;
        }
    }

    psSib->psNext = psChild;
}

/************************************************************************/
/*                    GXCCreateXMLElementAndValue()                     */
/************************************************************************/

/**
 * \brief Create an element and text value.
 *
 * This function creates an element and a single text child. It is
 * equivalent to the following:
 *
 * \code
 *     GXCXMLNode *psTextNode;
 *     GXCXMLNode *psElementNode;
 *
 *     psElementNode = GXCCreateXMLNode( psParent, CXT_Element, pszName );
 *     psTextNode = GXCCreateXMLNode( psElementNode, CXT_Text, pszValue );
 *
 *     return psElementNode;
 * \endcode
 *
 * @param psParent the parent node to which the resulting node should
 * be attached.  May be nullptr to keep as freestanding.
 * @param pszName the element name to create.
 * @param pszValue the text to attach to the element. Must not be nullptr.
 *
 * @return the pointer to the new element node.
 */

GXCXMLNode *GXCCreateXMLElementAndValue(GXCXMLNode *psParent,
                                        const char *pszName,
                                        const char *pszValue)
{
    GXCXMLNode *psElementNode =
        GXCCreateXMLNode(psParent, CXT_Element, pszName);
    GXCCreateXMLNode(psElementNode, CXT_Text, pszValue);

    return psElementNode;
}

/************************************************************************/
/*                     GXCAddXMLAttributeAndValue()                     */
/************************************************************************/

/**
 * \brief Create an attribute and text value.
 *
 * @param psParent the parent node to which the resulting node should
 * be attached.  Must not be nullptr.
 * @param pszName the attribute name to create.
 * @param pszValue the text to attach to the attribute. Must not be nullptr.
 */

void GXCAddXMLAttributeAndValue(GXCXMLNode *psParent, const char *pszName,
                                const char *pszValue)
{
    GXCXMLNode *psAttributeNode =
        GXCCreateXMLNode(psParent, CXT_Attribute, pszName);
    GXCCreateXMLNode(psAttributeNode, CXT_Text, pszValue);
}

/************************************************************************/
/*                         GXCDestroyXMLNode()                          */
/************************************************************************/

/**
 * \brief Destroy a tree.
 *
 * This function frees resources associated with a GXCXMLNode and all its
 * children nodes.
 *
 * @param psNode the tree to free.
 */

void GXCDestroyXMLNode(GXCXMLNode *psNode)
{
    while (psNode != nullptr)
    {
        free(psNode->pszValue);
        free(psNode->pszNamespace);

        if (psNode->psChild != nullptr)
        {
            GXCXMLNode *psNext = psNode->psNext;
            psNode->psNext = psNode->psChild;
            // Move the child and its siblings as the next
            // siblings of the current node.
            if (psNext != nullptr)
            {
                GXCXMLNode *psIter = psNode->psChild;
                while (psIter->psNext != nullptr)
                    psIter = psIter->psNext;
                psIter->psNext = psNext;
            }
        }

        GXCXMLNode *psNext = psNode->psNext;

        free(psNode);

        psNode = psNext;
    }
}

/************************************************************************/
/*                         GXCGetXMLLocalName()                         */
/*                                                                      */
/*      Returns the passed name with any namespace prefix stripped      */
/*      off.                                                            */
/************************************************************************/

const char *GXCGetXMLLocalName(const char *pszQualifiedName)
{
    const char *pszReturn = strchr(pszQualifiedName, ':');
    if (pszReturn == nullptr)
        return pszQualifiedName;
    return pszReturn + 1;
}

/************************************************************************/
/*                           GXCGetXMLNode()                            */
/************************************************************************/

/**
 * \brief Find node by path.
 *
 * Searches the document or subdocument indicated by psRoot for an element
 * (or attribute) with the given path.  The path should consist of a set of
 * element names separated by dots, not including the name of the root
 * element (psRoot).  If the requested element is not found nullptr is
 * returned.
 *
 * A path component without a namespace prefix matches a node by its local
 * name, whatever its prefix. A prefixed component must match exactly.
 *
 * @param psRoot the subtree in which to search.  nullptr is safe.
 * @param pszPath the list of element names in the path (dot separated).
 *
 * @return the requested element node, or nullptr if not found.
 */

const GXCXMLNode *GXCGetXMLNode(const GXCXMLNode *psRoot, const char *pszPath)
{
    if (psRoot == nullptr || pszPath == nullptr)
        return nullptr;

    std::istringstream oStream(pszPath);
    std::string osToken;
    while (psRoot != nullptr && std::getline(oStream, osToken, '.'))
    {
        const bool bBare = osToken.find(':') == std::string::npos;
        const GXCXMLNode *psChild = psRoot->psChild;
        for (; psChild != nullptr; psChild = psChild->psNext)
        {
            if (psChild->eType == CXT_Text || psChild->eType == CXT_Comment)
                continue;
            const char *pszName = bBare ? GXCGetXMLLocalName(psChild->pszValue)
                                        : psChild->pszValue;
            if (EQUAL(osToken.c_str(), pszName))
                break;
        }

        psRoot = psChild;
    }

    return psRoot;
}

GXCXMLNode *GXCGetXMLNode(GXCXMLNode *psRoot, const char *pszPath)
{
    return const_cast<GXCXMLNode *>(
        GXCGetXMLNode(static_cast<const GXCXMLNode *>(psRoot), pszPath));
}

/************************************************************************/
/*                           GXCGetXMLValue()                           */
/************************************************************************/

/**
 * \brief Fetch element/attribute value.
 *
 * Searches the document for the element/attribute value associated with
 * the path.  The corresponding node is internally found with GXCGetXMLNode()
 * (see there for details on path handling).  Once found, the value is
 * considered to be the first CXT_Text child of the node.
 *
 * @param psRoot the subtree in which to search.  nullptr is safe.
 * @param pszPath the list of element names in the path (dot separated).  An
 * empty path means get the value of the psRoot node.
 * @param pszDefault the value to return if a corresponding value is not
 * found, may be nullptr.
 *
 * @return the requested value or pszDefault if not found.
 */

const char *GXCGetXMLValue(const GXCXMLNode *psRoot, const char *pszPath,
                           const char *pszDefault)
{
    const GXCXMLNode *psTarget = nullptr;

    if (pszPath == nullptr || *pszPath == '\0')
        psTarget = psRoot;
    else
        psTarget = GXCGetXMLNode(psRoot, pszPath);

    if (psTarget == nullptr)
        return pszDefault;

    if (psTarget->eType == CXT_Attribute)
    {
        if (psTarget->psChild == nullptr ||
            psTarget->psChild->eType != CXT_Text)
            return pszDefault;
        return psTarget->psChild->pszValue;
    }

    if (psTarget->eType == CXT_Element)
    {
        // Find first non-attribute child, and verify it is a single text
        // with no siblings.
        psTarget = psTarget->psChild;

        while (psTarget != nullptr && psTarget->eType == CXT_Attribute)
            psTarget = psTarget->psNext;

        if (psTarget != nullptr && psTarget->eType == CXT_Text &&
            psTarget->psNext == nullptr)
            return psTarget->pszValue;
    }

    return pszDefault;
}

/************************************************************************/
/*                           GXCGetXMLText()                            */
/************************************************************************/

/** Return the concatenation of the text children of an element. */
std::string GXCGetXMLText(const GXCXMLNode *psElement)
{
    std::string osText;
    if (psElement == nullptr)
        return osText;

    for (const GXCXMLNode *psChild = psElement->psChild; psChild != nullptr;
         psChild = psChild->psNext)
    {
        if (psChild->eType == CXT_Text && psChild->pszValue != nullptr)
            osText += psChild->pszValue;
    }
    return osText;
}

/************************************************************************/
/*                  GXCXMLTreeCloser::getDocumentElement()              */
/************************************************************************/

GXCXMLNode *GXCXMLTreeCloser::getDocumentElement()
{
    GXCXMLNode *doc = get();
    // skip the XML declaration or any other leading non element node
    while (doc != nullptr && doc->eType != CXT_Element)
        doc = doc->psNext;
    return doc;
}

/************************************************************************/
/* ==================================================================== */
/*                     Tree building from expat                         */
/* ==================================================================== */
/************************************************************************/

namespace
{

struct GXCXMLParseContext
{
    GXCXMLNode *psRoot = nullptr;
    std::vector<GXCXMLNode *> apsStack{};
    std::string osPendingText{};
};

/* Split an expat "uri local prefix" triplet into namespace and
 * qualified name. */
void SplitExpatName(const char *pszExpatName, std::string &osNamespace,
                    std::string &osQualifiedName, bool &bHasNamespace)
{
    const char *pszSep1 = strchr(pszExpatName, GXC_EXPAT_NS_SEPARATOR);
    if (pszSep1 == nullptr)
    {
        bHasNamespace = false;
        osNamespace.clear();
        osQualifiedName = pszExpatName;
        return;
    }

    bHasNamespace = true;
    osNamespace.assign(pszExpatName, pszSep1 - pszExpatName);
    const char *pszLocal = pszSep1 + 1;
    const char *pszSep2 = strchr(pszLocal, GXC_EXPAT_NS_SEPARATOR);
    if (pszSep2 == nullptr)
    {
        osQualifiedName = pszLocal;
    }
    else
    {
        osQualifiedName = pszSep2 + 1;
        osQualifiedName += ':';
        osQualifiedName.append(pszLocal, pszSep2 - pszLocal);
    }
}

void FlushPendingText(GXCXMLParseContext *psCtxt)
{
    if (!psCtxt->apsStack.empty() &&
        !GXCStripWhitespace(psCtxt->osPendingText).empty())
    {
        GXCCreateXMLNode(psCtxt->apsStack.back(), CXT_Text,
                         psCtxt->osPendingText.c_str());
    }
    psCtxt->osPendingText.clear();
}

void XMLCALL StartElementCbk(void *pUserData, const char *pszName,
                             const char **ppszAttr)
{
    GXCXMLParseContext *psCtxt = static_cast<GXCXMLParseContext *>(pUserData);
    FlushPendingText(psCtxt);

    std::string osNamespace;
    std::string osQualifiedName;
    bool bHasNamespace = false;
    SplitExpatName(pszName, osNamespace, osQualifiedName, bHasNamespace);

    GXCXMLNode *psParent =
        psCtxt->apsStack.empty() ? nullptr : psCtxt->apsStack.back();
    GXCXMLNode *psElement = GXCCreateXMLNodeNS(
        psParent, CXT_Element, bHasNamespace ? osNamespace.c_str() : nullptr,
        osQualifiedName.c_str());
    if (psParent == nullptr)
        psCtxt->psRoot = psElement;

    for (int i = 0; ppszAttr[i] != nullptr; i += 2)
    {
        SplitExpatName(ppszAttr[i], osNamespace, osQualifiedName,
                       bHasNamespace);
        GXCXMLNode *psAttr = GXCCreateXMLNodeNS(
            psElement, CXT_Attribute,
            bHasNamespace ? osNamespace.c_str() : nullptr,
            osQualifiedName.c_str());
        GXCCreateXMLNode(psAttr, CXT_Text, ppszAttr[i + 1]);
    }

    psCtxt->apsStack.push_back(psElement);
}

void XMLCALL EndElementCbk(void *pUserData, const char * /* pszName */)
{
    GXCXMLParseContext *psCtxt = static_cast<GXCXMLParseContext *>(pUserData);
    FlushPendingText(psCtxt);
    if (!psCtxt->apsStack.empty())
        psCtxt->apsStack.pop_back();
}

void XMLCALL DataHandlerCbk(void *pUserData, const char *data, int nLen)
{
    GXCXMLParseContext *psCtxt = static_cast<GXCXMLParseContext *>(pUserData);
    if (psCtxt->apsStack.empty())
        return;
    psCtxt->osPendingText.append(data, nLen);
}

}  // namespace

/************************************************************************/
/*                         GXCParseXMLString()                          */
/************************************************************************/

/**
 * \brief Parse an XML string into tree form.
 *
 * The passed document is parsed by expat in namespace aware mode, and
 * the root element of the resulting tree is returned. Whitespace-only
 * text, comments and processing instructions are dropped.
 *
 * If a parsing error occurs, nullptr is returned and an error is issued
 * with GXCError() using the GXCE_MalformedInput error number.
 *
 * @param pszString the document to parse.
 *
 * @return parsed tree or nullptr on error.
 */

GXCXMLNode *GXCParseXMLString(const char *pszString)
{
    if (pszString == nullptr || *pszString == '\0')
    {
        GXCError(CE_Failure, GXCE_MalformedInput,
                 "GXCParseXMLString() called with empty document.");
        return nullptr;
    }

    GXCExpatUniquePtr oParser(GXCCreateExpatXMLParser(true));
    if (!oParser)
    {
        GXCError(CE_Failure, GXCE_OutOfMemory,
                 "Cannot create XML parser.");
        return nullptr;
    }

    GXCXMLParseContext sCtxt;
    XML_SetUserData(oParser.get(), &sCtxt);
    XML_SetElementHandler(oParser.get(), StartElementCbk, EndElementCbk);
    XML_SetCharacterDataHandler(oParser.get(), DataHandlerCbk);

    const int nLen = static_cast<int>(strlen(pszString));
    if (XML_Parse(oParser.get(), pszString, nLen, XML_TRUE) != XML_STATUS_OK)
    {
        GXCError(CE_Failure, GXCE_MalformedInput,
                 "XML parsing failed: %s at line %d, column %d",
                 XML_ErrorString(XML_GetErrorCode(oParser.get())),
                 static_cast<int>(XML_GetCurrentLineNumber(oParser.get())),
                 static_cast<int>(XML_GetCurrentColumnNumber(oParser.get())));
        GXCDestroyXMLNode(sCtxt.psRoot);
        return nullptr;
    }

    if (sCtxt.psRoot == nullptr)
    {
        GXCError(CE_Failure, GXCE_MalformedInput,
                 "XML document has no root element.");
        return nullptr;
    }

    return sCtxt.psRoot;
}

/************************************************************************/
/*                          GXCParseXMLFile()                           */
/************************************************************************/

/**
 * \brief Parse XML file into tree.
 *
 * The named file is read and parsed with GXCParseXMLString().
 *
 * If the file cannot be read an error is issued with GXCE_OpenFailed
 * and nullptr is returned.
 *
 * @param pszFilename the file to open.
 *
 * @return nullptr on failure, or the document tree on success.
 */

GXCXMLNode *GXCParseXMLFile(const char *pszFilename)
{
    std::ifstream oFile(pszFilename, std::ios::in | std::ios::binary);
    if (!oFile.is_open())
    {
        GXCError(CE_Failure, GXCE_OpenFailed, "Failed to open file %s.",
                 pszFilename);
        return nullptr;
    }

    std::ostringstream oContent;
    oContent << oFile.rdbuf();
    if (oFile.bad())
    {
        GXCError(CE_Failure, GXCE_FileIO, "Failed to read file %s.",
                 pszFilename);
        return nullptr;
    }

    GXCDebug("GXC", "Parsing %s", pszFilename);
    return GXCParseXMLString(oContent.str().c_str());
}
