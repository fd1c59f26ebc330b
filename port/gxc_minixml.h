/**********************************************************************
 *
 * Project:  GXC - GSIP eXtension Conformance
 * Purpose:  Declarations for the namespace aware XML node tree.
 * Author:   GXC contributors
 *
 **********************************************************************
 * Copyright (c) 2024, GXC contributors
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#ifndef GXC_MINIXML_H_INCLUDED
#define GXC_MINIXML_H_INCLUDED

#include "gxc_port.h"

#include <memory>
#include <string>

/**
 * \file gxc_minixml.h
 *
 * Definitions for the XML document tree consumed by the conformance
 * checker. Parsing is delegated to expat; this module only turns its
 * callbacks into a tree of GXCXMLNode.
 */

/** XML node type */
typedef enum
{
    /*! Node is an element */ CXT_Element = 0,
    /*! Node is a raw text value */ CXT_Text = 1,
    /*! Node is attribute */ CXT_Attribute = 2,
    /*! Node is an XML comment. */ CXT_Comment = 3,
    /*! Node is a special literal */ CXT_Literal = 4
} GXCXMLNodeType;

/**
 * Document node structure.
 *
 * This C structure is used to hold a single text fragment representing a
 * component of the document when parsed.
 *
 * Attributes of an element are stored as CXT_Attribute children that
 * precede the other children, each one holding its value in a single
 * CXT_Text child.
 */
typedef struct GXCXMLNode
{
    /**
     * \brief Node type
     *
     * One of CXT_Element, CXT_Text, CXT_Attribute, CXT_Comment,
     * or CXT_Literal.
     */
    GXCXMLNodeType eType;

    /**
     * \brief Node value
     *
     * For CXT_Element and CXT_Attribute this is the qualified name as it
     * appears in the document ("gml:pos"), for CXT_Text the text itself.
     */
    char *pszValue;

    /**
     * \brief Namespace URI
     *
     * Namespace URI of an element or attribute, or nullptr if the name is
     * not in a namespace. Always nullptr for other node types.
     */
    char *pszNamespace;

    /**
     * \brief Next sibling.
     */
    struct GXCXMLNode *psNext;

    /**
     * \brief Child node.
     */
    struct GXCXMLNode *psChild;
} GXCXMLNode;

GXCXMLNode GXC_DLL *GXCParseXMLString(const char *);
GXCXMLNode GXC_DLL *GXCParseXMLFile(const char *pszFilename);
void GXC_DLL GXCDestroyXMLNode(GXCXMLNode *);

GXCXMLNode GXC_DLL *GXCCreateXMLNode(GXCXMLNode *poParent,
                                     GXCXMLNodeType eType,
                                     const char *pszText);
GXCXMLNode GXC_DLL *GXCCreateXMLNodeNS(GXCXMLNode *poParent,
                                       GXCXMLNodeType eType,
                                       const char *pszNamespace,
                                       const char *pszQualifiedName);
GXCXMLNode GXC_DLL *GXCCreateXMLElementAndValue(GXCXMLNode *psParent,
                                                const char *pszName,
                                                const char *pszValue);
void GXC_DLL GXCAddXMLAttributeAndValue(GXCXMLNode *psParent,
                                        const char *pszName,
                                        const char *pszValue);
void GXC_DLL GXCAddXMLChild(GXCXMLNode *psParent, GXCXMLNode *psChild);

GXCXMLNode GXC_DLL *GXCGetXMLNode(GXCXMLNode *poRoot, const char *pszPath);
const GXCXMLNode GXC_DLL *GXCGetXMLNode(const GXCXMLNode *poRoot,
                                        const char *pszPath);
const char GXC_DLL *GXCGetXMLValue(const GXCXMLNode *poRoot,
                                   const char *pszPath,
                                   const char *pszDefault);
const char GXC_DLL *GXCGetXMLLocalName(const char *pszQualifiedName);
std::string GXC_DLL GXCGetXMLText(const GXCXMLNode *psElement);

/*! @cond Doxygen_Suppress */
struct GXC_DLL GXCXMLTreeCloserDeleter
{
    void operator()(GXCXMLNode *psNode) const
    {
        GXCDestroyXMLNode(psNode);
    }
};

/*! @endcond */

/** Manage a tree of XML nodes so that all nodes are freed when the instance
 * goes out of scope.  Only the top level node should be in a
 * GXCXMLTreeCloser.
 */
class GXC_DLL GXCXMLTreeCloser
    : public std::unique_ptr<GXCXMLNode, GXCXMLTreeCloserDeleter>
{
  public:
    /** Constructor */
    explicit GXCXMLTreeCloser(GXCXMLNode *data)
        : std::unique_ptr<GXCXMLNode, GXCXMLTreeCloserDeleter>(data)
    {
    }

    /** Returns a pointer to the document (root) element
     * @return the node pointer */
    GXCXMLNode *getDocumentElement();
};

#endif /* GXC_MINIXML_H_INCLUDED */
