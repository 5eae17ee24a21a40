#ifndef SVG_DOCUMENT_HPP
#define SVG_DOCUMENT_HPP

#include "stego_error.hpp"

#include <libxml/tree.h>

#include <cstddef>
#include <string>
#include <vector>

namespace svgstego {

    // 一个 element 的句柄：libxml2 节点 + 在整个文档里的先序位置
    struct SvgElement {
        xmlNodePtr node;
        size_t     order;
    };

    // Owns one parsed SVG tree. Only SVG 1.0 / 1.1 documents (by DOCTYPE
    // system id) are accepted.
    class SvgDocument
    {
      public:
        SvgDocument();
        ~SvgDocument();

        SvgDocument(const SvgDocument&) = delete;
        SvgDocument& operator=(const SvgDocument&) = delete;

        bool loadFile(const std::string& path, StegoError& outError);
        bool loadMemory(const std::string& text, StegoError& outError);

        // Inputs larger than this are rejected as InvalidFile before parsing.
        // Capped at INT_MAX, the most libxml2 accepts in one buffer.
        void setSizeLimit(size_t bytes);
        size_t sizeLimit() const { return _sizeLimit; }

        bool serialize(std::string& outText) const;

        bool isLoaded() const { return _doc != nullptr; }

        std::string doctypeSystemId() const;

        // Elements with the given local name, in document order. Only
        // un-namespaced elements and elements in the SVG namespace match.
        std::vector<SvgElement> elementsByTag(const std::string& tag) const;

        size_t elementCount() const { return _elements.size(); }

        bool hasAttribute(const SvgElement& element, const std::string& name) const;
        bool getAttribute(const SvgElement& element, const std::string& name,
                          std::string& outValue) const;
        bool setAttribute(const SvgElement& element, const std::string& name,
                          const std::string& value);

      private:
        bool parse(const std::string& text, const std::string& source, StegoError& outError);
        bool adopt(xmlDocPtr doc, const std::string& source, StegoError& outError);
        void release();
        void indexElements(xmlNodePtr node);

        xmlDocPtr               _doc;
        std::vector<xmlNodePtr> _elements; // 先序遍历顺序
        size_t                  _sizeLimit;
    };

}

#endif // SVG_DOCUMENT_HPP
