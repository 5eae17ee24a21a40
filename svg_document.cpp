#include "svg_document.hpp"
#include "stego_config.hpp"

#include <libxml/parser.h>
#include <libxml/xmlerror.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>

namespace svgstego {

    // 不联网，不加载外部 DTD，错误不直接打到 stderr（我们自己打）
    static const int PARSE_OPTIONS = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;

    static const size_t MAX_PARSE_BYTES = static_cast<size_t>(std::numeric_limits<int>::max());

    static const xmlChar* toXml(const std::string& s) {
        return reinterpret_cast<const xmlChar*>(s.c_str());
    }

    SvgDocument::SvgDocument()
        : _doc(nullptr), _sizeLimit(MAX_PARSE_BYTES)
    {
    }

    SvgDocument::~SvgDocument()
    {
        release();
    }

    void SvgDocument::release()
    {
        if (_doc) {
            xmlFreeDoc(_doc);
            _doc = nullptr;
        }
        _elements.clear();
    }

    bool SvgDocument::loadFile(const std::string& path, StegoError& outError)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            std::cerr << "[svg] Failed to open file: " << path << std::endl;
            outError = StegoError::InvalidFile;
            return false;
        }

        std::string text((std::istreambuf_iterator<char>(in)),
                         std::istreambuf_iterator<char>());
        if (in.bad()) {
            std::cerr << "[svg] Failed to read file: " << path << std::endl;
            outError = StegoError::InvalidFile;
            return false;
        }

        return parse(text, path, outError);
    }

    bool SvgDocument::loadMemory(const std::string& text, StegoError& outError)
    {
        return parse(text, "<memory>", outError);
    }

    void SvgDocument::setSizeLimit(size_t bytes)
    {
        _sizeLimit = std::min(bytes, MAX_PARSE_BYTES);
    }

    bool SvgDocument::parse(const std::string& text, const std::string& source,
                            StegoError& outError)
    {
        release();

        // xmlReadMemory 的长度是 int
        if (text.size() > _sizeLimit) {
            std::cerr << "[svg] File too large: " << source << " (" << text.size()
                      << " bytes, limit " << _sizeLimit << ")" << std::endl;
            outError = StegoError::InvalidFile;
            return false;
        }

        xmlResetLastError();
        xmlDocPtr doc = xmlReadMemory(text.data(), static_cast<int>(text.size()),
                                      source.c_str(), nullptr, PARSE_OPTIONS);
        return adopt(doc, source, outError);
    }

    bool SvgDocument::adopt(xmlDocPtr doc, const std::string& source, StegoError& outError)
    {
        if (!doc) {
            const xmlError* err = xmlGetLastError();
            std::cerr << "[svg] Not well-formed XML: " << source;
            if (err && err->message) {
                // libxml2 messages already end with '\n'
                std::cerr << " (line " << err->line << "): " << err->message;
            } else {
                std::cerr << std::endl;
            }
            outError = StegoError::InvalidDocument;
            return false;
        }

        _doc = doc;

        std::string systemId = doctypeSystemId();
        const std::vector<std::string>& valid = validDoctypes();
        if (std::find(valid.begin(), valid.end(), systemId) == valid.end()) {
            if (systemId.empty()) {
                std::cerr << "[svg] Missing SVG doctype: " << source << std::endl;
            } else {
                std::cerr << "[svg] Unrecognized doctype '" << systemId << "': "
                          << source << std::endl;
            }
            release();
            outError = StegoError::InvalidDocument;
            return false;
        }

        indexElements(xmlDocGetRootElement(_doc));
        outError = StegoError::None;
        return true;
    }

    void SvgDocument::indexElements(xmlNodePtr node)
    {
        for (xmlNodePtr cur = node; cur; cur = cur->next) {
            if (cur->type != XML_ELEMENT_NODE) {
                continue;
            }
            _elements.push_back(cur);
            indexElements(cur->children);
        }
    }

    bool SvgDocument::serialize(std::string& outText) const
    {
        outText.clear();
        if (!_doc) {
            std::cerr << "[svg] serialize called on empty document\n";
            return false;
        }

        xmlChar* buf = nullptr;
        int size = 0;
        xmlDocDumpMemoryEnc(_doc, &buf, &size, "UTF-8");
        if (!buf) {
            std::cerr << "[svg] xmlDocDumpMemoryEnc failed\n";
            return false;
        }

        outText.assign(reinterpret_cast<const char*>(buf), static_cast<size_t>(size));
        xmlFree(buf);
        return true;
    }

    std::string SvgDocument::doctypeSystemId() const
    {
        if (!_doc) {
            return std::string();
        }
        xmlDtdPtr dtd = xmlGetIntSubset(_doc);
        if (!dtd || !dtd->SystemID) {
            return std::string();
        }
        return std::string(reinterpret_cast<const char*>(dtd->SystemID));
    }

    std::vector<SvgElement> SvgDocument::elementsByTag(const std::string& tag) const
    {
        std::vector<SvgElement> found;
        for (size_t i = 0; i < _elements.size(); ++i) {
            xmlNodePtr node = _elements[i];
            // 别的 namespace 里同名的元素（foo:path）不算
            if (node->ns && !xmlStrEqual(node->ns->href, toXml(SVG_NAMESPACE))) {
                continue;
            }
            if (xmlStrEqual(node->name, toXml(tag))) {
                found.push_back(SvgElement{ node, i });
            }
        }
        return found;
    }

    // 只看元素上真正写出来的、无 namespace 的属性（不算 DTD 默认值）
    static xmlAttrPtr findAttribute(xmlNodePtr node, const std::string& name)
    {
        for (xmlAttrPtr attr = node->properties; attr; attr = attr->next) {
            if (attr->ns == nullptr && xmlStrEqual(attr->name, toXml(name))) {
                return attr;
            }
        }
        return nullptr;
    }

    bool SvgDocument::hasAttribute(const SvgElement& element, const std::string& name) const
    {
        return findAttribute(element.node, name) != nullptr;
    }

    bool SvgDocument::getAttribute(const SvgElement& element, const std::string& name,
                                   std::string& outValue) const
    {
        outValue.clear();
        xmlAttrPtr attr = findAttribute(element.node, name);
        if (!attr) {
            return false;
        }
        xmlChar* value = xmlNodeListGetString(_doc, attr->children, 1);
        if (value) {
            outValue.assign(reinterpret_cast<const char*>(value));
            xmlFree(value);
        }
        return true;
    }

    bool SvgDocument::setAttribute(const SvgElement& element, const std::string& name,
                                   const std::string& value)
    {
        if (!xmlSetNsProp(element.node, nullptr, toXml(name), toXml(value))) {
            std::cerr << "[svg] Failed to set attribute " << name << std::endl;
            return false;
        }
        return true;
    }

}
