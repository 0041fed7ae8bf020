#include "dirmirror/detail/html_anchors.hpp"

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

#include <climits>
#include <memory>
#include <mutex>

namespace dirmirror::detail {

namespace {

struct DocDeleter {
    void operator()(xmlDoc* doc) const noexcept {
        if (doc) {
            xmlFreeDoc(doc);
        }
    }
};

void ensureXmlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] { xmlInitParser(); });
}

void collectAnchors(xmlNode* node, std::vector<std::string>& out) {
    for (xmlNode* current = node; current != nullptr; current = current->next) {
        if (current->type == XML_ELEMENT_NODE &&
            xmlStrcasecmp(current->name, reinterpret_cast<const xmlChar*>("a")) == 0) {
            xmlChar* href = xmlGetProp(current, reinterpret_cast<const xmlChar*>("href"));
            if (href) {
                out.emplace_back(reinterpret_cast<const char*>(href));
                xmlFree(href);
            }
        }
        collectAnchors(current->children, out);
    }
}

} // namespace

std::vector<std::string> extractAnchors(std::string_view html, const std::string& base_url) {
    std::vector<std::string> anchors;
    if (html.empty() || html.size() > static_cast<std::size_t>(INT_MAX)) {
        return anchors;
    }

    ensureXmlInitialized();
    constexpr int options = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET;
    std::unique_ptr<xmlDoc, DocDeleter> doc{
        htmlReadMemory(html.data(), static_cast<int>(html.size()), base_url.c_str(), "UTF-8", options)};
    if (!doc) {
        return anchors;
    }

    collectAnchors(xmlDocGetRootElement(doc.get()), anchors);
    return anchors;
}

} // namespace dirmirror::detail
