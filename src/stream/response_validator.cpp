/*
 * response_validator.cpp
 *
 * Classifies a response before the stream consumes it. Provider error bodies
 * (<Error><Code/><Message/><Resource/><RequestId/></Error>) are parsed with libxml2.
 */

#include <rangeio/stream/retry.hpp>

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <memory>

namespace rangeio::stream {

namespace {

bool isXmlMediaType(std::string_view contentType) {
    auto semi = contentType.find(';');
    if (semi != std::string_view::npos)
        contentType = contentType.substr(0, semi);
    std::string lower;
    lower.reserve(contentType.size());
    for (unsigned char c : contentType) {
        if (!std::isspace(c))
            lower.push_back(static_cast<char>(std::tolower(c)));
    }
    return lower == "application/xml" || lower == "text/xml";
}

bool elementNamed(const xmlNode* node, const char* name) {
    return node->type == XML_ELEMENT_NODE &&
           std::strcmp(reinterpret_cast<const char*>(node->name), name) == 0;
}

std::string elementText(const xmlNode* node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (content == nullptr)
        return {};
    std::string out(reinterpret_cast<const char*>(content));
    xmlFree(content);
    return out;
}

// Reads at most `limit` bytes of the body; read failures end the capture early.
std::string captureBody(http::IBodyStream& body, std::size_t limit) {
    std::string out;
    std::array<std::byte, 8192> chunk{};
    while (out.size() < limit) {
        const auto want = std::min(chunk.size(), limit - out.size());
        auto n = body.read(MutableByteSpan(chunk.data(), want));
        if (!n.ok() || n.value() == 0)
            break;
        out.append(reinterpret_cast<const char*>(chunk.data()), n.value());
    }
    return out;
}

} // namespace

std::optional<ResponseError> parseXmlError(std::string_view body, int statusCode) {
    if (body.empty())
        return std::nullopt;

    std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)> doc(
        xmlReadMemory(body.data(), static_cast<int>(body.size()), "error.xml", nullptr,
                      XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
        &xmlFreeDoc);
    if (!doc)
        return std::nullopt;

    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (root == nullptr || !elementNamed(root, "Error"))
        return std::nullopt;

    ResponseError out;
    out.statusCode = statusCode;
    for (const xmlNode* child = root->children; child != nullptr; child = child->next) {
        if (elementNamed(child, "Code"))
            out.code = elementText(child);
        else if (elementNamed(child, "Message"))
            out.message = elementText(child);
        else if (elementNamed(child, "Resource"))
            out.resource = elementText(child);
        else if (elementNamed(child, "RequestId"))
            out.requestId = elementText(child);
    }
    return out;
}

Expected<void> validateResponse(http::HttpResponse& response) {
    if (response.statusCode >= 300) {
        ResponseError failure;
        failure.statusCode = response.statusCode;
        failure.code = response.statusLine();

        if (response.body) {
            auto contentType = response.headers.get("Content-Type");
            if (contentType && isXmlMediaType(*contentType)) {
                auto parsed = parseXmlError(captureBody(*response.body, kMaxErrorBodyBytes),
                                            response.statusCode);
                if (parsed) {
                    if (parsed->code.empty())
                        parsed->code = failure.code;
                    failure = std::move(*parsed);
                }
            }
            response.body->close();
        }

        Error err{ErrorCode::ServerError, failure.describe()};
        err.response = std::move(failure);
        return err;
    }

    if (!response.contentLength) {
        if (response.body)
            response.body->close();
        return Error{ErrorCode::MissingContentLength,
                     "retrieving objects with undefined content-length responses (chunked "
                     "transfer encoding / EOF close) is not supported"};
    }
    return {};
}

} // namespace rangeio::stream
