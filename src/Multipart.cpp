#include "gAI/Multipart.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace gAI {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Value of a ;-separated header parameter such as name="file"
std::string headerParameter(const std::string& header, const std::string& key) {
    size_t pos = 0;
    while (pos < header.size()) {
        size_t semi = header.find(';', pos);
        std::string token = trim(header.substr(pos, semi == std::string::npos ? std::string::npos : semi - pos));
        auto eq = token.find('=');
        if (eq != std::string::npos && toLower(trim(token.substr(0, eq))) == key) {
            return unquote(trim(token.substr(eq + 1)));
        }
        if (semi == std::string::npos) {
            break;
        }
        pos = semi + 1;
    }
    return "";
}

MultipartPart parsePart(const std::string& raw) {
    auto headerEnd = raw.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        throw std::invalid_argument("Multipart part without header terminator");
    }

    MultipartPart part;
    part.data = raw.substr(headerEnd + 4);

    size_t pos = 0;
    while (pos < headerEnd) {
        size_t eol = raw.find("\r\n", pos);
        if (eol == std::string::npos || eol > headerEnd) {
            eol = headerEnd;
        }
        std::string line = raw.substr(pos, eol - pos);
        pos = eol + 2;

        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string name = toLower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));

        if (name == "content-disposition") {
            part.name = headerParameter(value, "name");
            part.filename = headerParameter(value, "filename");
        } else if (name == "content-type") {
            part.contentType = value;
        }
    }
    return part;
}

} // namespace

std::string multipartBoundary(const std::string& contentType) {
    auto semi = contentType.find(';');
    if (toLower(trim(contentType.substr(0, semi))) != "multipart/form-data" || semi == std::string::npos) {
        return "";
    }
    return headerParameter(contentType.substr(semi + 1), "boundary");
}

std::vector<MultipartPart> parseMultipart(const std::string& contentType, const std::string& body) {
    std::string boundary = multipartBoundary(contentType);
    if (boundary.empty()) {
        throw std::invalid_argument("Expected multipart/form-data with a boundary");
    }

    const std::string delimiter = "--" + boundary;
    std::vector<MultipartPart> parts;

    size_t pos = body.find(delimiter);
    if (pos == std::string::npos) {
        throw std::invalid_argument("Multipart boundary not found in body");
    }

    for (;;) {
        pos += delimiter.size();
        if (body.compare(pos, 2, "--") == 0) {
            return parts;
        }
        if (body.compare(pos, 2, "\r\n") != 0) {
            throw std::invalid_argument("Malformed multipart delimiter");
        }
        pos += 2;

        size_t next = body.find("\r\n" + delimiter, pos);
        if (next == std::string::npos) {
            throw std::invalid_argument("Unterminated multipart body");
        }
        parts.push_back(parsePart(body.substr(pos, next - pos)));
        pos = next + 2;
    }
}

} // namespace gAI
