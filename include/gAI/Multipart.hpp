#pragma once

#include <string>
#include <vector>

namespace gAI {

struct MultipartPart {
    std::string name;         // form field name
    std::string filename;     // empty for plain fields
    std::string contentType;  // empty when the part carries none
    std::string data;
};

// Boundary parameter of a multipart/form-data Content-Type, or empty
std::string multipartBoundary(const std::string& contentType);

// Splits a multipart/form-data body into its parts.
// Throws std::invalid_argument on malformed input.
std::vector<MultipartPart> parseMultipart(const std::string& contentType, const std::string& body);

} // namespace gAI
