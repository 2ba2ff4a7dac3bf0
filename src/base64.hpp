#pragma once
#include <cstdint>
#include <string>

// Standard alphabet with '=' padding. The encoded form never contains quotes,
// backslashes or line breaks, so it can sit inside any string literal as-is.
std::string base64_encode(const std::string& text);

// Stops at the first byte outside the alphabet (padding included).
std::string base64_decode(const std::string& s);
