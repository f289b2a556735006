#pragma once

#include <string>

// True when text is well-formed UTF-8: no overlong forms, no surrogates and
// nothing above U+10FFFF.
bool IsValidUtf8(const std::string& text);
