#ifndef RUNBOX_UTILS_H_
#define RUNBOX_UTILS_H_

#include <string>

#include "invocation.h"

const char* ErrorKindName(ErrorKind);

// case-insensitive (ASCII) substring search
bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle);

#endif  // RUNBOX_UTILS_H_
