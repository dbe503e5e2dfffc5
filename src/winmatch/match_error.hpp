#pragma once

#include <string>

enum class MatchErrorKind {
    Pattern,    // malformed regular expression criterion
    Argument,   // required argument absent (e.g. empty filter callback)
    Discovery,  // window provider could not enumerate or snapshot windows
    Callback,   // a suspending enumeration callback failed
    Parse,      // malformed predicate or config document
};

struct MatchError {
    MatchErrorKind kind;
    std::string message;
};

const char* to_string(MatchErrorKind kind);
