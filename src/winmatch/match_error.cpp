#include "match_error.hpp"

const char* to_string(MatchErrorKind kind) {
    switch (kind) {
        case MatchErrorKind::Pattern: return "pattern";
        case MatchErrorKind::Argument: return "argument";
        case MatchErrorKind::Discovery: return "discovery";
        case MatchErrorKind::Callback: return "callback";
        case MatchErrorKind::Parse: return "parse";
    }
    return "unknown";
}
