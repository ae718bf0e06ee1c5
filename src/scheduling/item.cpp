#include "../include/scheduling/item.hpp"

namespace nudger {

const char* executionKindName(ExecutionKind kind) {
    switch (kind) {
        case ExecutionKind::Query: return "query";
        case ExecutionKind::Excursion: return "excursion";
    }
    return "unknown";
}

bool parseExecutionKind(const std::string& text, ExecutionKind& kind) {
    if (text == "query") {
        kind = ExecutionKind::Query;
        return true;
    }
    if (text == "excursion") {
        kind = ExecutionKind::Excursion;
        return true;
    }
    return false;
}

} // namespace nudger
