#include "voxturn/outcome.hpp"

namespace voxturn {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Transcription: return "transcription";
        case ErrorKind::Generation: return "generation";
        case ErrorKind::Synthesis: return "synthesis";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Protocol: return "protocol";
        case ErrorKind::Internal: return "internal";
    }
    return "internal";
}

} // namespace voxturn
