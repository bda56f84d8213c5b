#include "modules/speech_recognizer.hpp"

namespace voxplay::modules {

std::string recognizer_error_to_string(RecognizerError error) {
    switch (error) {
        case RecognizerError::ModelUnavailable: return "ModelUnavailable";
        case RecognizerError::InferenceFailed: return "InferenceFailed";
        case RecognizerError::Aborted: return "Aborted";
    }
    return "Unknown";
}

} // namespace voxplay::modules
