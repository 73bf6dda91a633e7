// EN: Validator state names
// FR: Noms des états de validateur

#include "validation/validation_types.hpp"

namespace FP {
namespace Validation {

std::string validatorStateToString(ValidatorState state) {
    switch (state) {
        case ValidatorState::IDLE:      return "IDLE";
        case ValidatorState::SAMPLING:  return "SAMPLING";
        case ValidatorState::DETECTING: return "DETECTING";
        case ValidatorState::SCANNING:  return "SCANNING";
        case ValidatorState::COMPLETE:  return "COMPLETE";
        case ValidatorState::CANCELLED: return "CANCELLED";
        case ValidatorState::FAILED:    return "FAILED";
        default:                        return "UNKNOWN";
    }
}

} // namespace Validation
} // namespace FP
