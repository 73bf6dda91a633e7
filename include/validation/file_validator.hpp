// EN: Dispatch a file to the delimited or JSON validator
// FR: Aiguille un fichier vers le validateur délimité ou JSON

#pragma once

#include "validation/validation_report.hpp"
#include "validation/validation_settings.hpp"
#include "validation/validation_types.hpp"

#include <string>

namespace FP {
namespace Validation {

// EN: ".json" (case-insensitive, a trailing ".gz" ignored) selects JSON, anything else is delimited. Never returns AUTO.
// FR: ".json" (insensible à la casse, ".gz" final ignoré) sélectionne JSON, tout le reste est délimité. Ne retourne jamais AUTO.
FileKind detectFileKind(const std::string& path);

// EN: Resolve the kind (settings.kind unless AUTO) and run the matching validator
// FR: Résout le type (settings.kind sauf si AUTO) et lance le validateur correspondant
ValidationReport validateFile(const std::string& path,
                              const ValidationSettings& settings,
                              const CancellationFlag* cancel_flag = nullptr,
                              const ProgressCallback& progress = nullptr);

} // namespace Validation
} // namespace FP
