// EN: File kind dispatch
// FR: Aiguillage par type de fichier

#include "validation/file_validator.hpp"
#include "validation/delimited_validator.hpp"
#include "validation/json_validator.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace FP {
namespace Validation {

namespace {

std::string lowercaseExtension(const std::filesystem::path& path) {
    std::string extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension;
}

} // namespace

FileKind detectFileKind(const std::string& path) {
    std::filesystem::path file_path(path);
    std::string extension = lowercaseExtension(file_path);
    if (extension == ".gz") {
        extension = lowercaseExtension(file_path.stem());
    }
    return extension == ".json" ? FileKind::JSON : FileKind::DELIMITED;
}

ValidationReport validateFile(const std::string& path,
                              const ValidationSettings& settings,
                              const CancellationFlag* cancel_flag,
                              const ProgressCallback& progress) {
    FileKind kind = settings.kind == FileKind::AUTO ? detectFileKind(path) : settings.kind;
    LOG_DEBUG("file_validator", path + " handled as " + fileKindToString(kind));

    if (kind == FileKind::JSON) {
        return JsonValidator(settings.json).validate(path, cancel_flag, progress);
    }
    return DelimitedValidator(settings.delimited).validate(path, cancel_flag, progress);
}

} // namespace Validation
} // namespace FP
