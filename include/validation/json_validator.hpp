// EN: Structural checker for JSON documents - parse validity and top-level key-set drift
// FR: Vérificateur structurel de documents JSON - validité du parsing et dérive des clés de premier niveau

#pragma once

#include "validation/validation_report.hpp"
#include "validation/validation_types.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>

namespace FP {
namespace Validation {

struct JsonValidatorOptions {
    size_t max_errors{1000};                // EN: Cap per record list / FR: Plafond par liste d'enregistrements
    size_t read_buffer_size{64 * 1024};     // EN: Reader buffer in bytes / FR: Buffer du lecteur en octets

    // EN: Called with the 1-based index of each array element before the cancellation poll that precedes its check
    // FR: Appelé avec l'index base 1 de chaque élément du tableau avant le test d'annulation qui précède son contrôle
    std::function<void(size_t)> element_listener;
};

// EN: Reads the whole document into memory and parses it once with nlohmann::json.
// FR: Lit tout le document en mémoire et le parse une fois avec nlohmann::json.
class JsonValidator {
public:
    // EN: Throws std::invalid_argument when a numeric option is 0
    // FR: Lance std::invalid_argument si une option numérique vaut 0
    explicit JsonValidator(JsonValidatorOptions options = {});

    ValidationReport validate(const std::string& path,
                              const CancellationFlag* cancel_flag = nullptr,
                              const ProgressCallback& progress = nullptr);

    ValidatorState getState() const { return state_.load(); }
    const JsonValidatorOptions& getOptions() const { return options_; }

    // EN: 1-based line holding byte offset `byte` (nlohmann's parse_error::byte) of `content`
    // FR: Ligne base 1 contenant l'octet `byte` (parse_error::byte de nlohmann) de `content`
    static size_t lineOfByte(const std::string& content, size_t byte);

private:
    JsonValidatorOptions options_;
    std::atomic<ValidatorState> state_{ValidatorState::IDLE};

    void transition(ValidatorState next, const std::string& path);
};

ValidationReport validateJson(const std::string& path,
                              size_t max_errors = 1000,
                              const CancellationFlag* cancel_flag = nullptr,
                              const ProgressCallback& progress = nullptr);

} // namespace Validation
} // namespace FP
