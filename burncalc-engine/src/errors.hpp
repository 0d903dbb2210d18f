#ifndef BURNCALC_ERRORS_HPP
#define BURNCALC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace burncalc {

/**
 * @brief Failure categories surfaced by chart generation
 */
enum class ChartErrorKind {
    Configuration,   ///< Missing or malformed remote API configuration (fatal to the session)
    Validation,      ///< User-correctable input problem, raised before any fetch
    Transport,       ///< A timesheet fetch failed or returned an undecodable payload
    Persistence      ///< Ceiling record could not be read or written
};

inline std::string kind_to_string(ChartErrorKind kind) {
    switch (kind) {
        case ChartErrorKind::Configuration: return "configuration";
        case ChartErrorKind::Validation: return "validation";
        case ChartErrorKind::Transport: return "transport";
        case ChartErrorKind::Persistence: return "persistence";
        default: return "unknown";
    }
}

/**
 * @brief Typed failure raised by the chart pipeline
 */
class ChartError : public std::runtime_error {
public:
    ChartError(ChartErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ChartErrorKind kind() const { return kind_; }

private:
    ChartErrorKind kind_;
};

} // namespace burncalc

#endif // BURNCALC_ERRORS_HPP
