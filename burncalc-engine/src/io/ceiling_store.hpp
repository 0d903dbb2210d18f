#ifndef BURNCALC_IO_CEILING_STORE_HPP
#define BURNCALC_IO_CEILING_STORE_HPP

#include "../ceiling.hpp"
#include "../errors.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace burncalc {
namespace io {

/**
 * @brief Ceiling record could not be read, decoded or written
 */
class CeilingStoreError : public ChartError {
public:
    explicit CeilingStoreError(const std::string& message)
        : ChartError(ChartErrorKind::Persistence, message) {}
};

// Decodes a ceiling record document.
//
// Accepts the current shape {"popStart", "popEnd", "releases"} and the legacy
// shape (a bare array of releases, no PoP). Dates may be "YYYY-MM-DD" or a
// full ISO-8601 timestamp. A release without an id gets a fresh one.
// Releases are returned sorted by date. `legacy_format` is set when the
// legacy shape was read. Throws CeilingStoreError.
CeilingRecord parse_ceiling_record(const std::string& json_string, bool* legacy_format = nullptr);

// Encodes a record as pretty-printed JSON with sorted keys; releases are
// written in date order and absent PoP dates as null
std::string serialize_ceiling_record(const CeilingRecord& record);

/**
 * @brief Per-job ceiling records stored as JSON files
 *
 * Layout: <root>/ceiling/job_<id>.json
 *
 * Writes go to a temporary file that is renamed over the target, so a
 * reader never sees a partially written record.
 */
class CeilingStore {
public:
    /**
     * @param root_dir Data directory (default: $XDG_DATA_HOME/burncalc or ~/.local/share/burncalc)
     */
    explicit CeilingStore(const std::string& root_dir = "");

    const std::filesystem::path& root() const { return root_dir_; }

    std::filesystem::path record_path(int64_t job_id) const;

    /**
     * @brief Load a job's record; a missing file yields an empty record
     * @throws CeilingStoreError if the file exists but cannot be read or decoded
     */
    CeilingRecord load_record(int64_t job_id) const;

    /**
     * @brief Load a job's record, logging and returning an empty record on failure
     */
    CeilingRecord load_record_or_empty(int64_t job_id) const;

    /**
     * @brief Overwrite a job's record (releases sorted before writing)
     * @throws CeilingStoreError on I/O failure
     */
    void save_record(int64_t job_id, const CeilingRecord& record) const;

    /**
     * @brief Replace a job's releases, keeping the stored PoP
     */
    void save_releases(int64_t job_id, const std::vector<CeilingRelease>& releases) const;

    static std::string get_default_root_dir();

private:
    std::filesystem::path root_dir_;
};

} // namespace io
} // namespace burncalc

#endif // BURNCALC_IO_CEILING_STORE_HPP
