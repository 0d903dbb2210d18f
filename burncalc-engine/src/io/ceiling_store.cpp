#include "ceiling_store.hpp"
#include "../logger.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace burncalc {
namespace io {

// ============================================================================
// JSON Encoding
// ============================================================================

namespace {

std::optional<Date> decode_date(const json& j, const char* field) {
    if (!j.contains(field) || j[field].is_null()) {
        return std::nullopt;
    }
    const std::string text = j[field].get<std::string>();
    try {
        return Date::parse(text);
    } catch (const std::invalid_argument&) {
        throw CeilingStoreError(std::string("Invalid date in field '") + field + "': " + text);
    }
}

CeilingRelease decode_release(const json& j) {
    if (!j.is_object()) {
        throw CeilingStoreError("Release must be an object");
    }
    auto date = decode_date(j, "date");
    if (!date) {
        throw CeilingStoreError("Release missing required field: date");
    }
    if (!j.contains("hours")) {
        throw CeilingStoreError("Release missing required field: hours");
    }

    CeilingRelease release;
    release.date = *date;
    release.hours = j["hours"].get<double>();

    if (j.contains("id") && !j["id"].is_null()) {
        release.id = j["id"].get<std::string>();
    }
    if (release.id.empty()) {
        release.id = generate_release_id();
    }

    if (j.contains("note") && !j["note"].is_null()) {
        release.note = j["note"].get<std::string>();
    }
    return release;
}

std::vector<CeilingRelease> decode_releases(const json& j) {
    if (!j.is_array()) {
        throw CeilingStoreError("Field 'releases' must be an array");
    }
    std::vector<CeilingRelease> releases;
    releases.reserve(j.size());
    for (const auto& release_json : j) {
        releases.push_back(decode_release(release_json));
    }
    sort_releases(releases);
    return releases;
}

json encode_date(const std::optional<Date>& date) {
    if (!date) {
        return nullptr;
    }
    return date->to_string();
}

} // anonymous namespace

CeilingRecord parse_ceiling_record(const std::string& json_string, bool* legacy_format) {
    CeilingRecord record;
    bool legacy = false;

    try {
        json j = json::parse(json_string);

        if (j.is_array()) {
            // Legacy shape: releases only
            legacy = true;
            record.releases = decode_releases(j);
        } else if (j.is_object()) {
            record.pop_start = decode_date(j, "popStart");
            record.pop_end = decode_date(j, "popEnd");
            if (j.contains("releases") && !j["releases"].is_null()) {
                record.releases = decode_releases(j["releases"]);
            }
        } else {
            throw CeilingStoreError("Ceiling record must be an object or an array");
        }

    } catch (const json::parse_error& e) {
        throw CeilingStoreError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw CeilingStoreError(std::string("JSON type error: ") + e.what());
    }

    if (legacy_format) {
        *legacy_format = legacy;
    }
    return record;
}

std::string serialize_ceiling_record(const CeilingRecord& record) {
    std::vector<CeilingRelease> releases = record.releases;
    sort_releases(releases);

    json releases_json = json::array();
    for (const auto& release : releases) {
        json r;
        r["id"] = release.id;
        r["date"] = release.date.to_string();
        r["hours"] = release.hours;
        r["note"] = release.note ? json(*release.note) : json(nullptr);
        releases_json.push_back(r);
    }

    json j;
    j["popStart"] = encode_date(record.pop_start);
    j["popEnd"] = encode_date(record.pop_end);
    j["releases"] = releases_json;

    // nlohmann::json objects keep keys ordered
    return j.dump(2) + "\n";
}

// ============================================================================
// CeilingStore Implementation
// ============================================================================

std::string CeilingStore::get_default_root_dir() {
#ifdef __APPLE__
    const char* home = getenv("HOME");
    if (home) {
        return std::string(home) + "/Library/Application Support/burncalc";
    }
    return "/tmp/burncalc";
#else
    const char* data_home = getenv("XDG_DATA_HOME");
    if (data_home && *data_home) {
        return std::string(data_home) + "/burncalc";
    }
    const char* home = getenv("HOME");
    if (home) {
        return std::string(home) + "/.local/share/burncalc";
    }
    return "/tmp/burncalc";
#endif
}

CeilingStore::CeilingStore(const std::string& root_dir) {
    if (root_dir.empty()) {
        root_dir_ = get_default_root_dir();
    } else {
        root_dir_ = root_dir;
    }
}

fs::path CeilingStore::record_path(int64_t job_id) const {
    return root_dir_ / "ceiling" / ("job_" + std::to_string(job_id) + ".json");
}

CeilingRecord CeilingStore::load_record(int64_t job_id) const {
    const fs::path path = record_path(job_id);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return CeilingRecord();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw CeilingStoreError("Failed to open ceiling record: " + path.string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    bool legacy = false;
    CeilingRecord record;
    try {
        record = parse_ceiling_record(buffer.str(), &legacy);
    } catch (const CeilingStoreError& e) {
        throw CeilingStoreError(path.string() + ": " + e.what());
    }

    Logger::get_instance().log_ceiling_loaded(job_id, path.string(), record.releases.size(), legacy);
    return record;
}

CeilingRecord CeilingStore::load_record_or_empty(int64_t job_id) const {
    try {
        return load_record(job_id);
    } catch (const CeilingStoreError& e) {
        Logger::get_instance().log_ceiling_load_failed(job_id, record_path(job_id).string(), e.what());
        return CeilingRecord();
    }
}

void CeilingStore::save_record(int64_t job_id, const CeilingRecord& record) const {
    const fs::path path = record_path(job_id);

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw CeilingStoreError("Failed to create directory " + path.parent_path().string() +
                                ": " + ec.message());
    }

    const std::string contents = serialize_ceiling_record(record);

    // Write beside the target, then rename over it
    fs::path tmp_path = path;
    tmp_path += ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw CeilingStoreError("Failed to open file for writing: " + tmp_path.string());
        }
        file << contents;
        file.flush();
        if (!file) {
            throw CeilingStoreError("Failed to write ceiling record: " + tmp_path.string());
        }
    }

    fs::rename(tmp_path, path, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        throw CeilingStoreError("Failed to replace ceiling record " + path.string());
    }

    Logger::get_instance().log_ceiling_saved(job_id, path.string(), record.releases.size());
}

void CeilingStore::save_releases(int64_t job_id, const std::vector<CeilingRelease>& releases) const {
    CeilingRecord record = load_record_or_empty(job_id);
    record.releases = releases;
    sort_releases(record.releases);
    save_record(job_id, record);
}

} // namespace io
} // namespace burncalc
