//  EngineConfig.cpp
//  gridtiler
//

#include "EngineConfig.hpp"

#include "Errors.hpp"
#include "Logging.hpp"
#include "PathUtils.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>

std::map<std::string, std::string> readKvCfg(const std::string &path)
{
    std::ifstream f(path.c_str());
    if (!f.is_open()) {
        throw ConfigError("failed to open cfg file: " + path);
    }
    std::map<std::string, std::string> kv;
    std::string line;
    long lineNo = 0;
    while (std::getline(f, line)) {
        lineNo++;
        const std::string t = trim(line);
        if (t.empty() || t[0] == '#') {
            continue;
        }
        std::istringstream iss(t);
        std::string k;
        std::string v;
        if (!(iss >> k)) {
            continue;
        }
        if (!(iss >> v)) {
            std::ostringstream oss;
            oss << "invalid KEY VALUE line (missing value) in " << path << ":" << lineNo << ": " << t;
            throw ConfigError(oss.str());
        }
        kv[toUpper(k)] = v;
    }
    return kv;
}

int parseIntValue(const std::string &key, const std::string &v)
{
    char *endptr = nullptr;
    errno = 0;
    const long val = strtol(v.c_str(), &endptr, 10);
    if (endptr == v.c_str() || *endptr != '\0') {
        throw ConfigError("invalid integer for " + key + ": '" + v + "'");
    }
    if (errno == ERANGE || val < INT_MIN || val > INT_MAX) {
        throw ConfigError("integer out of range for " + key + ": '" + v + "'");
    }
    return (int)val;
}

static double parseDouble(const std::string &key, const std::string &v)
{
    char *endptr = nullptr;
    const double val = strtod(v.c_str(), &endptr);
    if (endptr == v.c_str() || *endptr != '\0') {
        throw ConfigError("invalid number for " + key + ": '" + v + "'");
    }
    return val;
}

static CalcFailurePolicy parsePolicy(const std::string &v)
{
    const std::string u = toUpper(v);
    if (u == "PARTIAL" || u == "KEEP_PARTIAL" || u == "0") {
        return CALC_KEEP_PARTIAL;
    }
    if (u == "FAIL_TILE" || u == "1") {
        return CALC_FAIL_TILE;
    }
    throw ConfigError("invalid CALC_FAILURE_POLICY value '" + v + "'. Valid values: PARTIAL/FAIL_TILE or 0/1.");
}

void EngineConfig::read(const std::string &path)
{
    cfg_path_ = path;
    const std::map<std::string, std::string> kv = readKvCfg(path);
    const std::string cfg_dir = dirnameOf(path);

    auto resolve = [&](const std::string &p) -> std::string {
        if (p.empty() || isAbsPath(p)) {
            return p;
        }
        return joinPath(cfg_dir, p);
    };

    for (const auto &it : kv) {
        const std::string &k = it.first;
        const std::string &v = it.second;
        if (k == "INPUT_FILE") {
            input_file = resolve(v);
        } else if (k == "INPUT_VAR") {
            input_var = v;
        } else if (k == "NC_DIM_TIME") {
            dim_time = v;
        } else if (k == "NC_DIM_LAT") {
            dim_lat = v;
        } else if (k == "NC_DIM_LON") {
            dim_lon = v;
        } else if (k == "TIME_VAR") {
            time_var = v;
        } else if (k == "LAT_VAR") {
            lat_var = v;
        } else if (k == "LON_VAR") {
            lon_var = v;
        } else if (k == "REFERENCE_FILE") {
            reference_file = resolve(v);
        } else if (k == "BASELINE_PERIOD") {
            baseline_period = v;
        } else if (k == "OUT_DIR") {
            out_dir = resolve(v);
        } else if (k == "TILE_DIR") {
            tile_dir = resolve(v);
        } else if (k == "OUTPUT_PREFIX") {
            output_prefix = v;
        } else if (k == "INDICES") {
            indices = v;
        } else if (k == "START_YEAR") {
            start_year = parseIntValue(k, v);
        } else if (k == "END_YEAR") {
            end_year = parseIntValue(k, v);
        } else if (k == "CHUNK_SIZE") {
            chunk_size = parseIntValue(k, v);
        } else if (k == "TILE_COUNT") {
            tile_count = parseIntValue(k, v);
        } else if (k == "NUM_WORKERS") {
            num_workers = parseIntValue(k, v);
        } else if (k == "MAX_WORKERS") {
            max_workers = parseIntValue(k, v);
        } else if (k == "CHUNK_TIMEOUT_SEC") {
            chunk_timeout_sec = parseDouble(k, v);
        } else if (k == "IO_RETRIES") {
            io_retries = parseIntValue(k, v);
        } else if (k == "DEFLATE_LEVEL") {
            deflate_level = parseIntValue(k, v);
        } else if (k == "CALC_FAILURE_POLICY") {
            calc_failure_policy = parsePolicy(v);
        } else if (k == "VERBOSE") {
            verbose = parseIntValue(k, v);
        } else if (k == "LOG_FILE") {
            log_file = resolve(v);
        } else {
            logMsg(LOG_WARN, "Unknown cfg key %s in %s (ignored)", k.c_str(), path.c_str());
        }
    }
}

void EngineConfig::finalize()
{
    if (input_file.empty()) {
        throw ConfigError("INPUT_FILE is required");
    }
    if (time_var.empty()) {
        time_var = dim_time;
    }
    if (lat_var.empty()) {
        lat_var = dim_lat;
    }
    if (lon_var.empty()) {
        lon_var = dim_lon;
    }
    if (chunk_size < 1) {
        throw ConfigError("CHUNK_SIZE must be >= 1, got " + std::to_string(chunk_size));
    }
    if (max_workers < 1) {
        throw ConfigError("MAX_WORKERS must be >= 1, got " + std::to_string(max_workers));
    }
    if (num_workers < 0) {
        throw ConfigError("NUM_WORKERS must be >= 0, got " + std::to_string(num_workers));
    }
    if (!(chunk_timeout_sec >= 0.0)) {
        throw ConfigError("CHUNK_TIMEOUT_SEC must be >= 0");
    }
    if (io_retries < 0) {
        throw ConfigError("IO_RETRIES must be >= 0, got " + std::to_string(io_retries));
    }
    if (deflate_level < 0 || deflate_level > 9) {
        throw ConfigError("DEFLATE_LEVEL must be in 0..9, got " + std::to_string(deflate_level));
    }
    if (out_dir.empty()) {
        throw ConfigError("OUT_DIR must not be empty");
    }
}

std::string EngineConfig::tileDir() const
{
    if (!tile_dir.empty()) {
        return tile_dir;
    }
    return joinPath(out_dir, ".tiles");
}
