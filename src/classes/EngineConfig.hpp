//  EngineConfig.hpp
//  gridtiler
//
//  Run configuration, read from a KEY VALUE cfg file:
//
//      # comment
//      INPUT_FILE   data/tas_daily.nc
//      INPUT_VAR    tas
//      TILE_COUNT   4
//
//  Keys are case-insensitive; relative paths resolve against the cfg file's
//  directory. Command-line flags override the file.
//
#ifndef EngineConfig_hpp
#define EngineConfig_hpp

#include <map>
#include <string>

enum CalcFailurePolicy {
    CALC_KEEP_PARTIAL = 0,
    CALC_FAIL_TILE = 1
};

static inline const char *CalcFailurePolicyName(CalcFailurePolicy policy)
{
    switch (policy) {
        case CALC_KEEP_PARTIAL: return "PARTIAL";
        case CALC_FAIL_TILE:    return "FAIL_TILE";
        default:                return "UNKNOWN";
    }
}

/* Parse a KEY VALUE file into an upper-cased key map. Throws ConfigError. */
std::map<std::string, std::string> readKvCfg(const std::string &path);

/* Whole-string base-10 int. Throws ConfigError naming key on junk or int overflow. */
int parseIntValue(const std::string &key, const std::string &v);

class EngineConfig {
public:
    /* Input */
    std::string input_file;
    std::string input_var = "tas";
    std::string dim_time = "time";
    std::string dim_lat = "lat";
    std::string dim_lon = "lon";
    std::string time_var;   /* defaults to dim_time */
    std::string lat_var;    /* defaults to dim_lat */
    std::string lon_var;    /* defaults to dim_lon */

    /* Reference surfaces */
    std::string reference_file;
    std::string baseline_period;

    /* Output */
    std::string out_dir = "./outputs";
    std::string tile_dir;   /* defaults to <out_dir>/.tiles */
    std::string output_prefix = "indices";
    std::string indices = "mean";

    /* Run */
    int start_year = 1981;
    int end_year = 2024;
    int chunk_size = 1;     /* years per chunk */
    int tile_count = 4;
    int num_workers = 0;    /* 0 = one per tile */
    int max_workers = 8;
    double chunk_timeout_sec = 0.0; /* 0 = no timeout */
    int io_retries = 3;
    int deflate_level = 4;
    CalcFailurePolicy calc_failure_policy = CALC_KEEP_PARTIAL;

    int verbose = 0;
    std::string log_file;

    void read(const std::string &path);
    /* Fill derived defaults (tile_dir, coordinate names) and range-check. */
    void finalize();

    std::string tileDir() const;

private:
    std::string cfg_path_;
};

#endif /* EngineConfig_hpp */
