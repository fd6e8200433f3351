//  main.cpp
//  gridtiler
//
//  gridtiler run --cfg <file> [--start <year>] [--end <year>]
//                [--chunk-size <n>] [--tiles {1,2,4,8}] [--workers <n>]
//                [--verbose]
//
//  Exit codes: 0 all chunks ok, 1 some chunk failed, 2 usage/config error,
//  3 other fatal error before the run. The run summary (JSON) goes to stdout.
//

#include "ChunkDriver.hpp"
#include "ClimateIndexCalculator.hpp"
#include "DomainGrid.hpp"
#include "EngineConfig.hpp"
#include "Errors.hpp"
#include "Logging.hpp"
#include "NetcdfChunkSource.hpp"
#include "ReferenceCache.hpp"
#include "TileArtifact.hpp"

#include <getopt.h>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <set>
#include <string>

namespace {

enum ExitCode {
    EXIT_ALL_OK = 0,
    EXIT_CHUNK_FAILED = 1,
    EXIT_USAGE = 2,
    EXIT_FATAL = 3
};

static void usage(FILE *fp)
{
    fprintf(fp,
            "Usage: gridtiler run --cfg <file> [options]\n"
            "Options:\n"
            "  --cfg <file>          KEY VALUE run configuration (required)\n"
            "  --start <year>        first year (overrides START_YEAR)\n"
            "  --end <year>          last year, inclusive (overrides END_YEAR)\n"
            "  --chunk-size <n>      years per chunk (overrides CHUNK_SIZE)\n"
            "  --tiles <n>           tiles per chunk: 1, 2, 4 or 8 (overrides TILE_COUNT)\n"
            "  --workers <n>         worker threads (overrides NUM_WORKERS)\n"
            "  --verbose             debug logging\n"
            "  --version             print version and exit\n"
            "  -h, --help            this text\n");
}

struct CliOverrides {
    std::string cfg_path;
    bool has_start = false, has_end = false, has_chunk = false, has_tiles = false, has_workers = false;
    int start = 0, end = 0, chunk = 0, tiles = 0, workers = 0;
    bool verbose = false;
};

static int runCommand(const CliOverrides &cli)
{
    EngineConfig cfg;
    cfg.read(cli.cfg_path);
    if (cli.has_start) {
        cfg.start_year = cli.start;
    }
    if (cli.has_end) {
        cfg.end_year = cli.end;
    }
    if (cli.has_chunk) {
        cfg.chunk_size = cli.chunk;
    }
    if (cli.has_tiles) {
        cfg.tile_count = cli.tiles;
    }
    if (cli.has_workers) {
        cfg.num_workers = cli.workers;
    }
    if (cli.verbose) {
        cfg.verbose = 1;
    }
    cfg.finalize();

    logSetLevel(cfg.verbose ? LOG_DEBUG : LOG_INFO);
    if (!cfg.log_file.empty() && !logOpenFile(cfg.log_file)) {
        logMsg(LOG_WARN, "Cannot open LOG_FILE %s; logging to stderr only", cfg.log_file.c_str());
    }

    if (!DomainGrid::isValidTileCount(cfg.tile_count)) {
        throw InvalidTileCount(cfg.tile_count, "supported values are 1, 2, 4, 8");
    }
    const ClimateIndexCalculator calc(cfg.input_var, cfg.indices);

    const NetcdfChunkSource source(cfg);

    ReferenceCache refs;
    const std::set<std::string> ref_names = calc.referenceNames();
    if (!ref_names.empty()) {
        if (cfg.reference_file.empty()) {
            throw ConfigError("INDICES needs reference surfaces but REFERENCE_FILE is not set");
        }
        std::shared_ptr<const SurfaceSource> surfaces =
            std::make_shared<NetcdfSurfaceSource>(cfg.reference_file, cfg.dim_lat, cfg.dim_lon, cfg.baseline_period);
        refs = ReferenceCache::load(surfaces, ref_names);
    }

    const TileArtifactIO io(cfg.deflate_level);

    DriverOptions opt;
    opt.out_dir = cfg.out_dir;
    opt.output_prefix = cfg.output_prefix;
    opt.baseline_period = cfg.baseline_period;
    opt.scheduler.tile_dir = cfg.tileDir();
    opt.scheduler.worker_count = cfg.num_workers;
    opt.scheduler.max_workers = cfg.max_workers;
    opt.scheduler.timeout_sec = cfg.chunk_timeout_sec;
    opt.scheduler.worker.policy = cfg.calc_failure_policy;
    opt.scheduler.worker.io_retries = cfg.io_retries;

    logMsg(LOG_INFO,
           "gridtiler %s: %s, indices=%s, policy=%s",
           GRIDTILER_VERSION,
           cli.cfg_path.c_str(),
           cfg.indices.c_str(),
           CalcFailurePolicyName(cfg.calc_failure_policy));

    ChunkDriver driver(source, refs, calc, io, opt);
    const RunSummary summary = driver.run(cfg.start_year, cfg.end_year, cfg.chunk_size, cfg.tile_count);

    fprintf(stdout, "%s\n", summary.toJson().c_str());
    fflush(stdout);
    return summary.allSucceeded() ? EXIT_ALL_OK : EXIT_CHUNK_FAILED;
}

} // namespace

int main(int argc, char *argv[])
{
    if (argc < 2) {
        usage(stderr);
        return EXIT_USAGE;
    }
    const std::string cmd = argv[1];
    if (cmd == "-h" || cmd == "--help") {
        usage(stdout);
        return EXIT_ALL_OK;
    }
    if (cmd == "--version") {
        fprintf(stdout, "gridtiler %s\n", GRIDTILER_VERSION);
        return EXIT_ALL_OK;
    }
    if (cmd != "run") {
        fprintf(stderr, "\n  Fatal Error: Unknown command '%s'.\n\n", cmd.c_str());
        usage(stderr);
        return EXIT_USAGE;
    }

    enum { OPT_CFG = 1, OPT_START, OPT_END, OPT_CHUNK, OPT_TILES, OPT_WORKERS, OPT_VERBOSE, OPT_VERSION };
    static const struct option long_opts[] = {
        {"cfg", required_argument, nullptr, OPT_CFG},
        {"start", required_argument, nullptr, OPT_START},
        {"end", required_argument, nullptr, OPT_END},
        {"chunk-size", required_argument, nullptr, OPT_CHUNK},
        {"tiles", required_argument, nullptr, OPT_TILES},
        {"workers", required_argument, nullptr, OPT_WORKERS},
        {"verbose", no_argument, nullptr, OPT_VERBOSE},
        {"version", no_argument, nullptr, OPT_VERSION},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}};

    CliOverrides cli;
    try {
        optind = 2;
        int c;
        while ((c = getopt_long(argc, argv, "h", long_opts, nullptr)) != -1) {
            switch (c) {
                case OPT_CFG:
                    cli.cfg_path = optarg;
                    break;
                case OPT_START:
                    cli.start = parseIntValue("--start", optarg);
                    cli.has_start = true;
                    break;
                case OPT_END:
                    cli.end = parseIntValue("--end", optarg);
                    cli.has_end = true;
                    break;
                case OPT_CHUNK:
                    cli.chunk = parseIntValue("--chunk-size", optarg);
                    cli.has_chunk = true;
                    break;
                case OPT_TILES:
                    cli.tiles = parseIntValue("--tiles", optarg);
                    cli.has_tiles = true;
                    break;
                case OPT_WORKERS:
                    cli.workers = parseIntValue("--workers", optarg);
                    cli.has_workers = true;
                    break;
                case OPT_VERBOSE:
                    cli.verbose = true;
                    break;
                case OPT_VERSION:
                    fprintf(stdout, "gridtiler %s\n", GRIDTILER_VERSION);
                    return EXIT_ALL_OK;
                case 'h':
                    usage(stdout);
                    return EXIT_ALL_OK;
                default:
                    usage(stderr);
                    return EXIT_USAGE;
            }
        }
        if (optind < argc) {
            throw ConfigError(std::string("unexpected argument '") + argv[optind] + "'");
        }
        if (cli.cfg_path.empty()) {
            throw ConfigError("--cfg <file> is required");
        }
        if (cli.has_workers && cli.workers < 1) {
            throw ConfigError("--workers must be >= 1");
        }
    } catch (const ConfigError &e) {
        logFatalBlock("Invalid command line.", "Reason", e.what());
        usage(stderr);
        return EXIT_USAGE;
    }

    int rc = EXIT_FATAL;
    try {
        rc = runCommand(cli);
    } catch (const ConfigError &e) {
        logFatalBlock("Invalid configuration.", "Reason", e.what());
        rc = EXIT_USAGE;
    } catch (const InvalidTileCount &e) {
        logFatalBlock("Invalid tile count.", "Reason", e.what());
        rc = EXIT_USAGE;
    } catch (const ReferenceDataError &e) {
        logFatalBlock("Reference data unusable.", "Surface", e.surface() + " (" + e.what() + ")");
        rc = EXIT_FATAL;
    } catch (const ArtifactIOError &e) {
        logFatalBlock("NetCDF I/O failure.", "File", e.path() + " (" + e.what() + ")");
        rc = EXIT_FATAL;
    } catch (const std::exception &e) {
        logFatalBlock("Run aborted.", "Reason", e.what());
        rc = EXIT_FATAL;
    }
    logCloseFile();
    return rc;
}
