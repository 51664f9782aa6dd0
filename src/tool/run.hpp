#pragma once
#include "cfg/cfg.hpp"
#include "uuid/generator.hpp"
#include <ostream>

namespace fastuuid::tool {

struct run_options {
    unsigned long long count = 1; // identifiers per worker
    unsigned threads = 1;
    cfg::output_format_enum format = cfg::hex128;
    bool print = true;
};

struct run_result {
    unsigned long long total = 0;
    double elapsed = 0.0; // seconds
};

// Reads run_options from the "generate" section. Throws cfg_exception if count * threads
// does not fit in 64 bits.
run_options options_from(const cfg::cfg &config);

// Runs opts.threads workers sharing gen. Printed identifiers are written to out in chunks,
// one line each, so a worker never holds more than a chunk in memory. An exception thrown
// by any worker is rethrown here after all workers have been joined.
run_result run(uuid::generator &gen, const run_options &opts, std::ostream &out);

// Command line entry point: parses options, loads configuration, initializes logging and
// runs the workers. Returns EXIT_SUCCESS or EXIT_FAILURE; errors are logged, never thrown.
int run_tool(int argc, char *argv[], std::ostream &out);

} // namespace fastuuid::tool
