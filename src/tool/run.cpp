#include "run.hpp"
#include "logger/logger.hpp"
#include "uuid/hex.hpp"
#include <algorithm>
#include <atomic>
#include <boost/exception/diagnostic_information.hpp>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fmt/core.h>
#include <iostream>
#include <limits>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace fastuuid::tool {

namespace {

constexpr unsigned long long chunk_size = 4096;


void print_help()
{
    std::cout << "\nfastuuid\n\n"
                 "Options:\n"
                 "  -h    This message\n"
                 "  -c    Path to configuration file\n"
                 "  -n    Identifiers per thread\n"
                 "  -t    Number of threads sharing one generator\n"
                 "  -f    Output format: hex128 or raw\n"
                 "  -q    Do not print identifiers, only report throughput\n"
              << std::endl;
}


// Stops early, at a chunk boundary, once stop is set by a failing worker.
void run_worker(uuid::generator &gen, const run_options &opts, std::ostream &out, std::mutex &out_mutex,
                const std::atomic<bool> &stop)
{
    std::string buf;
    std::uint8_t sink = 0;
    unsigned long long left = opts.count;

    while (left > 0 && !stop) {
        const auto n = std::min(left, chunk_size);
        if (!opts.print) {
            for (unsigned long long i = 0; i < n; ++i)
                sink ^= gen.next()[0];
            left -= n;
            continue;
        }

        buf.clear();
        for (unsigned long long i = 0; i < n; ++i) {
            const auto id = gen.next();
            buf += opts.format == cfg::raw ? uuid::hex192(id) : uuid::hex128(id);
            buf += '\n';
        }

        std::lock_guard<std::mutex> lock(out_mutex);
        out << buf;
        left -= n;
    }
    spdlog::trace("worker done, sink {}", sink);
}

} // namespace


run_options options_from(const cfg::cfg &config)
{
    const auto g = config.section(cfg::GENERATE_SECTION);

    run_options opts;
    opts.count = g->get<unsigned long long>("count");
    opts.threads = g->get<unsigned>("threads");
    opts.format = g->get<cfg::output_format_enum>("format");
    opts.print = g->get<bool>("print");

    if (opts.count > std::numeric_limits<std::uint64_t>::max() / opts.threads)
        throw cfg::cfg_exception(fmt::format(R"(section "{}", "count" ({}) times "threads" ({}) exceeds {})",
                                             cfg::GENERATE_SECTION, opts.count, opts.threads,
                                             std::numeric_limits<std::uint64_t>::max()));
    return opts;
}


run_result run(uuid::generator &gen, const run_options &opts, std::ostream &out)
{
    std::mutex out_mutex;
    std::atomic<bool> stop{false};
    std::vector<std::exception_ptr> errors(opts.threads);
    std::vector<std::thread> workers;
    workers.reserve(opts.threads);

    const auto start = std::chrono::steady_clock::now();
    for (unsigned i = 0; i < opts.threads; ++i) {
        workers.emplace_back([&, i]() {
            try {
                run_worker(gen, opts, out, out_mutex, stop);
            } catch (...) {
                // handed to the joining thread below
                errors[i] = std::current_exception();
                stop = true;
            }
        });
    }
    for (auto &w: workers)
        w.join();

    run_result result;
    result.elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    result.total = opts.count * opts.threads;

    for (const auto &e: errors)
        if (e)
            std::rethrow_exception(e);

    return result;
}


int run_tool(int argc, char *argv[], std::ostream &out)
{
    int ch = 0;
    const char *config_file = nullptr;
    std::vector<std::pair<std::string, std::string>> overrides;

    // glibc: 0 forces a full rescan so run_tool() can be called more than once
    optind = 0;
    while ((ch = getopt(argc, argv, "hc:n:t:f:q")) != -1) {
        switch (ch) {
        case 'c':
            config_file = optarg;
            break;
        case 'n':
            overrides.emplace_back("count", optarg);
            break;
        case 't':
            overrides.emplace_back("threads", optarg);
            break;
        case 'f':
            overrides.emplace_back("format", optarg);
            break;
        case 'q':
            overrides.emplace_back("print", "false");
            break;
        case 'h':
        case '?':
        default:
            print_help();
            return EXIT_FAILURE;
        }
    }

    try {
        cfg::cfg config;
        if (config_file != nullptr)
            config.init(config_file);
        else
            config.init();

        const auto g = config.section(cfg::GENERATE_SECTION);
        for (const auto &[name, value]: overrides)
            g->set(name, value);

        logger::init(config);
        const auto opts = options_from(config);

        auto gen = uuid::must_make_generator();
        spdlog::info("generating {} identifiers on {} thread(s)", opts.count * opts.threads, opts.threads);

        const auto result = run(*gen, opts, out);
        out.flush();

        const double total = static_cast<double>(result.total);
        spdlog::info("{} identifiers in {:.6f}s ({:.1f} ns/op, {:.0f} ops/s)", result.total, result.elapsed,
                     total > 0 ? result.elapsed * 1e9 / total : 0.0,
                     result.elapsed > 0 ? total / result.elapsed : 0.0);
        return EXIT_SUCCESS;
    } catch (const cfg::cfg_exception &e) {
        spdlog::error("Configuration error: {}", e.what());
    } catch (const boost::exception &e) {
        spdlog::error("Boost exception caught: {}", boost::diagnostic_information(e));
    } catch (const std::exception &e) {
        spdlog::error("Exception caught: {}", e.what());
    }

    return EXIT_FAILURE;
}

} // namespace fastuuid::tool
