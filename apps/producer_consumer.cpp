#include "producer_consumer_model.hpp"

#include <evsim/core/error.hpp>
#include <evsim/core/executor.hpp>
#include <evsim/core/simulation.hpp>
#include <evsim/core/types.hpp>

#include <evsim/io/error.hpp>
#include <evsim/io/executor_config.hpp>
#include <evsim/io/trace_writers.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace {

namespace core = evsim::core;
namespace io = evsim::io;
namespace demo = evsim::demo;

struct Config {
    uint64_t items{10};
    double produce_interval{1.0};
    double consume_time{1.0};
    std::size_t capacity{0};  // 0 = unbounded
    std::string executor_file;
    std::string output_file{"-"};
    std::string format{"json"};
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("evsim-producer-consumer", "Producer/consumer discrete-event simulation");

    options.add_options()
        ("n,items", "Number of products (default: 10)", cxxopts::value<uint64_t>()->default_value("10"))
        ("produce-interval", "Seconds between products (default: 1)", cxxopts::value<double>()->default_value("1"))
        ("consume-time", "Seconds to consume a product (default: 1)", cxxopts::value<double>()->default_value("1"))
        ("capacity", "Queue capacity, 0 for unbounded (default: 0)", cxxopts::value<std::size_t>()->default_value("0"))
        ("e,executor", "Executor configuration (JSON)", cxxopts::value<std::string>())
        ("o,output", "Trace output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("format", "Format: json|null (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("v,verbose", "Print producer/consumer activity to stderr")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    Config config;
    config.items = result["items"].as<uint64_t>();
    config.produce_interval = result["produce-interval"].as<double>();
    config.consume_time = result["consume-time"].as<double>();
    config.capacity = result["capacity"].as<std::size_t>();
    if (result.count("executor") != 0U) {
        config.executor_file = result["executor"].as<std::string>();
    }
    config.output_file = result["output"].as<std::string>();
    config.format = result["format"].as<std::string>();
    config.verbose = result.count("verbose") != 0U;

    if (config.format != "json" && config.format != "null") {
        std::cerr << "Error: unknown format: " << config.format << std::endl;
        std::exit(64);
    }

    return config;
}

std::unique_ptr<core::TraceWriter> make_writer(const std::string& format, std::ostream& out) {
    if (format == "null") {
        return std::make_unique<io::NullTraceWriter>();
    }
    return std::make_unique<io::JsonTraceWriter>(out);
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        io::ExecutorConfig executor_config;
        if (!config.executor_file.empty()) {
            executor_config = io::load_executor_config(config.executor_file);
        }

        // 1. Setup trace writer
        std::ofstream outfile;
        if (config.output_file != "-") {
            outfile.open(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open output file: " << config.output_file << std::endl;
                return 1;
            }
        }
        std::ostream& out = config.output_file == "-" ? std::cout : outfile;
        auto writer = make_writer(config.format, out);

        // 2. Build the model
        core::Simulation sim;
        sim.set_trace_writer(writer.get());

        demo::ModelParams params;
        params.items = config.items;
        params.produce_interval = core::duration_from_seconds(config.produce_interval);
        params.consume_time = core::duration_from_seconds(config.consume_time);
        params.capacity = config.capacity;
        params.log = config.verbose ? &std::cerr : nullptr;
        auto model = demo::build_model(sim, params);

        // 3. Run
        std::size_t steps = io::make_executor(executor_config).execute(sim);

        // 4. Finalize output
        if (auto* json = dynamic_cast<io::JsonTraceWriter*>(writer.get())) {
            json->finalize();
        }

        const demo::Counters& result = *sim.state().get(model.counters);
        std::cerr << "steps=" << steps << " time=" << sim.time()
                  << " produced=" << result.produced << " consumed=" << result.consumed
                  << " dropped=" << result.dropped << std::endl;

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::SimulationError& e) {
        std::cerr << "Simulation error: " << e.what() << std::endl;
        return 1;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
