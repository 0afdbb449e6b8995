#include "config.hpp"
#include "errors.hpp"
#include "import_map.hpp"
#include "output_verifier.hpp"
#include "server.hpp"
#include "syntax_engine.hpp"
#include "transform.hpp"

#include <boost/program_options.hpp>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>

namespace po = boost::program_options;

namespace {
std::unique_ptr<jsxform::Server> g_server;

void signal_handler(int /*signum*/) {
    if (g_server) {
        std::cout << "\nShutting down...\n";
        g_server->stop();
    }
    std::exit(0);
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot read " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot write " + path.string());
    }
    out << content;
}

struct FileJob {
    std::filesystem::path input;
    std::string filename;
    std::string output;           // empty = stdout
    std::string import_map_file;  // empty = no map
    jsxform::SwcOptions options;
    bool has_plugin_resolves = false;
    bool print_deps = false;
};

// Transforms one file. Returns false after reporting an error.
bool run_job(jsxform::Transformer& transformer, const FileJob& job) {
    try {
        jsxform::TransformRequest request;
        request.filename = job.filename;
        request.options = job.options;
        request.has_plugin_resolves = job.has_plugin_resolves;
        request.source_text = read_file(job.input);
        if (!job.import_map_file.empty()) {
            request.import_map = jsxform::ImportMap::parse(read_file(job.import_map_file));
        }

        jsxform::TransformResult result = transformer.transform(request);

        for (const auto& warning : result.warnings) {
            std::cerr << "Warning: " << warning.specifier << ": " << warning.message << "\n";
        }

        std::string code = result.output.code;
        if (result.output.map && !job.output.empty()) {
            const std::string map_file = job.output + ".map";
            write_file(map_file, *result.output.map);
            code += "\n//# sourceMappingURL=" + std::filesystem::path(map_file).filename().string() + "\n";
        }

        if (job.output.empty()) {
            std::cout << code;
            if (result.output.map) {
                std::cerr << "Warning: --source-map needs --out, map not written\n";
            }
        } else {
            write_file(job.output, code);
        }

        if (job.print_deps) {
            for (const auto& dep : result.dependencies) {
                std::cerr << (dep.is_dynamic ? "dynamic " : "static  ")
                          << dep.specifier << " -> " << dep.resolved
                          << (dep.pending ? " (pending)" : "") << "\n";
            }
        }
        return true;
    } catch (const jsxform::ParseError& e) {
        std::cerr << "Error: " << job.input.string() << ":" << e.line() << ":" << e.column()
                  << ": " << e.message() << "\n";
    } catch (const jsxform::ConfigError& e) {
        std::cerr << "Error: invalid configuration: " << e.what() << "\n";
    } catch (const jsxform::EmitError& e) {
        std::cerr << "Error: " << e.what() << "\n";
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
    return false;
}

// Re-runs the job whenever the input or the import map changes
void watch(jsxform::Transformer& transformer, const FileJob& job) {
    namespace fs = std::filesystem;

    auto stamp = [&job]() {
        std::error_code ec;
        auto input_time = fs::last_write_time(job.input, ec);
        if (job.import_map_file.empty()) {
            return std::make_pair(input_time, fs::file_time_type{});
        }
        return std::make_pair(input_time, fs::last_write_time(job.import_map_file, ec));
    };

    std::cout << "Watching " << job.input.string() << " for changes...\n";
    auto last = stamp();
    while (true) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        auto current = stamp();
        if (current != last) {
            last = current;
            if (run_job(transformer, job)) {
                std::cout << "Rebuilt " << job.input.string() << "\n";
            }
        }
    }
}
}  // namespace

int main(int argc, char* argv[]) {
    jsxform::Config config;
    FileJob job;
    std::string input;
    std::string target = "es2020";
    std::string source_type;

    po::options_description desc("jsxform - JavaScript/JSX module transform");
    desc.add_options()
        ("help,h", "Show help message")
        ("input", po::value<std::string>(&input), "Source file to transform")
        ("out,o", po::value<std::string>(&job.output), "Output file (default: stdout)")
        ("filename,f", po::value<std::string>(&job.filename),
            "Module path relative specifiers resolve against (default: the input path)")
        ("import-map,m", po::value<std::string>(&job.import_map_file), "Import map JSON file")
        ("target,t", po::value<std::string>(&target)->default_value("es2020"),
            "Syntax level: es2015 ... es2022, esnext")
        ("jsx-factory", po::value<std::string>(&job.options.jsx_factory)->default_value("React.createElement"),
            "JSX element factory")
        ("jsx-fragment-factory", po::value<std::string>(&job.options.jsx_fragment_factory)->default_value("React.Fragment"),
            "JSX fragment factory")
        ("source-type", po::value<std::string>(&source_type),
            "js, jsx, ts or tsx (default: from the file extension)")
        ("production", "Production build: no fast refresh, .js extensions on local paths")
        ("source-map", "Write <out>.map")
        ("deps", "Print the dependency list to stderr")
        ("plugin-resolves", "Defer bare and remote specifiers to the host")
        ("no-verify", "Skip the QuickJS compile check of the output")
        ("watch,w", "Transform again whenever the input changes")
        ("serve", "Run the HTTP transform service")
        ("host,H", po::value<std::string>(&config.host)->default_value("0.0.0.0"),
            "Host to bind to")
        ("port,p", po::value<uint16_t>(&config.port)->default_value(8080),
            "Port to listen on")
        ("threads,j", po::value<size_t>(&config.thread_count)->default_value(0),
            "Number of worker threads (0 = auto)")
        ("cache-size,s", po::value<size_t>(&config.cache_size)->default_value(1024),
            "Max cached responses (LRU, 0 = off)")
        ("max-memory", po::value<size_t>(&config.max_memory_mb)->default_value(64),
            "Max memory per verifier runtime in MB")
    ;

    po::positional_options_description positional;
    positional.add("input", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << desc << "\n";
        return 1;
    }

    if (vm.count("help")) {
        std::cout << desc << "\n";
        std::cout << "\nUsage:\n";
        std::cout << "  # Transform a file\n";
        std::cout << "  ./jsxform app.jsx -m import_map.json -o app.js --source-map\n\n";
        std::cout << "  # Start the service\n";
        std::cout << "  ./jsxform --serve -p 8080\n\n";
        std::cout << "  # Transform over HTTP\n";
        std::cout << R"(  curl -X POST http://localhost:8080/transform -d '{"filename":"/app.jsx","sourceText":"export default () => <div/>"}')" << "\n";
        return 0;
    }

    config.verify_output = vm.count("no-verify") == 0;

    if (vm.count("serve")) {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::cout << "jsxform v1.0.0\n";
        std::cout << "==============\n";
        std::cout << "Response cache: " << config.cache_size << " entries\n";
        std::cout << "Output verification: " << (config.verify_output ? "on" : "off") << "\n";
        std::cout << "Threads: " << config.get_thread_count() << "\n\n";

        try {
            g_server = std::make_unique<jsxform::Server>(config);
            g_server->run();
        } catch (const std::exception& e) {
            std::cerr << "Fatal error: " << e.what() << "\n";
            return 1;
        }
        return 0;
    }

    if (input.empty()) {
        std::cerr << "Error: no input file\n";
        std::cerr << desc << "\n";
        return 1;
    }

    auto level = jsxform::parse_target_level(target);
    if (!level) {
        std::cerr << "Error: unknown target: " << target << "\n";
        return 1;
    }

    job.input = input;
    if (job.filename.empty()) {
        job.filename = std::filesystem::path(input).generic_string();
    }
    job.options.target = *level;
    if (!source_type.empty()) {
        auto type = jsxform::parse_source_type(source_type);
        if (!type) {
            std::cerr << "Error: unknown source type: " << source_type << "\n";
            return 1;
        }
        job.options.source_type = *type;
    }
    job.options.is_dev = vm.count("production") == 0;
    job.options.source_map = vm.count("source-map") != 0;
    job.has_plugin_resolves = vm.count("plugin-resolves") != 0;
    job.print_deps = vm.count("deps") != 0;

    if (!std::filesystem::exists(job.input)) {
        std::cerr << "Error: Input file not found: " << input << "\n";
        return 1;
    }

    jsxform::BuiltinSyntaxEngine engine;
    std::unique_ptr<jsxform::QuickJsVerifier> verifier;
    if (config.verify_output) {
        try {
            verifier = std::make_unique<jsxform::QuickJsVerifier>(config.max_memory_mb);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }
    jsxform::Transformer transformer(engine, verifier.get());

    const bool ok = run_job(transformer, job);
    if (vm.count("watch")) {
        watch(transformer, job);
    }
    return ok ? 0 : 1;
}
