#include <boost/program_options.hpp>
#include <causal/logging/core.hpp>
#include <iostream>
#include <string>
#include <vector>

#include "server.hpp"

namespace po = boost::program_options;
namespace lg = causal::logging;

void print_main_help(const po::options_description &desc) {
    std::cout << "usage: exe <command> [options]\n\n";
    std::cout << "commands:\n";
    std::cout << "  serve\n\n";
    std::cout << desc << std::endl;
    std::cout << "\nEXAMPLES:\n";
    std::cout << "  # Start a single server on port 5001:\n";
    std::cout << "    ./exe serve --name=Server1 --port=5001\n\n";
    std::cout << "  # The default client expects 3 servers, open 3 terminals:\n";
    std::cout << "    Terminal 1: ./exe serve --name=Server1 --port=5001\n";
    std::cout << "    Terminal 2: ./exe serve --name=Server2 --port=5002\n";
    std::cout << "    Terminal 3: ./exe serve --name=Server3 --port=5003\n\n";
}

void print_serve_help(const po::options_description &desc) {
    std::cout << "usage: exe serve [options]\n\n" << desc << std::endl;
    std::cout << "\nEXAMPLES:\n";
    std::cout << "  ./exe serve --name=Server2 --host=0.0.0.0 --port=5002\n";
    std::cout << "  ./exe serve --name=Server1 --roster=Client,Server1 "
                 "--log-file=server1.log\n";
}

void handle_serve(const po::variables_map &vm) {
    std::string log_file = vm["log-file"].as<std::string>();
    if (log_file.empty()) {
        lg::init(lg::level::trace, lg::sink_type::console);
    } else {
        lg::init(lg::level::trace, lg::sink_type::file, log_file);
    }

    causal::server::Options options;
    options.name = vm["name"].as<std::string>();
    options.address = causal::service::Address(vm["host"].as<std::string>(),
                                               vm["port"].as<int>());
    options.roster =
        causal::service::parse_roster(vm["roster"].as<std::string>());
    size_t log_capacity = vm["log-capacity"].as<size_t>();
    if (log_capacity > 0) {
        options.log_capacity = log_capacity;
    }

    causal::server::Server server(options);
    server.wait();
}

int main(int argc, char *argv[]) {
    lg::init(lg::level::info, lg::sink_type::console);
    try {
        // Global options
        po::options_description global_desc("Global Options");
        global_desc.add_options()("help", "show help");

        // Serve options
        po::options_description serve_desc("Serve Options");
        serve_desc.add_options()("help", "show help")(
            "name,n", po::value<std::string>()->default_value("Server1"),
            "set server name (spaces are dropped to form the process id)")(
            "host,h", po::value<std::string>()->default_value("0.0.0.0"),
            "set server host")("port,p", po::value<int>()->default_value(5001),
                               "set server port")(
            "roster,r",
            po::value<std::string>()->default_value(
                "Client,Server1,Server2,Server3"),
            "comma-separated process ids of every participant")(
            "log-capacity", po::value<size_t>()->default_value(0),
            "keep at most this many events (0 keeps all)")(
            "log-file", po::value<std::string>()->default_value(""),
            "write logs to this file instead of the console");

        std::string subcommand;
        std::vector<std::string> sub_args;
        if (argc < 2) {
            subcommand = "serve";
        } else {
            subcommand = argv[1];
            sub_args.assign(argv + 2, argv + argc);
        }

        if (subcommand == "serve") {
            po::variables_map serve_vm;
            po::store(
                po::command_line_parser(sub_args).options(serve_desc).run(),
                serve_vm);
            po::notify(serve_vm);

            if (serve_vm.count("help")) {
                print_serve_help(serve_desc);
                return 0;
            }

            handle_serve(serve_vm);
        } else {
            print_main_help(global_desc);
            return 1;
        }
    } catch (const std::exception &e) {
        lg::write(lg::level::error, e.what());
        return 1;
    }

    return 0;
}
