#include <boost/program_options.hpp>
#include <causal/logging/core.hpp>
#include <causal/service/wire.hpp>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "client.hpp"
#include "menu.hpp"

namespace po = boost::program_options;
namespace lg = causal::logging;

void print_help(const po::options_description &desc) {
    std::cout << "usage: exe [options]\n\n" << desc << std::endl;
    std::cout << "\nEXAMPLES:\n";
    std::cout << "  # Talk to the three default servers on localhost:\n";
    std::cout << "    ./exe\n\n";
    std::cout << "  # Two servers on other hosts, logging to a file:\n";
    std::cout << "    ./exe --server=Server1=10.0.0.5:5001 "
                 "--server=Server2=10.0.0.6:5001 \\\n"
                 "          --roster=Client,Server1,Server2 "
                 "--log-file=client.log\n";
}

int main(int argc, char *argv[]) {
    lg::init(lg::level::info, lg::sink_type::console);
    try {
        po::options_description desc("Client Options");
        desc.add_options()("help", "show help")(
            "id,i", po::value<std::string>()->default_value("Client"),
            "process id of this client (must be in the roster)")(
            "server,s", po::value<std::vector<std::string>>()->composing(),
            "server as name=host:port, repeatable (default Server1..3 on "
            "localhost:5001..5003)")(
            "roster,r",
            po::value<std::string>()->default_value(
                "Client,Server1,Server2,Server3"),
            "comma-separated process ids of every participant")(
            "log-file", po::value<std::string>()->default_value(""),
            "write logs to this file (default: errors only, to the console)");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            print_help(desc);
            return 0;
        }

        std::string log_file = vm["log-file"].as<std::string>();
        if (log_file.empty()) {
            // keep the console for the menu
            lg::init(lg::level::error, lg::sink_type::console);
        } else {
            lg::init(lg::level::trace, lg::sink_type::file, log_file);
        }

        std::vector<causal::client::ServerInfo> servers;
        if (vm.count("server")) {
            const auto &texts = vm["server"].as<std::vector<std::string>>();
            for (const auto &text : texts) {
                servers.push_back(causal::client::parse_server(text));
            }
        } else {
            servers = causal::client::default_servers();
        }

        causal::client::Client client(
            vm["id"].as<std::string>(),
            causal::service::parse_roster(vm["roster"].as<std::string>()),
            std::move(servers));
        causal::client::Menu menu(client, std::cin, std::cout);
        menu.run();
    } catch (const std::exception &e) {
        lg::write(lg::level::error, e.what());
        return 1;
    }

    return 0;
}
