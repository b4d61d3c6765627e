#include <glog/logging.h>
#include <cxxopts.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

#include "../common/configuration.h"
#include "../store/in_memory_store.h"
#include "../store/store_server.h"

namespace {

std::atomic<bool> g_shutdown_requested{false};

void HandleShutdownSignal(int) {
	g_shutdown_requested.store(true);
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("tollgate_store_server",
			"Shared atomic store for horizontally scaled Tollgate instances");

	options.add_options()
		("c,config", "YAML configuration file", cxxopts::value<std::string>())
		("p,port", "Listening port (overrides store.listen_port)", cxxopts::value<int>())
		("a,address", "Listening host", cxxopts::value<std::string>()->default_value("0.0.0.0"))
		("sweep_interval_ms", "Expired key purge interval",
		 cxxopts::value<int>()->default_value("1000"))
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);

	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	Tollgate::Configuration& configuration = Tollgate::Configuration::getInstance();
	if (arguments.count("config")) {
		const std::string path = arguments["config"].as<std::string>();
		if (!configuration.loadFromFile(path)) {
			LOG(ERROR) << "Failed to load configuration from " << path;
			for (const auto& error : configuration.getValidationErrors()) {
				LOG(ERROR) << "  " << error;
			}
			return EXIT_FAILURE;
		}
		LOG(INFO) << "Loaded configuration from " << path;
	}

	int port = configuration.config().store.listen_port.get();
	if (arguments.count("port")) {
		port = arguments["port"].as<int>();
	}
	const std::string listen_address =
		arguments["address"].as<std::string>() + ":" + std::to_string(port);

	Tollgate::InMemoryAtomicStore store;
	try {
		Tollgate::AtomicStoreServer server(store, listen_address,
				arguments["sweep_interval_ms"].as<int>());
		LOG(INFO) << "Tollgate store server listening on port " << server.port();

		std::signal(SIGINT, HandleShutdownSignal);
		std::signal(SIGTERM, HandleShutdownSignal);

		while (!g_shutdown_requested.load()) {
			std::this_thread::sleep_for(std::chrono::milliseconds(200));
		}
		LOG(INFO) << "Received shutdown signal";
		server.Shutdown();
	} catch (const std::exception& e) {
		LOG(ERROR) << "Store server failed: " << e.what();
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
