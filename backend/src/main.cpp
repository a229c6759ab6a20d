#include <iostream>
#include <sstream>
#include <thread>
#include <chrono>
#include <csignal>
#include <atomic>
#include <mutex>
#include <poll.h>
#include <unistd.h>
#include "p2pNode.hpp"

std::atomic<bool> g_running{true};

/**
 * Signal handler for graceful shutdown
 */
void signalHandler(int signum) {
	static bool already_shutting_down = false;

	if (already_shutting_down) {
		_exit(signum);
	}

	already_shutting_down = true;
	g_running = false;
}

void printUsage(const char* program) {
	std::cout << "Usage: " << program << " [options]\n"
	          << "  -c, --config <file>          JSON config file\n"
	          << "  -p, --port <port>            Control port (default 12000)\n"
	          << "  -b, --broadcast-port <port>  Discovery port (default 23333)\n"
	          << "  -n, --name <name>            Node name (default: first free node_N)\n"
	          << "  -d, --downloads <dir>        Downloads directory (default ./downloads)\n"
	          << "  -h, --help                   Show this help" << std::endl;
}

void printCommands() {
	std::cout << "Commands:\n"
	          << "  peers                   List known peers\n"
	          << "  info                    Show this node\n"
	          << "  send <ip:port> <file>   Offer a file to a peer\n"
	          << "  help                    Show this list\n"
	          << "  quit                    Stop the node" << std::endl;
}

/**
 * Applies command-line flags on top of the config file
 * @return: false if the arguments are invalid or help was requested
 */
bool parseArguments(int argc, char* argv[], NodeConfig& config) {
	// The config file comes first so flags can override it
	for (int i = 1; i < argc; i++) {
		std::string arg = argv[i];
		if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
			config = NodeConfig::fromFile(argv[i + 1]);
		}
	}

	for (int i = 1; i < argc; i++) {
		std::string arg = argv[i];
		if (arg == "-h" || arg == "--help") {
			printUsage(argv[0]);
			return false;
		}
		if (i + 1 >= argc) {
			std::cerr << "Missing value for " << arg << std::endl;
			printUsage(argv[0]);
			return false;
		}

		std::string value = argv[++i];
		if (arg == "-c" || arg == "--config") {
			continue;
		} else if (arg == "-p" || arg == "--port") {
			config.control_port = std::stoi(value);
		} else if (arg == "-b" || arg == "--broadcast-port") {
			config.discovery_port = std::stoi(value);
		} else if (arg == "-n" || arg == "--name") {
			config.node_name = value;
		} else if (arg == "-d" || arg == "--downloads") {
			config.download_dir = value;
		} else {
			std::cerr << "Unknown option: " << arg << std::endl;
			printUsage(argv[0]);
			return false;
		}
	}

	config.validate();
	return true;
}

/**
 * Main function
 */
int main(int argc, char* argv[]) {
	NodeConfig config;
	try {
		if (!parseArguments(argc, argv, config)) {
			return 1;
		}
	} catch (const std::exception& e) {
		std::cerr << "Invalid configuration: " << e.what() << std::endl;
		return 1;
	}

	// Register signal handler for Ctrl+C
	signal(SIGINT, signalHandler);
	signal(SIGTERM, signalHandler);

	P2PNode node(config);

	node.getEngine().setReceiveCallback([](const TransferOutcome& outcome) {
		if (outcome.success) {
			std::cout << "Received " << outcome.path << " (" << formatFileSize(outcome.bytes) << ")" << std::endl;
		} else {
			std::cout << "Receive failed: " << outcome.reason << std::endl;
		}
	});
	node.getEngine().setProgressCallback([](const std::string& peer, int percentage) {
		std::cout << "[" << peer << "] " << percentage << "%" << std::endl;
	});

	if (!node.start()) {
		std::cerr << "Failed to start node" << std::endl;
		return 1;
	}

	std::cout << "\n=== LAN Drop ===" << std::endl;
	printCommands();

	// Offer currently shown to the user, answered by the next y/n line
	std::shared_ptr<OfferRequest> awaiting;
	std::mutex awaiting_mutex;

	std::thread prompt_thread([&]() {
		while (g_running) {
			bool busy = false;
			{
				std::lock_guard<std::mutex> lock(awaiting_mutex);
				if (awaiting && awaiting->expired) {
					std::cout << "\nOffer expired" << std::endl;
					awaiting.reset();
				}
				busy = static_cast<bool>(awaiting);
			}
			if (busy) {
				std::this_thread::sleep_for(std::chrono::milliseconds(200));
				continue;
			}

			auto request = node.offerChannel().next(std::chrono::milliseconds(200));
			if (!request) continue;

			std::lock_guard<std::mutex> lock(awaiting_mutex);
			awaiting = request;
			const SendOffer& offer = request->offer.offer;
			std::cout << "\nAccept " << offer.file_name << " (" << formatFileSize(offer.file_size)
			          << ") from " << request->offer.senderKey() << "? [y/n] " << std::flush;
		}
	});

	std::string line;
	while (g_running) {
		struct pollfd stdin_fd;
		stdin_fd.fd = STDIN_FILENO;
		stdin_fd.events = POLLIN;
		int ready = poll(&stdin_fd, 1, 200);
		if (ready <= 0) {
			continue;
		}
		if (!std::getline(std::cin, line)) {
			break;
		}

		std::istringstream input(line);
		std::string command;
		input >> command;
		if (command.empty()) continue;

		{
			std::lock_guard<std::mutex> lock(awaiting_mutex);
			if (awaiting) {
				if (command == "y" || command == "yes" || command == "n" || command == "no") {
					bool accept = command[0] == 'y';
					node.offerChannel().answer(awaiting, accept);
					std::cout << (accept ? "Accepted" : "Rejected") << std::endl;
					awaiting.reset();
					continue;
				}
			}
		}

		if (command == "peers") {
			std::cout << formatPeerTable(node.listPeers()) << std::endl;
		} else if (command == "info") {
			std::cout << node.info() << std::endl;
		} else if (command == "send") {
			std::string target;
			std::string path;
			input >> target;
			std::getline(input >> std::ws, path);
			if (target.empty() || path.empty()) {
				std::cout << "Usage: send <ip:port> <file>" << std::endl;
				continue;
			}

			bool sent = node.sendFile(target, path, [target](const TransferOutcome& outcome) {
				if (outcome.success) {
					std::cout << "Sent " << outcome.path << " to " << target << " ("
					          << formatFileSize(outcome.bytes) << ")" << std::endl;
				} else {
					std::cout << "Sending " << outcome.path << " to " << target << " failed: "
					          << outcome.reason << std::endl;
				}
			});
			if (!sent) {
				std::cout << "Offer not sent" << std::endl;
			}
		} else if (command == "help") {
			printCommands();
		} else if (command == "quit" || command == "exit") {
			break;
		} else {
			std::cout << "Unknown command: " << command << " (try help)" << std::endl;
		}
	}

	std::cout << "\nShutting down..." << std::endl;
	g_running = false;
	prompt_thread.join();
	node.stop();

	std::cout << "Application terminated." << std::endl;
	return 0;
}
