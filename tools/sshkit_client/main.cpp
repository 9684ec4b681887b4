#include "client.hpp"
#include "sshkit/engine/libssh2/libssh2_engine.hpp"

#include <stdexcept>
#include <iostream>

int main(int argc, char* argv[]) {
	try {
		using namespace sshkit;
		client_commands p;
		p.parse(argc, argv);
		if(p.help) {
			std::cout << "sshkit client\n";
			client_commands().print_help(std::cout);
			return 0;
		}
		if(!p.config_file.empty()) {
			p.parse_file(p.config_file);
			// command line overrides the config file
			p.parse(argc, argv);
		}

		libssh2_engine engine;
		sshkit_client client(engine, p, std::cout);
		return client.run();
	} catch(std::exception const& e) {
		std::cerr << "Exception: " << e.what() << "\n";
		return 1;
	}
}
