#include "inbd_command.h"
#include "inbd_config.h"
#include "inbd_host.h"
#include "inbd_http.h"
#include "inbd_paths.h"
#include "inbd_reboot.h"
#include "inbd_request.h"
#include "inbd_service.h"
#include "inbd_state.h"
#include "inbd_status_log.h"
#include "inbd_verifier.h"
#include "utils/string_utils.h"

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {
void printUsage(const std::string &name) {
    std::cout << "Usage: " << name << " <command> [args]\n"
              << "Commands:\n"
              << "  serve                        Handle JSON requests from stdin, one per line\n"
              << "  verify                       Verify the update recorded before the last reboot\n"
              << "  sota [options]               Run a SOTA update\n"
              << "      --mode full|download-only|no-download\n"
              << "      --url <url> --signature <hex> --hash-algorithm <sha256|sha384|sha512>\n"
              << "      --packages <a,b> --kernel-command <args> --release-date <date>\n"
              << "      --duration <seconds> --no-reboot\n"
              << "  power <cycle|off>            Reboot or shut down the system\n"
              << "  config load <uri> [signature] [hash-algorithm]\n"
              << "  config <get|set|append|remove> <path>\n"
              << "  source os-update <line> [line...]\n"
              << "  source app-add <filename> <line> [line...] [--gpg-key-uri <uri> --gpg-key-name <name>]\n"
              << "  source app-remove <filename> [gpg-key-name]\n";
}

// Production collaborators wired together for one process.
struct Agent {
    inbd::Paths paths;
    inbd::SystemCommandExecutor executor;
    inbd::LinuxHost host;
    inbd::CurlTransport http{inbd::custom_ca_file_from_env()};
    inbd::StateStore stateStore{executor, paths.state_file};
    inbd::UpdateLogger logger{paths.status_log, paths.granular_log};
    inbd::DeviceConfig config{paths.config_file, paths.schema_file};
    inbd::AgentContext context{paths, executor, host, http, stateStore, logger, config};
};

int runServe(inbd::RequestService &service) {
    inbd::serve_stream(service, std::cin, std::cout);
    return 0;
}

bool parseSotaArgs(int argc, char **argv, inbd::UpdateRequest &request, std::string &error) {
    for (int i = 2; i < argc; ++i) {
        const std::string_view option = argv[i];
        if (option == "--no-reboot") {
            request.do_not_reboot = true;
            continue;
        }
        if (i + 1 >= argc) {
            error = std::string(option) + " requires a value";
            return false;
        }
        const std::string value = argv[++i];
        if (option == "--mode") {
            const auto mode = inbd::parse_update_mode(value);
            if (!mode) {
                error = "invalid mode: " + value;
                return false;
            }
            request.mode = *mode;
        } else if (option == "--url") {
            request.url = trim(value);
        } else if (option == "--signature") {
            request.signature = trim(value);
        } else if (option == "--hash-algorithm") {
            const auto algorithm = inbd::parse_hash_algorithm(value);
            if (!algorithm) {
                error = "invalid hash algorithm: " + value;
                return false;
            }
            request.hash_algorithm = *algorithm;
        } else if (option == "--packages") {
            for (const auto &name : split(value, ',')) {
                if (!trim(name).empty()) {
                    request.package_list.push_back(trim(name));
                }
            }
        } else if (option == "--kernel-command") {
            request.kernel_command = trim(value);
        } else if (option == "--release-date") {
            request.release_date = value;
        } else if (option == "--duration") {
            char *end = nullptr;
            const long long seconds = std::strtoll(value.c_str(), &end, 10);
            if (value.empty() || *end != '\0' || seconds < 0) {
                error = "invalid duration: " + value;
                return false;
            }
            request.duration_seconds = seconds;
        } else {
            error = "unknown option: " + std::string(option);
            return false;
        }
    }
    return true;
}

int printResponse(int statusCode, const std::string &error) {
    std::cout << "status_code: " << statusCode << std::endl;
    if (!error.empty()) {
        std::cerr << error << std::endl;
    }
    return statusCode == inbd::kStatusOk ? 0 : 1;
}

int runSource(int argc, char **argv, inbd::RequestService &service) {
    if (argc < 4) {
        std::cerr << "source requires an operation and arguments" << std::endl;
        return 1;
    }
    const std::string operation = argv[2];
    inbd::UpdateResponse response;
    if (operation == "os-update") {
        std::vector<std::string> sources(argv + 3, argv + argc);
        response = service.update_os_source(sources);
    } else if (operation == "app-add") {
        inbd::ApplicationSource source;
        source.filename = argv[3];
        for (int i = 4; i < argc; ++i) {
            const std::string_view arg = argv[i];
            if ((arg == "--gpg-key-uri" || arg == "--gpg-key-name") && i + 1 < argc) {
                (arg == "--gpg-key-uri" ? source.gpg_key_uri : source.gpg_key_name) = argv[++i];
            } else {
                source.sources.emplace_back(arg);
            }
        }
        response = service.add_application_source(source);
    } else if (operation == "app-remove") {
        response = service.remove_application_source(argv[3], argc >= 5 ? argv[4] : "");
    } else {
        std::cerr << "unknown source operation: " << operation << std::endl;
        return 1;
    }
    return printResponse(response.status_code, response.error);
}

int runConfig(int argc, char **argv, inbd::RequestService &service) {
    if (argc < 4) {
        std::cerr << "config requires an operation and a path" << std::endl;
        return 1;
    }
    const std::string operation = argv[2];
    const std::string path = argv[3];
    inbd::ConfigResponse response;
    if (operation == "load") {
        response = service.load_config(path, argc >= 5 ? argv[4] : "", argc >= 6 ? argv[5] : "");
    } else if (operation == "get") {
        response = service.get_config(path);
        if (response.success) {
            std::cout << response.value << std::endl;
        }
    } else if (operation == "set") {
        response = service.set_config(path);
    } else if (operation == "append") {
        response = service.append_config(path);
    } else if (operation == "remove") {
        response = service.remove_config(path);
    } else {
        std::cerr << "unknown config operation: " << operation << std::endl;
        return 1;
    }
    return printResponse(response.status_code, response.error);
}
}

int main(int argc, char **argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    inbd::init_http();
    Agent agent;
    inbd::RequestService service(agent.context);

    std::string command = argv[1];
    if (command == "serve") {
        return runServe(service);
    } else if (command == "verify") {
        inbd::PostBootVerifier verifier(agent.context);
        verifier.run();
        return 0;
    } else if (command == "sota") {
        inbd::UpdateRequest request;
        std::string error;
        if (!parseSotaArgs(argc, argv, request, error)) {
            std::cerr << error << std::endl;
            return 1;
        }
        const auto response = service.update_system_software(request);
        return printResponse(response.status_code, response.error);
    } else if (command == "power") {
        if (argc < 3) {
            std::cerr << "power requires an action (cycle|off)" << std::endl;
            return 1;
        }
        const auto action = inbd::parse_power_action(argv[2]);
        if (!action) {
            std::cerr << "invalid power action: " << argv[2] << std::endl;
            return 1;
        }
        const auto response = service.set_power_state(*action);
        return printResponse(response.status_code, response.error);
    } else if (command == "config") {
        return runConfig(argc, argv, service);
    } else if (command == "source") {
        return runSource(argc, argv, service);
    } else {
        printUsage(argv[0]);
        return 1;
    }
}
