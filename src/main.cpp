#include <curl/curl.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <iterator>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "execution/executor.hpp"
#include "sandbox/docker_client.hpp"
using namespace std;
using nlohmann::json;

static string read_request(const string &source) {
    if (source == "-")
        return string(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    return runner::read_file_content(source);
}

int main(int argc, char *argv[]) {
    FLAGS_logtostderr = true;
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("code-runner options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("request", po::value<string>(), "execute the request document in the given file, or read it from stdin if the file is -")
        ("ping", "check whether the docker daemon is reachable")
        ("docker-socket", po::value<string>(), "set the unix socket of the docker daemon, default to /var/run/docker.sock. You can either pass it from environ DOCKER_SOCKET")
        ("docker-api-version", po::value<string>(), "set the docker engine api version, default to v1.41. You can either pass it from environ DOCKER_API_VERSION")
        ("image-prefix", po::value<string>(), "set the prefix of language images, default to runner-. You can either pass it from environ RUNNER_IMAGE_PREFIX")
        ("memory-limit", po::value<int64_t>(), "set memory limit in bytes of each container, default to 268435456(256MB). You can either pass it from environ RUNNER_MEMORY_LIMIT")
        ("cpu-quota", po::value<int64_t>(), "set cpu quota in microseconds per 100ms period, default to 50000(0.5 core). You can either pass it from environ RUNNER_CPU_QUOTA")
        ("timeout", po::value<int64_t>(), "set default time limit in milliseconds for requests without one, default to 5000. You can either pass it from environ RUNNER_TIMEOUT")
        ("max-timeout", po::value<int64_t>(), "set the largest time limit in milliseconds a request may ask for, default to 300000. You can either pass it from environ RUNNER_MAX_TIMEOUT")
        ("output-limit", po::value<int64_t>(), "set the largest output in bytes kept for each job, default to 16777216(16MB). You can either pass it from environ RUNNER_OUTPUT_LIMIT")
        ("tmp-dir", po::value<string>(), "set the directory to create workspaces in. You can either pass it from environ RUNNER_TMPDIR")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "CodeRunner: execute untrusted programs in resource-capped docker containers" << endl
             << "The user must be able to access the docker daemon socket" << endl
             << "Usage: " << argv[0] << " --request <file|-> [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "code-runner 1.0" << endl;
        return EXIT_SUCCESS;
    }

    try {
        if (vm.count("docker-socket")) {
            runner::DOCKER_SOCKET = vm.at("docker-socket").as<string>();
        } else if (getenv("DOCKER_SOCKET")) {
            runner::DOCKER_SOCKET = getenv("DOCKER_SOCKET");
        }

        if (vm.count("docker-api-version")) {
            runner::DOCKER_API_VERSION = vm.at("docker-api-version").as<string>();
        } else if (getenv("DOCKER_API_VERSION")) {
            runner::DOCKER_API_VERSION = getenv("DOCKER_API_VERSION");
        }

        if (vm.count("image-prefix")) {
            runner::IMAGE_PREFIX = vm.at("image-prefix").as<string>();
        } else if (getenv("RUNNER_IMAGE_PREFIX")) {
            runner::IMAGE_PREFIX = getenv("RUNNER_IMAGE_PREFIX");
        }

        if (vm.count("memory-limit")) {
            runner::MEMORY_LIMIT = vm.at("memory-limit").as<int64_t>();
        } else if (getenv("RUNNER_MEMORY_LIMIT")) {
            runner::MEMORY_LIMIT = boost::lexical_cast<int64_t>(getenv("RUNNER_MEMORY_LIMIT"));
        }

        if (vm.count("cpu-quota")) {
            runner::CPU_QUOTA = vm.at("cpu-quota").as<int64_t>();
        } else if (getenv("RUNNER_CPU_QUOTA")) {
            runner::CPU_QUOTA = boost::lexical_cast<int64_t>(getenv("RUNNER_CPU_QUOTA"));
        }

        if (vm.count("timeout")) {
            runner::DEFAULT_TIMEOUT = chrono::milliseconds(vm.at("timeout").as<int64_t>());
        } else if (getenv("RUNNER_TIMEOUT")) {
            runner::DEFAULT_TIMEOUT = chrono::milliseconds(boost::lexical_cast<int64_t>(getenv("RUNNER_TIMEOUT")));
        }

        if (vm.count("max-timeout")) {
            runner::MAX_TIMEOUT = chrono::milliseconds(vm.at("max-timeout").as<int64_t>());
        } else if (getenv("RUNNER_MAX_TIMEOUT")) {
            runner::MAX_TIMEOUT = chrono::milliseconds(boost::lexical_cast<int64_t>(getenv("RUNNER_MAX_TIMEOUT")));
        }

        if (vm.count("output-limit")) {
            runner::OUTPUT_LIMIT = vm.at("output-limit").as<int64_t>();
        } else if (getenv("RUNNER_OUTPUT_LIMIT")) {
            runner::OUTPUT_LIMIT = boost::lexical_cast<int64_t>(getenv("RUNNER_OUTPUT_LIMIT"));
        }
    } catch (boost::bad_lexical_cast &e) {
        cerr << "Invalid numeric option in environment: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("tmp-dir")) {
        runner::TEMP_DIR = filesystem::path(vm.at("tmp-dir").as<string>());
    } else if (getenv("RUNNER_TMPDIR")) {
        runner::TEMP_DIR = filesystem::path(getenv("RUNNER_TMPDIR"));
    }
    try {
        runner::TEMP_DIR = runner::prepare_temp_root(runner::TEMP_DIR);
    } catch (filesystem::filesystem_error &e) {
        cerr << "Unable to prepare temporary directory: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    CHECK(runner::MEMORY_LIMIT > 0) << "Memory limit should be positive";
    CHECK(runner::CPU_QUOTA > 0) << "CPU quota should be positive";
    CHECK(runner::DEFAULT_TIMEOUT.count() > 0) << "Default timeout should be positive";
    CHECK(runner::DEFAULT_TIMEOUT <= runner::MAX_TIMEOUT) << "Default timeout should not exceed max timeout";
    CHECK(runner::OUTPUT_LIMIT > 0) << "Output limit should be positive";

    curl_global_init(CURL_GLOBAL_ALL);
    runner::sandbox::docker_client docker = runner::sandbox::docker_client::from_config();

    if (vm.count("ping")) {
        bool alive = docker.ping();
        cout << (alive ? "ok" : "unreachable") << endl;
        curl_global_cleanup();
        return alive ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (!vm.count("request")) {
        cerr << "Either --request or --ping is required" << endl
             << endl;
        cerr << desc << endl;
        curl_global_cleanup();
        return EXIT_FAILURE;
    }

    runner::execution_outcome outcome;
    try {
        json document = json::parse(read_request(vm.at("request").as<string>()), nullptr, false);
        if (document.is_discarded())
            throw runner::invalid_request_error("Request is not a valid JSON document");
        runner::executor engine(docker, runner::executor_options::from_config());
        outcome = engine.execute(runner::parse_request(document));
    } catch (runner::runner_exception &ex) {
        LOG(WARNING) << "Rejected request: " << ex.what();
        outcome = runner::failed_outcome(ex.what());
    } catch (system_error &ex) {
        LOG(ERROR) << "Unable to read request: " << ex.what();
        outcome = runner::failed_outcome(ex.what());
    }

    cout << runner::to_json(outcome).dump(4) << endl;
    curl_global_cleanup();
    return outcome.success ? EXIT_SUCCESS : EXIT_FAILURE;
}
