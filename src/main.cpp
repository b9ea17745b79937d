#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <memory>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "judge/grader.hpp"
#include "model/catalog.hpp"
#include "sandbox/docker.hpp"
#include "store/redis_result_store.hpp"
#include "store/result_store.hpp"
using namespace std;

static const int EXIT_INFRASTRUCTURE = 1;
static const int EXIT_USAGE = 2;

static unique_ptr<autograder::result_store> make_store(const autograder::store_config& config) {
    if (config.type == "redis")
        return make_unique<autograder::redis_result_store>(config.redis);
    return make_unique<autograder::memory_result_store>();
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("autograder options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>()->required(), "set the configuration file")
        ("catalog", po::value<string>()->required(), "set the catalog file with submissions and test cases, compile states are written back to it")
        ("full-test", po::value<string>(), "delete cached results of the submission and evaluate it from scratch")
        ("results", po::value<string>(), "print test results of the submission, running only test cases without cached results")
        ("grade", po::value<string>(), "print the grade summary of the submission")
        ("work-root", po::value<string>(), "set the root directory of working directories. You can either pass it from environ WORKROOT")
        ("runtime-descriptor", po::value<string>(), "set the Dockerfile template of sandbox images. You can either pass it from environ RUNTIMEDESCRIPTOR")
        ("docker-socket", po::value<string>(), "set the unix socket of the docker engine. You can either pass it from environ DOCKERSOCKET")
        ("parallelism", po::value<size_t>(), "set the maximum number of containers running at the same time for one submission. You can either pass it from environ PARALLELISM")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "autograder: compile submissions, run them against test cases in docker containers" << endl
                 << "Usage: " << argv[0] << " --config <file> --catalog <file> (--full-test <id> | --results <id> | --grade <id>)" << endl;
            cout << desc << endl;
            return EXIT_SUCCESS;
        }
        if (vm.count("version")) {
            cout << "autograder 1.0" << endl;
            return EXIT_SUCCESS;
        }
        po::notify(vm);
        if (vm.count("full-test") + vm.count("results") + vm.count("grade") != 1)
            throw po::error("exactly one of --full-test, --results and --grade should be specified");
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_USAGE;
    }

    autograder::grader_config config;
    try {
        config = autograder::load_config(vm.at("config").as<string>());
    } catch (std::exception& e) {
        cerr << "Configuration file " << vm.at("config").as<string>() << " is malformed: " << e.what() << endl;
        return EXIT_USAGE;
    }

    if (vm.count("work-root")) {
        config.work_root = vm.at("work-root").as<string>();
    } else if (getenv("WORKROOT")) {
        config.work_root = getenv("WORKROOT");
    }
    CHECK(filesystem::is_directory(config.work_root))
        << "Work root " << config.work_root << " does not exist";

    if (vm.count("runtime-descriptor")) {
        config.runtime_descriptor = vm.at("runtime-descriptor").as<string>();
    } else if (getenv("RUNTIMEDESCRIPTOR")) {
        config.runtime_descriptor = getenv("RUNTIMEDESCRIPTOR");
    }
    CHECK(filesystem::is_regular_file(config.runtime_descriptor))
        << "Runtime descriptor " << config.runtime_descriptor << " does not exist";

    if (vm.count("docker-socket")) {
        config.engine.socket = vm.at("docker-socket").as<string>();
    } else if (getenv("DOCKERSOCKET")) {
        config.engine.socket = getenv("DOCKERSOCKET");
    }

    try {
        if (vm.count("parallelism")) {
            config.sandbox.parallelism = vm.at("parallelism").as<size_t>();
        } else if (getenv("PARALLELISM")) {
            config.sandbox.parallelism = boost::lexical_cast<size_t>(getenv("PARALLELISM"));
        }
    } catch (boost::bad_lexical_cast& e) {
        cerr << "PARALLELISM should be a positive integer" << endl;
        return EXIT_USAGE;
    }
    if (config.sandbox.parallelism == 0) {
        cerr << "parallelism should be positive" << endl;
        return EXIT_USAGE;
    }

    filesystem::path catalog_path = vm.at("catalog").as<string>();
    autograder::memory_catalog records;
    try {
        records.load(catalog_path);
    } catch (std::exception& e) {
        cerr << "Catalog file " << catalog_path << " is malformed: " << e.what() << endl;
        return EXIT_USAGE;
    }

    autograder::sandbox::docker_engine engine(config.engine);
    unique_ptr<autograder::result_store> store = make_store(config.store);
    autograder::grader grader(config, engine, records, *store);

    try {
        if (vm.count("grade")) {
            cout << grader.grade(vm.at("grade").as<string>()) << endl;
        } else {
            autograder::submission_results results = vm.count("full-test")
                                                         ? grader.full_test(vm.at("full-test").as<string>())
                                                         : grader.test_results(vm.at("results").as<string>());
            // 选手程序的输出不一定是合法的 UTF-8
            cout << nlohmann::json(results).dump(4, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
        }
        autograder::write_file_content(catalog_path, records.dump().dump(4));
    } catch (out_of_range& e) {
        cerr << e.what() << endl;
        return EXIT_USAGE;
    } catch (invalid_argument& e) {
        cerr << e.what() << endl;
        return EXIT_USAGE;
    } catch (autograder::grader_exception& e) {
        LOG(ERROR) << e;
        cerr << e.what() << endl;
        return EXIT_INFRASTRUCTURE;
    } catch (std::exception& e) {
        LOG(ERROR) << "Evaluation failed: " << e.what();
        cerr << e.what() << endl;
        return EXIT_INFRASTRUCTURE;
    }

    return EXIT_SUCCESS;
}
