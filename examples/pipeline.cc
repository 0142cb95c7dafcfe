// fan out work to two stages and join on both finishing.
//
//   lockstep-pipeline --delay-ms 300 --verbose
//
// the join returns after one delay, not two, because the stages run
// concurrently once released.

#include <chrono>
#include <iostream>
#include <thread>
#include "lockstep/config.hh"
#include "lockstep/rendezvous.hh"
#include "lockstep/task.hh"

using namespace lockstep;
using namespace std::chrono;

static void stage(rendezvous &rv, const std::string &name, milliseconds delay) {
    rv.wait("go" + name);
    std::this_thread::sleep_for(delay);
    rv.emit("done" + name);
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    config conf;
    long delay_ms = 0;

    po::options_description desc("Allowed options");
    desc.add_options()
        ("help", "Show help message")
        ("delay-ms", po::value(&delay_ms)->default_value(300), "how long each stage works")
        ;

    po::variables_map vm;
    try {
        conf = config::from_env();
        // defaults shown by --help come from the environment
        conf.add_options(desc);
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl << std::endl;
        std::cerr << desc << std::endl;
        return 1;
    }
    if (vm.count("help")) {
        std::cerr << desc << std::endl;
        return 1;
    }

    const milliseconds delay{delay_ms};
    try {
        rendezvous rv{default_reporter(), conf};
        task one = task::spawn([&] { stage(rv, "1", delay); });
        task two = task::spawn([&] { stage(rv, "2", delay); });

        const auto begin = steady_clock::now();
        rv.emit("go1");
        rv.emit("go2");
        rv.wait("done1", "done2");
        const auto took = duration_cast<milliseconds>(steady_clock::now() - begin);

        one.join();
        two.join();
        LOG(INFO) << "both stages done in " << took.count() << "ms (stage delay " << delay.count() << "ms)";
    } catch (failure &e) {
        LOG(ERROR) << "pipeline failed: " << e.what();
        return 2;
    }
    return 0;
}
