#include <cstdint>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "simenv/demo_device.hpp"
#include "simenv/environment.hpp"
#include "simenv/error.hpp"

namespace {

struct demo_cli_options {
    std::int64_t episodes = 3;
    std::int64_t max_steps = 20;
    std::uint64_t seed = 7;
    std::int64_t restart_every = 0;
    std::int64_t timeout_every = 0;
    bool dump_logs = false;
    bool dump_profile = false;
};

void print_usage(std::ostream& out) {
    out << "usage: simenv_demo [--episodes N] [--max-steps N] [--seed N] [--restart-every N]\n"
           "                   [--timeout-every N] [--dump-logs] [--dump-profile]\n";
}

std::int64_t parse_int_flag(const std::string& flag, const std::string& text) {
    std::size_t consumed = 0;
    std::int64_t value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + ": expected integer, got '" + text + "'");
    }
    if (consumed != text.size()) {
        throw std::invalid_argument(flag + ": expected integer, got '" + text + "'");
    }
    if (value < 0) {
        throw std::invalid_argument(flag + ": must be non-negative");
    }
    return value;
}

demo_cli_options parse_args(int argc, char** argv) {
    demo_cli_options options;
    const std::vector<std::string> args(argv + 1, argv + argc);
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--dump-logs") {
            options.dump_logs = true;
            continue;
        }
        if (arg == "--dump-profile") {
            options.dump_profile = true;
            continue;
        }
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("missing value for " + arg);
        }
        const std::string& value = args[++i];
        if (arg == "--episodes") {
            options.episodes = parse_int_flag(arg, value);
        } else if (arg == "--max-steps") {
            options.max_steps = parse_int_flag(arg, value);
        } else if (arg == "--seed") {
            options.seed = static_cast<std::uint64_t>(parse_int_flag(arg, value));
        } else if (arg == "--restart-every") {
            options.restart_every = parse_int_flag(arg, value);
        } else if (arg == "--timeout-every") {
            options.timeout_every = parse_int_flag(arg, value);
        } else {
            throw std::invalid_argument("unknown argument: " + arg);
        }
    }
    if (options.max_steps == 0) {
        throw std::invalid_argument("--max-steps: must be > 0");
    }
    return options;
}

simenv::array_map random_action(std::mt19937_64& rng) {
    std::uniform_int_distribution<int> type_dist(0, static_cast<int>(simenv::k_num_action_types) - 1);
    std::uniform_real_distribution<float> pos_dist(0.0f, 1.0f);
    simenv::array_map action;
    action.emplace("action_type", simenv::make_scalar(simenv::dtype::int32, static_cast<double>(type_dist(rng))));
    action.emplace("touch_position",
                   simenv::make_array(simenv::dtype::float32,
                                      {2},
                                      {static_cast<double>(pos_dist(rng)), static_cast<double>(pos_dist(rng))}));
    return action;
}

int run_demo(const demo_cli_options& cli) {
    simenv::demo_task_options task_options;
    task_options.max_steps = cli.max_steps;
    auto tasks = std::make_shared<simenv::demo_task_manager>(task_options);

    simenv::demo_device_options device_options;
    device_options.restart_every = cli.restart_every;
    device_options.timeout_every = cli.timeout_every;
    auto device = std::make_shared<simenv::demo_coordinator>(tasks, device_options);

    simenv::environment env(device, tasks, simenv::demo_task_definition(task_options));
    std::mt19937_64 rng(cli.seed);

    for (std::int64_t episode = 0; episode < cli.episodes; ++episode) {
        simenv::timestep ts = env.reset();
        double episode_return = 0.0;
        std::int64_t steps = 0;
        while (!ts.last()) {
            ts = env.step(random_action(rng));
            episode_return += ts.reward;
            ++steps;
        }
        const simenv::array_map extras = env.task_extras();
        const auto score = extras.find("score");
        std::cout << "episode=" << episode + 1 << " steps=" << steps << " return=" << episode_return;
        if (score != extras.end()) {
            std::cout << " score=" << score->second.data.front();
        }
        std::cout << '\n';
    }

    for (const auto& [key, value] : env.telemetry()) {
        std::cout << key << '=' << value << '\n';
    }
    if (cli.dump_profile) {
        std::cout << env.dump_profile();
    }
    env.close();
    if (cli.dump_logs) {
        std::cout << env.dump_logs();
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        return run_demo(parse_args(argc, argv));
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << '\n';
        print_usage(std::cerr);
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
