/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#include <iostream>

#include <boost/program_options.hpp>

#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/variant.hpp>
#include <fc/variant_object.hpp>

#include <dsched/chain/controller.hpp>
#include <dsched/chain/event_log.hpp>
#include <dsched/chain/exceptions.hpp>
#include <dsched/chain/execution_sink.hpp>

using namespace dsched::chain;
using namespace dsched::chain::name_literals;

namespace bpo = boost::program_options;

namespace dsched {

/**
 *  Tasks to submit into a new block, followed by `produce` blocks
 *  (at least one, the block carrying the submissions).
 */
struct replay_step {
    vector<task> submit;
    uint32_t     produce = 1;
};

struct replay_script {
    vector<replay_step> steps;
};

}  // namespace dsched

FC_REFLECT(dsched::replay_step, (submit)(produce));
FC_REFLECT(dsched::replay_script, (steps));

namespace dsched {

class json_event_log : public event_log {
public:
    explicit json_event_log(std::ostream& out)
        : out_(out) {}

    void
    append(const task_event& ev) override {
        out_ << fc::json::to_string(fc::mutable_variant_object("event", ev)) << std::endl;
    }

private:
    std::ostream& out_;
};

void
register_builtin_handlers(action_dispatcher& dispatcher) {
    dispatcher.register_handler("noop"_n, [](const auto&, const auto&) {});
    dispatcher.register_handler("log"_n, [](const action& act, const account_name& as) {
        ilog("${as}: ${data}", ("as", as)("data", std::string(act.data.begin(), act.data.end())));
    });
}

int
replay(const replay_script& script, const controller::config& cfg) {
    auto dispatcher = action_dispatcher();
    auto log        = json_event_log(std::cout);

    register_builtin_handlers(dispatcher);

    auto control = controller(cfg, dispatcher, log);
    control.startup();

    ilog("replaying ${s} steps with config: ${c}", ("s", script.steps.size())("c", control.get_config()));

    for(auto& step : script.steps) {
        control.start_block();
        for(auto& t : step.submit) {
            try {
                control.schedule_task(t);
            }
            catch(const invalid_nonce_exception& e) {
                std::cout << fc::json::to_string(fc::mutable_variant_object("rejected", t)("error", e.top_message())) << std::endl;
            }
        }

        auto summary = control.finalize_block();
        std::cout << fc::json::to_string(fc::mutable_variant_object("block", summary)) << std::endl;

        for(auto i = 1u; i < step.produce; i++) {
            control.start_block();
            summary = control.finalize_block();
            std::cout << fc::json::to_string(fc::mutable_variant_object("block", summary)) << std::endl;
        }
    }

    ilog("replay finished at block ${n}, ${c} tasks carried over",
         ("n", control.head_block_num())("c", control.get_carry_over().size()));
    return 0;
}

}  // namespace dsched

int
main(int argc, char** argv) {
    try {
        auto opts = bpo::options_description("dsched-replay options");
        opts.add_options()
            ("help,h", "Print this help message and exit.")
            ("script,s", bpo::value<std::string>()->required(), "JSON file with the steps to replay")
            ("state-dir,d", bpo::value<std::string>(), "Directory of the state database, a temporary one is used when absent")
            ("max-tasks-per-block,m", bpo::value<uint32_t>()->default_value(config::default_max_tasks_per_block),
                "Maximum number of tasks executed in one block")
            ("state-size-mb", bpo::value<uint64_t>()->default_value(config::default_state_size / (1024 * 1024)),
                "Maximum size (in MiB) of the state database");

        auto vmap = bpo::variables_map();
        bpo::store(bpo::parse_command_line(argc, argv, opts), vmap);
        if(vmap.count("help")) {
            std::cout << opts << std::endl;
            return 0;
        }
        bpo::notify(vmap);

        auto temp = fc::temp_directory();

        auto cfg                = controller::config();
        cfg.max_tasks_per_block = vmap["max-tasks-per-block"].as<uint32_t>();
        cfg.state_size          = vmap["state-size-mb"].as<uint64_t>() * 1024 * 1024;
        cfg.state_dir           = vmap.count("state-dir") ? fc::path(vmap["state-dir"].as<std::string>()) : temp.path();

        auto script_path = fc::path(vmap["script"].as<std::string>());
        DSCHED_ASSERT(fc::exists(script_path), replay_script_exception,
            "Script file: ${p} doesn't exist", ("p", script_path));

        auto script = fc::json::from_file(script_path).as<dsched::replay_script>();
        return dsched::replay(script, cfg);
    }
    catch(const fc::exception& e) {
        elog("${e}", ("e", e.to_detail_string()));
    }
    catch(const bpo::error& e) {
        elog("${e}", ("e", e.what()));
    }
    catch(const std::exception& e) {
        elog("${e}", ("e", e.what()));
    }
    return 1;
}
