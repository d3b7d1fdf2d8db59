/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#define BOOST_TEST_MODULE dsched_unittests
#include <cstring>
#include <boost/test/unit_test.hpp>
#include <fc/log/logger.hpp>

struct logging_fixture {
    logging_fixture() {
        auto& suite = boost::unit_test::framework::master_test_suite();

        bool is_verbose = false;
        for(int i = 1; i < suite.argc; i++) {
            if(std::strcmp(suite.argv[i], "--verbose") == 0) {
                is_verbose = true;
                break;
            }
        }
        if(!is_verbose) {
            fc::logger::get(DEFAULT_LOGGER).set_log_level(fc::log_level::off);
        }
    }
};

BOOST_TEST_GLOBAL_FIXTURE(logging_fixture);
