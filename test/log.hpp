#ifndef SSHCONF_TEST_LOG_HEADER
#define SSHCONF_TEST_LOG_HEADER

#include "sshconf/common/logger.hpp"

namespace sshconf::test {

// silent unless the runner is started with --show-log
stdout_logger& test_log();

}

#endif
