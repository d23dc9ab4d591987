#ifndef SSHCONF_SSHCONF_HEADER
#define SSHCONF_SSHCONF_HEADER

#include "sshconf/common/logger.hpp"
#include "sshconf/core/errors.hpp"
#include "sshconf/core/serializer.hpp"
#include "sshconf/core/ssh_config.hpp"

#include <iosfwd>
#include <string>
#include <string_view>

namespace sshconf {

/// parse config text, throws parser_error
ssh_config parse_config(std::string_view data);
ssh_config parse_config(std::string_view data, logger&);

/// read the whole stream and parse it
ssh_config load_config(std::istream&);
ssh_config load_config(std::istream&, logger&);

/// throws error if the file cannot be read, log lines are prefixed with the file name
ssh_config load_config_file(std::string const& file, logger&);

std::string dump_config(ssh_config const&, render_options const& = {});
void dump_config(ssh_config const&, std::ostream&, render_options const& = {});

}

#endif
