#ifndef SSHCONF_HOST_BLOCK_HEADER
#define SSHCONF_HOST_BLOCK_HEADER

#include "host_list.hpp"
#include "keyword_set.hpp"

namespace sshconf {

/// one "Host ..." line and the keywords that follow it
struct host_block {
	host_list hosts;
	keyword_set keywords;

	bool operator==(host_block const&) const = default;
};

}

#endif
