#ifndef SSHCONF_SSH_CONFIG_HEADER
#define SSHCONF_SSH_CONFIG_HEADER

#include "host_block.hpp"

#include <string_view>
#include <vector>

namespace sshconf {

/** \brief Parsed client configuration
 *
 *  Blocks are kept in file order, which is also the precedence order: for a given host
 *  the first matching block that sets a keyword decides its value.
 */
class ssh_config {
public:
	using const_iterator = std::vector<host_block>::const_iterator;

	ssh_config() = default;

	/// add block to the end, no merging
	void append(host_block);

	/// merge keywords into an existing block with the same host list (existing values win), otherwise append
	void add(host_list hosts, keyword_set keywords);

	/// blocks whose host list matches hostname, in file order. Throws invalid_argument for empty hostname
	std::vector<host_block> get_matching_hosts(std::string_view hostname) const;

	/// all keywords that apply to hostname, first matching block wins per keyword
	keyword_set get_config_for_host(std::string_view hostname) const;

	std::vector<host_block> const& blocks() const { return blocks_; }

	std::size_t size() const { return blocks_.size(); }
	bool empty() const { return blocks_.empty(); }

	const_iterator begin() const { return blocks_.begin(); }
	const_iterator end() const { return blocks_.end(); }

	bool operator==(ssh_config const&) const = default;

private:
	std::vector<host_block> blocks_;
};

}

#endif
