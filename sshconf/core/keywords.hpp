#ifndef SSHCONF_KEYWORDS_HEADER
#define SSHCONF_KEYWORDS_HEADER

#include <span>
#include <string_view>

namespace sshconf {

std::string_view const host_keyword = "Host";
std::string_view const match_keyword = "Match";

/// every keyword recognised in the client config, in canonical spelling (includes Host and Match)
std::span<std::string_view const> all_keywords();

/// canonical spelling of the keyword (case-insensitive lookup), empty if the keyword is not known
std::string_view canonical_keyword(std::string_view name);

inline bool is_keyword(std::string_view name) {
	return !canonical_keyword(name).empty();
}

}

#endif
