#ifndef SSHCONF_HOST_LIST_HEADER
#define SSHCONF_HOST_LIST_HEADER

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sshconf {

/// one glob pattern of a Host line, "!pattern" in source form when negated
struct host_pattern {
	std::string pattern;
	bool negated{};

	/// glob match of the pattern itself, ignoring the negation
	bool glob_match(std::string_view hostname) const;

	std::string to_string() const;

	bool operator==(host_pattern const&) const = default;
};

host_pattern parse_host_pattern(std::string_view);

/** \brief Patterns of one Host line
 *
 *  Every pattern is evaluated. A matching negated pattern vetoes the whole list no matter
 *  where it is, otherwise the list matches if any positive pattern matches.
 */
class host_list {
public:
	host_list() = default;
	explicit host_list(std::vector<host_pattern> patterns)
	: patterns_(std::move(patterns))
	{
	}
	/// patterns in source form ("!" prefix for negation)
	explicit host_list(std::vector<std::string> const& patterns);
	host_list(std::initializer_list<std::string_view> patterns);

	/// throws invalid_argument if hostname is empty
	bool matches(std::string_view hostname) const;

	void add(host_pattern p) {
		patterns_.push_back(std::move(p));
	}

	bool empty() const { return patterns_.empty(); }
	std::size_t size() const { return patterns_.size(); }

	/// space separated source form, as written after "Host"
	std::string to_string() const;

	std::vector<host_pattern>::const_iterator begin() const { return patterns_.begin(); }
	std::vector<host_pattern>::const_iterator end() const { return patterns_.end(); }

	bool operator==(host_list const&) const = default;

private:
	std::vector<host_pattern> patterns_;
};

/// the implicit list of keywords that appear before the first Host line
host_list const& wildcard_host_list();

}

#endif
