#ifndef SSHCONF_KEYWORD_SET_HEADER
#define SSHCONF_KEYWORD_SET_HEADER

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sshconf {

/** \brief Keyword/value pairs of one Host block
 *
 *  Keys are stored in the canonical spelling of the keyword table and every key given to
 *  the interface is normalised first, so "user", "USER" and "User" address the same entry.
 *  Insertion order is kept, it is the order the serialiser writes the keywords in.
 */
class keyword_set {
public:
	using value_type = std::pair<std::string, std::string>;
	using const_iterator = std::vector<value_type>::const_iterator;

	keyword_set() = default;
	keyword_set(std::initializer_list<value_type>);

	/// canonical spelling of the keyword, throws invalid_keyword for unknown keywords and for Host/Match
	static std::string normalize(std::string_view name);

	bool contains(std::string_view name) const;

	/// throws key_not_found if the keyword is not set
	std::string const& get(std::string_view name) const;
	std::string const& operator[](std::string_view name) const { return get(name); }

	/// insert or overwrite
	void set(std::string_view name, std::string value);

	/// returns true if the keyword was set
	bool erase(std::string_view name);

	/// add the entries of other whose keyword is not yet set here, existing values are never overwritten
	void merge_missing(keyword_set const& other);

	std::size_t size() const { return values_.size(); }
	bool empty() const { return values_.empty(); }

	const_iterator begin() const { return values_.begin(); }
	const_iterator end() const { return values_.end(); }

	bool operator==(keyword_set const&) const = default;

private:
	std::vector<value_type>::iterator find(std::string const& key);
	const_iterator find(std::string const& key) const;

private:
	std::vector<value_type> values_;
};

}

#endif
