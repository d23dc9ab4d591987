
#include "keyword_set.hpp"
#include "errors.hpp"
#include "keywords.hpp"

#include <algorithm>

namespace sshconf {

keyword_set::keyword_set(std::initializer_list<value_type> list) {
	for(auto&& [k, v] : list) {
		set(k, v);
	}
}

std::string keyword_set::normalize(std::string_view name) {
	auto canonical = canonical_keyword(name);
	if(canonical.empty() || canonical == host_keyword || canonical == match_keyword) {
		throw invalid_keyword(name);
	}
	return std::string(canonical);
}

std::vector<keyword_set::value_type>::iterator keyword_set::find(std::string const& key) {
	return std::find_if(values_.begin(), values_.end(), [&](auto const& v) { return v.first == key; });
}

keyword_set::const_iterator keyword_set::find(std::string const& key) const {
	return std::find_if(values_.begin(), values_.end(), [&](auto const& v) { return v.first == key; });
}

bool keyword_set::contains(std::string_view name) const {
	return find(normalize(name)) != values_.end();
}

std::string const& keyword_set::get(std::string_view name) const {
	auto key = normalize(name);
	auto it = find(key);
	if(it == values_.end()) {
		throw key_not_found(key);
	}
	return it->second;
}

void keyword_set::set(std::string_view name, std::string value) {
	auto key = normalize(name);
	auto it = find(key);
	if(it != values_.end()) {
		it->second = std::move(value);
	} else {
		values_.emplace_back(std::move(key), std::move(value));
	}
}

bool keyword_set::erase(std::string_view name) {
	auto it = find(normalize(name));
	if(it == values_.end()) {
		return false;
	}
	values_.erase(it);
	return true;
}

void keyword_set::merge_missing(keyword_set const& other) {
	for(auto&& [k, v] : other) {
		// keys of other are already canonical
		if(find(k) == values_.end()) {
			values_.emplace_back(k, v);
		}
	}
}

}
