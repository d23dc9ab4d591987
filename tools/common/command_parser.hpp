#ifndef SSHCONF_TOOLS_COMMON_COMMAND_PARSER_HEADER
#define SSHCONF_TOOLS_COMMON_COMMAND_PARSER_HEADER

#include "sshconf/common/util.hpp"
#include "sshconf/core/errors.hpp"

#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

namespace sshconf {

struct option_base {
	virtual ~option_base() {}
	virtual void parse(std::vector<std::string> const&) = 0;
	virtual void print(std::ostream&) const = 0;
};

struct option {
	option(std::string n, std::string a, std::string i, std::unique_ptr<option_base> p)
	: name(std::move(n))
	, alias(std::move(a))
	, info(std::move(i))
	, extract(std::move(p))
	{}

	std::string name;
	std::string alias;
	std::string info;
	std::unique_ptr<option_base> extract;
};

/** \brief "--name value" / "-alias value" options from the command line or an options file
 *
 *  Values containing spaces can be quoted with '"'. Positional arguments are ignored.
 *  Unknown options and values that do not convert throw invalid_argument.
 */
class command_parser {
public:
	command_parser(bool show_value_in_help = true)
	: show_value_in_help_(show_value_in_help)
	{}

	template<typename T>
	void add(T& var, std::string name, std::string alias, std::string info);

	/// named parameter with optional value, set to default constructed T if given without value
	template<typename T>
	void add(std::optional<T>& var, std::string name, std::string alias, std::string info);

	/// flag without value
	void add(bool& var, std::string name, std::string alias, std::string info);

	void parse(int argc, char* args[]);
	void parse(std::istream&);
	void parse(std::string);

	/// one or more options per line, '#' starts a comment line
	void parse_file(std::string const& file_name);

	void print_help(std::ostream&) const;
private:
	template<typename Option, typename T>
	void add_impl(T& var, std::string name, std::string alias, std::string info);
	std::string parse_name(std::istream& in);
	std::string parse_quoted(std::istream& in);
	std::string parse_arg(std::istream& in);
	void parse_args(std::istream& in, std::string const& name);
private:
	std::map<std::string, std::shared_ptr<option>> options_;
	bool const show_value_in_help_;
};

template<typename T>
void convert_argument(std::string const& arg, T& value) {
	if constexpr(std::is_same_v<std::string, T>) {
		value = arg;
	} else {
		std::istringstream in(arg);
		if(!(in >> value) || !(in >> std::ws).eof()) {
			throw invalid_argument("failed to interpret argument '" + arg + "'");
		}
	}
}

template<typename T>
struct value_option : option_base {
	value_option(T& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const& args) override {
		if(args.size() != 1) {
			std::ostringstream out;
			print_list(out, args, ",");
			throw invalid_argument("expected exactly one argument: [" + out.str() + "]");
		}
		convert_argument(args[0], value_);
	}
	void print(std::ostream& o) const override {
		o << value_;
	}

	T& value_;
};

template<typename T>
struct optional_option : option_base {
	optional_option(std::optional<T>& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const& args) override {
		if(args.size() > 1) {
			std::ostringstream out;
			print_list(out, args, ",");
			throw invalid_argument("expected at most one argument: [" + out.str() +"]");
		}
		value_.emplace();
		if(args.size() == 1) {
			convert_argument(args[0], *value_);
		}
	}
	void print(std::ostream& o) const override {
		if(value_) {
			o << *value_;
		}
	}

	std::optional<T>& value_;
};

template<typename Option, typename T>
void command_parser::add_impl(T& var, std::string name, std::string alias, std::string info) {
	auto e = std::make_unique<Option>(var);
	auto p = std::make_shared<option>(name, alias, std::move(info), std::move(e));
	if(!name.empty()) {
		options_.insert({"--"+name, p});
	}
	if(!alias.empty()) {
		options_.insert({"-"+alias, p});
	}
}

template<typename T>
void command_parser::add(T& var, std::string name, std::string alias, std::string info) {
	add_impl<value_option<T>>(var, std::move(name), std::move(alias), std::move(info));
}

template<typename T>
void command_parser::add(std::optional<T>& var, std::string name, std::string alias, std::string info) {
	add_impl<optional_option<T>>(var, std::move(name), std::move(alias), std::move(info));
}

}

#endif
