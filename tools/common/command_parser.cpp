#include "command_parser.hpp"

#include <fstream>

namespace sshconf {

void command_parser::parse(int argc, char* args[]) {
	std::string s;
	for(int i = 1; i != argc; ++i) {
		if(i > 1) {
			s += " ";
		}
		std::string arg = args[i];
		if(arg.find(' ') != std::string::npos || arg.find('\t') != std::string::npos) {
			arg = '"' + arg + '"';
		}
		s += arg;
	}
	parse(s);
}

void command_parser::parse(std::string s) {
	std::istringstream in(s);
	parse(in);
}

std::string command_parser::parse_name(std::istream& in) {
	std::string s;
	in >> s;
	return s;
}

std::string command_parser::parse_quoted(std::istream& in) {
	std::string s;
	in.ignore(); // opening quote
	for(auto c = in.get(); c != '"'; c = in.get()) {
		if(c == std::istream::traits_type::eof()) {
			throw invalid_argument("missing closing quote after '" + s + "'");
		}
		s += char(c);
	}
	return s;
}

std::string command_parser::parse_arg(std::istream& in) {
	std::string s;
	if(in.peek() == '"') {
		s = parse_quoted(in);
	} else {
		in >> s;
	}
	return s;
}

void command_parser::parse_args(std::istream& in, std::string const& name) {
	std::vector<std::string> args;

	for(;in >> std::ws && in.peek() != '-';) {
		std::string a = parse_arg(in);
		if(!a.empty())  {
			args.push_back(std::move(a));
		}
	}

	auto it = options_.find(name);
	if(it == options_.end()) {
		throw invalid_argument("no option named '" + name + "'");
	}
	it->second->extract->parse(args);
}

void command_parser::parse(std::istream& in) {
	for(; in >> std::ws; ) {
		if(in.peek() == '-') {
			parse_args(in, parse_name(in));
		} else {
			parse_arg(in);
		}
	}
}

namespace {

struct print_align {
	print_align(std::ostream& out)
	: out_(out)
	{
	}

	~print_align () {
		out_ << temp_out_.str();
	}

	template<typename T>
	print_align& operator<<(T const& v) {
		temp_out_ << v;
		return *this;
	}

	print_align& align(std::size_t s) {
		std::string str = temp_out_.str();
		out_ << str;
		if(str.size() < s) {
			out_ << std::string(s-str.size(), ' ');
		}
		temp_out_.str("");
		return *this;
	}

	std::ostringstream temp_out_;
	std::ostream& out_;
};

}

void command_parser::print_help(std::ostream& out) const {
	for(auto&& v : options_) {
		if(v.first.substr(0, 2) != "--") {
			continue;
		}
		auto const& info = *v.second;
		std::string alias;
		if(!info.alias.empty()) {
			alias = ", -" + info.alias;
		}

		(print_align(out) << "--" << info.name << alias).align(32) << " " << info.info;

		if(show_value_in_help_) {
			std::ostringstream extract_out;
			info.extract->print(extract_out);
			std::string eout = extract_out.str();

			if(!eout.empty()) {
				out << " (" + eout + ")";
			}
		}
		out << "\n";
	}
}

void command_parser::parse_file(std::string const& file_name) {
	std::ifstream is(file_name);
	if(!is) {
		throw invalid_argument("could not open options file '" + file_name + "'");
	}
	std::string line;
	while(std::getline(is, line)) {
		auto l = trim(line);
		if(!l.empty() && l.front() != '#') {
			parse(std::string(l));
		}
	}
}

struct flag_option : option_base {
	flag_option(bool& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const& args) override {
		if(!args.empty()) {
			throw invalid_argument("flag does not take a value: '" + args[0] + "'");
		}
		value_ = true;
	}
	void print(std::ostream& o) const override {
		o << (value_ ? "true" : "false");
	}

	bool& value_;
};

void command_parser::add(bool& var, std::string name, std::string alias, std::string info) {
	add_impl<flag_option>(var, std::move(name), std::move(alias), std::move(info));
}

}
