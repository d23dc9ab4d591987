#include "log.hpp"
#include "sshconf/core/config_parser.hpp"
#include "sshconf/core/errors.hpp"

#include <catch2/catch.hpp>

#include <vector>

namespace sshconf::test {

static ssh_config parse(std::string_view data) {
	return config_parser(test_log()).parse(data);
}

namespace {

struct recording_logger : logger {
	std::vector<std::pair<type, std::string>> lines;

protected:
	void do_log_line(type t, std::string const& s, std::source_location&&) override {
		lines.emplace_back(t, s);
	}
};

}

static std::string parse_error(std::string_view data) {
	try {
		parse(data);
	} catch(parser_error const& e) {
		return e.what();
	}
	return "<no error>";
}

TEST_CASE("config_parser simple", "[unit]") {
	auto config = parse(
		"Host myhost.com\n"
		"    PreferredAuthentications publickey\n"
		"    User myuser\n"
		"    ForwardAgent no\n");

	REQUIRE(config.size() == 1);
	CHECK(config.blocks()[0].hosts == host_list{"myhost.com"});

	auto kw = config.get_config_for_host("myhost.com");
	CHECK(kw["PreferredAuthentications"] == "publickey");
	CHECK(kw["User"] == "myuser");
	CHECK(kw["ForwardAgent"] == "no");
}

TEST_CASE("config_parser first occurrence wins", "[unit]") {
	auto config = parse(
		"Host myhost.com\n"
		"    PreferredAuthentications publickey\n"
		"    User myuser\n"
		"    ForwardAgent no\n"
		"    User nobody\n");

	CHECK(config.get_config_for_host("myhost.com")["User"] == "myuser");
	CHECK(config.blocks()[0].keywords.size() == 3);

	CHECK(parse("Host a\nUser alice\nuser bob\n").get_config_for_host("a")["User"] == "alice");
}

TEST_CASE("config_parser multiple blocks", "[unit]") {
	auto config = parse(
		"Host myhost.com\n"
		"    PreferredAuthentications publickey\n"
		"    User myuser\n"
		"    ForwardAgent no\n"
		"\n"
		"Host *.com\n"
		"    User nobody\n"
		"    HashKnownHosts yes\n");

	auto kw = config.get_config_for_host("myhost.com");
	CHECK(kw["PreferredAuthentications"] == "publickey");
	CHECK(kw["User"] == "myuser");
	CHECK(kw["ForwardAgent"] == "no");
	CHECK(kw["HashKnownHosts"] == "yes");
	CHECK(config.get_matching_hosts("myhost.com").size() == 2);
}

TEST_CASE("config_parser keywords before first Host", "[unit]") {
	auto config = parse(
		"ForwardX11 no\n"
		"\n"
		"Host myhost.com\n"
		"    PreferredAuthentications publickey\n"
		"    User myuser\n"
		"    ForwardAgent yes\n"
		"    ForwardX11 yes\n"
		"\n"
		"Host *.com\n"
		"    User nobody\n"
		"    HashKnownHosts yes\n");

	REQUIRE(config.size() == 3);
	CHECK(config.blocks()[0].hosts == host_list{"*"});
	CHECK(config.get_config_for_host("myhost.com")["ForwardX11"] == "no");
	CHECK(config.get_matching_hosts("myhost.com").size() == 3);
	CHECK(config.get_config_for_host("other.net") == keyword_set{{"ForwardX11", "no"}});
}

TEST_CASE("config_parser comments and whitespace", "[unit]") {
	auto config = parse(
		"# Host myhost.net\n"
		"# user auser\n"
		"\n"
		"Host myhost.com myhost.org\n"
		"\n"
		"  # some text\n"
		"preferredauthentications password\n"
		"user myuser # trailing comment\n"
		"\n"
		"# forwardagent no\n"
		"\n"
		"host *\n"
		"forwardagent yes\n"
		"\n");

	REQUIRE(config.size() == 2);
	CHECK(config.blocks()[0].hosts == host_list{"myhost.com", "myhost.org"});
	CHECK(config.get_config_for_host("myhost.net") == keyword_set{{"ForwardAgent", "yes"}});
	CHECK(config.get_config_for_host("myhost.com")["ForwardAgent"] == "yes");
	CHECK(config.get_config_for_host("myhost.org")["PreferredAuthentications"] == "password");

	// the value is the rest of the line, only the comment is cut off
	CHECK(config.get_config_for_host("myhost.org")["User"] == "myuser ");
}

TEST_CASE("config_parser value keeps inner whitespace", "[unit]") {
	auto config = parse("Host a\n\tProxyCommand  ssh -W %h:%p  bastion\n");
	CHECK(config.get_config_for_host("a")["ProxyCommand"] == "ssh -W %h:%p  bastion");
}

TEST_CASE("config_parser crlf line endings", "[unit]") {
	auto config = parse("Host a\r\n  User alice\r\n  Port 22\r\n");
	auto kw = config.get_config_for_host("a");
	CHECK(kw["User"] == "alice");
	CHECK(kw["Port"] == "22");
}

TEST_CASE("config_parser no implicit block for empty preamble", "[unit]") {
	CHECK(parse("").empty());
	CHECK(parse("# only a comment\n\n").empty());

	auto config = parse("# header\nHost a\n");
	REQUIRE(config.size() == 1);
	CHECK(config.blocks()[0].hosts == host_list{"a"});
	CHECK(config.blocks()[0].keywords.empty());
}

TEST_CASE("config_parser host without keywords is kept", "[unit]") {
	auto config = parse("Host a\nHost b\n  User bob\n");
	REQUIRE(config.size() == 2);
	CHECK(config.blocks()[0].keywords.empty());
	CHECK(config.blocks()[1].keywords == keyword_set{{"User", "bob"}});
}

TEST_CASE("config_parser repeated host lines stay separate blocks", "[unit]") {
	auto config = parse("Host a\n  User alice\nHost a\n  User bob\n  Port 2\n");
	REQUIRE(config.size() == 2);
	auto kw = config.get_config_for_host("a");
	CHECK(kw["User"] == "alice");
	CHECK(kw["Port"] == "2");
}

TEST_CASE("config_parser negated patterns", "[unit]") {
	auto config = parse("Host *.com !insecure.com\n  User alice\n");
	CHECK(config.get_config_for_host("secure.com")["User"] == "alice");
	CHECK(config.get_config_for_host("insecure.com").empty());
}

TEST_CASE("config_parser errors", "[unit]") {
	CHECK(parse_error("Host myhost.com\n    badkeyword no\n") == "Invalid keyword at line 2: badkeyword");
	CHECK(parse_error("Host myhost.com\n    ProxyJump\n") == "Invalid syntax at line 2: ProxyJump");
	CHECK(parse_error("Host myhost.com\n    ProxyJump   # no value\n") == "Invalid syntax at line 2: ProxyJump");
	CHECK(parse_error("User alice\nHost\n") == "Empty Host keyword at line 2");
	CHECK(parse_error("Host   # comment only\n") == "Empty Host keyword at line 1");
	CHECK(parse_error("Host a\n\nMatch host a\n  User b\n") == "Match keyword is not supported at line 3");
	CHECK(parse_error("match all\n") == "Match keyword is not supported at line 1");
	CHECK(parse_error("  MATCH exec true\n") == "Match keyword is not supported at line 1");
}

TEST_CASE("config_parser error carries line", "[unit]") {
	try {
		parse("Host a\n# comment\n\n  NotAKeyword x\n");
		FAIL("expected parser_error");
	} catch(parser_error const& e) {
		CHECK(e.line() == 4);
	}
}

TEST_CASE("config_parser can be reused after error", "[unit]") {
	config_parser p(test_log());
	CHECK_THROWS_AS(p.parse("Host a\n  bad value\n"), parser_error);

	auto config = p.parse("Host b\n  User bob\n");
	REQUIRE(config.size() == 1);
	CHECK(config.get_config_for_host("b")["User"] == "bob");
}

TEST_CASE("config_parser leaves error reporting to the caller", "[unit]") {
	recording_logger log;
	config_parser p(log);
	CHECK_THROWS_AS(p.parse("Host a\nMatch all\n"), parser_error);

	for(auto&& [t, s] : log.lines) {
		CHECK(t != logger::error);
	}
	REQUIRE_FALSE(log.lines.empty());
	CHECK(log.lines.back().first == logger::debug);
	CHECK(log.lines.back().second == "Match keyword is not supported at line 2");
}

TEST_CASE("config_parser repeated keyword keeps first value and logs", "[unit]") {
	recording_logger log;
	auto config = config_parser(log).parse("Host a\n  User alice\n  USER bob\n  Port 22\n");

	REQUIRE(config.size() == 1);
	CHECK(config.blocks()[0].keywords == keyword_set{{"User", "alice"}, {"Port", "22"}});

	bool logged = false;
	for(auto&& [t, s] : log.lines) {
		if(t == logger::debug_verbose && s == "line 3: ignoring repeated keyword USER") {
			logged = true;
		}
	}
	CHECK(logged);
}

}
