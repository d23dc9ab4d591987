
#include "keywords.hpp"
#include "sshconf/common/util.hpp"

#include <string>
#include <unordered_map>

namespace sshconf {

static std::string_view const keywords[] = {
	"Host",
	"Match",
	"AddKeysToAgent",
	"AddressFamily",
	"BatchMode",
	"BindAddress",
	"BindInterface",
	"CanonicalDomains",
	"CanonicalizeFallbackLocal",
	"CanonicalizeHostname",
	"CanonicalizeMaxDots",
	"CanonicalizePermittedCNAMEs",
	"CASignatureAlgorithms",
	"CertificateFile",
	"ChallengeResponseAuthentication",
	"CheckHostIP",
	"Ciphers",
	"ClearAllForwardings",
	"Compression",
	"ConnectionAttempts",
	"ConnectTimeout",
	"ControlMaster",
	"ControlPath",
	"ControlPersist",
	"DynamicForward",
	"EnableSSHKeysign",
	"EscapeChar",
	"ExitOnForwardFailure",
	"FingerprintHash",
	"ForwardAgent",
	"ForwardX11",
	"ForwardX11Timeout",
	"ForwardX11Trusted",
	"GatewayPorts",
	"GlobalKnownHostsFile",
	"GSSAPIAuthentication",
	"GSSAPIClientIdentity",
	"GSSAPIDelegateCredentials",
	"GSSAPIKeyExchange",
	"GSSAPIRenewalForcesRekey",
	"GSSAPIServerIdentity",
	"GSSAPITrustDns",
	"GSSAPIKexAlgorithms",
	"HashKnownHosts",
	"HostbasedAuthentication",
	"HostbasedKeyTypes",
	"HostKeyAlgorithms",
	"HostKeyAlias",
	"Hostname",
	"IdentitiesOnly",
	"IdentityAgent",
	"IdentityFile",
	"IgnoreUnknown",
	"Include",
	"IPQoS",
	"KbdInteractiveAuthentication",
	"KbdInteractiveDevices",
	"KexAlgorithms",
	"LocalCommand",
	"LocalForward",
	"LogLevel",
	"MACs",
	"NoHostAuthenticationForLocalhost",
	"NumberOfPasswordPrompts",
	"PasswordAuthentication",
	"PermitLocalCommand",
	"PKCS11Provider",
	"Port",
	"PreferredAuthentications",
	"ProxyCommand",
	"ProxyJump",
	"ProxyUseFdpass",
	"PubkeyAcceptedKeyTypes",
	"PubkeyAuthentication",
	"RekeyLimit",
	"RemoteCommand",
	"RemoteForward",
	"RequestTTY",
	"RevokedHostKeys",
	"SecurityKeyProvider",
	"SendEnv",
	"ServerAliveCountMax",
	"ServerAliveInterval",
	"SetEnv",
	"StreamLocalBindMask",
	"StreamLocalBindUnlink",
	"StrictHostKeyChecking",
	"SyslogFacility",
	"TCPKeepAlive",
	"Tunnel",
	"TunnelDevice",
	"UpdateHostKeys",
	"User",
	"UserKnownHostsFile",
	"VerifyHostKeyDNS",
	"VisualHostKey",
	"XAuthLocation"
};

namespace {

using keyword_map = std::unordered_map<std::string, std::string_view>;

keyword_map make_keyword_map() {
	keyword_map res;
	for(auto&& k : keywords) {
		res.emplace(to_lower(k), k);
	}
	return res;
}

keyword_map const& keyword_case() {
	static keyword_map const map = make_keyword_map();
	return map;
}

}

std::span<std::string_view const> all_keywords() {
	return keywords;
}

std::string_view canonical_keyword(std::string_view name) {
	auto const& map = keyword_case();
	auto it = map.find(to_lower(name));
	if(it == map.end()) {
		return {};
	}
	return it->second;
}

}
