#undef NDEBUG
#include"client_identity.hpp"
#include"key_pair.hpp"
#include<assert.h>
#include<cstring>
#include<memory>
#include<openssl/evp.h>
#include<openssl/x509.h>
#include<openssl/x509v3.h>
#include<string>
#include<vector>

using namespace qdist;

namespace {

using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

std::vector<uint8_t> hexread(char const* hex) {
	auto out = std::vector<uint8_t>();
	for (auto i = std::size_t(0); hex[i] && hex[i + 1]; i += 2)
		out.push_back(uint8_t(std::stoul(std::string(hex + i, 2), nullptr, 16)));
	return out;
}

KeyPair::Bytes to_bytes(std::vector<uint8_t> const& v) {
	auto b = KeyPair::Bytes();
	assert(v.size() == b.size());
	std::memcpy(b.data(), v.data(), b.size());
	return b;
}

/* RFC 8032 section 7.1, test 1.  */
void test_rfc8032_vector() {
	auto kp = KeyPair::from_seed(to_bytes(hexread(
		"9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60")));
	auto pub = hexread("d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
	assert(std::vector<uint8_t>(kp.public_key().begin(), kp.public_key().end()) == pub);
	uint8_t const empty[1] = {0};
	auto sig = kp.sign(empty, 0);
	assert(sig == hexread("e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b"));
}

void test_generate() {
	auto a = KeyPair::generate();
	auto b = KeyPair::generate();
	assert(a.public_key() != b.public_key());
	auto again = KeyPair::from_seed(a.secret_seed());
	assert(again.public_key() == a.public_key());
}

void test_certificate() {
	auto kp = KeyPair::generate();
	auto id = build_client_identity(kp);
	assert(id.certificate_der.size() == 249);
	assert(id.private_key_der.size() == 48);

	auto const* p = id.certificate_der.data();
	auto cert = X509Ptr(d2i_X509(nullptr, &p, long(id.certificate_der.size())), &X509_free);
	assert(cert);
	assert(p == id.certificate_der.data() + id.certificate_der.size());
	assert(X509_get_version(cert.get()) == 2);

	/* The certificate carries the pair's public key and is signed by it.  */
	auto* pkey = X509_get0_pubkey(cert.get());
	assert(pkey);
	assert(EVP_PKEY_id(pkey) == EVP_PKEY_ED25519);
	auto raw = KeyPair::Bytes();
	auto len = raw.size();
	assert(EVP_PKEY_get_raw_public_key(pkey, raw.data(), &len) == 1);
	assert(raw == kp.public_key());
	assert(X509_verify(cert.get(), pkey) == 1);

	char cn[64];
	assert(X509_NAME_get_text_by_NID(X509_get_issuer_name(cert.get()), NID_commonName, cn, sizeof(cn)) > 0);
	assert(std::string(cn) == "Solana node");
	assert(X509_NAME_entry_count(X509_get_subject_name(cert.get())) == 0);

	/* Valid from 1970 to 4096.  */
	assert(X509_cmp_current_time(X509_get0_notBefore(cert.get())) < 0);
	assert(X509_cmp_current_time(X509_get0_notAfter(cert.get())) > 0);

	auto crit = int();
	auto* san = static_cast<GENERAL_NAMES*>(
		X509_get_ext_d2i(cert.get(), NID_subject_alt_name, &crit, nullptr));
	assert(san);
	assert(crit == 1);
	assert(sk_GENERAL_NAME_num(san) == 1);
	auto* gn = sk_GENERAL_NAME_value(san, 0);
	assert(gn->type == GEN_DNS);
	assert(std::string(reinterpret_cast<char const*>(ASN1_STRING_get0_data(gn->d.dNSName))) == "localhost");
	GENERAL_NAMES_free(san);

	auto* bc = static_cast<BASIC_CONSTRAINTS*>(
		X509_get_ext_d2i(cert.get(), NID_basic_constraints, &crit, nullptr));
	assert(bc);
	assert(crit == 1);
	assert(!bc->ca);
	BASIC_CONSTRAINTS_free(bc);
}

void test_private_key() {
	auto kp = KeyPair::generate();
	auto id = build_client_identity(kp);

	auto const* p = id.private_key_der.data();
	auto pkey = PkeyPtr(d2i_AutoPrivateKey(nullptr, &p, long(id.private_key_der.size())), &EVP_PKEY_free);
	assert(pkey);
	assert(EVP_PKEY_id(pkey.get()) == EVP_PKEY_ED25519);
	auto seed = KeyPair::Bytes();
	auto len = seed.size();
	assert(EVP_PKEY_get_raw_private_key(pkey.get(), seed.data(), &len) == 1);
	assert(seed == kp.secret_seed());
}

/* Same key pair, same bytes.  */
void test_deterministic() {
	auto kp = KeyPair::generate();
	auto a = build_client_identity(kp);
	auto b = build_client_identity(KeyPair::from_seed(kp.secret_seed()));
	assert(a.certificate_der == b.certificate_der);
	assert(a.private_key_der == b.private_key_der);

	auto other = build_client_identity(KeyPair::generate());
	assert(other.certificate_der != a.certificate_der);
}

}

int main() {
	test_rfc8032_vector();
	test_generate();
	test_certificate();
	test_private_key();
	test_deterministic();
	return 0;
}
