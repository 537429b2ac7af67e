#include "softmock/core/tls/CertificateAuthority.h"
#include "softmock/core/util/Error.h"
#include "softmock/core/util/Digest.h"
#include "softmock/core/util/Logger.h"
#include <fmt/format.h>
#include <filesystem>
#include <cstdio>
#include <cctype>
#include <algorithm>
#include <openssl/x509v3.h>
#include <openssl/rsa.h>
#include <openssl/bn.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#ifdef _WIN32
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#endif

namespace softmock::core::tls {
using util::CaError;

namespace {
constexpr long kRootValiditySeconds = 315360000L; // ~10 years

std::string openssl_error() {
    unsigned long e = ERR_get_error();
    if (e == 0) return "unknown OpenSSL error";
    char buf[256];
    ERR_error_string_n(e, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

PKeyPtr generate_rsa_key(int bits) {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> kctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), EVP_PKEY_CTX_free);
    if (!kctx || EVP_PKEY_keygen_init(kctx.get()) <= 0 || EVP_PKEY_CTX_set_rsa_keygen_bits(kctx.get(), bits) <= 0) {
        throw CaError("key generation setup failed: " + openssl_error());
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(kctx.get(), &raw) <= 0) throw CaError("key generation failed: " + openssl_error());
    return PKeyPtr(raw, EVP_PKEY_free);
}

void set_random_serial(X509* cert) {
    unsigned char bytes[8];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) throw CaError("no randomness for serial number");
    bytes[0] &= 0x7F; // keep the serial positive
    std::unique_ptr<BIGNUM, decltype(&BN_free)> bn(BN_bin2bn(bytes, sizeof(bytes), nullptr), BN_free);
    if (!bn || !BN_to_ASN1_INTEGER(bn.get(), X509_get_serialNumber(cert))) throw CaError("cannot set serial number");
}

void add_ext(X509* cert, X509* issuer, int nid, const std::string& value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.c_str());
    if (!ext) throw CaError(fmt::format("cannot build extension {} '{}': {}", OBJ_nid2sn(nid), value, openssl_error()));
    X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
}

void add_name_entry(X509_NAME* name, const char* field, const std::string& value) {
    X509_NAME_add_entry_by_txt(name, field, MBSTRING_ASC, reinterpret_cast<const unsigned char*>(value.c_str()), -1, -1, 0);
}

std::string fingerprint_of(X509* cert) {
    unsigned char md[EVP_MAX_MD_SIZE]; unsigned int n = 0;
    if (!cert || !X509_digest(cert, EVP_sha256(), md, &n)) return {};
    return util::hex_colon(md, n);
}

bool is_ip_literal(const std::string& host) {
    unsigned char buf[16];
    return inet_pton(AF_INET, host.c_str(), buf) == 1 || inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

std::string lower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return char(std::tolower(c)); });
    return v;
}
}

std::string LeafCertificate::der() const {
    std::string out; unsigned char* buf = nullptr;
    int len = i2d_X509(cert.get(), &buf);
    if (len > 0 && buf) { out.assign(reinterpret_cast<char*>(buf), (size_t)len); OPENSSL_free(buf); }
    return out;
}

std::shared_ptr<CertificateAuthority> CertificateAuthority::create(const CertConfig& cfg) {
    auto ctx = std::shared_ptr<CertificateAuthority>(new CertificateAuthority(cfg));
    if (ctx->cfg_.caCertPath.empty()) ctx->cfg_.caCertPath = "softmock_root_ca.pem";
    if (ctx->cfg_.caKeyPath.empty()) ctx->cfg_.caKeyPath = "softmock_root_ca.key";
    ctx->load_or_generate();
    return ctx;
}

CertificateAuthority::~CertificateAuthority() = default;

void CertificateAuthority::load_or_generate() {
    std::lock_guard lk(rootMu_);
    bool haveCert = std::filesystem::exists(cfg_.caCertPath);
    bool haveKey = std::filesystem::exists(cfg_.caKeyPath);
    if (!haveCert || !haveKey) {
        if (!cfg_.generateIfMissing) {
            throw CaError(fmt::format("root CA material missing (cert={} key={})", cfg_.caCertPath, cfg_.caKeyPath));
        }
        util::log_info(fmt::format("generating new root CA (cert={} key={})", cfg_.caCertPath, cfg_.caKeyPath));
        generate_root_locked();
    } else {
        util::log_info(fmt::format("loading existing root CA (cert={} key={})", cfg_.caCertPath, cfg_.caKeyPath));
        FILE* fcert = std::fopen(cfg_.caCertPath.c_str(), "rb");
        if (fcert) { caCert_.reset(PEM_read_X509(fcert, nullptr, nullptr, nullptr)); std::fclose(fcert); }
        FILE* fkey = std::fopen(cfg_.caKeyPath.c_str(), "rb");
        if (fkey) { caKey_.reset(PEM_read_PrivateKey(fkey, nullptr, nullptr, nullptr)); std::fclose(fkey); }
        if (!caCert_) throw CaError("cannot parse root certificate " + cfg_.caCertPath + ": " + openssl_error());
        if (!caKey_) throw CaError("cannot parse root key " + cfg_.caKeyPath + ": " + openssl_error());
        if (X509_check_private_key(caCert_.get(), caKey_.get()) != 1) {
            ERR_clear_error();
            throw CaError("root key does not match root certificate");
        }
    }
    caFingerprint_ = fingerprint_of(caCert_.get());
    util::log_info("CA SHA256 fingerprint " + caFingerprint_);
}

void CertificateAuthority::generate_root_locked() {
    PKeyPtr pkey = generate_rsa_key(2048);
    X509Ptr cert(X509_new(), X509_free);
    if (!cert) throw CaError("X509_new failed");
    set_random_serial(cert.get());
    X509_gmtime_adj(X509_get_notBefore(cert.get()), -86400L);
    X509_gmtime_adj(X509_get_notAfter(cert.get()), kRootValiditySeconds);
    X509_set_version(cert.get(), 2);
    X509_set_pubkey(cert.get(), pkey.get());
    X509_NAME* name = X509_get_subject_name(cert.get());
    add_name_entry(name, "C", "XX");
    add_name_entry(name, "O", "softmock");
    add_name_entry(name, "CN", "softmock Root CA");
    X509_set_issuer_name(cert.get(), name);
    add_ext(cert.get(), cert.get(), NID_basic_constraints, "critical,CA:TRUE");
    add_ext(cert.get(), cert.get(), NID_key_usage, "critical,keyCertSign,cRLSign");
    add_ext(cert.get(), cert.get(), NID_subject_key_identifier, "hash");
    if (!X509_sign(cert.get(), pkey.get(), EVP_sha256())) throw CaError("root signing failed: " + openssl_error());

    // Persist; a failure here leaves an in-memory root that still works for this run.
    std::error_code ec;
    auto parent = std::filesystem::path(cfg_.caCertPath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    parent = std::filesystem::path(cfg_.caKeyPath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    bool saved = false;
    if (FILE* f = std::fopen(cfg_.caCertPath.c_str(), "wb")) { saved = PEM_write_X509(f, cert.get()) == 1; std::fclose(f); }
    if (FILE* f = std::fopen(cfg_.caKeyPath.c_str(), "wb")) {
        saved = PEM_write_PrivateKey(f, pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) == 1 && saved;
        std::fclose(f);
        std::filesystem::permissions(cfg_.caKeyPath, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace, ec);
    } else {
        saved = false;
    }
    if (!saved) util::log_warn(fmt::format("could not persist root CA to {} / {}", cfg_.caCertPath, cfg_.caKeyPath));

    caCert_ = std::move(cert);
    caKey_ = std::move(pkey);
}

void CertificateAuthority::regenerate_root() {
    {
        std::lock_guard lk(rootMu_);
        generate_root_locked();
        caFingerprint_ = fingerprint_of(caCert_.get());
        util::log_info("root CA regenerated, SHA256 fingerprint " + caFingerprint_);
    }
    std::lock_guard lk(cacheMu_);
    leafCache_.clear();
}

bool CertificateAuthority::valid_hostname(const std::string& host) {
    if (host.empty() || host.size() > 253) return false;
    if (is_ip_literal(host)) return true;
    size_t labelLen = 0;
    char prev = '.';
    for (char c : host) {
        if (c == '.') {
            if (labelLen == 0 || prev == '-') return false;
            labelLen = 0;
        } else {
            if (!(std::isalnum((unsigned char)c) || c == '-' || c == '_')) return false;
            if (labelLen == 0 && c == '-') return false;
            if (++labelLen > 63) return false;
        }
        prev = c;
    }
    return prev != '-';
}

bool CertificateAuthority::usable(const LeafCertificate& leaf) const {
    if (std::chrono::system_clock::now() + cfg_.renewBefore >= leaf.notAfter) return false;
    std::lock_guard lk(rootMu_);
    return leaf.rootFingerprint == caFingerprint_;
}

std::shared_ptr<const LeafCertificate> CertificateAuthority::generate_leaf(const std::string& hostname) const {
    auto leaf = std::make_shared<LeafCertificate>();
    leaf->host = hostname;
    leaf->key = generate_rsa_key(2048);
    X509Ptr cert(X509_new(), X509_free);
    if (!cert) throw CaError("X509_new failed");
    set_random_serial(cert.get());
    auto validity = cfg_.leafValidity.count();
    X509_gmtime_adj(X509_get_notBefore(cert.get()), -86400L);
    X509_gmtime_adj(X509_get_notAfter(cert.get()), static_cast<long>(validity));
    X509_set_version(cert.get(), 2);
    X509_set_pubkey(cert.get(), leaf->key.get());
    X509_NAME* subj = X509_get_subject_name(cert.get());
    add_name_entry(subj, "O", "softmock");
    if (hostname.size() <= 64) add_name_entry(subj, "CN", hostname);

    std::lock_guard lk(rootMu_);
    if (!caCert_ || !caKey_) throw CaError("root CA unavailable");
    X509_set_issuer_name(cert.get(), X509_get_subject_name(caCert_.get()));
    add_ext(cert.get(), caCert_.get(), NID_subject_alt_name, (is_ip_literal(hostname) ? "IP:" : "DNS:") + hostname);
    add_ext(cert.get(), caCert_.get(), NID_basic_constraints, "CA:FALSE");
    add_ext(cert.get(), caCert_.get(), NID_key_usage, "critical,digitalSignature,keyEncipherment");
    add_ext(cert.get(), caCert_.get(), NID_ext_key_usage, "serverAuth");
    add_ext(cert.get(), caCert_.get(), NID_subject_key_identifier, "hash");
    add_ext(cert.get(), caCert_.get(), NID_authority_key_identifier, "keyid:always");
    if (!X509_sign(cert.get(), caKey_.get(), EVP_sha256())) throw CaError("leaf signing failed for " + hostname + ": " + openssl_error());
    leaf->cert = std::move(cert);
    leaf->notAfter = std::chrono::system_clock::now() + cfg_.leafValidity;
    leaf->rootFingerprint = caFingerprint_;
    return leaf;
}

std::shared_ptr<const LeafCertificate> CertificateAuthority::issue_leaf(const std::string& requested) {
    std::string hostname = lower(requested);
    if (!hostname.empty() && hostname.front() == '[' && hostname.back() == ']') hostname = hostname.substr(1, hostname.size() - 2);
    if (!valid_hostname(hostname)) throw CaError("invalid hostname '" + requested + "'");

    std::unique_lock lk(cacheMu_);
    for (;;) {
        auto it = leafCache_.find(hostname);
        if (it != leafCache_.end() && usable(*it->second)) return it->second;
        if (inFlight_.count(hostname) == 0) break;
        cacheCv_.wait(lk);
    }
    inFlight_.insert(hostname);
    lk.unlock();

    std::shared_ptr<const LeafCertificate> leaf;
    try {
        leaf = generate_leaf(hostname);
    } catch (const std::exception&) {
        lk.lock();
        inFlight_.erase(hostname);
        cacheCv_.notify_all();
        throw;
    }
    generations_.fetch_add(1);
    util::log_debug(fmt::format("issued leaf certificate for {}", hostname));

    lk.lock();
    inFlight_.erase(hostname);
    leafCache_[hostname] = leaf;
    cacheCv_.notify_all();
    return leaf;
}

std::size_t CertificateAuthority::cached_leaf_count() const {
    std::lock_guard lk(cacheMu_);
    return leafCache_.size();
}

std::string CertificateAuthority::export_ca_pem() const {
    std::lock_guard lk(rootMu_);
    std::string out;
    if (!caCert_) return out;
    BIO* mem = BIO_new(BIO_s_mem());
    if (PEM_write_bio_X509(mem, caCert_.get())) {
        char* data = nullptr; long len = BIO_get_mem_data(mem, &data);
        if (len > 0 && data) out.assign(data, (size_t)len);
    }
    BIO_free(mem);
    return out;
}

std::string CertificateAuthority::export_ca_der() const {
    std::lock_guard lk(rootMu_);
    std::string out; if(!caCert_) return out; unsigned char* buf=nullptr; int len = i2d_X509(caCert_.get(), &buf); if(len>0 && buf){ out.assign(reinterpret_cast<char*>(buf), (size_t)len); OPENSSL_free(buf);} return out;
}

std::string CertificateAuthority::ca_fingerprint_sha256() const {
    std::lock_guard lk(rootMu_);
    return caFingerprint_;
}

X509* CertificateAuthority::root_certificate_ref() const {
    std::lock_guard lk(rootMu_);
    if (!caCert_) return nullptr;
    X509_up_ref(caCert_.get());
    return caCert_.get();
}
}
