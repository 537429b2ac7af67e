#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <unordered_map>
#include <unordered_set>
#include <chrono>
#include <atomic>
#include <cstdint>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

namespace softmock::core::tls {
using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using PKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

struct CertConfig {
    std::string caCertPath;   // path to root CA certificate (PEM)
    std::string caKeyPath;    // path to root CA private key (PEM)
    bool generateIfMissing{true};
    std::chrono::seconds leafValidity{std::chrono::hours(24 * 365)};
    // entries closer than this to notAfter are regenerated
    std::chrono::seconds renewBefore{std::chrono::hours(1)};
};

// Per-host certificate presented to clients. Immutable once issued.
struct LeafCertificate {
    std::string host;
    X509Ptr cert{nullptr, X509_free};
    PKeyPtr key{nullptr, EVP_PKEY_free};
    std::chrono::system_clock::time_point notAfter;
    std::string rootFingerprint;
    std::string der() const;
};

class CertificateAuthority {
public:
    // Loads the root from cfg paths, generating and persisting it when missing
    // and allowed. Throws CaError when no usable root can be produced.
    static std::shared_ptr<CertificateAuthority> create(const CertConfig& cfg);
    ~CertificateAuthority();
    CertificateAuthority(const CertificateAuthority&) = delete;
    CertificateAuthority& operator=(const CertificateAuthority&) = delete;

    const CertConfig& config() const { return cfg_; }

    // Cached, still-valid leaf for `hostname`, generating it on a miss. At most
    // one generation per host runs at a time; concurrent callers wait for it.
    // Throws CaError for invalid hostnames or signing failures.
    std::shared_ptr<const LeafCertificate> issue_leaf(const std::string& hostname);

    // Replaces the root with a freshly generated one, persists it and drops all cached leaves.
    void regenerate_root();

    std::string export_ca_pem() const;
    std::string export_ca_der() const;
    std::string ca_fingerprint_sha256() const;
    // Root certificate with an added reference; caller frees.
    X509* root_certificate_ref() const;

    uint64_t generation_count() const { return generations_.load(); }
    std::size_t cached_leaf_count() const;

    static bool valid_hostname(const std::string& hostname);
private:
    explicit CertificateAuthority(CertConfig cfg) : cfg_(std::move(cfg)) {}
    void load_or_generate();
    void generate_root_locked();
    std::shared_ptr<const LeafCertificate> generate_leaf(const std::string& hostname) const;
    bool usable(const LeafCertificate& leaf) const;

    CertConfig cfg_;
    mutable std::mutex rootMu_;
    X509Ptr caCert_{nullptr, X509_free};
    PKeyPtr caKey_{nullptr, EVP_PKEY_free};
    std::string caFingerprint_;

    mutable std::mutex cacheMu_;
    std::condition_variable cacheCv_;
    std::unordered_map<std::string, std::shared_ptr<const LeafCertificate>> leafCache_;
    std::unordered_set<std::string> inFlight_;
    std::atomic<uint64_t> generations_{0};
};
}
