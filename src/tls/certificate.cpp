#include "certificate.hpp"
#include <core/utils.hpp>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <fmt/format.h>

std::string openssl_error_string() {
    std::string out;
    unsigned long code;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out;
}

Result<std::vector<X509Ptr>> parse_pem_certificates(const std::string& pem) {
    using R = Result<std::vector<X509Ptr>>;

    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return R::Err(ErrorKind::Config, "cannot allocate BIO: " + openssl_error_string());
    }

    std::vector<X509Ptr> certs;
    while (X509* cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)) {
        certs.emplace_back(cert);
    }
    // PEM_read_bio_X509 ends with "no start line" once the input is exhausted
    std::string err = openssl_error_string();

    if (certs.empty()) {
        return R::Err(ErrorKind::CertificateParse,
            err.empty() ? "failed to append certificate to pool: no certificate found"
                        : "failed to append certificate to pool: " + err);
    }
    return R::Ok(std::move(certs));
}

Result<X509Ptr> parse_der_certificate(const std::string& der) {
    const auto* p = reinterpret_cast<const unsigned char*>(der.data());
    const auto* end = p + der.size();
    X509Ptr cert(d2i_X509(nullptr, &p, static_cast<long>(der.size())));
    if (!cert) {
        return Result<X509Ptr>::Err(ErrorKind::CertificateParse,
            "failed to parse certificate: " + openssl_error_string());
    }
    if (p != end) {
        return Result<X509Ptr>::Err(ErrorKind::CertificateParse,
            fmt::format("failed to parse certificate: {} trailing bytes", end - p));
    }
    return Result<X509Ptr>::Ok(std::move(cert));
}

std::string to_der(X509* cert) {
    int len = i2d_X509(cert, nullptr);
    if (len <= 0) return "";
    std::string der(static_cast<size_t>(len), '\0');
    auto* p = reinterpret_cast<unsigned char*>(&der[0]);
    i2d_X509(cert, &p);
    return der;
}

std::string to_pem(X509* cert) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_X509(bio.get(), cert) != 1) return "";
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(len));
}

static std::time_t asn1_to_time_t(const ASN1_TIME* t) {
    struct tm tm_buf = {};
    if (!t || ASN1_TIME_to_tm(t, &tm_buf) != 1) return 0;
    return utc_mktime(&tm_buf);
}

std::time_t not_before(const X509* cert) {
    return asn1_to_time_t(X509_get0_notBefore(cert));
}

std::time_t not_after(const X509* cert) {
    return asn1_to_time_t(X509_get0_notAfter(cert));
}

std::string subject_name(const X509* cert) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio) return "";
    X509_NAME_print_ex(bio.get(), X509_get_subject_name(cert), 0, XN_FLAG_RFC2253);
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(len));
}
