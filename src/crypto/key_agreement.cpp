#include "relaysave/crypto/key_agreement.hpp"
#include "relaysave/crypto/hash.hpp"
#include <algorithm>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>
#include <sodium.h>
#include <memory>
#include <cstring>

namespace relaysave::crypto {

namespace {
    struct BnDeleter { void operator()(BIGNUM* bn) const { BN_clear_free(bn); } };
    struct BnCtxDeleter { void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); } };
    struct EcGroupDeleter { void operator()(EC_GROUP* group) const { EC_GROUP_free(group); } };
    struct EcPointDeleter { void operator()(EC_POINT* point) const { EC_POINT_clear_free(point); } };
    struct PkeyDeleter { void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); } };
    struct PkeyCtxDeleter { void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); } };
    struct ParamBldDeleter { void operator()(OSSL_PARAM_BLD* bld) const { OSSL_PARAM_BLD_free(bld); } };
    struct ParamDeleter { void operator()(OSSL_PARAM* params) const { OSSL_PARAM_free(params); } };

    using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
    using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
    using EcGroupPtr = std::unique_ptr<EC_GROUP, EcGroupDeleter>;
    using EcPointPtr = std::unique_ptr<EC_POINT, EcPointDeleter>;
    using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
    using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

    constexpr const char* CURVE_NAME = "secp256k1";
    constexpr size_t COMPRESSED_POINT_SIZE = 33;

    EcGroupPtr make_group() {
        return EcGroupPtr(EC_GROUP_new_by_curve_name(NID_secp256k1));
    }

    BnPtr scalar_from_secret(const EC_GROUP* group, std::span<const std::uint8_t> secret_key) {
        if (secret_key.size() != SECRET_KEY_SIZE) {
            return nullptr;
        }
        
        BnPtr scalar(BN_secure_new());
        if (!scalar || !BN_bin2bn(secret_key.data(), static_cast<int>(secret_key.size()), scalar.get())) {
            return nullptr;
        }
        
        if (BN_is_zero(scalar.get()) || BN_cmp(scalar.get(), EC_GROUP_get0_order(group)) >= 0) {
            return nullptr;
        }
        
        return scalar;
    }

    std::array<std::uint8_t, COMPRESSED_POINT_SIZE> lift_x(const PublicKey& public_key) {
        std::array<std::uint8_t, COMPRESSED_POINT_SIZE> encoded{};
        encoded[0] = 0x02;
        std::copy(public_key.begin(), public_key.end(), encoded.begin() + 1);
        return encoded;
    }

    PkeyPtr build_pkey(OSSL_PARAM_BLD* builder, int selection) {
        std::unique_ptr<OSSL_PARAM, ParamDeleter> params(OSSL_PARAM_BLD_to_param(builder));
        if (!params) {
            return nullptr;
        }
        
        PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
        EVP_PKEY* raw = nullptr;
        if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) <= 0 ||
            EVP_PKEY_fromdata(ctx.get(), &raw, selection, params.get()) <= 0) {
            return nullptr;
        }
        return PkeyPtr(raw);
    }

    PkeyPtr make_private_pkey(const EC_GROUP* group, const BIGNUM* scalar) {
        BnCtxPtr bn_ctx(BN_CTX_new());
        EcPointPtr point(EC_POINT_new(group));
        if (!bn_ctx || !point || !EC_POINT_mul(group, point.get(), scalar, nullptr, nullptr, bn_ctx.get())) {
            return nullptr;
        }
        
        std::array<std::uint8_t, COMPRESSED_POINT_SIZE> encoded{};
        if (EC_POINT_point2oct(group, point.get(), POINT_CONVERSION_COMPRESSED,
                               encoded.data(), encoded.size(), bn_ctx.get()) != encoded.size()) {
            return nullptr;
        }
        
        std::unique_ptr<OSSL_PARAM_BLD, ParamBldDeleter> builder(OSSL_PARAM_BLD_new());
        if (!builder ||
            !OSSL_PARAM_BLD_push_utf8_string(builder.get(), OSSL_PKEY_PARAM_GROUP_NAME, CURVE_NAME, 0) ||
            !OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_PRIV_KEY, scalar) ||
            !OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                              encoded.data(), encoded.size())) {
            return nullptr;
        }
        
        return build_pkey(builder.get(), EVP_PKEY_KEYPAIR);
    }

    PkeyPtr make_public_pkey(const PublicKey& public_key) {
        auto encoded = lift_x(public_key);
        
        std::unique_ptr<OSSL_PARAM_BLD, ParamBldDeleter> builder(OSSL_PARAM_BLD_new());
        if (!builder ||
            !OSSL_PARAM_BLD_push_utf8_string(builder.get(), OSSL_PKEY_PARAM_GROUP_NAME, CURVE_NAME, 0) ||
            !OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                              encoded.data(), encoded.size())) {
            return nullptr;
        }
        
        return build_pkey(builder.get(), EVP_PKEY_PUBLIC_KEY);
    }
}

CryptoResult KeyAgreement::derive_conversation_key(std::span<const std::uint8_t> secret_key,
                                                   const PublicKey& peer_public_key,
                                                   ConversationKey& out_key) {
    auto group = make_group();
    if (!group) {
        return CryptoResult(CryptoError::INITIALIZATION_FAILED, "secp256k1 is not available");
    }
    
    auto scalar = scalar_from_secret(group.get(), secret_key);
    if (!scalar) {
        return CryptoResult(CryptoError::INVALID_KEY, "Secret key is not a valid secp256k1 scalar");
    }
    
    if (!is_valid_public_key(peer_public_key)) {
        return CryptoResult(CryptoError::INVALID_KEY, "Public key is not on secp256k1");
    }
    
    auto private_pkey = make_private_pkey(group.get(), scalar.get());
    auto peer_pkey = make_public_pkey(peer_public_key);
    if (!private_pkey || !peer_pkey) {
        return CryptoResult(CryptoError::KEY_AGREEMENT_FAILED, "Failed to load key material");
    }
    
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(private_pkey.get(), nullptr));
    if (!ctx || EVP_PKEY_derive_init(ctx.get()) <= 0 ||
        EVP_PKEY_derive_set_peer(ctx.get(), peer_pkey.get()) <= 0) {
        return CryptoResult(CryptoError::KEY_AGREEMENT_FAILED, "Failed to initialize ECDH");
    }
    
    SecureBytes shared_x(SHA256_HASH_SIZE);
    size_t shared_len = shared_x.size();
    if (EVP_PKEY_derive(ctx.get(), shared_x.data_ptr(), &shared_len) <= 0 || shared_len != SHA256_HASH_SIZE) {
        return CryptoResult(CryptoError::KEY_AGREEMENT_FAILED, "ECDH derivation failed");
    }
    
    const auto* salt = reinterpret_cast<const std::uint8_t*>(CONVERSATION_KEY_SALT);
    out_key = Hkdf::extract(std::span(salt, std::strlen(CONVERSATION_KEY_SALT)), shared_x.span());
    return CryptoResult();
}

CryptoResult KeyAgreement::derive_public_key(std::span<const std::uint8_t> secret_key,
                                             PublicKey& out_public_key) {
    auto group = make_group();
    if (!group) {
        return CryptoResult(CryptoError::INITIALIZATION_FAILED, "secp256k1 is not available");
    }
    
    auto scalar = scalar_from_secret(group.get(), secret_key);
    if (!scalar) {
        return CryptoResult(CryptoError::INVALID_KEY, "Secret key is not a valid secp256k1 scalar");
    }
    
    BnCtxPtr bn_ctx(BN_CTX_new());
    EcPointPtr point(EC_POINT_new(group.get()));
    BnPtr x(BN_new());
    if (!bn_ctx || !point || !x ||
        !EC_POINT_mul(group.get(), point.get(), scalar.get(), nullptr, nullptr, bn_ctx.get()) ||
        !EC_POINT_get_affine_coordinates(group.get(), point.get(), x.get(), nullptr, bn_ctx.get())) {
        return CryptoResult(CryptoError::KEY_AGREEMENT_FAILED, "Failed to compute public key");
    }
    
    if (BN_bn2binpad(x.get(), out_public_key.data(), static_cast<int>(out_public_key.size())) < 0) {
        return CryptoResult(CryptoError::KEY_AGREEMENT_FAILED, "Failed to encode public key");
    }
    
    return CryptoResult();
}

bool KeyAgreement::is_valid_secret_key(std::span<const std::uint8_t> secret_key) {
    auto group = make_group();
    return group && scalar_from_secret(group.get(), secret_key) != nullptr;
}

bool KeyAgreement::is_valid_public_key(const PublicKey& public_key) {
    auto group = make_group();
    BnCtxPtr bn_ctx(BN_CTX_new());
    if (!group || !bn_ctx) {
        return false;
    }
    
    EcPointPtr point(EC_POINT_new(group.get()));
    auto encoded = lift_x(public_key);
    return point && EC_POINT_oct2point(group.get(), point.get(), encoded.data(), encoded.size(), bn_ctx.get()) == 1;
}

namespace key_utils {

CryptoResult parse_secret_key_hex(const std::string& hex, SecureBytes& out_secret_key) {
    if (hex.size() != SECRET_KEY_SIZE * 2) {
        return CryptoResult(CryptoError::INVALID_KEY, "Secret key must be 64 hex characters");
    }
    
    auto bytes = hash_utils::from_hex(hex);
    if (!bytes) {
        return CryptoResult(CryptoError::INVALID_KEY, "Secret key is not valid hex");
    }
    
    SecureBytes secret(std::span<const std::uint8_t>(*bytes));
    sodium_memzero(bytes->data(), bytes->size());
    
    if (!KeyAgreement::is_valid_secret_key(secret.span())) {
        return CryptoResult(CryptoError::INVALID_KEY, "Secret key is out of range");
    }
    
    out_secret_key = std::move(secret);
    return CryptoResult();
}

CryptoResult parse_public_key_hex(const std::string& hex, PublicKey& out_public_key) {
    if (hex.size() != PUBLIC_KEY_SIZE * 2) {
        return CryptoResult(CryptoError::INVALID_KEY, "Public key must be 64 hex characters");
    }
    
    auto bytes = hash_utils::from_hex(hex);
    if (!bytes) {
        return CryptoResult(CryptoError::INVALID_KEY, "Public key is not valid hex");
    }
    
    PublicKey key;
    std::copy(bytes->begin(), bytes->end(), key.begin());
    if (!KeyAgreement::is_valid_public_key(key)) {
        return CryptoResult(CryptoError::INVALID_KEY, "Public key is not on secp256k1");
    }
    
    out_public_key = key;
    return CryptoResult();
}

}

}
