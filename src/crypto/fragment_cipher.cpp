#include "umbra/crypto/fragment_cipher.hpp"
#include "umbra/crypto/sodium_interop.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace umbra::protocol::crypto {

namespace {

Result<Unit, ProtocolFailure> CheckKey(std::span<const uint8_t> key) {
    if (key.size() != kSharedKeyBytes) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                fmt::format("Channel key must be {} bytes, got {}", kSharedKeyBytes, key.size())));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> CheckPayload(const size_t size) {
    if (size > kMaxFragmentPayloadBytes) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                fmt::format("Fragment payload of {} bytes exceeds limit of {}",
                            size, kMaxFragmentPayloadBytes)));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

template<typename T>
Result<T, ProtocolFailure> Flatten(Result<Result<T, ProtocolFailure>, SodiumFailure> nested) {
    if (nested.IsErr()) {
        return Result<T, ProtocolFailure>::Err(
            ProtocolFailure::ObjectDisposed(nested.UnwrapErr().message));
    }
    return std::move(nested).Unwrap();
}

} // namespace

Result<Fragment, ProtocolFailure> Fragment::FromWire(
    std::span<const uint8_t> seq,
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> auth_tag) {

    auto nonce_result = Nonce::Decode(seq);
    if (nonce_result.IsErr()) {
        return Result<Fragment, ProtocolFailure>::Err(std::move(nonce_result).UnwrapErr());
    }
    if (auth_tag.size() != kAuthTagBytes) {
        return Result<Fragment, ProtocolFailure>::Err(
            ProtocolFailure::ProtocolViolation(
                fmt::format("Auth tag must be {} bytes, got {}", kAuthTagBytes, auth_tag.size())));
    }
    if (ciphertext.size() > kMaxFragmentPayloadBytes) {
        return Result<Fragment, ProtocolFailure>::Err(
            ProtocolFailure::ProtocolViolation("Fragment ciphertext exceeds maximum size"));
    }
    AuthTag tag{};
    std::copy(auth_tag.begin(), auth_tag.end(), tag.begin());
    return Result<Fragment, ProtocolFailure>::Ok(
        Fragment(nonce_result.Unwrap(), std::vector<uint8_t>(ciphertext.begin(), ciphertext.end()), tag));
}

Result<std::vector<uint8_t>, ProtocolFailure> FragmentCipher::Keystream(
    std::string_view domain_tag,
    std::span<const uint8_t> key,
    const Nonce& seq,
    const size_t length) {

    const auto seq_bytes = seq.Encode();
    Digest subkey = SodiumInterop::Hash({AsBytes(domain_tag), key, seq_bytes});
    auto stream = SodiumInterop::Keystream(subkey, length);
    sodium_memzero(subkey.data(), subkey.size());
    return stream;
}

AuthTag FragmentCipher::ComputeTag(
    std::span<const uint8_t> key,
    const Nonce& seq,
    std::span<const uint8_t> ciphertext) {

    const auto seq_bytes = seq.Encode();
    Digest mac_key = SodiumInterop::Hash({AsBytes(kAuthenticationDomainTag), key, seq_bytes});
    const AuthTag tag = SodiumInterop::Hash({mac_key, seq_bytes, ciphertext});
    sodium_memzero(mac_key.data(), mac_key.size());
    return tag;
}

Result<Fragment, ProtocolFailure> FragmentCipher::Encrypt(
    std::span<const uint8_t> key,
    const Nonce& seq,
    std::span<const uint8_t> plaintext) {

    if (auto check = CheckKey(key); check.IsErr()) {
        return Result<Fragment, ProtocolFailure>::Err(std::move(check).UnwrapErr());
    }
    if (auto check = CheckPayload(plaintext.size()); check.IsErr()) {
        return Result<Fragment, ProtocolFailure>::Err(std::move(check).UnwrapErr());
    }

    auto stream_result = Keystream(kEncryptionDomainTag, key, seq, plaintext.size());
    if (stream_result.IsErr()) {
        return Result<Fragment, ProtocolFailure>::Err(std::move(stream_result).UnwrapErr());
    }
    std::vector<uint8_t> ciphertext = std::move(stream_result).Unwrap();
    for (size_t i = 0; i < ciphertext.size(); ++i) {
        ciphertext[i] ^= plaintext[i];
    }

    const AuthTag tag = ComputeTag(key, seq, ciphertext);
    return Result<Fragment, ProtocolFailure>::Ok(Fragment(seq, std::move(ciphertext), tag));
}

Result<Fragment, ProtocolFailure> FragmentCipher::Encrypt(
    const SecureMemoryHandle& key,
    const Nonce& seq,
    std::span<const uint8_t> plaintext) {
    return Flatten(key.WithReadAccess([&](std::span<const uint8_t> key_bytes) {
        return Encrypt(key_bytes, seq, plaintext);
    }));
}

Result<std::vector<uint8_t>, ProtocolFailure> FragmentCipher::Decrypt(
    std::span<const uint8_t> key,
    const Fragment& fragment) {

    if (auto check = CheckKey(key); check.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(check).UnwrapErr());
    }
    if (auto check = CheckPayload(fragment.Ciphertext().size()); check.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(check).UnwrapErr());
    }

    const AuthTag expected = ComputeTag(key, fragment.Seq(), fragment.Ciphertext());
    if (!SodiumInterop::ConstantTimeEquals(expected, fragment.Tag())) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Authentication("Fragment authentication tag mismatch"));
    }

    auto stream_result = Keystream(kEncryptionDomainTag, key, fragment.Seq(), fragment.Ciphertext().size());
    if (stream_result.IsErr()) {
        return stream_result;
    }
    std::vector<uint8_t> plaintext = std::move(stream_result).Unwrap();
    const auto ciphertext = fragment.Ciphertext();
    for (size_t i = 0; i < plaintext.size(); ++i) {
        plaintext[i] ^= ciphertext[i];
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(plaintext));
}

Result<std::vector<uint8_t>, ProtocolFailure> FragmentCipher::Decrypt(
    const SecureMemoryHandle& key,
    const Fragment& fragment) {
    return Flatten(key.WithReadAccess([&](std::span<const uint8_t> key_bytes) {
        return Decrypt(key_bytes, fragment);
    }));
}

} // namespace umbra::protocol::crypto
