#include "crypto/signer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "crypto/hash.hpp"

namespace modvault::crypto {

namespace {

constexpr std::string_view kErrSigInit = "Failed to initialize OQS signature context";

class SigContext {
 public:
  explicit SigContext(std::string_view algorithm) {
    handle_ = OQS_SIG_new(std::string(algorithm).c_str());
    if (handle_ == nullptr) {
      throw std::runtime_error(std::string(kErrSigInit));
    }
  }

  ~SigContext() { OQS_SIG_free(handle_); }
  SigContext(const SigContext&) = delete;
  SigContext& operator=(const SigContext&) = delete;
  SigContext(SigContext&&) = delete;
  SigContext& operator=(SigContext&&) = delete;

  OQS_SIG* get() const { return handle_; }

 private:
  OQS_SIG* handle_{nullptr};
};

const OQS_SIG& SignatureContext() {
  static SigContext ctx(kSignerAlgorithm);
  return *ctx.get();
}

void EnsureSize(std::span<const std::uint8_t> buffer, std::size_t expected_size,
                std::string_view label) {
  if (buffer.size() != expected_size) {
    throw std::runtime_error(std::string(label) + " size mismatch");
  }
}

void Wipe(std::vector<std::uint8_t>* buffer) {
  if (!buffer->empty()) {
    OQS_MEM_cleanse(buffer->data(), buffer->size());
  }
  buffer->clear();
}

}  // namespace

SignerKey::SignerKey(std::vector<std::uint8_t> secret_key, std::vector<std::uint8_t> public_key)
    : secret_key_(std::move(secret_key)), public_key_(std::move(public_key)) {}

SignerKey::~SignerKey() { Wipe(&secret_key_); }

SignerKey::SignerKey(SignerKey&& other) noexcept = default;

SignerKey& SignerKey::operator=(SignerKey&& other) noexcept {
  if (this != &other) {
    Wipe(&secret_key_);
    secret_key_ = std::move(other.secret_key_);
    public_key_ = std::move(other.public_key_);
  }
  return *this;
}

SignerKey SignerKey::Generate() {
  const auto& sig = SignatureContext();
  std::vector<std::uint8_t> public_key(sig.length_public_key);
  std::vector<std::uint8_t> secret_key(sig.length_secret_key);
  if (OQS_SIG_keypair(&sig, public_key.data(), secret_key.data()) != OQS_SUCCESS) {
    throw std::runtime_error("Failed to generate ML-DSA keypair");
  }
  return SignerKey(std::move(secret_key), std::move(public_key));
}

SignerKey SignerKey::Import(std::span<const std::uint8_t> secret_key,
                            std::span<const std::uint8_t> public_key) {
  const auto& sig = SignatureContext();
  EnsureSize(secret_key, sig.length_secret_key, "ML-DSA secret key");
  EnsureSize(public_key, sig.length_public_key, "ML-DSA public key");
  return SignerKey(std::vector<std::uint8_t>(secret_key.begin(), secret_key.end()),
                   std::vector<std::uint8_t>(public_key.begin(), public_key.end()));
}

std::vector<std::uint8_t> SignerKey::Sign(std::span<const std::uint8_t> message) const {
  const auto& sig = SignatureContext();
  EnsureSize(secret_key_, sig.length_secret_key, "ML-DSA secret key");
  std::vector<std::uint8_t> signature(sig.length_signature);
  size_t sig_len = 0;
  if (OQS_SIG_sign(&sig, signature.data(), &sig_len, message.data(), message.size(),
                   secret_key_.data()) != OQS_SUCCESS) {
    throw std::runtime_error("ML-DSA signing failure");
  }
  signature.resize(sig_len);
  return signature;
}

primitives::Address SignerKey::address() const { return AddressFromPublicKey(public_key_); }

std::size_t SignerPublicKeySize() { return SignatureContext().length_public_key; }

std::size_t SignerSignatureSize() { return SignatureContext().length_signature; }

bool VerifySignature(std::span<const std::uint8_t> message,
                     std::span<const std::uint8_t> signature,
                     std::span<const std::uint8_t> public_key) {
  const auto& sig = SignatureContext();
  if (public_key.size() != sig.length_public_key) {
    return false;
  }
  if (signature.empty() || signature.size() > sig.length_signature) {
    return false;
  }
  return OQS_SIG_verify(&sig, message.data(), message.size(), signature.data(), signature.size(),
                        public_key.data()) == OQS_SUCCESS;
}

primitives::Address AddressFromPublicKey(std::span<const std::uint8_t> public_key) {
  const auto digest = Sha3_256(public_key);
  primitives::Address address{};
  std::copy(digest.end() - address.size(), digest.end(), address.begin());
  return address;
}

}  // namespace modvault::crypto
