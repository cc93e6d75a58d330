#ifndef GUIDSTORE_CRYPT_HPP
#define GUIDSTORE_CRYPT_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace guidstore::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// Salted AES-128-CBC for short strings and whole files. Key and IV are both
// derived from the salt, so equal inputs give equal outputs under one salt.
class Crypt {
public:

  static constexpr size_t KEY_SIZE = 16;     // 128 bits for AES-128
  static constexpr size_t BLOCK_SIZE = 16;   // AES block size

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Salt derived from this machine
  Crypt();
  explicit Crypt(std::string salt);
  ~Crypt();

  Crypt(const Crypt&) = delete;
  Crypt& operator=(const Crypt&) = delete;

  // Stable per-host salt
  static std::string machine_salt();


  // ---- STRING OPERATIONS ----
  // Returns unpadded base64 of the ciphertext
  std::string encrypt(const std::string& text);
  std::string decrypt(const std::string& text);


  // ---- FILE OPERATIONS ----
  void encrypt_file(const std::filesystem::path& input, const std::filesystem::path& output);
  void decrypt_file(const std::filesystem::path& input, const std::filesystem::path& output);


  // ---- STREAM OPERATIONS ----
  std::ostream& encrypt(std::istream& input, std::ostream& output);
  std::ostream& decrypt(std::istream& input, std::ostream& output);


  // ---- GETTERS/SETTERS ----
  const std::string& salt() const { return salt_; }
  void set_salt(std::string salt) { salt_ = std::move(salt); }

private:
  // ---- PARAMETERS ----
  std::string salt_;
  std::unique_ptr<CipherContext> context_;
  static constexpr size_t BUFFER_SIZE = 8192;


  // ---- INITIALIZATION ----
  // Key and IV: salt bytes first, then each remaining position holds its index
  std::array<uint8_t, KEY_SIZE> salt_bytes() const;
  void initialize_cipher(bool encrypting);


  // ---- STREAM PROCESSING ----
  void process_stream(std::istream& input, std::ostream& output, bool encrypting);
  size_t process_block(const uint8_t* inbuf, size_t bytes_read, uint8_t* outbuf, bool encrypting);
  void process_final_block(uint8_t* outbuf, int& outlen, bool encrypting);
  void write_output_block(std::ostream& output, const uint8_t* data, size_t length);
  void process_file(const std::filesystem::path& input, const std::filesystem::path& output,
                    bool encrypting);
};

// ---- BASE64 ----
std::string encode_base64(const std::vector<uint8_t>& data);
// Accepts input with or without '=' padding
std::vector<uint8_t> decode_base64(const std::string& text);

} // namespace guidstore::crypto

#endif // GUIDSTORE_CRYPT_HPP
