#include "crypto/crypt.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <boost/asio/ip/host_name.hpp>
#include <boost/log/trivial.hpp>

namespace guidstore::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw CryptoError("Crypt: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  EVP_CIPHER_CTX* get() { return ctx; }
};

namespace {

bool is_blank(const std::string& text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

void require_path(const std::filesystem::path& path, const char* name) {
  if (is_blank(path.string())) {
    throw InvalidArgumentError(std::string(name) + " can not be blank");
  }
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Crypt::Crypt() : Crypt(machine_salt()) {}

Crypt::Crypt(std::string salt)
  : salt_(std::move(salt))
  , context_(std::make_unique<CipherContext>()) {
  BOOST_LOG_TRIVIAL(debug) << "Crypt: Initialized with a " << salt_.size() << " byte salt";
}

Crypt::~Crypt() = default;

std::string Crypt::machine_salt() {
  std::string host = boost::asio::ip::host_name();
  BOOST_LOG_TRIVIAL(trace) << "Crypt: Deriving machine salt from host " << host;
  return host;
}


//==============================================
// CRYPTO UNIT INITIALIZATION
//==============================================

std::array<uint8_t, Crypt::KEY_SIZE> Crypt::salt_bytes() const {
  std::array<uint8_t, KEY_SIZE> secret;
  for (size_t i = 0; i < secret.size(); i++) {
    secret[i] = i < salt_.size() ? static_cast<uint8_t>(salt_[i]) : static_cast<uint8_t>(i);
  }
  return secret;
}

void Crypt::initialize_cipher(bool encrypting) {
  BOOST_LOG_TRIVIAL(trace) << "Crypt: Initializing cipher for " << (encrypting ? "encryption" : "decryption");

  EVP_CIPHER_CTX_reset(context_->get());

  const std::array<uint8_t, KEY_SIZE> secret = salt_bytes();
  const EVP_CIPHER* cipher = EVP_aes_128_cbc();
  if (encrypting) {
    if (!EVP_EncryptInit_ex(context_->get(), cipher, nullptr, secret.data(), secret.data())) {
      throw EncryptionError("Crypt: Failed to initialize encryption context");
    }
  } else {
    if (!EVP_DecryptInit_ex(context_->get(), cipher, nullptr, secret.data(), secret.data())) {
      throw DecryptionError("Crypt: Failed to initialize decryption context");
    }
  }
}


//==============================================
// STREAM PROCESSING - ENCRYPTION/DECRYPTION
//==============================================

void Crypt::process_stream(std::istream& input, std::ostream& output, bool encrypting) {
  if (!input.good() || !output.good()) {
    throw CryptoError("Crypt: Invalid stream state");
  }

  initialize_cipher(encrypting);

  std::array<uint8_t, BUFFER_SIZE> inbuf;
  std::array<uint8_t, BUFFER_SIZE + EVP_MAX_BLOCK_LENGTH> outbuf;
  size_t block_count = 0;
  size_t total_bytes_processed = 0;

  while (input.good()) {
    input.read(reinterpret_cast<char*>(inbuf.data()), inbuf.size());
    auto bytes_read = input.gcount();
    if (bytes_read <= 0) {
      break;
    }

    auto outlen = process_block(inbuf.data(), static_cast<size_t>(bytes_read), outbuf.data(), encrypting);
    write_output_block(output, outbuf.data(), outlen);
    total_bytes_processed += outlen;
    block_count++;
  }
  if (input.bad()) {
    throw CryptoError("Crypt: Failed to read from input stream");
  }

  int final_outlen = 0;
  process_final_block(outbuf.data(), final_outlen, encrypting);
  write_output_block(output, outbuf.data(), static_cast<size_t>(final_outlen));
  total_bytes_processed += static_cast<size_t>(final_outlen);
  output.flush();

  BOOST_LOG_TRIVIAL(debug) << "Crypt: Completed " << (encrypting ? "encryption" : "decryption")
                           << ": Processed " << total_bytes_processed
                           << " bytes in " << block_count << " blocks";
}

size_t Crypt::process_block(const uint8_t* inbuf, size_t bytes_read, uint8_t* outbuf, bool encrypting) {
  int outlen = 0;
  if (encrypting) {
    if (!EVP_EncryptUpdate(context_->get(), outbuf, &outlen, inbuf, static_cast<int>(bytes_read))) {
      throw EncryptionError("Crypt: Failed to encrypt data block");
    }
  } else {
    if (!EVP_DecryptUpdate(context_->get(), outbuf, &outlen, inbuf, static_cast<int>(bytes_read))) {
      throw DecryptionError("Crypt: Failed to decrypt data block");
    }
  }
  return static_cast<size_t>(outlen);
}

void Crypt::process_final_block(uint8_t* outbuf, int& outlen, bool encrypting) {
  if (encrypting) {
    if (!EVP_EncryptFinal_ex(context_->get(), outbuf, &outlen)) {
      throw EncryptionError("Crypt: Failed to finalize encryption");
    }
  } else {
    // Fails on bad padding, which is what a wrong salt usually produces
    if (!EVP_DecryptFinal_ex(context_->get(), outbuf, &outlen)) {
      throw DecryptionError("Crypt: Failed to finalize decryption");
    }
  }
}

void Crypt::write_output_block(std::ostream& output, const uint8_t* data, size_t length) {
  if (length > 0) {
    output.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
    if (!output.good()) {
      throw CryptoError("Crypt: Failed to write to output stream");
    }
  }
}

std::ostream& Crypt::encrypt(std::istream& input, std::ostream& output) {
  process_stream(input, output, true);
  return output;
}

std::ostream& Crypt::decrypt(std::istream& input, std::ostream& output) {
  process_stream(input, output, false);
  return output;
}


//==============================================
// STRING OPERATIONS
//==============================================

std::string Crypt::encrypt(const std::string& text) {
  if (is_blank(text)) {
    throw InvalidArgumentError("text can not be blank");
  }

  std::istringstream input(text);
  std::ostringstream output;
  encrypt(input, output);

  const std::string cipher = output.str();
  std::string encoded = encode_base64(std::vector<uint8_t>(cipher.begin(), cipher.end()));
  encoded.erase(encoded.find_last_not_of('=') + 1);
  return encoded;
}

std::string Crypt::decrypt(const std::string& text) {
  if (is_blank(text)) {
    throw InvalidArgumentError("text can not be blank");
  }

  std::vector<uint8_t> cipher;
  try {
    cipher = decode_base64(text);
  } catch (const InvalidArgumentError& e) {
    throw DecryptionError(std::string("Crypt: ") + e.what());
  }

  std::istringstream input(std::string(cipher.begin(), cipher.end()));
  std::ostringstream output;
  decrypt(input, output);
  return output.str();
}


//==============================================
// FILE OPERATIONS
//==============================================

void Crypt::encrypt_file(const std::filesystem::path& input, const std::filesystem::path& output) {
  process_file(input, output, true);
}

void Crypt::decrypt_file(const std::filesystem::path& input, const std::filesystem::path& output) {
  process_file(input, output, false);
}

void Crypt::process_file(const std::filesystem::path& input, const std::filesystem::path& output,
                         bool encrypting) {
  require_path(input, "input path");
  require_path(output, "output path");
  BOOST_LOG_TRIVIAL(info) << "Crypt: " << (encrypting ? "Encrypting " : "Decrypting ")
                          << input.string() << " to " << output.string();

  std::ifstream in(input, std::ios::binary);
  if (!in) {
    throw CryptoError("Crypt: Failed to open input file: " + input.string());
  }
  std::ofstream out(output, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw CryptoError("Crypt: Failed to create output file: " + output.string());
  }

  process_stream(in, out, encrypting);
}


//==============================================
// BASE64
//==============================================

std::string encode_base64(const std::vector<uint8_t>& data) {
  if (data.empty()) {
    return std::string();
  }
  // EVP_EncodeBlock also writes a terminating NUL
  std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                data.data(), static_cast<int>(data.size()));
  encoded.resize(static_cast<size_t>(written));
  return encoded;
}

std::vector<uint8_t> decode_base64(const std::string& text) {
  std::string padded = text;
  padded.erase(padded.find_last_not_of('=') + 1);
  size_t padding = (4 - padded.size() % 4) % 4;
  if (padding == 3) {
    throw InvalidArgumentError("invalid base64 length");
  }
  padded.append(padding, '=');
  if (padded.empty()) {
    return {};
  }

  std::vector<uint8_t> decoded(padded.size() / 4 * 3);
  int written = EVP_DecodeBlock(decoded.data(),
                                reinterpret_cast<const unsigned char*>(padded.data()),
                                static_cast<int>(padded.size()));
  if (written < 0) {
    throw InvalidArgumentError("invalid base64 input");
  }
  // EVP_DecodeBlock counts padding positions as zero bytes
  decoded.resize(static_cast<size_t>(written) - padding);
  return decoded;
}

} // namespace guidstore::crypto
