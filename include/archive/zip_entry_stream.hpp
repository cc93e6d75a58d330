#ifndef GUIDSTORE_ZIP_ENTRY_STREAM_HPP
#define GUIDSTORE_ZIP_ENTRY_STREAM_HPP

#include <array>
#include <cstdint>
#include <istream>
#include <memory>
#include <streambuf>
#include <string>

namespace guidstore::archive {

// Forward declaration for the zlib stream state
struct InflateContext;

// Decodes one entry's payload on demand from a source positioned at the first
// byte of the compressed data. Reads at most compressed_size bytes from source
// and verifies size and CRC-32 once the payload is exhausted.
class ZipEntryStreambuf : public std::streambuf {
public:
  ZipEntryStreambuf(std::unique_ptr<std::istream> source, uint16_t method,
                    uint64_t compressed_size, uint64_t uncompressed_size,
                    uint32_t crc32, std::string name);
  ~ZipEntryStreambuf() override;

protected:
  int_type underflow() override;

private:
  static constexpr size_t BUFFER_SIZE = 16384;

  std::unique_ptr<std::istream> source_;
  std::unique_ptr<InflateContext> inflate_;
  uint16_t method_;
  uint64_t compressed_remaining_;
  uint64_t expected_size_;
  uint32_t expected_crc_;
  std::string name_;

  uint64_t produced_ = 0;
  uint32_t running_crc_ = 0;
  bool finished_ = false;

  std::array<char, BUFFER_SIZE> in_buffer_;
  std::array<char, BUFFER_SIZE> out_buffer_;

  // ---- DECODING ----
  // Refills in_buffer_ from source, returns bytes read
  size_t read_source();
  // Produces the next chunk of payload into out_buffer_, returns its length
  size_t produce();
  // Checks size and CRC once the payload end is reached
  void verify();
};

// std::istream that owns its ZipEntryStreambuf
class ZipEntryStream : public std::istream {
public:
  explicit ZipEntryStream(std::unique_ptr<ZipEntryStreambuf> buf);

private:
  std::unique_ptr<ZipEntryStreambuf> buf_;
};

} // namespace guidstore::archive

#endif // GUIDSTORE_ZIP_ENTRY_STREAM_HPP
