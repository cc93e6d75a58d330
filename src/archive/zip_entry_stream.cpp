#include "archive/zip_entry_stream.hpp"
#include "archive/archive_error.hpp"
#include "archive/zip_format.hpp"
#include <algorithm>
#include <cstring>
#include <zlib.h>
#include <boost/log/trivial.hpp>

namespace guidstore::archive {

//=================================================
// RAII WRAPPER TO MANAGE INFLATE STATE LIFECYCLE
//=================================================

struct InflateContext {
  z_stream stream{};

  InflateContext() {
    // Negative window bits: raw deflate data without zlib header
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
      throw ArchiveError("Zip entry stream: Failed to initialize inflate state");
    }
  }

  ~InflateContext() {
    inflateEnd(&stream);
  }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ZipEntryStreambuf::ZipEntryStreambuf(std::unique_ptr<std::istream> source, uint16_t method,
                                     uint64_t compressed_size, uint64_t uncompressed_size,
                                     uint32_t crc32, std::string name)
  : source_(std::move(source))
  , method_(method)
  , compressed_remaining_(compressed_size)
  , expected_size_(uncompressed_size)
  , expected_crc_(crc32)
  , name_(std::move(name)) {
  if (method_ == zip_format::METHOD_DEFLATE) {
    inflate_ = std::make_unique<InflateContext>();
  } else if (method_ != zip_format::METHOD_STORED) {
    throw CorruptArchiveError("unsupported compression method " + std::to_string(method_) +
                              " for entry " + name_);
  }
  running_crc_ = static_cast<uint32_t>(::crc32(0L, Z_NULL, 0));
  setg(out_buffer_.data(), out_buffer_.data(), out_buffer_.data());
}

ZipEntryStreambuf::~ZipEntryStreambuf() = default;


//==============================================
// DECODING
//==============================================

ZipEntryStreambuf::int_type ZipEntryStreambuf::underflow() {
  if (gptr() < egptr()) {
    return traits_type::to_int_type(*gptr());
  }

  size_t produced = 0;
  while (produced == 0 && !finished_) {
    produced = produce();
  }

  if (produced == 0) {
    return traits_type::eof();
  }

  setg(out_buffer_.data(), out_buffer_.data(), out_buffer_.data() + produced);
  return traits_type::to_int_type(*gptr());
}

size_t ZipEntryStreambuf::read_source() {
  auto wanted = static_cast<std::streamsize>(
    std::min<uint64_t>(compressed_remaining_, in_buffer_.size()));
  if (wanted == 0) {
    return 0;
  }

  source_->read(in_buffer_.data(), wanted);
  auto got = source_->gcount();
  if (got <= 0) {
    throw CorruptArchiveError("unexpected end of data in entry " + name_);
  }
  compressed_remaining_ -= static_cast<uint64_t>(got);
  return static_cast<size_t>(got);
}

size_t ZipEntryStreambuf::produce() {
  size_t length = 0;

  if (method_ == zip_format::METHOD_STORED) {
    length = read_source();
    if (length > 0) {
      std::memcpy(out_buffer_.data(), in_buffer_.data(), length);
    }
    if (compressed_remaining_ == 0) {
      finished_ = true;
    }
  } else {
    z_stream& zs = inflate_->stream;
    if (zs.avail_in == 0) {
      size_t got = read_source();
      zs.next_in = reinterpret_cast<Bytef*>(in_buffer_.data());
      zs.avail_in = static_cast<uInt>(got);
      if (got == 0) {
        throw CorruptArchiveError("truncated deflate stream in entry " + name_);
      }
    }

    zs.next_out = reinterpret_cast<Bytef*>(out_buffer_.data());
    zs.avail_out = static_cast<uInt>(out_buffer_.size());

    int rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      throw CorruptArchiveError("inflate failed for entry " + name_ + ": " +
                                (zs.msg ? zs.msg : "unknown error"));
    }
    length = out_buffer_.size() - zs.avail_out;
    if (rc == Z_STREAM_END) {
      finished_ = true;
    }
  }

  if (length > 0) {
    running_crc_ = static_cast<uint32_t>(
      ::crc32(running_crc_, reinterpret_cast<const Bytef*>(out_buffer_.data()),
              static_cast<uInt>(length)));
    produced_ += length;
  }

  if (finished_) {
    verify();
  }
  return length;
}

void ZipEntryStreambuf::verify() {
  if (produced_ != expected_size_) {
    BOOST_LOG_TRIVIAL(error) << "Zip entry stream: Size mismatch for " << name_
                             << ": expected " << expected_size_ << " got " << produced_;
    throw CorruptArchiveError("size mismatch in entry " + name_);
  }
  if (running_crc_ != expected_crc_) {
    BOOST_LOG_TRIVIAL(error) << "Zip entry stream: CRC mismatch for " << name_;
    throw CorruptArchiveError("CRC mismatch in entry " + name_);
  }
}


//==============================================
// OWNING STREAM
//==============================================

ZipEntryStream::ZipEntryStream(std::unique_ptr<ZipEntryStreambuf> buf)
  : std::istream(nullptr)
  , buf_(std::move(buf)) {
  rdbuf(buf_.get());
  // Surface decoding errors instead of leaving only badbit behind
  exceptions(std::ios::badbit);
}

} // namespace guidstore::archive
