#include "archive/zip_archive.hpp"
#include "archive/byte_order.hpp"
#include "archive/zip_entry_stream.hpp"
#include "archive/zip_format.hpp"
#include <algorithm>
#include <array>
#include <ctime>
#include <fstream>
#include <limits>
#include <sstream>
#include <zlib.h>
#include <boost/log/trivial.hpp>

namespace guidstore::archive {

namespace {

using LE = ByteOrder;

//=================================================
// RAII WRAPPER TO MANAGE DEFLATE STATE LIFECYCLE
//=================================================

struct DeflateContext {
  z_stream stream{};

  explicit DeflateContext(int level) {
    if (deflateInit2(&stream, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
      throw ArchiveError("Zip archive: Failed to initialize deflate state");
    }
  }

  ~DeflateContext() {
    deflateEnd(&stream);
  }
};

// Current local time in MS-DOS date/time encoding
void dos_date_time(uint16_t& dos_time, uint16_t& dos_date) {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);

  dos_time = static_cast<uint16_t>((local.tm_hour << 11) | (local.tm_min << 5) | (local.tm_sec / 2));
  dos_date = static_cast<uint16_t>(((local.tm_year + 1900 - 1980) << 9) |
                                   ((local.tm_mon + 1) << 5) | local.tm_mday);
}

void append_central_header(std::string& out, const ZipEntryInfo& info) {
  LE::putLittleEndian<uint32_t>(out, zip_format::CENTRAL_HEADER_SIGNATURE);
  LE::putLittleEndian<uint16_t>(out, zip_format::VERSION_MADE_BY);
  LE::putLittleEndian<uint16_t>(out, zip_format::VERSION_NEEDED);
  LE::putLittleEndian<uint16_t>(out, info.flags);
  LE::putLittleEndian<uint16_t>(out, info.method);
  LE::putLittleEndian<uint16_t>(out, info.mod_time);
  LE::putLittleEndian<uint16_t>(out, info.mod_date);
  LE::putLittleEndian<uint32_t>(out, info.crc32);
  LE::putLittleEndian<uint32_t>(out, static_cast<uint32_t>(info.compressed_size));
  LE::putLittleEndian<uint32_t>(out, static_cast<uint32_t>(info.uncompressed_size));
  LE::putLittleEndian<uint16_t>(out, static_cast<uint16_t>(info.name.size()));
  LE::putLittleEndian<uint16_t>(out, 0);   // extra field length
  LE::putLittleEndian<uint16_t>(out, 0);   // comment length
  LE::putLittleEndian<uint16_t>(out, 0);   // disk number start
  LE::putLittleEndian<uint16_t>(out, 0);   // internal attributes
  LE::putLittleEndian<uint32_t>(out, zip_format::UNIX_FILE_ATTRIBUTES);
  LE::putLittleEndian<uint32_t>(out, static_cast<uint32_t>(info.local_header_offset));
  out += info.name;
}

void check_limits(uint64_t value, const std::string& what) {
  if (value >= zip_format::ZIP64_VALUE_MARKER) {
    throw ArchiveError("Zip archive: " + what + " exceeds the non-ZIP64 limit");
  }
}

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ZipArchive::ZipArchive(const std::filesystem::path& path) : path_(path) {
  BOOST_LOG_TRIVIAL(debug) << "Zip archive: Opening " << path_.string();

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    BOOST_LOG_TRIVIAL(info) << "Zip archive: Creating empty archive at " << path_.string();
    create_empty();
  } else if (std::filesystem::is_regular_file(path_, ec) && std::filesystem::file_size(path_, ec) == 0) {
    // A zero-length file is treated as a new archive
    BOOST_LOG_TRIVIAL(info) << "Zip archive: Initializing zero-length file " << path_.string();
    create_empty();
  }

  load_index();
  open_ = true;
  BOOST_LOG_TRIVIAL(debug) << "Zip archive: Opened " << path_.string() << " with "
                           << committed_.size() << " entries";
}

ZipArchive::~ZipArchive() {
  if (!open_) {
    return;
  }
  try {
    close();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Zip archive: Failed to close " << path_.string()
                             << " during destruction: " << e.what();
  }
}


//==============================================
// ENTRY OPERATIONS
//==============================================

bool ZipArchive::contains(const std::string& name) const {
  ensure_open();
  return pending_.count(name) > 0 || committed_.count(name) > 0;
}

void ZipArchive::put(const std::string& name, const std::string& data) {
  std::istringstream input(data);
  put(name, input);
}

void ZipArchive::put(const std::string& name, std::istream& data) {
  ensure_open();
  validate_name(name);

  PendingEntry entry = compress(name, data);
  BOOST_LOG_TRIVIAL(trace) << "Zip archive: Compressed " << name << " from "
                           << entry.info.uncompressed_size << " to "
                           << entry.info.compressed_size << " bytes";

  // The replaced record is simply not carried over on commit
  committed_.erase(name);
  pending_[name] = std::move(entry);
  dirty_ = true;
}

bool ZipArchive::remove(const std::string& name) {
  ensure_open();
  bool removed = committed_.erase(name) > 0;
  removed = pending_.erase(name) > 0 || removed;
  if (removed) {
    dirty_ = true;
  }
  return removed;
}

std::unique_ptr<std::istream> ZipArchive::open_entry(const std::string& name) const {
  ensure_open();

  if (auto it = pending_.find(name); it != pending_.end()) {
    const ZipEntryInfo& info = it->second.info;
    auto source = std::make_unique<std::istringstream>(it->second.compressed);
    auto buf = std::make_unique<ZipEntryStreambuf>(std::move(source), info.method,
      info.compressed_size, info.uncompressed_size, info.crc32, name);
    return std::make_unique<ZipEntryStream>(std::move(buf));
  }

  auto it = committed_.find(name);
  if (it == committed_.end()) {
    return nullptr;
  }

  const ZipEntryInfo& info = it->second;
  auto source = std::make_unique<std::ifstream>(path_, std::ios::binary);
  if (!*source) {
    throw ArchiveError("Zip archive: Failed to open " + path_.string() + " for reading");
  }
  source->seekg(static_cast<std::streamoff>(data_offset(*source, info)));

  auto buf = std::make_unique<ZipEntryStreambuf>(std::move(source), info.method,
    info.compressed_size, info.uncompressed_size, info.crc32, name);
  return std::make_unique<ZipEntryStream>(std::move(buf));
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<std::string> ZipArchive::entry_names() const {
  ensure_open();
  std::vector<std::string> names;
  names.reserve(committed_.size() + pending_.size());
  for (const auto& [name, info] : committed_) {
    names.push_back(name);
  }
  for (const auto& [name, entry] : pending_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

size_t ZipArchive::entry_count() const {
  ensure_open();
  return committed_.size() + pending_.size();
}


//==============================================
// PERSISTENCE
//==============================================

void ZipArchive::commit() {
  ensure_open();
  if (!dirty_) {
    BOOST_LOG_TRIVIAL(trace) << "Zip archive: Nothing to commit for " << path_.string();
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Zip archive: Committing " << pending_.size()
                           << " pending entries to " << path_.string();

  auto tmp = path_;
  tmp += ".tmp";

  std::vector<ZipEntryInfo> written;
  written.reserve(committed_.size() + pending_.size());

  {
    std::ifstream source(path_, std::ios::binary);
    if (!source) {
      throw ArchiveError("Zip archive: Failed to open " + path_.string() + " for reading");
    }
    std::ofstream target(tmp, std::ios::binary | std::ios::trunc);
    if (!target) {
      throw ArchiveError("Zip archive: Failed to create " + tmp.string());
    }

    // Surviving records keep their original order in the file
    std::vector<const ZipEntryInfo*> survivors;
    survivors.reserve(committed_.size());
    for (const auto& [name, info] : committed_) {
      survivors.push_back(&info);
    }
    std::sort(survivors.begin(), survivors.end(),
      [](const ZipEntryInfo* a, const ZipEntryInfo* b) {
        return a->local_header_offset < b->local_header_offset;
      });

    uint64_t offset = 0;
    for (const ZipEntryInfo* info : survivors) {
      ZipEntryInfo moved = *info;
      moved.local_header_offset = offset;
      offset += copy_record(source, target, *info);
      written.push_back(std::move(moved));
    }

    std::vector<const PendingEntry*> added;
    added.reserve(pending_.size());
    for (const auto& [name, entry] : pending_) {
      added.push_back(&entry);
    }
    std::sort(added.begin(), added.end(),
      [](const PendingEntry* a, const PendingEntry* b) { return a->info.name < b->info.name; });

    for (const PendingEntry* entry : added) {
      check_limits(offset, "archive size");
      ZipEntryInfo info = entry->info;
      info.local_header_offset = offset;
      offset += write_record(target, *entry);
      written.push_back(std::move(info));
    }

    if (written.size() >= zip_format::ZIP64_COUNT_MARKER) {
      throw ArchiveError("Zip archive: entry count exceeds the non-ZIP64 limit");
    }

    std::string central;
    for (const auto& info : written) {
      append_central_header(central, info);
    }
    check_limits(offset, "central directory offset");
    check_limits(central.size(), "central directory size");

    std::string end_record;
    LE::putLittleEndian<uint32_t>(end_record, zip_format::END_OF_CENTRAL_DIR_SIGNATURE);
    LE::putLittleEndian<uint16_t>(end_record, 0);   // this disk
    LE::putLittleEndian<uint16_t>(end_record, 0);   // central directory disk
    LE::putLittleEndian<uint16_t>(end_record, static_cast<uint16_t>(written.size()));
    LE::putLittleEndian<uint16_t>(end_record, static_cast<uint16_t>(written.size()));
    LE::putLittleEndian<uint32_t>(end_record, static_cast<uint32_t>(central.size()));
    LE::putLittleEndian<uint32_t>(end_record, static_cast<uint32_t>(offset));
    LE::putLittleEndian<uint16_t>(end_record, 0);   // comment length

    target.write(central.data(), static_cast<std::streamsize>(central.size()));
    target.write(end_record.data(), static_cast<std::streamsize>(end_record.size()));
    target.flush();
    if (!target) {
      target.close();
      std::filesystem::remove(tmp);
      throw ArchiveError("Zip archive: Failed to write " + tmp.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path_, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw ArchiveError("Zip archive: Failed to replace " + path_.string() + ": " + ec.message());
  }

  committed_.clear();
  for (auto& info : written) {
    std::string name = info.name;
    committed_.emplace(std::move(name), std::move(info));
  }
  pending_.clear();
  dirty_ = false;

  BOOST_LOG_TRIVIAL(debug) << "Zip archive: Committed " << committed_.size()
                           << " entries to " << path_.string();
}

void ZipArchive::close() {
  if (!open_) {
    return;
  }
  commit();
  open_ = false;
  committed_.clear();
  pending_.clear();
  BOOST_LOG_TRIVIAL(debug) << "Zip archive: Closed " << path_.string();
}

uint64_t ZipArchive::copy_record(std::istream& source, std::ostream& target,
                                 const ZipEntryInfo& info) const {
  uint64_t start = info.local_header_offset;
  uint64_t end = data_offset(source, info) + info.compressed_size;

  if (info.flags & zip_format::FLAG_DATA_DESCRIPTOR) {
    // Descriptor is crc/csize/usize, optionally preceded by its signature
    std::array<char, 4> signature{};
    source.seekg(static_cast<std::streamoff>(end));
    source.read(signature.data(), signature.size());
    if (!source) {
      throw CorruptArchiveError("missing data descriptor for entry " + info.name);
    }
    end += LE::getLittleEndian<uint32_t>(signature.data()) == zip_format::DATA_DESCRIPTOR_SIGNATURE
      ? 16 : 12;
  }

  source.clear();
  source.seekg(static_cast<std::streamoff>(start));

  std::array<char, 65536> buffer;
  uint64_t remaining = end - start;
  while (remaining > 0) {
    auto chunk = static_cast<std::streamsize>(std::min<uint64_t>(remaining, buffer.size()));
    source.read(buffer.data(), chunk);
    if (source.gcount() != chunk) {
      throw CorruptArchiveError("truncated record for entry " + info.name);
    }
    target.write(buffer.data(), chunk);
    remaining -= static_cast<uint64_t>(chunk);
  }
  return end - start;
}

uint64_t ZipArchive::write_record(std::ostream& target, const PendingEntry& entry) const {
  const ZipEntryInfo& info = entry.info;

  std::string header;
  LE::putLittleEndian<uint32_t>(header, zip_format::LOCAL_HEADER_SIGNATURE);
  LE::putLittleEndian<uint16_t>(header, zip_format::VERSION_NEEDED);
  LE::putLittleEndian<uint16_t>(header, info.flags);
  LE::putLittleEndian<uint16_t>(header, info.method);
  LE::putLittleEndian<uint16_t>(header, info.mod_time);
  LE::putLittleEndian<uint16_t>(header, info.mod_date);
  LE::putLittleEndian<uint32_t>(header, info.crc32);
  LE::putLittleEndian<uint32_t>(header, static_cast<uint32_t>(info.compressed_size));
  LE::putLittleEndian<uint32_t>(header, static_cast<uint32_t>(info.uncompressed_size));
  LE::putLittleEndian<uint16_t>(header, static_cast<uint16_t>(info.name.size()));
  LE::putLittleEndian<uint16_t>(header, 0);   // extra field length
  header += info.name;

  target.write(header.data(), static_cast<std::streamsize>(header.size()));
  target.write(entry.compressed.data(), static_cast<std::streamsize>(entry.compressed.size()));
  return header.size() + entry.compressed.size();
}

uint64_t ZipArchive::data_offset(std::istream& source, const ZipEntryInfo& info) const {
  std::array<char, zip_format::LOCAL_HEADER_SIZE> header;
  source.clear();
  source.seekg(static_cast<std::streamoff>(info.local_header_offset));
  source.read(header.data(), header.size());
  if (!source || LE::getLittleEndian<uint32_t>(header.data()) != zip_format::LOCAL_HEADER_SIGNATURE) {
    throw CorruptArchiveError("bad local header for entry " + info.name);
  }

  uint16_t name_length = LE::getLittleEndian<uint16_t>(header.data() + 26);
  uint16_t extra_length = LE::getLittleEndian<uint16_t>(header.data() + 28);
  return info.local_header_offset + zip_format::LOCAL_HEADER_SIZE + name_length + extra_length;
}


//==============================================
// INDEX LOADING
//==============================================

void ZipArchive::create_empty() const {
  std::string end_record;
  LE::putLittleEndian<uint32_t>(end_record, zip_format::END_OF_CENTRAL_DIR_SIGNATURE);
  end_record.append(zip_format::END_OF_CENTRAL_DIR_SIZE - 4, '\0');

  std::ofstream file(path_, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw ArchiveError("Zip archive: Failed to create " + path_.string());
  }
  file.write(end_record.data(), static_cast<std::streamsize>(end_record.size()));
  file.flush();
  if (!file) {
    throw ArchiveError("Zip archive: Failed to write " + path_.string());
  }
}

void ZipArchive::load_index() {
  std::ifstream file(path_, std::ios::binary);
  if (!file) {
    throw ArchiveError("Zip archive: Failed to open " + path_.string());
  }

  std::error_code ec;
  uint64_t file_size = std::filesystem::file_size(path_, ec);
  if (ec) {
    throw ArchiveError("Zip archive: Failed to stat " + path_.string() + ": " + ec.message());
  }
  if (file_size < zip_format::END_OF_CENTRAL_DIR_SIZE) {
    throw CorruptArchiveError(path_.string() + " is too small to be an archive");
  }

  // The end record sits in the last 22 bytes plus an optional comment
  uint64_t tail_size = std::min<uint64_t>(
    file_size, zip_format::END_OF_CENTRAL_DIR_SIZE + zip_format::MAX_COMMENT_SIZE);
  std::string tail(static_cast<size_t>(tail_size), '\0');
  file.seekg(static_cast<std::streamoff>(file_size - tail_size));
  file.read(tail.data(), static_cast<std::streamsize>(tail.size()));
  if (!file) {
    throw ArchiveError("Zip archive: Failed to read " + path_.string());
  }

  size_t end_pos = std::string::npos;
  for (size_t i = tail.size() - zip_format::END_OF_CENTRAL_DIR_SIZE + 1; i-- > 0;) {
    if (LE::getLittleEndian<uint32_t>(tail.data() + i) == zip_format::END_OF_CENTRAL_DIR_SIGNATURE) {
      uint16_t comment_length = LE::getLittleEndian<uint16_t>(tail.data() + i + 20);
      if (i + zip_format::END_OF_CENTRAL_DIR_SIZE + comment_length <= tail.size()) {
        end_pos = i;
        break;
      }
    }
  }
  if (end_pos == std::string::npos) {
    throw CorruptArchiveError("end of central directory not found in " + path_.string());
  }

  const char* end_record = tail.data() + end_pos;
  uint16_t disk_number = LE::getLittleEndian<uint16_t>(end_record + 4);
  uint16_t central_disk = LE::getLittleEndian<uint16_t>(end_record + 6);
  uint16_t entry_total = LE::getLittleEndian<uint16_t>(end_record + 10);
  uint32_t central_size = LE::getLittleEndian<uint32_t>(end_record + 12);
  uint32_t central_offset = LE::getLittleEndian<uint32_t>(end_record + 16);

  if (disk_number != 0 || central_disk != 0) {
    throw CorruptArchiveError("multi-disk archives are not supported");
  }
  if (entry_total == zip_format::ZIP64_COUNT_MARKER ||
      central_size == zip_format::ZIP64_VALUE_MARKER ||
      central_offset == zip_format::ZIP64_VALUE_MARKER) {
    throw CorruptArchiveError("ZIP64 archives are not supported");
  }

  uint64_t end_offset = file_size - tail_size + end_pos;
  if (static_cast<uint64_t>(central_offset) + central_size > end_offset) {
    throw CorruptArchiveError("central directory lies outside " + path_.string());
  }

  std::string central(central_size, '\0');
  file.seekg(static_cast<std::streamoff>(central_offset));
  file.read(central.data(), static_cast<std::streamsize>(central.size()));
  if (!file) {
    throw ArchiveError("Zip archive: Failed to read central directory of " + path_.string());
  }

  committed_.clear();
  size_t pos = 0;
  for (uint16_t n = 0; n < entry_total; ++n) {
    if (pos + zip_format::CENTRAL_HEADER_SIZE > central.size()) {
      throw CorruptArchiveError("central directory truncated");
    }
    const char* record = central.data() + pos;
    if (LE::getLittleEndian<uint32_t>(record) != zip_format::CENTRAL_HEADER_SIGNATURE) {
      throw CorruptArchiveError("bad central directory signature");
    }

    ZipEntryInfo info;
    info.flags = LE::getLittleEndian<uint16_t>(record + 8);
    info.method = LE::getLittleEndian<uint16_t>(record + 10);
    info.mod_time = LE::getLittleEndian<uint16_t>(record + 12);
    info.mod_date = LE::getLittleEndian<uint16_t>(record + 14);
    info.crc32 = LE::getLittleEndian<uint32_t>(record + 16);
    uint32_t compressed = LE::getLittleEndian<uint32_t>(record + 20);
    uint32_t uncompressed = LE::getLittleEndian<uint32_t>(record + 24);
    uint16_t name_length = LE::getLittleEndian<uint16_t>(record + 28);
    uint16_t extra_length = LE::getLittleEndian<uint16_t>(record + 30);
    uint16_t comment_length = LE::getLittleEndian<uint16_t>(record + 32);
    uint32_t local_offset = LE::getLittleEndian<uint32_t>(record + 42);

    size_t record_size = zip_format::CENTRAL_HEADER_SIZE + name_length + extra_length + comment_length;
    if (pos + record_size > central.size()) {
      throw CorruptArchiveError("central directory record truncated");
    }
    if (compressed == zip_format::ZIP64_VALUE_MARKER ||
        uncompressed == zip_format::ZIP64_VALUE_MARKER ||
        local_offset == zip_format::ZIP64_VALUE_MARKER) {
      throw CorruptArchiveError("ZIP64 entries are not supported");
    }
    if (info.flags & zip_format::FLAG_ENCRYPTED) {
      throw CorruptArchiveError("encrypted entries are not supported");
    }
    if (static_cast<uint64_t>(local_offset) + compressed > central_offset) {
      throw CorruptArchiveError("entry data lies outside the archive");
    }

    info.name.assign(record + zip_format::CENTRAL_HEADER_SIZE, name_length);
    info.compressed_size = compressed;
    info.uncompressed_size = uncompressed;
    info.local_header_offset = local_offset;

    std::string name = info.name;
    committed_[std::move(name)] = std::move(info);
    pos += record_size;
  }

  pending_.clear();
  dirty_ = false;
}


//==============================================
// UTILITY METHODS
//==============================================

void ZipArchive::ensure_open() const {
  if (!open_) {
    throw ArchiveClosedError(path_.string());
  }
}

void ZipArchive::validate_name(const std::string& name) {
  if (name.empty() || name.size() > std::numeric_limits<uint16_t>::max()) {
    throw ArchiveError("Zip archive: Invalid entry name length " + std::to_string(name.size()));
  }
}

ZipArchive::PendingEntry ZipArchive::compress(const std::string& name, std::istream& data) {
  if (!data.good()) {
    throw ArchiveError("Zip archive: Invalid input stream for entry " + name);
  }

  PendingEntry entry;
  entry.info.name = name;
  entry.info.method = zip_format::METHOD_DEFLATE;
  dos_date_time(entry.info.mod_time, entry.info.mod_date);

  DeflateContext context(COMPRESSION_LEVEL);
  z_stream& zs = context.stream;

  std::array<char, 16384> in_buffer;
  std::array<char, 16384> out_buffer;
  uLong crc = ::crc32(0L, Z_NULL, 0);
  uint64_t total_in = 0;

  bool last = false;
  while (!last) {
    data.read(in_buffer.data(), in_buffer.size());
    auto got = data.gcount();
    if (data.bad()) {
      throw ArchiveError("Zip archive: Failed to read input stream for entry " + name);
    }
    last = !data;

    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(in_buffer.data()), static_cast<uInt>(got));
    total_in += static_cast<uint64_t>(got);

    zs.next_in = reinterpret_cast<Bytef*>(in_buffer.data());
    zs.avail_in = static_cast<uInt>(got);
    int flush = last ? Z_FINISH : Z_NO_FLUSH;

    do {
      zs.next_out = reinterpret_cast<Bytef*>(out_buffer.data());
      zs.avail_out = static_cast<uInt>(out_buffer.size());
      if (deflate(&zs, flush) == Z_STREAM_ERROR) {
        throw ArchiveError("Zip archive: deflate failed for entry " + name);
      }
      entry.compressed.append(out_buffer.data(), out_buffer.size() - zs.avail_out);
    } while (zs.avail_out == 0);
  }

  check_limits(total_in, "entry size");
  check_limits(entry.compressed.size(), "compressed entry size");

  entry.info.crc32 = static_cast<uint32_t>(crc);
  entry.info.uncompressed_size = total_in;
  entry.info.compressed_size = entry.compressed.size();
  return entry;
}

} // namespace guidstore::archive
