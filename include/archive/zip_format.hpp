#ifndef GUIDSTORE_ZIP_FORMAT_HPP
#define GUIDSTORE_ZIP_FORMAT_HPP

#include <cstdint>
#include <cstddef>

// Record layouts of the PKWARE .ZIP application note (APPNOTE.TXT), limited to
// what a single-disk, non-ZIP64 archive needs.
namespace guidstore::archive::zip_format {

constexpr uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;
constexpr uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
constexpr uint32_t END_OF_CENTRAL_DIR_SIGNATURE = 0x06054b50;
constexpr uint32_t DATA_DESCRIPTOR_SIGNATURE = 0x08074b50;

constexpr size_t LOCAL_HEADER_SIZE = 30;
constexpr size_t CENTRAL_HEADER_SIZE = 46;
constexpr size_t END_OF_CENTRAL_DIR_SIZE = 22;
constexpr size_t MAX_COMMENT_SIZE = 0xFFFF;

constexpr uint16_t METHOD_STORED = 0;
constexpr uint16_t METHOD_DEFLATE = 8;

constexpr uint16_t VERSION_NEEDED = 20;  // 2.0: deflate, directories
constexpr uint16_t VERSION_MADE_BY = (3 << 8) | 20;  // unix host, 2.0

constexpr uint16_t FLAG_ENCRYPTED = 0x0001;
constexpr uint16_t FLAG_DATA_DESCRIPTOR = 0x0008;
constexpr uint16_t FLAG_UTF8_NAME = 0x0800;

// Sentinels meaning the real value lives in a ZIP64 extra field
constexpr uint16_t ZIP64_COUNT_MARKER = 0xFFFF;
constexpr uint32_t ZIP64_VALUE_MARKER = 0xFFFFFFFF;

// Regular file, rw-r--r--, stored in the high half of the external attributes
constexpr uint32_t UNIX_FILE_ATTRIBUTES = 0100644u << 16;

} // namespace guidstore::archive::zip_format

#endif // GUIDSTORE_ZIP_FORMAT_HPP
