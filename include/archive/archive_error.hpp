#ifndef GUIDSTORE_ARCHIVE_ERROR_HPP
#define GUIDSTORE_ARCHIVE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace guidstore::archive {

class ArchiveError : public std::runtime_error {
public:
    explicit ArchiveError(const std::string& message)
        : std::runtime_error(message) {}
};

// Structure of the container could not be parsed or fails its checksums
class CorruptArchiveError : public ArchiveError {
public:
    explicit CorruptArchiveError(const std::string& message)
        : ArchiveError("Corrupt archive: " + message) {}
};

class ArchiveClosedError : public ArchiveError {
public:
    explicit ArchiveClosedError(const std::string& message)
        : ArchiveError("Archive closed: " + message) {}
};

} // namespace guidstore::archive

#endif // GUIDSTORE_ARCHIVE_ERROR_HPP
