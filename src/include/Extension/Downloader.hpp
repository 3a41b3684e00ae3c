#pragma once

#include <string>

#include "Extension/Errors.hpp"

enum struct DownloadedFileType
{
    /// A gzip-compressed file, decompressed to the destination path
    Gzip,
    /// A gzip-compressed tarball, extracted into the destination directory
    GzipTar,
    /// A zip archive, extracted into the destination directory
    Zip,
    /// A plain file, stored at the destination path
    Uncompressed,
};

class Downloader
{
public:
    virtual ~Downloader() {}

    /// Downloads `url` to `destination`, decoding it according to `fileType`. Fails with ExtensionErrorKind::Download
    virtual Status downloadFile(const std::string& url, const std::string& destination, DownloadedFileType fileType) = 0;
};

/// Extracts every regular file and directory of the zip or tar archive at `archivePath` into `destination`.
/// Entries which would escape `destination` are rejected
Status extractArchive(const std::string& archivePath, const std::string& destination);

/// Decompresses the single gzip stream at `archivePath` into the file `destination`
Status decompressGzip(const std::string& archivePath, const std::string& destination);

/// Downloads over libcurl and decodes archives with libarchive
class HttpDownloader : public Downloader
{
public:
    Status downloadFile(const std::string& url, const std::string& destination, DownloadedFileType fileType) override;
};
