#include "Extension/Downloader.hpp"
#include "Extension/Http.hpp"
#include "FileUtils.hpp"

#include <cstdio>
#include <filesystem>
#include <memory>

#include <archive.h>
#include <archive_entry.h>

using ArchiveReader = std::unique_ptr<archive, decltype(&archive_read_free)>;

static ExtensionError downloadError(const std::string& message)
{
    return makeError(ExtensionErrorKind::Download, message);
}

static std::string archiveErrorString(archive* reader)
{
    const char* message = archive_error_string(reader);
    return message ? message : "unknown archive error";
}

static Status copyEntryData(archive* reader, const std::string& target)
{
    FILE* file = fopen(target.c_str(), "wb");
    if (!file)
        return downloadError("failed to create '" + target + "'");

    const void* buffer = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;

    while (true)
    {
        int result = archive_read_data_block(reader, &buffer, &size, &offset);
        if (result == ARCHIVE_EOF)
            break;
        if (result != ARCHIVE_OK)
        {
            fclose(file);
            return downloadError("failed to decompress '" + target + "': " + archiveErrorString(reader));
        }

        if (fseek(file, long(offset), SEEK_SET) != 0 || fwrite(buffer, 1, size, file) != size)
        {
            fclose(file);
            return downloadError("failed to write '" + target + "'");
        }
    }

    if (fclose(file) != 0)
        return downloadError("failed to write '" + target + "'");

    return Unit{};
}

Status extractArchive(const std::string& archivePath, const std::string& destination)
{
    ArchiveReader reader(archive_read_new(), &archive_read_free);
    if (!reader)
        return downloadError("failed to initialize libarchive");

    archive_read_support_format_zip(reader.get());
    archive_read_support_format_tar(reader.get());
    archive_read_support_filter_gzip(reader.get());

    if (archive_read_open_filename(reader.get(), archivePath.c_str(), 10240) != ARCHIVE_OK)
        return downloadError("failed to open archive '" + archivePath + "': " + archiveErrorString(reader.get()));

    if (auto error = FileUtils::createDirectories(destination))
        return downloadError("failed to create '" + destination + "': " + *error);

    archive_entry* entry = nullptr;
    while (true)
    {
        int result = archive_read_next_header(reader.get(), &entry);
        if (result == ARCHIVE_EOF)
            break;
        if (result != ARCHIVE_OK && result != ARCHIVE_WARN)
            return downloadError("failed to read archive '" + archivePath + "': " + archiveErrorString(reader.get()));

        const char* pathname = archive_entry_pathname(entry);
        std::string name = pathname ? pathname : "";
        if (!FileUtils::isContainedRelativePath(name))
            return downloadError("archive entry '" + name + "' points outside of the destination directory");

        std::string target = FileUtils::joinPaths(destination, name);

        auto type = archive_entry_filetype(entry);
        if (type == AE_IFDIR)
        {
            if (auto error = FileUtils::createDirectories(target))
                return downloadError("failed to create '" + target + "': " + *error);
            continue;
        }

        // Links and special files are never part of a release asset
        if (type != AE_IFREG)
            continue;

        std::string parent = std::filesystem::path(target).parent_path().generic_string();
        if (!parent.empty())
        {
            if (auto error = FileUtils::createDirectories(parent))
                return downloadError("failed to create '" + parent + "': " + *error);
        }

        if (auto status = copyEntryData(reader.get(), target); !status)
            return status;
    }

    return Unit{};
}

Status decompressGzip(const std::string& archivePath, const std::string& destination)
{
    ArchiveReader reader(archive_read_new(), &archive_read_free);
    if (!reader)
        return downloadError("failed to initialize libarchive");

    archive_read_support_format_raw(reader.get());
    archive_read_support_filter_gzip(reader.get());

    if (archive_read_open_filename(reader.get(), archivePath.c_str(), 10240) != ARCHIVE_OK)
        return downloadError("failed to open '" + archivePath + "': " + archiveErrorString(reader.get()));

    archive_entry* entry = nullptr;
    if (archive_read_next_header(reader.get(), &entry) != ARCHIVE_OK)
        return downloadError("failed to read '" + archivePath + "': " + archiveErrorString(reader.get()));

    return copyEntryData(reader.get(), destination);
}

Status HttpDownloader::downloadFile(const std::string& url, const std::string& destination, DownloadedFileType fileType)
{
    std::string partial = destination;
    while (!partial.empty() && (partial.back() == '/' || partial.back() == '\\'))
        partial.pop_back();
    partial += ".partial";

    if (auto error = Http::downloadToFile(url, partial))
    {
        // A leftover partial file is overwritten by the next attempt
        FileUtils::removeAll(partial);
        return downloadError(*error);
    }

    Status status = Unit{};
    switch (fileType)
    {
    case DownloadedFileType::Zip:
    case DownloadedFileType::GzipTar:
        status = extractArchive(partial, destination);
        break;
    case DownloadedFileType::Gzip:
        status = decompressGzip(partial, destination);
        break;
    case DownloadedFileType::Uncompressed:
        if (auto error = FileUtils::renameFile(partial, destination))
            status = downloadError("failed to move download to '" + destination + "': " + *error);
        break;
    }

    FileUtils::removeAll(partial);
    return status;
}
