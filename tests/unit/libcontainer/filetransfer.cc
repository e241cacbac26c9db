#include "buildjail/libcontainer/filetransfer.hh"
#include "buildjail/libutil/file-system.hh"
#include "tests/container-fixture.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <dirent.h>

using testing::ElementsAre;
using testing::IsEmpty;

namespace buildjail {

TEST(uriFileName, lastPathComponent) {
    ASSERT_EQ(
        uriFileName("https://partner-images.canonical.com/core/xenial/current/ubuntu-xenial-core-cloudimg-amd64-root.tar.gz"),
        "ubuntu-xenial-core-cloudimg-amd64-root.tar.gz");
    ASSERT_EQ(uriFileName("file:///srv/images/focal.tar.gz"), "focal.tar.gz");
    ASSERT_EQ(uriFileName("image.tar"), "image.tar");
}

TEST(uriFileName, ignoresQueryAndFragment) {
    ASSERT_EQ(uriFileName("https://example.org/a/image.tar.gz?token=abc/def#frag"), "image.tar.gz");
    ASSERT_EQ(uriFileName("https://example.org/a/image.tar.gz/"), "image.tar.gz");
}

TEST(uriFileName, noFileName) {
    ASSERT_THROW(uriFileName("https://example.org/a/.."), UsageError);
    ASSERT_THROW(uriFileName(""), UsageError);
    ASSERT_THROW(uriFileName("/"), UsageError);
}

TEST(FileTransferError, includesShortResponseBody) {
    FileTransferError e(FileTransfer::NotFound, "no such image\n", "unable to download '%s'", "x");
    ASSERT_EQ(e.error, FileTransfer::NotFound);
    ASSERT_THAT(e.msg(), testing::HasSubstr("no such image"));
}

class DownloadCacheTest : public ContainerTest
{
protected:
    const std::string uri = "https://example.org/images/ubuntu-focal-core-cloudimg-amd64-root.tar.gz";

    Strings cacheContents()
    {
        Strings res;
        std::unique_ptr<DIR, DIRDeleter> dir(opendir(settings.downloadCache.get().c_str()));
        if (!dir)
            throw SysError("opening directory '%s'", settings.downloadCache.get());
        while (auto entry = readdir(dir.get())) {
            std::string name = entry->d_name;
            if (name != "." && name != "..")
                res.push_back(name);
        }
        res.sort();
        return res;
    }
};

TEST_F(DownloadCacheTest, downloadsIntoCache) {
    auto path = downloadCached(transfer, uri, settings.downloadCache);

    ASSERT_EQ(path, settings.downloadCache.get() + "/ubuntu-focal-core-cloudimg-amd64-root.tar.gz");
    ASSERT_EQ(readFile(path), "base image of " + uri);
    ASSERT_THAT(transfer.downloads, ElementsAre(uri));
    ASSERT_THAT(cacheContents(), ElementsAre("ubuntu-focal-core-cloudimg-amd64-root.tar.gz"));
}

TEST_F(DownloadCacheTest, reusesCachedFile) {
    seedDownloadCache("ubuntu-focal-core-cloudimg-amd64-root.tar.gz");

    auto path = downloadCached(transfer, uri, settings.downloadCache);

    ASSERT_EQ(readFile(path), "base image");
    ASSERT_THAT(transfer.downloads, IsEmpty());
}

TEST_F(DownloadCacheTest, failedDownloadLeavesNothingBehind) {
    transfer.failure = FileTransfer::Transient;

    ASSERT_THROW(downloadCached(transfer, uri, settings.downloadCache), FileTransferError);
    ASSERT_THAT(cacheContents(), IsEmpty());

    /* The next attempt downloads again. */
    transfer.failure.reset();
    downloadCached(transfer, uri, settings.downloadCache);
    ASSERT_EQ(transfer.downloads.size(), 2u);
}

TEST_F(DownloadCacheTest, curlReadsLocalFiles) {
    auto source = tmpDir + "/ubuntu-jammy-core-cloudimg-amd64-root.tar.gz";
    writeFile(source, "local archive");

    auto curl = makeCurlFileTransfer();
    auto path = downloadCached(*curl, "file://" + source, settings.downloadCache);

    ASSERT_EQ(baseNameOf(path), "ubuntu-jammy-core-cloudimg-amd64-root.tar.gz");
    ASSERT_EQ(readFile(path), "local archive");
}

TEST_F(DownloadCacheTest, curlReportsMissingFiles) {
    auto curl = makeCurlFileTransfer();
    ASSERT_THROW(
        downloadCached(*curl, "file://" + tmpDir + "/missing.tar.gz", settings.downloadCache),
        FileTransferError);
    ASSERT_THAT(cacheContents(), IsEmpty());
}

}
