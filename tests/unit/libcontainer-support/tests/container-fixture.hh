#pragma once
///@file

#include "buildjail/libcontainer/globals.hh"
#include "buildjail/libutil/file-system.hh"
#include "tests/recording-executor.hh"

#include <gtest/gtest.h>

namespace buildjail {

/**
 * A container below a fresh temporary directory, owned by `bob`, with
 * all external effects going to a RecordingExecutor.
 */
class ContainerTest : public ::testing::Test
{
protected:
    Path tmpDir;
    AutoDelete deleteTmpDir;
    Settings settings;
    SessionConfig config;
    RecordingExecutor executor;
    FakeMountTableReader mountReader{executor.mounts};
    FakeFileTransfer transfer;

    explicit ContainerTest(Architecture arch = Architecture::x86_64, const std::string & workDirName = "work");

    /**
     * Put a base image archive into the download cache.
     */
    void seedDownloadCache(const std::string & fileName);
};

/**
 * The temporary directory tests create their files in.
 */
Path testTempDir();

}
