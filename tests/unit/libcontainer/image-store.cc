#include "buildjail/libcontainer/image-store.hh"
#include "buildjail/libutil/processes.hh"
#include "buildjail/libutil/strings.hh"
#include "tests/container-fixture.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sys/stat.h>

using testing::ElementsAre;
using testing::Key;
using testing::Contains;

namespace buildjail {

class ImageStoreTest : public ContainerTest
{
protected:
    ImageStore image{config.layout.imagePath, config.layout.chrootDir, executor, mountReader};
};

TEST_F(ImageStoreTest, createMakesSparseImage) {
    ASSERT_FALSE(image.exists());

    image.create(64ULL << 20);

    ASSERT_TRUE(image.exists());
    ASSERT_TRUE(pathExists(image.root()));

    auto st = lstat(image.image());
    ASSERT_EQ(st.st_size, 64LL << 20);
    /* Nothing was written, so (almost) nothing is allocated. */
    ASSERT_LT(st.st_blocks * 512, 1LL << 20);

    ASSERT_THAT(executor.commandLines(), ElementsAre(showCommandLine("mkfs.ext4", {image.image()})));
    ASSERT_FALSE(executor.commands.back().privileged);
}

TEST_F(ImageStoreTest, createReplacesOldImage) {
    createDirs(image.root() + "/etc");
    writeFile(image.root() + "/etc/leftover", "x");
    writeFile(image.image(), "old image");

    image.create(1 << 20);

    ASSERT_FALSE(pathExists(image.root() + "/etc/leftover"));
    ASSERT_EQ(lstat(image.image()).st_size, 1 << 20);
    ASSERT_THAT(executor.commandLines(), ElementsAre(
        "sudo " + showCommandLine("rm", {"-rf", image.root()}),
        showCommandLine("mkfs.ext4", {image.image()})));
}

TEST_F(ImageStoreTest, createRefusesWhileMounted) {
    image.create(1 << 20);
    image.mount();
    ASSERT_THROW(image.create(1 << 20), StorageError);
    ASSERT_TRUE(image.exists());
}

TEST_F(ImageStoreTest, createFailsWhenMkfsFails) {
    executor.handler = [](const Command & cmd) -> std::optional<CommandResult> {
        if (cmd.program == "mkfs.ext4")
            return CommandResult{.status = 1 << 8};
        return std::nullopt;
    };
    ASSERT_THROW(image.create(1 << 20), ExecError);
}

TEST_F(ImageStoreTest, mountAndUnmountAreIdempotent) {
    image.create(1 << 20);

    image.mount();
    image.mount();
    ASSERT_TRUE(image.isMounted());
    ASSERT_EQ(image.mountState(), MountState::Mounted);
    ASSERT_THAT(executor.mounts, Contains(Key(image.root())));

    image.unmount();
    image.unmount();
    ASSERT_FALSE(image.isMounted());
    ASSERT_EQ(image.mountState(), MountState::Unmounted);

    ASSERT_THAT(executor.commandLines(), ElementsAre(
        showCommandLine("mkfs.ext4", {image.image()}),
        "sudo " + showCommandLine("mount", {image.image(), image.root()}),
        "sudo " + showCommandLine("umount", {image.root()})));
}

TEST_F(ImageStoreTest, mountStateComesFromTheLiveTable) {
    image.create(1 << 20);
    image.mount();

    /* Someone else unmounted it. */
    executor.mounts.clear();
    ASSERT_FALSE(image.isMounted());

    /* And someone mounted it again. */
    executor.mounts[image.root()] = "/";
    ASSERT_TRUE(image.isMounted());
    ASSERT_EQ(image.mountState(), MountState::Mounted);
}

TEST_F(ImageStoreTest, unreadableMountTableFallsBackToTrackedState) {
    image.create(1 << 20);
    image.mount();

    mountReader.broken = true;
    ASSERT_TRUE(image.isMounted());

    image.markUnmounted();
    ASSERT_FALSE(image.isMounted());
}

TEST_F(ImageStoreTest, quarantineMovesImageAside) {
    image.create(1 << 20);
    writeFile(image.image() + ".failed", "older failure");

    image.quarantine();

    ASSERT_FALSE(image.exists());
    ASSERT_TRUE(pathExists(image.image() + ".failed"));
    ASSERT_EQ(lstat(image.image() + ".failed").st_size, 1 << 20);
}

TEST_F(ImageStoreTest, quarantineWithoutImageIsNoop) {
    image.quarantine();
    ASSERT_FALSE(pathExists(image.image() + ".failed"));
}

}
