#include "buildjail/libcontainer/provisioner.hh"
#include "buildjail/libutil/processes.hh"
#include "buildjail/libutil/strings.hh"
#include "tests/container-fixture.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using testing::Contains;
using testing::ElementsAre;
using testing::ElementsAreArray;
using testing::HasSubstr;
using testing::Key;
using testing::Not;

namespace buildjail {

TEST(imageName, secondFieldOfFileName) {
    ASSERT_EQ(imageName("https://partner-images.canonical.com/core/xenial/current/ubuntu-xenial-core-cloudimg-amd64-root.tar.gz"), "xenial");
    ASSERT_EQ(imageName("file:///srv/ubuntu-focal-core.tar.gz?x=1"), "focal");
    ASSERT_THROW(imageName("https://example.org/rootfs.tar.gz"), UsageError);
}

TEST(isLegacyImage, olderReleases) {
    ASSERT_TRUE(isLegacyImage("xenial"));
    ASSERT_TRUE(isLegacyImage("bionic"));
    ASSERT_FALSE(isLegacyImage("focal"));
    ASSERT_FALSE(isLegacyImage("jammy"));
}

class ProvisionerTest : public ContainerTest
{
protected:
    ImageStore image{config.layout.imagePath, config.layout.chrootDir, executor, mountReader};
    ChrootRunner chroot{config, executor};
    Provisioner provisioner{config, image, chroot, executor, transfer};

    /**
     * Commands run inside the container, one string each.
     */
    Strings chrootCommandLines() const
    {
        Strings res;
        for (auto & cmd : executor.chrootCommands())
            res.push_back(concatStringsSep(" ", cmd));
        return res;
    }

    /**
     * Host-side commands, leaving out the chroot plumbing.
     */
    Strings hostPrograms() const
    {
        Strings res;
        for (auto & cmd : executor.commands)
            if (cmd.program != "infocmp" && !(cmd.program == "cp" && cmd.args.front() == "/etc/resolv.conf"))
                res.push_back(cmd.program == "chroot" ? "chroot" : showCommand(cmd));
        return res;
    }

    void failInside(const std::string & commandLine)
    {
        executor.handler = [commandLine](const Command & cmd) -> std::optional<CommandResult> {
            if (cmd.program == "chroot" && concatStringsSep(" ", innerCommand(cmd)) == commandLine)
                return CommandResult{.status = 100 << 8};
            return std::nullopt;
        };
    }
};

class Provisioner32Test : public ContainerTest
{
protected:
    Provisioner32Test() : ContainerTest(Architecture::x86) {}

    ImageStore image{config.layout.imagePath, config.layout.chrootDir, executor, mountReader};
    ChrootRunner chroot{config, executor};
    Provisioner provisioner{config, image, chroot, executor, transfer};
};

static const std::string toolchain =
    "apt-get install -y build-essential software-properties-common nasm chrpath zsh git "
    "uuid-dev libmount-dev apt-transport-https dh-autoreconf gperf";

TEST_F(ProvisionerTest, imageUrlHasArchitecture) {
    ASSERT_EQ(provisioner.imageUrl(),
        "https://partner-images.canonical.com/core/xenial/current/ubuntu-xenial-core-cloudimg-amd64-root.tar.gz");
}

TEST_F(Provisioner32Test, imageUrlHasArchitecture) {
    ASSERT_THAT(provisioner.imageUrl(), HasSubstr("-cloudimg-i386-root"));
}

TEST_F(ProvisionerTest, legacyImage) {
    provisioner.provision();

    ASSERT_THAT(transfer.downloads, ElementsAre(provisioner.imageUrl()));

    ASSERT_THAT(chrootCommandLines(), ElementsAreArray(Strings{
        "groupadd -f -g 1000 crusers",
        "useradd --home-dir=/home/bob --create-home --uid=1000 --gid=1000 bob",
        "chmod +x /usr/sbin/policy-rc.d",
        "dpkg-divert --local --rename --add /sbin/initctl",
        "cp -a /usr/sbin/policy-rc.d /sbin/initctl",
        "sed -i s/^exit.*/exit 0/ /sbin/initctl",
        "debconf-set-selections",
        "debconf-set-selections",
        "debconf-show tzdata",
        "apt-get update",
        "apt-get install -y tzdata",
        toolchain,
        "add-apt-repository ppa:deadsnakes/ppa -y",
        "apt-get update",
        "apt-get install -y python3.9 python3.9-venv",
        "sh -c ln -sf `which python3.9` `which python3`",
        "python3 -m ensurepip --upgrade --default-pip",
        "sh -c curl https://apt.kitware.com/keys/kitware-archive-latest.asc | gpg --dearmor - > /usr/share/keyrings/kitware-archive-keyring.gpg",
        "sh -c echo 'deb [signed-by=/usr/share/keyrings/kitware-archive-keyring.gpg] https://apt.kitware.com/ubuntu/ xenial main' > /etc/apt/sources.list.d/kitware.list",
        "apt-get update",
        "rm /usr/share/keyrings/kitware-archive-keyring.gpg",
        "apt-get install -y kitware-archive-keyring",
        "apt-get install -y cmake",
        "python3 -m pip install ninja",
        "python3 -m pip install meson",
        "apt-get clean",
        "chsh -s /bin/zsh bob",
    }));

    /* The image is left mounted, and nothing else. */
    ASSERT_TRUE(image.exists());
    ASSERT_TRUE(image.isMounted());
    ASSERT_EQ(executor.mounts.size(), 1u);
}

TEST_F(ProvisionerTest, hostSideSteps) {
    provisioner.provision();

    auto archive = settings.downloadCache.get() + "/" + uriFileName(provisioner.imageUrl());
    auto root = image.root();
    auto sudo = [](std::string_view program, const Strings & args) {
        return "sudo " + showCommandLine(program, args);
    };

    auto programs = hostPrograms();
    Strings head(programs.begin(), std::next(programs.begin(), 7));
    ASSERT_THAT(head, ElementsAre(
        showCommandLine("mkfs.ext4", {image.image()}),
        sudo("mount", {image.image(), root}),
        sudo("tar", {"-C", root, "-xpf", archive}),
        "chroot",
        "chroot",
        sudo("tee", {root + "/usr/sbin/policy-rc.d"}),
        "chroot"));

    ASSERT_THAT(programs, Contains(sudo("tee", {root + "/etc/apt/apt.conf.d/chroot-no-languages"})));

    Strings tail(std::prev(programs.end(), 6), programs.end());
    ASSERT_THAT(tail, ElementsAre(
        "chroot",
        "chroot",
        "chroot",
        "chroot",
        sudo("umount", {"-l", root + "/dev/urandom"}),
        sudo("umount", {"-l", root + "/dev/random"})));
}

TEST_F(ProvisionerTest, devicesAreBoundForPackageInstalls) {
    bool sawBinds = false;
    executor.handler = [&](const Command & cmd) -> std::optional<CommandResult> {
        if (cmd.program == "chroot" && innerCommand(cmd) == Strings{"apt-get", "update"}) {
            sawBinds = executor.mounts.contains(image.root() + "/dev/random")
                && executor.mounts.contains(image.root() + "/dev/urandom");
        }
        return std::nullopt;
    };

    provisioner.provision();

    ASSERT_TRUE(sawBinds);
    ASSERT_THAT(executor.mounts, Not(Contains(Key(image.root() + "/dev/random"))));
    ASSERT_THAT(executor.mounts, Not(Contains(Key(image.root() + "/dev/urandom"))));
}

TEST_F(ProvisionerTest, tzdataIsPreseeded) {
    provisioner.provision();

    Strings inputs;
    for (auto & cmd : executor.commands)
        if (cmd.program == "chroot" && cmd.input)
            inputs.push_back(*cmd.input);

    ASSERT_THAT(inputs, ElementsAre(
        "tzdata tzdata/Areas select Asia\n",
        "tzdata tzdata/Zones/Asia select Kolkata\n",
        "6\n44\n"));

    for (auto & cmd : executor.commands)
        if (cmd.program == "chroot" && innerCommand(cmd).front() == "debconf-set-selections")
            ASSERT_EQ(cmd.environment->at("DEBIAN_FRONTEND"), "noninteractive");
}

TEST_F(ProvisionerTest, otherTimezonesRelyOnDebconfOnly) {
    settings.timezone = "Europe/Berlin";
    provisioner.provision();

    Strings inputs;
    for (auto & cmd : executor.commands)
        if (cmd.program == "chroot" && cmd.input)
            inputs.push_back(*cmd.input);

    ASSERT_THAT(inputs, ElementsAre(
        "tzdata tzdata/Areas select Europe\n",
        "tzdata tzdata/Zones/Europe select Berlin\n"));
}

TEST_F(ProvisionerTest, invalidTimezone) {
    settings.timezone = "Kolkata";
    ASSERT_THROW(provisioner.provision(), UsageError);
    ASSERT_THAT(executor.mounts, Not(Contains(Key(image.root() + "/dev/random"))));
}

TEST_F(ProvisionerTest, currentImage) {
    settings.image = "https://cloud-images.ubuntu.com/focal/current/ubuntu-focal-core-cloudimg-{}-root.tar.gz";
    settings.deps = Strings{"libssl-dev", "nasm"};
    settings.buildShell = "/bin/bash";

    provisioner.provision();

    auto lines = chrootCommandLines();
    Strings tail(std::next(lines.begin(), 11), lines.end());
    ASSERT_THAT(tail, ElementsAreArray(Strings{
        toolchain,
        "apt-get install -y python-is-python3 python3-pip",
        "apt-get install -y cmake",
        "python3 -m pip install ninja",
        "python3 -m pip install meson",
        "apt-get install -y libssl-dev nasm",
        "apt-get clean",
        "chsh -s /bin/bash bob",
    }));
}

TEST_F(ProvisionerTest, emptyToolchain) {
    settings.image = "https://cloud-images.ubuntu.com/jammy/ubuntu-jammy-{}.tar.gz";
    settings.toolchainPackages = Strings{};

    provisioner.provision();

    ASSERT_THAT(chrootCommandLines(), Not(Contains(HasSubstr("build-essential"))));
    ASSERT_THAT(chrootCommandLines(), Not(Contains("apt-get install -y")));
}

TEST_F(ProvisionerTest, usersGroupIsNotRecreated) {
    config.host.gid = 100;

    provisioner.provision();

    auto lines = chrootCommandLines();
    ASSERT_EQ(lines.front(), "useradd --home-dir=/home/bob --create-home --uid=1000 --gid=100 bob");
    ASSERT_THAT(lines, Not(Contains(HasSubstr("groupadd"))));
}

TEST_F(ProvisionerTest, usesCachedBaseImage) {
    seedDownloadCache("ubuntu-xenial-core-cloudimg-amd64-root.tar.gz");

    provisioner.provision();

    ASSERT_TRUE(transfer.downloads.empty());
}

TEST_F(ProvisionerTest, downloadFailure) {
    transfer.failure = FileTransfer::NotFound;

    ASSERT_THROW(provisioner.provision(), FileTransferError);
    ASSERT_FALSE(image.exists());
    ASSERT_TRUE(executor.commands.empty());
}

TEST_F(ProvisionerTest, failureReleasesDevices) {
    failInside("apt-get update");

    try {
        provisioner.provision();
        FAIL() << "should have thrown";
    } catch (ExecError & e) {
        ASSERT_EQ(e.info().status, 100u);
    }

    ASSERT_THAT(executor.mounts, Not(Contains(Key(image.root() + "/dev/random"))));
    ASSERT_THAT(executor.mounts, Not(Contains(Key(image.root() + "/dev/urandom"))));
    ASSERT_THAT(chrootCommandLines(), Not(Contains("apt-get clean")));
}

TEST_F(ProvisionerTest, deviceBindFailureUndoesEarlierBinds) {
    executor.handler = [&](const Command & cmd) -> std::optional<CommandResult> {
        if (cmd.program == "mount" && cmd.args.back() == image.root() + "/dev/urandom")
            return CommandResult{.status = 32 << 8};
        return std::nullopt;
    };

    ASSERT_THROW((DeviceBinds{executor, image.root()}), ExecError);

    ASSERT_THAT(executor.mounts, Not(Contains(Key(image.root() + "/dev/random"))));
    ASSERT_EQ(showCommand(executor.commands.back()),
        "sudo " + showCommandLine("umount", {"-l", image.root() + "/dev/random"}));
}

}
