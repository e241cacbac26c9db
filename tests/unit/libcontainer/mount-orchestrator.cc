#include "buildjail/libcontainer/mount-orchestrator.hh"
#include "buildjail/libutil/processes.hh"
#include "tests/container-fixture.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using testing::Contains;
using testing::ElementsAre;
using testing::Key;
using testing::Not;

namespace buildjail {

class MountOrchestratorTest : public ContainerTest
{
protected:
    ImageStore image{config.layout.imagePath, config.layout.chrootDir, executor, mountReader};
    MountOrchestrator orchestrator{config, executor, mountReader, image};
    Path sessionTmp;

    MountOrchestratorTest()
        : sessionTmp(tmpDir + "/bypy/b/tmp-session")
    {
        image.create(1 << 20);
        image.mount();
        executor.commands.clear();
    }

    Path root() const { return image.root(); }

    std::vector<Strings> umounts() const
    {
        std::vector<Strings> res;
        for (auto & cmd : executor.commands)
            if (cmd.program == "umount")
                res.push_back(cmd.args);
        return res;
    }
};

TEST_F(MountOrchestratorTest, entriesInOrder) {
    auto entries = orchestrator.mountEntries(sessionTmp);

    Strings destinations;
    for (auto & e : entries) destinations.push_back(e.destination);
    ASSERT_THAT(destinations, ElementsAre(
        "/tmp", "/sw", "/src", "/sources", "/buildjail", "/dev", "/proc", "/sys", "/dev/shm"));

    ASSERT_EQ(entries[0].source, sessionTmp);
    ASSERT_EQ(entries[2].source, config.workDir);
    ASSERT_TRUE(entries[2].readOnly);
    ASSERT_EQ(entries[4].source, config.toolsDir);
    ASSERT_TRUE(entries[4].readOnly);
    ASSERT_FALSE(entries[1].readOnly);
    ASSERT_EQ(entries[6].fsType, "proc");
    ASSERT_EQ(entries[7].fsType, "sysfs");
    ASSERT_EQ(entries[8].fsType, "");
}

TEST_F(MountOrchestratorTest, hostDestinationDoesNotEscapeTheRoot) {
    ASSERT_EQ(orchestrator.hostDestination({.source = "/dev", .destination = "/dev"}), root() + "/dev");
    ASSERT_EQ(orchestrator.hostDestination({.source = "x", .destination = "/a/../b/"}), root() + "/b");
    ASSERT_EQ(orchestrator.hostDestination({.source = "x", .destination = "/../etc"}), root() + "/etc");
    ASSERT_EQ(orchestrator.hostDestination({.source = "x", .destination = "../../etc"}), root() + "/etc");
    ASSERT_EQ(orchestrator.hostDestination({.source = "x", .destination = "/"}), root());
}

TEST_F(MountOrchestratorTest, toolsMountPointStaysInsideTheRoot) {
    settings.toolsMountPoint = "../../../../../../etc";

    orchestrator.mountAll(sessionTmp);

    ASSERT_EQ(executor.mounts.at(root() + "/etc"), config.toolsDir);
    for (auto & [mountPoint, source] : executor.mounts)
        ASSERT_TRUE(isDirOrInDir(mountPoint, root())) << mountPoint;
}

TEST_F(MountOrchestratorTest, mountAllMountsEverything) {
    orchestrator.mountAll(sessionTmp);

    for (auto & dest : {"/tmp", "/sw", "/src", "/sources", "/buildjail", "/dev", "/proc", "/sys", "/dev/shm"})
        ASSERT_THAT(executor.mounts, Contains(Key(root() + dest))) << dest;

    ASSERT_EQ(executor.mounts.at(root() + "/src"), config.workDir);
    ASSERT_EQ(executor.mounts.at(root() + "/proc"), "proc");

    for (auto & cmd : executor.commands)
        ASSERT_TRUE(cmd.privileged) << showCommand(cmd);
}

TEST_F(MountOrchestratorTest, readOnlyMountsAreRemounted) {
    orchestrator.mountAll(sessionTmp);

    std::vector<Strings> srcCommands;
    for (auto & cmd : executor.commands)
        if (!cmd.args.empty() && cmd.args.back() == root() + "/src")
            srcCommands.push_back(cmd.args);

    ASSERT_THAT(srcCommands, ElementsAre(
        Strings{"-p", root() + "/src"},
        Strings{"--bind", config.workDir, root() + "/src"},
        Strings{"-o", "remount,ro,bind", root() + "/src"}));

    size_t remounts = 0;
    for (auto & cmd : executor.commands)
        if (!cmd.args.empty() && cmd.args.front() == "-o")
            ++remounts;
    ASSERT_EQ(remounts, 2u);
}

TEST_F(MountOrchestratorTest, sharedMemoryIsWorldWritable) {
    orchestrator.mountAll(sessionTmp);

    auto & last = executor.commands.back();
    ASSERT_EQ(last.program, "chmod");
    ASSERT_THAT(last.args, ElementsAre("a+w", root() + "/dev/shm"));

    auto & bind = executor.commands[executor.commands.size() - 2];
    ASSERT_EQ(bind.program, "mount");
    ASSERT_THAT(bind.args, ElementsAre("--bind", "/dev/shm", root() + "/dev/shm"));
}

TEST_F(MountOrchestratorTest, typedMounts) {
    orchestrator.mountAll(sessionTmp);

    std::vector<Strings> typed;
    for (auto & cmd : executor.commands)
        if (cmd.program == "mount" && cmd.args.front() == "-t")
            typed.push_back(cmd.args);

    ASSERT_THAT(typed, ElementsAre(
        Strings{"-t", "proc", "proc", root() + "/proc"},
        Strings{"-t", "sysfs", "sys", root() + "/sys"}));
}

TEST_F(MountOrchestratorTest, mountAllIsIdempotent) {
    orchestrator.mountAll(sessionTmp);
    auto mounts = executor.mounts;
    auto count = executor.commands.size();

    orchestrator.mountAll(sessionTmp);

    ASSERT_EQ(executor.commands.size(), count);
    ASSERT_EQ(executor.mounts, mounts);
}

TEST_F(MountOrchestratorTest, mountAllCompletesPartialSetup) {
    executor.mounts[root() + "/tmp"] = sessionTmp;
    executor.mounts[root() + "/proc"] = "proc";

    orchestrator.mountAll(sessionTmp);

    for (auto & cmd : executor.commands) {
        ASSERT_NE(cmd.args.back(), root() + "/tmp") << showCommand(cmd);
        ASSERT_NE(cmd.args.back(), root() + "/proc") << showCommand(cmd);
    }
    ASSERT_THAT(executor.mounts, Contains(Key(root() + "/sys")));
}

TEST_F(MountOrchestratorTest, failingMountPropagates) {
    executor.handler = [&](const Command & cmd) -> std::optional<CommandResult> {
        if (cmd.program == "mount" && cmd.args.back() == root() + "/sources")
            return CommandResult{.status = 32 << 8};
        return std::nullopt;
    };

    ASSERT_THROW(orchestrator.mountAll(sessionTmp), ExecError);
    ASSERT_THAT(executor.mounts, Contains(Key(root() + "/src")));
    ASSERT_THAT(executor.mounts, Not(Contains(Key(root() + "/dev"))));
}

TEST_F(MountOrchestratorTest, unmountAllDeepestFirst) {
    executor.mounts[root() + "/a/b"] = "/a/b";
    executor.mounts[root() + "/a/b/c"] = "/a/b/c";
    executor.mounts[root() + "/x"] = "/x";
    executor.mounts["/home"] = "/home";

    orchestrator.unmountAll();

    ASSERT_THAT(umounts(), ElementsAre(
        Strings{"-l", root() + "/a/b/c"},
        Strings{"-l", root() + "/a/b"},
        Strings{"-l", root() + "/x"},
        Strings{"-l", root()}));

    ASSERT_THAT(executor.mounts, ElementsAre(Key("/home")));
    ASSERT_FALSE(image.isMounted());
    ASSERT_EQ(image.mountState(), MountState::Unmounted);
}

TEST_F(MountOrchestratorTest, unmountAllAfterFullSetup) {
    orchestrator.mountAll(sessionTmp);
    executor.commands.clear();

    orchestrator.unmountAll();

    ASSERT_TRUE(executor.mounts.empty());
    auto cmds = umounts();
    ASSERT_EQ(cmds.size(), 10u);
    ASSERT_THAT(cmds.back(), ElementsAre("-l", root()));

    auto position = [&](const Path & point) {
        return std::find(cmds.begin(), cmds.end(), Strings{"-l", point}) - cmds.begin();
    };
    ASSERT_LT(position(root() + "/dev/shm"), position(root() + "/dev"));
}

TEST_F(MountOrchestratorTest, unmountAllLeavesTheSourceTreeAlone) {
    executor.mounts[root() + "/src"] = config.workDir;
    executor.mounts[root() + "/src/nested"] = config.workDir + "/nested";

    orchestrator.unmountAll();

    ASSERT_THAT(executor.mounts, ElementsAre(Key(root() + "/src/nested")));
    ASSERT_THAT(umounts(), ElementsAre(
        Strings{"-l", root() + "/src"},
        Strings{"-l", root()}));
}

TEST_F(MountOrchestratorTest, unmountAllWithNothingMounted) {
    executor.mounts.clear();
    orchestrator.unmountAll();
    ASSERT_TRUE(executor.commands.empty());
}

TEST_F(MountOrchestratorTest, unmountAllGivesUpOnStuckMounts) {
    executor.mounts[root() + "/dev"] = "/dev";
    executor.handler = [&](const Command & cmd) -> std::optional<CommandResult> {
        /* Pretend another mount is stacked underneath every time. */
        if (cmd.program == "umount" && cmd.args.back() == root() + "/dev")
            return CommandResult{};
        return std::nullopt;
    };

    ASSERT_THROW(orchestrator.unmountAll(), Error);
    ASSERT_EQ(umounts().size(), 16u);
}

TEST_F(MountOrchestratorTest, unmountAllPropagatesUmountFailure) {
    executor.handler = [&](const Command & cmd) -> std::optional<CommandResult> {
        if (cmd.program == "umount")
            return CommandResult{.status = 16 << 8};
        return std::nullopt;
    };

    ASSERT_THROW(orchestrator.unmountAll(), ExecError);
}

}
