#pragma once
///@file

#include "buildjail/libcontainer/chroot.hh"
#include "buildjail/libcontainer/executor.hh"
#include "buildjail/libcontainer/filetransfer.hh"
#include "buildjail/libcontainer/globals.hh"
#include "buildjail/libcontainer/image-store.hh"

namespace buildjail {

MakeError(ProvisioningFailure, Error);

/**
 * The release codename in a base image URL: the second `-`-separated
 * field of its file name.
 */
std::string imageName(std::string_view url);

/**
 * Whether the release is too old to ship a usable Python and CMake.
 */
bool isLegacyImage(std::string_view name);

/**
 * Builds a container image from scratch.
 */
class Provisioner
{
    const SessionConfig & config;
    ImageStore & image;
    ChrootRunner & chroot;
    CommandExecutor & executor;
    FileTransfer & transfer;

    void createBuildUser();
    void disableServices();
    void installPackages(const std::string & name);

public:
    Provisioner(
        const SessionConfig & config,
        ImageStore & image,
        ChrootRunner & chroot,
        CommandExecutor & executor,
        FileTransfer & transfer);

    /**
     * The `image` setting with the architecture filled in.
     */
    std::string imageUrl() const;

    /**
     * Replace the image by a fresh one built from the base image. The
     * new image is left mounted. A failure leaves a half-built image
     * behind; see Session for the cleanup.
     */
    void provision();
};

/**
 * Bind mounts of the host's random devices, needed by package
 * maintainer scripts. Lazily unmounted again on destruction.
 */
class DeviceBinds
{
    CommandExecutor & executor;
    Paths mounted;

    void release();

public:
    DeviceBinds(CommandExecutor & executor, const Path & root);
    DeviceBinds(const DeviceBinds &) = delete;
    ~DeviceBinds();
};

}
