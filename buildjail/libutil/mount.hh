#pragma once
///@file

#include "buildjail/libutil/types.hh"

#include <map>

namespace buildjail {

/**
 * Live mounts, keyed by the absolute, symlink-resolved mount point.
 * The value is the root of the mount within its filesystem.
 */
typedef std::map<Path, std::string> MountTable;

/**
 * Parse the contents of a `/proc/<pid>/mountinfo` file.
 *
 * Field 4 of each line is the mount root and field 5 the mount point.
 * Octal escapes (`\040` and friends) are decoded. Mount points are
 * resolved with `realPathOrCanon()`. Lines with fewer than five fields
 * are skipped.
 */
MountTable parseMountInfo(std::string_view contents);

/**
 * Undo the octal escaping the kernel applies to whitespace and
 * backslashes in mountinfo fields.
 */
std::string unescapeMountField(std::string_view field);

class MountTableReader
{
public:
    virtual ~MountTableReader() = default;

    /**
     * Read the current mount table. Never cached.
     */
    virtual MountTable currentMounts() = 0;
};

/**
 * Reads `/proc/self/mountinfo`.
 */
class ProcMountTableReader : public MountTableReader
{
    Path mountInfoPath;

public:
    ProcMountTableReader(Path mountInfoPath = "/proc/self/mountinfo")
        : mountInfoPath(std::move(mountInfoPath))
    { }

    MountTable currentMounts() override;
};

}
