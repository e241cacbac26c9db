#include "buildjail/libutil/mount.hh"
#include "buildjail/libutil/file-system.hh"
#include "buildjail/libutil/logging.hh"
#include "buildjail/libutil/strings.hh"

namespace buildjail {

std::string unescapeMountField(std::string_view field)
{
    std::string res;
    res.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()
            && field[i + 1] >= '0' && field[i + 1] <= '3'
            && field[i + 2] >= '0' && field[i + 2] <= '7'
            && field[i + 3] >= '0' && field[i + 3] <= '7')
        {
            res += char((field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 + (field[i + 3] - '0'));
            i += 3;
        } else
            res += field[i];
    }
    return res;
}

MountTable parseMountInfo(std::string_view contents)
{
    MountTable table;

    while (!contents.empty()) {
        auto [line, rest] = getLine(contents);
        contents = rest;

        auto fields = tokenizeString<std::vector<std::string>>(line, " ");
        if (fields.empty()) continue;
        if (fields.size() < 5) {
            debug("ignoring malformed mountinfo line '%s'", line);
            continue;
        }

        auto mountPoint = unescapeMountField(fields[4]);
        if (mountPoint.empty() || mountPoint[0] != '/') {
            debug("ignoring mountinfo line with relative mount point '%s'", line);
            continue;
        }

        table.insert_or_assign(realPathOrCanon(mountPoint), unescapeMountField(fields[3]));
    }

    return table;
}

MountTable ProcMountTableReader::currentMounts()
{
    return parseMountInfo(readFile(mountInfoPath));
}

}
