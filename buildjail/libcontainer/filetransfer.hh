#pragma once
///@file

#include "buildjail/libutil/error.hh"
#include "buildjail/libutil/strings.hh"
#include "buildjail/libutil/types.hh"

#include <chrono>
#include <memory>
#include <optional>

namespace buildjail {

struct FileTransfer
{
    virtual ~FileTransfer() { }

    /**
     * Download `uri` into the file `destination`, which is created or
     * truncated. May throw a FileTransferError exception; the contents
     * of `destination` are unspecified in that case.
     */
    virtual void download(const std::string & uri, const Path & destination) = 0;

    enum Error { NotFound, Forbidden, Misc, Transient };
};

/**
 * @param connectTimeout Zero keeps the curl default.
 */
std::unique_ptr<FileTransfer> makeCurlFileTransfer(std::chrono::seconds connectTimeout = {});

class FileTransferError : public Error
{
public:
    FileTransfer::Error error;
    /// intentionally optional
    std::optional<std::string> response;

    template<typename... Args>
    FileTransferError(FileTransfer::Error error, std::optional<std::string> response, const Args & ... args)
        : Error(args...), error(error), response(response)
    {
        const auto hf = HintFmt(args...);
        if (response && (response->size() < 1024 || response->find("<html>") != std::string::npos))
            err.msg = HintFmt("%1%\n\nresponse body:\n\n%2%", Uncolored(hf.str()), chomp(*response));
        else
            err.msg = hf;
    }
};

/**
 * Return the path of `uri` in `cacheDir`, downloading it first unless
 * a file of that name is already there. The download goes to a
 * temporary name and is renamed into place once complete.
 */
Path downloadCached(FileTransfer & transfer, const std::string & uri, const Path & cacheDir);

/**
 * The last path component of `uri`, without query or fragment.
 */
std::string uriFileName(std::string_view uri);

}
